#include "id.hpp"

#include <random>

#include "time.hpp"

namespace practicedb::util {

std::string GenerateId() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  static constexpr char               kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";

  std::uniform_int_distribution<int> pick(0, 35);

  std::string suffix(9, '0');
  for (auto& c : suffix)
    c = kAlphabet[pick(rng)];

  return std::to_string(ToUnixMillis(Now())) + "_" + suffix;
}

} // namespace practicedb::util
