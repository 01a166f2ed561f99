#include "internal/observability/logging.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

namespace obs = practicedb::observability;

void TestFieldsAreAppendedAndQuoted() {
  assert(obs::FormatLogLine("seeded collection", {obs::CollectionField("db_users"), obs::CountField("documents", 3)}) ==
         "seeded collection collection=db_users documents=3");

  const std::runtime_error error("Document with ID \"p1\" not found");
  assert(obs::FormatLogLine("update failed", {obs::DocumentField("p1"), obs::ErrorField(error)}) ==
         R"(update failed document=p1 error="Document with ID \"p1\" not found")");

  assert(obs::FormatLogLine("empty", {obs::StringField("key", "")}) == R"(empty key="")");
  assert(obs::FormatLogLine("flag", {obs::BoolField("merge", true)}) == "flag merge=true");
}

void TestContextAppliesWhileInScope() {
  {
    obs::LogContext outer({obs::CollectionField("db_claims")});
    {
      obs::LogContext inner({obs::TransactionField("tx_1")});
      assert(obs::FormatLogLine("pulled", {obs::CountField("applied", 2)}) == "pulled applied=2 collection=db_claims transaction=tx_1");
      assert(obs::CurrentLogContext().size() == 2);
    }
    assert(obs::FormatLogLine("pulled") == "pulled collection=db_claims");
  }
  assert(obs::CurrentLogContext().empty());
  assert(obs::FormatLogLine("idle") == "idle");
}

void TestContextIsPerThread() {
  obs::LogContext ctx({obs::CollectionField("db_patients")});

  std::string other;
  std::thread worker([&other] { other = obs::FormatLogLine("worker"); });
  worker.join();

  assert(other == "worker");
  assert(obs::FormatLogLine("main") == "main collection=db_patients");
}

} // namespace

int main() {
  TestFieldsAreAppendedAndQuoted();
  TestContextAppliesWhileInScope();
  TestContextIsPerThread();

  std::cout << "practicedb_unit_logging: pass\n";
  return 0;
}
