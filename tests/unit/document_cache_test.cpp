#include "internal/db/engine/document_cache.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

namespace {

using practicedb::db::DocumentCache;
namespace d = practicedb::document;

d::Document MakeDoc(const std::string& id, const std::string& name) {
  d::Document doc;
  d::SetString(doc, "id", id);
  d::SetString(doc, "name", name);
  return doc;
}

void TestPutAndGetReturnsStoredDocument() {
  DocumentCache cache(std::chrono::minutes(5));
  cache.Put("db_patients", "p1", MakeDoc("p1", "Ahmed"));

  const auto cached = cache.Get("db_patients", "p1");
  assert(cached.has_value());
  assert(d::StringField(*cached, "name") == std::optional<std::string>("Ahmed"));
  assert(!cache.Get("db_claims", "p1").has_value());
}

void TestEntriesExpireAfterTtl() {
  DocumentCache cache(std::chrono::milliseconds(20));
  cache.Put("db_patients", "p1", MakeDoc("p1", "Ahmed"));
  assert(cache.Get("db_patients", "p1").has_value());

  std::this_thread::sleep_for(std::chrono::milliseconds(40));
  assert(!cache.Get("db_patients", "p1").has_value());
}

void TestInvalidateCollectionLeavesOtherCollections() {
  DocumentCache cache(std::chrono::minutes(5));
  cache.Put("db_patients", "p1", MakeDoc("p1", "Ahmed"));
  cache.Put("db_patients", "p2", MakeDoc("p2", "Sara"));
  cache.Put("db_claims", "c1", MakeDoc("c1", "claim"));

  cache.InvalidateCollection("db_patients");
  assert(!cache.Get("db_patients", "p1").has_value());
  assert(!cache.Get("db_patients", "p2").has_value());
  assert(cache.Get("db_claims", "c1").has_value());

  cache.Invalidate("db_claims", "c1");
  assert(cache.Size() == 0);
}

void TestClearDropsEverything() {
  DocumentCache cache(std::chrono::minutes(5));
  cache.Put("db_patients", "p1", MakeDoc("p1", "Ahmed"));
  cache.Put("db_users", "u1", MakeDoc("u1", "Dr"));
  assert(cache.Size() == 2);

  cache.Clear();
  assert(cache.Size() == 0);
}

} // namespace

int main() {
  TestPutAndGetReturnsStoredDocument();
  TestEntriesExpireAfterTtl();
  TestInvalidateCollectionLeavesOtherCollections();
  TestClearDropsEverything();

  std::cout << "practicedb_unit_document_cache: pass\n";
  return 0;
}
