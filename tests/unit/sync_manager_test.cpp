#include "internal/sync/sync_manager.hpp"

#include <cassert>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>

#include "internal/db/engine/database_engine.hpp"
#include "internal/db/model/collections.hpp"
#include "internal/storage/memory/memory_storage_adapter.hpp"

namespace {

using practicedb::db::DatabaseEngine;
using practicedb::db::model::SyncStatus;
using practicedb::sync::HttpClient;
using practicedb::sync::HttpRequest;
using practicedb::sync::HttpResponse;
using practicedb::sync::SyncManager;
namespace c   = practicedb::db::collections;
namespace d   = practicedb::document;
namespace cfg = practicedb::runtime::config;

// Records every request and answers through a test-supplied handler.
class FakeHttpClient final : public HttpClient {
 public:
  using Handler = std::function<HttpResponse(const HttpRequest&)>;

  explicit FakeHttpClient(Handler handler) : handler_(std::move(handler)) {
  }

  HttpResponse Send(const HttpRequest& request) override {
    requests.push_back(request);
    return handler_(request);
  }

  std::vector<HttpRequest> requests;

 private:
  Handler handler_;
};

HttpResponse Respond(int status, std::string body = "") {
  HttpResponse response;
  response.status = status;
  response.body   = std::move(body);
  return response;
}

cfg::SyncConfig MakeConfig(cfg::ConflictResolution policy = cfg::NEWEST_WINS) {
  cfg::SyncConfig config;
  config.set_enabled(true);
  config.set_endpoint("http://sync.local/");
  config.set_api_key("secret");
  config.set_request_timeout_ms(2500);
  config.set_conflict_resolution(policy);
  config.add_collections(c::kPatients);
  return config;
}

std::shared_ptr<DatabaseEngine> MakeEngine() {
  return std::make_shared<DatabaseEngine>(std::make_shared<practicedb::storage::MemoryStorageAdapter>());
}

d::Document Change(const std::string& action, const std::string& id, const std::string& timestamp, const std::string& name = "") {
  d::Document change;
  d::SetString(change, "action", action);
  d::SetString(change, "documentId", id);
  d::SetString(change, "timestamp", timestamp);
  if (!name.empty()) {
    d::Document data;
    d::SetString(data, "name", name);
    (*change.mutable_fields())["data"] = d::StructValue(data);
  }
  return change;
}

void TestMissingEndpointThrows() {
  auto            http = std::make_shared<FakeHttpClient>([](const HttpRequest&) { return Respond(200); });
  cfg::SyncConfig config;
  SyncManager     manager(MakeEngine(), config, http);

  bool threw = false;
  try {
    manager.Sync();
  } catch (const std::runtime_error& e) {
    threw = true;
    assert(std::string(e.what()) == "Sync endpoint not configured");
  }
  assert(threw);
  assert(!manager.CheckHealth());
  assert(http->requests.empty());
}

void TestDefaultsAreApplied() {
  auto            http = std::make_shared<FakeHttpClient>([](const HttpRequest&) { return Respond(200); });
  cfg::SyncConfig config;
  config.set_endpoint("http://sync.local//");
  SyncManager manager(MakeEngine(), config, http);

  assert(manager.Config().endpoint() == "http://sync.local");
  assert(manager.Config().interval_ms() == 300000);
  assert(manager.Config().max_push_attempts() == 5);
  assert(manager.Config().conflict_resolution() == cfg::NEWEST_WINS);
  assert(static_cast<std::size_t>(manager.Config().collections_size()) == practicedb::db::DomainCollections().size());
}

void TestPushMarksRowsSynced() {
  auto engine = MakeEngine();
  engine->Create(c::kPatients, d::ParseDocument(R"({"id": "p1", "name": "Ahmed"})"));
  engine->Create(c::kPatients, d::ParseDocument(R"({"id": "p2", "name": "Sara"})"));
  engine->Delete(c::kPatients, "p2");

  auto http = std::make_shared<FakeHttpClient>([](const HttpRequest& r) { return r.method == "POST" ? Respond(201) : Respond(200, "[]"); });
  SyncManager manager(engine, MakeConfig(), http);

  const auto report = manager.Sync();
  assert(report.pushed == 3);
  assert(report.conflicts == 0);
  assert(report.pulled == 0);
  assert(engine->GetPendingSyncs().empty());

  const auto& first = http->requests.front();
  assert(first.method == "POST");
  assert(first.url == "http://sync.local/sync/db_patients");
  assert(first.headers.at("Authorization") == "Bearer secret");
  assert(first.headers.at("Content-Type") == "application/json");
  assert(first.timeout == std::chrono::milliseconds(2500));

  const auto body = d::ParseDocument(first.body);
  assert(d::StringField(body, "action") == std::optional<std::string>("create"));
  assert(d::StringField(body, "documentId") == std::optional<std::string>("p1"));
  assert(d::FindField(body, "data")->has_struct_value());

  // p2 is gone, so its create and delete carry no document.
  const auto deleted = d::ParseDocument(http->requests[2].body);
  assert(d::StringField(deleted, "action") == std::optional<std::string>("delete"));
  assert(d::IsNullOrAbsent(d::FindField(deleted, "data")));

  assert(http->requests.back().url == "http://sync.local/sync/db_patients/changes");
}

void TestFailedPushStaysPendingUntilAttemptsRunOut() {
  auto engine = MakeEngine();
  engine->Create(c::kPatients, d::ParseDocument(R"({"id": "p1"})"));

  auto http = std::make_shared<FakeHttpClient>([](const HttpRequest& r) {
    if (r.method == "POST") return Respond(500);
    throw std::runtime_error("connection refused");
  });
  auto config = MakeConfig();
  config.set_max_push_attempts(2);
  SyncManager manager(engine, config, http);

  auto report = manager.Sync();
  assert(report.pushed == 0);
  assert(report.conflicts == 1);
  auto log = engine->GetSyncLog();
  assert(log[0].status == SyncStatus::Pending);
  assert(log[0].attempts == 1);
  assert(log[0].error == std::optional<std::string>("HTTP 500"));

  report = manager.Sync();
  assert(report.conflicts == 1);
  log = engine->GetSyncLog();
  assert(log[0].status == SyncStatus::Error);
  assert(engine->GetPendingSyncs().empty());

  // Nothing left to push on the next pass.
  report = manager.Sync();
  assert(report.conflicts == 0);
}

void TestNewestWinsComparesTimestamps() {
  auto engine = MakeEngine();
  engine->Create(c::kPatients, d::ParseDocument(R"({"id": "p1", "name": "Local"})"));
  SyncManager manager(engine, MakeConfig(cfg::NEWEST_WINS), std::make_shared<FakeHttpClient>([](const HttpRequest&) { return Respond(200); }));

  assert(!manager.ApplyRemoteChange(c::kPatients, Change("update", "p1", "2000-01-01T00:00:00.000Z", "Stale")));
  assert(d::StringField(*engine->Get(c::kPatients, "p1"), "name") == std::optional<std::string>("Local"));

  assert(manager.ApplyRemoteChange(c::kPatients, Change("update", "p1", "2999-01-01T00:00:00.000Z", "Remote")));
  assert(d::StringField(*engine->Get(c::kPatients, "p1"), "name") == std::optional<std::string>("Remote"));

  assert(manager.ApplyRemoteChange(c::kPatients, Change("create", "p9", "2000-01-01T00:00:00.000Z", "New")));
  assert(d::DocumentId(*engine->Get(c::kPatients, "p9")) == "p9");

  // Remote writes are not echoed back into the sync log.
  assert(engine->GetSyncLog().size() == 1);
}

void TestClientAndServerWinPolicies() {
  auto engine = MakeEngine();
  engine->Create(c::kPatients, d::ParseDocument(R"({"id": "p1", "name": "Local"})"));
  auto http = std::make_shared<FakeHttpClient>([](const HttpRequest&) { return Respond(200); });

  SyncManager client_wins(engine, MakeConfig(cfg::CLIENT_WINS), http);
  assert(!client_wins.ApplyRemoteChange(c::kPatients, Change("update", "p1", "2999-01-01T00:00:00.000Z", "Remote")));
  assert(!client_wins.ApplyRemoteChange(c::kPatients, Change("delete", "p1", "2999-01-01T00:00:00.000Z")));
  assert(engine->Get(c::kPatients, "p1").has_value());

  SyncManager server_wins(engine, MakeConfig(cfg::SERVER_WINS), http);
  assert(server_wins.ApplyRemoteChange(c::kPatients, Change("update", "p1", "2000-01-01T00:00:00.000Z", "Remote")));
  assert(d::StringField(*engine->Get(c::kPatients, "p1"), "name") == std::optional<std::string>("Remote"));
  assert(server_wins.ApplyRemoteChange(c::kPatients, Change("delete", "p1", "2000-01-01T00:00:00.000Z")));
  assert(!engine->Get(c::kPatients, "p1").has_value());

  bool threw = false;
  try {
    server_wins.ApplyRemoteChange(c::kPatients, Change("update", "", "2000-01-01T00:00:00.000Z", "x"));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestPullCountsAppliedChanges() {
  auto engine = MakeEngine();
  engine->Create(c::kPatients, d::ParseDocument(R"({"id": "p1", "name": "Local"})"));
  engine->MarkAsSynced({engine->GetPendingSyncs().front().id});

  auto http = std::make_shared<FakeHttpClient>([](const HttpRequest&) {
    return Respond(200, R"([
      {"action": "update", "documentId": "p1", "timestamp": "2000-01-01T00:00:00.000Z", "data": {"name": "Stale"}},
      {"action": "create", "documentId": "p2", "timestamp": "2024-01-01T00:00:00.000Z", "data": {"name": "Fresh"}},
      {"action": "update", "documentId": "p3", "timestamp": "2024-01-01T00:00:00.000Z"}
    ])");
  });
  SyncManager manager(engine, MakeConfig(), http);

  const auto report = manager.Sync();
  assert(report.pulled == 1);
  assert(engine->Get(c::kPatients, "p2").has_value());
  assert(!engine->Get(c::kPatients, "p3").has_value());
}

void TestPullFailureDoesNotAbortPass() {
  auto engine = MakeEngine();
  auto http   = std::make_shared<FakeHttpClient>([](const HttpRequest& r) {
    if (r.url.find("db_patients") != std::string::npos) return Respond(503);
    return Respond(200, R"([{"action": "create", "documentId": "c1", "timestamp": "2024-01-01T00:00:00.000Z", "data": {"status": "draft"}}])");
  });
  auto config = MakeConfig();
  config.add_collections(c::kClaims);
  SyncManager manager(engine, config, http);

  const auto report = manager.Sync();
  assert(report.pulled == 1);
  assert(engine->Get(c::kClaims, "c1").has_value());
}

void TestCheckHealth() {
  int  status = 200;
  auto http   = std::make_shared<FakeHttpClient>([&status](const HttpRequest&) {
    if (status < 0) throw std::runtime_error("timeout");
    return Respond(status);
  });
  SyncManager manager(MakeEngine(), MakeConfig(), http);

  assert(manager.CheckHealth());
  assert(http->requests.back().url == "http://sync.local/health");

  status = 503;
  assert(!manager.CheckHealth());
  status = -1;
  assert(!manager.CheckHealth());
}

void TestStartStop() {
  auto http = std::make_shared<FakeHttpClient>([](const HttpRequest&) { return Respond(200, "[]"); });

  auto disabled_config = MakeConfig();
  disabled_config.set_enabled(false);
  SyncManager disabled(MakeEngine(), disabled_config, http);
  disabled.Start();
  assert(!disabled.Running());

  SyncManager manager(MakeEngine(), MakeConfig(), http);
  manager.Start();
  assert(manager.Running());
  manager.Stop();
  assert(!manager.Running());
  manager.Stop();
}

} // namespace

int main() {
  TestMissingEndpointThrows();
  TestDefaultsAreApplied();
  TestPushMarksRowsSynced();
  TestFailedPushStaysPendingUntilAttemptsRunOut();
  TestNewestWinsComparesTimestamps();
  TestClientAndServerWinPolicies();
  TestPullCountsAppliedChanges();
  TestPullFailureDoesNotAbortPass();
  TestCheckHealth();
  TestStartStop();

  std::cout << "practicedb_unit_sync_manager: pass\n";
  return 0;
}
