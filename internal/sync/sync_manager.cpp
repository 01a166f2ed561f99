#include "sync_manager.hpp"

#include <chrono>
#include <exception>
#include <stdexcept>

#include "internal/db/engine/database_engine.hpp"
#include "internal/db/model/collections.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

namespace practicedb::sync {

namespace cfg = practicedb::runtime::config;

namespace {

constexpr uint64_t kDefaultIntervalMs       = 5 * 60 * 1000;
constexpr uint64_t kDefaultRequestTimeoutMs = 10 * 1000;
constexpr uint32_t kDefaultMaxPushAttempts  = 5;

// True when local is strictly newer than remote.
bool LocalIsNewer(const std::string& local, const std::string& remote) {
  const auto l = util::ParseIso8601(local);
  const auto r = util::ParseIso8601(remote);
  if (l && r) return *l > *r;
  return local > remote;
}

std::string TrimTrailingSlash(std::string endpoint) {
  while (!endpoint.empty() && endpoint.back() == '/') endpoint.pop_back();
  return endpoint;
}

} // namespace

SyncManager::SyncManager(std::shared_ptr<db::DatabaseEngine> engine, cfg::SyncConfig config, HttpClientPtr http)
    : engine_(std::move(engine)), config_(std::move(config)), http_(std::move(http)) {
  if (!engine_ || !http_) {
    throw std::invalid_argument("SyncManager requires an engine and an http client");
  }

  config_.set_endpoint(TrimTrailingSlash(config_.endpoint()));
  if (config_.interval_ms() == 0) config_.set_interval_ms(kDefaultIntervalMs);
  if (config_.request_timeout_ms() == 0) config_.set_request_timeout_ms(kDefaultRequestTimeoutMs);
  if (config_.max_push_attempts() == 0) config_.set_max_push_attempts(kDefaultMaxPushAttempts);
  if (config_.conflict_resolution() == cfg::CONFLICT_RESOLUTION_UNSPECIFIED) config_.set_conflict_resolution(cfg::NEWEST_WINS);
  if (config_.collections().empty()) {
    for (const auto& collection : db::DomainCollections()) config_.add_collections(collection);
  }
}

SyncManager::~SyncManager() {
  Stop();
}

// ------------------------------------------------------------
// Sync pass
// ------------------------------------------------------------

SyncReport SyncManager::Sync() {
  if (config_.endpoint().empty()) {
    throw std::runtime_error("Sync endpoint not configured");
  }

  std::scoped_lock         lock(sync_mutex_);
  observability::SpanScope span("practicedb.sync");
  span.SetAttribute("sync.endpoint", config_.endpoint());

  SyncReport report;
  Push(report);

  for (const auto& collection : config_.collections()) {
    observability::LogContext ctx({observability::CollectionField(collection)});
    observability::SpanScope  pull_span("practicedb.sync.pull", collection);
    try {
      const auto applied = Pull(collection);
      pull_span.SetCount("sync.applied", applied);
      report.pulled += applied;
    } catch (const std::exception& e) {
      pull_span.RecordError(e);
      PRACTICEDB_LOG_WARN("sync pull failed", {observability::ErrorField(e)});
    }
  }

  span.SetCount("sync.pushed", report.pushed);
  span.SetCount("sync.pulled", report.pulled);
  span.SetCount("sync.conflicts", report.conflicts);
  PRACTICEDB_LOG_INFO("sync completed", {observability::CountField("pushed", report.pushed), observability::CountField("pulled", report.pulled),
                                         observability::CountField("conflicts", report.conflicts)});
  return report;
}

void SyncManager::Push(SyncReport& report) {
  std::vector<std::string> synced;

  for (const auto& entry : engine_->GetPendingSyncs()) {
    document::Document body;
    document::SetString(body, "action", db::model::ToString(entry.action));
    document::SetString(body, "documentId", entry.document_id);
    document::SetString(body, "timestamp", entry.timestamp);
    document::SetNull(body, "data");
    if (entry.action != db::model::SyncAction::Delete) {
      if (auto current = engine_->Get(entry.collection, entry.document_id)) {
        (*body.mutable_fields())["data"] = document::StructValue(*current);
      }
    }

    auto request = MakeRequest("POST", "/sync/" + entry.collection);
    request.SetJsonBody(document::ToJson(body));

    std::string error;
    try {
      const auto response = http_->Send(request);
      if (response.Ok()) {
        synced.push_back(entry.id);
        ++report.pushed;
        continue;
      }
      error = "HTTP " + std::to_string(response.status);
    } catch (const std::exception& e) {
      error = e.what();
    }

    ++report.conflicts;
    PRACTICEDB_LOG_WARN("sync push failed", {observability::CollectionField(entry.collection), observability::DocumentField(entry.document_id),
                                             observability::StringField("error", error)});
    engine_->MarkSyncFailed(entry.id, error, config_.max_push_attempts());
  }

  if (!synced.empty()) {
    engine_->MarkAsSynced(synced);
  }
}

std::size_t SyncManager::Pull(const std::string& collection) {
  const auto response = http_->Send(MakeRequest("GET", "/sync/" + collection + "/changes"));
  if (!response.Ok()) {
    throw std::runtime_error("HTTP " + std::to_string(response.status));
  }

  document::Value changes;
  document::FromJson(response.body, &changes);
  if (!changes.has_list_value()) {
    throw std::runtime_error("changes feed is not a JSON array");
  }

  std::size_t applied = 0;
  for (const auto& change : changes.list_value().values()) {
    if (!change.has_struct_value()) continue;
    try {
      if (ApplyRemoteChange(collection, change.struct_value())) ++applied;
    } catch (const std::exception& e) {
      PRACTICEDB_LOG_WARN("remote change rejected", {observability::ErrorField(e)});
    }
  }
  return applied;
}

bool SyncManager::ApplyRemoteChange(const std::string& collection, const document::Document& change) {
  const auto id        = document::StringField(change, "documentId").value_or("");
  const auto action    = document::StringField(change, "action").value_or("");
  const auto timestamp = document::StringField(change, "timestamp").value_or("");
  if (id.empty()) {
    throw std::invalid_argument("remote change has no documentId");
  }

  if (const auto local = engine_->Get(collection, id)) {
    switch (config_.conflict_resolution()) {
      case cfg::CLIENT_WINS:
        return false;
      case cfg::SERVER_WINS:
        break;
      default:
        if (LocalIsNewer(document::StringField(*local, document::kUpdatedAtField).value_or(""), timestamp)) return false;
        break;
    }
  }

  if (action == "delete") {
    return engine_->ApplyRemoteDelete(collection, id);
  }

  const auto* data = document::FindField(change, "data");
  if (!data || !data->has_struct_value()) {
    throw std::invalid_argument("remote " + action + " for " + id + " carries no document");
  }

  auto doc = data->struct_value();
  if (document::DocumentId(doc).empty()) document::SetString(doc, document::kIdField, id);
  engine_->ApplyRemoteUpsert(collection, doc);
  return true;
}

bool SyncManager::CheckHealth() {
  if (config_.endpoint().empty()) return false;
  try {
    return http_->Send(MakeRequest("GET", "/health")).Ok();
  } catch (const std::exception& e) {
    PRACTICEDB_LOG_WARN("sync health check failed", {observability::ErrorField(e)});
    return false;
  }
}

HttpRequest SyncManager::MakeRequest(const std::string& method, const std::string& path) const {
  HttpRequest request;
  request.method  = method;
  request.url     = config_.endpoint() + path;
  request.timeout = std::chrono::milliseconds(config_.request_timeout_ms());
  if (!config_.api_key().empty()) {
    request.headers["Authorization"] = "Bearer " + config_.api_key();
  }
  return request;
}

// ------------------------------------------------------------
// Background loop
// ------------------------------------------------------------

void SyncManager::Start() {
  if (!config_.enabled() || config_.endpoint().empty()) {
    PRACTICEDB_LOG_INFO("sync disabled or no endpoint configured");
    return;
  }
  if (running_.exchange(true)) return;

  thread_ = std::thread(&SyncManager::Run, this);
  PRACTICEDB_LOG_INFO("sync started", {observability::StringField("endpoint", config_.endpoint()),
                                       observability::CountField("interval_ms", config_.interval_ms())});
}

void SyncManager::Stop() {
  {
    std::scoped_lock lock(wake_mutex_);
    if (!running_.exchange(false)) return;
  }
  wake_.notify_all();
  if (thread_.joinable()) thread_.join();
  PRACTICEDB_LOG_INFO("sync stopped");
}

bool SyncManager::Running() const {
  return running_;
}

void SyncManager::Run() {
  const auto interval = std::chrono::milliseconds(config_.interval_ms());

  while (running_) {
    {
      std::unique_lock lock(wake_mutex_);
      if (wake_.wait_for(lock, interval, [this] { return !running_; })) break;
    }

    try {
      Sync();
    } catch (const std::exception& e) {
      PRACTICEDB_LOG_ERROR("auto-sync failed", {observability::ErrorField(e)});
    }
  }
}

} // namespace practicedb::sync
