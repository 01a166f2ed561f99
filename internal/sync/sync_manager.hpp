#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "http_client.hpp"
#include "internal/document/value.hpp"

namespace practicedb::db {
class DatabaseEngine;
}

namespace practicedb::sync {

struct SyncReport {
  std::size_t pushed    = 0;
  std::size_t pulled    = 0;
  std::size_t conflicts = 0;
};

/*
  Best-effort push/pull reconciliation with a remote endpoint.

  Push drains pending sync-log rows one by one; pull applies each
  collection's change feed through the conflict policy. A failure on
  one row or one collection is logged and does not stop the pass.
*/
class SyncManager {
 public:
  SyncManager(std::shared_ptr<db::DatabaseEngine> engine, practicedb::runtime::config::SyncConfig config, HttpClientPtr http);
  ~SyncManager();

  SyncManager(const SyncManager&)            = delete;
  SyncManager& operator=(const SyncManager&) = delete;

  // Throws std::runtime_error when no endpoint is configured.
  SyncReport Sync();

  // change = {action, documentId, data, timestamp}. Returns false when the local side was kept.
  bool ApplyRemoteChange(const std::string& collection, const document::Document& change);

  bool CheckHealth();

  // Periodic Sync() on a background thread; no-op when disabled or without endpoint.
  void Start();
  void Stop();
  bool Running() const;

  const practicedb::runtime::config::SyncConfig& Config() const {
    return config_;
  }

 private:
  void        Push(SyncReport& report);
  std::size_t Pull(const std::string& collection);
  HttpRequest MakeRequest(const std::string& method, const std::string& path) const;
  void        Run();

  std::shared_ptr<db::DatabaseEngine>     engine_;
  practicedb::runtime::config::SyncConfig config_;
  HttpClientPtr                           http_;

  std::mutex              sync_mutex_;
  std::mutex              wake_mutex_;
  std::condition_variable wake_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace practicedb::sync
