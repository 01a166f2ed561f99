#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/document/value.hpp"

namespace practicedb::db::model {

enum class SyncAction { Create, Update, Delete };

enum class SyncStatus { Pending, Synced, Error };

/*
  One row of the sync log: a local mutation the remote peer has not
  acknowledged yet. Persisted as a JSON object under db_sync_log.
*/
struct SyncLogEntry {
  std::string                id;
  std::string                collection;
  SyncAction                 action = SyncAction::Create;
  std::string                document_id;
  std::string                timestamp;
  SyncStatus                 status = SyncStatus::Pending;
  std::optional<std::string> synced_at;
  std::optional<std::string> error;
  uint32_t                   attempts = 0;
};

const char* ToString(SyncAction action);
const char* ToString(SyncStatus status);

// Throws std::invalid_argument on unknown names.
SyncAction ParseSyncAction(const std::string& name);
SyncStatus ParseSyncStatus(const std::string& name);

document::Document ToDocument(const SyncLogEntry& entry);

// Rows with unknown action/status are rejected with std::invalid_argument.
SyncLogEntry FromDocument(const document::Document& doc);

} // namespace practicedb::db::model
