#include "sync_log_entry.hpp"

#include <stdexcept>

namespace practicedb::db::model {

const char* ToString(SyncAction action) {
  switch (action) {
    case SyncAction::Create:
      return "create";
    case SyncAction::Update:
      return "update";
    case SyncAction::Delete:
      return "delete";
  }
  return "create";
}

const char* ToString(SyncStatus status) {
  switch (status) {
    case SyncStatus::Pending:
      return "pending";
    case SyncStatus::Synced:
      return "synced";
    case SyncStatus::Error:
      return "error";
  }
  return "pending";
}

SyncAction ParseSyncAction(const std::string& name) {
  if (name == "create") return SyncAction::Create;
  if (name == "update") return SyncAction::Update;
  if (name == "delete") return SyncAction::Delete;
  throw std::invalid_argument("unknown sync action: " + name);
}

SyncStatus ParseSyncStatus(const std::string& name) {
  if (name == "pending") return SyncStatus::Pending;
  if (name == "synced") return SyncStatus::Synced;
  if (name == "error") return SyncStatus::Error;
  throw std::invalid_argument("unknown sync status: " + name);
}

document::Document ToDocument(const SyncLogEntry& entry) {
  document::Document doc;
  document::SetString(doc, "id", entry.id);
  document::SetString(doc, "collection", entry.collection);
  document::SetString(doc, "action", ToString(entry.action));
  document::SetString(doc, "documentId", entry.document_id);
  document::SetString(doc, "timestamp", entry.timestamp);
  document::SetString(doc, "status", ToString(entry.status));
  if (entry.synced_at) document::SetString(doc, "syncedAt", *entry.synced_at);
  if (entry.error) document::SetString(doc, "error", *entry.error);
  document::SetNumber(doc, "attempts", entry.attempts);
  return doc;
}

SyncLogEntry FromDocument(const document::Document& doc) {
  SyncLogEntry entry;
  entry.id          = document::StringField(doc, "id").value_or("");
  entry.collection  = document::StringField(doc, "collection").value_or("");
  entry.action      = ParseSyncAction(document::StringField(doc, "action").value_or(""));
  entry.document_id = document::StringField(doc, "documentId").value_or("");
  entry.timestamp   = document::StringField(doc, "timestamp").value_or("");
  entry.status      = ParseSyncStatus(document::StringField(doc, "status").value_or("pending"));
  entry.synced_at   = document::StringField(doc, "syncedAt");
  entry.error       = document::StringField(doc, "error");
  entry.attempts    = static_cast<uint32_t>(document::NumberField(doc, "attempts").value_or(0));
  return entry;
}

} // namespace practicedb::db::model
