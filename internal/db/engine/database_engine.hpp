#pragma once

#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "change_channel.hpp"
#include "config/config.pb.h"
#include "document_cache.hpp"
#include "internal/db/model/database_metadata.hpp"
#include "internal/db/model/sync_log_entry.hpp"
#include "internal/storage/storage_adapter.hpp"
#include "query.hpp"
#include "transaction.hpp"

namespace practicedb::db {

/*
  Document engine over a StorageAdapter.

  Each collection is one document array under its own key. Every
  mutating call, in order:
    persists the collection
    invalidates the cache
    appends one sync row per touched document
    rebuilds the collection's registered indexes
    refreshes the collection count in metadata
    records before-images into pending transactions
    publishes one ChangeEvent (after the engine lock is released)

  Calls are serialized by one mutex. There is no isolation between
  calls: a transaction only remembers what to restore.
*/
class DatabaseEngine {
 public:
  explicit DatabaseEngine(storage::StorageAdapterPtr storage, const practicedb::runtime::config::EngineConfig& config = {});

  DatabaseEngine(const DatabaseEngine&)            = delete;
  DatabaseEngine& operator=(const DatabaseEngine&) = delete;

  // ------------------------------------------------------------------
  // Reads
  // ------------------------------------------------------------------
  std::optional<document::Document> Get(const std::string& collection, const std::string& id);
  std::vector<document::Document>   GetAll(const std::string& collection);
  QueryResult                       Query(const std::string& collection, const QueryOptions& options = {});
  std::size_t                       Count(const std::string& collection, const Where& where = {});

  // One row per distinct groupBy value, in first-seen order.
  std::vector<AggregateRow> Aggregate(const std::string& collection, const std::string& group_by, const AggregateSpec& spec);

  // ------------------------------------------------------------------
  // Writes
  // ------------------------------------------------------------------
  /*
    Create stamps id (when absent), createdAt and updatedAt.
    Throws util::AlreadyExists when the id is taken.
  */
  document::Document Create(const std::string& collection, const document::Document& data);

  // nullopt when id is unknown; id and createdAt are never overwritten.
  std::optional<document::Document> Update(const std::string& collection, const std::string& id, const document::Document& patch);

  document::Document Upsert(const std::string& collection, const document::Document& data);

  bool Delete(const std::string& collection, const std::string& id);

  // where is evaluated under the engine lock; a predicate must not call back into the engine.
  std::size_t DeleteMany(const std::string& collection, const Where& where);

  // All-or-nothing duplicate check before anything is written.
  std::vector<document::Document> CreateMany(const std::string& collection, const std::vector<document::Document>& documents);
  std::size_t                     UpdateMany(const std::string& collection, const std::vector<DocumentPatch>& patches);

  // ------------------------------------------------------------------
  // Indexes
  // ------------------------------------------------------------------
  void                            CreateIndex(const std::string& collection, const std::string& field, const std::string& index_name);
  bool                            DropIndex(const std::string& index_name);
  void                            RebuildIndexes(const std::string& collection);
  std::vector<document::Document> FindByIndex(const std::string& collection, const std::string& index_name, const document::Value& value);
  std::vector<std::string>        ListIndexes();

  // ------------------------------------------------------------------
  // Change notification
  // ------------------------------------------------------------------
  [[nodiscard]] Subscription Subscribe(const std::string& collection, ChangeHandler handler);

  // ------------------------------------------------------------------
  // Transactions
  // ------------------------------------------------------------------
  std::string                BeginTransaction();
  bool                       CommitTransaction(const std::string& id);
  bool                       RollbackTransaction(const std::string& id);
  // Finished transactions keep their status but drop their operations;
  // only the most recent 64 of them stay retrievable.
  std::optional<Transaction> GetTransaction(const std::string& id) const;

  // ------------------------------------------------------------------
  // Sync log
  // ------------------------------------------------------------------
  std::vector<model::SyncLogEntry> GetSyncLog();
  std::vector<model::SyncLogEntry> GetPendingSyncs();
  void                             MarkAsSynced(const std::vector<std::string>& ids);

  // Counts an attempt; the row turns to error once attempts reach max_attempts.
  void MarkSyncFailed(const std::string& id, const std::string& error, uint32_t max_attempts);

  // Remote changes keep their own timestamps and produce no sync rows.
  document::Document ApplyRemoteUpsert(const std::string& collection, const document::Document& doc);
  bool               ApplyRemoteDelete(const std::string& collection, const std::string& id);

  // ------------------------------------------------------------------
  // Metadata / maintenance
  // ------------------------------------------------------------------
  model::DatabaseMetadata GetMetadata();
  model::DatabaseMetadata UpdateStatistics();
  void                    SetLastMigration(const std::string& version);

  document::Document ExportDatabase();
  void               ImportDatabase(const document::Document& bundle, bool merge);
  void               ClearDatabase();

  storage::StorageAdapter& Storage() {
    return *storage_;
  }

 private:
  using Events = std::vector<ChangeEvent>;

  std::vector<document::Document> LoadCollection(const std::string& collection);
  void                            SaveCollection(const std::string& collection, const std::vector<document::Document>& docs);

  std::vector<model::SyncLogEntry> LoadSyncLog();
  void                             SaveSyncLog(const std::vector<model::SyncLogEntry>& entries);
  void                             LogSync(const std::string& collection, model::SyncAction action, const std::vector<std::string>& ids);

  document::Document LoadIndexRegistry();
  void               RebuildIndexesLocked(const std::string& collection, const std::vector<document::Document>& docs);

  model::DatabaseMetadata GetMetadataLocked();
  void                    SaveMetadata(const model::DatabaseMetadata& metadata);
  void                    RefreshCount(const std::string& collection, std::size_t count);
  model::DatabaseMetadata UpdateStatisticsLocked();

  void Record(const Operation& op);
  void Finish(std::map<std::string, Transaction>::iterator it, TransactionStatus status);

  // Shared tail of every mutation on one collection.
  void AfterWrite(const std::string& collection, const std::vector<document::Document>& docs, ChangeKind kind, std::vector<std::string> ids,
                  Events& events);

  document::Document PrepareNew(const document::Document& data, const std::string& now) const;

  void Publish(Events events);

  storage::StorageAdapterPtr storage_;
  uint32_t                   sync_log_capacity_;
  DocumentCache              cache_;
  ChangeChannel              channel_;

  mutable std::mutex                 mutex_;
  std::map<std::string, Transaction> transactions_;
  std::deque<std::string>            finished_;
};

/*
  Rolls the transaction back on scope exit unless Commit() was called.
*/
class ScopedTransaction {
 public:
  explicit ScopedTransaction(DatabaseEngine& engine);
  ~ScopedTransaction();

  ScopedTransaction(const ScopedTransaction&)            = delete;
  ScopedTransaction& operator=(const ScopedTransaction&) = delete;

  const std::string& Id() const {
    return id_;
  }

  bool Commit();
  bool Rollback();

 private:
  DatabaseEngine& engine_;
  std::string     id_;
  bool            done_ = false;
};

} // namespace practicedb::db
