#include "database_engine.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#include "internal/db/model/collections.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/id.hpp"
#include "internal/util/time.hpp"

namespace practicedb::db {

using document::Document;
using document::Value;

namespace {

constexpr uint64_t kDefaultCacheTtlMs      = 5 * 60 * 1000;
constexpr uint32_t kDefaultSyncLogCapacity = 1000;
// Finished transactions kept for GetTransaction, oldest evicted first.
constexpr std::size_t kFinishedTransactionHistory = 64;

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::ptrdiff_t FindIndex(const std::vector<Document>& docs, const std::string& id) {
  for (std::size_t i = 0; i < docs.size(); ++i) {
    if (document::DocumentId(docs[i]) == id) return static_cast<std::ptrdiff_t>(i);
  }
  return -1;
}

// ISO-8601 strings of one format order lexicographically.
std::string LaterTimestamp(const std::string& previous, const std::string& now) {
  return previous > now ? previous : now;
}

Document Merge(const Document& before, const Document& patch, const std::string& now) {
  Document after = before;
  for (const auto& [key, value] : patch.fields()) {
    if (key == document::kIdField || key == document::kCreatedAtField || key == document::kUpdatedAtField) continue;
    (*after.mutable_fields())[key] = value;
  }
  const auto previous = document::StringField(before, document::kUpdatedAtField).value_or("");
  document::SetString(after, document::kUpdatedAtField, LaterTimestamp(previous, now));
  return after;
}

Document Project(const Document& doc, const QueryOptions& options) {
  if (!options.include.empty()) {
    Document picked;
    for (const auto& field : options.include) {
      if (const auto* v = document::FindField(doc, field)) (*picked.mutable_fields())[field] = *v;
    }
    return picked;
  }

  Document trimmed = doc;
  for (const auto& field : options.exclude) {
    trimmed.mutable_fields()->erase(field);
  }
  return trimmed;
}

Document BuildIndex(const std::vector<Document>& docs, const std::string& field) {
  Document index;
  for (const auto& doc : docs) {
    const auto* v = document::FindPath(doc, field);
    if (!v) continue;
    auto& ids = (*index.mutable_fields())[document::ValueKey(v)];
    ids.mutable_list_value()->add_values()->set_string_value(document::DocumentId(doc));
  }
  return index;
}

std::string GroupKey(const Value* v) {
  if (!v) return "u:";
  return std::to_string(static_cast<int>(v->kind_case())) + ":" + document::ValueKey(v);
}

} // namespace

const char* ToString(TransactionStatus status) {
  switch (status) {
    case TransactionStatus::Pending:
      return "pending";
    case TransactionStatus::Committed:
      return "committed";
    case TransactionStatus::RolledBack:
      return "rolledback";
  }
  return "pending";
}

bool Matches(const Where& where, const Document& doc) {
  return std::visit(Overloaded{
                        [](const std::monostate&) { return true; },
                        [&doc](const Document& fields) {
                          for (const auto& [key, expected] : fields.fields()) {
                            const auto* actual = document::FindField(doc, key);
                            if (!actual || !document::ValueEquals(*actual, expected)) return false;
                          }
                          return true;
                        },
                        [&doc](const Predicate& predicate) { return !predicate || predicate(doc); },
                    },
                    where);
}

DatabaseEngine::DatabaseEngine(storage::StorageAdapterPtr storage, const practicedb::runtime::config::EngineConfig& config)
    : storage_(std::move(storage)),
      sync_log_capacity_(config.sync_log_capacity() ? config.sync_log_capacity() : kDefaultSyncLogCapacity),
      cache_(std::chrono::milliseconds(static_cast<int64_t>(config.cache_ttl_ms() ? config.cache_ttl_ms() : kDefaultCacheTtlMs))) {
  if (!storage_) {
    throw std::invalid_argument("DatabaseEngine requires a storage adapter");
  }
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

std::optional<Document> DatabaseEngine::Get(const std::string& collection, const std::string& id) {
  if (auto cached = cache_.Get(collection, id)) return cached;

  std::scoped_lock lock(mutex_);
  for (auto& doc : LoadCollection(collection)) {
    if (document::DocumentId(doc) == id) {
      cache_.Put(collection, id, doc);
      return doc;
    }
  }
  return std::nullopt;
}

std::vector<Document> DatabaseEngine::GetAll(const std::string& collection) {
  std::scoped_lock lock(mutex_);
  return LoadCollection(collection);
}

QueryResult DatabaseEngine::Query(const std::string& collection, const QueryOptions& options) {
  std::vector<Document> all;
  {
    std::scoped_lock lock(mutex_);
    all = LoadCollection(collection);
  }

  std::vector<Document> filtered;
  filtered.reserve(all.size());
  for (auto& doc : all) {
    if (Matches(options.where, doc)) filtered.push_back(std::move(doc));
  }

  if (options.order_by && !options.order_by->empty()) {
    const auto& field     = *options.order_by;
    const int   direction = options.order_direction == SortDirection::Desc ? -1 : 1;
    std::stable_sort(filtered.begin(), filtered.end(), [&](const Document& a, const Document& b) {
      return direction * document::CompareValues(document::FindPath(a, field), document::FindPath(b, field)) < 0;
    });
  }

  QueryResult result;
  result.total     = filtered.size();
  result.page_size = options.limit;
  if (options.limit > 0) {
    result.page        = options.offset / options.limit + 1;
    result.total_pages = result.total / options.limit + (result.total % options.limit ? 1 : 0);
  }

  const auto begin = std::min(options.offset, filtered.size());
  const auto end   = begin + std::min(options.limit, filtered.size() - begin);
  result.data.reserve(end - begin);
  for (auto i = begin; i < end; ++i) {
    result.data.push_back(Project(filtered[i], options));
  }
  return result;
}

std::size_t DatabaseEngine::Count(const std::string& collection, const Where& where) {
  std::vector<Document> docs;
  {
    std::scoped_lock lock(mutex_);
    docs = LoadCollection(collection);
  }
  if (std::holds_alternative<std::monostate>(where)) return docs.size();
  return static_cast<std::size_t>(std::count_if(docs.begin(), docs.end(), [&](const Document& d) { return Matches(where, d); }));
}

std::vector<AggregateRow> DatabaseEngine::Aggregate(const std::string& collection, const std::string& group_by, const AggregateSpec& spec) {
  const auto docs = GetAll(collection);

  std::vector<AggregateRow>                      rows;
  std::vector<std::vector<const Document*>>      members;
  std::unordered_map<std::string, std::size_t>   slots;

  for (const auto& doc : docs) {
    const auto* v   = document::FindField(doc, group_by);
    const auto  key = GroupKey(v);

    auto it = slots.find(key);
    if (it == slots.end()) {
      AggregateRow row;
      row.group = v ? *v : document::NullValue();
      rows.push_back(std::move(row));
      members.emplace_back();
      it = slots.emplace(key, rows.size() - 1).first;
    }
    members[it->second].push_back(&doc);
  }

  for (std::size_t i = 0; i < rows.size(); ++i) {
    auto&       row   = rows[i];
    const auto& items = members[i];

    if (spec.count) row.count = items.size();

    if (spec.sum) {
      double sum = 0;
      for (const auto* item : items) sum += document::ToNumberOrZero(document::FindField(*item, *spec.sum));
      row.sum = sum;
    }

    if (spec.avg && !items.empty()) {
      double sum = 0;
      for (const auto* item : items) sum += document::ToNumberOrZero(document::FindField(*item, *spec.avg));
      row.avg = sum / static_cast<double>(items.size());
    }

    if (spec.min) {
      const Value* best = nullptr;
      for (const auto* item : items) {
        const auto* v = document::FindField(*item, *spec.min);
        if (v && (!best || document::CompareValues(v, best) < 0)) best = v;
      }
      if (best) row.min = *best;
    }

    if (spec.max) {
      const Value* best = nullptr;
      for (const auto* item : items) {
        const auto* v = document::FindField(*item, *spec.max);
        if (v && (!best || document::CompareValues(v, best) > 0)) best = v;
      }
      if (best) row.max = *best;
    }
  }
  return rows;
}

// ------------------------------------------------------------
// Writes
// ------------------------------------------------------------

Document DatabaseEngine::Create(const std::string& collection, const Document& data) {
  Events   events;
  Document created;
  {
    std::scoped_lock lock(mutex_);
    auto             docs = LoadCollection(collection);

    created       = PrepareNew(data, util::NowIso8601());
    const auto id = document::DocumentId(created);
    if (FindIndex(docs, id) >= 0) {
      throw util::AlreadyExists("Document with ID " + id + " already exists in " + collection);
    }

    docs.push_back(created);
    SaveCollection(collection, docs);
    cache_.InvalidateCollection(collection);
    LogSync(collection, model::SyncAction::Create, {id});
    Record(Created{collection, created});
    AfterWrite(collection, docs, ChangeKind::Created, {id}, events);
  }
  Publish(std::move(events));
  return created;
}

std::optional<Document> DatabaseEngine::Update(const std::string& collection, const std::string& id, const Document& patch) {
  Events   events;
  Document updated;
  {
    std::scoped_lock lock(mutex_);
    auto             docs  = LoadCollection(collection);
    const auto       index = FindIndex(docs, id);
    if (index < 0) return std::nullopt;

    const Document before = docs[index];
    updated               = Merge(before, patch, util::NowIso8601());
    docs[index]           = updated;

    SaveCollection(collection, docs);
    cache_.Invalidate(collection, id);
    LogSync(collection, model::SyncAction::Update, {id});
    Record(Updated{collection, before, updated});
    AfterWrite(collection, docs, ChangeKind::Updated, {id}, events);
  }
  Publish(std::move(events));
  return updated;
}

Document DatabaseEngine::Upsert(const std::string& collection, const Document& data) {
  const auto id = document::DocumentId(data);
  if (!id.empty()) {
    if (auto updated = Update(collection, id, data)) return *updated;
  }
  return Create(collection, data);
}

bool DatabaseEngine::Delete(const std::string& collection, const std::string& id) {
  Events events;
  {
    std::scoped_lock lock(mutex_);
    auto             docs  = LoadCollection(collection);
    const auto       index = FindIndex(docs, id);
    if (index < 0) return false;

    Document removed = std::move(docs[index]);
    docs.erase(docs.begin() + index);

    SaveCollection(collection, docs);
    cache_.Invalidate(collection, id);
    LogSync(collection, model::SyncAction::Delete, {id});
    Record(Deleted{collection, removed});
    AfterWrite(collection, docs, ChangeKind::Deleted, {id}, events);
  }
  Publish(std::move(events));
  return true;
}

std::size_t DatabaseEngine::DeleteMany(const std::string& collection, const Where& where) {
  Events      events;
  std::size_t removed_count = 0;
  {
    std::scoped_lock lock(mutex_);
    auto             docs = LoadCollection(collection);

    std::vector<Document>    remaining;
    std::vector<std::string> ids;
    for (auto& doc : docs) {
      if (Matches(where, doc)) {
        ids.push_back(document::DocumentId(doc));
        Record(Deleted{collection, doc});
      } else {
        remaining.push_back(std::move(doc));
      }
    }
    if (ids.empty()) return 0;
    removed_count = ids.size();

    SaveCollection(collection, remaining);
    cache_.InvalidateCollection(collection);
    LogSync(collection, model::SyncAction::Delete, ids);
    AfterWrite(collection, remaining, ChangeKind::Deleted, std::move(ids), events);
  }
  Publish(std::move(events));
  return removed_count;
}

std::vector<Document> DatabaseEngine::CreateMany(const std::string& collection, const std::vector<Document>& documents) {
  Events                events;
  std::vector<Document> created;
  {
    std::scoped_lock lock(mutex_);
    auto             docs = LoadCollection(collection);

    std::unordered_set<std::string> taken;
    for (const auto& doc : docs) taken.insert(document::DocumentId(doc));

    const auto               now = util::NowIso8601();
    std::vector<std::string> ids;
    created.reserve(documents.size());
    for (const auto& data : documents) {
      auto doc = PrepareNew(data, now);
      auto id  = document::DocumentId(doc);
      if (!taken.insert(id).second) {
        throw util::AlreadyExists("Document with ID " + id + " already exists in " + collection);
      }
      ids.push_back(std::move(id));
      created.push_back(std::move(doc));
    }
    if (created.empty()) return created;

    docs.insert(docs.end(), created.begin(), created.end());
    SaveCollection(collection, docs);
    cache_.InvalidateCollection(collection);
    LogSync(collection, model::SyncAction::Create, ids);
    for (const auto& doc : created) Record(Created{collection, doc});
    AfterWrite(collection, docs, ChangeKind::Created, std::move(ids), events);
  }
  Publish(std::move(events));
  return created;
}

std::size_t DatabaseEngine::UpdateMany(const std::string& collection, const std::vector<DocumentPatch>& patches) {
  Events      events;
  std::size_t updated_count = 0;
  {
    std::scoped_lock lock(mutex_);
    auto             docs = LoadCollection(collection);
    const auto       now  = util::NowIso8601();

    std::vector<std::string> ids;
    for (const auto& patch : patches) {
      const auto index = FindIndex(docs, patch.id);
      if (index < 0) continue;

      Document before = docs[index];
      docs[index]     = Merge(before, patch.data, now);
      Record(Updated{collection, std::move(before), docs[index]});
      ids.push_back(patch.id);
    }
    if (ids.empty()) return 0;
    updated_count = ids.size();

    SaveCollection(collection, docs);
    cache_.InvalidateCollection(collection);
    LogSync(collection, model::SyncAction::Update, ids);
    AfterWrite(collection, docs, ChangeKind::Updated, std::move(ids), events);
  }
  Publish(std::move(events));
  return updated_count;
}

// ------------------------------------------------------------
// Indexes
// ------------------------------------------------------------

void DatabaseEngine::CreateIndex(const std::string& collection, const std::string& field, const std::string& index_name) {
  std::scoped_lock lock(mutex_);

  auto     registry = LoadIndexRegistry();
  Document definition;
  document::SetString(definition, "collection", collection);
  document::SetString(definition, "field", field);
  *(*registry.mutable_fields())[index_name].mutable_struct_value() = definition;
  storage_->Set(collections::kIndexRegistry, document::StructValue(registry));

  storage_->Set(IndexKey(index_name), document::StructValue(BuildIndex(LoadCollection(collection), field)));

  PRACTICEDB_LOG_DEBUG("index created", {observability::StringField("index", index_name), observability::CollectionField(collection),
                                         observability::StringField("field", field)});
}

bool DatabaseEngine::DropIndex(const std::string& index_name) {
  std::scoped_lock lock(mutex_);

  auto       registry = LoadIndexRegistry();
  const bool existed  = registry.mutable_fields()->erase(index_name) > 0;
  if (existed) {
    storage_->Set(collections::kIndexRegistry, document::StructValue(registry));
  }
  storage_->Delete(IndexKey(index_name));
  return existed;
}

void DatabaseEngine::RebuildIndexes(const std::string& collection) {
  std::scoped_lock lock(mutex_);
  RebuildIndexesLocked(collection, LoadCollection(collection));
}

std::vector<Document> DatabaseEngine::FindByIndex(const std::string& collection, const std::string& index_name, const Value& value) {
  std::scoped_lock lock(mutex_);

  const auto index = storage_->Get(IndexKey(index_name));
  if (!index || !index->has_struct_value()) return {};

  const auto* ids = document::FindField(index->struct_value(), document::ValueKey(&value));
  if (!ids || !ids->has_list_value()) return {};

  std::unordered_set<std::string> wanted;
  for (const auto& id : ids->list_value().values()) wanted.insert(id.string_value());

  std::vector<Document> matches;
  for (auto& doc : LoadCollection(collection)) {
    if (wanted.count(document::DocumentId(doc))) matches.push_back(std::move(doc));
  }
  return matches;
}

std::vector<std::string> DatabaseEngine::ListIndexes() {
  std::scoped_lock         lock(mutex_);
  std::vector<std::string> names;
  for (const auto& [name, definition] : LoadIndexRegistry().fields()) names.push_back(name);
  std::sort(names.begin(), names.end());
  return names;
}

Document DatabaseEngine::LoadIndexRegistry() {
  auto registry = storage_->Get(collections::kIndexRegistry);
  if (!registry || !registry->has_struct_value()) return {};
  return registry->struct_value();
}

void DatabaseEngine::RebuildIndexesLocked(const std::string& collection, const std::vector<Document>& docs) {
  for (const auto& [name, definition] : LoadIndexRegistry().fields()) {
    if (!definition.has_struct_value()) continue;
    const auto& def = definition.struct_value();
    if (document::StringField(def, "collection").value_or("") != collection) continue;

    const auto field = document::StringField(def, "field").value_or("");
    storage_->Set(IndexKey(name), document::StructValue(BuildIndex(docs, field)));
  }
}

// ------------------------------------------------------------
// Change notification
// ------------------------------------------------------------

Subscription DatabaseEngine::Subscribe(const std::string& collection, ChangeHandler handler) {
  return channel_.Subscribe(collection, std::move(handler));
}

void DatabaseEngine::Publish(Events events) {
  for (auto& event : events) {
    channel_.Publish(std::move(event));
  }
}

// ------------------------------------------------------------
// Transactions
// ------------------------------------------------------------

std::string DatabaseEngine::BeginTransaction() {
  std::scoped_lock lock(mutex_);

  Transaction tx;
  tx.id         = util::GenerateId();
  tx.created_at = util::NowIso8601();
  auto id       = tx.id;
  transactions_.emplace(id, std::move(tx));
  return id;
}

bool DatabaseEngine::CommitTransaction(const std::string& id) {
  std::scoped_lock lock(mutex_);

  auto it = transactions_.find(id);
  if (it == transactions_.end() || it->second.status != TransactionStatus::Pending) return false;
  Finish(it, TransactionStatus::Committed);
  return true;
}

bool DatabaseEngine::RollbackTransaction(const std::string& id) {
  Events events;
  {
    std::scoped_lock lock(mutex_);

    auto it = transactions_.find(id);
    if (it == transactions_.end() || it->second.status != TransactionStatus::Pending) return false;

    // Finish first so the restores below are not recorded into this transaction.
    const auto ops = it->second.operations;
    Finish(it, TransactionStatus::RolledBack);

    std::map<std::string, std::vector<Document>>    touched;
    std::map<std::string, std::vector<std::string>> touched_ids;
    auto                                            docs_of = [&](const std::string& collection) -> std::vector<Document>& {
      auto found = touched.find(collection);
      if (found == touched.end()) found = touched.emplace(collection, LoadCollection(collection)).first;
      return found->second;
    };

    for (auto op = ops.rbegin(); op != ops.rend(); ++op) {
      std::visit(Overloaded{
                     [&](const Created& c) {
                       auto&      docs  = docs_of(c.collection);
                       const auto docid = document::DocumentId(c.doc);
                       const auto index = FindIndex(docs, docid);
                       if (index < 0) return;
                       Record(Deleted{c.collection, docs[index]});
                       docs.erase(docs.begin() + index);
                       LogSync(c.collection, model::SyncAction::Delete, {docid});
                       touched_ids[c.collection].push_back(docid);
                     },
                     [&](const Updated& u) {
                       auto&      docs  = docs_of(u.collection);
                       const auto docid = document::DocumentId(u.before);
                       const auto index = FindIndex(docs, docid);
                       if (index < 0) {
                         docs.push_back(u.before);
                         Record(Created{u.collection, u.before});
                         LogSync(u.collection, model::SyncAction::Create, {docid});
                       } else {
                         Record(Updated{u.collection, docs[index], u.before});
                         docs[index] = u.before;
                         LogSync(u.collection, model::SyncAction::Update, {docid});
                       }
                       touched_ids[u.collection].push_back(docid);
                     },
                     [&](const Deleted& d) {
                       auto&      docs  = docs_of(d.collection);
                       const auto docid = document::DocumentId(d.doc);
                       if (FindIndex(docs, docid) >= 0) return;
                       docs.push_back(d.doc);
                       Record(Created{d.collection, d.doc});
                       LogSync(d.collection, model::SyncAction::Create, {docid});
                       touched_ids[d.collection].push_back(docid);
                     },
                 },
                 *op);
    }

    for (auto& [collection, docs] : touched) {
      SaveCollection(collection, docs);
      cache_.InvalidateCollection(collection);
      AfterWrite(collection, docs, ChangeKind::RolledBack, touched_ids[collection], events);
    }

    PRACTICEDB_LOG_INFO("transaction rolled back", {observability::TransactionField(id), observability::CountField("operations", ops.size())});
  }
  Publish(std::move(events));
  return true;
}

void DatabaseEngine::Finish(std::map<std::string, Transaction>::iterator it, TransactionStatus status) {
  it->second.status = status;
  it->second.operations.clear();
  it->second.operations.shrink_to_fit();

  finished_.push_back(it->first);
  while (finished_.size() > kFinishedTransactionHistory) {
    transactions_.erase(finished_.front());
    finished_.pop_front();
  }
}

std::optional<Transaction> DatabaseEngine::GetTransaction(const std::string& id) const {
  std::scoped_lock lock(mutex_);
  auto             it = transactions_.find(id);
  if (it == transactions_.end()) return std::nullopt;
  return it->second;
}

void DatabaseEngine::Record(const Operation& op) {
  for (auto& [id, tx] : transactions_) {
    if (tx.status == TransactionStatus::Pending) tx.operations.push_back(op);
  }
}

// ------------------------------------------------------------
// Sync log
// ------------------------------------------------------------

std::vector<model::SyncLogEntry> DatabaseEngine::LoadSyncLog() {
  std::vector<model::SyncLogEntry> entries;

  const auto stored = storage_->Get(collections::kSyncLog);
  if (!stored) return entries;

  for (const auto& doc : document::ToDocuments(*stored)) {
    try {
      entries.push_back(model::FromDocument(doc));
    } catch (const std::invalid_argument& e) {
      PRACTICEDB_LOG_WARN("skipping malformed sync log row", {observability::ErrorField(e)});
    }
  }
  return entries;
}

void DatabaseEngine::SaveSyncLog(const std::vector<model::SyncLogEntry>& entries) {
  std::vector<Document> docs;
  docs.reserve(entries.size());
  for (const auto& entry : entries) docs.push_back(model::ToDocument(entry));
  storage_->Set(collections::kSyncLog, document::FromDocuments(docs));
}

void DatabaseEngine::LogSync(const std::string& collection, model::SyncAction action, const std::vector<std::string>& ids) {
  if (ids.empty()) return;

  auto       entries = LoadSyncLog();
  const auto now     = util::NowIso8601();
  for (const auto& id : ids) {
    model::SyncLogEntry entry;
    entry.id          = util::GenerateId();
    entry.collection  = collection;
    entry.action      = action;
    entry.document_id = id;
    entry.timestamp   = now;
    entries.push_back(std::move(entry));
  }

  if (entries.size() > sync_log_capacity_) {
    entries.erase(entries.begin(), entries.begin() + static_cast<std::ptrdiff_t>(entries.size() - sync_log_capacity_));
  }
  SaveSyncLog(entries);
}

std::vector<model::SyncLogEntry> DatabaseEngine::GetSyncLog() {
  std::scoped_lock lock(mutex_);
  return LoadSyncLog();
}

std::vector<model::SyncLogEntry> DatabaseEngine::GetPendingSyncs() {
  std::scoped_lock                 lock(mutex_);
  std::vector<model::SyncLogEntry> pending;
  for (auto& entry : LoadSyncLog()) {
    if (entry.status == model::SyncStatus::Pending) pending.push_back(std::move(entry));
  }
  return pending;
}

void DatabaseEngine::MarkAsSynced(const std::vector<std::string>& ids) {
  if (ids.empty()) return;
  std::scoped_lock lock(mutex_);

  const std::unordered_set<std::string> wanted(ids.begin(), ids.end());
  const auto                            now     = util::NowIso8601();
  auto                                  entries = LoadSyncLog();
  for (auto& entry : entries) {
    if (!wanted.count(entry.id)) continue;
    entry.status    = model::SyncStatus::Synced;
    entry.synced_at = now;
    entry.error.reset();
  }
  SaveSyncLog(entries);
}

void DatabaseEngine::MarkSyncFailed(const std::string& id, const std::string& error, uint32_t max_attempts) {
  std::scoped_lock lock(mutex_);

  auto entries = LoadSyncLog();
  for (auto& entry : entries) {
    if (entry.id != id) continue;
    ++entry.attempts;
    entry.error = error;
    if (max_attempts > 0 && entry.attempts >= max_attempts) {
      entry.status = model::SyncStatus::Error;
    }
    SaveSyncLog(entries);
    return;
  }
}

Document DatabaseEngine::ApplyRemoteUpsert(const std::string& collection, const Document& doc) {
  const auto id = document::DocumentId(doc);
  if (id.empty()) {
    throw std::invalid_argument("remote document for " + collection + " has no id");
  }

  Events   events;
  Document applied = doc;
  {
    std::scoped_lock lock(mutex_);
    const auto       now = util::NowIso8601();
    if (!document::StringField(applied, document::kCreatedAtField)) document::SetString(applied, document::kCreatedAtField, now);
    if (!document::StringField(applied, document::kUpdatedAtField)) document::SetString(applied, document::kUpdatedAtField, now);

    auto       docs  = LoadCollection(collection);
    const auto index = FindIndex(docs, id);
    ChangeKind kind  = ChangeKind::Created;
    if (index >= 0) {
      Record(Updated{collection, docs[index], applied});
      docs[index] = applied;
      kind        = ChangeKind::Updated;
    } else {
      Record(Created{collection, applied});
      docs.push_back(applied);
    }

    SaveCollection(collection, docs);
    cache_.Invalidate(collection, id);
    AfterWrite(collection, docs, kind, {id}, events);
  }
  Publish(std::move(events));
  return applied;
}

bool DatabaseEngine::ApplyRemoteDelete(const std::string& collection, const std::string& id) {
  Events events;
  {
    std::scoped_lock lock(mutex_);
    auto             docs  = LoadCollection(collection);
    const auto       index = FindIndex(docs, id);
    if (index < 0) return false;

    Record(Deleted{collection, docs[index]});
    docs.erase(docs.begin() + index);

    SaveCollection(collection, docs);
    cache_.Invalidate(collection, id);
    AfterWrite(collection, docs, ChangeKind::Deleted, {id}, events);
  }
  Publish(std::move(events));
  return true;
}

// ------------------------------------------------------------
// Metadata
// ------------------------------------------------------------

model::DatabaseMetadata DatabaseEngine::GetMetadata() {
  std::scoped_lock lock(mutex_);
  return GetMetadataLocked();
}

model::DatabaseMetadata DatabaseEngine::GetMetadataLocked() {
  if (auto stored = storage_->Get(collections::kMetadata); stored && stored->has_struct_value()) {
    return model::MetadataFromDocument(stored->struct_value());
  }

  model::DatabaseMetadata metadata;
  metadata.created_at = util::NowIso8601();
  metadata.updated_at = metadata.created_at;
  for (const auto& collection : DomainCollections()) metadata.statistics[collection] = 0;
  SaveMetadata(metadata);
  return metadata;
}

void DatabaseEngine::SaveMetadata(const model::DatabaseMetadata& metadata) {
  storage_->Set(collections::kMetadata, document::StructValue(model::ToDocument(metadata)));
}

void DatabaseEngine::RefreshCount(const std::string& collection, std::size_t count) {
  if (!IsDomainCollection(collection)) return;

  auto metadata = GetMetadataLocked();
  auto it       = metadata.statistics.find(collection);
  if (it != metadata.statistics.end() && it->second == count) return;

  metadata.statistics[collection] = count;
  metadata.updated_at             = util::NowIso8601();
  SaveMetadata(metadata);
}

model::DatabaseMetadata DatabaseEngine::UpdateStatistics() {
  std::scoped_lock lock(mutex_);
  return UpdateStatisticsLocked();
}

model::DatabaseMetadata DatabaseEngine::UpdateStatisticsLocked() {
  auto metadata = GetMetadataLocked();
  for (const auto& collection : DomainCollections()) {
    metadata.statistics[collection] = LoadCollection(collection).size();
  }
  metadata.updated_at = util::NowIso8601();
  SaveMetadata(metadata);
  return metadata;
}

void DatabaseEngine::SetLastMigration(const std::string& version) {
  std::scoped_lock lock(mutex_);

  auto metadata           = GetMetadataLocked();
  metadata.last_migration = version;
  metadata.version        = version;
  metadata.updated_at     = util::NowIso8601();
  SaveMetadata(metadata);
}

// ------------------------------------------------------------
// Export / import
// ------------------------------------------------------------

Document DatabaseEngine::ExportDatabase() {
  std::scoped_lock lock(mutex_);

  Document bundle;
  auto&    fields = *bundle.mutable_fields();
  for (const auto& collection : DomainCollections()) {
    fields[collection] = document::FromDocuments(LoadCollection(collection));
  }
  fields["metadata"] = document::StructValue(model::ToDocument(GetMetadataLocked()));
  fields["exportedAt"].set_string_value(util::NowIso8601());
  return bundle;
}

void DatabaseEngine::ImportDatabase(const Document& bundle, bool merge) {
  Events events;
  {
    std::scoped_lock lock(mutex_);

    for (const auto& collection : DomainCollections()) {
      const auto* incoming = document::FindField(bundle, collection);
      if (!incoming || !incoming->has_list_value()) continue;

      std::vector<Document>    docs;
      std::vector<std::string> ids;
      if (merge) {
        docs = LoadCollection(collection);
        std::unordered_set<std::string> taken;
        for (const auto& doc : docs) taken.insert(document::DocumentId(doc));
        for (auto& doc : document::ToDocuments(*incoming)) {
          auto id = document::DocumentId(doc);
          if (!taken.insert(id).second) continue;
          ids.push_back(std::move(id));
          docs.push_back(std::move(doc));
        }
      } else {
        docs = document::ToDocuments(*incoming);
        for (const auto& doc : docs) ids.push_back(document::DocumentId(doc));
      }

      SaveCollection(collection, docs);
      cache_.InvalidateCollection(collection);
      AfterWrite(collection, docs, ChangeKind::Imported, std::move(ids), events);
    }

    UpdateStatisticsLocked();
    PRACTICEDB_LOG_INFO("database imported", {observability::BoolField("merge", merge), observability::CountField("collections", events.size())});
  }
  Publish(std::move(events));
}

void DatabaseEngine::ClearDatabase() {
  Events events;
  {
    std::scoped_lock lock(mutex_);
    storage_->Clear();
    cache_.Clear();
    transactions_.clear();
    finished_.clear();

    for (const auto& collection : DomainCollections()) {
      events.push_back(ChangeEvent{collection, ChangeKind::Cleared, {}, {}});
    }
  }
  Publish(std::move(events));
}

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------

std::vector<Document> DatabaseEngine::LoadCollection(const std::string& collection) {
  const auto stored = storage_->Get(collection);
  if (!stored) return {};
  if (!stored->has_list_value()) {
    PRACTICEDB_LOG_WARN("collection payload is not an array", {observability::CollectionField(collection)});
    return {};
  }
  return document::ToDocuments(*stored);
}

void DatabaseEngine::SaveCollection(const std::string& collection, const std::vector<Document>& docs) {
  storage_->Set(collection, document::FromDocuments(docs));
}

void DatabaseEngine::AfterWrite(const std::string& collection, const std::vector<Document>& docs, ChangeKind kind, std::vector<std::string> ids,
                                Events& events) {
  RebuildIndexesLocked(collection, docs);
  RefreshCount(collection, docs.size());

  ChangeEvent event;
  event.collection   = collection;
  event.kind         = kind;
  event.document_ids = std::move(ids);
  if (channel_.SubscriberCount(collection) > 0) event.snapshot = docs;
  events.push_back(std::move(event));
}

Document DatabaseEngine::PrepareNew(const Document& data, const std::string& now) const {
  Document doc = data;
  auto     id  = document::StringField(doc, document::kIdField).value_or("");
  if (id.empty()) id = util::GenerateId();

  document::SetString(doc, document::kIdField, id);
  document::SetString(doc, document::kCreatedAtField, now);
  document::SetString(doc, document::kUpdatedAtField, now);
  return doc;
}

// ------------------------------------------------------------
// ScopedTransaction
// ------------------------------------------------------------

ScopedTransaction::ScopedTransaction(DatabaseEngine& engine) : engine_(engine), id_(engine.BeginTransaction()) {
}

ScopedTransaction::~ScopedTransaction() {
  if (done_) return;
  try {
    engine_.RollbackTransaction(id_);
  } catch (const std::exception& e) {
    PRACTICEDB_LOG_ERROR("scoped rollback failed", {observability::TransactionField(id_), observability::ErrorField(e)});
  }
}

bool ScopedTransaction::Commit() {
  done_ = true;
  return engine_.CommitTransaction(id_);
}

bool ScopedTransaction::Rollback() {
  done_ = true;
  return engine_.RollbackTransaction(id_);
}

} // namespace practicedb::db
