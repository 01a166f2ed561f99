#include "migration_runner.hpp"

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <sstream>

#include "internal/db/engine/database_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace practicedb::migration {

namespace {

constexpr const char* kBaseVersion = "0.0.0";

std::vector<long> SplitVersion(const std::string& version) {
  std::vector<long>  parts;
  std::istringstream in(version);
  std::string        part;
  while (std::getline(in, part, '.')) {
    parts.push_back(std::strtol(part.c_str(), nullptr, 10));
  }
  return parts;
}

} // namespace

int CompareVersions(const std::string& a, const std::string& b) {
  const auto lhs = SplitVersion(a);
  const auto rhs = SplitVersion(b);
  const auto n   = std::max(lhs.size(), rhs.size());

  for (std::size_t i = 0; i < n; ++i) {
    const long l = i < lhs.size() ? lhs[i] : 0;
    const long r = i < rhs.size() ? rhs[i] : 0;
    if (l != r) return l < r ? -1 : 1;
  }
  return 0;
}

MigrationRunner::MigrationRunner(db::DatabaseEngine& engine, std::vector<Migration> migrations)
    : engine_(engine), migrations_(std::move(migrations)) {
  std::stable_sort(migrations_.begin(), migrations_.end(),
                   [](const Migration& a, const Migration& b) { return CompareVersions(a.version, b.version) < 0; });
}

std::string MigrationRunner::CurrentVersion() {
  const auto metadata = engine_.GetMetadata();
  return metadata.last_migration.value_or(kBaseVersion);
}

std::vector<std::string> MigrationRunner::PendingVersions() {
  const auto               current = CurrentVersion();
  std::vector<std::string> pending;
  for (const auto& m : migrations_) {
    if (CompareVersions(m.version, current) > 0) pending.push_back(m.version);
  }
  return pending;
}

std::vector<std::string> MigrationRunner::RunMigrations() {
  observability::SpanScope span("practicedb.migration.run");

  const auto current = CurrentVersion();
  span.SetAttribute("migration.from", current);

  std::vector<std::string> applied;
  for (const auto& m : migrations_) {
    if (CompareVersions(m.version, current) <= 0) continue;

    observability::LogContext ctx({observability::StringField("version", m.version)});
    PRACTICEDB_LOG_INFO("applying migration", {observability::StringField("name", m.name)});
    try {
      m.up(engine_);
    } catch (const std::exception& e) {
      span.RecordError(e);
      PRACTICEDB_LOG_ERROR("migration failed", {observability::ErrorField(e)});
      throw util::MigrationError("Migration " + m.version + " (" + m.name + ") failed: " + e.what());
    }

    engine_.SetLastMigration(m.version);
    span.AddEvent("migration.applied");
    applied.push_back(m.version);
  }

  span.SetCount("migration.applied", applied.size());
  return applied;
}

std::vector<std::string> MigrationRunner::Rollback(const std::string& target) {
  observability::SpanScope span("practicedb.migration.rollback");
  span.SetAttribute("migration.target", target);

  const auto current = CurrentVersion();
  if (CompareVersions(target, current) >= 0) {
    return {};
  }

  std::vector<std::string> reverted;
  for (auto it = migrations_.rbegin(); it != migrations_.rend(); ++it) {
    if (CompareVersions(it->version, target) <= 0 || CompareVersions(it->version, current) > 0) continue;

    observability::LogContext ctx({observability::StringField("version", it->version)});
    PRACTICEDB_LOG_INFO("reverting migration", {observability::StringField("name", it->name)});
    try {
      it->down(engine_);
    } catch (const std::exception& e) {
      span.RecordError(e);
      throw util::MigrationError("Rollback of " + it->version + " (" + it->name + ") failed: " + e.what());
    }
    reverted.push_back(it->version);
  }

  engine_.SetLastMigration(target);
  return reverted;
}

} // namespace practicedb::migration
