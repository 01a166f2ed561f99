#include "database_metadata.hpp"

namespace practicedb::db::model {

document::Document ToDocument(const DatabaseMetadata& metadata) {
  document::Document doc;
  document::SetString(doc, "version", metadata.version);
  if (metadata.last_migration) {
    document::SetString(doc, "lastMigration", *metadata.last_migration);
  } else {
    document::SetNull(doc, "lastMigration");
  }
  document::SetString(doc, "createdAt", metadata.created_at);
  document::SetString(doc, "updatedAt", metadata.updated_at);

  auto* stats = (*doc.mutable_fields())["statistics"].mutable_struct_value();
  for (const auto& [collection, count] : metadata.statistics) {
    (*stats->mutable_fields())[collection].set_number_value(static_cast<double>(count));
  }
  return doc;
}

DatabaseMetadata MetadataFromDocument(const document::Document& doc) {
  DatabaseMetadata metadata;
  metadata.version        = document::StringField(doc, "version").value_or(kInitialSchemaVersion);
  metadata.last_migration = document::StringField(doc, "lastMigration");
  metadata.created_at     = document::StringField(doc, "createdAt").value_or("");
  metadata.updated_at     = document::StringField(doc, "updatedAt").value_or("");

  if (const auto* stats = document::FindField(doc, "statistics"); stats && stats->has_struct_value()) {
    for (const auto& [collection, count] : stats->struct_value().fields()) {
      metadata.statistics[collection] = static_cast<uint64_t>(document::ToNumberOrZero(&count));
    }
  }
  return metadata;
}

} // namespace practicedb::db::model
