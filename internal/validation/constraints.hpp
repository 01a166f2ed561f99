#pragma once

#include <string>
#include <vector>

namespace practicedb::validation {

enum class OnDelete { Restrict, Cascade, SetNull };

// Declarative only; ids are immutable so nothing acts on it.
enum class OnUpdate { Restrict, Cascade };

const char* ToString(OnDelete policy);

/*
  source_collection.source_field holds an id of target_collection.
*/
struct ReferenceConstraint {
  std::string source_collection;
  std::string source_field;
  std::string target_collection;
  OnDelete    on_delete = OnDelete::Restrict;
  OnUpdate    on_update = OnUpdate::Cascade;
};

// Documents of collection must carry distinct tuples of fields.
struct UniqueConstraint {
  std::string              collection;
  std::vector<std::string> fields;
};

const std::vector<ReferenceConstraint>& DefaultReferenceConstraints();
const std::vector<UniqueConstraint>&    DefaultUniqueConstraints();

} // namespace practicedb::validation
