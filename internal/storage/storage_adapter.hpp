#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/document/value.hpp"

namespace practicedb::storage {

/*
  Key/value persistence abstraction.

  Every value is a google.protobuf.Value (document arrays, index maps,
  metadata, sync log). Operations are atomic per key only; the engine
  never assumes multi-key atomicity.

  Implementations:
    MEMORY → process-local map, lost on exit
    SQLITE → single kv table, survives restarts
*/
class StorageAdapter {
 public:
  virtual ~StorageAdapter() = default;

  // ------------------------------------------------------------------
  // Get
  // ------------------------------------------------------------------
  /*
    Absent keys and unreadable values both yield nullopt.
  */
  virtual std::optional<document::Value> Get(const std::string& key) = 0;

  // ------------------------------------------------------------------
  // Set
  // ------------------------------------------------------------------
  /*
    Replace the value stored under key. Throws std::runtime_error when
    the backend cannot persist it.
  */
  virtual void Set(const std::string& key, const document::Value& value) = 0;

  virtual void Delete(const std::string& key) = 0;

  // Keys (without any backend namespace) starting with prefix.
  virtual std::vector<std::string> Keys(const std::string& prefix = "") = 0;

  // Remove every key starting with prefix; empty prefix wipes the store.
  virtual void Clear(const std::string& prefix = "") = 0;
};

using StorageAdapterPtr = std::shared_ptr<StorageAdapter>;

} // namespace practicedb::storage
