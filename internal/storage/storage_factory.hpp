#pragma once

#include "config/config.pb.h"
#include "storage_adapter.hpp"

namespace practicedb::storage {

/*
  Builds the storage adapter selected by configuration.

      auto storage = StorageFactory::Build(config.storage());
      engine = std::make_shared<DatabaseEngine>(storage, config.engine());

  An empty StorageConfig selects the memory adapter. With encryption set
  the backend is wrapped in an EncryptedStorageAdapter.
*/
class StorageFactory {
 public:
  static StorageAdapterPtr Build(const practicedb::runtime::config::StorageConfig& cfg);
};

} // namespace practicedb::storage
