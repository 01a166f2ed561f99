#include "encrypted_storage_adapter.hpp"

#include <stdexcept>
#include <string_view>

#include "cipher.hpp"
#include "internal/observability/logging.hpp"

namespace practicedb::storage {

namespace {
constexpr std::string_view kEnvelope = "enc:v1:";
}

EncryptedStorageAdapter::EncryptedStorageAdapter(StorageAdapterPtr inner, KeyManager keys, std::vector<std::string> sensitive)
    : inner_(std::move(inner)), keys_(std::move(keys)), sensitive_(std::move(sensitive)) {
  if (!inner_) throw std::invalid_argument("EncryptedStorageAdapter requires an inner adapter");
}

bool EncryptedStorageAdapter::IsSensitive(const std::string& key) const {
  for (const auto& name : sensitive_) {
    if (!name.empty() && key.find(name) != std::string::npos) return true;
  }
  return false;
}

std::optional<document::Value> EncryptedStorageAdapter::Get(const std::string& key) {
  auto stored = inner_->Get(key);
  if (!stored || !IsSensitive(key)) return stored;

  if (!stored->has_string_value() || stored->string_value().compare(0, kEnvelope.size(), kEnvelope) != 0) {
    return stored;
  }

  try {
    const auto sealed    = crypto::Base64Decode(stored->string_value().substr(kEnvelope.size()));
    const auto plaintext = crypto::Open(keys_.Key(), sealed);

    document::Value value;
    document::FromJson(plaintext, &value);
    return value;
  } catch (const std::exception& e) {
    PRACTICEDB_LOG_WARN("cannot decrypt stored value", {observability::StringField("key", key), observability::ErrorField(e)});
    return std::nullopt;
  }
}

void EncryptedStorageAdapter::Set(const std::string& key, const document::Value& value) {
  if (!IsSensitive(key)) {
    inner_->Set(key, value);
    return;
  }

  const auto sealed = crypto::Seal(keys_.Key(), document::ToJson(value));
  inner_->Set(key, document::StringValue(std::string(kEnvelope) + crypto::Base64Encode(sealed)));
}

void EncryptedStorageAdapter::Delete(const std::string& key) {
  inner_->Delete(key);
}

std::vector<std::string> EncryptedStorageAdapter::Keys(const std::string& prefix) {
  return inner_->Keys(prefix);
}

void EncryptedStorageAdapter::Clear(const std::string& prefix) {
  inner_->Clear(prefix);
}

} // namespace practicedb::storage
