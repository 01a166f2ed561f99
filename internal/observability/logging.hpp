#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace practicedb::runtime::config {
class RuntimeConfig;
}

namespace practicedb::observability {

/*
  Structured logging on spdlog.

  A line is the message followed by key=value fields. Values containing
  spaces or quotes are double-quoted. Fields pushed with LogContext are
  appended to every line logged on the same thread while the context
  is alive, so a sync pass or migration does not repeat its collection
  or version on each call.

      LogContext ctx({CollectionField("db_patients")});
      PRACTICEDB_LOG_INFO("pulled changes", {CountField("applied", n)});
      // pulled changes applied=3 collection=db_patients
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField CountField(std::string_view key, std::size_t value);
LogField BoolField(std::string_view key, bool value);

LogField CollectionField(std::string_view collection);
LogField DocumentField(std::string_view id);
LogField TransactionField(std::string_view id);
LogField ErrorField(const std::exception& error);

class LogContext {
 public:
  explicit LogContext(std::initializer_list<LogField> fields);
  ~LogContext();

  LogContext(const LogContext&)            = delete;
  LogContext& operator=(const LogContext&) = delete;

 private:
  std::size_t pushed_;
};

// Fields of every live LogContext on this thread, outermost first.
std::vector<LogField> CurrentLogContext();

void InitializeLogging(const practicedb::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

// The formatted line without level or timestamp.
std::string FormatLogLine(std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace practicedb::observability

#define PRACTICEDB_LOG_DEBUG(message, ...) ::practicedb::observability::LogDebug((message), ##__VA_ARGS__)
#define PRACTICEDB_LOG_INFO(message, ...) ::practicedb::observability::LogInfo((message), ##__VA_ARGS__)
#define PRACTICEDB_LOG_WARN(message, ...) ::practicedb::observability::LogWarn((message), ##__VA_ARGS__)
#define PRACTICEDB_LOG_ERROR(message, ...) ::practicedb::observability::LogError((message), ##__VA_ARGS__)
