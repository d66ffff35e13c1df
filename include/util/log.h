#ifndef CELLFORGE_UTIL_LOG_H_
#define CELLFORGE_UTIL_LOG_H_

#include <string>

namespace cellforge::util {

enum class LogLevel { kError, kWarn, kInfo, kDebug, kTrace };
enum class LogFormat { kText, kJson };

struct LogRecord {
  LogLevel level = LogLevel::kInfo;
  std::string component;
  std::string message;
  std::string formula;
  std::string function;
  std::string detail;
};

const char* LogLevelName(LogLevel level);
std::string FormatLogLine(const LogRecord& record, LogFormat format);

/// True when a record at `level` would be written under the current environment.
bool LogEnabled(LogLevel level);

/// Writes one line to stderr if the environment enables the record's level.
void Log(const LogRecord& record);

}  // namespace cellforge::util

#endif  // CELLFORGE_UTIL_LOG_H_
