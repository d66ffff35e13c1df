#include "runtime/options.h"

#include <cerrno>
#include <cstdlib>
#include <string>

#include "util/log.h"

namespace cellforge::runtime {

namespace {

const char* GetEnv(const char* suffix) {
  const std::string name = std::string("CELLFORGE") + suffix;
  const char* value = std::getenv(name.c_str());
  if (value && value[0] != '\0') return value;
  return nullptr;
}

std::optional<uint64_t> ParseUnsigned(const char* name, const char* value) {
  if (!value) return std::nullopt;
  errno = 0;
  char* end = nullptr;
  unsigned long long parsed = std::strtoull(value, &end, 10);
  if (errno != 0 || end == value || *end != '\0' || value[0] == '-') {
    util::Log({util::LogLevel::kWarn, "config", "ignoring malformed setting", "", "",
               std::string(name) + "=" + value});
    return std::nullopt;
  }
  return static_cast<uint64_t>(parsed);
}

}  // namespace

EngineOptions LoadEngineOptions() {
  EngineOptions options;
  if (auto depth = ParseUnsigned("CELLFORGE_MAX_LAMBDA_DEPTH", GetEnv("_MAX_LAMBDA_DEPTH"))) {
    if (*depth > 0 && *depth <= 100000) {
      options.max_lambda_depth = static_cast<int>(*depth);
    }
  }
  if (auto cells = ParseUnsigned("CELLFORGE_MAX_ARRAY_CELLS", GetEnv("_MAX_ARRAY_CELLS"))) {
    if (*cells > 0) {
      options.max_array_cells = static_cast<int64_t>(*cells);
    }
  }
  options.random_seed = ParseUnsigned("CELLFORGE_RANDOM_SEED", GetEnv("_RANDOM_SEED"));
  return options;
}

}  // namespace cellforge::runtime
