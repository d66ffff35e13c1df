#ifndef CELLFORGE_RUNTIME_ENVIRONMENT_H_
#define CELLFORGE_RUNTIME_ENVIRONMENT_H_

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include "runtime/value.h"
#include "util/string.h"

namespace cellforge::runtime {

/// LET and lambda scope. Names are case-insensitive.
class Environment {
 public:
  explicit Environment(std::shared_ptr<Environment> parent = nullptr) : parent_(parent) {}

  /// Stores or replaces a binding in this scope.
  void Define(const std::string& name, const Value& value) {
    values_[util::ToUpper(name)] = value;
  }

  /// Looks up a name through the parent chain, returning std::nullopt if it is unbound.
  std::optional<Value> Get(const std::string& name) const {
    const std::string key = util::ToUpper(name);
    for (const Environment* scope = this; scope != nullptr; scope = scope->parent_.get()) {
      auto it = scope->values_.find(key);
      if (it != scope->values_.end()) {
        return it->second;
      }
    }
    return std::nullopt;
  }

 private:
  std::unordered_map<std::string, Value> values_;
  std::shared_ptr<Environment> parent_;
};

}  // namespace cellforge::runtime

#endif  // CELLFORGE_RUNTIME_ENVIRONMENT_H_
