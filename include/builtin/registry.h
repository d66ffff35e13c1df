#ifndef CELLFORGE_BUILTIN_REGISTRY_H_
#define CELLFORGE_BUILTIN_REGISTRY_H_

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "builtin/function_id.h"
#include "runtime/call_args.h"
#include "runtime/value.h"

namespace cellforge::builtin {

enum class Category {
  kLogical,
  kInformation,
  kMath,
  kStatistical,
  kLookup,
  kArray,
  kFinancial,
  kDateTime,
  kText,
  kEngineering,
  kDatabase,
};

const char* CategoryName(Category category);
std::optional<Category> ParseCategory(std::string_view name);

/// Eager handlers see resolved arguments; lazy handlers force only what they need.
enum class ArgMode { kEager, kLazy };

constexpr int kVariadic = -1;

enum FunctionFlags : unsigned {
  kNoFlags = 0,
  kLazy = 1u << 0,
  kVolatile = 1u << 1,
  /// Scalar function applied per element when handed arrays, like an operator.
  kElementwise = 1u << 2,
};

using Handler = runtime::Value (*)(runtime::CallArgs& args);

struct FunctionSpec {
  FunctionId id = FunctionId::kNumFunctionIds;
  std::string name;
  Category category = Category::kMath;
  int min_args = 0;
  int max_args = 0;  // kVariadic for no upper bound
  ArgMode mode = ArgMode::kEager;
  Handler handler = nullptr;
  std::string syntax;
  std::string description;
  bool is_volatile = false;
  bool elementwise = false;

  bool AcceptsArgCount(size_t count) const {
    if (static_cast<int>(count) < min_args) return false;
    return max_args == kVariadic || static_cast<int>(count) <= max_args;
  }
};

/// Table of builtins indexed by FunctionId, with a case-insensitive name index.
/// Populated once at startup and read-only afterwards.
class FunctionRegistry {
 public:
  FunctionRegistry() = default;
  FunctionRegistry(const FunctionRegistry&) = delete;
  FunctionRegistry& operator=(const FunctionRegistry&) = delete;

  /// Adds a function. Throws std::logic_error when the id or name is already taken.
  void Register(FunctionSpec spec);

  /// Shorthand for Register that builds the FunctionSpec from its parts.
  void Add(FunctionId id, const char* name, Category category, int min_args, int max_args,
           Handler handler, const char* syntax, const char* description,
           unsigned flags = kNoFlags);

  /// Case-insensitive lookup; null when the name is unknown.
  const FunctionSpec* Lookup(std::string_view name) const;

  /// Lookup by id; null when the id was never registered.
  const FunctionSpec* Get(FunctionId id) const;

  /// Sorted list of every registered name.
  std::vector<std::string> AllNames() const;
  std::vector<std::string> NamesInCategory(Category category) const;

  size_t size() const { return by_name_.size(); }

 private:
  std::array<std::optional<FunctionSpec>, static_cast<size_t>(FunctionId::kNumFunctionIds)>
      table_;
  std::unordered_map<std::string, FunctionId> by_name_;
};

/// Process-wide registry holding every builtin, populated on first use.
const FunctionRegistry& DefaultRegistry();

}  // namespace cellforge::builtin

#endif  // CELLFORGE_BUILTIN_REGISTRY_H_
