#include "builtin/registry.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include "builtin/builtins.h"
#include "util/log.h"
#include "util/string.h"

namespace cellforge::builtin {

namespace {

constexpr Category kAllCategories[] = {
    Category::kLogical,   Category::kInformation, Category::kMath,        Category::kStatistical,
    Category::kLookup,    Category::kArray,       Category::kFinancial,   Category::kDateTime,
    Category::kText,      Category::kEngineering, Category::kDatabase,
};

}  // namespace

const char* CategoryName(Category category) {
  switch (category) {
    case Category::kLogical:
      return "logical";
    case Category::kInformation:
      return "information";
    case Category::kMath:
      return "math";
    case Category::kStatistical:
      return "statistical";
    case Category::kLookup:
      return "lookup";
    case Category::kArray:
      return "array";
    case Category::kFinancial:
      return "financial";
    case Category::kDateTime:
      return "datetime";
    case Category::kText:
      return "text";
    case Category::kEngineering:
      return "engineering";
    case Category::kDatabase:
      return "database";
  }
  return "math";
}

std::optional<Category> ParseCategory(std::string_view name) {
  for (Category category : kAllCategories) {
    if (util::EqualsIgnoreCase(name, CategoryName(category))) {
      return category;
    }
  }
  return std::nullopt;
}

void FunctionRegistry::Register(FunctionSpec spec) {
  const size_t index = static_cast<size_t>(spec.id);
  const std::string key = util::ToUpper(spec.name);
  if (index >= table_.size() || spec.handler == nullptr) {
    throw std::logic_error("invalid registration for function " + key);
  }
  if (table_[index].has_value() || by_name_.count(key) > 0) {
    util::Log({util::LogLevel::kError, "registry", "duplicate function registration", "", key,
               ""});
    throw std::logic_error("function already registered: " + key);
  }
  spec.name = key;
  by_name_.emplace(key, spec.id);
  table_[index] = std::move(spec);
}

void FunctionRegistry::Add(FunctionId id, const char* name, Category category, int min_args,
                           int max_args, Handler handler, const char* syntax,
                           const char* description, unsigned flags) {
  FunctionSpec spec;
  spec.id = id;
  spec.name = name;
  spec.category = category;
  spec.min_args = min_args;
  spec.max_args = max_args;
  spec.mode = (flags & kLazy) ? ArgMode::kLazy : ArgMode::kEager;
  spec.handler = handler;
  spec.syntax = syntax;
  spec.description = description;
  spec.is_volatile = (flags & kVolatile) != 0;
  spec.elementwise = (flags & kElementwise) != 0;
  Register(std::move(spec));
}

const FunctionSpec* FunctionRegistry::Lookup(std::string_view name) const {
  auto it = by_name_.find(util::ToUpper(name));
  if (it == by_name_.end()) {
    return nullptr;
  }
  return Get(it->second);
}

const FunctionSpec* FunctionRegistry::Get(FunctionId id) const {
  const size_t index = static_cast<size_t>(id);
  if (index >= table_.size() || !table_[index].has_value()) {
    return nullptr;
  }
  return &*table_[index];
}

std::vector<std::string> FunctionRegistry::AllNames() const {
  std::vector<std::string> names;
  names.reserve(by_name_.size());
  for (const auto& entry : by_name_) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

std::vector<std::string> FunctionRegistry::NamesInCategory(Category category) const {
  std::vector<std::string> names;
  for (const auto& entry : table_) {
    if (entry.has_value() && entry->category == category) {
      names.push_back(entry->name);
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

const FunctionRegistry& DefaultRegistry() {
  static FunctionRegistry registry;
  static const bool installed = [] {
    InstallBuiltins(&registry);
    util::Log({util::LogLevel::kInfo, "registry", "builtins installed", "", "",
               "count=" + std::to_string(registry.size())});
    return true;
  }();
  (void)installed;
  return registry;
}

}  // namespace cellforge::builtin
