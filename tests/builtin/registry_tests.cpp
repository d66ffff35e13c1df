#include <algorithm>
#include <stdexcept>

#include "builtin/registry.h"
#include "runtime/call_args.h"
#include "test_util.h"

namespace test {

namespace {

rt::Value Zero(rt::CallArgs& /*args*/) { return rt::Value::Number(0); }

bool Contains(const std::vector<std::string>& names, const std::string& name) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

void TestDefaultRegistry(TestContext* ctx) {
  const bt::FunctionRegistry& registry = bt::DefaultRegistry();
  ExpectTrue(registry.size() == static_cast<size_t>(bt::FunctionId::kNumFunctionIds),
             "every_id_registered", ctx);

  const bt::FunctionSpec* sum = registry.Lookup("sum");
  ExpectTrue(sum != nullptr && sum->name == "SUM" && sum->id == bt::FunctionId::kSum,
             "lookup_ignores_case", ctx);
  ExpectTrue(registry.Get(bt::FunctionId::kSum) == sum, "get_by_id", ctx);
  ExpectTrue(registry.Lookup("NOSUCHFUNC") == nullptr, "unknown_name", ctx);

  const bt::FunctionSpec* if_spec = registry.Lookup("IF");
  ExpectTrue(if_spec != nullptr && if_spec->mode == bt::ArgMode::kLazy, "if_is_lazy", ctx);
  const bt::FunctionSpec* rand = registry.Lookup("RAND");
  ExpectTrue(rand != nullptr && rand->is_volatile, "rand_is_volatile", ctx);
  const bt::FunctionSpec* upper = registry.Lookup("UPPER");
  ExpectTrue(upper != nullptr && upper->elementwise && !upper->is_volatile,
             "upper_is_elementwise", ctx);
  ExpectTrue(sum != nullptr && sum->mode == bt::ArgMode::kEager && !sum->syntax.empty() &&
                 !sum->description.empty(),
             "sum_metadata", ctx);

  ExpectTrue(if_spec != nullptr && !if_spec->AcceptsArgCount(1) && if_spec->AcceptsArgCount(2) &&
                 if_spec->AcceptsArgCount(3) && !if_spec->AcceptsArgCount(4),
             "if_arity", ctx);
  ExpectTrue(sum != nullptr && sum->AcceptsArgCount(200), "sum_variadic", ctx);
  ExpectError("=IF(TRUE)", rt::ErrorKind::kValue, ctx);
  ExpectError("=UPPER(\"a\", \"b\")", rt::ErrorKind::kValue, ctx);
}

void TestCategories(TestContext* ctx) {
  const bt::FunctionRegistry& registry = bt::DefaultRegistry();
  const auto financial = registry.NamesInCategory(bt::Category::kFinancial);
  ExpectTrue(Contains(financial, "XNPV") && !Contains(financial, "SUM"), "financial_names", ctx);
  const auto database = registry.NamesInCategory(bt::Category::kDatabase);
  ExpectTrue(Contains(database, "DSUM"), "database_names", ctx);

  const auto all = registry.AllNames();
  ExpectTrue(all.size() == registry.size() && std::is_sorted(all.begin(), all.end()),
             "all_names_sorted", ctx);

  ExpectTrue(std::string(bt::CategoryName(bt::Category::kDateTime)) == "datetime",
             "category_name", ctx);
  auto parsed = bt::ParseCategory("Engineering");
  ExpectTrue(parsed.has_value() && *parsed == bt::Category::kEngineering, "parse_category", ctx);
  ExpectTrue(!bt::ParseCategory("physics").has_value(), "parse_unknown_category", ctx);
}

void TestRegistration(TestContext* ctx) {
  bt::FunctionRegistry registry;
  registry.Add(bt::FunctionId::kSum, "Sum", bt::Category::kMath, 1, bt::kVariadic, Zero,
               "SUM(number1, ...)", "Adds.");
  ExpectTrue(registry.size() == 1 && registry.Lookup("SUM") != nullptr &&
                 registry.Lookup("SUM")->name == "SUM",
             "registered_name_upper_cased", ctx);

  bool duplicate_name = false;
  try {
    registry.Add(bt::FunctionId::kProduct, "sum", bt::Category::kMath, 1, 1, Zero, "", "");
  } catch (const std::logic_error&) {
    duplicate_name = true;
  }
  ExpectTrue(duplicate_name, "duplicate_name_rejected", ctx);

  bool duplicate_id = false;
  try {
    registry.Add(bt::FunctionId::kSum, "TOTAL", bt::Category::kMath, 1, 1, Zero, "", "");
  } catch (const std::logic_error&) {
    duplicate_id = true;
  }
  ExpectTrue(duplicate_id, "duplicate_id_rejected", ctx);

  bool missing_handler = false;
  try {
    registry.Add(bt::FunctionId::kAbs, "ABS", bt::Category::kMath, 1, 1, nullptr, "", "");
  } catch (const std::logic_error&) {
    missing_handler = true;
  }
  ExpectTrue(missing_handler && registry.size() == 1, "missing_handler_rejected", ctx);
}

}  // namespace

void RunRegistryTests(TestContext* ctx) {
  TestDefaultRegistry(ctx);
  TestCategories(ctx);
  TestRegistration(ctx);
}

}  // namespace test
