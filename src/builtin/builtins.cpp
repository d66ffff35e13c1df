#include "builtin/builtins.h"

namespace cellforge::builtin {

void InstallBuiltins(FunctionRegistry* registry) {
  if (!registry) {
    return;
  }
  RegisterLogicalFunctions(registry);
  RegisterInformationFunctions(registry);
  RegisterMathFunctions(registry);
  RegisterStatisticalFunctions(registry);
  RegisterDistributionFunctions(registry);
  RegisterCriteriaFunctions(registry);
  RegisterDatabaseFunctions(registry);
  RegisterLookupFunctions(registry);
  RegisterArrayFunctions(registry);
  RegisterLambdaFunctions(registry);
  RegisterFinancialFunctions(registry);
  RegisterDateTimeFunctions(registry);
  RegisterTextFunctions(registry);
  RegisterEngineeringFunctions(registry);
}

}  // namespace cellforge::builtin
