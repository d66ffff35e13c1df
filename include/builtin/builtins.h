#ifndef CELLFORGE_BUILTIN_BUILTINS_H_
#define CELLFORGE_BUILTIN_BUILTINS_H_

#include "builtin/registry.h"

namespace cellforge::builtin {

/// Registers every builtin function into `registry`.
void InstallBuiltins(FunctionRegistry* registry);

void RegisterLogicalFunctions(FunctionRegistry* registry);
void RegisterInformationFunctions(FunctionRegistry* registry);
void RegisterMathFunctions(FunctionRegistry* registry);
void RegisterStatisticalFunctions(FunctionRegistry* registry);
void RegisterDistributionFunctions(FunctionRegistry* registry);
void RegisterCriteriaFunctions(FunctionRegistry* registry);
void RegisterDatabaseFunctions(FunctionRegistry* registry);
void RegisterLookupFunctions(FunctionRegistry* registry);
void RegisterArrayFunctions(FunctionRegistry* registry);
void RegisterLambdaFunctions(FunctionRegistry* registry);
void RegisterFinancialFunctions(FunctionRegistry* registry);
void RegisterDateTimeFunctions(FunctionRegistry* registry);
void RegisterTextFunctions(FunctionRegistry* registry);
void RegisterEngineeringFunctions(FunctionRegistry* registry);

}  // namespace cellforge::builtin

#endif  // CELLFORGE_BUILTIN_BUILTINS_H_
