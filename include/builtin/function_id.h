#ifndef CELLFORGE_BUILTIN_FUNCTION_ID_H_
#define CELLFORGE_BUILTIN_FUNCTION_ID_H_

namespace cellforge::builtin {

/// Closed set of builtin functions; each id is registered exactly once.
enum class FunctionId {
  // Logical
  kIf, kIfs, kSwitch, kIfError, kIfNa, kAnd, kOr, kNot, kXor, kTrue, kFalse, kLet, kLambda,
  // Information
  kIsNumber, kIsText, kIsNonText, kIsBlank, kIsLogical, kIsError, kIsErr, kIsNa, kIsEven, kIsOdd,
  kNa, kType, kErrorType, kN, kT, kIsRef,
  // Math
  kSum, kProduct, kAbs, kSign, kInt, kTrunc, kRound, kRoundUp, kRoundDown, kMRound, kCeiling,
  kCeilingMath, kFloor, kFloorMath, kEven, kOdd, kMod, kQuotient, kPower, kSqrt, kSqrtPi, kExp,
  kLn, kLog, kLog10, kPi, kDegrees, kRadians, kSin, kCos, kTan, kCot, kAsin, kAcos, kAtan, kAtan2,
  kSinh, kCosh, kTanh, kAsinh, kAcosh, kAtanh, kFact, kFactDouble, kCombin, kPermut, kGcd, kLcm,
  kMultinomial, kSumSq, kSumProduct, kSumX2MY2, kSumX2PY2, kSumXMY2, kRand, kRandBetween,
  kSubtotal, kAggregate,
  // Statistical
  kAverage, kAverageA, kCount, kCountA, kCountBlank, kMin, kMax, kMinA, kMaxA, kMedian, kMode,
  kModeSngl, kStdev, kStdevS, kStdevP, kVar, kVarS, kVarP, kLarge, kSmall, kRank, kRankEq,
  kRankAvg, kPercentile, kPercentileInc, kPercentileExc, kQuartile, kQuartileInc, kCorrel,
  kPearson, kCovarianceP, kCovarianceS, kRsq, kSlope, kIntercept, kForecast, kForecastLinear,
  kGeoMean, kHarMean, kDevSq, kAveDev, kFisher, kFisherInv, kStandardize, kModeMult, kStdevA,
  kStdevPA, kVarA, kVarPA, kQuartileExc, kPercentRank, kPercentRankInc, kPercentRankExc,
  kFrequency, kSteyx, kLinest, kLogest, kTrend, kGrowth,
  // Distributions
  kNormDist, kNormInv, kNormSDist, kNormSInv, kLognormDist, kLognormInv, kPoissonDist, kPoisson,
  kExponDist, kExponDistLegacy, kBinomDist, kBinomInv, kGammaDist, kGammaInv, kGammaLn, kGamma,
  kBetaDist, kBetaInv, kChisqDist, kChisqDistRt, kChisqInv, kTDist, kTDistRt, kTDist2T, kTInv,
  kTInv2T, kWeibullDist, kHypgeomDist, kErf, kErfc, kChisqInvRt, kChisqTest, kFDist, kFDistRt,
  kFInv, kFInvRt, kFTest, kTTest,
  // Criteria aggregates
  kSumIf, kSumIfs, kCountIf, kCountIfs, kAverageIf, kAverageIfs, kMaxIfs, kMinIfs,
  // Database
  kDSum, kDAverage, kDCount, kDCountA, kDMax, kDMin, kDProduct, kDGet,
  // Lookup and reference
  kXLookup, kXMatch, kVLookup, kHLookup, kLookup, kMatch, kIndex, kChoose, kRows, kColumns, kRow,
  kColumn, kAddress, kOffset, kIndirect,
  // Array
  kSequence, kRandArray, kTranspose, kSort, kSortBy, kUnique, kFilter, kTake, kDrop, kChooseRows,
  kChooseCols, kVStack, kHStack, kToRow, kToCol, kWrapRows, kWrapCols, kExpand, kMUnit,
  // Lambda helpers
  kMap, kReduce, kScan, kByRow, kByCol, kMakeArray,
  // Financial
  kNpv, kXnpv, kPv, kFv, kPmt, kIpmt, kPpmt, kNper, kRate, kIrr, kXirr, kMirr, kEffect, kNominal,
  kSln, kDb, kDdb, kCumIpmt, kCumPrinc, kSyd, kVdb, kFvSchedule, kDisc, kIntRate,
  // Date and time
  kDate, kTime, kToday, kNow, kYear, kMonth, kDay, kHour, kMinute, kSecond, kWeekday, kWeekNum,
  kEoMonth, kEDate, kDateDif, kDays, kDays360, kNetworkDays, kWorkday, kYearFrac, kDateValue,
  kTimeValue,
  // Text
  kConcatenate, kConcat, kTextJoin, kTextSplit, kTextBefore, kTextAfter, kLeft, kRight, kMid, kLen,
  kUpper, kLower, kProper, kTrim, kClean, kSubstitute, kReplace, kFind, kSearch, kExact, kRept,
  kChar, kCode, kUnichar, kUnicode, kValue, kNumberValue, kText, kFixed, kDollar,
  // Engineering
  kComplex, kImReal, kImaginary, kImAbs, kImArgument, kImConjugate, kImAdd, kImSum, kImSub,
  kImProduct, kImDiv, kImPower, kImSqrt, kImExp, kImLn, kImLog10, kImLog2, kImSin, kImCos, kImTan,
  kImSinh, kImCosh, kBin2Dec, kOct2Dec, kHex2Dec, kDec2Bin, kDec2Oct, kDec2Hex, kBin2Hex, kHex2Bin,
  kBitAnd, kBitOr, kBitXor, kBitLShift, kBitRShift, kDelta, kGeStep,

  kNumFunctionIds,
};

}  // namespace cellforge::builtin

#endif  // CELLFORGE_BUILTIN_FUNCTION_ID_H_
