#include "test_util.h"
#include "util/log.h"
#include "util/status.h"
#include "util/string.h"

namespace test {

void RunUtilTests(TestContext* ctx) {
  std::string trimmed = util::Trim("  hello \n");
  ExpectTrue(trimmed == "hello", "trim_basic", ctx);
  ExpectTrue(util::EqualsIgnoreCase("Sum", "SUM"), "equals_ignore_case", ctx);
  ExpectTrue(!util::EqualsIgnoreCase("SUM", "SUMIF"), "equals_ignore_case_length", ctx);
  auto [head, rest] = util::SplitHead("  set A1   =1+2 ");
  ExpectTrue(head == "set" && rest == "A1   =1+2", "split_head", ctx);
  ExpectTrue(util::ToUpper("norm.dist") == "NORM.DIST", "to_upper", ctx);

  util::Status ok = util::Status::OK();
  util::Status bad = util::Status::Invalid("nope");
  ExpectTrue(ok.ok() && !bad.ok(), "status_ok_flag", ctx);
  ExpectTrue(bad.code == util::StatusCode::kInvalidArgument, "status_code", ctx);
  util::StatusOr<int> value(42);
  util::StatusOr<int> missing(util::Status::NotFound("gone"));
  ExpectTrue(value.ok() && value.value() == 42, "status_or_value", ctx);
  ExpectTrue(!missing.ok() && missing.status().message == "gone", "status_or_error", ctx);

  util::Error err("Unexpected token ')'", 1, 6);
  ExpectTrue(err.formatted() == "Error at 1:6 - Unexpected token ')'", "error_formatted", ctx);
  ExpectTrue(err.formatted("=1+2)").find("\n       ^") != std::string::npos, "error_caret", ctx);

  util::LogRecord record{util::LogLevel::kWarn, "parser", "formula \"rejected\"", "=1+", "", ""};
  const std::string text = util::FormatLogLine(record, util::LogFormat::kText);
  ExpectTrue(text ==
                 "level=warn component=parser formula=\"=1+\" message=\"formula \\\"rejected\\\"\"",
             "log_text_format", ctx);
  const std::string json = util::FormatLogLine(record, util::LogFormat::kJson);
  ExpectTrue(json.front() == '{' && json.find("\"level\":\"warn\"") != std::string::npos &&
                 json.find("\"formula\":\"=1+\"") != std::string::npos,
             "log_json_format", ctx);

  {
    ScopedEnvVar level("CELLFORGE_LOG_LEVEL", "debug");
    ExpectTrue(util::LogEnabled(util::LogLevel::kDebug), "log_level_debug_enabled", ctx);
    ExpectTrue(!util::LogEnabled(util::LogLevel::kTrace), "log_level_trace_disabled", ctx);
  }
  {
    ScopedEnvVar level("CELLFORGE_LOG_LEVEL", "error");
    ExpectTrue(!util::LogEnabled(util::LogLevel::kWarn), "log_level_error_only", ctx);
  }
}

}  // namespace test
