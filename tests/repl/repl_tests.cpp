#include <istream>
#include <ostream>
#include <sstream>

#include "repl/repl.h"
#include "test_util.h"

namespace test {

namespace {

class StreamRedirect {
 public:
  StreamRedirect(std::istream& in, std::ostream& out, std::istream& new_in, std::ostream& new_out)
      : orig_in_buf_(in.rdbuf()), orig_out_buf_(out.rdbuf()) {
    in.rdbuf(new_in.rdbuf());
    out.rdbuf(new_out.rdbuf());
  }

  ~StreamRedirect() = default;

  void Restore(std::istream& in, std::ostream& out) {
    in.rdbuf(orig_in_buf_);
    out.rdbuf(orig_out_buf_);
  }

 private:
  std::streambuf* orig_in_buf_;
  std::streambuf* orig_out_buf_;
};

// Feeds `script` to a fresh session and returns everything it printed.
std::string RunSession(const std::string& script, int* errors = nullptr) {
  std::istringstream input(script);
  std::ostringstream output;
  StreamRedirect redirect(std::cin, std::cout, input, output);
  cellforge::repl::Repl repl;
  repl.Run();
  redirect.Restore(std::cin, std::cout);
  if (errors != nullptr) {
    *errors = repl.error_count();
  }
  return output.str();
}

bool HasLine(const std::string& out, const std::string& line) {
  return out.find(line + "\n") != std::string::npos;
}

}  // namespace

void RunReplTests(TestContext* ctx) {
  int errors = 0;
  std::string out = RunSession("=1 + 1\nexit\n", &errors);
  ExpectTrue(HasLine(out, "2") && errors == 0, "repl_evaluates_formula", ctx);

  out = RunSession("set A1 5\nset A2 =A1*2\n=SUM(A1:A2)\nexit\n");
  ExpectTrue(HasLine(out, "A1 = 5") && HasLine(out, "A2 = 10") && HasLine(out, "15"),
             "repl_sets_cells", ctx);

  out = RunSession("set B1 \"hi\"\nset B2 true\n=B1 & B2\n");
  ExpectTrue(HasLine(out, "hiTRUE"), "repl_literals_and_eof", ctx);

  out = RunSession("set 1A 3\nexit\n");
  ExpectTrue(out.find("invalid cell address") != std::string::npos, "repl_rejects_address", ctx);

  out = RunSession("=1/0\n=NA()\n# comment line\n\nexit\n", &errors);
  ExpectTrue(HasLine(out, "#DIV/0!") && HasLine(out, "#N/A") && errors == 2,
             "repl_counts_errors", ctx);

  out = RunSession("define double =LAMBDA(x, x*2)\n=DOUBLE(21)\nexit\n");
  ExpectTrue(HasLine(out, "defined DOUBLE") && HasLine(out, "42"), "repl_defines_lambda", ctx);
  out = RunSession("define A1 =LAMBDA(x, x)\ndefine twice =1+1\nexit\n");
  ExpectTrue(out.find("invalid lambda name") != std::string::npos &&
                 out.find("must be a LAMBDA") != std::string::npos,
             "repl_rejects_bad_define", ctx);

  out = RunSession("help xnpv\nhelp nothing\nexit\n");
  ExpectTrue(out.find("XNPV [financial]") != std::string::npos &&
                 out.find("unknown function 'nothing'") != std::string::npos,
             "repl_help", ctx);

  out = RunSession("help rand\nexit\n");
  ExpectTrue(HasLine(out, "  volatile"), "repl_help_volatile", ctx);

  out = RunSession("names database\nnames colours\nexit\n");
  ExpectTrue(out.find("DSUM") != std::string::npos && out.find("XNPV") == std::string::npos &&
                 out.find("unknown category") != std::string::npos,
             "repl_names", ctx);

  out = RunSession("frobnicate\nexit\n");
  ExpectTrue(out.find("Unknown command 'frobnicate'") != std::string::npos,
             "repl_unknown_command", ctx);

  std::ostringstream direct;
  StreamRedirect redirect(std::cin, std::cout, std::cin, direct);
  cellforge::repl::Repl repl;
  bool stop_on_exit = repl.ProcessLine("  exit  ");
  bool stop_on_formula = repl.ProcessLine("=3*4");
  redirect.Restore(std::cin, std::cout);
  ExpectTrue(stop_on_exit && !stop_on_formula && HasLine(direct.str(), "12"),
             "repl_process_line", ctx);
}

}  // namespace test
