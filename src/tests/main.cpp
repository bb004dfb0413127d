/*
* (C) 2015 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#include "../cli/argparse.h"
#include "runner/test_runner.h"
#include "tests.h"
#include <iostream>
#include <string>
#include <vector>

#include <ordo/build.h>
#include <ordo/version.h>

namespace {

const char* const ARG_SPEC =
   "ordo_tests --verbose --help --list-tests --data-dir=src/tests/data --log-success --abort-on-first-fail "
   "--no-stdout --skip-tests= --test-runs=1 *suites";

void print_names(std::ostream& out, const std::string& title, const std::set<std::string>& names) {
   out << title << "\n" << std::string(title.size(), '-') << "\n";

   size_t line_len = 0;
   for(const auto& name : names) {
      if(line_len > 0 && line_len + name.size() > 72) {
         out << "\n";
         line_len = 0;
      }
      out << name << " ";
      line_len += name.size() + 1;
   }
   out << "\n\n";
}

}  // namespace

int main(int argc, char* argv[]) {
   std::cerr << Ordo::runtime_version_check(ORDO_VERSION_MAJOR, ORDO_VERSION_MINOR, ORDO_VERSION_PATCH);

   try {
      Ordo_CLI::Argument_Parser parser(ARG_SPEC);

      parser.parse_args(std::vector<std::string>(argv + 1, argv + argc));

      if(parser.flag_set("help")) {
         std::cout << "Usage: " << ARG_SPEC << "\n\n";
         print_names(std::cout, "Available test suites", Ordo_Tests::Test::registered_tests());
         print_names(std::cout, "Available test categories", Ordo_Tests::Test::registered_test_categories());
         return 0;
      }

      if(parser.flag_set("list-tests")) {
         for(const auto& test_name : Ordo_Tests::Test::registered_tests()) {
            std::cout << test_name << "\n";
         }
         return 0;
      }

      Ordo_Tests::Test_Options opts;
      opts.requested_tests = parser.get_arg_list("suites");
      for(const auto& skip : parser.get_arg_list("skip-tests")) {
         opts.skip_tests.insert(skip);
      }
      opts.data_dir = parser.get_arg_or("data-dir", "src/tests/data");
      opts.test_runs = parser.get_arg_sz("test-runs");
      opts.verbose = parser.flag_set("verbose");
      opts.log_success = parser.flag_set("log-success");
      opts.abort_on_first_fail = parser.flag_set("abort-on-first-fail");
      opts.no_stdout = parser.flag_set("no-stdout");

      Ordo_Tests::Test_Runner tests(std::cout);

      return tests.run(opts) ? 0 : 1;
   } catch(Ordo_CLI::CLI_Usage_Error& e) {
      std::cerr << "Usage error: " << e.what() << "\nUsage: " << ARG_SPEC << std::endl;
   } catch(std::exception& e) {
      std::cerr << "Exiting with error: " << e.what() << std::endl;
   }
   return 2;
}
