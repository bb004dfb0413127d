/*
* (C) 2017 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_TEST_RUNNER_H_
#define ORDO_TEST_RUNNER_H_

#include <iosfwd>
#include <set>
#include <string>
#include <vector>

namespace Ordo_Tests {

struct Test_Options;

/*
* Runs the selected tests, printing each result and a summary per run
* to the output stream (unless no_stdout is set)
*/
class Test_Runner final {
   public:
      explicit Test_Runner(std::ostream& out) : m_output(out) {}

      /// @return true iff all tests have passed
      bool run(const Test_Options& options);

   private:
      /// @return true iff all tests passed
      bool run_tests(const std::vector<std::string>& tests_to_run, size_t run, size_t total_runs);

      void report(const std::string& text);

      std::ostream& m_output;
      bool m_quiet = false;
};

}  // namespace Ordo_Tests

#endif
