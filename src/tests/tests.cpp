/*
* (C) 2014,2015 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#include "tests.h"

#include <ordo/hex.h>
#include <ordo/internal/fmt.h>
#include <ordo/internal/parsing.h>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iomanip>

namespace Ordo_Tests {

Test::Result::Result(std::string who, const std::vector<Result>& downstream_results) : Result(std::move(who)) {
   for(const auto& result : downstream_results) {
      merge(result);
   }
}

void Test::Result::merge(const Result& other) {
   // A location only makes sense if all merged results share a name
   if(who() == other.who()) {
      m_where = other.m_where;
   } else {
      m_where.reset();
   }

   m_elapsed += other.m_elapsed;
   m_tests_passed += other.m_tests_passed;
   m_fail_log.insert(m_fail_log.end(), other.m_fail_log.begin(), other.m_fail_log.end());
   m_log.insert(m_log.end(), other.m_log.begin(), other.m_log.end());
}

void Test::Result::test_note(const std::string& note) {
   if(!note.empty()) {
      m_log.push_back(who() + " " + note);
   }
}

bool Test::Result::test_success(const std::string& note) {
   if(Test::options().log_success) {
      test_note(note);
   }
   ++m_tests_passed;
   return true;
}

bool Test::Result::test_failure(const std::string& err) {
   m_fail_log.push_back(err);

   if(Test::options().abort_on_first_fail) {
      std::abort();
   }
   return false;
}

bool Test::Result::test_failure(const std::string& what, const std::string& error) {
   return test_failure(Ordo::fmt("{} {} with error {}", who(), what, error));
}

bool Test::Result::check_throw(const std::string& what,
                               const std::function<void()>& fn,
                               const std::type_info* expected_type,
                               const std::string* expected_msg) {
   try {
      fn();
   } catch(const std::exception& ex) {
      if(expected_type != nullptr && *expected_type != typeid(ex)) {
         return test_failure(Ordo::fmt("{} threw unexpected exception: {}", what, ex.what()));
      }
      if(expected_msg != nullptr && *expected_msg != ex.what()) {
         return test_failure(
            Ordo::fmt("{} threw exception with unexpected message (expected: '{}', got: '{}')", what, *expected_msg, ex.what()));
      }
      return test_success(what + " threw as expected");
   }

   return test_failure(what + " failed to throw expected exception");
}

bool Test::Result::test_throws(const std::string& what, const std::function<void()>& fn) {
   return check_throw(what, fn, nullptr, nullptr);
}

bool Test::Result::test_no_throw(const std::string& what, const std::function<void()>& fn) {
   try {
      fn();
   } catch(const std::exception& ex) {
      return test_failure(Ordo::fmt("{} threw unexpected exception: {}", what, ex.what()));
   }
   return test_success(what + " did not throw");
}

bool Test::Result::test_eq(const std::string& what, const std::string& produced, const std::string& expected) {
   if(produced == expected) {
      return test_success(Ordo::fmt("{} {} produced expected result", who(), what));
   }
   return test_failure(
      Ordo::fmt("{} {} produced unexpected result '{}' expected '{}'", who(), what, produced, expected));
}

bool Test::Result::test_eq(const std::string& what, const char* produced, const char* expected) {
   return test_eq(what, std::string(produced), std::string(expected));
}

bool Test::Result::test_eq(const std::string& what, bool produced, bool expected) {
   return test_eq(what, std::string(produced ? "true" : "false"), std::string(expected ? "true" : "false"));
}

bool Test::Result::test_eq(const std::string& what,
                           std::span<const uint8_t> produced,
                           std::span<const uint8_t> expected) {
   if(std::equal(produced.begin(), produced.end(), expected.begin(), expected.end())) {
      return test_success();
   }

   std::ostringstream err;
   err << who() << " unexpected result for " << what;

   if(produced.size() != expected.size()) {
      err << " produced " << produced.size() << " bytes expected " << expected.size();
   }

   const auto mismatch = std::mismatch(produced.begin(), produced.end(), expected.begin(), expected.end());
   err << "\nProduced: " << Ordo::hex_encode(produced) << "\nExpected: " << Ordo::hex_encode(expected)
       << "\nFirst difference at offset " << (mismatch.first - produced.begin());

   return test_failure(err.str());
}

bool Test::Result::test_eq(const std::string& what, std::span<const uint8_t> produced, const char* expected_hex) {
   const std::vector<uint8_t> expected = Ordo::hex_decode(expected_hex);
   return test_eq(what, produced, std::span<const uint8_t>(expected));
}

std::string Test::Result::result_string() const {
   const bool verbose = Test::options().verbose;

   if(tests_run() == 0 && !verbose) {
      return "";
   }

   std::ostringstream report;

   report << who() << " ran ";

   if(tests_run() == 0) {
      report << "ZERO";
   } else {
      report << tests_run();
   }
   report << " tests";

   if(auto elapsed = elapsed_time()) {
      report << " in " << format_time(*elapsed);
   }

   if(tests_failed()) {
      report << " " << tests_failed() << " FAILED";
   } else {
      report << " all ok";
   }

   report << "\n";

   for(size_t i = 0; i != m_fail_log.size(); ++i) {
      report << "Failure " << (i + 1) << ": " << m_fail_log[i];
      if(m_where) {
         report << " (at " << m_where->path << ":" << m_where->line << ")";
      }
      report << "\n";
   }

   if(!m_fail_log.empty() || tests_run() == 0 || verbose) {
      for(size_t i = 0; i != m_log.size(); ++i) {
         report << "Note " << (i + 1) << ": " << m_log[i] << "\n";
      }
   }

   return report.str();
}

void Test::initialize(std::string test_name, CodeLocation location) {
   m_test_name = std::move(test_name);
   m_registration_location = std::move(location);
}

//static
std::string Test::format_time(std::chrono::nanoseconds elapsed) {
   const double ns = static_cast<double>(elapsed.count());

   std::ostringstream o;
   o << std::setprecision(2) << std::fixed;

   if(ns > 1e9) {
      o << ns / 1e9 << " sec";
   } else {
      o << ns / 1e6 << " msec";
   }

   return o.str();
}

std::vector<Test::Result> FnTest::run() {
   std::vector<Test::Result> results;

   for(const auto& fn : m_fns) {
      if(const auto* single = std::get_if<test_fn>(&fn)) {
         results.push_back((*single)());
      } else {
         const auto many = std::get<test_fn_vec>(fn)();
         results.insert(results.end(), many.begin(), many.end());
      }
   }

   return results;
}

namespace {

class Test_Registry {
   public:
      static Test_Registry& instance() {
         static Test_Registry registry;
         return registry;
      }

      void register_test(const std::string& category,
                         const std::string& name,
                         bool smoke_test,
                         std::function<std::unique_ptr<Test>()> maker_fn) {
         if(m_tests.contains(name)) {
            throw Test_Error("Duplicate registration of test '" + name + "'");
         }

         if(m_tests.contains(category) || m_categories.contains(name)) {
            throw Test_Error(Ordo::fmt("Test '{}' and category '{}' clash with existing names", name, category));
         }

         if(smoke_test) {
            m_smoke_tests.push_back(name);
         }

         m_tests.emplace(name, std::move(maker_fn));
         m_categories.emplace(category, name);
      }

      std::unique_ptr<Test> get_test(const std::string& test_name) const {
         auto i = m_tests.find(test_name);
         if(i != m_tests.end()) {
            return i->second();
         }
         return nullptr;
      }

      std::set<std::string> registered_tests() const {
         std::set<std::string> s;
         for(const auto& [name, _] : m_tests) {
            s.insert(name);
         }
         return s;
      }

      std::set<std::string> registered_test_categories() const {
         std::set<std::string> s;
         for(const auto& [category, _] : m_categories) {
            s.insert(category);
         }
         return s;
      }

      /*
      * With no request, every test is run: smoke tests first, then the
      * rest in alphabetical order. A request names tests or categories.
      */
      std::vector<std::string> filter_registered_tests(const std::vector<std::string>& requested,
                                                       const std::set<std::string>& to_be_skipped) const {
         std::vector<std::string> result;

         auto add = [&](const std::string& test_name) {
            if(!to_be_skipped.contains(test_name) &&
               std::find(result.begin(), result.end(), test_name) == result.end()) {
               result.push_back(test_name);
            }
         };

         if(requested.empty()) {
            for(const auto& test_name : m_smoke_tests) {
               add(test_name);
            }
            for(const auto& [test_name, _] : m_tests) {
               add(test_name);
            }
            return result;
         }

         for(const auto& r : requested) {
            if(m_tests.contains(r)) {
               add(r);
               continue;
            }

            auto [first, last] = m_categories.equal_range(r);
            if(first == last) {
               throw Test_Error("Unknown test suite or category: " + r);
            }
            for(; first != last; ++first) {
               add(first->second);
            }
         }

         return result;
      }

   private:
      Test_Registry() = default;

      std::map<std::string, std::function<std::unique_ptr<Test>()>> m_tests;
      std::multimap<std::string, std::string> m_categories;
      std::vector<std::string> m_smoke_tests;
};

}  // namespace

//static
void Test::register_test(const std::string& category,
                         const std::string& name,
                         bool smoke_test,
                         std::function<std::unique_ptr<Test>()> maker_fn) {
   Test_Registry::instance().register_test(category, name, smoke_test, std::move(maker_fn));
}

std::set<std::string> Test::registered_tests() {
   return Test_Registry::instance().registered_tests();
}

std::set<std::string> Test::registered_test_categories() {
   return Test_Registry::instance().registered_test_categories();
}

std::unique_ptr<Test> Test::get_test(const std::string& test_name) {
   return Test_Registry::instance().get_test(test_name);
}

std::vector<std::string> Test::filter_registered_tests(const std::vector<std::string>& requested,
                                                       const std::set<std::string>& to_be_skipped) {
   return Test_Registry::instance().filter_registered_tests(requested, to_be_skipped);
}

// NOLINTNEXTLINE(*-avoid-non-const-global-variables)
Test_Options Test::m_opts;

//static
void Test::set_test_options(const Test_Options& opts) {
   m_opts = opts;
}

//static
std::string Test::data_file(const std::string& file) {
   return options().data_dir + "/" + file;
}

std::string VarMap::get_req_str(const std::string& key) const {
   auto i = m_vars.find(key);
   if(i == m_vars.end()) {
      throw Test_Error("Test missing variable " + key);
   }
   return i->second;
}

std::string VarMap::get_opt_str(const std::string& key, const std::string& def_value) const {
   auto i = m_vars.find(key);
   if(i == m_vars.end()) {
      return def_value;
   }
   return i->second;
}

std::vector<uint8_t> VarMap::get_req_bin(const std::string& key) const {
   const std::string hex = get_req_str(key);

   try {
      return Ordo::hex_decode(hex);
   } catch(Ordo::Invalid_Argument& e) {
      throw Test_Error(Ordo::fmt("Bad hex '{}' for key {}: {}", hex, key, e.what()));
   }
}

bool VarMap::get_req_bool(const std::string& key) const {
   const std::string val = get_req_str(key);

   if(val == "true") {
      return true;
   } else if(val == "false") {
      return false;
   }
   throw Test_Error(Ordo::fmt("Invalid boolean '{}' for key {}", val, key));
}

size_t VarMap::get_req_sz(const std::string& key) const {
   const std::string val = get_req_str(key);

   try {
      return Ordo::to_u32bit(val);
   } catch(Ordo::Invalid_Argument&) {
      throw Test_Error(Ordo::fmt("Invalid size '{}' for key {}", val, key));
   }
}

int64_t VarMap::get_req_i64(const std::string& key) const {
   const std::string val = get_req_str(key);

   try {
      size_t used = 0;
      const int64_t v = std::stoll(val, &used);
      if(used == val.size()) {
         return v;
      }
   } catch(std::exception&) {
      // reported below
   }
   throw Test_Error(Ordo::fmt("Invalid integer '{}' for key {}", val, key));
}

Text_Based_Test::Text_Based_Test(const std::string& data_src,
                                 const std::string& required_keys,
                                 const std::string& optional_keys) :
      m_data_src(data_src), m_required_keys(Ordo::split_on(required_keys, ',')) {
   if(m_required_keys.empty()) {
      throw Test_Error("Text_Based_Test for " + data_src + " needs at least one required key");
   }

   m_known_keys.insert(m_required_keys.begin(), m_required_keys.end());
   for(const auto& key : Ordo::split_on(optional_keys, ',')) {
      m_known_keys.insert(key);
   }
}

namespace {

// strips leading and trailing but not internal whitespace
std::string strip_ws(const std::string& in) {
   const char* whitespace = " \t\r";

   const auto first_c = in.find_first_not_of(whitespace);
   if(first_c == std::string::npos) {
      return "";
   }

   const auto last_c = in.find_last_not_of(whitespace);

   return in.substr(first_c, last_c - first_c + 1);
}

}  // namespace

std::string Text_Based_Test::describe_vector(size_t test_cnt, const std::string& header, const VarMap& vars) const {
   std::ostringstream oss;
   oss << "Test # " << test_cnt << " ";
   if(!header.empty()) {
      oss << header << " ";
   }
   for(const auto& k : m_required_keys) {
      oss << k << "=" << vars.get_opt_str(k, "") << " ";
   }
   return oss.str();
}

std::vector<Test::Result> Text_Based_Test::run() {
   const std::string path = Test::data_file(m_data_src);
   std::ifstream in(path);
   if(!in.good()) {
      throw Test_Error("Could not open input file '" + path + "'");
   }

   const std::string& output_key = m_required_keys.back();

   std::vector<Test::Result> results;
   std::string header;
   std::string header_or_name = m_data_src;
   VarMap vars;
   size_t test_cnt = 0;

   std::string raw_line;
   while(std::getline(in, raw_line)) {
      const std::string line = strip_ws(raw_line);

      if(line.empty() || line[0] == '#') {
         continue;
      }

      if(line.front() == '[' && line.back() == ']') {
         header = line.substr(1, line.size() - 2);
         header_or_name = header;
         test_cnt = 0;
         vars.clear();
         continue;
      }

      const auto equal_i = line.find('=');
      if(equal_i == std::string::npos) {
         results.push_back(Test::Result::Failure(header_or_name, "invalid input '" + line + "'"));
         continue;
      }

      const std::string key = strip_ws(line.substr(0, equal_i));
      const std::string val = strip_ws(line.substr(equal_i + 1));

      if(!m_known_keys.contains(key)) {
         results.push_back(Test::Result::Failure(header_or_name, Ordo::fmt("test {} unknown key {}", test_cnt, key)));
      }

      vars.add(key, val);

      if(key != output_key) {
         continue;
      }

      ++test_cnt;

      for(const auto& req_key : m_required_keys) {
         if(!vars.has_key(req_key)) {
            results.push_back(
               Test::Result::Failure(header_or_name, Ordo::fmt("test {} missing required key {}", test_cnt, req_key)));
         }
      }

      try {
         const auto start = std::chrono::steady_clock::now();
         Test::Result result = run_one_test(header, vars);
         result.set_elapsed_time(std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start));

         if(result.tests_failed()) {
            result.test_note(describe_vector(test_cnt, header, vars) + "failed");
         }
         results.push_back(result);
      } catch(std::exception& e) {
         results.push_back(Test::Result::Failure(
            header_or_name, describe_vector(test_cnt, header, vars) + "failed with exception '" + e.what() + "'"));
      }

      vars.clear();
   }

   if(results.empty()) {
      throw Test_Error("No test vectors found in " + path);
   }

   try {
      std::vector<Test::Result> final_tests = run_final_tests();
      results.insert(results.end(), final_tests.begin(), final_tests.end());
   } catch(std::exception& e) {
      results.push_back(Test::Result::Failure(header_or_name, "run_final_tests exception " + std::string(e.what())));
   }

   return results;
}

}  // namespace Ordo_Tests
