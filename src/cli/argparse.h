/*
* (C) 2015,2017 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_CLI_ARGPARSE_H_
#define ORDO_CLI_ARGPARSE_H_

#include "cli_exceptions.h"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace Ordo_CLI {

/**
* Parses command lines against a spec such as
* "ordo-test --verbose --data-dir=src/tests/data *suites": a name,
* then flags, options with their default values and an optional
* trailing list of free arguments
*/
class Argument_Parser final {
   public:
      explicit Argument_Parser(const std::string& spec);

      void parse_args(const std::vector<std::string>& params);

      bool flag_set(const std::string& flag) const;

      std::string get_arg(const std::string& option) const;

      std::string get_arg_or(const std::string& option, const std::string& otherwise) const;

      size_t get_arg_sz(const std::string& option) const;

      std::vector<std::string> get_arg_list(const std::string& what) const;

      static std::vector<std::string> split_on(const std::string& str, char delim);

   private:
      // set in constructor
      std::set<std::string> m_spec_flags;
      std::map<std::string, std::string> m_spec_opts;
      std::string m_spec_rest;

      // set in parse_args()
      std::map<std::string, std::string> m_user_args;
      std::set<std::string> m_user_flags;
      std::vector<std::string> m_user_rest;
};

inline std::vector<std::string> Argument_Parser::split_on(const std::string& str, char delim) {
   std::vector<std::string> elems;
   std::string substr;

   for(const char c : str) {
      if(c == delim) {
         if(!substr.empty()) {
            elems.push_back(substr);
         }
         substr.clear();
      } else {
         substr += c;
      }
   }

   if(!substr.empty()) {
      elems.push_back(substr);
   }

   return elems;
}

inline bool Argument_Parser::flag_set(const std::string& flag_name) const {
   return m_user_flags.contains(flag_name);
}

inline std::string Argument_Parser::get_arg(const std::string& opt_name) const {
   auto i = m_user_args.find(opt_name);
   if(i == m_user_args.end()) {
      // this shouldn't occur unless you passed the wrong thing to get_arg
      throw CLI_Error("Unknown option " + opt_name + " used (program bug)");
   }
   return i->second;
}

inline std::string Argument_Parser::get_arg_or(const std::string& opt_name, const std::string& otherwise) const {
   auto i = m_user_args.find(opt_name);
   if(i == m_user_args.end() || i->second.empty()) {
      return otherwise;
   }
   return i->second;
}

inline size_t Argument_Parser::get_arg_sz(const std::string& opt_name) const {
   const std::string s = get_arg(opt_name);

   try {
      return static_cast<size_t>(std::stoul(s));
   } catch(std::exception&) {
      throw CLI_Usage_Error("Invalid integer value '" + s + "' for option " + opt_name);
   }
}

inline std::vector<std::string> Argument_Parser::get_arg_list(const std::string& what) const {
   if(what == m_spec_rest) {
      return m_user_rest;
   }

   return split_on(get_arg(what), ',');
}

inline void Argument_Parser::parse_args(const std::vector<std::string>& params) {
   for(const auto& param : params) {
      if(!param.starts_with("--")) {
         if(m_spec_rest.empty()) {
            throw CLI_Usage_Error("Unexpected argument " + param);
         }
         m_user_rest.push_back(param);
         continue;
      }

      const auto eq = param.find('=');

      if(eq == std::string::npos) {
         const std::string flag = param.substr(2);

         if(!m_spec_flags.contains(flag)) {
            if(m_spec_opts.contains(flag)) {
               throw CLI_Usage_Error("Invalid usage of option --" + flag + " without value");
            }
            throw CLI_Usage_Error("Unknown flag --" + flag);
         }
         m_user_flags.insert(flag);
      } else {
         const std::string opt_name = param.substr(2, eq - 2);

         if(!m_spec_opts.contains(opt_name)) {
            throw CLI_Usage_Error("Unknown option --" + opt_name);
         }

         if(m_user_args.contains(opt_name)) {
            throw CLI_Usage_Error("Duplicated option --" + opt_name);
         }

         m_user_args.emplace(opt_name, param.substr(eq + 1));
      }
   }

   // Now insert any defaults for options not supplied by the user
   for(const auto& opt : m_spec_opts) {
      m_user_args.insert(opt);
   }
}

inline Argument_Parser::Argument_Parser(const std::string& spec) {
   const std::vector<std::string> parts = split_on(spec, ' ');

   if(parts.empty()) {
      throw CLI_Error("Invalid command spec '" + spec + "'");
   }

   for(size_t i = 1; i != parts.size(); ++i) {
      const auto& s = parts[i];

      if(s.size() > 2 && s.starts_with("--")) {
         const auto eq = s.find('=');

         if(eq == std::string::npos) {
            m_spec_flags.insert(s.substr(2));
         } else {
            m_spec_opts.emplace(s.substr(2, eq - 2), s.substr(eq + 1));
         }
      } else if(s[0] == '*' && s.size() > 1 && m_spec_rest.empty() && i + 1 == parts.size()) {
         m_spec_rest = s.substr(1);
      } else {
         throw CLI_Error("Invalid command spec '" + spec + "'");
      }
   }
}

}  // namespace Ordo_CLI

#endif
