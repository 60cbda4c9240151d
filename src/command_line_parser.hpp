#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto a SettingsManager. Options are looked up in the settings
// specification (long key or alias); positionals fill the keys listed in the
// argv specification in order. Any malformed argument raises UsageError.
class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "zap",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","source"},{"required",true}},
                      {{"index",1},{"key","destination"},{"required",true}}
                    }));

  // Returns the number of positionals seen.
  std::size_t parse(int argc, char* argv[], SettingsManager& settings) const;
  std::size_t parse(const std::vector<std::string>& args, SettingsManager& settings) const;
  void usage(bool to_stderr = false) const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
    bool required = false;
  };

  std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec) const;
  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
  nlohmann::json settings_spec_;
  nlohmann::json argv_spec_;
  std::vector<ArgvSpec> positional_specs_;
};
