#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)),
    argv_spec_(std::move(argv_spec)),
    positional_specs_(build_positional_specs(argv_spec_)) {}

std::vector<CommandLineParser::ArgvSpec> CommandLineParser::build_positional_specs(const nlohmann::json& spec) const {
  std::vector<ArgvSpec> result;
  for(const auto& entry : spec) {
    ArgvSpec out;
    out.index = entry.at("index").get<std::size_t>();
    out.key = entry.at("key").get<std::string>();
    out.required = entry.value("required", false);
    result.push_back(std::move(out));
  }
  std::sort(result.begin(), result.end(),
            [](const ArgvSpec& a, const ArgvSpec& b){ return a.index < b.index; });

  SettingsManager probe(settings_spec_);
  for(const auto& argv_entry : result) {
    if(!probe.resolve_key(argv_entry.key)) {
      throw std::runtime_error("ARGV specification references unknown setting '" + argv_entry.key + "'");
    }
  }
  return result;
}

// "-1" is a value (a negative number), not an option.
bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0 && candidate.size() > 2) return true;
  if(candidate.size() >= 2 && candidate[0] == '-' &&
     std::isalpha(static_cast<unsigned char>(candidate[1]))) {
    return true;
  }
  return false;
}

std::size_t CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  return parse(args, settings);
}

std::size_t CommandLineParser::parse(const std::vector<std::string>& args, SettingsManager& settings) const {
  std::size_t positional_index = 0;
  bool options_done = false;

  auto store_positional = [&](const std::string& token){
    if(positional_index >= positional_specs_.size()) {
      throw UsageError("Unexpected positional argument '" + token + "'");
    }
    const auto& spec = positional_specs_[positional_index++];
    std::string error;
    if(!settings.set_from_string(spec.key, token, error)) {
      throw UsageError("Invalid value for " + spec.key + " '" + token + "': " + error);
    }
  };

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    if(options_done) {
      store_positional(token);
      continue;
    }
    if(token == "--") {
      options_done = true;
      continue;
    }

    auto handle_option = [&](const std::string& key_token,
                             const std::string* inline_value,
                             bool long_form){
      auto resolved = settings.resolve_key(key_token);
      if(!resolved || std::any_of(positional_specs_.begin(), positional_specs_.end(),
                                  [&](const ArgvSpec& p){ return p.key == *resolved; })) {
        if(long_form) {
          throw UsageError("Unknown option --" + key_token);
        }
        return false;
      }
      bool is_bool = settings.is_bool_setting(*resolved);
      std::string value;
      if(inline_value) {
        value = *inline_value;
      } else if(is_bool) {
        if(i + 1 < args.size() && !is_option_token(args[i + 1]) &&
           SettingsManager::is_bool_literal(args[i + 1])) {
          value = args[++i];
        } else {
          value = "true";
        }
      } else {
        if(i + 1 >= args.size()) {
          throw UsageError("Missing value for option '" + key_token + "'");
        }
        value = args[++i];
      }
      std::string error;
      if(!settings.set_from_string(*resolved, value, error)) {
        throw UsageError("Invalid value for option '" + key_token + "': " + error);
      }
      return true;
    };

    if(token.rfind("--", 0) == 0) {
      std::string key = token.substr(2);
      auto eq = key.find('=');
      if(eq != std::string::npos) {
        std::string value = key.substr(eq + 1);
        key.resize(eq);
        handle_option(key, &value, true);
      } else {
        handle_option(key, nullptr, true);
      }
      continue;
    }

    if(token.size() > 1 && token[0] == '-') {
      std::string alias = token.substr(1);
      if(handle_option(alias, nullptr, false)) {
        continue;
      }
      if(is_option_token(token)) {
        throw UsageError("Unknown option " + token);
      }
      // "-5" and similar fall through as positionals
    }

    store_positional(token);
  }

  if(!settings.help_requested()) {
    for(std::size_t i = positional_index; i < positional_specs_.size(); ++i) {
      if(positional_specs_[i].required) {
        throw UsageError("Missing required argument <" + positional_specs_[i].key + ">");
      }
    }
  }
  return positional_index;
}

void CommandLineParser::usage(bool to_stderr) const {
  std::ostringstream text;
  text << process_name_ << " - parallel single-file copy over SSH\n";
  text << "Usage:\n";

  std::string cmd = process_name_ + " [options]";
  for(const auto& pos : positional_specs_) {
    cmd += pos.required ? " <" + pos.key + ">" : " [" + pos.key + "]";
  }
  text << "  " << cmd << "\n\n";
  text << "Options:\n";
  for(const auto& entry : settings_spec_) {
    auto key = entry.at("key").get<std::string>();
    if(std::any_of(positional_specs_.begin(), positional_specs_.end(),
                   [&](const ArgvSpec& p){ return p.key == key; })) {
      continue;
    }
    auto type = entry.at("type").get<std::string>();
    std::string argument_hint = (type == "bool") ? "[true|false]" : "<" + type + ">";
    std::ostringstream aliases;
    if(entry.contains("aliases")) {
      const auto alias_list = entry.at("aliases").get<std::vector<std::string>>();
      if(!alias_list.empty()) {
        aliases << " (alias: ";
        for(std::size_t i = 0; i < alias_list.size(); ++i) {
          if(i > 0) aliases << ", ";
          aliases << "-" << alias_list[i];
        }
        aliases << ")";
      }
    }
    auto description = entry.value("description", "");
    auto default_value = entry.at("default");
    std::string default_str;
    if(type == "bool") {
      default_str = default_value.get<bool>() ? "true" : "false";
    } else if(default_value.is_string()) {
      default_str = default_value.get<std::string>();
    } else {
      default_str = default_value.dump();
    }
    text << fmt::format("  --{:<20} {:<14} {}{} (default: {})\n",
                        key,
                        argument_hint,
                        description,
                        aliases.str(),
                        default_str);
  }
  if(to_stderr) {
    print_err(nullptr, "{}", text.str());
  } else {
    print_out(nullptr, "{}", text.str());
  }
}
