/**
 * @file src/config.cpp
 * @brief Definitions for the configuration of vavk.
 */
// standard includes
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <utility>

// local includes
#include "config.h"
#include "logging.h"
#include "utility.h"

namespace fs = std::filesystem;
using namespace std::literals;

namespace config {
  driver_t driver {
    2,  // min_log_level
    {},  // log_file
    {},  // config_file
  };

  vulkan_t vulkan {
    true,  // validation
  };

  // Environment variables and the option each one overrides
  constexpr std::pair<std::string_view, std::string_view> env_overrides[] {
    {"VAVK_LOG_LEVEL"sv, "min_log_level"sv},
    {"VAVK_LOG_FILE"sv, "log_file"sv},
    {"VAVK_VULKAN_VALIDATION"sv, "vulkan_validation"sv},
  };

  bool endline(char ch) {
    return ch == '\r' || ch == '\n';
  }

  bool space_tab(char ch) {
    return ch == ' ' || ch == '\t';
  }

  bool whitespace(char ch) {
    return space_tab(ch) || endline(ch);
  }

  std::string to_string(const char *begin, const char *end) {
    std::string result;

    KITTY_WHILE_LOOP(auto pos = begin, pos != end, {
      auto comment = std::find(pos, end, '#');
      auto endl = std::find_if(comment, end, endline);

      result.append(pos, comment);

      pos = endl;
    })

    return result;
  }

  std::pair<
    std::string_view::const_iterator,
    std::optional<std::pair<std::string, std::string>>>
    parse_option(std::string_view::const_iterator begin, std::string_view::const_iterator end) {
    begin = std::find_if_not(begin, end, whitespace);
    auto endl = std::find_if(begin, end, endline);
    auto endc = std::find(begin, endl, '#');
    endc = std::find_if(std::make_reverse_iterator(endc), std::make_reverse_iterator(begin), std::not_fn(whitespace)).base();

    auto eq = std::find(begin, endc, '=');
    if (eq == endc || eq == begin) {
      return std::make_pair(endl, std::nullopt);
    }

    auto end_name = std::find_if_not(std::make_reverse_iterator(eq), std::make_reverse_iterator(begin), space_tab).base();
    auto begin_val = std::find_if_not(eq + 1, endc, space_tab);

    if (begin_val == endc) {
      return std::make_pair(endl, std::nullopt);
    }

    return std::make_pair(
      endl,
      std::make_pair(to_string(begin, end_name), to_string(begin_val, endc))
    );
  }

  std::unordered_map<std::string, std::string> parse_config(const std::string_view &file_content) {
    std::unordered_map<std::string, std::string> vars;

    auto pos = std::begin(file_content);
    auto end = std::end(file_content);

    while (pos < end) {
      TUPLE_2D(endl, var, parse_option(pos, end));

      pos = endl;
      if (pos != end) {
        pos += (*pos == '\r' && pos + 1 != end) ? 2 : 1;
      }

      if (!var) {
        continue;
      }

      vars.insert_or_assign(std::move(var->first), std::move(var->second));
    }

    return vars;
  }

  void string_f(std::unordered_map<std::string, std::string> &vars, const std::string &name, std::string &input) {
    auto it = vars.find(name);
    if (it == std::end(vars)) {
      return;
    }

    input = std::move(it->second);

    vars.erase(it);
  }

  bool to_bool(std::string &boolean) {
    std::transform(std::begin(boolean), std::end(boolean), std::begin(boolean), [](char ch) {
      return (char) std::tolower(ch);
    });

    return boolean == "true"sv ||
           boolean == "yes"sv ||
           boolean == "enable"sv ||
           boolean == "enabled"sv ||
           boolean == "on"sv ||
           (std::find(std::begin(boolean), std::end(boolean), '1') != std::end(boolean));
  }

  void bool_f(std::unordered_map<std::string, std::string> &vars, const std::string &name, bool &input) {
    std::string tmp;
    string_f(vars, name, tmp);

    if (tmp.empty()) {
      return;
    }

    input = to_bool(tmp);
  }

  void log_level_f(std::unordered_map<std::string, std::string> &vars, const std::string &name, int &input) {
    std::string log_level_string;
    string_f(vars, name, log_level_string);

    if (log_level_string.empty()) {
      return;
    }

    if (log_level_string == "verbose"sv) {
      input = 0;
    } else if (log_level_string == "debug"sv) {
      input = 1;
    } else if (log_level_string == "info"sv) {
      input = 2;
    } else if (log_level_string == "warning"sv) {
      input = 3;
    } else if (log_level_string == "error"sv) {
      input = 4;
    } else if (log_level_string == "fatal"sv) {
      input = 5;
    } else if (log_level_string == "none"sv) {
      input = 6;
    } else {
      // accept digit directly
      auto val = log_level_string[0];
      if (val >= '0' && val < '7') {
        input = val - '0';
      }
    }
  }

  void apply_config(std::unordered_map<std::string, std::string> &&vars) {
    for (auto &[name, val] : vars) {
      BOOST_LOG(info) << "config: '"sv << name << "' = "sv << val;
    }

    log_level_f(vars, "min_log_level"s, driver.min_log_level);
    string_f(vars, "log_file"s, driver.log_file);
    bool_f(vars, "vulkan_validation"s, vulkan.validation);

    for (auto &[var, _] : vars) {
      BOOST_LOG(warning) << "config: Unrecognized configurable option ["sv << var << ']';
    }
  }

  std::string read_file(const char *path) {
    if (!fs::exists(path)) {
      BOOST_LOG(debug) << "Missing file: " << path;
      return {};
    }

    std::ifstream in(path);
    return std::string {(std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>()};
  }

  void load() {
    std::unordered_map<std::string, std::string> vars;

    if (auto path = std::getenv("VAVK_CONFIG_FILE"); path && *path) {
      driver.config_file = path;
      vars = parse_config(read_file(path));
    }

    for (auto &[env, name] : env_overrides) {
      auto value = std::getenv(std::string {env}.c_str());
      if (value && *value) {
        vars.insert_or_assign(std::string {name}, value);
      }
    }

    apply_config(std::move(vars));
  }
}  // namespace config
