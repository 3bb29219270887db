#pragma once

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <boost/json.hpp>
#include <boost/program_options.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "common_macros.hpp"
#include "customio/console_output.hpp"
#include "my_error_codes.hpp"
#include "result_monad.hpp"

namespace fs = std::filesystem;
namespace po = boost::program_options;

namespace kubeplane {

struct CliParams {
  std::vector<fs::path> config_dirs;
  std::vector<std::string> profiles;
  fs::path runtime_dir;
  std::string subcmd;
  std::string verbose; // vvvv
  bool silent = false;
  bool json = false;
  size_t offset = 0;
  size_t limit = 50;
};

struct CliCtx {
  po::variables_map vm;
  std::vector<std::string> positionals;
  std::vector<std::string> unrecognized;
  kubeplane::CliParams params;
  CliCtx(po::variables_map &&vm,                  //
         std::vector<std::string> &&positionals,  //
         std::vector<std::string> &&unrecognized, //
         kubeplane::CliParams &&params_)
      : vm(std::move(vm)), positionals(std::move(positionals)),
        unrecognized(std::move(unrecognized)), params(std::move(params_)) {}

  // True when the option was given explicitly rather than defaulted.
  bool is_specified_by_user(const std::string &opt_name) const {
    auto it = vm.find(opt_name);
    if (it == vm.end()) {
      return false;
    }
    return !it->second.defaulted();
  }
  bool positional_contains(const std::string &name) const {
    return std::find(positionals.begin(), positionals.end(), name) !=
           positionals.end();
  }
  std::pair<size_t, size_t> offset_limit() const {
    return std::make_pair(params.offset, params.limit);
  }

  size_t verbosity_level() const {
    if (params.silent) {
      return 0;
    }
    if (params.verbose.empty()) {
      return 3;
    }
    if (params.verbose == "trace") {
      return 5;
    } else if (params.verbose == "debug") {
      return 4;
    } else if (params.verbose == "info") {
      return 3;
    } else if (params.verbose == "warning") {
      return 2;
    } else if (params.verbose == "error") {
      return 1;
    }
    return std::count(params.verbose.begin(), params.verbose.end(), 'v');
  }
  ~CliCtx() { DEBUG_PRINT("CliCtx destroyed"); }

  // "kubeplane cluster delete prod" -> action() == "delete"
  std::string action() const {
    return positionals.size() > 1 ? positionals[1] : std::string{};
  }

  // Positional argument `index` after the action.
  monad::MyResult<std::string> argument(size_t index,
                                        std::string_view what) const {
    if (positionals.size() <= index + 2) {
      return monad::MyResult<std::string>::Err(monad::make_error(
          my_errors::GENERAL::SHOW_OPT_DESC,
          fmt::format("{} must be provided for {}.", what, action())));
    }
    return monad::MyResult<std::string>::Ok(positionals[index + 2]);
  }
};

inline std::string_view
get_unrecognized(const std::vector<std::string> &unrecognized,
                 const std::string &option_name) {
  auto it = std::find(unrecognized.begin(), unrecognized.end(), option_name);
  if (it != unrecognized.end() && ++it != unrecognized.end()) {
    return *it;
  }
  return "";
}

// `source` minus one occurrence of each token in `excluded`.
inline std::vector<std::string>
filter_tokens(const std::vector<std::string> &source,
              const std::vector<std::string> &excluded) {
  std::vector<std::string> result;
  result.reserve(source.size());
  std::vector<std::string> remaining = excluded;
  for (const auto &token : source) {
    auto it = std::find(remaining.begin(), remaining.end(), token);
    if (it != remaining.end()) {
      remaining.erase(it);
      continue;
    }
    result.push_back(token);
  }
  return result;
}

inline bool parse_bool(const std::string &value) {
  std::string val_lower = value;
  std::transform(val_lower.begin(), val_lower.end(), val_lower.begin(),
                 ::tolower);
  return (val_lower == "1" || val_lower == "true" || val_lower == "yes" ||
          val_lower == "on");
}

inline bool is_known_subcommand(std::string_view candidate) {
  static constexpr std::array<std::string_view, 3> kKnown{
      "cluster", "tasks", "workflows"};
  return std::find(kKnown.begin(), kKnown.end(), candidate) != kKnown.end();
}

inline std::optional<size_t>
find_subcommand_index(const std::vector<std::string> &tokens) {
  for (size_t i = 0; i < tokens.size(); ++i) {
    if (is_known_subcommand(tokens[i])) {
      return i;
    }
  }
  return std::nullopt;
}

// Makes `positionals` start with the subcommand. When the parser took an
// option value for the subcommand ("--profiles dev cluster list") the real
// subcommand is searched in the positionals and then in the raw tokens.
inline void normalize_cli_subcommand(
    std::string &subcmd, std::vector<std::string> &positionals,
    const std::vector<std::string> &fallback_tokens = {}) {
  auto looks_like_option = [](const std::string &token) {
    return !token.empty() && token[0] == '-';
  };

  auto token_is_option_value = [&](const std::string &token) {
    if (token.empty() || fallback_tokens.empty()) {
      return false;
    }
    for (size_t i = 0; i + 1 < fallback_tokens.size(); ++i) {
      if (!looks_like_option(fallback_tokens[i])) {
        continue;
      }
      const auto &value = fallback_tokens[i + 1];
      if (value.empty() || looks_like_option(value)) {
        continue;
      }
      if (value == token) {
        return true;
      }
    }
    return false;
  };

  auto ensure_prefix = [&]() {
    if (subcmd.empty()) {
      return;
    }
    if (positionals.empty() || positionals.front() != subcmd) {
      positionals.insert(positionals.begin(), subcmd);
    }
  };

  if (!subcmd.empty()) {
    const bool known = is_known_subcommand(subcmd);
    if (!known && token_is_option_value(subcmd)) {
      if (!positionals.empty() && positionals.front() == subcmd) {
        positionals.erase(positionals.begin());
      }
      subcmd.clear();
    } else {
      ensure_prefix();
      return;
    }
  }

  if (!positionals.empty()) {
    if (auto idx = find_subcommand_index(positionals)) {
      subcmd = positionals[*idx];
      if (*idx != 0) {
        auto detected = positionals[*idx];
        positionals.erase(positionals.begin() + *idx);
        positionals.insert(positionals.begin(), std::move(detected));
      }
      return;
    }
  }

  if (fallback_tokens.empty()) {
    return;
  }

  if (auto idx = find_subcommand_index(fallback_tokens)) {
    subcmd = fallback_tokens[*idx];
    if (positionals.empty()) {
      positionals.push_back(subcmd);
      for (size_t j = *idx + 1; j < fallback_tokens.size(); ++j) {
        const auto &candidate = fallback_tokens[j];
        if (looks_like_option(candidate)) {
          break;
        }
        positionals.push_back(candidate);
      }
    } else {
      ensure_prefix();
    }
  }
}

} // namespace kubeplane
