#include <boost/json.hpp>
#include <boost/program_options.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>

#include "common_macros.hpp"
#include "kubeplane_common.hpp"
#include "kubeplane_entry.hpp"
#include "util/my_logging.hpp"

#ifndef KUBEPLANE_VERSION
#define KUBEPLANE_VERSION "0.0.0-dev"
#endif

namespace po = boost::program_options;

namespace {

namespace js = boost::json;

struct DefaultPaths {
  fs::path config_dir;
  fs::path runtime_dir;
};

fs::path get_env_path(const char *name) {
  if (const char *value = std::getenv(name); value && *value) {
    return fs::path(value);
  }
  return {};
}

// Environment variable precedence (highest to lowest):
// 1. KUBEPLANE_CONFIG_DIR + KUBEPLANE_RUNTIME_DIR
// 2. KUBEPLANE_BASE_DIR (appends /config and /runtime)
// 3. /etc/kubeplane and /var/lib/kubeplane with individual overrides
DefaultPaths resolve_default_paths() {
  fs::path config_override = get_env_path("KUBEPLANE_CONFIG_DIR");
  fs::path runtime_override = get_env_path("KUBEPLANE_RUNTIME_DIR");

  if (!config_override.empty() && !runtime_override.empty()) {
    return {config_override, runtime_override};
  }

  fs::path base_override = get_env_path("KUBEPLANE_BASE_DIR");
  if (!base_override.empty()) {
    return {config_override.empty() ? (base_override / "config")
                                    : config_override,
            runtime_override.empty() ? (base_override / "runtime")
                                     : runtime_override};
  }

  return {config_override.empty() ? fs::path("/etc/kubeplane")
                                  : config_override,
          runtime_override.empty() ? fs::path("/var/lib/kubeplane")
                                   : runtime_override};
}

void ensure_directory_exists(const fs::path &dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec && !fs::exists(dir)) {
    throw std::runtime_error(std::string("Failed to create directory '") +
                             dir.string() + "': " + ec.message());
  }
}

void write_json_if_missing(const fs::path &file_path,
                           const js::value &content) {
  if (fs::exists(file_path)) {
    return;
  }
  ensure_directory_exists(file_path.parent_path());
  std::ofstream ofs(file_path);
  if (!ofs) {
    throw std::runtime_error("Unable to write default config file: " +
                             file_path.string());
  }
  ofs << js::serialize(content) << std::endl;
}

bool bootstrap_default_config_dir(const fs::path &config_dir,
                                  const fs::path &runtime_dir) {
  std::error_code ec;
  fs::create_directories(config_dir, ec);
  if (ec && !fs::exists(config_dir)) {
    std::cerr << "Warning: unable to create default config directory '"
              << config_dir << "': " << ec.message() << std::endl;
    return false;
  }

  try {
    js::object application{{"verbose", "info"},
                           {"runtime_dir", runtime_dir.string()},
                           {"state_db_file", "kubeplane.db"},
                           {"task_timeout_seconds", 600},
                           {"step_timeout_seconds", 30},
                           {"cleanup_max_attempts", 3},
                           {"cleanup_retry_delay_ms", 500},
                           {"command_threads", 4}};
    write_json_if_missing(config_dir / "application.json", application);

    js::object ioc{{"threads_num", 2}, {"name", "kubeplane-ioc"}};
    write_json_if_missing(config_dir / "ioc_config.json", ioc);

    js::object log{{"level", "info"},
                   {"log_dir", (runtime_dir / "logs").string()},
                   {"log_file", "kubeplane"},
                   {"rotation_size", 10 * 1024 * 1024}};
    write_json_if_missing(config_dir / "log_config.json", log);

    // Credentials may reference environment variables, e.g.
    // "access_token": "${DIGITALOCEAN_ACCESS_TOKEN}".
    write_json_if_missing(config_dir / "cloud_accounts.json",
                          js::object{{"accounts", js::array{}}});
  } catch (const std::exception &ex) {
    std::cerr << "Warning: failed to write default configuration files: "
              << ex.what() << std::endl;
    return false;
  }

  return true;
}

// The first application*.json among the config directories that sets
// runtime_dir wins.
std::optional<fs::path>
find_runtime_dir_override(const std::vector<fs::path> &config_dirs,
                          const std::vector<std::string> &profiles) {
  std::optional<fs::path> runtime_dir;
  auto apply_file = [&](const fs::path &file) {
    if (runtime_dir || !fs::exists(file)) {
      return;
    }
    std::ifstream ifs(file);
    if (!ifs) {
      return;
    }
    std::string content((std::istreambuf_iterator<char>(ifs)),
                        std::istreambuf_iterator<char>());
    boost::system::error_code ec;
    auto value = js::parse(content, ec);
    if (ec || !value.is_object()) {
      return;
    }
    if (auto *rd = value.as_object().if_contains("runtime_dir");
        rd && rd->is_string()) {
      runtime_dir = fs::path(std::string(rd->as_string()));
    }
  };

  for (const auto &dir : config_dirs) {
    apply_file(dir / "application.override.json");
    for (const auto &profile : profiles) {
      apply_file(dir / ("application." + profile + ".json"));
    }
    apply_file(dir / "application.json");
  }
  return runtime_dir;
}

void add_unique_path(std::vector<fs::path> &paths, const fs::path &candidate) {
  if (candidate.empty()) {
    return;
  }
  if (std::find(paths.begin(), paths.end(), candidate) == paths.end()) {
    paths.push_back(candidate);
  }
}

} // namespace

int RunKubeplaneApplication(int argc, char *argv[]) {
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (arg == "--version" || arg == "version") {
      std::cout << KUBEPLANE_VERSION << std::endl;
      return EXIT_SUCCESS;
    }
  }

  try {
    po::variables_map vm;
    po::options_description generic_desc("kubeplane: cluster workflow runner");

    kubeplane::CliParams cli_params;
    std::vector<std::string> config_dirs_args;

    generic_desc.add_options() //
        ("config-dirs,c",
         po::value<std::vector<std::string>>(&config_dirs_args)
             ->multitoken()
             ->composing(),
         "paths of the configuration directories.") //
        ("profiles",
         po::value<std::vector<std::string>>(&cli_params.profiles)
             ->default_value(std::vector<std::string>{}, "")
             ->notifier([&](const std::vector<std::string> &profiles) mutable {
               if (profiles.empty()) {
                 cli_params.profiles.push_back("default");
               }
             }),
         "profiles to use from the configuration file.") //
        ("verbose,v",
         po::value<std::string>(&cli_params.verbose)->default_value("info"),
         "verbosity level, like info, trace, vvvv.") //
        ("silent", po::bool_switch(&cli_params.silent)->default_value(false),
         "suppress all output.") //
        ("json", po::bool_switch(&cli_params.json)->default_value(false),
         "print results as JSON.") //
        ("offset", po::value<size_t>(&cli_params.offset)->default_value(0),
         "offset") //
        ("limit", po::value<size_t>(&cli_params.limit)->default_value(50),
         "limit") //
        ("help,h", "Print help");

    po::options_description hidden_desc("Hidden options");
    hidden_desc.add_options() //
        ("positionals",
         po::value<std::vector<std::string>>()->default_value({}, ""),
         "all positional arguments");

    po::options_description cmdline_options("Allowed options");
    cmdline_options.add(generic_desc).add(hidden_desc);

    po::positional_options_description p;
    p.add("positionals", -1);

    po::parsed_options parsed = po::command_line_parser(argc, argv)
                                    .options(cmdline_options)
                                    .positional(p)
                                    .allow_unregistered()
                                    .run();
    po::store(parsed, vm);
    po::notify(vm);

    for (const auto &dir_str : config_dirs_args) {
      fs::path config_dir(dir_str);
      if (!fs::exists(config_dir)) {
        throw std::runtime_error("Config directory does not exist: " +
                                 config_dir.string());
      }
      cli_params.config_dirs.push_back(std::move(config_dir));
    }

    std::vector<std::string> positionals =
        vm["positionals"].as<std::vector<std::string>>();
    if (!positionals.empty()) {
      cli_params.subcmd = positionals[0];
    }

    std::vector<std::string> unrecognized = po::collect_unrecognized(
        parsed.options, po::collect_unrecognized_mode::include_positional);

    kubeplane::normalize_cli_subcommand(cli_params.subcmd, positionals,
                                        unrecognized);

    if (vm.count("help") || cli_params.subcmd.empty()) {
      std::cerr << generic_desc << std::endl;
      std::cerr
          << "Subcommands:" << std::endl
          << "  cluster    import <file> | list | show <name> | delete <name>"
          << std::endl
          << "             | delete-node <name> <node> | add-nodes <name>"
          << std::endl
          << "             | tasks <name>" << std::endl
          << "  tasks      list [--cluster <name>] | show <id> | purge "
             "--cluster <name>"
          << std::endl
          << "  workflows  list | show <kind>" << std::endl
          << std::endl;
      return vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    const DefaultPaths defaults = resolve_default_paths();
    const bool default_config_available =
        bootstrap_default_config_dir(defaults.config_dir, defaults.runtime_dir);

    std::vector<fs::path> ordered_config_dirs;
    if (default_config_available && fs::exists(defaults.config_dir)) {
      add_unique_path(ordered_config_dirs, defaults.config_dir);
    }
    for (const auto &dir : cli_params.config_dirs) {
      add_unique_path(ordered_config_dirs, dir);
    }

    if (ordered_config_dirs.empty()) {
      std::cerr << "No configuration directories found. Provide --config-dirs"
                << " or ensure the default directory '" << defaults.config_dir
                << "' is accessible." << std::endl;
      return EXIT_FAILURE;
    }

    std::vector<fs::path> lookup_order(ordered_config_dirs.rbegin(),
                                       ordered_config_dirs.rend());
    auto runtime_override =
        find_runtime_dir_override(lookup_order, cli_params.profiles);
    fs::path resolved_runtime_dir =
        runtime_override.value_or(defaults.runtime_dir);

    try {
      ensure_directory_exists(resolved_runtime_dir);
      ensure_directory_exists(resolved_runtime_dir / "logs");
      ensure_directory_exists(resolved_runtime_dir / "state");
    } catch (const std::exception &ex) {
      std::cerr << "Failed to prepare runtime directory '"
                << resolved_runtime_dir << "': " << ex.what() << std::endl;
      return EXIT_FAILURE;
    }

    cli_params.config_dirs = ordered_config_dirs;
    cli_params.runtime_dir = resolved_runtime_dir;

    static cjj365::ConfigSources config_sources(
        cli_params.config_dirs, cli_params.profiles,
        std::map<std::string, std::string>{});
    {
      auto log_config_result = config_sources.json_content("log_config");
      if (log_config_result.is_err()) {
        std::cerr << "Failed to load log_config: " << log_config_result.error()
                  << std::endl;
        return EXIT_FAILURE;
      }
      DEBUG_PRINT("log config: " << log_config_result.value());
      cjj365::LoggingConfig logging_config =
          boost::json::value_to<cjj365::LoggingConfig>(log_config_result.value());
      kubeplane::init_my_log(logging_config);
    }

    static kubeplane::CliCtx cli_ctx(std::move(vm), std::move(positionals),
                                     std::move(unrecognized),
                                     std::move(cli_params));

    if (!cli_ctx.is_specified_by_user("verbose")) {
      auto app_config_result = config_sources.json_content("application");
      if (app_config_result.is_ok()) {
        auto app_config = boost::json::value_to<kubeplane::KubeplaneConfig>(
            app_config_result.value());
        if (!app_config.verbose.empty()) {
          cli_ctx.params.verbose = app_config.verbose;
        }
      }
    }
    KUBEPLANE_VERBOSE_LOG("subcommand: " << cli_ctx.params.subcmd
                                         << ", runtime dir: "
                                         << cli_ctx.params.runtime_dir);

    return kubeplane::launch(config_sources, cli_ctx);
  } catch (const std::exception &e) {
    std::cerr << "error catched on main: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
}

int main(int argc, char *argv[]) {
  return RunKubeplaneApplication(argc, argv);
}
