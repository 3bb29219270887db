#pragma once
#include "log_stream.hpp"
#include <boost/json.hpp>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>

#include "json_util.hpp"
#include "my_error_codes.hpp"
#include "result_monad.hpp"
#include "simple_data.hpp"

namespace kubeplane
{
  namespace fs = std::filesystem;
  namespace json = boost::json;

  struct KubeplaneConfig
  {
    std::string verbose{};
    fs::path runtime_dir{};
    fs::path task_logs_dir{}; // empty: <runtime_dir>/logs/tasks
    std::string state_db_file{"kubeplane.db"};
    std::int64_t task_timeout_seconds{600};
    std::int64_t step_timeout_seconds{30};
    int cleanup_max_attempts{3};
    std::int64_t cleanup_retry_delay_ms{500};
    int command_threads{4};

    fs::path resolved_task_logs_dir() const
    {
      if (!task_logs_dir.empty())
        return task_logs_dir;
      return runtime_dir / "logs" / "tasks";
    }

    friend KubeplaneConfig tag_invoke(const json::value_to_tag<KubeplaneConfig> &,
                                      const json::value &jv)
    {
      auto *jo_p = jv.if_object();
      if (!jo_p)
      {
        throw std::runtime_error("KubeplaneConfig is not an object");
      }
      try
      {
        KubeplaneConfig kc{};
        if (auto *p = jo_p->if_contains("verbose"))
          kc.verbose = p->as_string().c_str();
        if (auto *p = jo_p->if_contains("runtime_dir"))
          kc.runtime_dir = fs::path(p->as_string().c_str());
        else
          std::cerr << "runtime_dir not found, using default empty path" << std::endl;
        if (auto *p = jo_p->if_contains("task_logs_dir"))
          kc.task_logs_dir = fs::path(p->as_string().c_str());
        if (auto *p = jo_p->if_contains("state_db_file"))
          kc.state_db_file = p->as_string().c_str();
        if (auto *p = jo_p->if_contains("task_timeout_seconds"))
          kc.task_timeout_seconds = p->to_number<std::int64_t>();
        if (auto *p = jo_p->if_contains("step_timeout_seconds"))
          kc.step_timeout_seconds = p->to_number<std::int64_t>();
        if (auto *p = jo_p->if_contains("cleanup_max_attempts"))
          kc.cleanup_max_attempts = p->to_number<int>();
        if (auto *p = jo_p->if_contains("cleanup_retry_delay_ms"))
          kc.cleanup_retry_delay_ms = p->to_number<std::int64_t>();
        if (auto *p = jo_p->if_contains("command_threads"))
          kc.command_threads = p->to_number<int>();
        if (kc.command_threads < 1)
        {
          std::cerr << "command_threads must be >= 1, using 1" << std::endl;
          kc.command_threads = 1;
        }
        if (kc.cleanup_retry_delay_ms < 0)
          kc.cleanup_retry_delay_ms = 0;
        if (kc.task_timeout_seconds < 0)
          kc.task_timeout_seconds = 0; // no deadline
        if (kc.step_timeout_seconds < 0)
          kc.step_timeout_seconds = 0; // step default
        if (kc.cleanup_max_attempts < 1)
        {
          std::cerr << "cleanup_max_attempts must be >= 1, using 1" << std::endl;
          kc.cleanup_max_attempts = 1;
        }
        return kc;
      }
      catch (const std::exception &ex)
      {
        throw std::runtime_error(std::string("error in parsing KubeplaneConfig: ") + ex.what());
      }
    }
  };

  class IKubeplaneConfigProvider
  {
  public:
    virtual ~IKubeplaneConfigProvider() = default;

    virtual const KubeplaneConfig &get() const = 0;
    virtual KubeplaneConfig &get() = 0;
  };

  class KubeplaneConfigProviderFile : public IKubeplaneConfigProvider
  {
  private:
    KubeplaneConfig config_;
    customio::IOutput &output_;

  public:
    KubeplaneConfigProviderFile(cjj365::AppProperties &app_properties,
                                cjj365::ConfigSources &config_sources,
                                customio::IOutput &output)
        : output_(output)
    {
      if (!config_sources.application_json)
      {
        output_.error() << "Failed to load App config." << std::endl;
        throw std::runtime_error("Failed to load App config.");
      }
      json::value jv = config_sources.application_json.value();
      static const std::map<std::string, std::string> empty_cli_map{};
      jsonutil::substitue_envs(jv, empty_cli_map, app_properties.properties);
      config_ = json::value_to<KubeplaneConfig>(std::move(jv));
    }

    const KubeplaneConfig &get() const override { return config_; }
    KubeplaneConfig &get() override { return config_; }
  };
} // namespace kubeplane
