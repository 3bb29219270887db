#pragma once

#include <map>
#include <string>
#include <vector>

#include "customio/console_output.hpp"
#include "log_stream.hpp"
#include "model/cluster.hpp"
#include "result_monad.hpp"
#include "simple_data.hpp"
#include "workflows/step_config.hpp"

namespace kubeplane::accounts {

class IAccountGetter {
public:
  virtual ~IAccountGetter() = default;
  // GENERAL::NOT_FOUND for an unknown account name.
  virtual monad::MyResult<model::CloudAccount>
  get(const std::string &name) = 0;
};

// Accounts from cloud_accounts.json:
//
//   {"accounts": [{"name": "do-main", "provider": "digitalocean",
//                  "credentials": {"access_token": "${DO_TOKEN}"}}]}
//
// A missing file means no accounts.
class ConfigAccountGetter : public IAccountGetter {
public:
  ConfigAccountGetter(cjj365::AppProperties &app_properties,
                      cjj365::ConfigSources &config_sources,
                      customio::IOutput &output);

  monad::MyResult<model::CloudAccount> get(const std::string &name) override;

  std::vector<std::string> names() const;

private:
  std::map<std::string, model::CloudAccount> accounts_;
};

// In-process accounts, for embedding and tests.
class StaticAccountGetter : public IAccountGetter {
public:
  StaticAccountGetter() = default;
  explicit StaticAccountGetter(std::vector<model::CloudAccount> accounts);

  void add(model::CloudAccount account);
  monad::MyResult<model::CloudAccount> get(const std::string &name) override;

private:
  std::map<std::string, model::CloudAccount> accounts_;
};

// Credential keys each provider requires.
const std::vector<std::string> &
required_credential_keys(model::CloudProvider provider);

// Copies the account credentials into `config` after checking that every
// key the provider needs is present and non-empty (VALIDATION_FAILED
// otherwise). Also sets the account name and provider on the config.
monad::MyVoidResult
fill_cloud_account_credentials(const model::CloudAccount &account,
                               workflows::StepConfig &config);

} // namespace kubeplane::accounts
