#include "accounts/account_getter.hpp"

#include <fmt/format.h>

#include <boost/json.hpp>
#include <stdexcept>

#include "json_util.hpp"
#include "my_error_codes.hpp"

namespace kubeplane::accounts {

namespace json = boost::json;

namespace {
monad::MyResult<model::CloudAccount>
find_account(const std::map<std::string, model::CloudAccount> &accounts,
             const std::string &name) {
  auto it = accounts.find(name);
  if (it == accounts.end()) {
    return monad::MyResult<model::CloudAccount>::Err(
        monad::make_error(my_errors::GENERAL::NOT_FOUND,
                          fmt::format("cloud account {} not found", name)));
  }
  return monad::MyResult<model::CloudAccount>::Ok(it->second);
}
} // namespace

ConfigAccountGetter::ConfigAccountGetter(
    cjj365::AppProperties &app_properties,
    cjj365::ConfigSources &config_sources, customio::IOutput &output) {
  auto result = config_sources.json_content("cloud_accounts");
  if (result.is_err()) {
    output.debug() << "cloud_accounts.json not found; no cloud accounts"
                   << std::endl;
    return;
  }
  auto jv = result.value();
  jsonutil::substitue_envs(jv, config_sources.cli_overrides(),
                           app_properties.properties);

  const json::array *entries = nullptr;
  if (auto *obj = jv.if_object()) {
    if (auto *p = obj->if_contains("accounts")) {
      entries = p->if_array();
    }
  } else {
    entries = jv.if_array();
  }
  if (!entries) {
    throw std::runtime_error(
        "cloud_accounts.json must hold an \"accounts\" array");
  }
  for (const auto &entry : *entries) {
    auto account = json::value_to<model::CloudAccount>(entry);
    if (account.name.empty()) {
      throw std::runtime_error("cloud account without a name");
    }
    auto name = account.name;
    if (!accounts_.emplace(name, std::move(account)).second) {
      output.warning() << "duplicate cloud account " << name
                       << " ignored" << std::endl;
    }
  }
}

monad::MyResult<model::CloudAccount>
ConfigAccountGetter::get(const std::string &name) {
  return find_account(accounts_, name);
}

std::vector<std::string> ConfigAccountGetter::names() const {
  std::vector<std::string> out;
  for (const auto &[name, account] : accounts_) {
    out.push_back(name);
  }
  return out;
}

StaticAccountGetter::StaticAccountGetter(
    std::vector<model::CloudAccount> accounts) {
  for (auto &account : accounts) {
    add(std::move(account));
  }
}

void StaticAccountGetter::add(model::CloudAccount account) {
  auto name = account.name;
  accounts_[name] = std::move(account);
}

monad::MyResult<model::CloudAccount>
StaticAccountGetter::get(const std::string &name) {
  return find_account(accounts_, name);
}

const std::vector<std::string> &
required_credential_keys(model::CloudProvider provider) {
  static const std::vector<std::string> kDigitalOcean{"access_token"};
  static const std::vector<std::string> kAws{"access_key", "secret_key"};
  static const std::vector<std::string> kGce{"service_account_file"};
  static const std::vector<std::string> kAzure{"client_id", "client_secret",
                                               "subscription_id", "tenant_id"};
  static const std::vector<std::string> kOpenStack{"username", "password",
                                                   "auth_url"};
  static const std::vector<std::string> kPacket{"api_token"};
  switch (provider) {
  case model::CloudProvider::DigitalOcean:
    return kDigitalOcean;
  case model::CloudProvider::AWS:
    return kAws;
  case model::CloudProvider::GCE:
    return kGce;
  case model::CloudProvider::Azure:
    return kAzure;
  case model::CloudProvider::OpenStack:
    return kOpenStack;
  case model::CloudProvider::Packet:
    return kPacket;
  }
  return kDigitalOcean;
}

monad::MyVoidResult
fill_cloud_account_credentials(const model::CloudAccount &account,
                               workflows::StepConfig &config) {
  std::vector<std::string> missing;
  for (const auto &key : required_credential_keys(account.provider)) {
    auto it = account.credentials.find(key);
    if (it == account.credentials.end() || it->second.empty()) {
      missing.push_back(key);
    }
  }
  if (!missing.empty()) {
    std::string keys;
    for (const auto &k : missing) {
      keys += keys.empty() ? k : ", " + k;
    }
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::WORKFLOW::VALIDATION_FAILED,
        fmt::format("cloud account {} ({}) is missing credentials: {}",
                    account.name, model::to_string(account.provider), keys)));
  }
  config.cloud_account_name = account.name;
  config.provider = account.provider;
  config.credentials = account.credentials;
  return monad::MyVoidResult::Ok();
}

} // namespace kubeplane::accounts
