#include "workflows/step_config.hpp"

#include <stdexcept>
#include <string_view>

namespace kubeplane::workflows {

namespace {

std::string string_field(const json::object &obj, const char *key) {
  if (auto const *p = obj.if_contains(key); p && p->is_string()) {
    return json::value_to<std::string>(*p);
  }
  return {};
}

} // namespace

StepConfig StepConfig::clone_for_node(const model::NodeProfile &profile,
                                      model::Node node) const {
  StepConfig copy = *this;
  if (node.region.empty()) {
    node.region = kube.region;
  }
  if (node.size.empty()) {
    node.size = profile.size;
  }
  node.role = profile.role;
  if (node.provider.empty()) {
    node.provider = std::string(model::to_string(provider));
  }
  copy.node = std::move(node);
  copy.node_profile = profile;
  return copy;
}

std::optional<std::string>
StepConfig::lookup(const std::string &placeholder) const {
  if (placeholder == "cluster_name") {
    return cluster_name;
  }
  if (placeholder == "account_name") {
    return cloud_account_name;
  }
  if (placeholder == "provider") {
    return std::string(model::to_string(provider));
  }
  if (placeholder == "region") {
    if (node && !node->region.empty()) {
      return node->region;
    }
    return kube.region;
  }
  if (placeholder == "node_name") {
    if (node) {
      return node->name;
    }
    return std::nullopt;
  }
  if (placeholder == "node_id") {
    if (node && !node->id.empty()) {
      return node->id;
    }
    return std::nullopt;
  }
  if (placeholder == "k8s_version") {
    return kube.k8s_version;
  }
  if (placeholder == "master_ip") {
    for (const auto &[name, master] : masters) {
      if (!master.private_ip.empty()) {
        return master.private_ip;
      }
    }
    return std::nullopt;
  }

  constexpr std::string_view kProfilePrefix = "profile.";
  constexpr std::string_view kCredentialPrefix = "credential.";
  if (placeholder.rfind(kProfilePrefix, 0) == 0) {
    if (!node_profile) {
      return std::nullopt;
    }
    return node_profile->value(placeholder.substr(kProfilePrefix.size()));
  }
  if (placeholder.rfind(kCredentialPrefix, 0) == 0) {
    auto it = credentials.find(placeholder.substr(kCredentialPrefix.size()));
    if (it == credentials.end()) {
      return std::nullopt;
    }
    return it->second;
  }
  return std::nullopt;
}

StepConfig step_config_from_cluster(const model::Cluster &cluster,
                                    const model::CloudAccount &account) {
  StepConfig config;
  config.cluster_name = cluster.name;
  config.cloud_account_name = account.name;
  config.provider = account.provider;
  config.kube.region = cluster.region;
  config.kube.arch = cluster.arch;
  config.kube.operating_system = cluster.operating_system;
  config.kube.operating_system_version = cluster.operating_system_version;
  config.kube.docker_version = cluster.docker_version;
  config.kube.k8s_version = cluster.k8s_version;
  config.kube.helm_version = cluster.helm_version;
  config.kube.network_type = cluster.networking.type;
  config.kube.cidr = cluster.networking.cidr;
  config.kube.network_version = cluster.networking.version;
  config.kube.rbac_enabled = cluster.rbac_enabled;
  return config;
}

StepConfig tag_invoke(const json::value_to_tag<StepConfig> &,
                      const json::value &jv) {
  auto const *obj = jv.if_object();
  if (!obj) {
    throw std::runtime_error("StepConfig is not an object");
  }
  StepConfig config;
  config.cluster_name = string_field(*obj, "clusterName");
  config.cloud_account_name = string_field(*obj, "cloudAccountName");
  if (auto provider = model::parse_cloud_provider(string_field(*obj, "provider"));
      provider.is_ok()) {
    config.provider = provider.value();
  }
  if (auto const *p = obj->if_contains("kubeProfile"); p && p->is_object()) {
    const auto &kp = p->as_object();
    config.kube.region = string_field(kp, "region");
    config.kube.arch = string_field(kp, "arch");
    config.kube.operating_system = string_field(kp, "operatingSystem");
    config.kube.operating_system_version =
        string_field(kp, "operatingSystemVersion");
    config.kube.docker_version = string_field(kp, "dockerVersion");
    config.kube.k8s_version = string_field(kp, "k8sVersion");
    config.kube.helm_version = string_field(kp, "helmVersion");
    config.kube.network_type = string_field(kp, "networkType");
    config.kube.cidr = string_field(kp, "cidr");
    config.kube.network_version = string_field(kp, "networkVersion");
    if (auto const *rbac = kp.if_contains("rbacEnabled");
        rbac && rbac->is_bool()) {
      config.kube.rbac_enabled = rbac->as_bool();
    }
  }
  if (auto const *p = obj->if_contains("masters"); p && p->is_object()) {
    for (const auto &[name, node_jv] : p->as_object()) {
      config.masters.emplace(std::string(name),
                             json::value_to<model::Node>(node_jv));
    }
  }
  if (auto const *p = obj->if_contains("node"); p && p->is_object()) {
    config.node = json::value_to<model::Node>(*p);
  }
  if (auto const *p = obj->if_contains("nodeProfile"); p && p->is_object()) {
    config.node_profile = json::value_to<model::NodeProfile>(*p);
  }
  if (auto const *p = obj->if_contains("timeoutSeconds"); p && p->is_int64()) {
    config.timeout_seconds = p->as_int64();
  }
  return config;
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const StepConfig &config) {
  json::object o;
  o["clusterName"] = config.cluster_name;
  o["cloudAccountName"] = config.cloud_account_name;
  o["provider"] = model::to_string(config.provider);
  o["kubeProfile"] = json::object{
      {"region", config.kube.region},
      {"arch", config.kube.arch},
      {"operatingSystem", config.kube.operating_system},
      {"operatingSystemVersion", config.kube.operating_system_version},
      {"dockerVersion", config.kube.docker_version},
      {"k8sVersion", config.kube.k8s_version},
      {"helmVersion", config.kube.helm_version},
      {"networkType", config.kube.network_type},
      {"cidr", config.kube.cidr},
      {"networkVersion", config.kube.network_version},
      {"rbacEnabled", config.kube.rbac_enabled}};
  json::object masters;
  for (const auto &[name, master] : config.masters) {
    masters[name] = json::value_from(master);
  }
  o["masters"] = std::move(masters);
  if (config.node) {
    o["node"] = json::value_from(*config.node);
  }
  if (config.node_profile) {
    o["nodeProfile"] = json::value_from(*config.node_profile);
  }
  o["timeoutSeconds"] = config.timeout_seconds;
  jv = std::move(o);
}

} // namespace kubeplane::workflows
