#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include <boost/json.hpp>

#include "model/cloud_provider.hpp"
#include "model/cluster.hpp"
#include "model/node.hpp"

namespace kubeplane::workflows {

namespace json = boost::json;

// Cluster-wide machine settings copied out of a model::Cluster.
struct KubeProfile {
  std::string region;
  std::string arch;
  std::string operating_system;
  std::string operating_system_version;
  std::string docker_version;
  std::string k8s_version;
  std::string helm_version;
  std::string network_type;
  std::string cidr;
  std::string network_version;
  bool rbac_enabled{false};
};

// Everything a step needs to act on a cluster. Tasks own a value copy, so a
// running task never sees later edits of the source cluster.
//
// `credentials` are resolved secrets. They travel with the in-memory copy
// handed to steps but are never written to the task store.
struct StepConfig {
  std::string cluster_name;
  std::string cloud_account_name;
  model::CloudProvider provider{model::CloudProvider::DigitalOcean};
  std::map<std::string, std::string> credentials;
  KubeProfile kube;
  std::map<std::string, model::Node> masters;
  std::optional<model::Node> node;
  std::optional<model::NodeProfile> node_profile;
  std::int64_t timeout_seconds{0};

  void add_master(const model::Node &master) { masters[master.name] = master; }

  // Copy of this config scoped to a single node.
  StepConfig clone_for_node(const model::NodeProfile &profile,
                            model::Node node) const;

  // Resolves a template placeholder such as "cluster_name", "node_name",
  // "profile.size" or "credential.access_token".
  std::optional<std::string> lookup(const std::string &placeholder) const;
};

StepConfig step_config_from_cluster(const model::Cluster &cluster,
                                    const model::CloudAccount &account);

StepConfig tag_invoke(const json::value_to_tag<StepConfig> &,
                      const json::value &jv);

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const StepConfig &config);

} // namespace kubeplane::workflows
