#pragma once

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

#include <boost/json.hpp>

#include "model/cloud_provider.hpp"
#include "model/node.hpp"

namespace kubeplane::model {

namespace json = boost::json;

struct Networking {
  std::string type;    // flannel, calico...
  std::string cidr;
  std::string version;
};

// Persisted under the "/kube/" prefix. `revision` is bumped by ClusterStore
// on every successful mutation.
struct Cluster {
  std::string name;
  std::string account_name;
  std::string region;
  std::string arch;
  std::string operating_system;
  std::string operating_system_version;
  std::string docker_version;
  std::string k8s_version;
  std::string helm_version;
  Networking networking;
  bool rbac_enabled{false};
  std::map<std::string, Node> masters;
  std::map<std::string, Node> nodes;
  std::int64_t revision{0};

  bool has_node(const std::string &node_name) const {
    return masters.count(node_name) > 0 || nodes.count(node_name) > 0;
  }
  bool is_master(const std::string &node_name) const {
    return masters.count(node_name) > 0;
  }
};

struct CloudAccount {
  std::string name;
  CloudProvider provider{CloudProvider::DigitalOcean};
  std::map<std::string, std::string> credentials;
};

namespace detail {
inline std::string string_field(const json::object &obj, const char *key) {
  if (auto const *p = obj.if_contains(key); p && p->is_string()) {
    return json::value_to<std::string>(*p);
  }
  return {};
}

inline std::map<std::string, Node> node_map(const json::object &obj,
                                            const char *key) {
  std::map<std::string, Node> out;
  if (auto const *p = obj.if_contains(key); p && p->is_object()) {
    for (const auto &[name, node_jv] : p->as_object()) {
      auto node = json::value_to<Node>(node_jv);
      if (node.name.empty()) {
        node.name = std::string(name);
      }
      out.emplace(std::string(name), std::move(node));
    }
  }
  return out;
}

inline json::object node_map_to_json(const std::map<std::string, Node> &nodes) {
  json::object o;
  for (const auto &[name, node] : nodes) {
    o[name] = json::value_from(node);
  }
  return o;
}
} // namespace detail

inline Cluster tag_invoke(const json::value_to_tag<Cluster> &,
                          const json::value &jv) {
  Cluster cluster{};
  auto const *obj = jv.if_object();
  if (!obj) {
    throw std::runtime_error("Cluster is not an object");
  }
  cluster.name = detail::string_field(*obj, "name");
  cluster.account_name = detail::string_field(*obj, "accountName");
  cluster.region = detail::string_field(*obj, "region");
  cluster.arch = detail::string_field(*obj, "arch");
  cluster.operating_system = detail::string_field(*obj, "operatingSystem");
  cluster.operating_system_version =
      detail::string_field(*obj, "operatingSystemVersion");
  cluster.docker_version = detail::string_field(*obj, "dockerVersion");
  cluster.k8s_version = detail::string_field(*obj, "k8sVersion");
  cluster.helm_version = detail::string_field(*obj, "helmVersion");
  if (auto const *p = obj->if_contains("networking"); p && p->is_object()) {
    const auto &net = p->as_object();
    cluster.networking.type = detail::string_field(net, "type");
    cluster.networking.cidr = detail::string_field(net, "cidr");
    cluster.networking.version = detail::string_field(net, "version");
  }
  if (auto const *p = obj->if_contains("rbacEnabled"); p && p->is_bool()) {
    cluster.rbac_enabled = p->as_bool();
  }
  cluster.masters = detail::node_map(*obj, "masters");
  cluster.nodes = detail::node_map(*obj, "nodes");
  if (auto const *p = obj->if_contains("revision"); p && p->is_int64()) {
    cluster.revision = p->as_int64();
  }
  return cluster;
}

inline void tag_invoke(const json::value_from_tag &, json::value &jv,
                       const Cluster &cluster) {
  json::object o;
  o["name"] = cluster.name;
  o["accountName"] = cluster.account_name;
  o["region"] = cluster.region;
  o["arch"] = cluster.arch;
  o["operatingSystem"] = cluster.operating_system;
  o["operatingSystemVersion"] = cluster.operating_system_version;
  o["dockerVersion"] = cluster.docker_version;
  o["k8sVersion"] = cluster.k8s_version;
  o["helmVersion"] = cluster.helm_version;
  o["networking"] = json::object{{"type", cluster.networking.type},
                                 {"cidr", cluster.networking.cidr},
                                 {"version", cluster.networking.version}};
  o["rbacEnabled"] = cluster.rbac_enabled;
  o["masters"] = detail::node_map_to_json(cluster.masters);
  o["nodes"] = detail::node_map_to_json(cluster.nodes);
  o["revision"] = cluster.revision;
  jv = std::move(o);
}

inline CloudAccount tag_invoke(const json::value_to_tag<CloudAccount> &,
                               const json::value &jv) {
  auto const *obj = jv.if_object();
  if (!obj) {
    throw std::runtime_error("CloudAccount is not an object");
  }
  CloudAccount account{};
  account.name = detail::string_field(*obj, "name");
  auto provider = parse_cloud_provider(detail::string_field(*obj, "provider"));
  if (provider.is_err()) {
    throw std::runtime_error(provider.error().what);
  }
  account.provider = provider.value();
  if (auto const *p = obj->if_contains("credentials"); p && p->is_object()) {
    for (const auto &[key, value] : p->as_object()) {
      if (value.is_string()) {
        account.credentials.emplace(std::string(key),
                                    json::value_to<std::string>(value));
      }
    }
  }
  return account;
}

} // namespace kubeplane::model
