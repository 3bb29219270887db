#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <boost/json.hpp>

namespace kubeplane::model {

namespace json = boost::json;

enum class NodeRole { Master, Node };

inline std::string_view to_string(NodeRole role) {
  return role == NodeRole::Master ? "master" : "node";
}

inline std::optional<NodeRole> parse_node_role(std::string_view value) {
  if (value == "master") {
    return NodeRole::Master;
  }
  if (value == "node" || value == "worker") {
    return NodeRole::Node;
  }
  return std::nullopt;
}

struct Node {
  std::string id;   // provider side identifier, empty until provisioned
  std::string name;
  NodeRole role{NodeRole::Node};
  std::string region;
  std::string size;
  std::string public_ip;
  std::string private_ip;
  std::string state;
  std::string provider;
  std::int64_t created_at{}; // epoch seconds
};

// Machine shape requested for a node that does not exist yet.
struct NodeProfile {
  NodeRole role{NodeRole::Node};
  std::string size;
  std::string image;
  std::map<std::string, std::string> extra;

  // Lookup used by command templates ({profile.<key>}).
  std::optional<std::string> value(const std::string &key) const {
    if (key == "role") {
      return std::string(to_string(role));
    }
    if (key == "size") {
      return size.empty() ? std::nullopt : std::optional<std::string>(size);
    }
    if (key == "image") {
      return image.empty() ? std::nullopt : std::optional<std::string>(image);
    }
    if (auto it = extra.find(key); it != extra.end()) {
      return it->second;
    }
    return std::nullopt;
  }
};

inline Node tag_invoke(const json::value_to_tag<Node> &,
                       const json::value &jv) {
  Node node{};
  if (auto const *obj = jv.if_object()) {
    auto str = [obj](const char *key) -> std::string {
      if (auto const *p = obj->if_contains(key); p && p->is_string()) {
        return json::value_to<std::string>(*p);
      }
      return {};
    };
    node.id = str("id");
    node.name = str("name");
    node.region = str("region");
    node.size = str("size");
    node.public_ip = str("publicIp");
    node.private_ip = str("privateIp");
    node.state = str("state");
    node.provider = str("provider");
    if (auto role = parse_node_role(str("role"))) {
      node.role = *role;
    }
    if (auto const *p = obj->if_contains("createdAt"); p && p->is_int64()) {
      node.created_at = p->as_int64();
    }
  }
  return node;
}

inline void tag_invoke(const json::value_from_tag &, json::value &jv,
                       const Node &node) {
  json::object o;
  o["id"] = node.id;
  o["name"] = node.name;
  o["role"] = to_string(node.role);
  o["region"] = node.region;
  o["size"] = node.size;
  o["publicIp"] = node.public_ip;
  o["privateIp"] = node.private_ip;
  o["state"] = node.state;
  o["provider"] = node.provider;
  o["createdAt"] = node.created_at;
  jv = std::move(o);
}

inline NodeProfile tag_invoke(const json::value_to_tag<NodeProfile> &,
                              const json::value &jv) {
  NodeProfile profile{};
  if (auto const *obj = jv.if_object()) {
    for (const auto &[key, value] : *obj) {
      if (!value.is_string()) {
        continue;
      }
      std::string text = json::value_to<std::string>(value);
      if (key == "role") {
        if (auto role = parse_node_role(text)) {
          profile.role = *role;
        }
      } else if (key == "size") {
        profile.size = std::move(text);
      } else if (key == "image") {
        profile.image = std::move(text);
      } else {
        profile.extra.emplace(std::string(key), std::move(text));
      }
    }
  }
  return profile;
}

inline void tag_invoke(const json::value_from_tag &, json::value &jv,
                       const NodeProfile &profile) {
  json::object o;
  for (const auto &[key, value] : profile.extra) {
    o[key] = value;
  }
  o["role"] = to_string(profile.role);
  if (!profile.size.empty()) {
    o["size"] = profile.size;
  }
  if (!profile.image.empty()) {
    o["image"] = profile.image;
  }
  jv = std::move(o);
}

} // namespace kubeplane::model
