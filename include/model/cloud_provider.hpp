#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <string_view>

#include "my_error_codes.hpp"
#include "result_monad.hpp"

namespace kubeplane::model {

enum class CloudProvider { AWS, DigitalOcean, GCE, Azure, OpenStack, Packet };

inline constexpr std::array<CloudProvider, 6> kAllCloudProviders{
    CloudProvider::AWS,   CloudProvider::DigitalOcean, CloudProvider::GCE,
    CloudProvider::Azure, CloudProvider::OpenStack,    CloudProvider::Packet};

inline std::string_view to_string(CloudProvider provider) {
  switch (provider) {
  case CloudProvider::AWS:
    return "aws";
  case CloudProvider::DigitalOcean:
    return "digitalocean";
  case CloudProvider::GCE:
    return "gce";
  case CloudProvider::Azure:
    return "azure";
  case CloudProvider::OpenStack:
    return "openstack";
  case CloudProvider::Packet:
    return "packet";
  }
  return "unknown";
}

// Case-insensitive; accepts the names produced by to_string.
inline monad::MyResult<CloudProvider>
parse_cloud_provider(std::string_view name) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  for (auto provider : kAllCloudProviders) {
    if (to_string(provider) == lowered) {
      return monad::MyResult<CloudProvider>::Ok(provider);
    }
  }
  return monad::MyResult<CloudProvider>::Err(
      monad::make_error(my_errors::WORKFLOW::VALIDATION_FAILED,
                        "unknown cloud provider '" + std::string(name) + "'"));
}

} // namespace kubeplane::model
