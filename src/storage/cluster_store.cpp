#include "storage/cluster_store.hpp"

#include <fmt/format.h>

#include <boost/json.hpp>

#include "my_error_codes.hpp"

namespace kubeplane::storage {

namespace json = boost::json;

monad::MyResult<model::Cluster> decode_cluster(const std::string &raw) {
  try {
    auto jv = json::parse(raw);
    return monad::MyResult<model::Cluster>::Ok(
        json::value_to<model::Cluster>(jv));
  } catch (const std::exception &e) {
    return monad::MyResult<model::Cluster>::Err(
        monad::make_error(my_errors::JSON::DECODE_ERROR,
                          fmt::format("failed to decode cluster: {}", e.what())));
  }
}

std::string encode_cluster(const model::Cluster &cluster) {
  return json::serialize(json::value_from(cluster));
}

ClusterStore::ClusterStore(IKeyValueStore &store) : store_(store) {}

monad::MyResult<model::Cluster> ClusterStore::get(const std::string &name) {
  auto raw = store_.get(kPrefix, name);
  if (raw.is_err()) {
    auto err = std::move(raw).error();
    if (err.code == my_errors::GENERAL::NOT_FOUND) {
      err.what = fmt::format("cluster {} not found", name);
    }
    return monad::MyResult<model::Cluster>::Err(std::move(err));
  }
  return decode_cluster(raw.value());
}

monad::MyResult<std::vector<model::Cluster>> ClusterStore::list() {
  using ReturnType = monad::MyResult<std::vector<model::Cluster>>;
  auto entries = store_.list_all(kPrefix);
  if (entries.is_err()) {
    return ReturnType::Err(std::move(entries).error());
  }
  std::vector<model::Cluster> clusters;
  for (const auto &[name, raw] : entries.value()) {
    auto cluster = decode_cluster(raw);
    if (cluster.is_err()) {
      return ReturnType::Err(std::move(cluster).error());
    }
    clusters.push_back(std::move(cluster).value());
  }
  return ReturnType::Ok(std::move(clusters));
}

monad::MyVoidResult ClusterStore::create(model::Cluster cluster) {
  if (cluster.name.empty()) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::GENERAL::INVALID_ARGUMENT, "cluster name is empty"));
  }
  cluster.revision = 1;
  auto swapped = store_.compare_and_put(kPrefix, cluster.name, std::nullopt,
                                        encode_cluster(cluster));
  if (swapped.is_err()) {
    return monad::MyVoidResult::Err(std::move(swapped).error());
  }
  if (!swapped.value()) {
    return monad::MyVoidResult::Err(
        monad::make_error(my_errors::GENERAL::INVALID_ARGUMENT,
                          fmt::format("cluster {} already exists", cluster.name)));
  }
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult ClusterStore::remove(const std::string &name) {
  return store_.remove(kPrefix, name);
}

monad::MyResult<model::Cluster> ClusterStore::mutate(const std::string &name,
                                                     const Mutator &fn) {
  using ReturnType = monad::MyResult<model::Cluster>;
  for (int attempt = 0; attempt < kMaxMutateAttempts; ++attempt) {
    auto raw = store_.get(kPrefix, name);
    if (raw.is_err()) {
      return ReturnType::Err(std::move(raw).error());
    }
    auto decoded = decode_cluster(raw.value());
    if (decoded.is_err()) {
      return decoded;
    }
    model::Cluster cluster = std::move(decoded).value();
    if (auto r = fn(cluster); r.is_err()) {
      return ReturnType::Err(std::move(r).error());
    }
    cluster.name = name;
    cluster.revision += 1;
    auto swapped = store_.compare_and_put(kPrefix, name, raw.value(),
                                          encode_cluster(cluster));
    if (swapped.is_err()) {
      return ReturnType::Err(std::move(swapped).error());
    }
    if (swapped.value()) {
      return ReturnType::Ok(std::move(cluster));
    }
  }
  return ReturnType::Err(monad::make_error(
      my_errors::WORKFLOW::CAS_CONFLICT,
      fmt::format("cluster {} changed concurrently {} times, giving up", name,
                  kMaxMutateAttempts)));
}

} // namespace kubeplane::storage
