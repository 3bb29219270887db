#pragma once

#include <functional>
#include <string>
#include <vector>

#include "model/cluster.hpp"
#include "result_monad.hpp"
#include "storage/key_value_store.hpp"

namespace kubeplane::storage {

// Clusters persisted as JSON under "/kube/<name>". Writes go through
// compare_and_put so concurrent mutations of the same cluster never lose an
// update.
class ClusterStore {
public:
  static constexpr const char *kPrefix = "/kube/";
  static constexpr int kMaxMutateAttempts = 8;

  // Returns an error to abort the mutation without writing.
  using Mutator = std::function<monad::MyVoidResult(model::Cluster &)>;

  explicit ClusterStore(IKeyValueStore &store);

  monad::MyResult<model::Cluster> get(const std::string &name);
  monad::MyResult<std::vector<model::Cluster>> list();

  // GENERAL::INVALID_ARGUMENT when a cluster of that name exists.
  monad::MyVoidResult create(model::Cluster cluster);
  monad::MyVoidResult remove(const std::string &name);

  // Read-modify-write with revision bump. Retries on concurrent writers,
  // WORKFLOW::CAS_CONFLICT once kMaxMutateAttempts is exhausted.
  monad::MyResult<model::Cluster> mutate(const std::string &name,
                                         const Mutator &fn);

private:
  IKeyValueStore &store_;
};

monad::MyResult<model::Cluster> decode_cluster(const std::string &raw);
std::string encode_cluster(const model::Cluster &cluster);

} // namespace kubeplane::storage
