#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "my_error_codes.hpp"
#include "storage/cluster_store.hpp"
#include "storage/key_value_store.hpp"

using kubeplane::model::Cluster;
using kubeplane::model::Node;
using kubeplane::model::NodeRole;
using kubeplane::storage::ClusterStore;

namespace {

Cluster sample_cluster(const std::string &name) {
  Cluster cluster;
  cluster.name = name;
  cluster.account_name = "do-main";
  cluster.region = "fra1";
  cluster.k8s_version = "1.14.1";
  Node master;
  master.name = name + "-master-1";
  master.role = NodeRole::Master;
  cluster.masters[master.name] = master;
  return cluster;
}

} // namespace

TEST(ClusterStoreTest, CreateThenGet) {
  kubeplane::storage::InMemoryKeyValueStore kv;
  ClusterStore store(kv);
  ASSERT_TRUE(store.create(sample_cluster("alpha")).is_ok());

  auto loaded = store.get("alpha");
  ASSERT_TRUE(loaded.is_ok()) << loaded.error().what;
  EXPECT_EQ(loaded.value().account_name, "do-main");
  EXPECT_EQ(loaded.value().revision, 1);
  EXPECT_TRUE(loaded.value().is_master("alpha-master-1"));
  EXPECT_TRUE(kv.get(ClusterStore::kPrefix, "alpha").is_ok());
}

TEST(ClusterStoreTest, DuplicateCreateIsRejected) {
  kubeplane::storage::InMemoryKeyValueStore kv;
  ClusterStore store(kv);
  ASSERT_TRUE(store.create(sample_cluster("alpha")).is_ok());
  auto again = store.create(sample_cluster("alpha"));
  ASSERT_TRUE(again.is_err());
  EXPECT_EQ(again.error().code, my_errors::GENERAL::INVALID_ARGUMENT);

  auto unnamed = store.create(Cluster{});
  EXPECT_TRUE(unnamed.is_err());
}

TEST(ClusterStoreTest, MissingClusterIsNotFound) {
  kubeplane::storage::InMemoryKeyValueStore kv;
  ClusterStore store(kv);
  auto r = store.get("ghost");
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::GENERAL::NOT_FOUND);
  EXPECT_EQ(r.error().what, "cluster ghost not found");

  auto m = store.mutate("ghost", [](Cluster &) {
    return monad::MyVoidResult::Ok();
  });
  EXPECT_TRUE(m.is_err());
}

TEST(ClusterStoreTest, MutateBumpsRevision) {
  kubeplane::storage::InMemoryKeyValueStore kv;
  ClusterStore store(kv);
  store.create(sample_cluster("alpha"));

  auto updated = store.mutate("alpha", [](Cluster &c) {
    Node worker;
    worker.name = "alpha-node-1";
    c.nodes[worker.name] = worker;
    return monad::MyVoidResult::Ok();
  });
  ASSERT_TRUE(updated.is_ok());
  EXPECT_EQ(updated.value().revision, 2);
  EXPECT_TRUE(store.get("alpha").value().has_node("alpha-node-1"));
}

TEST(ClusterStoreTest, MutatorErrorLeavesRecordAlone) {
  kubeplane::storage::InMemoryKeyValueStore kv;
  ClusterStore store(kv);
  store.create(sample_cluster("alpha"));

  auto r = store.mutate("alpha", [](Cluster &c) {
    c.region = "nyc1";
    return monad::MyVoidResult::Err(
        monad::make_error(my_errors::GENERAL::INVALID_ARGUMENT, "refused"));
  });
  ASSERT_TRUE(r.is_err());
  auto stored = store.get("alpha").value();
  EXPECT_EQ(stored.region, "fra1");
  EXPECT_EQ(stored.revision, 1);
}

TEST(ClusterStoreTest, ConcurrentMutationsKeepEveryUpdate) {
  kubeplane::storage::InMemoryKeyValueStore kv;
  ClusterStore store(kv);
  store.create(sample_cluster("alpha"));

  constexpr int kWriters = 4;
  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kWriters; ++i) {
    threads.emplace_back([&store, &failures, i]() {
      auto r = store.mutate("alpha", [i](Cluster &c) {
        Node worker;
        worker.name = "alpha-node-" + std::to_string(i);
        c.nodes[worker.name] = worker;
        return monad::MyVoidResult::Ok();
      });
      if (r.is_err()) {
        ++failures;
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }

  auto stored = store.get("alpha").value();
  EXPECT_EQ(static_cast<int>(stored.nodes.size()) + failures.load(), kWriters);
  EXPECT_EQ(stored.revision, 1 + static_cast<std::int64_t>(stored.nodes.size()));
}

TEST(ClusterStoreTest, ListAndRemove) {
  kubeplane::storage::InMemoryKeyValueStore kv;
  ClusterStore store(kv);
  store.create(sample_cluster("alpha"));
  store.create(sample_cluster("beta"));

  auto all = store.list();
  ASSERT_TRUE(all.is_ok());
  EXPECT_EQ(all.value().size(), 2u);

  ASSERT_TRUE(store.remove("alpha").is_ok());
  EXPECT_EQ(store.list().value().size(), 1u);
  EXPECT_TRUE(store.remove("alpha").is_err());
}
