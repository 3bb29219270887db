#include <gtest/gtest.h>

#include <fstream>
#include <memory>
#include <optional>
#include <string>

#include "conf/kubeplane_config.hpp"
#include "customio/console_output.hpp"
#include "log_stream.hpp"
#include "my_error_codes.hpp"
#include "storage/key_value_store.hpp"
#include "storage/sqlite_key_value_store.hpp"
#include "test_config_utils.hpp"

using kubeplane::storage::IKeyValueStore;
using kubeplane::storage::InMemoryKeyValueStore;
using kubeplane::storage::SqliteKeyValueStore;

namespace {

class FixedConfigProvider : public kubeplane::IKubeplaneConfigProvider {
public:
  explicit FixedConfigProvider(kubeplane::KubeplaneConfig config)
      : config_(std::move(config)) {}
  const kubeplane::KubeplaneConfig &get() const override { return config_; }
  kubeplane::KubeplaneConfig &get() override { return config_; }

private:
  kubeplane::KubeplaneConfig config_;
};

void check_prefix_isolation(IKeyValueStore &store) {
  ASSERT_TRUE(store.put("/tasks/", "a", "1").is_ok());
  ASSERT_TRUE(store.put("/tasks/", "b", "2").is_ok());
  ASSERT_TRUE(store.put("/kube/", "a", "cluster").is_ok());

  auto tasks = store.list_all("/tasks/");
  ASSERT_TRUE(tasks.is_ok());
  ASSERT_EQ(tasks.value().size(), 2u);
  EXPECT_EQ(tasks.value()[0].first, "a");
  EXPECT_EQ(tasks.value()[0].second, "1");
  EXPECT_EQ(tasks.value()[1].first, "b");

  auto kube = store.get("/kube/", "a");
  ASSERT_TRUE(kube.is_ok());
  EXPECT_EQ(kube.value(), "cluster");

  auto empty = store.list_all("/nothing/");
  ASSERT_TRUE(empty.is_ok());
  EXPECT_TRUE(empty.value().empty());
}

void check_get_and_remove(IKeyValueStore &store) {
  auto missing = store.get("/tasks/", "ghost");
  ASSERT_TRUE(missing.is_err());
  EXPECT_EQ(missing.error().code, my_errors::GENERAL::NOT_FOUND);

  ASSERT_TRUE(store.put("/tasks/", "x", "v1").is_ok());
  ASSERT_TRUE(store.put("/tasks/", "x", "v2").is_ok());
  EXPECT_EQ(store.get("/tasks/", "x").value(), "v2");

  ASSERT_TRUE(store.remove("/tasks/", "x").is_ok());
  EXPECT_TRUE(store.get("/tasks/", "x").is_err());
  auto again = store.remove("/tasks/", "x");
  ASSERT_TRUE(again.is_err());
  EXPECT_EQ(again.error().code, my_errors::GENERAL::NOT_FOUND);
}

void check_compare_and_put(IKeyValueStore &store) {
  auto created = store.compare_and_put("/kube/", "c1", std::nullopt, "r1");
  ASSERT_TRUE(created.is_ok());
  EXPECT_TRUE(created.value());

  auto exists = store.compare_and_put("/kube/", "c1", std::nullopt, "other");
  ASSERT_TRUE(exists.is_ok());
  EXPECT_FALSE(exists.value());

  auto stale = store.compare_and_put("/kube/", "c1", std::string("r0"), "r2");
  ASSERT_TRUE(stale.is_ok());
  EXPECT_FALSE(stale.value());
  EXPECT_EQ(store.get("/kube/", "c1").value(), "r1");

  auto fresh = store.compare_and_put("/kube/", "c1", std::string("r1"), "r2");
  ASSERT_TRUE(fresh.is_ok());
  EXPECT_TRUE(fresh.value());
  EXPECT_EQ(store.get("/kube/", "c1").value(), "r2");

  auto absent = store.compare_and_put("/kube/", "c9", std::string("r1"), "x");
  ASSERT_TRUE(absent.is_ok());
  EXPECT_FALSE(absent.value());
}

void check_embedded_nul(IKeyValueStore &store) {
  const std::string value("a\0b", 3);
  ASSERT_TRUE(store.put("/tasks/", "nul", value).is_ok());

  auto got = store.get("/tasks/", "nul");
  ASSERT_TRUE(got.is_ok());
  EXPECT_EQ(got.value().size(), 3u);
  EXPECT_EQ(got.value(), value);

  auto listed = store.list_all("/tasks/");
  ASSERT_TRUE(listed.is_ok());
  ASSERT_EQ(listed.value().size(), 1u);
  EXPECT_EQ(listed.value()[0].second, value);
}

} // namespace

TEST(InMemoryKeyValueStoreTest, PrefixIsolation) {
  InMemoryKeyValueStore store;
  check_prefix_isolation(store);
  EXPECT_EQ(store.size(), 3u);
}

TEST(InMemoryKeyValueStoreTest, GetAndRemove) {
  InMemoryKeyValueStore store;
  check_get_and_remove(store);
}

TEST(InMemoryKeyValueStoreTest, CompareAndPut) {
  InMemoryKeyValueStore store;
  check_compare_and_put(store);
}

TEST(InMemoryKeyValueStoreTest, EmbeddedNulIsKept) {
  InMemoryKeyValueStore store;
  check_embedded_nul(store);
}

class SqliteKeyValueStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    runtime_dir_ = testinfra::make_temp_dir("kubeplane-sqlite");
    kubeplane::KubeplaneConfig config;
    config.runtime_dir = runtime_dir_;
    config.state_db_file = "test.db";
    provider_ = std::make_unique<FixedConfigProvider>(config);
    output_backend_ = std::make_unique<customio::ConsoleOutputWithColor>(
        testinfra::test_log_level());
    output_ = std::make_unique<customio::ConsoleOutput>(*output_backend_);
    store_ = std::make_unique<SqliteKeyValueStore>(*provider_, *output_);
  }

  void TearDown() override {
    store_.reset();
    std::error_code ec;
    std::filesystem::remove_all(runtime_dir_, ec);
  }

  std::filesystem::path runtime_dir_;
  std::unique_ptr<FixedConfigProvider> provider_;
  std::unique_ptr<customio::ConsoleOutputWithColor> output_backend_;
  std::unique_ptr<customio::ConsoleOutput> output_;
  std::unique_ptr<SqliteKeyValueStore> store_;
};

TEST_F(SqliteKeyValueStoreTest, OpensUnderStateDir) {
  ASSERT_TRUE(store_->available());
  EXPECT_EQ(store_->db_path(), runtime_dir_ / "state" / "test.db");
  EXPECT_TRUE(std::filesystem::exists(store_->db_path()));
}

TEST_F(SqliteKeyValueStoreTest, PrefixIsolation) {
  check_prefix_isolation(*store_);
}

TEST_F(SqliteKeyValueStoreTest, GetAndRemove) { check_get_and_remove(*store_); }

TEST_F(SqliteKeyValueStoreTest, CompareAndPut) {
  check_compare_and_put(*store_);
}

TEST_F(SqliteKeyValueStoreTest, EmbeddedNulIsKept) {
  check_embedded_nul(*store_);
}

TEST_F(SqliteKeyValueStoreTest, ValuesSurviveReopen) {
  ASSERT_TRUE(store_->put("/tasks/", "keep", "{\"id\":\"keep\"}").is_ok());
  store_.reset();
  store_ = std::make_unique<SqliteKeyValueStore>(*provider_, *output_);
  auto value = store_->get("/tasks/", "keep");
  ASSERT_TRUE(value.is_ok()) << value.error().what;
  EXPECT_EQ(value.value(), "{\"id\":\"keep\"}");
}

TEST_F(SqliteKeyValueStoreTest, UnwritableLocationIsUnavailable) {
  // A regular file where the state directory should be.
  auto blocker = runtime_dir_ / "blocked";
  {
    std::ofstream ofs(blocker);
    ofs << "x";
  }
  kubeplane::KubeplaneConfig config;
  config.runtime_dir = blocker;
  FixedConfigProvider provider(config);
  SqliteKeyValueStore store(provider, *output_);
  EXPECT_FALSE(store.available());
  auto r = store.put("/tasks/", "a", "b");
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::WORKFLOW::STORAGE_UNAVAILABLE);
}
