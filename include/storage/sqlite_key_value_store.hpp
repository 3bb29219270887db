#pragma once

#include <filesystem>
#include <functional> // IWYU pragma: keep
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "conf/kubeplane_config.hpp"
#include "customio/console_output.hpp"
#include "storage/key_value_store.hpp"

struct sqlite3;

namespace kubeplane::storage {

// Single kv_store table in <runtime_dir>/state/<state_db_file>, opened lazily
// on first use. All calls are serialized on one connection.
class SqliteKeyValueStore : public IKeyValueStore {
public:
  SqliteKeyValueStore(IKubeplaneConfigProvider &config_provider,
                      customio::ConsoleOutput &output);
  ~SqliteKeyValueStore() override;

  monad::MyResult<std::vector<Entry>>
  list_all(const std::string &prefix) override;
  monad::MyResult<std::string> get(const std::string &prefix,
                                   const std::string &id) override;
  monad::MyVoidResult put(const std::string &prefix, const std::string &id,
                          const std::string &value) override;
  monad::MyVoidResult remove(const std::string &prefix,
                             const std::string &id) override;
  monad::MyResult<bool>
  compare_and_put(const std::string &prefix, const std::string &id,
                  const std::optional<std::string> &expected,
                  const std::string &value) override;

  bool available() const;
  std::filesystem::path db_path() const;

private:
  bool ensure_initialized() const;
  void close_db() const;

  std::optional<std::string> read_value(const std::string &key,
                                        std::optional<std::string> &out) const;
  std::optional<std::string> upsert_value(const std::string &key,
                                          const std::string &value) const;
  std::optional<std::string> erase_value(const std::string &key,
                                         bool &erased) const;

  std::optional<std::string>
  with_transaction(const std::function<std::optional<std::string>()> &body) const;

  IKubeplaneConfigProvider &config_provider_;
  customio::ConsoleOutput &output_;
  mutable std::mutex mutex_;
  mutable std::filesystem::path db_path_;
  mutable sqlite3 *db_{nullptr};
  mutable bool initialized_{false};
};

} // namespace kubeplane::storage
