#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "result_monad.hpp"

namespace kubeplane::storage {

// Byte-oriented store with prefix namespaces. Values are opaque to the store.
class IKeyValueStore {
public:
  using Entry = std::pair<std::string, std::string>; // id, value

  virtual ~IKeyValueStore() = default;

  // All entries whose key starts with `prefix`, ids relative to the prefix.
  virtual monad::MyResult<std::vector<Entry>>
  list_all(const std::string &prefix) = 0;

  // GENERAL::NOT_FOUND when absent.
  virtual monad::MyResult<std::string> get(const std::string &prefix,
                                           const std::string &id) = 0;

  virtual monad::MyVoidResult put(const std::string &prefix,
                                  const std::string &id,
                                  const std::string &value) = 0;

  // GENERAL::NOT_FOUND when absent.
  virtual monad::MyVoidResult remove(const std::string &prefix,
                                     const std::string &id) = 0;

  // Writes `value` only if the current value equals `expected`
  // (std::nullopt: the key must not exist). Ok(false) on mismatch.
  virtual monad::MyResult<bool>
  compare_and_put(const std::string &prefix, const std::string &id,
                  const std::optional<std::string> &expected,
                  const std::string &value) = 0;
};

class InMemoryKeyValueStore : public IKeyValueStore {
public:
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

  std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string> data_;
};

} // namespace kubeplane::storage
