#include "storage/key_value_store.hpp"

#include "my_error_codes.hpp"

namespace kubeplane::storage {

monad::MyResult<std::vector<IKeyValueStore::Entry>>
InMemoryKeyValueStore::list_all(const std::string &prefix) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Entry> out;
  for (auto it = data_.lower_bound(prefix);
       it != data_.end() && it->first.compare(0, prefix.size(), prefix) == 0;
       ++it) {
    out.emplace_back(it->first.substr(prefix.size()), it->second);
  }
  return monad::MyResult<std::vector<Entry>>::Ok(std::move(out));
}

monad::MyResult<std::string>
InMemoryKeyValueStore::get(const std::string &prefix, const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = data_.find(prefix + id);
  if (it == data_.end()) {
    return monad::MyResult<std::string>::Err(monad::make_error(
        my_errors::GENERAL::NOT_FOUND, "key " + prefix + id + " not found"));
  }
  return monad::MyResult<std::string>::Ok(it->second);
}

monad::MyVoidResult InMemoryKeyValueStore::put(const std::string &prefix,
                                               const std::string &id,
                                               const std::string &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  data_[prefix + id] = value;
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult InMemoryKeyValueStore::remove(const std::string &prefix,
                                                  const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (data_.erase(prefix + id) == 0) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::GENERAL::NOT_FOUND, "key " + prefix + id + " not found"));
  }
  return monad::MyVoidResult::Ok();
}

monad::MyResult<bool> InMemoryKeyValueStore::compare_and_put(
    const std::string &prefix, const std::string &id,
    const std::optional<std::string> &expected, const std::string &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto key = prefix + id;
  auto it = data_.find(key);
  const bool matches = expected ? (it != data_.end() && it->second == *expected)
                                : it == data_.end();
  if (!matches) {
    return monad::MyResult<bool>::Ok(false);
  }
  data_[key] = value;
  return monad::MyResult<bool>::Ok(true);
}

std::size_t InMemoryKeyValueStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return data_.size();
}

} // namespace kubeplane::storage
