#include "util/string_util.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <mutex>
#include <algorithm>

namespace kubeplane {
namespace stringutil {

namespace {
std::mutex& generator_mutex() {
  static std::mutex m;
  return m;
}

boost::uuids::uuid next_uuid() {
  // random_generator is not thread safe.
  static boost::uuids::random_generator generator;
  std::lock_guard<std::mutex> lock(generator_mutex());
  return generator();
}
}  // namespace

std::string generate_uuid(const std::string& prefix, bool no_dash) {
  std::string v = boost::uuids::to_string(next_uuid());
  if (no_dash) {
    v.erase(std::remove(v.begin(), v.end(), '-'), v.end());
  }
  return prefix + v;
}

std::string random_hex(std::size_t len) {
  std::string out;
  while (out.size() < len) {
    out += generate_uuid("", true);
  }
  out.resize(len);
  return out;
}

}  // namespace stringutil
}  // namespace kubeplane
