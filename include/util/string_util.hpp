#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace kubeplane {
namespace stringutil {

std::string generate_uuid(const std::string& prefix = "", bool no_dash = false);

// `len` lowercase hex characters from the uuid random source.
std::string random_hex(std::size_t len);

// Expands "{name}" placeholders. Unknown names are collected in `missing`
// and left in place; "{{" and "}}" produce literal braces.
template <typename Lookup>
std::string expand_placeholders(std::string_view tmpl, Lookup&& lookup,
                                std::vector<std::string>& missing) {
  std::string out;
  out.reserve(tmpl.size());
  for (size_t i = 0; i < tmpl.size(); ++i) {
    char c = tmpl[i];
    if (c == '{' && i + 1 < tmpl.size() && tmpl[i + 1] == '{') {
      out.push_back('{');
      ++i;
      continue;
    }
    if (c == '}' && i + 1 < tmpl.size() && tmpl[i + 1] == '}') {
      out.push_back('}');
      ++i;
      continue;
    }
    if (c != '{') {
      out.push_back(c);
      continue;
    }
    auto close = tmpl.find('}', i + 1);
    if (close == std::string_view::npos) {
      out.append(tmpl.substr(i));
      break;
    }
    std::string name(tmpl.substr(i + 1, close - i - 1));
    if (auto value = lookup(name)) {
      out.append(*value);
    } else {
      missing.push_back(name);
      out.append(tmpl.substr(i, close - i + 1));
    }
    i = close;
  }
  return out;
}

}  // namespace stringutil
}  // namespace kubeplane
