// json_model/document/key_path.cpp - Key path implementation
#include "json_model/document/key_path.hpp"

#include <utility>

namespace json_model
{

std::optional<KeyPath> KeyPath::parse(std::string_view dotted)
{
  if (dotted.empty()) {
    return std::nullopt;
  }

  std::vector<std::string> components;
  size_t start = 0;
  while (true) {
    const size_t sep = dotted.find(k_key_path_separator, start);
    if (sep == std::string_view::npos) {
      components.emplace_back(dotted.substr(start));
      break;
    }
    components.emplace_back(dotted.substr(start, sep - start));
    start = sep + 1;
  }

  return KeyPath(std::move(components));
}

std::string KeyPath::prefix_string(size_t count) const
{
  std::string out;
  for (size_t i = 0; i < count && i < components_.size(); ++i) {
    if (i > 0) {
      out += k_key_path_separator;
    }
    out += components_[i];
  }
  return out;
}

std::optional<KeyPath> resolve_key_path(
  const KeyPathTable & table, const std::string & property_key)
{
  const auto it = table.find(property_key);
  if (it == table.end()) {
    return std::nullopt;
  }
  return KeyPath::parse(it->second);
}

}  // namespace json_model
