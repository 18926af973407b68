#include "engine/registry.hpp"

#include <algorithm>

namespace im::engine {

auto NodeTypeInfo::accepts_input(std::string_view handle) const -> bool {
  if (handle.empty() || open_inputs) {
    return true;
  }
  return std::find(inputs.begin(), inputs.end(), handle) != inputs.end();
}

auto NodeTypeInfo::provides_output(std::string_view handle) const -> bool {
  if (handle.empty() || open_outputs) {
    return true;
  }
  return std::find(outputs.begin(), outputs.end(), handle) != outputs.end();
}

auto NodeRegistry::register_type(NodeTypeInfo info, std::shared_ptr<NodeExecutor> executor) -> void {
  auto name = info.type;
  entries_[std::move(name)] = Entry{std::move(info), std::move(executor)};
}

auto NodeRegistry::find(std::string_view type) const -> const Entry* {
  auto it = entries_.find(std::string(type));
  if (it == entries_.end()) {
    return nullptr;
  }
  return &it->second;
}

auto NodeRegistry::types() const -> std::vector<std::string> {
  std::vector<std::string> names;
  names.reserve(entries_.size());
  for (const auto& [name, entry] : entries_) {
    names.push_back(name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

}  // namespace im::engine
