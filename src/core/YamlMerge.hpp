#pragma once

#include <yaml-cpp/yaml.h>

namespace tvr {

// Returns base with overlay applied on top. Maps merge key by key; any other
// overlay value replaces the base value. A null overlay entry ("key: ~")
// keeps the base value, so user files can list keys without overriding them.
inline YAML::Node mergeYaml(const YAML::Node& base, const YAML::Node& overlay)
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(base);
    if (!base.IsDefined() || base.IsNull() || !base.IsMap() || !overlay.IsMap())
        return YAML::Clone(overlay);

    YAML::Node merged = YAML::Clone(base);
    for (const auto& entry : overlay) {
        const std::string key = entry.first.as<std::string>();
        merged[key] = merged[key] ? mergeYaml(merged[key], entry.second)
                                  : YAML::Clone(entry.second);
    }
    return merged;
}

} // namespace tvr
