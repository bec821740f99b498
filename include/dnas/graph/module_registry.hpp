#pragma once

#include <dnas/concepts.hpp>
#include <string>
#include <unordered_map>
#include <optional>

namespace dnas::graph {

// Layer instance referenced by CALL_MODULE nodes
struct ModuleInfo {
    std::string name;       // qualified name, e.g. "features.conv0"
    std::string type;       // concrete layer type, e.g. "Conv2d"
    std::unordered_map<std::string, Dim> attributes;  // e.g. out_channels

    std::optional<Dim> attribute(const std::string& key) const {
        auto it = attributes.find(key);
        if (it == attributes.end()) return std::nullopt;
        return it->second;
    }
};

/**
 * @brief Resolves CALL_MODULE targets to their concrete layer types
 */
class ModuleRegistry {
public:
    void add(const ModuleInfo& info) {
        modules_[info.name] = info;
    }

    void add(const std::string& name, const std::string& type) {
        add(ModuleInfo{name, type, {}});
    }

    const ModuleInfo* find(const std::string& name) const {
        auto it = modules_.find(name);
        return (it != modules_.end()) ? &it->second : nullptr;
    }

    // Layer type of a module, empty if unknown
    std::string type_of(const std::string& name) const {
        const ModuleInfo* info = find(name);
        return info ? info->type : std::string();
    }

    size_t size() const { return modules_.size(); }

    const std::unordered_map<std::string, ModuleInfo>& modules() const { return modules_; }

private:
    std::unordered_map<std::string, ModuleInfo> modules_;
};

} // namespace dnas::graph
