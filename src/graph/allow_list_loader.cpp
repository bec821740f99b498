#include <dnas/graph/allow_list_loader.hpp>
#include <fstream>
#include <stdexcept>

namespace dnas::graph {

using json = nlohmann::json;

//=============================================================================
// Public API - File I/O
//=============================================================================

AllowList AllowListLoader::load_from_file(const std::filesystem::path& file_path) {
    if (!std::filesystem::exists(file_path)) {
        throw std::runtime_error("Allow-list file does not exist: " + file_path.string());
    }

    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open allow-list file: " + file_path.string());
    }

    json j;
    try {
        file >> j;
        return parse_json(j);
    }
    catch (const json::exception& e) {
        throw std::runtime_error("JSON error in " + file_path.string() + ": " + e.what());
    }
}

AllowList AllowListLoader::load_from_string(const std::string& json_string) {
    try {
        return parse_json(json::parse(json_string));
    }
    catch (const json::exception& e) {
        throw std::runtime_error("JSON error: " + std::string(e.what()));
    }
}

void AllowListLoader::save_to_file(const AllowList& allow_list,
                                   const std::filesystem::path& file_path) {
    std::ofstream file(file_path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create allow-list file: " + file_path.string());
    }
    file << to_json(allow_list).dump(2);
}

std::string AllowListLoader::to_json_string(const AllowList& allow_list, bool pretty) {
    json j = to_json(allow_list);
    return pretty ? j.dump(2) : j.dump();
}

//=============================================================================
// JSON Parsing
//=============================================================================

AllowList AllowListLoader::parse_json(const json& j) {
    AllowList list = j.value("extends_defaults", true) ? AllowList::defaults() : AllowList();

    if (j.contains("remove")) {
        for (const auto& entry : j["remove"]) {
            list.remove(operation_kind_from_string(entry.at("op").get<std::string>()),
                        entry.at("target").get<std::string>());
        }
    }

    if (j.contains("entries")) {
        for (const auto& entry : j["entries"]) {
            OperationKind kind = operation_kind_from_string(entry.at("op").get<std::string>());
            if (kind == OperationKind::INPUT || kind == OperationKind::OUTPUT) {
                throw std::runtime_error("Allow-list entries cannot reclassify input or output nodes");
            }
            list.add(kind, entry.at("target").get<std::string>(),
                     node_category_from_string(entry.at("category").get<std::string>()));
        }
    }

    if (j.contains("untouchable")) {
        for (const auto& entry : j["untouchable"]) {
            list.mark_untouchable(operation_kind_from_string(entry.at("op").get<std::string>()),
                                  entry.at("target").get<std::string>());
        }
    }

    return list;
}

json AllowListLoader::to_json(const AllowList& allow_list) {
    json j;
    j["extends_defaults"] = false;
    j["entries"] = json::array();
    for (const auto& [key, category] : allow_list.entries()) {
        j["entries"].push_back({
            {"op", to_string(key.first)},
            {"target", key.second},
            {"category", to_string(category)}
        });
    }
    j["untouchable"] = json::array();
    for (const auto& key : allow_list.untouchable()) {
        j["untouchable"].push_back({{"op", to_string(key.first)}, {"target", key.second}});
    }
    return j;
}

} // namespace dnas::graph
