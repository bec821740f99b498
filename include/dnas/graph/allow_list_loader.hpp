#pragma once

#include <dnas/graph/allow_list.hpp>
#include <string>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace dnas::graph {

/**
 * @brief Loads allow-list configurations from JSON files
 *
 * @code
 * {
 *   "extends_defaults": true,
 *   "entries": [
 *     { "op": "call_module", "target": "PITConv1d", "category": "features_defining" }
 *   ],
 *   "remove": [ { "op": "call_module", "target": "Dropout" } ],
 *   "untouchable": [ { "op": "call_function", "target": "F.conv3d" } ]
 * }
 * @endcode
 */
class AllowListLoader {
public:
    /**
     * @brief Load allow-list from JSON file
     * @param file_path Path to JSON configuration file
     * @return AllowList object
     * @throws std::runtime_error if file cannot be read or JSON is invalid
     */
    static AllowList load_from_file(const std::filesystem::path& file_path);

    /**
     * @brief Load allow-list from JSON string
     * @throws std::runtime_error if JSON is invalid
     */
    static AllowList load_from_string(const std::string& json_string);

    /**
     * @brief Save allow-list table to JSON file
     * @throws std::runtime_error if file cannot be written
     */
    static void save_to_file(const AllowList& allow_list, const std::filesystem::path& file_path);

    /// Convert allow-list table to JSON string (classifier rules are not serialized)
    static std::string to_json_string(const AllowList& allow_list, bool pretty = true);

private:
    static AllowList parse_json(const nlohmann::json& j);
    static nlohmann::json to_json(const AllowList& allow_list);
};

} // namespace dnas::graph
