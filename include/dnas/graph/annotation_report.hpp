#pragma once

#include <dnas/graph/graph.hpp>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace dnas::graph {

/**
 * @brief Export of the pass results for downstream tooling
 *
 * Per node: name, op, target, category, flags, features and the names of
 * the node(s) setting its input features. Fields a pass has not written yet
 * are omitted.
 */
class AnnotationReport {
public:
    static nlohmann::json to_json(const ComputationalGraph& graph);
    static std::string to_json_string(const ComputationalGraph& graph, bool pretty = true);
    static void save_to_file(const ComputationalGraph& graph, const std::filesystem::path& file_path);

    // Table of categories, features and back-references on std::cout
    static void print(const ComputationalGraph& graph);
};

} // namespace dnas::graph
