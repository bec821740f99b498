#include <dnas/graph/graph_loader.hpp>
#include <fstream>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace dnas::graph {

using json = nlohmann::json;

namespace {

TensorShape parse_shape(const std::string& node_name, const json& j) {
    TensorShape shape;
    for (Dim extent : j.get<std::vector<Dim>>()) {
        if (extent <= 0) {
            throw std::runtime_error("Node '" + node_name + "' has a non-positive extent (" +
                                     std::to_string(extent) + ") in its shape");
        }
        shape.push_back(static_cast<Size>(extent));
    }
    return shape;
}

LoadedGraph parse_graph(const json& j) {
    LoadedGraph loaded;
    loaded.graph = std::make_unique<ComputationalGraph>(j.value("name", "graph"));

    // Parse modules
    if (j.contains("modules")) {
        for (const auto& [name, module_json] : j["modules"].items()) {
            ModuleInfo info;
            info.name = name;
            info.type = module_json.at("type").get<std::string>();
            if (module_json.contains("attributes")) {
                for (const auto& [key, value] : module_json["attributes"].items()) {
                    if (value.is_number_integer()) {
                        info.attributes[key] = value.get<Dim>();
                    }
                }
            }
            loaded.modules.add(info);
        }
    }

    // Parse nodes
    if (!j.contains("nodes") || !j["nodes"].is_array()) {
        throw std::runtime_error("Graph description has no 'nodes' array");
    }
    auto& graph = *loaded.graph;
    for (const auto& node_json : j["nodes"]) {
        std::string name = node_json.at("name").get<std::string>();
        OperationKind kind = operation_kind_from_string(node_json.at("op").get<std::string>());
        Node* n = graph.add_node(name, kind, node_json.value("target", std::string()));

        if (kind == OperationKind::CALL_MODULE && !loaded.modules.find(n->target)) {
            throw std::runtime_error("Node '" + name + "' calls unknown module '" +
                                     n->target + "'");
        }

        // Add inputs
        if (node_json.contains("inputs")) {
            for (const auto& input : node_json["inputs"]) {
                const Node* src = graph.find(input.get<std::string>());
                if (!src) {
                    throw std::runtime_error("Node '" + name + "' references undefined input '" +
                                             input.get<std::string>() + "'");
                }
                graph.add_input(src->id, n->id);
            }
        }

        if (node_json.contains("shape")) {
            n->shape = parse_shape(name, node_json["shape"]);
        }
        if (node_json.contains("args")) {
            n->args = node_json["args"].get<std::vector<Dim>>();
        }
        if (node_json.contains("kwargs")) {
            for (const auto& [key, value] : node_json["kwargs"].items()) {
                if (value.is_number_integer()) {
                    n->set_kwarg(key, value.get<Dim>());
                }
            }
        }
    }

    graph.validate();
    return loaded;
}

} // namespace

// ============================================================================
// JSONGraphLoader Implementation
// ============================================================================

LoadedGraph JSONGraphLoader::load(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + filepath);
    }

    json j;
    try {
        file >> j;
        return parse_graph(j);
    }
    catch (const json::exception& e) {
        throw std::runtime_error("Invalid graph description in " + filepath + ": " + e.what());
    }
}

LoadedGraph JSONGraphLoader::load_from_string(const std::string& json_string) {
    try {
        return parse_graph(json::parse(json_string));
    }
    catch (const json::exception& e) {
        throw std::runtime_error("Invalid graph description: " + std::string(e.what()));
    }
}

// ============================================================================
// Factory Functions
// ============================================================================

std::unique_ptr<GraphLoader> create_graph_loader(const std::string& filepath) {
    // Determine loader based on file extension
    std::string ext;
    size_t dot_pos = filepath.find_last_of('.');
    if (dot_pos != std::string::npos) {
        ext = filepath.substr(dot_pos);
    }

    if (ext == ".json") {
        return std::make_unique<JSONGraphLoader>();
    }

    throw std::runtime_error("Unsupported file format: " + ext);
}

LoadedGraph load_graph(const std::string& filepath) {
    auto loader = create_graph_loader(filepath);
    return loader->load(filepath);
}

} // namespace dnas::graph
