#include <dnas/graph/annotation_report.hpp>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace dnas::graph {

using json = nlohmann::json;

namespace {

json flags_to_json(const NodeProperties& p) {
    return {
        {"features_propagating", p.features_propagating},
        {"features_defining", p.features_defining},
        {"shared_input_features", p.shared_input_features},
        {"flatten", p.flatten},
        {"squeeze", p.squeeze},
        {"features_concatenate", p.features_concatenate},
        {"untouchable", p.untouchable},
        {"zero_or_one_input", p.zero_or_one_input}
    };
}

std::string back_reference_names(const ComputationalGraph& graph, const InputFeaturesSetBy& ref) {
    std::string out = ref.concatenated ? "[" : "";
    for (size_t i = 0; i < ref.nodes.size(); ++i) {
        if (i > 0) out += ", ";
        out += graph.node(ref.nodes[i]).name;
    }
    if (ref.concatenated) out += "]";
    return out;
}

} // namespace

json AnnotationReport::to_json(const ComputationalGraph& graph) {
    json j;
    j["name"] = graph.name;
    j["nodes"] = json::array();

    for (NodeId id = 0; id < graph.size(); ++id) {
        const Node& n = graph.node(id);
        json node_json = {
            {"name", n.name},
            {"op", to_string(n.kind)},
            {"target", n.target}
        };
        if (n.properties) {
            if (auto category = n.properties->category()) {
                node_json["category"] = to_string(*category);
            }
            node_json["flags"] = flags_to_json(*n.properties);
        }
        if (n.features_calculator) {
            node_json["features"] = n.features_calculator->features();
            node_json["calculator"] = to_string(n.features_calculator->kind());
        }
        if (n.input_features_set_by) {
            json names = json::array();
            for (NodeId setter : n.input_features_set_by->nodes) {
                names.push_back(graph.node(setter).name);
            }
            node_json["input_features_set_by"] = names;
            node_json["input_features_concatenated"] = n.input_features_set_by->concatenated;
        }
        j["nodes"].push_back(node_json);
    }
    return j;
}

std::string AnnotationReport::to_json_string(const ComputationalGraph& graph, bool pretty) {
    json j = to_json(graph);
    return pretty ? j.dump(2) : j.dump();
}

void AnnotationReport::save_to_file(const ComputationalGraph& graph,
                                    const std::filesystem::path& file_path) {
    std::ofstream file(file_path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create report file: " + file_path.string());
    }
    file << to_json(graph).dump(2);
}

void AnnotationReport::print(const ComputationalGraph& graph) {
    std::cout << "\n" << std::string(78, '=') << "\n";
    std::cout << "Feature propagation for " << graph.name << "\n";
    std::cout << std::string(78, '=') << "\n";
    std::cout << std::left << std::setw(20) << "Node"
              << std::setw(24) << "Category"
              << std::setw(10) << "Features"
              << "Input features set by\n";
    std::cout << std::string(78, '-') << "\n";

    for (NodeId id = 0; id < graph.size(); ++id) {
        const Node& n = graph.node(id);
        std::string category = "-";
        if (n.properties && n.properties->category()) {
            category = to_string(*n.properties->category());
            if (n.properties->untouchable) category += "*";
        }
        std::string features = n.features_calculator
            ? std::to_string(n.features_calculator->features()) : "-";
        std::string setters = n.input_features_set_by
            ? back_reference_names(graph, *n.input_features_set_by) : "-";

        std::cout << std::left << std::setw(20) << n.name
                  << std::setw(24) << category
                  << std::setw(10) << features
                  << setters << "\n";
    }
    std::cout << std::right;
}

} // namespace dnas::graph
