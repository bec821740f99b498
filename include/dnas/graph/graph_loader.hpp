#pragma once

#include <dnas/graph/graph.hpp>
#include <dnas/graph/module_registry.hpp>
#include <memory>
#include <string>
#include <vector>

namespace dnas::graph {

// Traced graph together with the modules its CALL_MODULE nodes invoke
struct LoadedGraph {
    std::unique_ptr<ComputationalGraph> graph;
    ModuleRegistry modules;
};

// Graph loader interface
class GraphLoader {
public:
    virtual ~GraphLoader() = default;

    // Load graph from file
    virtual LoadedGraph load(const std::string& filepath) = 0;

    // Get supported file extensions
    virtual std::vector<std::string> supported_extensions() const = 0;
};

/**
 * @brief Loads a traced forward graph from JSON
 *
 * Expected layout:
 * @code
 * {
 *   "name": "toy",
 *   "modules": { "conv0": { "type": "Conv2d", "attributes": { "out_channels": 16 } } },
 *   "nodes": [
 *     { "name": "x", "op": "placeholder", "shape": [1, 3, 32, 32] },
 *     { "name": "conv0", "op": "call_module", "target": "conv0", "inputs": ["x"],
 *       "shape": [1, 16, 32, 32] },
 *     { "name": "flat", "op": "call_function", "target": "torch.flatten",
 *       "inputs": ["conv0"], "args": [1], "kwargs": { "end_dim": -1 } },
 *     { "name": "output", "op": "output", "inputs": ["flat"] }
 *   ]
 * }
 * @endcode
 * Nodes must be listed after their inputs. Shapes are the output of an
 * external shape-inference step.
 */
class JSONGraphLoader : public GraphLoader {
public:
    LoadedGraph load(const std::string& filepath) override;
    std::vector<std::string> supported_extensions() const override {
        return {".json"};
    }

    LoadedGraph load_from_string(const std::string& json_string);
};

// Factory function to get appropriate loader
std::unique_ptr<GraphLoader> create_graph_loader(const std::string& filepath);

// Convenience function to load graph
LoadedGraph load_graph(const std::string& filepath);

} // namespace dnas::graph
