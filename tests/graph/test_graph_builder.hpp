#pragma once

#include <dnas/graph/graph.hpp>
#include <dnas/graph/module_registry.hpp>
#include <string>
#include <vector>

namespace dnas::graph::test_utils {

// Builds traced graphs node by node for the unit tests
class TestNet {
public:
    ComputationalGraph graph;
    ModuleRegistry modules;

    explicit TestNet(const std::string& name = "test_net") : graph(name) {}

    NodeId input(const std::string& name, const TensorShape& shape) {
        Node* n = graph.add_node(name, OperationKind::INPUT);
        n->shape = shape;
        return n->id;
    }

    NodeId module(const std::string& name, const std::string& type,
                  const std::vector<NodeId>& inputs, const TensorShape& shape) {
        modules.add(name, type);
        return add(name, OperationKind::CALL_MODULE, name, inputs, shape, {});
    }

    NodeId function(const std::string& name, const std::string& target,
                    const std::vector<NodeId>& inputs, const TensorShape& shape,
                    const std::vector<Dim>& args = {}) {
        return add(name, OperationKind::CALL_FUNCTION, target, inputs, shape, args);
    }

    NodeId method(const std::string& name, const std::string& target,
                  const std::vector<NodeId>& inputs, const TensorShape& shape,
                  const std::vector<Dim>& args = {}) {
        return add(name, OperationKind::CALL_METHOD, target, inputs, shape, args);
    }

    NodeId output(const std::vector<NodeId>& inputs) {
        return add("output", OperationKind::OUTPUT, "output", inputs, {}, {});
    }

    Node& operator[](NodeId id) { return graph.node(id); }
    Node& operator[](const std::string& name) { return *graph.find(name); }

private:
    NodeId add(const std::string& name, OperationKind kind, const std::string& target,
               const std::vector<NodeId>& inputs, const TensorShape& shape,
               const std::vector<Dim>& args) {
        Node* n = graph.add_node(name, kind, target);
        for (NodeId in : inputs) {
            graph.add_input(in, n->id);
        }
        if (!shape.empty()) n->shape = shape;
        n->args = args;
        return n->id;
    }
};

} // namespace dnas::graph::test_utils
