#include <dnas/graph/graph.hpp>
#include <dnas/graph/errors.hpp>
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace dnas::graph {

// ============================================================================
// Enum conversions
// ============================================================================

std::string to_string(OperationKind kind) {
    switch (kind) {
    case OperationKind::INPUT:         return "placeholder";
    case OperationKind::OUTPUT:        return "output";
    case OperationKind::CALL_MODULE:   return "call_module";
    case OperationKind::CALL_FUNCTION: return "call_function";
    case OperationKind::CALL_METHOD:   return "call_method";
    }
    return "unknown";
}

OperationKind operation_kind_from_string(const std::string& op) {
    if (op == "placeholder" || op == "input") return OperationKind::INPUT;
    if (op == "output") return OperationKind::OUTPUT;
    if (op == "call_module") return OperationKind::CALL_MODULE;
    if (op == "call_function") return OperationKind::CALL_FUNCTION;
    if (op == "call_method") return OperationKind::CALL_METHOD;
    throw std::runtime_error("Unknown operation kind: " + op);
}

std::string to_string(NodeCategory category) {
    switch (category) {
    case NodeCategory::FEATURES_DEFINING:     return "features_defining";
    case NodeCategory::FEATURES_PROPAGATING:  return "features_propagating";
    case NodeCategory::SHARED_INPUT_FEATURES: return "shared_input_features";
    case NodeCategory::FLATTEN:               return "flatten";
    case NodeCategory::SQUEEZE:               return "squeeze";
    case NodeCategory::FEATURES_CONCATENATE:  return "features_concatenate";
    }
    return "unknown";
}

NodeCategory node_category_from_string(const std::string& name) {
    if (name == "features_defining") return NodeCategory::FEATURES_DEFINING;
    if (name == "features_propagating") return NodeCategory::FEATURES_PROPAGATING;
    if (name == "shared_input_features") return NodeCategory::SHARED_INPUT_FEATURES;
    if (name == "flatten") return NodeCategory::FLATTEN;
    if (name == "squeeze") return NodeCategory::SQUEEZE;
    if (name == "features_concatenate") return NodeCategory::FEATURES_CONCATENATE;
    throw std::runtime_error("Unknown node category: " + name);
}

std::optional<NodeCategory> NodeProperties::category() const {
    if (flatten) return NodeCategory::FLATTEN;
    if (squeeze) return NodeCategory::SQUEEZE;
    if (features_concatenate) return NodeCategory::FEATURES_CONCATENATE;
    if (shared_input_features) return NodeCategory::SHARED_INPUT_FEATURES;
    if (features_defining) return NodeCategory::FEATURES_DEFINING;
    if (features_propagating) return NodeCategory::FEATURES_PROPAGATING;
    return std::nullopt;
}

// ============================================================================
// ComputationalGraph Implementation
// ============================================================================

Node* ComputationalGraph::add_node(const std::string& node_name, OperationKind kind,
                                   const std::string& target) {
    if (by_name_.count(node_name)) {
        throw MalformedGraphError("Duplicate node name '" + node_name + "'");
    }
    NodeId id = nodes_.size();
    nodes_.push_back(std::make_unique<Node>(id, node_name, kind, target));
    by_name_[node_name] = id;
    return nodes_.back().get();
}

void ComputationalGraph::add_edge(NodeId from, NodeId to) {
    if (from >= nodes_.size() || to >= nodes_.size()) {
        throw MalformedGraphError("Edge references a node outside the graph");
    }
    auto& inputs = nodes_[to]->inputs;
    if (std::find(inputs.begin(), inputs.end(), from) != inputs.end()) {
        return;
    }
    inputs.push_back(from);
    nodes_[from]->users.push_back(to);
}

void ComputationalGraph::add_input(NodeId from, NodeId to) {
    add_edge(from, to);
    nodes_[to]->tensor_inputs.push_back(from);
}

Node* ComputationalGraph::find(const std::string& node_name) {
    auto it = by_name_.find(node_name);
    return (it != by_name_.end()) ? nodes_[it->second].get() : nullptr;
}

const Node* ComputationalGraph::find(const std::string& node_name) const {
    auto it = by_name_.find(node_name);
    return (it != by_name_.end()) ? nodes_[it->second].get() : nullptr;
}

std::vector<NodeId> ComputationalGraph::input_nodes() const {
    std::vector<NodeId> result;
    for (const auto& n : nodes_) {
        if (!n->inputs.empty()) continue;
        if (!n->is_input()) {
            throw MalformedGraphError("Node '" + n->name + "' (op: " + to_string(n->kind) +
                                      ") has no predecessors");
        }
        result.push_back(n->id);
    }
    return result;
}

std::vector<NodeId> ComputationalGraph::output_nodes() const {
    std::vector<NodeId> result;
    for (const auto& n : nodes_) {
        if (n->kind == OperationKind::OUTPUT) {
            result.push_back(n->id);
        }
    }
    return result;
}

const TensorShape& ComputationalGraph::input_shape(NodeId id) const {
    const Node& n = node(id);
    if (n.inputs.empty()) {
        throw std::runtime_error("Node '" + n.name + "' has no input");
    }
    const Node& prev = node(n.inputs.front());
    if (!prev.shape) {
        throw std::runtime_error("Node '" + prev.name + "' has no shape metadata "
                                 "(run shape inference first)");
    }
    return *prev.shape;
}

void ComputationalGraph::validate() const {
    for (const auto& n : nodes_) {
        if (n->is_input() && !n->inputs.empty()) {
            throw MalformedGraphError("Input node '" + n->name + "' has predecessors");
        }
    }
    // Throws for non-input nodes without predecessors
    input_nodes();
}

void ComputationalGraph::clear_annotations() {
    for (auto& n : nodes_) {
        n->clear_annotations();
    }
}

void ComputationalGraph::print() const {
    std::cout << "Graph: " << name << "\n";
    std::cout << "Nodes (" << nodes_.size() << "):\n";
    for (const auto& n : nodes_) {
        std::cout << "  " << n->name << " (op=" << to_string(n->kind);
        if (!n->target.empty()) std::cout << ", target=" << n->target;
        std::cout << ")\n";
        std::cout << "    inputs: ";
        for (NodeId in : n->inputs) std::cout << nodes_[in]->name << " ";
        if (n->shape) {
            std::cout << "\n    shape: [";
            for (size_t i = 0; i < n->shape->size(); ++i) {
                if (i > 0) std::cout << ", ";
                std::cout << (*n->shape)[i];
            }
            std::cout << "]";
        }
        std::cout << "\n";
    }
}

} // namespace dnas::graph
