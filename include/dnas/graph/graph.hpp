#pragma once

#include <dnas/concepts.hpp>
#include <dnas/graph/features_calculator.hpp>
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <unordered_map>

namespace dnas::graph {

// Operation kinds of a traced forward graph
enum class OperationKind {
    INPUT,          // Network input (placeholder)
    OUTPUT,         // Network output
    CALL_MODULE,    // Invocation of a registered layer, target = module name
    CALL_FUNCTION,  // Free function, e.g. "torch.cat"
    CALL_METHOD     // Tensor method, e.g. "flatten"
};

std::string to_string(OperationKind kind);
OperationKind operation_kind_from_string(const std::string& op);

// Semantic categories; exactly one applies to every annotated node
enum class NodeCategory {
    FEATURES_DEFINING,
    FEATURES_PROPAGATING,
    SHARED_INPUT_FEATURES,
    FLATTEN,
    SQUEEZE,
    FEATURES_CONCATENATE
};

std::string to_string(NodeCategory category);
NodeCategory node_category_from_string(const std::string& name);

// Static shape written by the shape-inference collaborator (dim 0 = batch, dim 1 = channels)
using TensorShape = std::vector<Size>;

/**
 * @brief Classification flags written by the annotation pass
 */
struct NodeProperties {
    bool features_propagating = false;
    bool features_defining = false;
    bool shared_input_features = false;
    bool flatten = false;
    bool squeeze = false;
    bool features_concatenate = false;
    bool untouchable = false;
    bool zero_or_one_input = false;

    /// Category selected by the flags, in the precedence used by propagation
    std::optional<NodeCategory> category() const;
};

/**
 * @brief Node(s) that set the number of input features of a node
 *
 * A single node in general; the ordered list of inputs for a channel
 * concatenation.
 */
struct InputFeaturesSetBy {
    std::vector<NodeId> nodes;
    bool concatenated = false;

    static InputFeaturesSetBy single(NodeId id) { return {{id}, false}; }
    static InputFeaturesSetBy list(std::vector<NodeId> ids) { return {std::move(ids), true}; }

    NodeId node() const { return nodes.front(); }
    bool operator==(const InputFeaturesSetBy& other) const = default;
};

// Operation node in a forward computation graph
class Node {
public:
    NodeId id;
    std::string name;
    OperationKind kind;
    std::string target;
    std::vector<NodeId> inputs;     // ordered predecessors, each stored once
    std::vector<NodeId> users;      // ordered successors

    // Tensor arguments in call order, repeats kept: cat([a, a]) -> {a, a}
    std::vector<NodeId> tensor_inputs;

    // Non-tensor arguments, e.g. flatten(x, 1) -> args = {1}
    std::vector<Dim> args;
    std::unordered_map<std::string, Dim> kwargs;

    std::optional<TensorShape> shape;

    // Derived state, one record per pass
    std::optional<NodeProperties> properties;
    FeaturesCalculatorPtr features_calculator;
    std::optional<InputFeaturesSetBy> input_features_set_by;

    Node(NodeId id, const std::string& name, OperationKind kind, const std::string& target)
        : id(id), name(name), kind(kind), target(target) {}

    /**
     * @brief Look up a non-tensor argument, first by position then by keyword
     *
     * @param index Position among the non-tensor positional arguments
     * @param key Keyword name
     * @return The argument value, or std::nullopt when absent
     */
    std::optional<Dim> arg(size_t index, const std::string& key) const {
        if (args.size() > index) return args[index];
        auto it = kwargs.find(key);
        if (it != kwargs.end()) return it->second;
        return std::nullopt;
    }

    Dim arg_or(size_t index, const std::string& key, Dim default_value) const {
        return arg(index, key).value_or(default_value);
    }

    void set_kwarg(const std::string& key, Dim value) {
        kwargs[key] = value;
    }

    // Tensor arguments, or the predecessors when none were recorded
    const std::vector<NodeId>& arguments() const {
        return tensor_inputs.empty() ? inputs : tensor_inputs;
    }

    bool is_input() const { return kind == OperationKind::INPUT; }

    // Clear the state written by the passes
    void clear_annotations() {
        properties.reset();
        features_calculator.reset();
        input_features_set_by.reset();
    }
};

/**
 * @brief Forward computation graph of a network
 *
 * Owns its nodes; nodes refer to each other by NodeId. The graph must stay
 * static and acyclic while the annotation passes run.
 */
class ComputationalGraph {
public:
    std::string name;

    ComputationalGraph() = default;
    ComputationalGraph(const std::string& name) : name(name) {}

    // Add a node; its id is its insertion index
    Node* add_node(const std::string& name, OperationKind kind, const std::string& target = "");

    // Add edge from -> to. A repeated edge is ignored.
    void add_edge(NodeId from, NodeId to);

    // Pass `from` as the next tensor argument of `to`; adds the edge
    void add_input(NodeId from, NodeId to);

    Node& node(NodeId id) { return *nodes_.at(id); }
    const Node& node(NodeId id) const { return *nodes_.at(id); }

    // Find node by name (nullptr if absent)
    Node* find(const std::string& name);
    const Node* find(const std::string& name) const;

    size_t size() const { return nodes_.size(); }

    const std::vector<NodeId>& predecessors(NodeId id) const { return node(id).inputs; }
    const std::vector<NodeId>& successors(NodeId id) const { return node(id).users; }

    /**
     * @brief Nodes without predecessors, in insertion order
     * @throws MalformedGraphError if one of them is not an input node
     */
    std::vector<NodeId> input_nodes() const;

    // Nodes of kind OUTPUT
    std::vector<NodeId> output_nodes() const;

    /**
     * @brief Shape flowing into a node (shape of its first predecessor)
     * @throws std::runtime_error when the node has no predecessor or the
     *         predecessor carries no shape
     */
    const TensorShape& input_shape(NodeId id) const;

    // Check structural invariants (throws MalformedGraphError)
    void validate() const;

    // Drop every annotation written by the passes
    void clear_annotations();

    // Print graph for debugging
    void print() const;

private:
    std::vector<std::unique_ptr<Node>> nodes_;
    std::unordered_map<std::string, NodeId> by_name_;
};

} // namespace dnas::graph
