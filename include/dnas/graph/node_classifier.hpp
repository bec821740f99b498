/**
 * @file node_classifier.hpp
 * @brief Side-effect free predicates mapping a node to its semantic category
 *
 * Features-defining ops (convolution, linear) set the number of output
 * features from their own configuration; features-propagating ops (ReLU,
 * batch norm) output as many features as they receive. Shared-input ops
 * (add, sub) need the same number of features on every input. Flatten and
 * squeeze may fold spatial dimensions into the channel dimension, and channel
 * concatenation sums its inputs.
 */

#pragma once

#include <dnas/graph/allow_list.hpp>
#include <dnas/graph/graph.hpp>
#include <dnas/graph/module_registry.hpp>

namespace dnas::graph {

class NodeClassifier {
public:
    NodeClassifier(const ComputationalGraph& graph,
                   const ModuleRegistry& modules,
                   const AllowList& allow_list)
        : graph_(graph), modules_(modules), allow_list_(allow_list) {}

    bool is_features_defining(const Node& n) const;
    bool is_features_propagating(const Node& n) const;
    bool is_shared_input_features_op(const Node& n) const;
    bool is_flatten(const Node& n) const;
    bool is_squeeze(const Node& n) const;
    bool is_features_concatenate(const Node& n) const;
    bool is_untouchable(const Node& n) const;
    bool is_zero_or_one_input(const Node& n) const;

    /// Evaluate all eight predicates
    NodeProperties properties(const Node& n) const;

    /**
     * @brief The single category of a node
     * @throws UnsupportedNodeError if no predicate matches
     */
    NodeCategory classify(const Node& n) const;

private:
    const ComputationalGraph& graph_;
    const ModuleRegistry& modules_;
    const AllowList& allow_list_;

    // Allow-list category; none for input and output nodes
    std::optional<NodeCategory> listed(const Node& n) const;

    // torch.cat along dim 1; a negative dim needs the first input's shape
    bool concatenates_channels(const Node& n) const;
};

} // namespace dnas::graph
