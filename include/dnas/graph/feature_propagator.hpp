/**
 * @file feature_propagator.hpp
 * @brief Annotation, features-calculator and input-features passes
 *
 * The three passes must run in order on a static, acyclic graph whose nodes
 * already carry shape metadata:
 *
 *   annotate()                  -> Node::properties
 *   propagate_features()        -> Node::features_calculator
 *   associate_input_features()  -> Node::input_features_set_by
 *
 * Every pass starts from the input nodes and walks the graph forward with a
 * FIFO work queue. A cyclic graph never terminates.
 */

#pragma once

#include <dnas/graph/allow_list.hpp>
#include <dnas/graph/features_calculator.hpp>
#include <dnas/graph/graph.hpp>
#include <dnas/graph/module_registry.hpp>
#include <functional>
#include <string>
#include <vector>

namespace dnas::graph {

/**
 * @brief Method-specific calculator builder tried before the built-in rules
 *
 * A search method registers rules for the layers it replaces, e.g. a masked
 * convolution whose output features depend on its learned channel mask.
 * `matches` may be left empty; a `build` returning nullptr has no opinion.
 */
struct ExtensionRule {
    std::string name;
    std::function<bool(const Node&, const ModuleRegistry&)> matches;
    std::function<FeaturesCalculatorPtr(const Node&, const ComputationalGraph&,
                                        const ModuleRegistry&)> build;
};

class FeaturePropagator {
public:
    explicit FeaturePropagator(const ModuleRegistry& modules,
                               AllowList allow_list = AllowList::defaults())
        : modules_(modules), allow_list_(std::move(allow_list)), verbose_(false) {}

    void add_rule(ExtensionRule rule) { rules_.push_back(std::move(rule)); }
    size_t rule_count() const { return rules_.size(); }

    void set_verbose(bool verbose) { verbose_ = verbose; }
    bool verbose() const { return verbose_; }

    const AllowList& allow_list() const { return allow_list_; }

    /**
     * @brief Write classification flags into every reachable node
     * @throws UnsupportedNodeError for a node no predicate matches
     */
    void annotate(ComputationalGraph& graph) const;

    /**
     * @brief Attach a features calculator to every reachable node
     *
     * A node whose predecessors are not all done is pushed back at the tail
     * of the queue.
     *
     * @throws UnsupportedNodeError, InvalidReshapeError
     * @throws std::runtime_error if a features-defining node has no shape, or
     *         a shape disagreeing with its layer's out_channels / out_features
     */
    void propagate_features(ComputationalGraph& graph) const;

    /**
     * @brief Record which node(s) set the input features of every node
     *
     * A node whose predecessors are not ready yet is skipped without error;
     * it is visited again when a predecessor resolves.
     */
    void associate_input_features(ComputationalGraph& graph) const;

    /// validate() followed by the three passes
    void run(ComputationalGraph& graph) const;

private:
    const ModuleRegistry& modules_;
    AllowList allow_list_;
    std::vector<ExtensionRule> rules_;
    bool verbose_;

    FeaturesCalculatorPtr build_calculator(const ComputationalGraph& graph, const Node& n) const;
    InputFeaturesSetBy back_reference_through(const ComputationalGraph& graph,
                                              const Node& n, const Node& prev) const;
};

/**
 * @brief Node(s) setting the input features of a node
 *
 * A back-reference to a channel concatenation expands into the concatenation's
 * own list: its immediate tensor arguments in call order, which may be
 * features-propagating nodes such as a batch norm.
 */
std::vector<NodeId> resolve_input_features(const ComputationalGraph& graph, const Node& n);

/// Calculator yielding the number of input features of a node
FeaturesCalculatorPtr input_features_calculator(const ComputationalGraph& graph, const Node& n);

} // namespace dnas::graph
