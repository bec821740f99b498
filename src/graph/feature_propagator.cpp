#include <dnas/graph/feature_propagator.hpp>
#include <dnas/graph/errors.hpp>
#include <dnas/graph/node_classifier.hpp>
#include <dnas/graph/reshape.hpp>
#include <deque>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace dnas::graph {

namespace {

const NodeProperties& properties_of(const Node& n) {
    if (!n.properties) {
        throw std::runtime_error("Node '" + n.name + "' has not been annotated");
    }
    return *n.properties;
}

std::deque<NodeId> seed_queue(const ComputationalGraph& graph) {
    auto inputs = graph.input_nodes();
    return std::deque<NodeId>(inputs.begin(), inputs.end());
}

// out_channels / out_features of the invoked layer, when the registry has them
std::optional<Dim> configured_features(const Node& n, const ModuleRegistry& modules) {
    if (n.kind != OperationKind::CALL_MODULE) return std::nullopt;
    const ModuleInfo* info = modules.find(n.target);
    if (!info) return std::nullopt;
    if (auto out = info->attribute("out_channels")) return out;
    return info->attribute("out_features");
}

void print_back_reference(const ComputationalGraph& graph, const InputFeaturesSetBy& ref) {
    if (ref.concatenated) std::cout << "[";
    for (size_t i = 0; i < ref.nodes.size(); ++i) {
        if (i > 0) std::cout << ", ";
        std::cout << graph.node(ref.nodes[i]).name;
    }
    if (ref.concatenated) std::cout << "]";
}

} // namespace

// ============================================================================
// Annotation
// ============================================================================

void FeaturePropagator::annotate(ComputationalGraph& graph) const {
    NodeClassifier classifier(graph, modules_, allow_list_);
    for (NodeId id = 0; id < graph.size(); ++id) {
        graph.node(id).properties.reset();
    }

    std::deque<NodeId> queue = seed_queue(graph);
    while (!queue.empty()) {
        Node& n = graph.node(queue.front());
        queue.pop_front();
        if (n.properties) continue;

        NodeProperties p = classifier.properties(n);
        if (!p.category()) {
            throw UnsupportedNodeError(n.name, to_string(n.kind), n.target);
        }
        n.properties = p;

        if (verbose_) {
            std::cout << "[Annotate] " << n.name << ": " << to_string(*p.category())
                      << (p.untouchable ? " (untouchable)" : "") << "\n";
        }

        for (NodeId succ : graph.successors(n.id)) {
            queue.push_back(succ);
        }
    }
}

// ============================================================================
// Features calculators
// ============================================================================

void FeaturePropagator::propagate_features(ComputationalGraph& graph) const {
    for (NodeId id = 0; id < graph.size(); ++id) {
        graph.node(id).features_calculator.reset();
    }

    std::deque<NodeId> queue = seed_queue(graph);
    while (!queue.empty()) {
        NodeId id = queue.front();
        queue.pop_front();
        Node& n = graph.node(id);
        if (n.features_calculator) continue;

        // predecessors not done yet: retry after the rest of the queue
        bool ready = true;
        for (NodeId in : n.inputs) {
            if (!graph.node(in).features_calculator) {
                ready = false;
                break;
            }
        }
        if (!ready) {
            queue.push_back(id);
            continue;
        }

        n.features_calculator = build_calculator(graph, n);

        if (verbose_) {
            std::cout << "[Features] " << n.name << ": "
                      << to_string(n.features_calculator->kind()) << " -> "
                      << n.features_calculator->features() << "\n";
        }

        for (NodeId succ : graph.successors(id)) {
            queue.push_back(succ);
        }
    }
}

FeaturesCalculatorPtr FeaturePropagator::build_calculator(const ComputationalGraph& graph,
                                                          const Node& n) const {
    for (const auto& rule : rules_) {
        if (rule.matches && !rule.matches(n, modules_)) continue;
        if (!rule.build) continue;
        if (auto calculator = rule.build(n, graph, modules_)) {
            return calculator;
        }
    }

    const NodeProperties& p = properties_of(n);
    auto input_calculator = [&](size_t i) {
        return graph.node(n.inputs.at(i)).features_calculator;
    };

    if (p.flatten || p.squeeze) {
        // a reshape may fold spatial extents into the channels, in which case the
        // result is NOT the traced output shape when upstream channels get masked
        ReshapeEffect effect = p.flatten ? flatten_effect(graph, n) : squeeze_effect(graph, n);
        if (effect.merges_channels) {
            return std::make_shared<FlattenFeaturesCalculator>(input_calculator(0),
                                                               effect.multiplier);
        }
        return std::make_shared<PassthroughFeaturesCalculator>(input_calculator(0));
    }
    if (p.features_concatenate) {
        // one term per tensor argument: cat([a, a]) counts a twice
        std::vector<FeaturesCalculatorPtr> inputs;
        for (NodeId in : n.arguments()) {
            inputs.push_back(graph.node(in).features_calculator);
        }
        return std::make_shared<ConcatFeaturesCalculator>(std::move(inputs));
    }
    if (p.shared_input_features) {
        // equal features on all inputs is enforced by the search method
        return input_calculator(0);
    }
    if (p.features_defining) {
        if (!n.shape || n.shape->size() < 2) {
            throw std::runtime_error("Features-defining node '" + n.name +
                                     "' has no channel dimension in its shape metadata");
        }
        Size channels = (*n.shape)[1];
        auto configured = configured_features(n, modules_);
        if (configured && *configured != static_cast<Dim>(channels)) {
            throw std::runtime_error("Node '" + n.name + "' is configured with " +
                                     std::to_string(*configured) + " output features but " +
                                     "its shape has " + std::to_string(channels) + " channels");
        }
        return std::make_shared<ConstFeaturesCalculator>(channels);
    }
    if (p.features_propagating && !n.inputs.empty()) {
        return std::make_shared<PassthroughFeaturesCalculator>(input_calculator(0));
    }
    throw UnsupportedNodeError(n.name, to_string(n.kind), n.target);
}

// ============================================================================
// Input features back-references
// ============================================================================

void FeaturePropagator::associate_input_features(ComputationalGraph& graph) const {
    for (NodeId id = 0; id < graph.size(); ++id) {
        graph.node(id).input_features_set_by.reset();
    }

    std::deque<NodeId> queue = seed_queue(graph);
    while (!queue.empty()) {
        NodeId id = queue.front();
        queue.pop_front();
        Node& n = graph.node(id);
        if (n.input_features_set_by) continue;

        if (n.inputs.empty()) {
            n.input_features_set_by = InputFeaturesSetBy::single(id);
        } else if (properties_of(n).features_concatenate) {
            bool ready = true;
            for (NodeId in : n.inputs) {
                if (!graph.node(in).input_features_set_by) ready = false;
            }
            if (ready) {
                n.input_features_set_by = InputFeaturesSetBy::list(n.arguments());
            }
        } else {
            const Node& prev = graph.node(n.inputs.front());
            if (prev.input_features_set_by) {
                n.input_features_set_by = back_reference_through(graph, n, prev);
            }
        }

        // not ready: skipped, a predecessor brings it back when it resolves
        if (!n.input_features_set_by) continue;

        if (verbose_) {
            std::cout << "[InputFeatures] " << n.name << " <- ";
            print_back_reference(graph, *n.input_features_set_by);
            std::cout << "\n";
        }

        for (NodeId succ : graph.successors(id)) {
            queue.push_back(succ);
        }
    }
}

InputFeaturesSetBy FeaturePropagator::back_reference_through(const ComputationalGraph& graph,
                                                             const Node& n,
                                                             const Node& prev) const {
    const NodeProperties& p = properties_of(prev);
    if (p.flatten || p.squeeze) {
        ReshapeEffect effect = p.flatten ? flatten_effect(graph, prev)
                                         : squeeze_effect(graph, prev);
        if (effect.merges_channels) return InputFeaturesSetBy::single(prev.id);
        return *prev.input_features_set_by;
    }
    if (p.features_concatenate || p.features_defining) {
        return InputFeaturesSetBy::single(prev.id);
    }
    if (p.features_propagating || p.shared_input_features) {
        return *prev.input_features_set_by;
    }
    throw UnsupportedNodeError(n.name, to_string(n.kind), n.target);
}

// ============================================================================
// Pipeline and queries
// ============================================================================

void FeaturePropagator::run(ComputationalGraph& graph) const {
    graph.validate();
    annotate(graph);
    propagate_features(graph);
    associate_input_features(graph);
}

std::vector<NodeId> resolve_input_features(const ComputationalGraph& graph, const Node& n) {
    if (!n.input_features_set_by) {
        throw std::runtime_error("Node '" + n.name + "' has no input features back-reference");
    }
    const InputFeaturesSetBy& ref = *n.input_features_set_by;
    if (ref.concatenated) return ref.nodes;

    const Node& setter = graph.node(ref.node());
    if (setter.id != n.id && setter.properties && setter.properties->features_concatenate &&
        setter.input_features_set_by) {
        return setter.input_features_set_by->nodes;
    }
    return ref.nodes;
}

FeaturesCalculatorPtr input_features_calculator(const ComputationalGraph& graph, const Node& n) {
    if (!n.input_features_set_by) {
        throw std::runtime_error("Node '" + n.name + "' has no input features back-reference");
    }
    const InputFeaturesSetBy& ref = *n.input_features_set_by;
    std::vector<FeaturesCalculatorPtr> calculators;
    for (NodeId id : ref.nodes) {
        const Node& setter = graph.node(id);
        if (!setter.features_calculator) {
            throw std::runtime_error("Node '" + setter.name + "' has no features calculator");
        }
        calculators.push_back(setter.features_calculator);
    }
    if (!ref.concatenated) return calculators.front();
    return std::make_shared<ConcatFeaturesCalculator>(std::move(calculators));
}

} // namespace dnas::graph
