#include <dnas/graph/node_classifier.hpp>
#include <dnas/graph/errors.hpp>

namespace dnas::graph {

bool NodeClassifier::is_zero_or_one_input(const Node& n) const {
    return n.inputs.size() <= 1;
}

bool NodeClassifier::is_features_defining(const Node& n) const {
    if (n.is_input()) return true;
    return listed(n) == NodeCategory::FEATURES_DEFINING;
}

bool NodeClassifier::is_features_propagating(const Node& n) const {
    if (n.is_input()) return false;
    if (n.kind == OperationKind::OUTPUT) return true;
    auto category = listed(n);
    if (category == NodeCategory::FEATURES_PROPAGATING) return true;
    // x + 1: a combiner with a single tensor input keeps its channels
    return category == NodeCategory::SHARED_INPUT_FEATURES && is_zero_or_one_input(n);
}

bool NodeClassifier::is_shared_input_features_op(const Node& n) const {
    if (is_zero_or_one_input(n)) return false;
    auto category = listed(n);
    if (category == NodeCategory::SHARED_INPUT_FEATURES) return true;
    // concatenation along batch or spatial axes needs matching channels
    return category == NodeCategory::FEATURES_CONCATENATE && !concatenates_channels(n);
}

bool NodeClassifier::is_flatten(const Node& n) const {
    return listed(n) == NodeCategory::FLATTEN;
}

bool NodeClassifier::is_squeeze(const Node& n) const {
    return listed(n) == NodeCategory::SQUEEZE;
}

bool NodeClassifier::is_features_concatenate(const Node& n) const {
    return listed(n) == NodeCategory::FEATURES_CONCATENATE && concatenates_channels(n);
}

bool NodeClassifier::is_untouchable(const Node& n) const {
    return allow_list_.is_untouchable(n.kind, n.target);
}

NodeProperties NodeClassifier::properties(const Node& n) const {
    NodeProperties p;
    p.features_propagating = is_features_propagating(n);
    p.features_defining = is_features_defining(n);
    p.shared_input_features = is_shared_input_features_op(n);
    p.flatten = is_flatten(n);
    p.squeeze = is_squeeze(n);
    p.features_concatenate = is_features_concatenate(n);
    p.untouchable = is_untouchable(n);
    p.zero_or_one_input = is_zero_or_one_input(n);
    return p;
}

NodeCategory NodeClassifier::classify(const Node& n) const {
    if (auto category = properties(n).category()) {
        return *category;
    }
    throw UnsupportedNodeError(n.name, to_string(n.kind), n.target);
}

std::optional<NodeCategory> NodeClassifier::listed(const Node& n) const {
    if (n.is_input() || n.kind == OperationKind::OUTPUT) return std::nullopt;
    return allow_list_.lookup(n, modules_);
}

bool NodeClassifier::concatenates_channels(const Node& n) const {
    Dim dim = n.arg_or(0, "dim", 0);
    if (dim < 0) {
        // throws when the first input carries no shape
        dim += static_cast<Dim>(graph_.input_shape(n.id).size());
    }
    return dim == 1;
}

} // namespace dnas::graph
