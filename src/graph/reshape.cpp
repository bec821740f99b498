#include <dnas/graph/reshape.hpp>
#include <dnas/graph/errors.hpp>
#include <string>

namespace dnas::graph {

Size normalize_dim(Dim dim, Size rank) {
    Dim r = static_cast<Dim>(rank);
    Dim d = dim < 0 ? dim + r : dim;
    if (d < 0 || d >= r) {
        throw InvalidReshapeError("Dimension " + std::to_string(dim) +
                                  " out of range for rank " + std::to_string(rank));
    }
    return static_cast<Size>(d);
}

ReshapeEffect flatten_effect(const ComputationalGraph& graph, const Node& n) {
    const TensorShape& shape = graph.input_shape(n.id);
    Size start = normalize_dim(n.arg_or(0, "start_dim", 0), shape.size());
    Size end = normalize_dim(n.arg_or(1, "end_dim", -1), shape.size());

    if (start == 0) {
        throw InvalidReshapeError("Flattening the batch dimension is not supported (node " +
                                  n.name + ")");
    }
    if (end < start) {
        throw InvalidReshapeError("flatten end_dim precedes start_dim (node " + n.name + ")");
    }

    ReshapeEffect effect;
    if (start == 1) {
        effect.merges_channels = true;
        for (Size i = 2; i <= end; ++i) {
            effect.multiplier *= shape[i];
        }
    }
    return effect;
}

ReshapeEffect squeeze_effect(const ComputationalGraph& graph, const Node& n) {
    auto dim = n.arg(0, "dim");
    if (!dim) {
        throw InvalidReshapeError("Squeeze without dim is not supported (node " + n.name + ")");
    }
    const TensorShape& shape = graph.input_shape(n.id);
    Size d = normalize_dim(*dim, shape.size());
    if (d == 0) {
        throw InvalidReshapeError("Squeezing the batch dimension is not supported (node " +
                                  n.name + ")");
    }

    ReshapeEffect effect;
    if (d == 1) {
        effect.merges_channels = true;
        effect.multiplier = shape.size() > 2 ? shape[2] : 1;
    }
    return effect;
}

} // namespace dnas::graph
