#pragma once

#include <dnas/graph/graph.hpp>

namespace dnas::graph {

/**
 * @brief Effect of a flatten or squeeze node on the channel dimension
 */
struct ReshapeEffect {
    bool merges_channels = false;  ///< Output channel dim absorbs spatial dims
    Size multiplier = 1;           ///< Factor applied to the input features
};

/// Resolve a possibly negative dimension index against a rank
/// @throws InvalidReshapeError if out of range
Size normalize_dim(Dim dim, Size rank);

/**
 * @brief flatten(x, start_dim=0, end_dim=-1)
 *
 * Merging [start_dim, end_dim] with start_dim == 1 folds the spatial extents
 * shape[2..end_dim] into the channel dimension.
 *
 * @throws InvalidReshapeError if the batch dimension is flattened
 */
ReshapeEffect flatten_effect(const ComputationalGraph& graph, const Node& n);

/**
 * @brief squeeze(x, dim)
 *
 * Squeezing dim 1 slides shape[2] into the channel slot.
 *
 * @throws InvalidReshapeError if dim is missing or is the batch dimension
 */
ReshapeEffect squeeze_effect(const ComputationalGraph& graph, const Node& n);

} // namespace dnas::graph
