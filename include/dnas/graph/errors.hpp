#pragma once

#include <stdexcept>
#include <string>

namespace dnas::graph {

/**
 * @brief Base class for errors raised while building or annotating a graph
 */
class GraphError : public std::runtime_error {
public:
    explicit GraphError(const std::string& message)
        : std::runtime_error(message) {}
};

/// A non-input node without predecessors, an input node with predecessors,
/// or two nodes sharing a name.
class MalformedGraphError : public GraphError {
public:
    explicit MalformedGraphError(const std::string& message)
        : GraphError(message) {}
};

/**
 * @brief No classification or calculator rule matches a node
 *
 * Carries the node identity so callers can report which operation of the
 * traced network needs an allow-list entry or an extension rule.
 */
class UnsupportedNodeError : public GraphError {
public:
    UnsupportedNodeError(const std::string& node_name,
                         const std::string& op,
                         const std::string& target)
        : GraphError("Unsupported node " + node_name + " (op: " + op +
                     ", target: " + target + ")"),
          node_name_(node_name), op_(op), target_(target) {}

    const std::string& node_name() const { return node_name_; }
    const std::string& op() const { return op_; }
    const std::string& target() const { return target_; }

private:
    std::string node_name_;
    std::string op_;
    std::string target_;
};

/// Flatten or squeeze touching the batch dimension, or squeeze without a dim.
class InvalidReshapeError : public GraphError {
public:
    explicit InvalidReshapeError(const std::string& message)
        : GraphError(message) {}
};

} // namespace dnas::graph
