/**
 * @file allow_list.hpp
 * @brief Operation kind -> node category table used by the node classifier
 *
 * Lookup key is (OperationKind, target). For CALL_MODULE nodes the target is
 * replaced by the concrete layer type of the invoked module, resolved through
 * the ModuleRegistry, so "conv0" is looked up as (CALL_MODULE, "Conv2d").
 *
 * Classifier rules registered with add_rule() are consulted before the table,
 * in registration order.
 */

#pragma once

#include <dnas/graph/graph.hpp>
#include <dnas/graph/module_registry.hpp>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace dnas::graph {

using ClassifierRule =
    std::function<std::optional<NodeCategory>(const Node&, const ModuleRegistry&)>;

class AllowList {
public:
    using Key = std::pair<OperationKind, std::string>;

    /// Empty table
    AllowList() = default;

    /// Table covering common convolution, linear, normalization, pooling,
    /// activation, padding, element-wise and reshape operations
    static AllowList defaults();

    void add(OperationKind kind, const std::string& target, NodeCategory category) {
        table_[{kind, target}] = category;
    }

    void remove(OperationKind kind, const std::string& target) {
        table_.erase({kind, target});
    }

    void add_rule(ClassifierRule rule) {
        rules_.push_back(std::move(rule));
    }

    /**
     * @brief Category configured for a node, if any
     *
     * Input and output nodes are not looked up here; the classifier handles
     * them structurally.
     */
    std::optional<NodeCategory> lookup(const Node& n, const ModuleRegistry& modules) const;

    std::optional<NodeCategory> lookup(OperationKind kind, const std::string& target) const {
        auto it = table_.find({kind, target});
        if (it == table_.end()) return std::nullopt;
        return it->second;
    }

    // Operations a search method must leave alone (functional conv/linear)
    void mark_untouchable(OperationKind kind, const std::string& target) {
        untouchable_.insert({kind, target});
    }

    bool is_untouchable(OperationKind kind, const std::string& target) const {
        return untouchable_.count({kind, target}) > 0;
    }

    const std::map<Key, NodeCategory>& entries() const { return table_; }
    const std::set<Key>& untouchable() const { return untouchable_; }
    size_t rule_count() const { return rules_.size(); }

private:
    std::map<Key, NodeCategory> table_;
    std::set<Key> untouchable_;
    std::vector<ClassifierRule> rules_;
};

} // namespace dnas::graph
