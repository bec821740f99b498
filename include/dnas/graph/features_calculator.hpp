/**
 * @file features_calculator.hpp
 * @brief Lazily evaluated channel counts
 *
 * A calculator yields the number of features (channels) produced by a node.
 * Derived calculators reference upstream calculators instead of copying
 * their values, so a search method that later deactivates channels of an
 * upstream layer sees the change propagate through flatten and concat nodes
 * without walking the graph again.
 */

#pragma once

#include <dnas/concepts.hpp>
#include <memory>
#include <string>
#include <vector>

namespace dnas::graph {

class FeaturesCalculator;
using FeaturesCalculatorPtr = std::shared_ptr<const FeaturesCalculator>;

enum class CalculatorKind {
    CONST,
    PASSTHROUGH,
    FLATTEN,
    CONCAT
};

std::string to_string(CalculatorKind kind);

class FeaturesCalculator {
public:
    virtual ~FeaturesCalculator() = default;

    /// Current number of features
    virtual Size features() const = 0;

    virtual CalculatorKind kind() const = 0;

    /// Calculators this one is derived from
    virtual std::vector<FeaturesCalculatorPtr> inputs() const { return {}; }
};

// Fixed number of features, set by the layer's own configuration
class ConstFeaturesCalculator final : public FeaturesCalculator {
public:
    explicit ConstFeaturesCalculator(Size features) : features_(features) {}

    Size features() const override { return features_; }
    CalculatorKind kind() const override { return CalculatorKind::CONST; }

private:
    Size features_;
};

// Same number of features as the upstream calculator
class PassthroughFeaturesCalculator final : public FeaturesCalculator {
public:
    explicit PassthroughFeaturesCalculator(FeaturesCalculatorPtr input);

    Size features() const override { return input_->features(); }
    CalculatorKind kind() const override { return CalculatorKind::PASSTHROUGH; }
    std::vector<FeaturesCalculatorPtr> inputs() const override { return {input_}; }

private:
    FeaturesCalculatorPtr input_;
};

/**
 * @brief Upstream features times the size of the spatial dimensions merged
 *        into the channel dimension by a flatten (or squeeze)
 */
class FlattenFeaturesCalculator final : public FeaturesCalculator {
public:
    FlattenFeaturesCalculator(FeaturesCalculatorPtr input, Size multiplier);

    Size features() const override { return input_->features() * multiplier_; }
    CalculatorKind kind() const override { return CalculatorKind::FLATTEN; }
    std::vector<FeaturesCalculatorPtr> inputs() const override { return {input_}; }

    Size multiplier() const { return multiplier_; }

private:
    FeaturesCalculatorPtr input_;
    Size multiplier_;
};

// Sum of the features of the concatenated inputs
class ConcatFeaturesCalculator final : public FeaturesCalculator {
public:
    explicit ConcatFeaturesCalculator(std::vector<FeaturesCalculatorPtr> inputs);

    Size features() const override;
    CalculatorKind kind() const override { return CalculatorKind::CONCAT; }
    std::vector<FeaturesCalculatorPtr> inputs() const override { return inputs_; }

private:
    std::vector<FeaturesCalculatorPtr> inputs_;
};

} // namespace dnas::graph
