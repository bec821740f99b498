#include <dnas/graph/features_calculator.hpp>
#include <numeric>
#include <stdexcept>

namespace dnas::graph {

std::string to_string(CalculatorKind kind) {
    switch (kind) {
    case CalculatorKind::CONST:       return "const";
    case CalculatorKind::PASSTHROUGH: return "passthrough";
    case CalculatorKind::FLATTEN:     return "flatten";
    case CalculatorKind::CONCAT:      return "concat";
    }
    return "unknown";
}

PassthroughFeaturesCalculator::PassthroughFeaturesCalculator(FeaturesCalculatorPtr input)
    : input_(std::move(input)) {
    if (!input_) {
        throw std::invalid_argument("PassthroughFeaturesCalculator requires an input calculator");
    }
}

FlattenFeaturesCalculator::FlattenFeaturesCalculator(FeaturesCalculatorPtr input, Size multiplier)
    : input_(std::move(input)), multiplier_(multiplier) {
    if (!input_) {
        throw std::invalid_argument("FlattenFeaturesCalculator requires an input calculator");
    }
}

ConcatFeaturesCalculator::ConcatFeaturesCalculator(std::vector<FeaturesCalculatorPtr> inputs)
    : inputs_(std::move(inputs)) {
    for (const auto& input : inputs_) {
        if (!input) {
            throw std::invalid_argument("ConcatFeaturesCalculator received a null input calculator");
        }
    }
}

Size ConcatFeaturesCalculator::features() const {
    return std::accumulate(inputs_.begin(), inputs_.end(), Size{0},
        [](Size total, const FeaturesCalculatorPtr& c) { return total + c->features(); });
}

} // namespace dnas::graph
