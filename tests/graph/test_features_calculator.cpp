#include <catch2/catch_test_macros.hpp>
#include <dnas/graph/features_calculator.hpp>
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace dnas;
using namespace dnas::graph;

TEST_CASE("FeaturesCalculator - Const", "[calculator][unit]") {
    ConstFeaturesCalculator c(32);
    REQUIRE(c.features() == 32);
    REQUIRE(c.kind() == CalculatorKind::CONST);
    REQUIRE(c.inputs().empty());
}

TEST_CASE("FeaturesCalculator - Passthrough follows its input", "[calculator][unit]") {
    auto base = std::make_shared<ConstFeaturesCalculator>(24);
    PassthroughFeaturesCalculator p(base);

    REQUIRE(p.features() == 24);
    REQUIRE(p.kind() == CalculatorKind::PASSTHROUGH);
    REQUIRE(p.inputs().size() == 1);
    REQUIRE(p.inputs()[0] == base);

    REQUIRE_THROWS_AS(PassthroughFeaturesCalculator(nullptr), std::invalid_argument);
}

TEST_CASE("FeaturesCalculator - Flatten multiplies", "[calculator][unit]") {
    auto base = std::make_shared<ConstFeaturesCalculator>(32);
    FlattenFeaturesCalculator f(base, 15);

    REQUIRE(f.features() == 480);
    REQUIRE(f.multiplier() == 15);
    REQUIRE(f.kind() == CalculatorKind::FLATTEN);
}

TEST_CASE("FeaturesCalculator - Concat sums in any order", "[calculator][unit]") {
    auto a = std::make_shared<ConstFeaturesCalculator>(16);
    auto b = std::make_shared<ConstFeaturesCalculator>(24);
    auto c = std::make_shared<FlattenFeaturesCalculator>(a, 2);
    std::vector<FeaturesCalculatorPtr> inputs{a, b, c};

    std::sort(inputs.begin(), inputs.end());
    do {
        ConcatFeaturesCalculator concat(inputs);
        REQUIRE(concat.features() == 16 + 24 + 32);
    } while (std::next_permutation(inputs.begin(), inputs.end()));

    SECTION("Empty concat has no features") {
        ConcatFeaturesCalculator empty(std::vector<FeaturesCalculatorPtr>{});
        REQUIRE(empty.features() == 0);
    }

    SECTION("Null inputs are rejected") {
        std::vector<FeaturesCalculatorPtr> with_null{a, nullptr};
        REQUIRE_THROWS_AS(ConcatFeaturesCalculator(with_null), std::invalid_argument);
    }
}

TEST_CASE("FeaturesCalculator - Derived values are not cached", "[calculator][unit]") {
    // an extension calculator whose value changes after construction
    class Counter : public FeaturesCalculator {
    public:
        Size value = 8;
        Size features() const override { return value; }
        CalculatorKind kind() const override { return CalculatorKind::CONST; }
    };

    auto counter = std::make_shared<Counter>();
    auto pass = std::make_shared<PassthroughFeaturesCalculator>(counter);
    auto flat = std::make_shared<FlattenFeaturesCalculator>(pass, 4);
    ConcatFeaturesCalculator concat({flat, pass});

    REQUIRE(concat.features() == 8 * 4 + 8);
    counter->value = 5;
    REQUIRE(concat.features() == 5 * 4 + 5);
}

TEST_CASE("FeaturesCalculator - Kind names", "[calculator][unit]") {
    REQUIRE(to_string(CalculatorKind::CONST) == "const");
    REQUIRE(to_string(CalculatorKind::PASSTHROUGH) == "passthrough");
    REQUIRE(to_string(CalculatorKind::FLATTEN) == "flatten");
    REQUIRE(to_string(CalculatorKind::CONCAT) == "concat");
}
