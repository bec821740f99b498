#include <catch2/catch_test_macros.hpp>
#include <dnas/graph/errors.hpp>
#include <dnas/graph/reshape.hpp>
#include "test_graph_builder.hpp"

using namespace dnas;
using namespace dnas::graph;
using dnas::graph::test_utils::TestNet;

TEST_CASE("Reshape - normalize_dim", "[reshape][unit]") {
    REQUIRE(normalize_dim(0, 4) == 0);
    REQUIRE(normalize_dim(3, 4) == 3);
    REQUIRE(normalize_dim(-1, 4) == 3);
    REQUIRE(normalize_dim(-4, 4) == 0);
    REQUIRE_THROWS_AS(normalize_dim(4, 4), InvalidReshapeError);
    REQUIRE_THROWS_AS(normalize_dim(-5, 4), InvalidReshapeError);
}

TEST_CASE("Reshape - Flatten", "[reshape][unit]") {
    TestNet net;
    NodeId x = net.input("x", {1, 32, 5, 3});

    SECTION("From the channel dimension folds all spatial extents") {
        NodeId flat = net.function("flat", "torch.flatten", {x}, {1, 480}, {1});
        ReshapeEffect effect = flatten_effect(net.graph, net[flat]);
        REQUIRE(effect.merges_channels);
        REQUIRE(effect.multiplier == 15);
    }

    SECTION("Bounded by end_dim") {
        NodeId flat = net.function("flat", "torch.flatten", {x}, {1, 160, 3}, {1, 2});
        ReshapeEffect effect = flatten_effect(net.graph, net[flat]);
        REQUIRE(effect.merges_channels);
        REQUIRE(effect.multiplier == 5);
    }

    SECTION("Channels alone are left untouched") {
        NodeId flat = net.function("flat", "torch.flatten", {x}, {1, 32, 5, 3}, {1, 1});
        ReshapeEffect effect = flatten_effect(net.graph, net[flat]);
        REQUIRE(effect.merges_channels);
        REQUIRE(effect.multiplier == 1);
    }

    SECTION("Spatial-only flatten keeps the channels") {
        NodeId flat = net.method("flat", "flatten", {x}, {1, 32, 15}, {2});
        ReshapeEffect effect = flatten_effect(net.graph, net[flat]);
        REQUIRE_FALSE(effect.merges_channels);
        REQUIRE(effect.multiplier == 1);
    }

    SECTION("Keyword arguments") {
        NodeId flat = net.method("flat", "flatten", {x}, {1, 480});
        net[flat].set_kwarg("start_dim", -3);
        ReshapeEffect effect = flatten_effect(net.graph, net[flat]);
        REQUIRE(effect.merges_channels);
        REQUIRE(effect.multiplier == 15);
    }

    SECTION("Batch dimension cannot be flattened") {
        NodeId all = net.function("all", "torch.flatten", {x}, {480});
        NodeId zero = net.function("zero", "torch.flatten", {x}, {32, 5, 3}, {0, 1});
        REQUIRE_THROWS_AS(flatten_effect(net.graph, net[all]), InvalidReshapeError);
        REQUIRE_THROWS_AS(flatten_effect(net.graph, net[zero]), InvalidReshapeError);
    }

    SECTION("end_dim before start_dim") {
        NodeId flat = net.function("flat", "torch.flatten", {x}, {1, 32, 5, 3}, {2, 1});
        REQUIRE_THROWS_AS(flatten_effect(net.graph, net[flat]), InvalidReshapeError);
    }
}

TEST_CASE("Reshape - Squeeze", "[reshape][unit]") {
    TestNet net;
    NodeId x = net.input("x", {1, 64, 1, 10});

    SECTION("Squeezing the spatial dim keeps the channels") {
        NodeId sq = net.method("sq", "squeeze", {x}, {1, 64, 10}, {2});
        ReshapeEffect effect = squeeze_effect(net.graph, net[sq]);
        REQUIRE_FALSE(effect.merges_channels);
        REQUIRE(effect.multiplier == 1);
    }

    SECTION("Channel squeeze next to a unit extent keeps the count") {
        NodeId sq = net.method("sq", "squeeze", {x}, {1, 64, 10}, {1});
        ReshapeEffect effect = squeeze_effect(net.graph, net[sq]);
        REQUIRE(effect.merges_channels);
        REQUIRE(effect.multiplier == 1);
    }

    SECTION("Squeezing the channel dim slides the next extent in") {
        NodeId y = net.input("y", {1, 1, 64, 10});
        NodeId sq = net.function("sq", "torch.squeeze", {y}, {1, 64, 10}, {1});
        ReshapeEffect effect = squeeze_effect(net.graph, net[sq]);
        REQUIRE(effect.merges_channels);
        REQUIRE(effect.multiplier == 64);
    }

    SECTION("Rank two input has nothing to slide in") {
        NodeId y = net.input("y", {1, 1});
        NodeId sq = net.method("sq", "squeeze", {y}, {1}, {-1});
        ReshapeEffect effect = squeeze_effect(net.graph, net[sq]);
        REQUIRE(effect.merges_channels);
        REQUIRE(effect.multiplier == 1);
    }

    SECTION("dim is required") {
        NodeId sq = net.method("sq", "squeeze", {x}, {64, 10});
        REQUIRE_THROWS_AS(squeeze_effect(net.graph, net[sq]), InvalidReshapeError);
    }

    SECTION("Batch dimension cannot be squeezed") {
        NodeId sq = net.method("sq", "squeeze", {x}, {64, 1, 10}, {0});
        REQUIRE_THROWS_AS(squeeze_effect(net.graph, net[sq]), InvalidReshapeError);
    }
}
