//  _  _  _  _ _  _ _  _  |_
// |_|| ||_ (_|| (_|| |_) | |
//         _|          |
//
// incremental, memoized dataflow graphs in C++
//
// Licensed under the MIT License <http://opensource.org/licenses/MIT>.
//
// Copyright © 2025–2025
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

// Catch includes
#include <catch2/catch_test_macros.hpp>

// incgraph includes
#include <incgraph/graph/comp_graph.hpp>
#include <incgraph/graph/input_registry.hpp>
#include <tests/utils/catch.hpp>

using namespace incgraph;

TEST_CASE("testing InputRegistry", "[graph][registry]")
{
    NodeArena<double> arena;
    auto x = arena.add(NodeData<double>::input());
    auto y = arena.add(NodeData<double>::input());

    InputRegistry registry;
    registry.add("x", x);
    registry.add("y", y);

    SECTION("testing lookup by name")
    {
        CHECK(registry.size() == 2);
        CHECK(registry.at("x") == x);
        CHECK(registry.at("y") == y);
        CHECK(registry.contains("x"));
        CHECK_FALSE(registry.contains("z"));
        CHECK(registry.find("y") == std::optional<NodeId>(y));
        CHECK_FALSE(registry.find("z").has_value());
    }

    SECTION("testing unknown names raise UnknownInputNameError")
    {
        try {
            registry.at("z");
            FAIL("expected UnknownInputNameError");
        } catch(const UnknownInputNameError& e) {
            CHECK(e.kind() == ErrorKind::UnknownInputName);
            CHECK(e.name() == "z");
        }
    }

    SECTION("testing a name cannot be bound twice")
    {
        CHECK_THROWS_AS(registry.add("x", y), DuplicateInputNameError);
        // The first binding survives
        CHECK(registry.at("x") == x);
    }

    SECTION("testing names are listed in sorted order")
    {
        registry.add("a", x);
        CHECK(registry.names() == std::vector<std::string>{"a", "x", "y"});
    }
}

TEST_CASE("testing input registration through CompGraph", "[graph][registry]")
{
    CompGraph<double> graph;

    SECTION("testing add_input_node with a name registers it")
    {
        auto x1 = graph.add_input_node("x1");
        CHECK(graph.has_input("x1"));
        CHECK(graph.input_id("x1") == x1);
        CHECK(graph.is_input(x1));
        CHECK_THROWS_AS(graph.add_input_node("x1"), DuplicateInputNameError);
        CHECK(graph.size() == 1);
    }

    SECTION("testing register_input binds an existing leaf")
    {
        auto leaf = graph.add_input_node();
        CHECK(graph.input_names().empty());
        graph.register_input("leaf", leaf);
        CHECK(graph.input_id("leaf") == leaf);

        // A second name for the same leaf is an alias
        graph.register_input("alias", leaf);
        graph.set_input("alias", 4.0);
        CHECK(graph.cached(leaf) == std::optional<double>(4.0));
        CHECK(graph.input_names() == std::vector<std::string>{"alias", "leaf"});
    }

    SECTION("testing operation nodes cannot be registered")
    {
        auto x = graph.add_input_node("x");
        auto op = graph.add_node({x}, sum_of);
        try {
            graph.register_input("op", op);
            FAIL("expected NotAnInputError");
        } catch(const NotAnInputError& e) {
            CHECK(e.kind() == ErrorKind::NotAnInput);
            CHECK(e.node() == op);
        }
        CHECK_FALSE(graph.has_input("op"));
    }

    SECTION("testing ids of another graph cannot be registered")
    {
        CompGraph<double> other;
        auto foreign = other.add_input_node();
        CHECK_THROWS_AS(graph.register_input("foreign", foreign), InvalidReferenceError);
        CHECK_THROWS_AS(graph.register_input("none", NodeId{}), InvalidReferenceError);
    }

    SECTION("testing set_input on an unknown name")
    {
        graph.add_input_node("x");
        CHECK_THROWS_AS(graph.set_input("y", 1.0), UnknownInputNameError);
        CHECK_THROWS_AS(graph.input_id("y"), UnknownInputNameError);
    }
}
