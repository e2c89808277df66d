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

// Eigen includes
#include <Eigen/Core>

// incgraph includes
#include <incgraph/graph/comp_graph.hpp>
#include <tests/utils/catch.hpp>

using namespace incgraph;
using Eigen::MatrixXd;
using Eigen::VectorXd;

TEST_CASE("testing vector-valued graphs", "[graph][eigen]")
{
    CompGraph<VectorXd> graph;
    auto u = graph.add_input_node("u");
    auto v = graph.add_input_node("v");

    CountedOp<VectorXd> axpy([](const std::vector<VectorXd>& args) -> VectorXd { return 2.0 * args[0] + args[1]; });
    CountedOp<VectorXd> normalize([](const std::vector<VectorXd>& args) -> VectorXd { return args[0].normalized(); });

    auto w = graph.add_node({u, v}, axpy.fn());
    auto n = graph.add_node({w}, normalize.fn());
    auto dot = graph.add_node({u, n}, [](const std::vector<VectorXd>& args) -> VectorXd {
        VectorXd out(1);
        out[0] = args[0].dot(args[1]);
        return out;
    });

    VectorXd u0(3), v0(3);
    u0 << 1.0, 0.0, 0.0;
    v0 << 0.0, 2.0, 0.0;
    graph.set_input("u", u0);
    graph.set_input("v", v0);

    SECTION("testing values flow through vector operations")
    {
        const VectorXd result = graph.compute(n);
        REQUIRE(result.size() == 3);
        CHECK(result[0] == approx(1.0 / std::sqrt(2.0)));
        CHECK(result[1] == approx(1.0 / std::sqrt(2.0)));
        CHECK(result[2] == approx(0.0));

        CHECK(graph.compute(dot)[0] == approx(1.0 / std::sqrt(2.0)));
        CHECK(axpy.count() == 1);
        CHECK(normalize.count() == 1);
    }

    SECTION("testing invalidation of vector inputs")
    {
        graph.compute(dot);

        VectorXd v1(3);
        v1 << 0.0, 0.0, 0.0;
        graph.set_input("v", v1);

        CHECK_FALSE(graph.is_fresh(w));
        CHECK_FALSE(graph.is_fresh(dot));
        CHECK(graph.compute(dot)[0] == approx(1.0));
        CHECK(axpy.count() == 2);
    }

    SECTION("testing matrix-valued nodes")
    {
        CompGraph<MatrixXd> mgraph;
        auto a = mgraph.add_input_node("A");
        auto ata = mgraph.add_node({a}, [](const std::vector<MatrixXd>& args) -> MatrixXd {
            return args[0].transpose() * args[0];
        });

        MatrixXd a0(2, 2);
        a0 << 1.0, 2.0,
              3.0, 4.0;
        mgraph.set_input("A", a0);

        const MatrixXd result = mgraph.compute(ata);
        CHECK(result(0, 0) == approx(10.0));
        CHECK(result(0, 1) == approx(14.0));
        CHECK(result(1, 0) == approx(14.0));
        CHECK(result(1, 1) == approx(20.0));
    }
}
