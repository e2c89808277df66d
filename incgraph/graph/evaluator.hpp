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

#pragma once

// C++ includes
#include <cstdint>
#include <utility>
#include <vector>

// incgraph includes
#include <incgraph/graph/graph_common.hpp>
#include <incgraph/graph/graph_errors.hpp>
#include <incgraph/graph/node_arena.hpp>

namespace incgraph {

/**
 * @brief Memoized, iterative evaluation of a node
 *
 * The engine walks the inputs of the queried node in post-order with an
 * explicit stack of (node, expanded) pairs:
 *
 * 1. A node whose cache is filled is never descended into nor recomputed. This
 *    is also what makes a node shared by several branches (a diamond) run
 *    once per query: the first branch fills its cache, later ones reuse it.
 * 2. A stale operation node is pushed back as expanded, above which its stale
 *    inputs are pushed. By the time the expanded entry is popped, every input
 *    holds a value.
 * 3. The expanded node collects its input values in declared order, applies
 *    its operation and stores the result.
 *
 * A stale input node has no value to offer and raises UnsetInputError. Nodes
 * evaluated before the failure keep their (correct) cache, so the graph stays
 * usable: set the missing input and query again.
 *
 * Memory is bounded by the number of edges reachable from the root, not by the
 * call stack, so arbitrarily deep graphs evaluate without overflow.
 */
template<typename T>
class EvaluationEngine
{
  public:
    void on_reserve(size_t cap)
    {
        stack_.reserve(cap);
    }

    const T& evaluate(NodeArena<T>& arena, NodeIndex_t root)
    {
        NodeData<T>& head = arena[root];
        if(head.cache) return *head.cache;

        stack_.clear();
        stack_.emplace_back(root, false);

        while(!stack_.empty()) {
            auto [id, expanded] = stack_.back(); stack_.pop_back();
            NodeData<T>& node = arena[id];
            if(node.cache) continue; // already resolved through another path

            if(expanded) {
                std::vector<T> args;
                args.reserve(node.inputs.size());
                for(NodeIndex_t input : node.inputs)
                    args.push_back(*arena[input].cache);
                node.cache = node.op(args);
                ++evaluations_;
                continue;
            }

            if(node.is_input()) {
                stack_.clear();
                throw UnsetInputError(arena.id_of(id), node.label);
            }

            stack_.emplace_back(id, true);
            // Reverse push so the first declared input is resolved first
            for(auto it = node.inputs.rbegin(); it != node.inputs.rend(); ++it)
                if(!arena[*it].cache) stack_.emplace_back(*it, false);
        }

        return *arena[root].cache;
    }

    // Number of operation invocations performed by this engine
    uint64_t evaluations() const { return evaluations_; }

    void reset_evaluations() { evaluations_ = 0; }

  private:
    std::vector<std::pair<NodeIndex_t, bool>> stack_;
    uint64_t evaluations_ = 0;
};

} // namespace incgraph
