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
#include <algorithm>
#include <cstdint>
#include <vector>

// incgraph includes
#include <incgraph/graph/graph_common.hpp>
#include <incgraph/graph/node_arena.hpp>

namespace incgraph {

/**
 * @brief Marks a node and all of its transitive dependents stale
 *
 * The walk follows the reverse edges (`dependents`) with an explicit stack, so
 * it is safe on arbitrarily long chains. A diamond makes a node reachable
 * along several paths; generation-stamped visit marks guarantee each node is
 * cleared and expanded once, keeping the walk linear in the number of edges.
 *
 * The engine owns only scratch storage. It is bound to no particular arena:
 * the owner keeps it sized through on_append().
 */
template<typename T>
class InvalidationEngine
{
  public:
    void on_reserve(size_t cap)
    {
        visit_gen_.reserve(cap);
    }

    void on_append(size_t new_size)
    {
        if(visit_gen_.size() < new_size) visit_gen_.resize(new_size, 0u);
    }

    // Returns the number of nodes marked stale, `root` included
    size_t invalidate(NodeArena<T>& arena, NodeIndex_t root)
    {
        const size_t n = arena.size();
        if(root == INVALID_NODE_INDEX || static_cast<size_t>(root) >= n) return 0;
        on_append(n);

        // Generation-based visitation to avoid O(N) clears
        uint32_t gen = ++current_gen_;
        if(gen == 0) { // wrap-around: rare full reset
            std::fill(visit_gen_.begin(), visit_gen_.end(), 0u);
            current_gen_ = 1; gen = 1;
        }

        size_t visited = 0;
        stack_.clear();
        visit_gen_[root] = gen;
        stack_.push_back(root);

        while(!stack_.empty()) {
            NodeIndex_t id = stack_.back(); stack_.pop_back();
            NodeData<T>& node = arena[id];
            node.cache.reset();
            ++visited;
            for(NodeIndex_t dep : node.dependents) {
                if(visit_gen_[dep] == gen) continue;
                visit_gen_[dep] = gen;
                stack_.push_back(dep);
            }
        }
        return visited;
    }

  private:
    std::vector<uint32_t> visit_gen_;
    uint32_t current_gen_ = 0;
    std::vector<NodeIndex_t> stack_;
};

} // namespace incgraph
