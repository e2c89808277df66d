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
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// incgraph includes
#include <incgraph/graph/comp_graph.hpp>

namespace incgraph {

/**
 * @brief CompGraph shared between threads
 *
 * Evaluation writes cache slots, so even a "read" takes exclusive access:
 * every operation runs under one mutex, making construction, set_input,
 * invalidate and compute mutually exclusive. Node operations run while the
 * lock is held and must not call back into the same LockedGraph.
 *
 * Use with_graph() to run several steps as one transaction:
 *
 *   shared.with_graph([](CompGraph<double>& g) {
 *       g.set_input("x", 1.0);
 *       g.set_input("y", 2.0);
 *       return g.compute(result);
 *   });
 */
template<typename T>
class LockedGraph
{
  public:
    using Operation = typename CompGraph<T>::Operation;

    explicit LockedGraph(size_t initial_capacity = 64)
        : graph_(initial_capacity)
    {
    }

    LockedGraph(const LockedGraph&) = delete;
    LockedGraph& operator=(const LockedGraph&) = delete;

    NodeId add_input_node(const std::string& name)
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return graph_.add_input_node(name);
    }

    NodeId add_node(const std::vector<NodeId>& inputs, Operation op)
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return graph_.add_node(inputs, std::move(op));
    }

    void set_input(const std::string& name, T value)
    {
        std::lock_guard<std::mutex> lock(mtx_);
        graph_.set_input(name, std::move(value));
    }

    size_t invalidate(NodeId id)
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return graph_.invalidate(id);
    }

    T compute(NodeId id)
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return graph_.compute(id);
    }

    std::optional<T> cached(NodeId id) const
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return graph_.cached(id);
    }

    template<typename F>
    auto with_graph(F&& func) -> decltype(func(std::declval<CompGraph<T>&>()))
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return func(graph_);
    }

  private:
    CompGraph<T> graph_;
    mutable std::mutex mtx_;
};

} // namespace incgraph
