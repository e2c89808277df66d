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
#include <functional>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// incgraph includes
#include <incgraph/graph/evaluator.hpp>
#include <incgraph/graph/graph_common.hpp>
#include <incgraph/graph/graph_errors.hpp>
#include <incgraph/graph/input_registry.hpp>
#include <incgraph/graph/invalidator.hpp>
#include <incgraph/graph/node_arena.hpp>

namespace incgraph {

/**
 * @brief Incremental computational graph
 *
 * Owns the node arena, the input registry and the evaluation/invalidation
 * engines of one graph of homogeneous value type T.
 *
 * Usage:
 *   CompGraph<double> graph;
 *   auto x = graph.add_input_node("x");
 *   auto y = graph.add_input_node("y");
 *   auto sum = graph.add_node({x, y}, [](const std::vector<double>& v) { return v[0] + v[1]; });
 *
 *   graph.set_input("x", 1.0);
 *   graph.set_input("y", 2.0);
 *   graph.compute(sum);        // runs the operation, caches 3.0
 *   graph.compute(sum);        // returns the cached 3.0
 *   graph.set_input("y", 5.0); // `sum` is stale again
 *
 * Topology is append-only: nodes can be added at any time but never removed or
 * rewired, and an operation node can only read nodes that already exist, so the
 * graph is acyclic by construction. After construction only cache slots change:
 * invalidation clears them, evaluation fills them.
 *
 * Setting an input always invalidates its dependents, even if the new value
 * equals the old one.
 *
 * A CompGraph is not synchronized; see LockedGraph for shared use.
 */
template<typename T>
class CompGraph
{
  public:
    using value_type = T;
    using Operation = typename NodeData<T>::Operation;

    explicit CompGraph(size_t initial_capacity = 64)
        : arena_(initial_capacity)
    {
        invalidator_.on_reserve(initial_capacity);
        evaluator_.on_reserve(initial_capacity);
    }

    CompGraph(const CompGraph&) = delete;
    CompGraph& operator=(const CompGraph&) = delete;
    CompGraph(CompGraph&&) = default;
    CompGraph& operator=(CompGraph&&) = default;

    void reserve(size_t new_capacity)
    {
        arena_.reserve(new_capacity);
        invalidator_.on_reserve(new_capacity);
        evaluator_.on_reserve(new_capacity);
    }

    ///////////////////////////
    // construction
    ///////////////////////////

    // Create an unset input node
    NodeId add_input_node()
    {
        NodeId id = arena_.add(NodeData<T>::input());
        invalidator_.on_append(arena_.size());
        return id;
    }

    // Create an unset input node and register it under `name`
    NodeId add_input_node(const std::string& name)
    {
        if(registry_.contains(name))
            throw DuplicateInputNameError(name);
        NodeId id = add_input_node();
        register_input(name, id);
        return id;
    }

    // Create an operation node reading `inputs` in the given order
    NodeId add_node(const std::vector<NodeId>& inputs, Operation op)
    {
        if(!op)
            throw std::invalid_argument("add_node requires a callable operation");

        std::vector<NodeIndex_t> indices;
        indices.reserve(inputs.size());
        for(const NodeId& input : inputs) {
            if(!arena_.contains(input))
                throw InvalidReferenceError(input, "add_node");
            indices.push_back(input.index());
        }

        NodeId id = arena_.add(NodeData<T>::operation(std::move(indices), std::move(op)));
        invalidator_.on_append(arena_.size());
        return id;
    }

    NodeId add_node(std::initializer_list<NodeId> inputs, Operation op)
    {
        return add_node(std::vector<NodeId>(inputs), std::move(op));
    }

    // Bind `name` to the input node `id`
    void register_input(const std::string& name, NodeId id)
    {
        NodeData<T>& node = checked(id, "register_input");
        if(!node.is_input())
            throw NotAnInputError(id, "register_input");
        registry_.add(name, id);
        if(node.label.empty())
            node.label = name;
    }

    ///////////////////////////
    // mutation
    ///////////////////////////

    // Invalidate the dependents of input `name`, then store `value` in it
    void set_input(const std::string& name, T value)
    {
        set_input(registry_.at(name), std::move(value));
    }

    void set_input(NodeId id, T value)
    {
        NodeData<T>& node = checked(id, "set_input");
        if(!node.is_input())
            throw NotAnInputError(id, "set_input");
        invalidator_.invalidate(arena_, id.index());
        arena_[id.index()].cache = std::move(value);
    }

    // Mark `id` and every node depending on it stale. Returns the number of
    // nodes visited.
    size_t invalidate(NodeId id)
    {
        checked(id, "invalidate");
        return invalidator_.invalidate(arena_, id.index());
    }

    ///////////////////////////
    // evaluation
    ///////////////////////////

    // Up-to-date value of `id`, recomputing only what is stale
    T compute(NodeId id)
    {
        checked(id, "compute");
        return evaluator_.evaluate(arena_, id.index());
    }

    // Current cache slot of `id`; std::nullopt if stale or unset
    std::optional<T> cached(NodeId id) const
    {
        return checked(id, "cached").cache;
    }

    bool is_fresh(NodeId id) const
    {
        return checked(id, "is_fresh").is_fresh();
    }

    // Total operation invocations since construction (or the last reset)
    uint64_t evaluation_count() const { return evaluator_.evaluations(); }

    void reset_evaluation_count() { evaluator_.reset_evaluations(); }

    ///////////////////////////
    // inspection
    ///////////////////////////

    NodeId input_id(const std::string& name) const
    {
        return registry_.at(name);
    }

    bool has_input(const std::string& name) const
    {
        return registry_.contains(name);
    }

    std::vector<std::string> input_names() const
    {
        return registry_.names();
    }

    bool is_input(NodeId id) const
    {
        return checked(id, "is_input").is_input();
    }

    bool contains(NodeId id) const
    {
        return arena_.contains(id);
    }

    std::vector<NodeId> inputs_of(NodeId id) const
    {
        return to_ids(checked(id, "inputs_of").inputs);
    }

    std::vector<NodeId> dependents_of(NodeId id) const
    {
        return to_ids(checked(id, "dependents_of").dependents);
    }

    size_t size() const { return arena_.size(); }

    bool empty() const { return arena_.empty(); }

    /**
     * @brief Write the topology in Graphviz dot format
     *
     * Edges point from an input to its reader. Fresh nodes are drawn solid,
     * stale ones dashed.
     */
    void write_dot(std::ostream& out) const
    {
        out << "digraph incgraph {\n";
        out << "  rankdir=BT;\n";
        out << "  node [shape=box];\n";
        for(size_t i = 0; i < arena_.size(); ++i) {
            const NodeData<T>& node = arena_[static_cast<NodeIndex_t>(i)];
            out << "  n" << i << " [label=\"";
            if(!node.label.empty())
                write_escaped(out, node.label);
            else
                out << "#" << i;
            out << "\\n" << node.kind << "\"";
            if(!node.is_fresh())
                out << ", style=dashed";
            out << "];\n";
            for(NodeIndex_t input : node.inputs)
                out << "  n" << input << " -> n" << i << ";\n";
        }
        out << "}\n";
    }

  private:
    NodeData<T>& checked(NodeId id, const char* context)
    {
        if(!arena_.contains(id))
            throw InvalidReferenceError(id, context);
        return arena_[id.index()];
    }

    const NodeData<T>& checked(NodeId id, const char* context) const
    {
        if(!arena_.contains(id))
            throw InvalidReferenceError(id, context);
        return arena_[id.index()];
    }

    // Escape the characters that would end or break a quoted dot string
    static void write_escaped(std::ostream& out, const std::string& text)
    {
        for(char c : text) {
            if(c == '"' || c == '\\')
                out << '\\';
            out << c;
        }
    }

    std::vector<NodeId> to_ids(const std::vector<NodeIndex_t>& indices) const
    {
        std::vector<NodeId> ids;
        ids.reserve(indices.size());
        for(NodeIndex_t index : indices)
            ids.push_back(arena_.id_of(index));
        return ids;
    }

    NodeArena<T> arena_;
    InputRegistry registry_;
    InvalidationEngine<T> invalidator_;
    EvaluationEngine<T> evaluator_;
};

} // namespace incgraph
