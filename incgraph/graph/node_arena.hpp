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
#include <functional>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// incgraph includes
#include <incgraph/graph/graph_common.hpp>
#include <incgraph/graph/graph_errors.hpp>

namespace incgraph {

/**
 * @brief Unified node data structure
 *
 * One struct represents both node kinds, discriminated by NodeKind:
 *
 * - kind == Input     → no inputs, no operation; cache holds the value set
 *                       from outside (std::nullopt while unset)
 * - kind == Operation → ordered inputs bound positionally to op; cache holds
 *                       the memoized result (std::nullopt while stale)
 *
 * Edges are stored as plain indices into the owning arena. `inputs` points to
 * strictly lower indices (nodes are appended after everything they read), so
 * any walk that resolves inputs before the node itself terminates.
 * `dependents` is the reverse adjacency, filled by the arena when a reader is
 * appended and never touched afterwards.
 */
template<typename T>
struct NodeData
{
    using Operation = std::function<T(const std::vector<T>&)>;

    // Cached value; std::nullopt means stale (or unset, for inputs)
    std::optional<T> cache;

    // Positional inputs, in the order the operation receives their values
    std::vector<NodeIndex_t> inputs;

    // Nodes reading this one, once per occurrence in their input list
    std::vector<NodeIndex_t> dependents;

    // Pure function of the input values (empty for input nodes)
    Operation op;

    // Registered input name, used for diagnostics only
    std::string label;

    NodeKind kind = NodeKind::Input;

    // Constructor for input nodes
    static NodeData input()
    {
        NodeData data;
        data.kind = NodeKind::Input;
        return data;
    }

    // Constructor for operation nodes
    static NodeData operation(std::vector<NodeIndex_t> inputs, Operation op)
    {
        NodeData data;
        data.kind = NodeKind::Operation;
        data.inputs = std::move(inputs);
        data.op = std::move(op);
        return data;
    }

    bool is_input() const { return kind == NodeKind::Input; }

    bool is_fresh() const { return cache.has_value(); }
};

/**
 * @brief Append-only store owning every node of one graph
 *
 * Nodes live in one contiguous vector indexed by construction order. The arena
 * is the only owner of node state; everything else refers to nodes by index or
 * by NodeId. There is no removal: the arena is destroyed as a unit.
 */
template<typename T>
class NodeArena
{
  private:
    std::vector<NodeData<T>> nodes_;
    GraphTag_t tag_;

  public:
    explicit NodeArena(size_t initial_capacity = 64)
        : tag_(detail::next_graph_tag())
    {
        this->reserve(initial_capacity);
    }

    // An id minted by one arena must never be valid in another
    NodeArena(const NodeArena&) = delete;
    NodeArena& operator=(const NodeArena&) = delete;

    NodeArena(NodeArena&& other) noexcept
        : nodes_(std::move(other.nodes_)), tag_(other.tag_)
    {
        other.tag_ = detail::next_graph_tag();
        other.nodes_.clear();
    }

    NodeArena& operator=(NodeArena&& other) noexcept
    {
        if(this != &other) {
            nodes_ = std::move(other.nodes_);
            tag_ = other.tag_;
            other.tag_ = detail::next_graph_tag();
            other.nodes_.clear();
        }
        return *this;
    }

    void reserve(size_t new_capacity)
    {
        nodes_.reserve(new_capacity);
    }

    // Add node to arena, wire the reverse edges of its inputs, and return its ID
    NodeId add(NodeData<T>&& node)
    {
        // Ensure we won't overflow the 32-bit NodeIndex_t
        if(nodes_.size() >= static_cast<size_t>(std::numeric_limits<NodeIndex_t>::max())) {
            throw std::length_error("Node arena exceeded maximum index for NodeId");
        }

        const auto id = static_cast<NodeIndex_t>(nodes_.size());

        for(NodeIndex_t input : node.inputs) {
            if(input >= id) {
                throw std::invalid_argument("Node inputs must refer to previously added nodes");
            }
        }
        // Append first: a failed append leaves the arena untouched
        nodes_.emplace_back(std::move(node));

        const std::vector<NodeIndex_t>& inputs = nodes_.back().inputs;
        size_t wired = 0;
        try {
            for(; wired < inputs.size(); ++wired)
                nodes_[inputs[wired]].dependents.push_back(id);
        } catch(...) {
            // Roll back so dependents only ever name existing readers
            for(size_t i = wired; i > 0; --i)
                nodes_[inputs[i - 1]].dependents.pop_back();
            nodes_.pop_back();
            throw;
        }

        return NodeId(id, tag_);
    }

    // Whether `id` was minted by this arena
    bool contains(const NodeId& id) const
    {
        return id.graph_tag() == tag_ && id.index() != INVALID_NODE_INDEX && static_cast<size_t>(id.index()) < nodes_.size();
    }

    // Reconstruct the handle of an index owned by this arena
    NodeId id_of(NodeIndex_t index) const
    {
        return NodeId(index, tag_);
    }

    // Checked access by handle
    NodeData<T>& at(const NodeId& id)
    {
        if(!contains(id))
            throw InvalidReferenceError(id, "node lookup");
        return nodes_[id.index()];
    }

    const NodeData<T>& at(const NodeId& id) const
    {
        if(!contains(id))
            throw InvalidReferenceError(id, "node lookup");
        return nodes_[id.index()];
    }

    // Unchecked access by index
    NodeData<T>& operator[](NodeIndex_t index)
    {
        return nodes_[index];
    }

    const NodeData<T>& operator[](NodeIndex_t index) const
    {
        return nodes_[index];
    }

    size_t size() const
    {
        return nodes_.size();
    }

    bool empty() const
    {
        return nodes_.empty();
    }

    GraphTag_t tag() const
    {
        return tag_;
    }
};

} // namespace incgraph
