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
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <ostream>

namespace incgraph {

// Forward declarations
template<typename T>
struct NodeData;
template<typename T>
class NodeArena;
template<typename T>
class CompGraph;

// Use a 32-bit index type for node IDs. This reduces per-node memory
// footprint on 64-bit platforms when arena sizes fit within 32 bits.
using NodeIndex_t = uint32_t;
using GraphTag_t = uint32_t;

static_assert(sizeof(NodeIndex_t) == 4, "NodeIndex_t must be 32-bit");

// Invalid node index constant
constexpr NodeIndex_t INVALID_NODE_INDEX = std::numeric_limits<NodeIndex_t>::max();

// Tag 0 is never handed out to a graph
constexpr GraphTag_t INVALID_GRAPH_TAG = 0;

/**
 * @brief Node kind enumeration
 *
 * - Input: leaf holding an externally supplied value (or unset)
 * - Operation: pure function of the ordered values of its inputs
 */
enum class NodeKind : uint8_t
{
    Input,
    Operation
};

inline std::ostream& operator<<(std::ostream& out, NodeKind kind)
{
    switch(kind) {
    case NodeKind::Input:
        return out << "input";
    case NodeKind::Operation:
        return out << "operation";
    }
    return out << "unknown";
}

/**
 * @brief Opaque handle to a node of one graph
 *
 * A NodeId pairs the construction index of the node with the tag of the arena
 * that minted it. Only a NodeArena can create a valid id, so an id always
 * refers to an existing node of its own graph; the tag lets every other graph
 * reject it. A default-constructed NodeId is invalid.
 */
class NodeId
{
  public:
    NodeId() = default;

    NodeIndex_t index() const { return index_; }

    GraphTag_t graph_tag() const { return tag_; }

    bool valid() const { return index_ != INVALID_NODE_INDEX && tag_ != INVALID_GRAPH_TAG; }

    friend bool operator==(const NodeId& l, const NodeId& r) { return l.index_ == r.index_ && l.tag_ == r.tag_; }
    friend bool operator!=(const NodeId& l, const NodeId& r) { return !(l == r); }

    // Orders by graph first, then by construction order
    friend bool operator<(const NodeId& l, const NodeId& r)
    {
        return l.tag_ != r.tag_ ? l.tag_ < r.tag_ : l.index_ < r.index_;
    }

    friend std::ostream& operator<<(std::ostream& out, const NodeId& id)
    {
        if(!id.valid())
            return out << "NodeId(invalid)";
        return out << "NodeId(" << id.index_ << "@" << id.tag_ << ")";
    }

  private:
    template<typename T>
    friend class NodeArena;

    NodeId(NodeIndex_t index, GraphTag_t tag)
        : index_(index), tag_(tag)
    {
    }

    NodeIndex_t index_ = INVALID_NODE_INDEX;
    GraphTag_t tag_ = INVALID_GRAPH_TAG;
};

namespace detail {

// Process-wide source of arena tags. Wraps around after 2^32 - 1 graphs,
// skipping the invalid tag.
inline GraphTag_t next_graph_tag()
{
    static std::atomic<GraphTag_t> counter{INVALID_GRAPH_TAG};
    GraphTag_t tag = ++counter;
    while(tag == INVALID_GRAPH_TAG)
        tag = ++counter;
    return tag;
}

} // namespace detail

} // namespace incgraph

namespace std {

template<>
struct hash<incgraph::NodeId>
{
    size_t operator()(const incgraph::NodeId& id) const noexcept
    {
        const uint64_t key = (static_cast<uint64_t>(id.graph_tag()) << 32) | id.index();
        return std::hash<uint64_t>{}(key);
    }
};

} // namespace std
