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
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>

// incgraph includes
#include <incgraph/graph/graph_common.hpp>

namespace incgraph {

/**
 * @brief Failure categories reported by the graph
 *
 * - UnknownInputName: an input was addressed by a name that was never registered
 * - UnsetInput: evaluation reached an input node whose value was never provided
 * - InvalidReference: a NodeId that does not belong to the graph was used
 * - DuplicateInputName: a name was registered twice
 * - NotAnInput: an input-only operation was applied to an operation node
 */
enum class ErrorKind : uint8_t
{
    UnknownInputName,
    UnsetInput,
    InvalidReference,
    DuplicateInputName,
    NotAnInput
};

inline const char* to_string(ErrorKind kind)
{
    switch(kind) {
    case ErrorKind::UnknownInputName:
        return "UnknownInputName";
    case ErrorKind::UnsetInput:
        return "UnsetInput";
    case ErrorKind::InvalidReference:
        return "InvalidReference";
    case ErrorKind::DuplicateInputName:
        return "DuplicateInputName";
    case ErrorKind::NotAnInput:
        return "NotAnInput";
    }
    return "Unknown";
}

inline std::ostream& operator<<(std::ostream& out, ErrorKind kind)
{
    return out << to_string(kind);
}

/**
 * @brief Base class of every error raised by the graph engine
 *
 * The graph stays usable after any GraphError: a failed operation never leaves
 * a cached value that disagrees with the current inputs.
 */
class GraphError : public std::runtime_error
{
  public:
    GraphError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind)
    {
    }

    ErrorKind kind() const noexcept { return kind_; }

  private:
    ErrorKind kind_;
};

class UnknownInputNameError : public GraphError
{
  public:
    explicit UnknownInputNameError(const std::string& name)
        : GraphError(ErrorKind::UnknownInputName, "no input registered under the name '" + name + "'"), name_(name)
    {
    }

    const std::string& name() const noexcept { return name_; }

  private:
    std::string name_;
};

class DuplicateInputNameError : public GraphError
{
  public:
    explicit DuplicateInputNameError(const std::string& name)
        : GraphError(ErrorKind::DuplicateInputName, "an input is already registered under the name '" + name + "'"), name_(name)
    {
    }

    const std::string& name() const noexcept { return name_; }

  private:
    std::string name_;
};

class UnsetInputError : public GraphError
{
  public:
    UnsetInputError(NodeId node, const std::string& name)
        : GraphError(ErrorKind::UnsetInput, describe(node, name)), node_(node), name_(name)
    {
    }

    NodeId node() const noexcept { return node_; }

    // Registered name of the input, empty if it has none
    const std::string& name() const noexcept { return name_; }

  private:
    static std::string describe(NodeId node, const std::string& name)
    {
        std::ostringstream ss;
        ss << "input data has not been set for ";
        if(name.empty())
            ss << node;
        else
            ss << "'" << name << "' (" << node << ")";
        return ss.str();
    }

    NodeId node_;
    std::string name_;
};

class InvalidReferenceError : public GraphError
{
  public:
    InvalidReferenceError(NodeId node, const std::string& context)
        : GraphError(ErrorKind::InvalidReference, describe(node, context)), node_(node)
    {
    }

    NodeId node() const noexcept { return node_; }

  private:
    static std::string describe(NodeId node, const std::string& context)
    {
        std::ostringstream ss;
        ss << context << ": " << node << " does not belong to this graph";
        return ss.str();
    }

    NodeId node_;
};

class NotAnInputError : public GraphError
{
  public:
    NotAnInputError(NodeId node, const std::string& context)
        : GraphError(ErrorKind::NotAnInput, describe(node, context)), node_(node)
    {
    }

    NodeId node() const noexcept { return node_; }

  private:
    static std::string describe(NodeId node, const std::string& context)
    {
        std::ostringstream ss;
        ss << context << ": " << node << " is an operation node, not an input";
        return ss.str();
    }

    NodeId node_;
};

} // namespace incgraph
