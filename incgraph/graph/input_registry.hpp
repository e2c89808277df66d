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
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// incgraph includes
#include <incgraph/graph/graph_common.hpp>
#include <incgraph/graph/graph_errors.hpp>

namespace incgraph {

/**
 * @brief Symbolic names for input nodes
 *
 * Maps external names to the NodeId of a leaf so that mutators can address
 * inputs by name. Names are unique: binding a name twice is an error rather
 * than a silent overwrite.
 */
class InputRegistry
{
  private:
    std::unordered_map<std::string, NodeId> inputs_;

  public:
    void add(const std::string& name, NodeId id)
    {
        auto [it, inserted] = inputs_.emplace(name, id);
        if(!inserted)
            throw DuplicateInputNameError(name);
    }

    NodeId at(const std::string& name) const
    {
        auto it = inputs_.find(name);
        if(it == inputs_.end())
            throw UnknownInputNameError(name);
        return it->second;
    }

    std::optional<NodeId> find(const std::string& name) const
    {
        auto it = inputs_.find(name);
        if(it == inputs_.end())
            return std::nullopt;
        return it->second;
    }

    bool contains(const std::string& name) const
    {
        return inputs_.count(name) != 0;
    }

    size_t size() const
    {
        return inputs_.size();
    }

    bool empty() const
    {
        return inputs_.empty();
    }

    // Registered names in lexicographic order
    std::vector<std::string> names() const
    {
        std::vector<std::string> result;
        result.reserve(inputs_.size());
        for(const auto& [name, id] : inputs_)
            result.push_back(name);
        std::sort(result.begin(), result.end());
        return result;
    }
};

} // namespace incgraph
