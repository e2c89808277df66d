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

// pybind11 includes
#include "pybind11.hxx"

// C++ includes
#include <sstream>

// incgraph includes
#include <incgraph/graph/comp_graph.hpp>
using namespace incgraph;

void export_node_id(py::module& m)
{
    py::class_<NodeId>(m, "NodeId")
        .def(py::init<>())
        .def_property_readonly("index", &NodeId::index)
        .def_property_readonly("graph_tag", &NodeId::graph_tag)
        .def("valid", &NodeId::valid)
        .def(py::self == py::self)
        .def(py::self != py::self)
        .def(py::self < py::self)
        .def("__hash__", [](const NodeId& id) { return std::hash<NodeId>{}(id); })
        .def("__repr__", [](const NodeId& id) { std::stringstream ss; ss << id; return ss.str(); })
        ;
}

void export_graph(py::module& m)
{
    using Graph = CompGraph<double>;

    py::class_<Graph>(m, "Graph")
        .def(py::init<size_t>(), py::arg("initial_capacity") = 64)
        .def("add_input_node", py::overload_cast<>(&Graph::add_input_node))
        .def("add_input_node", py::overload_cast<const std::string&>(&Graph::add_input_node), py::arg("name"))
        .def("add_node", py::overload_cast<const std::vector<NodeId>&, Graph::Operation>(&Graph::add_node), py::arg("inputs"), py::arg("op"))
        .def("register_input", &Graph::register_input, py::arg("name"), py::arg("id"))
        .def("set_input", py::overload_cast<const std::string&, double>(&Graph::set_input), py::arg("name"), py::arg("value"))
        .def("set_input", py::overload_cast<NodeId, double>(&Graph::set_input), py::arg("id"), py::arg("value"))
        .def("invalidate", &Graph::invalidate, py::arg("id"))
        .def("compute", &Graph::compute, py::arg("id"))
        .def("cached", &Graph::cached, py::arg("id"))
        .def("is_fresh", &Graph::is_fresh, py::arg("id"))
        .def("input_id", &Graph::input_id, py::arg("name"))
        .def("has_input", &Graph::has_input, py::arg("name"))
        .def("input_names", &Graph::input_names)
        .def("is_input", &Graph::is_input, py::arg("id"))
        .def("inputs_of", &Graph::inputs_of, py::arg("id"))
        .def("dependents_of", &Graph::dependents_of, py::arg("id"))
        .def("evaluation_count", &Graph::evaluation_count)
        .def("reset_evaluation_count", &Graph::reset_evaluation_count)
        .def("to_dot", [](const Graph& g) { std::stringstream ss; g.write_dot(ss); return ss.str(); })
        .def("__len__", &Graph::size)
        .def("__contains__", &Graph::contains)
        ;
}
