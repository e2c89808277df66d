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

// incgraph includes
#include <incgraph/graph/graph_errors.hpp>
using namespace incgraph;

void export_errors(py::module& m)
{
    py::enum_<ErrorKind>(m, "ErrorKind")
        .value("UnknownInputName", ErrorKind::UnknownInputName)
        .value("UnsetInput", ErrorKind::UnsetInput)
        .value("InvalidReference", ErrorKind::InvalidReference)
        .value("DuplicateInputName", ErrorKind::DuplicateInputName)
        .value("NotAnInput", ErrorKind::NotAnInput)
        ;

    // Base first: translators registered later are tried first, so each
    // specific error maps to its own class, deriving from GraphError
    auto& graph_error = py::register_exception<GraphError>(m, "GraphError", PyExc_RuntimeError);
    py::register_exception<UnknownInputNameError>(m, "UnknownInputNameError", graph_error.ptr());
    py::register_exception<UnsetInputError>(m, "UnsetInputError", graph_error.ptr());
    py::register_exception<InvalidReferenceError>(m, "InvalidReferenceError", graph_error.ptr());
    py::register_exception<DuplicateInputNameError>(m, "DuplicateInputNameError", graph_error.ptr());
    py::register_exception<NotAnInputError>(m, "NotAnInputError", graph_error.ptr());
}
