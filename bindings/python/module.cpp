/*
  Pybind11 module exposing KeyGraph-Core to Python.

  Notes:
    - Node values are arbitrary Python objects ordered with Python's `<`;
      all nodes of one graph must be mutually comparable.
    - Selectors are small value classes (AllVertices(), SingleVertex(n), ...)
      accepted wherever a selector is expected.
    - Unreachable distances come back as None. Engine failures raise
      RuntimeError, an absent shortest-path endpoint raises ValueError.
*/
#include <pybind11/operators.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "keygraph/core/algorithms.hpp"
#include "keygraph/core/error.hpp"
#include "keygraph/core/graph.hpp"
#include "keygraph/core/types.hpp"
#include "keygraph/core/vertex_selector.hpp"

namespace py = pybind11;
using namespace keygraph::core;

using PyGraph = Graph<py::object>;
using PyEdge = Edge<py::object>;
using PySelector = VertexSelector<py::object>;

namespace {
py::tuple edge_tuple(const PyEdge& e) {
  return py::make_tuple(e.from, e.to);
}
} // namespace

PYBIND11_MODULE(_keygraph_core, m) {
  m.doc() = "KeyGraph-Core C++ bindings";

  py::register_exception<EngineError>(m, "EngineError", PyExc_RuntimeError);
  py::register_exception<NodeNotFound>(m, "NodeNotFound", PyExc_ValueError);

  py::enum_<Directedness>(m, "Directedness")
      .value("UNDIRECTED", Directedness::Undirected)
      .value("DIRECTED", Directedness::Directed);

  py::enum_<NeiMode>(m, "NeiMode")
      .value("OUT", NeiMode::Out)
      .value("IN", NeiMode::In)
      .value("ALL", NeiMode::All);

  py::enum_<Connectedness>(m, "Connectedness")
      .value("WEAK", Connectedness::Weak)
      .value("STRONG", Connectedness::Strong);

  py::class_<PyEdge>(m, "Edge")
      .def(py::init([](py::object source, py::object target, Directedness d) {
             return PyEdge{std::move(source), std::move(target), std::nullopt, d};
           }),
           py::arg("source"), py::arg("target"), py::arg("directedness") = Directedness::Directed)
      .def_readonly("source", &PyEdge::from)
      .def_readonly("target", &PyEdge::to)
      .def_readonly("id", &PyEdge::id)
      .def_readonly("directedness", &PyEdge::directedness)
      .def(py::self == py::self)
      .def("__iter__", [](const PyEdge& e) { return py::iter(edge_tuple(e)); })
      .def("__repr__", [](const PyEdge& e) {
        return "Edge(" + py::repr(e.from).cast<std::string>() + ", " +
               py::repr(e.to).cast<std::string>() + ")";
      });

  // Selector kinds
  py::class_<AllVertices>(m, "AllVertices").def(py::init<>());
  py::class_<NoVertices>(m, "NoVertices").def(py::init<>());
  py::class_<SingleVertex<py::object>>(m, "SingleVertex")
      .def(py::init([](py::object node) { return SingleVertex<py::object>{std::move(node)}; }), py::arg("node"))
      .def_readonly("node", &SingleVertex<py::object>::node);
  py::class_<AdjacentTo<py::object>>(m, "AdjacentTo")
      .def(py::init([](py::object node, NeiMode mode) { return AdjacentTo<py::object>{std::move(node), mode}; }),
           py::arg("node"), py::arg("mode") = NeiMode::All)
      .def_readonly("node", &AdjacentTo<py::object>::node)
      .def_readonly("mode", &AdjacentTo<py::object>::mode);
  py::class_<NonadjacentTo<py::object>>(m, "NonadjacentTo")
      .def(py::init([](py::object node, NeiMode mode) { return NonadjacentTo<py::object>{std::move(node), mode}; }),
           py::arg("node"), py::arg("mode") = NeiMode::All)
      .def_readonly("node", &NonadjacentTo<py::object>::node)
      .def_readonly("mode", &NonadjacentTo<py::object>::mode);
  py::class_<ExplicitList<py::object>>(m, "ExplicitList")
      .def(py::init([](std::vector<py::object> nodes) { return ExplicitList<py::object>{std::move(nodes)}; }),
           py::arg("nodes"))
      .def_readonly("nodes", &ExplicitList<py::object>::nodes);
  py::class_<ContiguousRange<py::object>>(m, "ContiguousRange")
      .def(py::init([](py::object from, py::object to) {
             return ContiguousRange<py::object>{std::move(from), std::move(to)};
           }),
           py::arg("from_node"), py::arg("to_node"))
      .def_readonly("from_node", &ContiguousRange<py::object>::from)
      .def_readonly("to_node", &ContiguousRange<py::object>::to);

  py::class_<PyGraph>(m, "Graph")
      .def(py::init([](Directedness d) { return PyGraph::empty(d); }),
           py::arg("directedness") = Directedness::Undirected)
      .def_static(
          "from_list",
          [](const std::vector<std::pair<py::object, py::object>>& edges,
             Directedness d,
             const std::vector<py::object>& nodes) {
            return PyGraph::from_list(d, nodes, edges);
          },
          py::arg("edges"), py::kw_only(),
          py::arg("directedness") = Directedness::Undirected,
          py::arg("nodes") = std::vector<py::object>{})
      .def("copy", [](const PyGraph& g) { return PyGraph(g); })
      .def("__copy__", [](const PyGraph& g) { return PyGraph(g); })
      .def_property_readonly("directed", &PyGraph::is_directed)
      .def("insert_node", &PyGraph::insert_node, py::arg("node"))
      .def("insert_edge", &PyGraph::insert_edge, py::arg("source"), py::arg("target"))
      .def("delete_edge", &PyGraph::delete_edge, py::arg("source"), py::arg("target"))
      .def("delete_node", &PyGraph::delete_node, py::arg("node"))
      .def("number_of_nodes", &PyGraph::number_of_nodes)
      .def("number_of_edges", &PyGraph::number_of_edges)
      .def("member", &PyGraph::member, py::arg("node"))
      .def("__contains__", &PyGraph::member)
      .def("__len__", &PyGraph::number_of_nodes)
      .def("nodes", &PyGraph::nodes)
      .def("edges", &PyGraph::edges)
      .def("neighbours", &PyGraph::neighbours, py::arg("node"), py::arg("mode") = NeiMode::All)
      .def("vertex_id", &PyGraph::id_of, py::arg("node"))
      .def("selector_size", [](const PyGraph& g, const PySelector& sel) {
        return selector_size(sel, g);
      }, py::arg("selector"))
      .def("selected_vertices", [](const PyGraph& g, const PySelector& sel) {
        return selected_vertices(sel, g);
      }, py::arg("selector"))
      .def("are_connected", [](const PyGraph& g, const py::object& a, const py::object& b) {
        return are_connected(g, a, b);
      }, py::arg("source"), py::arg("target"))
      .def("get_shortest_path", [](const PyGraph& g, const py::object& a, const py::object& b, NeiMode mode) {
        auto p = get_shortest_path(g, a, b, mode);
        return py::make_tuple(std::move(p.vertices), std::move(p.edges));
      }, py::arg("source"), py::arg("target"), py::arg("mode"))
      .def("shortest_paths", [](const PyGraph& g, const PySelector& from, const PySelector& to, NeiMode mode) {
        return shortest_paths(g, from, to, mode);
      }, py::arg("from_selector"), py::arg("to_selector"), py::arg("mode"))
      .def("subcomponent", [](const PyGraph& g, const py::object& n, NeiMode mode) {
        return subcomponent(g, n, mode);
      }, py::arg("node"), py::arg("mode") = NeiMode::All)
      .def("subgraph", [](const PyGraph& g, const PySelector& sel) {
        return subgraph(g, sel);
      }, py::arg("selector"))
      .def("is_connected", [](const PyGraph& g, Connectedness c) {
        return is_connected(g, c);
      }, py::arg("mode") = Connectedness::Weak);
}
