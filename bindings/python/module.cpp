/*
  Pybind11 module exposing TrustFlow-Core C++ APIs to Python.

  Notes:
    - Accepts NumPy arrays (C-contiguous) and converts to spans for zero-copy
      views where possible.
    - InvalidInput derives from std::invalid_argument and surfaces as ValueError.
*/
#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <cstring>
#include <string>
#include <vector>

#include "trustflow/core/edge_decay.hpp"
#include "trustflow/core/rank_flow.hpp"
#include "trustflow/core/teleport.hpp"
#include "trustflow/core/temporal_graph.hpp"
#include "trustflow/core/timeline.hpp"
#include "trustflow/core/types.hpp"

namespace py = pybind11;
using namespace trustflow::core;

// Helpers to check NumPy arrays
template <typename T>
static std::span<const T> as_span(const py::array& arr, const char* name) {
  if (!py::isinstance<py::array_t<T>>(arr)) {
    throw py::type_error(std::string(name) + ": expected numpy array of correct dtype");
  }
  if (!(arr.flags() & py::array::c_style)) {
    throw py::type_error(std::string(name) + ": array must be C-contiguous (use np.ascontiguousarray)");
  }
  auto buf = arr.request();
  if (buf.ndim != 1) {
    throw py::type_error(std::string(name) + ": expected a 1-D array");
  }
  return std::span<const T>(static_cast<const T*>(buf.ptr), static_cast<std::size_t>(buf.size));
}

template <typename T>
static py::array_t<T> to_array(const std::vector<T>& v) {
  py::array_t<T> arr(v.size());
  if (!v.empty()) std::memcpy(arr.mutable_data(), v.data(), v.size()*sizeof(T));
  return arr;
}

PYBIND11_MODULE(_trustflow_core, m) {
  m.doc() = "TrustFlow-Core C++ bindings";

  py::class_<Edge>(m, "Edge")
      .def(py::init([](NodeId source, NodeId target, Timestamp creation_time){
        return Edge{source, target, creation_time};
      }), py::arg("source"), py::arg("target"), py::arg("creation_time"))
      .def_readonly("source", &Edge::source)
      .def_readonly("target", &Edge::target)
      .def_readonly("creation_time", &Edge::creation_time)
      .def("__repr__", [](const Edge& e){
        return "Edge(" + std::to_string(e.source) + ", " + std::to_string(e.target) + ", " +
               std::to_string(e.creation_time) + ")";
      });

  py::class_<TemporalGraph>(m, "TemporalGraph")
      .def_static(
          "from_arrays",
          [](std::int32_t num_nodes, py::array src, py::array dst, py::array creation_time) {
            auto src_s = as_span<std::int32_t>(src, "src");
            auto dst_s = as_span<std::int32_t>(dst, "dst");
            // Accept any integer dtype for creation_time; force-cast to int64
            py::array_t<std::int64_t, py::array::c_style | py::array::forcecast> t_i64(creation_time);
            auto tbuf = t_i64.request();
            std::span<const Timestamp> t_s(static_cast<const Timestamp*>(tbuf.ptr), static_cast<std::size_t>(tbuf.size));
            return TemporalGraph::from_arrays(num_nodes, src_s, dst_s, t_s);
          },
          py::arg("num_nodes"), py::arg("src"), py::arg("dst"), py::arg("creation_time"))
      .def("num_nodes", &TemporalGraph::num_nodes)
      .def("num_edges", &TemporalGraph::num_edges)
      .def("edges", [](const TemporalGraph& g){
        auto s = g.edges();
        return std::vector<Edge>(s.begin(), s.end());
      })
      .def("out_degree_view", [](const TemporalGraph& g){
        auto s = g.out_degree_view();
        return to_array(std::vector<std::int32_t>(s.begin(), s.end()));
      });

  m.def("current_weight", &current_weight,
        py::arg("edge"), py::arg("query_time"), py::arg("decay_constant"));

  m.def("decayed_weights",
        [](const TemporalGraph& g, Timestamp query_time, double decay_constant) {
          return to_array(decayed_weights(g, query_time, decay_constant));
        }, py::arg("g"), py::arg("query_time"), py::arg("decay_constant"));

  m.def("build_teleport_vector",
        [](std::int32_t num_nodes, std::vector<NodeId> experts, double expert_fraction) {
          return to_array(build_teleport_vector(num_nodes, experts, expert_fraction));
        }, py::arg("num_nodes"), py::arg("experts"), py::arg("expert_fraction"));

  m.def("rank_flow",
        [](const TemporalGraph& g, py::array weights, py::array teleport,
           double damping_factor, std::int32_t iterations) {
          auto w_s = as_span<double>(weights, "weights");
          auto t_s = as_span<double>(teleport, "teleport");
          std::vector<Rank> out;
          {
            py::gil_scoped_release release;
            out = rank_flow(g, w_s, t_s, damping_factor, iterations);
          }
          return to_array(out);
        }, py::arg("g"), py::arg("weights"), py::arg("teleport"), py::kw_only(),
        py::arg("damping_factor") = kDefaultDampingFactor,
        py::arg("iterations") = kDefaultIterations);

  m.def("rank_timeline",
        [](const TemporalGraph& g, std::vector<NodeId> experts, double decay_constant,
           Timestamp max_time, double expert_fraction, double damping_factor,
           std::int32_t iterations) {
          TimelineOptions opts;
          opts.decay_constant = decay_constant;
          opts.max_time = max_time;
          opts.expert_fraction = expert_fraction;
          opts.rank.damping_factor = damping_factor;
          opts.rank.iterations = iterations;
          std::vector<RankSnapshot> snaps;
          {
            py::gil_scoped_release release;
            snaps = rank_timeline(g, experts, opts);
          }
          py::list out;
          for (const auto& s : snaps) {
            out.append(py::make_tuple(s.time, to_array(s.weights), to_array(s.ranks)));
          }
          return out;
        }, py::arg("g"), py::arg("experts"), py::kw_only(),
        py::arg("decay_constant") = kDefaultDecayConstant,
        py::arg("max_time") = kDefaultMaxTime,
        py::arg("expert_fraction") = kDefaultExpertFraction,
        py::arg("damping_factor") = kDefaultDampingFactor,
        py::arg("iterations") = kDefaultIterations);
}
