// SPDX-License-Identifier: MIT

#include <pybind11/pybind11.h>
#include <pybind11/complex.h>
#include <pybind11/stl.h>
#include "photonic/simulator.hpp"
#include "photonic/codec.hpp"

namespace py = pybind11;
using namespace psx;

PYBIND11_MODULE(psx_python, m){
  py::register_exception<Error>(m, "PhotonicError");

  py::class_<Circuit>(m, "Circuit")
    .def(py::init<std::size_t>(), py::arg("modes"))
    .def_property_readonly("modes", &Circuit::modes)
    .def("__len__", &Circuit::size)
    .def("beamsplitter", [](Circuit& c, double R, double phi, std::size_t a, std::size_t b) -> Circuit& {
      return c.beamsplitter(R, phi, a, b);
    }, py::arg("R"), py::arg("phi"), py::arg("a"), py::arg("b"), py::return_value_policy::reference_internal)
    .def("phase_shifter", [](Circuit& c, double phi, std::size_t mode) -> Circuit& {
      return c.phase_shifter(phi, mode);
    }, py::arg("phi"), py::arg("mode"), py::return_value_policy::reference_internal)
    .def("unitary", [](const Circuit& c){
      auto U = compose(c);
      std::vector<std::vector<c64>> rows(U.modes, std::vector<c64>(U.modes));
      for (std::size_t i=0;i<U.modes;i++) for (std::size_t j=0;j<U.modes;j++) rows[i][j] = U(i,j);
      return rows;
    });

  m.def("amplitude", [](const Circuit& c, const FockState& in, const FockState& out, std::size_t max_photons){
    EngineOptions opts; opts.max_photons = max_photons;
    py::gil_scoped_release release;
    return amplitude(c, in, out, opts);
  }, py::arg("circuit"), py::arg("input"), py::arg("output"), py::arg("max_photons") = 24);

  m.def("distribution", [](const Circuit& c, const LabelMap& inputs, const LabelMap& outputs,
                           bool renormalize, unsigned threads){
    EngineOptions opts; opts.threads = threads;
    DistributionTable t;
    {
      py::gil_scoped_release release;
      t = distribution(c, inputs, outputs, renormalize ? Normalization::Renormalized : Normalization::Raw, opts);
    }
    py::dict d;
    for (std::size_t i=0;i<t.rows();++i)
      for (std::size_t j=0;j<t.cols();++j)
        d[py::make_tuple(t.inputs[i], t.outputs[j])] = t(i,j);
    return d;
  }, py::arg("circuit"), py::arg("inputs"), py::arg("outputs"), py::arg("renormalize") = false, py::arg("threads") = 1);
}
