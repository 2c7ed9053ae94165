// SPDX-License-Identifier: MIT

#include <pybind11/pybind11.h>
#include <pybind11/complex.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>
#include "qthought/errors.hpp"
#include "qthought/inference.hpp"
#include "qthought/quantum_system.hpp"
#include "qthought/quantum_tree.hpp"

namespace py = pybind11;
using namespace qth;

static Domain to_domain(const std::map<std::string, std::vector<std::string>>& d) {
  Domain out;
  for (const auto& [key, names] : d) out.push_back({ResourceSpec::parse(key), names});
  return out;
}

PYBIND11_MODULE(qthought_python, m){
  py::register_exception<ConfigError>(m, "ConfigError", PyExc_ValueError);
  py::register_exception<PreconditionError>(m, "PreconditionError", PyExc_RuntimeError);

  py::class_<Gate1q>(m, "Gate1q")
    .def("adjoint", &Gate1q::adjoint);
  auto g = m.def_submodule("gates");
  g.def("X", &gates::X);
  g.def("Y", &gates::Y);
  g.def("Z", &gates::Z);
  g.def("H", &gates::H);
  g.def("S", &gates::S);
  g.def("RX", &gates::RX);
  g.def("RY", &gates::RY);
  g.def("RZ", &gates::RZ);
  g.def("prepare", &gates::prepare);

  py::class_<Config>(m, "Config")
    .def(py::init<>())
    .def_readwrite("tolerance", &Config::tolerance)
    .def_readwrite("seed", &Config::seed)
    .def_readwrite("silent", &Config::silent)
    .def_readwrite("no_prediction_state", &Config::no_prediction_state);

  py::class_<Requirements>(m, "Requirements")
    .def(py::init<>())
    .def("add", [](Requirements& r, const std::map<std::string, std::vector<std::string>>& d){ r.add(to_domain(d)); })
    .def("__str__", &Requirements::str);

  py::class_<InferenceTable>(m, "InferenceTable")
    .def(py::init<std::string, int, std::string, int, InferenceMapping>())
    .def_property_readonly("input", &InferenceTable::input)
    .def_property_readonly("output", &InferenceTable::output)
    .def_property_readonly("table", &InferenceTable::table)
    .def("__getitem__", &InferenceTable::operator[])
    .def("__len__", &InferenceTable::size)
    .def("__eq__", [](const InferenceTable& a, const InferenceTable& b){ return a == b; })
    .def("__str__", &InferenceTable::str);

  py::class_<QuantumSystem>(m, "QuantumSystem")
    .def(py::init<Requirements, const Config&>(), py::arg("requirements"), py::arg("config") = Config{})
    .def_property_readonly("n_qubits", &QuantumSystem::n_qubits)
    .def_property_readonly("subsystems", &QuantumSystem::subsystems)
    .def("get_position", &QuantumSystem::get_position)
    .def("get_wavefunction", &QuantumSystem::get_wavefunction)
    .def("set_wavefunction", &QuantumSystem::set_wavefunction)
    .def("apply", &QuantumSystem::apply, py::arg("gate"), py::arg("target"), py::arg("controls") = std::vector<std::string>{})
    .def("prepare_value", &QuantumSystem::prepare_value)
    .def("observe", [](QuantumSystem& q, const std::string& memory, const std::string& observed, bool reverse){
        observe(q, memory, observed, reverse); }, py::arg("memory"), py::arg("observed"), py::arg("reverse") = false)
    .def("set_inference_table", &QuantumSystem::set_inference_table)
    .def("prep_inference", &QuantumSystem::prep_inference)
    .def("make_inference", &QuantumSystem::make_inference, py::arg("agent"), py::arg("reverse") = false)
    .def("subspace_of_state_n", &QuantumSystem::subspace_of_state_n)
    .def("project_to_subspace", &QuantumSystem::project_to_subspace)
    .def("possible_values", &QuantumSystem::possible_values)
    .def("readout", [](const QuantumSystem& q, const std::string& name, bool print_order){
        return q.readout(name, print_order ? BitOrder::Print : BitOrder::Internal); },
        py::arg("name"), py::arg("print_order") = false)
    .def("measure", &QuantumSystem::measure)
    .def("reset", &QuantumSystem::reset)
    .def("__str__", &QuantumSystem::str);

  py::class_<Protocol>(m, "Protocol")
    .def(py::init<>())
    .def("add_step", [](Protocol& p, const std::map<std::string, std::vector<std::string>>& domain,
                        const std::string& descr, int time, Action action, std::optional<std::string> branch_on){
        return p.add_step(ProtocolStep(to_domain(domain), descr, time, std::move(action), std::move(branch_on))); },
        py::arg("domain"), py::arg("descr"), py::arg("time"), py::arg("action"), py::arg("branch_on") = py::none())
    .def_property_readonly("requirements", &Protocol::requirements)
    .def("run", &Protocol::run, py::arg("qsys"), py::arg("t_start") = kTimeMin, py::arg("t_end") = kTimeMax)
    .def("get_times", &Protocol::get_times)
    .def("__str__", &Protocol::str);

  py::class_<QuantumTree>(m, "QuantumTree")
    .def(py::init<QuantumSystem>())
    .def("branch_out", &QuantumTree::branch_out)
    .def("split_branch", &QuantumTree::split_branch)
    .def("__len__", &QuantumTree::size)
    .def("__getitem__", [](QuantumTree& t, std::size_t i) -> QuantumSystem& { return t[i]; }, py::return_value_policy::reference_internal)
    .def_property_readonly("probabilities", &QuantumTree::probabilities)
    .def("run", [](QuantumTree& t, const Protocol& p, int t_start, int t_end){ p.run_manual(t, t_start, t_end); },
         py::arg("protocol"), py::arg("t_start") = kTimeMin, py::arg("t_end") = kTimeMax)
    .def("get_possible_outcomes", [](QuantumTree& t, const std::string& name){ return get_possible_outcomes(t, name); })
    .def("reset", [](QuantumTree& t){ reset(t); })
    .def("__str__", &QuantumTree::str);

  py::enum_<Strategy>(m, "Strategy")
    .value("Direct", Strategy::Direct)
    .value("Tree", Strategy::Tree);

  m.def("forward_inference", &forward_inference, py::arg("protocol"), py::arg("x"), py::arg("t_x"), py::arg("y"), py::arg("t_y"),
        py::arg("strategy") = Strategy::Direct, py::arg("config") = Config{});
  m.def("backward_inference", py::overload_cast<const InferenceTable&>(&backward_inference));
  m.def("consistency", &consistency);
}
