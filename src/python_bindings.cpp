#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>

#include "wiresag/common.hpp"
#include "wiresag/wire.hpp"
#include "wiresag/wire_catalog.hpp"
#include "wiresag/polynomial.hpp"
#include "wiresag/dip_tension.hpp"
#include "wiresag/catenary.hpp"
#include "wiresag/span_analysis.hpp"

namespace py = pybind11;
using namespace wiresag;

PYBIND11_MODULE(_core, m) {
    m.doc() = "Overhead conductor sag and tension solver";

    m.attr("DEFAULT_CURVE_SAMPLES") = DEFAULT_CURVE_SAMPLES;
    m.attr("PARABOLIC_SAG_RATIO_LIMIT") = PARABOLIC_SAG_RATIO_LIMIT;

    // std::invalid_argument already maps to ValueError
    py::register_exception<NumericalDivergence>(m, "NumericalDivergence", PyExc_RuntimeError);

    // --- WireProperties ---
    py::class_<WireProperties>(m, "WireProperties")
        .def(py::init<>())
        .def(py::init<double>(), py::arg("unit_weight"),
             "Minimal record from unit weight (N/m)")
        .def(py::init<double, double, double, double>(),
             py::arg("unit_weight"), py::arg("cross_section"),
             py::arg("elastic_modulus"), py::arg("thermal_expansion"),
             "Create from unit weight (N/m), cross-section (m^2), modulus (Pa) "
             "and expansion coefficient (1/degC)")
        .def_readwrite("type", &WireProperties::type)
        .def_readwrite("unit_weight", &WireProperties::unit_weight, "N/m")
        .def_readwrite("cross_section", &WireProperties::cross_section, "m^2")
        .def_readwrite("elastic_modulus", &WireProperties::elastic_modulus, "Pa")
        .def_readwrite("thermal_expansion", &WireProperties::thermal_expansion, "1/degC")
        .def("axial_stiffness", &WireProperties::axial_stiffness, "EA (N)")
        .def("validate", &WireProperties::validate)
        .def("validate_thermal", &WireProperties::validate_thermal)
        .def("__repr__", [](const WireProperties& w) {
            return "<WireProperties '" + w.type + "' w=" + std::to_string(w.unit_weight) +
                   " A=" + std::to_string(w.cross_section) +
                   " E=" + std::to_string(w.elastic_modulus) + ">";
        });

    // --- WireRecord ---
    py::class_<WireRecord>(m, "WireRecord")
        .def(py::init<>())
        .def_readwrite("type", &WireRecord::type)
        .def_readwrite("name", &WireRecord::name)
        .def_readwrite("cross_section", &WireRecord::cross_section)
        .def_readwrite("diameter", &WireRecord::diameter)
        .def_readwrite("unit_weight", &WireRecord::unit_weight)
        .def_readwrite("resistance", &WireRecord::resistance)
        .def_readwrite("resistance_temp_coef", &WireRecord::resistance_temp_coef)
        .def_readwrite("breaking_strength", &WireRecord::breaking_strength)
        .def_readwrite("safety_factor", &WireRecord::safety_factor)
        .def_readwrite("elastic_modulus", &WireRecord::elastic_modulus)
        .def_readwrite("thermal_expansion", &WireRecord::thermal_expansion)
        .def("properties", &WireRecord::properties)
        .def("allowable_tension", &WireRecord::allowable_tension,
             "Breaking strength / safety factor (N)")
        .def("__repr__", [](const WireRecord& r) {
            return "<WireRecord '" + r.type + "' " + r.name + ">";
        });

    // --- WireCatalog ---
    py::class_<WireCatalog>(m, "WireCatalog")
        .def(py::init<>())
        .def("load_from_csv", &WireCatalog::load_from_csv, py::arg("filename"),
             "Load conductor table from CSV (display units converted to SI)")
        .def("load_from_records", &WireCatalog::load_from_records, py::arg("records"))
        .def("find", &WireCatalog::find, py::arg("type"),
             py::return_value_policy::reference_internal)
        .def("at", &WireCatalog::at, py::arg("type"),
             py::return_value_policy::reference_internal)
        .def("properties", &WireCatalog::properties, py::arg("type"))
        .def("types", &WireCatalog::types)
        .def_property_readonly("records", &WireCatalog::records)
        .def("__len__", &WireCatalog::size)
        .def("__contains__", [](const WireCatalog& c, const std::string& type) {
            return c.find(type) != nullptr;
        })
        .def("__repr__", [](const WireCatalog& c) {
            return "<WireCatalog " + std::to_string(c.size()) + " wires>";
        });

    // --- RootSelectionConfig ---
    py::class_<RootSelectionConfig> roots(m, "RootSelectionConfig");
    py::enum_<RootSelectionConfig::Policy>(roots, "Policy")
        .value("SMALLEST_POSITIVE", RootSelectionConfig::Policy::SMALLEST_POSITIVE)
        .value("UNIQUE_POSITIVE", RootSelectionConfig::Policy::UNIQUE_POSITIVE);
    roots
        .def(py::init<>())
        .def_readwrite("policy", &RootSelectionConfig::policy)
        .def_readwrite("imag_tolerance", &RootSelectionConfig::imag_tolerance)
        .def_readwrite("distinct_tolerance", &RootSelectionConfig::distinct_tolerance);

    m.def("real_cubic_roots", &real_cubic_roots,
          py::arg("a2"), py::arg("a1"), py::arg("a0"), py::arg("imag_tolerance") = 1e-9,
          "Real roots of x^3 + a2*x^2 + a1*x + a0, ascending");

    // --- Dip / tension ---
    py::class_<DipTension>(m, "DipTension")
        .def(py::init<>())
        .def_readwrite("dip", &DipTension::dip, "m")
        .def_readwrite("tension", &DipTension::tension, "N")
        .def("__repr__", [](const DipTension& s) {
            return "<DipTension dip=" + std::to_string(s.dip) +
                   " tension=" + std::to_string(s.tension) + ">";
        });

    py::class_<StateChangeCoefficients>(m, "StateChangeCoefficients")
        .def(py::init<>())
        .def_readonly("dip0", &StateChangeCoefficients::dip0)
        .def_readonly("d_arg2", &StateChangeCoefficients::d_arg2)
        .def_readonly("d_arg3", &StateChangeCoefficients::d_arg3)
        .def_readonly("t_arg2", &StateChangeCoefficients::t_arg2)
        .def_readonly("t_arg3", &StateChangeCoefficients::t_arg3);

    m.def("compute_dip", &compute_dip,
          py::arg("weight"), py::arg("span"), py::arg("tension"));
    m.def("compute_tension", &compute_tension,
          py::arg("weight"), py::arg("span"), py::arg("dip"));
    m.def("compute_dip_or_tension", &compute_dip_or_tension,
          py::arg("weight"), py::arg("span"),
          py::arg("dip") = py::none(), py::arg("tension") = py::none());
    m.def("state_change_coefficients", &state_change_coefficients,
          py::arg("wire"), py::arg("span"), py::arg("tension_ref"),
          py::arg("temperature"), py::arg("reference_temperature"));
    m.def("compute_temperature_adjusted", &compute_temperature_adjusted,
          py::arg("wire"), py::arg("span"), py::arg("tension_ref"),
          py::arg("temperature"), py::arg("reference_temperature"),
          py::arg("config") = RootSelectionConfig());
    m.def("temperature_sweep", &temperature_sweep,
          py::arg("wire"), py::arg("span"), py::arg("tension_ref"),
          py::arg("temperatures"), py::arg("reference_temperature"),
          py::arg("config") = RootSelectionConfig(), py::arg("max_threads") = 0,
          py::call_guard<py::gil_scoped_release>());

    // --- Curves ---
    py::class_<CatenaryCurve>(m, "CatenaryCurve")
        .def(py::init<>())
        .def_readwrite("x", &CatenaryCurve::x, "Horizontal distance (m)")
        .def_readwrite("y", &CatenaryCurve::y, "Height (m)")
        .def_readwrite("apex_offset", &CatenaryCurve::apex_offset)
        .def_readwrite("apex_height", &CatenaryCurve::apex_height)
        .def("num_samples", &CatenaryCurve::num_samples)
        .def("lowest_sample", &CatenaryCurve::lowest_sample);

    m.def("apex_offset", &apex_offset,
          py::arg("weight"), py::arg("span"), py::arg("tension"),
          py::arg("height_difference") = py::none());
    m.def("generate_curve", &generate_curve,
          py::arg("weight"), py::arg("span"), py::arg("tension"), py::arg("dip"),
          py::arg("height1"), py::arg("height2") = py::none(),
          py::arg("num_samples") = DEFAULT_CURVE_SAMPLES);

    // --- Span analysis ---
    py::class_<SpanScenario>(m, "SpanScenario")
        .def(py::init<>())
        .def_readwrite("span", &SpanScenario::span)
        .def_readwrite("height1", &SpanScenario::height1)
        .def_readwrite("height2", &SpanScenario::height2)
        .def_readwrite("dip", &SpanScenario::dip)
        .def_readwrite("tension", &SpanScenario::tension)
        .def_readwrite("reference_temperature", &SpanScenario::reference_temperature)
        .def_readwrite("temperatures", &SpanScenario::temperatures)
        .def_readwrite("num_samples", &SpanScenario::num_samples)
        .def_readwrite("root_selection", &SpanScenario::root_selection)
        .def("validate", &SpanScenario::validate);

    py::class_<SpanState>(m, "SpanState")
        .def(py::init<>())
        .def_readonly("temperature", &SpanState::temperature)
        .def_readonly("is_reference", &SpanState::is_reference)
        .def_readonly("dip", &SpanState::dip)
        .def_readonly("tension", &SpanState::tension)
        .def_readonly("apex_offset", &SpanState::apex_offset)
        .def_readonly("sag_ratio", &SpanState::sag_ratio)
        .def_readonly("tension_utilization", &SpanState::tension_utilization)
        .def_readonly("curve", &SpanState::curve)
        .def("__repr__", [](const SpanState& s) {
            return "<SpanState T=" + std::to_string(s.temperature) +
                   "degC dip=" + std::to_string(s.dip) +
                   " tension=" + std::to_string(s.tension) + ">";
        });

    py::class_<SpanReport>(m, "SpanReport")
        .def(py::init<>())
        .def_readonly("states", &SpanReport::states)
        .def("reference", &SpanReport::reference,
             py::return_value_policy::reference_internal)
        .def("max_dip", &SpanReport::max_dip)
        .def("max_tension", &SpanReport::max_tension)
        .def("lowest_point", &SpanReport::lowest_point);

    py::class_<SpanAnalyzer>(m, "SpanAnalyzer")
        .def(py::init<const WireProperties&, double>(),
             py::arg("wire"), py::arg("allowable_tension") = 0.0)
        .def("analyze", &SpanAnalyzer::analyze,
             py::arg("scenario"), py::arg("max_threads") = 0,
             "Reference state plus one state per scenario temperature",
             py::call_guard<py::gil_scoped_release>())
        .def_property_readonly("wire", &SpanAnalyzer::wire)
        .def_property_readonly("allowable_tension", &SpanAnalyzer::allowable_tension);
}
