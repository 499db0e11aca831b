// src_cpp/bindings/pybind_module.cpp
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <string>
#include <vector>

#include "sitnikov/api.hpp"
#include "sitnikov/errors.hpp"
#include "sitnikov/models/sitnikov.hpp"
#include "sitnikov/types.hpp"

namespace py = pybind11;

// Physics helpers evaluated on a throwaway model with the given orbit
static sitnikov::Model orbit_model(double e, double tau) {
    sitnikov::ModelCfg cfg;
    cfg.e = e;
    cfg.tau = tau;
    return sitnikov::Model(cfg);
}

PYBIND11_MODULE(_engine, m) {
    m.doc() = "sitnikov C++ engine (pybind11)";

    m.def("hello", []() { return std::string("sitnikov C++ engine: OK"); });

    py::register_exception<sitnikov::Error>(m, "Error", PyExc_RuntimeError);
    py::register_exception<sitnikov::ConfigurationInvalid>(m, "ConfigurationInvalid", PyExc_ValueError);

    py::enum_<sitnikov::Method>(m, "Method")
        .value("RUNGE_KUTTA_4TH", sitnikov::Method::RUNGE_KUTTA_4TH)
        .value("LEAPFROG", sitnikov::Method::LEAPFROG)
        .value("YOSHIDA_4TH", sitnikov::Method::YOSHIDA_4TH);

    py::enum_<sitnikov::MegnoMethod>(m, "MegnoMethod")
        .value("VARIATIONAL", sitnikov::MegnoMethod::VARIATIONAL)
        .value("TRAPEZOIDAL", sitnikov::MegnoMethod::TRAPEZOIDAL);

    py::enum_<sitnikov::Status>(m, "Status")
        .value("OK", sitnikov::Status::OK)
        .value("ERROR", sitnikov::Status::ERROR);

    py::class_<sitnikov::ModelCfg>(m, "ModelCfg")
        .def(py::init<>())
        .def_readwrite("e", &sitnikov::ModelCfg::e)
        .def_readwrite("tau", &sitnikov::ModelCfg::tau)
        .def_readwrite("t_0", &sitnikov::ModelCfg::t_0)
        .def_readwrite("z_0", &sitnikov::ModelCfg::z_0)
        .def_readwrite("z_v_0", &sitnikov::ModelCfg::z_v_0)
        .def_readwrite("h", &sitnikov::ModelCfg::h)
        .def_readwrite("periods", &sitnikov::ModelCfg::periods)
        .def_readwrite("compute_megno", &sitnikov::ModelCfg::compute_megno)
        .def_readwrite("method", &sitnikov::ModelCfg::method)
        .def_readwrite("megno_method", &sitnikov::ModelCfg::megno_method);

    py::class_<sitnikov::TrajectorySitnikov>(m, "TrajectorySitnikov")
        .def_readonly("t", &sitnikov::TrajectorySitnikov::t)
        .def_readonly("z", &sitnikov::TrajectorySitnikov::z)
        .def_readonly("z_v", &sitnikov::TrajectorySitnikov::z_v)
        .def_readonly("megno", &sitnikov::TrajectorySitnikov::megno)
        .def_readonly("mean_megno", &sitnikov::TrajectorySitnikov::mean_megno)
        .def_readonly("status", &sitnikov::TrajectorySitnikov::status)
        .def_readonly("message", &sitnikov::TrajectorySitnikov::message)
        .def_readonly("e", &sitnikov::TrajectorySitnikov::e)
        .def_readonly("tau", &sitnikov::TrajectorySitnikov::tau)
        .def_readonly("h", &sitnikov::TrajectorySitnikov::h)
        .def_readonly("n", &sitnikov::TrajectorySitnikov::n)
        .def_readonly("i_m", &sitnikov::TrajectorySitnikov::i_m);

    m.def("simulate_sitnikov", py::overload_cast<const sitnikov::ModelCfg&>(&sitnikov::simulate_sitnikov),
          py::arg("cfg"),
          "Simulate the Sitnikov problem with a fixed-step integrator, optionally computing MEGNOs.");

    m.def("eccentric_anomaly",
          [](double e, double m_anomaly) { return orbit_model(e, 0.0).eccentric_anomaly(m_anomaly); },
          py::arg("e"), py::arg("m"),
          "Eccentric anomaly from the eccentricity and the mean anomaly (radians).");

    m.def("radius",
          [](double e, double t, double tau) { return orbit_model(e, tau).radius(t); },
          py::arg("e"), py::arg("t"), py::arg("tau") = 0.0,
          "Distance from the barycenter to either of the primaries at time t.");

    m.def("acceleration",
          [](double e, double t, double z, double tau) { return orbit_model(e, tau).acceleration(t, z); },
          py::arg("e"), py::arg("t"), py::arg("z"), py::arg("tau") = 0.0,
          "Acceleration of the third body at time t and position z.");
}
