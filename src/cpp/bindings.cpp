/*
    PyBind11 bindings for the copula multinomial signature engine
*/

#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>
#include "copula.h"
#include "dependence.h"
#include "grid.h"
#include "rank_stats.h"
#include "selector.h"
#include "signature.h"

namespace py = pybind11;

PYBIND11_MODULE(mnsig_cpp, m) {
    m.doc() = "C++ engine for copula family selection by multinomial signatures";

    py::enum_<mnsig::CopulaFamily>(m, "CopulaFamily")
        .value("Gaussian", mnsig::CopulaFamily::Gaussian)
        .value("T", mnsig::CopulaFamily::T)
        .value("Clayton", mnsig::CopulaFamily::Clayton)
        .value("Frank", mnsig::CopulaFamily::Frank)
        .value("Gumbel", mnsig::CopulaFamily::Gumbel);

    py::enum_<mnsig::DependencyKind>(m, "DependencyKind")
        .value("Kendall", mnsig::DependencyKind::Kendall)
        .value("Spearman", mnsig::DependencyKind::Spearman)
        .value("Native", mnsig::DependencyKind::Native);

    py::class_<mnsig::DependencySpec>(m, "DependencySpec")
        .def(py::init<>())
        .def_readwrite("kind", &mnsig::DependencySpec::kind)
        .def_readwrite("value", &mnsig::DependencySpec::value)
        .def_readwrite("correlation", &mnsig::DependencySpec::correlation)
        .def_readwrite("dof", &mnsig::DependencySpec::dof)
        .def_static("kendall", &mnsig::DependencySpec::kendall,
                    py::arg("tau"), py::arg("dof") = mnsig::DEFAULT_T_DOF)
        .def_static("spearman", &mnsig::DependencySpec::spearman,
                    py::arg("rho"), py::arg("dof") = mnsig::DEFAULT_T_DOF)
        .def_static("native", py::overload_cast<double>(&mnsig::DependencySpec::native),
                    py::arg("theta"))
        .def_static("native", py::overload_cast<const Eigen::Matrix2d&, int>(&mnsig::DependencySpec::native),
                    py::arg("correlation"), py::arg("dof") = 0);

    py::class_<mnsig::GridCell>(m, "GridCell")
        .def_readonly("u1v1", &mnsig::GridCell::u1v1)
        .def_readonly("u1v2", &mnsig::GridCell::u1v2)
        .def_readonly("u2v1", &mnsig::GridCell::u2v1)
        .def_readonly("u2v2", &mnsig::GridCell::u2v2);

    py::class_<mnsig::EmpiricalSignature>(m, "EmpiricalSignature")
        .def_readonly("rv1", &mnsig::EmpiricalSignature::rv1)
        .def_readonly("rv2", &mnsig::EmpiricalSignature::rv2)
        .def_readonly("esig", &mnsig::EmpiricalSignature::esig);

    py::class_<mnsig::SelectorConfig>(m, "SelectorConfig")
        .def(py::init<>())
        .def_readwrite("grid_size", &mnsig::SelectorConfig::grid_size)
        .def_readwrite("negative_tau_tolerance", &mnsig::SelectorConfig::negative_tau_tolerance)
        .def_readwrite("candidate_families", &mnsig::SelectorConfig::candidate_families)
        .def_readwrite("t_degrees_of_freedom", &mnsig::SelectorConfig::t_degrees_of_freedom)
        .def_readwrite("zero_mass_floor", &mnsig::SelectorConfig::zero_mass_floor);

    py::class_<mnsig::SelectionResult>(m, "SelectionResult")
        .def_readonly("family", &mnsig::SelectionResult::family)
        .def_readonly("parameter", &mnsig::SelectionResult::parameter)
        .def_readonly("tau_hat", &mnsig::SelectionResult::tau_hat)
        .def_readonly("divergences", &mnsig::SelectionResult::divergences)
        .def_readonly("rv1", &mnsig::SelectionResult::rv1)
        .def_readonly("rv2", &mnsig::SelectionResult::rv2)
        .def("admissible", &mnsig::SelectionResult::admissible);

    py::class_<mnsig::FamilySelector>(m, "FamilySelector")
        .def(py::init<>())
        .def(py::init<mnsig::SelectorConfig>(), py::arg("config"))
        .def("select", &mnsig::FamilySelector::select, py::arg("X"),
             R"pbdoc(
                Selects the copula family of the first two columns of X.

                Parameters
                ----------
                X : np.ndarray
                    M x N sample matrix (any margins)

                Returns
                -------
                SelectionResult
                    family (None if no family is admissible), native
                    parameter, empirical Kendall's tau and the KL divergence
                    of every candidate

                References
                ----------
                Elidan (2012) - "Lightning-speed Structure Learning of
                Nonlinear Continuous Networks", AISTATS
             )pbdoc")
        .def("select_pair", &mnsig::FamilySelector::select_pair,
             py::arg("X"), py::arg("dim1"), py::arg("dim2"))
        .def("select_all_pairs", &mnsig::FamilySelector::select_all_pairs, py::arg("X"))
        .def("select_from_signature", &mnsig::FamilySelector::select_from_signature,
             py::arg("empirical"), py::arg("tau_hat"));

    m.def("parse_family", &mnsig::parse_family, py::arg("name"));
    m.def("family_name", &mnsig::family_name, py::arg("family"));
    m.def("partition", &mnsig::partition, py::arg("K"),
          "Grid cells of the K x K partition in signature order");
    m.def("cvolume", &mnsig::cvolume,
          py::arg("family"), py::arg("u1v1"), py::arg("u1v2"), py::arg("u2v1"), py::arg("u2v2"),
          py::arg("dependency"),
          "Probability mass of a rectangle under a copula");
    m.def("copula_cdf", &mnsig::copula_cdf,
          py::arg("family"), py::arg("u"), py::arg("v"), py::arg("native"));
    m.def("copula_signature", &mnsig::copula_signature,
          py::arg("family"), py::arg("dependency"), py::arg("K"),
          "Theoretical multinomial signature of a copula family");
    m.def("empirical_signature", &mnsig::empirical_signature,
          py::arg("X"), py::arg("K"),
          "Empirical multinomial signature of every pair of columns");
    m.def("pseudo_observation_signature", &mnsig::pseudo_observation_signature,
          py::arg("U"), py::arg("K"),
          "Cell fractions of points already on the unit square");
    m.def("kl_divergence", &mnsig::kl_divergence, py::arg("p"), py::arg("q"));
    m.def("probability_integral_transform", &mnsig::probability_integral_transform, py::arg("X"));
    m.def("kendalls_tau", py::overload_cast<const Eigen::MatrixXd&>(&mnsig::kendalls_tau), py::arg("X"));
    m.def("kendalls_tau_matrix", &mnsig::kendalls_tau_matrix, py::arg("X"));
    m.def("invert_dependency", &mnsig::invert_dependency,
          py::arg("family"), py::arg("kind"), py::arg("value"), py::arg("dof") = mnsig::DEFAULT_T_DOF);
    m.def("select_family", &mnsig::select_family,
          py::arg("X"), py::arg("K") = mnsig::DEFAULT_GRID_SIZE,
          py::arg("families") = mnsig::SelectorConfig().candidate_families);

    m.attr("DEFAULT_GRID_SIZE") = mnsig::DEFAULT_GRID_SIZE;
    m.attr("DEFAULT_NEGATIVE_TAU_TOLERANCE") = mnsig::DEFAULT_NEGATIVE_TAU_TOLERANCE;
}
