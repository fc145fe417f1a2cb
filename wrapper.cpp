#include <pybind11/operators.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <string>

#include "sigqalc/errors.hpp"
#include "sigqalc/quantity.hpp"
#include "sigqalc/rational.hpp"
#include "sigqalc/rounding.hpp"
#include "sigqalc/units.hpp"

namespace py = pybind11;

using namespace sigqalc;

PYBIND11_MODULE(sigqalc, m) {
    m.doc() = "Measured quantities with error propagation and significant-error formatting";

    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const PreconditionViolation &e) {
            PyErr_SetString(PyExc_ValueError, e.what());
        }
    });

    py::enum_<ErrorPropagation>(m, "ErrorPropagation")
        .value("WORST_CASE", ErrorPropagation::WORST_CASE)
        .value("QUADRATURE", ErrorPropagation::QUADRATURE);

    py::class_<Rational>(m, "Rational")
        .def(py::init<long, long>(), py::arg("num"), py::arg("den") = 1)
        .def(py::init<const std::string &>())
        .def_static("half", &Rational::half)
        .def("__float__", &Rational::to_double)
        .def("__str__", &Rational::to_string)
        .def("__repr__", [](const Rational &r) { return "Rational('" + r.to_string() + "')"; })
        .def(py::self + py::self)
        .def(py::self - py::self)
        .def(py::self * py::self)
        .def(-py::self)
        .def(py::self == py::self)
        .def(py::self != py::self);

    py::class_<Units>(m, "Units")
        .def(py::init<>())
        .def(py::init<Units::ExponentMap>())
        .def_static("of", &Units::of, py::arg("symbol"), py::arg("exponent") = Rational::one())
        .def_property_readonly("exponents", &Units::exponents)
        .def_property_readonly("is_dimensionless", &Units::is_dimensionless)
        .def("invert", &Units::invert)
        .def("pow", &Units::pow)
        .def("__str__", &Units::to_string)
        .def(py::self * py::self)
        .def(py::self / py::self)
        .def(py::self == py::self)
        .def(py::self != py::self);

    py::class_<FormatConfig>(m, "FormatConfig")
        .def(py::init<>())
        .def_readwrite("sig_digits", &FormatConfig::sig_digits)
        .def_readwrite("leading_one_exception", &FormatConfig::leading_one_exception);

    py::class_<Quantity>(m, "Quantity")
        .def(py::init<double, double, Units>(), py::arg("value"), py::arg("error"), py::arg("units") = Units())
        .def_property_readonly("value", &Quantity::value)
        .def_property_readonly("error", &Quantity::error)
        .def_property_readonly("units", &Quantity::units)
        .def_property_readonly("has_unbounded_error", &Quantity::has_unbounded_error)
        .def("add", &Quantity::add, py::arg("other"), py::arg("model") = DEFAULT_PROPAGATION)
        .def("subtract", &Quantity::subtract, py::arg("other"), py::arg("model") = DEFAULT_PROPAGATION)
        .def("multiply", &Quantity::multiply, py::arg("other"), py::arg("model") = DEFAULT_PROPAGATION)
        .def("divide", &Quantity::divide, py::arg("other"), py::arg("model") = DEFAULT_PROPAGATION)
        .def("pow", &Quantity::pow)
        .def("sqrt", &Quantity::sqrt)
        .def("exp", &Quantity::exp)
        .def("log", &Quantity::log)
        .def("sin", &Quantity::sin)
        .def("cos", &Quantity::cos)
        .def("format", py::overload_cast<int, bool>(&Quantity::format_with_significant_error, py::const_),
             py::arg("sig_digits"), py::arg("leading_one_exception") = false)
        .def("__str__", &Quantity::to_string)
        .def(py::self + py::self)
        .def(py::self - py::self)
        .def(py::self * py::self)
        .def(py::self / py::self)
        .def(-py::self);

    m.def("format_with_significant_error",
          py::overload_cast<const Quantity &, const FormatConfig &>(&format_with_significant_error),
          py::arg("quantity"), py::arg("config"));
}
