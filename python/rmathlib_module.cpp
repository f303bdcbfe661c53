// python/rmathlib_module.cpp — Pybind11 module entrypoint exposing the decimal dispatch facade.

#include <string>
#include <utility>

#include <pybind11/pybind11.h>

#include <rmath/rmathlib.hpp>

namespace py = pybind11;
using rmath::context;
using rmath::status;
using rmath::core::decimal;

namespace {

const rmath::decimal_math& math() {
    static const rmath::decimal_math instance;
    return instance;
}

// Binds `name(a, b, context, status)` and the context-free `name(a, b)`.
template <typename Op>
void bind_binary(py::module_& module, const char* name, Op op, const char* doc) {
    module.def(
        name,
        [op](const decimal& a, const decimal& b, const context& ctx, status& st) {
            return op(a, b, ctx, st);
        },
        py::arg("a"), py::arg("b"), py::arg("context"), py::arg("status"), doc);
    module.def(
        name,
        [op](const decimal& a, const decimal& b) {
            status ignored;
            return op(a, b, rmath::default_context(), ignored);
        },
        py::arg("a"), py::arg("b"), doc);
}

template <typename Op>
void bind_unary(py::module_& module, const char* name, Op op, const char* doc) {
    module.def(
        name,
        [op](const decimal& a, const context& ctx, status& st) { return op(a, ctx, st); },
        py::arg("a"), py::arg("context"), py::arg("status"), doc);
    module.def(
        name,
        [op](const decimal& a) {
            status ignored;
            return op(a, rmath::default_context(), ignored);
        },
        py::arg("a"), doc);
}

} // namespace

PYBIND11_MODULE(rmathlib, module) {
    module.doc() = "Pybind11 bindings for the rmathlib arbitrary-precision decimal arithmetic";

    py::register_exception<rmath::trap_error>(module, "TrapError", PyExc_ArithmeticError);

    py::class_<context> py_context(module, "Context", "Immutable arithmetic configuration");
    py_context.def(py::init<>())
        .def(py::init([](const std::string& options) { return rmath::io::parse_context(options); }),
             py::arg("options"), "Build a context from a 'key=value;...' option string")
        .def_static("unlimited", &context::unlimited)
        .def_static("basic", &context::basic)
        .def_static("decimal32", &context::decimal32)
        .def_static("decimal64", &context::decimal64)
        .def_static("decimal128", &context::decimal128)
        .def_property_readonly("precision", &context::precision)
        .def_property_readonly("simplified", &context::is_simplified)
        .def_property_readonly("rounding", [](const context& ctx) {
            return std::string(rmath::to_string(ctx.rounding_mode()));
        })
        .def("with_precision", &context::with_precision, py::arg("digits"))
        .def("with_simplified", &context::with_simplified, py::arg("simplified"))
        .def("__eq__", [](const context& a, const context& b) { return a == b; })
        .def("__str__", [](const context& ctx) { return rmath::io::to_string(ctx); })
        .def("__repr__", [](const context& ctx) {
            return "<rmathlib.Context " + rmath::io::to_string(ctx) + ">";
        });

    py::class_<status> py_status(module, "Status", "Accumulator for raised conditions");
    py_status.def(py::init<>())
        .def("has", [](const status& st, const std::string& name) {
            const auto condition = rmath::flag_from_string(name);
            if (!condition) {
                throw py::value_error("unknown condition '" + name + "'");
            }
            return st.has(*condition);
        }, py::arg("name"))
        .def("clear", &status::clear)
        .def("__str__", [](const status& st) { return rmath::to_string(st.value()); })
        .def("__repr__", [](const status& st) {
            return "<rmathlib.Status " + rmath::to_string(st.value()) + ">";
        });

    py::class_<decimal> py_decimal(module, "Decimal", "Arbitrary-precision decimal number");
    py_decimal.def(py::init<>())
        .def(py::init([](const std::string& text) { return rmath::io::decimal_from_string(text); }),
             py::arg("text"))
        .def_static("from_float", &rmath::decimal_from_double, py::arg("value"),
                    "Exact decimal expansion of a Python float")
        .def("is_nan", &decimal::is_nan)
        .def("is_infinite", &decimal::is_infinity)
        .def("is_zero", &decimal::is_zero)
        .def("is_signed", &decimal::is_negative)
        .def("to_plain_string", [](const decimal& value) { return rmath::io::to_plain_string(value); })
        .def("__float__", [](const decimal& value) { return rmath::to_double(value); })
        .def("__str__", [](const decimal& value) { return rmath::io::to_string(value); })
        .def("__repr__", [](const decimal& value) {
            return "<rmathlib.Decimal " + rmath::io::to_string(value) + ">";
        })
        .def("__eq__", [](const decimal& a, const decimal& b) { return math().compare(a, b) == 0; })
        .def("__lt__", [](const decimal& a, const decimal& b) { return math().compare(a, b) < 0; })
        .def("__neg__", [](const decimal& a) { return math().negate(a); })
        .def("__abs__", [](const decimal& a) { return math().abs(a); });

    bind_binary(module, "add",
                [](auto&&... args) { return math().add(std::forward<decltype(args)>(args)...); },
                "Sum of two numbers");
    bind_binary(module, "subtract",
                [](auto&&... args) { return math().subtract(std::forward<decltype(args)>(args)...); },
                "Difference of two numbers");
    bind_binary(module, "multiply",
                [](auto&&... args) { return math().multiply(std::forward<decltype(args)>(args)...); },
                "Product of two numbers");
    bind_binary(module, "divide",
                [](auto&&... args) { return math().divide(std::forward<decltype(args)>(args)...); },
                "Quotient of two numbers");
    bind_binary(module, "remainder",
                [](auto&&... args) { return math().remainder(std::forward<decltype(args)>(args)...); },
                "Remainder of a truncating integer division");
    bind_binary(module, "quantize",
                [](auto&&... args) { return math().quantize(std::forward<decltype(args)>(args)...); },
                "Round the first operand to the exponent of the second");
    bind_binary(module, "power",
                [](auto&&... args) { return math().power(std::forward<decltype(args)>(args)...); },
                "First operand raised to the second");
    bind_unary(module, "reduce",
               [](auto&&... args) { return math().reduce(std::forward<decltype(args)>(args)...); },
               "Strip trailing zeros");
    bind_unary(module, "sqrt",
               [](auto&&... args) {
                   return math().square_root(std::forward<decltype(args)>(args)...);
               },
               "Correctly rounded square root");
    bind_unary(module, "exp",
               [](auto&&... args) { return math().exp(std::forward<decltype(args)>(args)...); },
               "Correctly rounded e^x");
    bind_unary(module, "ln",
               [](auto&&... args) { return math().ln(std::forward<decltype(args)>(args)...); },
               "Correctly rounded natural logarithm");
    bind_unary(module, "log10",
               [](auto&&... args) { return math().log10(std::forward<decltype(args)>(args)...); },
               "Correctly rounded base-10 logarithm");

    module.def("pi", [](const context& ctx, status& st) { return math().pi(ctx, st); },
               py::arg("context"), py::arg("status"), "Pi rounded to the context precision");
}
