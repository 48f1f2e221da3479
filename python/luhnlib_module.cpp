// python/luhnlib_module.cpp - Pybind11 module entrypoint exposing luhnlib.

#include <string>

#include <pybind11/pybind11.h>

#include <luhn/luhn.hpp>

namespace py = pybind11;

namespace {

std::string to_string(char digit) { return std::string(1, digit); }

} // namespace

PYBIND11_MODULE(luhnlib, module) {
    module.doc() = "Luhn check digit validation and computation";

    // luhn::invalid_input derives from std::invalid_argument, which pybind11
    // translates to ValueError.
    module.def("validate",
               [](const std::string& sequence) { return luhn::validate(sequence); },
               py::arg("sequence"),
               "Return True if the trailing check digit of a decimal sequence is correct.");
    module.def("checksum",
               [](const std::string& payload) { return to_string(luhn::checksum(payload)); },
               py::arg("payload"),
               "Return the check digit to append to a decimal payload.");
    module.def("validate_alnum",
               [](const std::string& sequence) { return luhn::validate_alnum(sequence); },
               py::arg("sequence"),
               "Like validate, for uppercase alphanumeric sequences such as ISINs.");
    module.def("checksum_alnum",
               [](const std::string& payload) { return to_string(luhn::checksum_alnum(payload)); },
               py::arg("payload"),
               "Like checksum, for uppercase alphanumeric payloads.");
}
