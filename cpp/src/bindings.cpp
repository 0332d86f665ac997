#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "vector_math.h"

namespace py = pybind11;

using vector_math::Vector;
using vector_math::VectorMath;

namespace {

// Indexable sequences other than str/bytes are vector candidates, as in the C++ API
bool isSequence(const py::handle& obj) {
    return py::isinstance<py::sequence>(obj) && !py::isinstance<py::str>(obj) &&
           !py::isinstance<py::bytes>(obj);
}

bool validateObject(const py::handle& obj, bool throwOnFailure) {
    if (!isSequence(obj)) {
        if (throwOnFailure) {
            throw vector_math::InvalidVectorError(
                "A given object is not an accepted representation of a vector");
        }
        return false;
    }
    return VectorMath::validateSize(py::len(obj), throwOnFailure);
}

std::vector<Vector> collectVectors(const py::args& args) {
    std::vector<Vector> vectors;
    vectors.reserve(args.size());
    for (const auto& arg : args) {
        validateObject(arg, true);
        vectors.push_back(arg.cast<Vector>());
    }
    return vectors;
}

bool fixDimensionMismatchArg(const py::kwargs& kwargs) {
    bool fix = false;
    for (const auto& item : kwargs) {
        const auto key = item.first.cast<std::string>();
        if (key != "fix_dimension_mismatch") {
            throw py::type_error("add_cartesian() got an unexpected keyword argument '" + key + "'");
        }
        fix = item.second.cast<bool>();
    }
    return fix;
}

}  // namespace

PYBIND11_MODULE(vector_math_cpp, m) {
    m.doc() = "Cartesian/Polar conversions and addition for raw 2D and 3D vectors";

    py::register_exception<vector_math::InvalidVectorError>(m, "InvalidVectorError", PyExc_TypeError);
    py::register_exception<vector_math::DimensionMismatchError>(m, "DimensionMismatchError", PyExc_ValueError);

    py::class_<VectorMath>(m, "VectorMath")
        .def_static("validate", &validateObject,
                    py::arg("obj"), py::arg("throw_on_failure") = false,
                    "Check that obj is a 2 or 3 element sequence (str excluded)")
        .def_static("to_cartesian",
                    [](const py::object& vector, bool usePhysicsConvention) {
                        if (!validateObject(vector, false)) {
                            return Vector{};
                        }
                        return VectorMath::toCartesian(vector.cast<Vector>(), usePhysicsConvention);
                    },
                    py::arg("vector"), py::arg("use_physics_convention") = false,
                    "Polar/Spherical (degrees) to Cartesian, [] for invalid input")
        .def_static("to_polar",
                    [](const py::object& vector, bool usePhysicsConvention) {
                        if (!validateObject(vector, false)) {
                            return Vector{};
                        }
                        return VectorMath::toPolar(vector.cast<Vector>(), usePhysicsConvention);
                    },
                    py::arg("vector"), py::arg("use_physics_convention") = false,
                    "Cartesian to Polar/Spherical (degrees), [] for invalid input")
        .def_static("two_to_three",
                    [](const py::object& vector) {
                        if (!validateObject(vector, false)) {
                            return Vector{};
                        }
                        return VectorMath::twoToThree(vector.cast<Vector>());
                    },
                    py::arg("vector"),
                    "Promote a 2D Cartesian vector to 3D with z = 0")
        .def_static("add_cartesian",
                    [](const py::args& args, const py::kwargs& kwargs) {
                        const bool fix = fixDimensionMismatchArg(kwargs);
                        try {
                            return VectorMath::addCartesian(collectVectors(args), fix);
                        } catch (const vector_math::InvalidVectorError&) {
                            return Vector{};
                        } catch (const vector_math::DimensionMismatchError&) {
                            return Vector{};
                        } catch (const py::cast_error&) {
                            // Non-numeric elements
                            return Vector{};
                        }
                    },
                    "Add Cartesian vectors, [] on invalid input or dimension mismatch. "
                    "Keyword: fix_dimension_mismatch=False")
        .def_static("to_cartesian_strict",
                    [](const py::object& vector, bool usePhysicsConvention) {
                        validateObject(vector, true);
                        return VectorMath::toCartesianStrict(vector.cast<Vector>(), usePhysicsConvention);
                    },
                    py::arg("vector"), py::arg("use_physics_convention") = false,
                    "to_cartesian raising InvalidVectorError for invalid input")
        .def_static("to_polar_strict",
                    [](const py::object& vector, bool usePhysicsConvention) {
                        validateObject(vector, true);
                        return VectorMath::toPolarStrict(vector.cast<Vector>(), usePhysicsConvention);
                    },
                    py::arg("vector"), py::arg("use_physics_convention") = false,
                    "to_polar raising InvalidVectorError for invalid input")
        .def_static("add_cartesian_strict",
                    [](const py::args& args, const py::kwargs& kwargs) {
                        return VectorMath::addCartesianStrict(collectVectors(args),
                                                              fixDimensionMismatchArg(kwargs));
                    },
                    "add_cartesian raising InvalidVectorError or DimensionMismatchError");

    // Version information
    m.attr("__version__") = "1.0.0";
}
