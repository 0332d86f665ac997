#include "vector_errors.h"

namespace vector_math {

InvalidVectorError::InvalidVectorError(const std::string& what)
    : std::invalid_argument(what) {}

InvalidVectorError InvalidVectorError::forSize(std::size_t size) {
    return InvalidVectorError("A given object is not an accepted representation of a vector "
                              "(expected 2 or 3 elements, got " + std::to_string(size) + ")");
}

DimensionMismatchError::DimensionMismatchError(std::size_t expected, std::size_t actual)
    : std::runtime_error("Vector dimension mismatch: expected " + std::to_string(expected) +
                         "D, got " + std::to_string(actual) + "D"),
      expected_(expected),
      actual_(actual) {}

} // namespace vector_math
