#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace vector_math {

/**
 * Raised when an object is not an accepted representation of a 2D or 3D vector
 */
class InvalidVectorError : public std::invalid_argument {
public:
    explicit InvalidVectorError(const std::string& what);

    /**
     * Error for a sized object whose element count is not 2 or 3
     */
    static InvalidVectorError forSize(std::size_t size);
};

/**
 * Raised when vectors of different dimensions are added without fixing the mismatch
 */
class DimensionMismatchError : public std::runtime_error {
public:
    DimensionMismatchError(std::size_t expected, std::size_t actual);

    std::size_t expected() const { return expected_; }
    std::size_t actual() const { return actual_; }

private:
    std::size_t expected_;
    std::size_t actual_;
};

} // namespace vector_math
