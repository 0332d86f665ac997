#pragma once

#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "vector_errors.h"

namespace vector_math {

/**
 * Raw vector representation: 2 or 3 components, meaning decided by the caller
 */
using Vector = std::vector<double>;

namespace detail {

template <typename T>
struct is_char : std::bool_constant<std::is_same_v<T, char> || std::is_same_v<T, wchar_t> ||
                                    std::is_same_v<T, char16_t> || std::is_same_v<T, char32_t>> {};

template <typename T>
struct is_text : std::bool_constant<std::is_array_v<T> &&
                                    is_char<std::remove_cv_t<std::remove_extent_t<T>>>::value> {};

template <typename C, typename Traits, typename Alloc>
struct is_text<std::basic_string<C, Traits, Alloc>> : std::true_type {};

template <typename C, typename Traits>
struct is_text<std::basic_string_view<C, Traits>> : std::true_type {};

template <typename T, typename = void>
struct is_indexed_sequence : std::false_type {};

template <typename T>
struct is_indexed_sequence<T, std::void_t<decltype(std::size(std::declval<const T&>())),
                                          decltype(std::declval<const T&>()[0])>>
    : std::true_type {};

// Anything with an element count and operator[], text excluded
template <typename T>
constexpr bool is_vector_like_v =
    is_indexed_sequence<std::remove_cv_t<T>>::value && !is_text<std::remove_cv_t<T>>::value;

template <typename T, typename = void>
struct is_vector_range : std::false_type {};

template <typename T>
struct is_vector_range<T, std::void_t<decltype(std::begin(std::declval<const T&>())),
                                      decltype(std::end(std::declval<const T&>()))>>
    : std::bool_constant<is_vector_like_v<
          std::remove_reference_t<decltype(*std::begin(std::declval<const T&>()))>>> {};

// Range whose elements are all vector candidates, e.g. std::vector<std::array<double, 3>>
template <typename T>
constexpr bool is_vector_range_v = is_vector_range<std::remove_cv_t<T>>::value;

} // namespace detail

/**
 * Coordinate conversions and addition for raw 2D/3D vectors.
 *
 * Angles are in degrees. 3D polar vectors are spherical: (r, azimuth, inclination)
 * in the mathematics convention, (r, inclination, azimuth) in the physics one.
 */
class VectorMath {
public:
    /**
     * Check that obj is an accepted vector representation (2 or 3 elements, not text)
     *
     * @param obj            Any object.
     * @param throwOnFailure Throw InvalidVectorError instead of returning false.
     */
    template <typename T>
    static bool validate(const T& obj, bool throwOnFailure = false) {
        if constexpr (detail::is_vector_like_v<T>) {
            return validateSize(static_cast<std::size_t>(std::size(obj)), throwOnFailure);
        } else {
            return rejectNonVector(throwOnFailure);
        }
    }

    /**
     * Dimension check for an object already known to be a sequence of `size` elements
     */
    static bool validateSize(std::size_t size, bool throwOnFailure = false);

    /**
     * Polar/Spherical to Cartesian. Returns an empty vector for invalid input.
     */
    template <typename T>
    static Vector toCartesian(const T& vector, bool usePhysicsConvention = false) {
        if (!validate(vector)) {
            return {};
        }
        return toCartesianStrict(vector, usePhysicsConvention);
    }

    /**
     * Cartesian to Polar/Spherical. Returns an empty vector for invalid input.
     *
     * Angles come from a single-argument arctangent, so they lie in [-90, 90]
     * and vectors with x < 0 do not round-trip through toCartesian.
     */
    template <typename T>
    static Vector toPolar(const T& vector, bool usePhysicsConvention = false) {
        if (!validate(vector)) {
            return {};
        }
        return toPolarStrict(vector, usePhysicsConvention);
    }

    /**
     * Sum of Cartesian vectors. The first vector fixes the result dimension.
     *
     * Returns an empty vector if any operand is invalid, or if dimensions differ
     * and fixDimensionMismatch is false. With fixDimensionMismatch, extra z
     * components are dropped and missing ones count as 0.
     */
    static Vector addCartesian(const std::vector<Vector>& vectors, bool fixDimensionMismatch = false);

    /**
     * addCartesian over any range of vector-like operands (std::array, Eigen vectors, ...)
     */
    template <typename Range, typename = std::enable_if_t<detail::is_vector_range_v<Range>>>
    static Vector addCartesian(const Range& vectors, bool fixDimensionMismatch = false) {
        return addCartesian(copyAll(vectors), fixDimensionMismatch);
    }

    /**
     * Promote a 2D Cartesian vector to 3D with z = 0. 3D input is returned as is.
     */
    template <typename T>
    static Vector twoToThree(const T& vector) {
        if (!validate(vector)) {
            return {};
        }
        Vector result = copyOf(vector);
        if (result.size() == 2) {
            result.push_back(0.0);
        }
        return result;
    }

    /**
     * toCartesian that throws InvalidVectorError instead of returning an empty vector
     */
    template <typename T>
    static Vector toCartesianStrict(const T& vector, bool usePhysicsConvention = false) {
        validate(vector, true);
        return cartesianFromPolar(copyOf(vector), usePhysicsConvention);
    }

    /**
     * toPolar that throws InvalidVectorError instead of returning an empty vector
     */
    template <typename T>
    static Vector toPolarStrict(const T& vector, bool usePhysicsConvention = false) {
        validate(vector, true);
        return polarFromCartesian(copyOf(vector), usePhysicsConvention);
    }

    /**
     * addCartesian that throws InvalidVectorError or DimensionMismatchError
     */
    static Vector addCartesianStrict(const std::vector<Vector>& vectors, bool fixDimensionMismatch = false);

    template <typename Range, typename = std::enable_if_t<detail::is_vector_range_v<Range>>>
    static Vector addCartesianStrict(const Range& vectors, bool fixDimensionMismatch = false) {
        return addCartesianStrict(copyAll(vectors), fixDimensionMismatch);
    }

private:
    static bool rejectNonVector(bool throwOnFailure);

    static Vector cartesianFromPolar(const Vector& vector, bool usePhysicsConvention);
    static Vector polarFromCartesian(const Vector& vector, bool usePhysicsConvention);

    template <typename T>
    static Vector copyOf(const T& obj) {
        if constexpr (detail::is_vector_like_v<T>) {
            const std::size_t n = static_cast<std::size_t>(std::size(obj));
            Vector result;
            result.reserve(n);
            for (std::size_t i = 0; i < n; ++i) {
                result.push_back(static_cast<double>(obj[i]));
            }
            return result;
        } else {
            rejectNonVector(true);
            return {};
        }
    }

    template <typename Range>
    static std::vector<Vector> copyAll(const Range& vectors) {
        std::vector<Vector> result;
        for (const auto& v : vectors) {
            result.push_back(copyOf(v));
        }
        return result;
    }
};

} // namespace vector_math
