#include "vector_math.h"
#include <cmath>

namespace vector_math {

namespace {
constexpr double kPi = 3.14159265358979323846;

double toRadians(double degrees) {
    return degrees * kPi / 180.0;
}

double toDegrees(double radians) {
    return radians * 180.0 / kPi;
}

// Angle of (x, y) from the positive x axis, limited to [-90, 90].
// x == 0 maps to +90 when y > 0 and to -90 otherwise, (0, 0) included.
double halfPlaneAngle(double x, double y) {
    if (x == 0.0) {
        return y > 0.0 ? 90.0 : -90.0;
    }
    return toDegrees(std::atan(y / x));
}
}  // namespace

bool VectorMath::validateSize(std::size_t size, bool throwOnFailure) {
    if (size > 1 && size < 4) {
        return true;
    }
    if (throwOnFailure) {
        throw InvalidVectorError::forSize(size);
    }
    return false;
}

bool VectorMath::rejectNonVector(bool throwOnFailure) {
    if (throwOnFailure) {
        throw InvalidVectorError("A given object is not an accepted representation of a vector");
    }
    return false;
}

Vector VectorMath::cartesianFromPolar(const Vector& vector, bool usePhysicsConvention) {
    const double r = vector[0];

    if (vector.size() == 2) {
        const double angle = toRadians(vector[1]);
        return {r * std::cos(angle), r * std::sin(angle)};
    }

    const double inclination = toRadians(usePhysicsConvention ? vector[1] : vector[2]);
    const double azimuth = toRadians(usePhysicsConvention ? vector[2] : vector[1]);

    return {r * std::sin(inclination) * std::cos(azimuth),
            r * std::sin(inclination) * std::sin(azimuth),
            r * std::cos(inclination)};
}

Vector VectorMath::polarFromCartesian(const Vector& vector, bool usePhysicsConvention) {
    const double x = vector[0];
    const double y = vector[1];

    if (vector.size() == 2) {
        return {std::sqrt(x * x + y * y), halfPlaneAngle(x, y)};
    }

    const double z = vector[2];
    const double r = std::sqrt(x * x + y * y + z * z);
    const double azimuth = halfPlaneAngle(x, y);
    // NaN for the zero vector
    const double inclination = toDegrees(std::acos(z / r));

    if (usePhysicsConvention) {
        return {r, inclination, azimuth};
    }
    return {r, azimuth, inclination};
}

Vector VectorMath::addCartesianStrict(const std::vector<Vector>& vectors, bool fixDimensionMismatch) {
    if (vectors.empty()) {
        throw InvalidVectorError("No vectors given to add");
    }

    if (vectors.size() == 1) {
        validate(vectors.front(), true);
        return vectors.front();
    }

    validate(vectors.front(), true);
    const std::size_t baseDim = vectors.front().size();
    Vector result(baseDim, 0.0);

    for (const auto& v : vectors) {
        validate(v, true);
        if (v.size() != baseDim && !fixDimensionMismatch) {
            throw DimensionMismatchError(baseDim, v.size());
        }

        result[0] += v[0];
        result[1] += v[1];
        if (baseDim == 3 && v.size() == 3) {
            result[2] += v[2];
        }
    }

    return result;
}

Vector VectorMath::addCartesian(const std::vector<Vector>& vectors, bool fixDimensionMismatch) {
    try {
        return addCartesianStrict(vectors, fixDimensionMismatch);
    } catch (const InvalidVectorError&) {
        return {};
    } catch (const DimensionMismatchError&) {
        return {};
    }
}

} // namespace vector_math
