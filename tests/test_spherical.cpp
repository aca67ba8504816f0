/// @file test_spherical.cpp
/// @brief Unit tests for the great-circle helpers in core/math/spherical.hpp.
///
/// Verifies haversine separations against hand-computed reference values,
/// angle wrapping, and the unit-vector prescreen bound.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "core/math/spherical.hpp"
#include "core/types.hpp"

#include <cmath>

using namespace skymatch;

// =================================================================
// Tolerance constants
// =================================================================

/// 1 microarcsecond, tight tolerance for separations in arcsec
static constexpr f64 kMicroArcsec = 1e-6;

// =================================================================
// Haversine separation
// =================================================================

TEST_CASE("Coincident positions are zero arcsec apart")
{
    CHECK(haversineArcsec(145.4354343, -27.23423, 145.4354343, -27.23423) == 0.0);
    CHECK(haversineArcsec(0.0, 90.0, 0.0, 90.0) == 0.0);
}

TEST_CASE("Pure declination offset equals the offset")
{
    // 1 arcsec north along a meridian
    const f64 sep = haversineArcsec(10.0, 20.0, 10.0, 20.0 + 1.0 / 3600.0);
    CHECK(sep == doctest::Approx(1.0).epsilon(1e-9));
}

TEST_CASE("RA offset shrinks with cos(dec)")
{
    // 1e-4 deg of RA at dec = -27.23423 deg
    const f64 sep = haversineArcsec(145.4354343, -27.23423, 145.4355343, -27.23423);
    CHECK(sep == doctest::Approx(0.3200915277).epsilon(kMicroArcsec));

    const f64 sep2 = haversineArcsec(150.234245, -30.324233, 150.234235, -30.324233);
    CHECK(sep2 == doctest::Approx(0.0310745550).epsilon(kMicroArcsec));
}

TEST_CASE("Separation is symmetric")
{
    const f64 ab = haversineArcsec(12.5, 45.0, 12.5003, 45.0002);
    const f64 ba = haversineArcsec(12.5003, 45.0002, 12.5, 45.0);
    CHECK(ab == ba);
}

TEST_CASE("Separation across RA = 0 wraps the short way")
{
    // 0.0001 deg either side of RA = 0 at the equator: 0.72 arcsec
    const f64 sep = haversineArcsec(359.9999, 0.0, 0.0001, 0.0);
    CHECK(sep == doctest::Approx(0.72).epsilon(1e-6));
}

TEST_CASE("Antipodal points are 180 degrees apart")
{
    const f64 sep = haversineArcsec(0.0, 0.0, 180.0, 0.0);
    CHECK(sep == doctest::Approx(180.0 * 3600.0).epsilon(1e-9));
}

TEST_CASE("RA is irrelevant at the pole")
{
    CHECK(haversineArcsec(0.0, 90.0, 123.0, 90.0) == doctest::Approx(0.0).epsilon(1e-9));
}

// =================================================================
// Angle wrapping
// =================================================================

TEST_CASE("normDeg wraps into [0, 360)")
{
    CHECK(normDeg(0.0) == 0.0);
    CHECK(normDeg(360.0) == 0.0);
    CHECK(normDeg(370.0) == doctest::Approx(10.0));
    CHECK(normDeg(-10.0) == doctest::Approx(350.0));
    CHECK(normDeg(-720.0) == 0.0);

    const f64 tiny = normDeg(-1e-20);
    CHECK(tiny >= 0.0);
    CHECK(tiny < 360.0);
}

TEST_CASE("wrapDeltaDeg wraps into (-180, 180]")
{
    CHECK(wrapDeltaDeg(359.9) == doctest::Approx(-0.1));
    CHECK(wrapDeltaDeg(-359.9) == doctest::Approx(0.1));
    CHECK(wrapDeltaDeg(180.0) == doctest::Approx(180.0));
    CHECK(wrapDeltaDeg(-180.0) == doctest::Approx(180.0));
    CHECK(wrapDeltaDeg(0.25) == doctest::Approx(0.25));
}

// =================================================================
// Unit vectors and prescreen bound
// =================================================================

TEST_CASE("unitVector has unit length and points at the pole for dec = 90")
{
    const Vec3d v = unitVector(123.4, -56.7);
    CHECK(glm::length(v) == doctest::Approx(1.0).epsilon(1e-12));

    const Vec3d pole = unitVector(0.0, 90.0);
    CHECK(pole.z == doctest::Approx(1.0));
    CHECK(std::abs(pole.x) < 1e-12);
}

TEST_CASE("Prescreen bound admits every pair within the radius")
{
    const f64 radius = 0.5;
    const Vec3d a = unitVector(200.0, 10.0);
    const Vec3d b = unitVector(200.0, 10.0 + radius / 3600.0);
    CHECK(glm::dot(a, b) >= dotPrescreenLimit(radius));

    // Coincident points with a vanishing radius still pass
    CHECK(glm::dot(a, a) >= dotPrescreenLimit(1e-9));
}

TEST_CASE("Prescreen bound rejects distant pairs")
{
    const Vec3d a = unitVector(10.0, 0.0);
    const Vec3d b = unitVector(11.0, 0.0);
    CHECK(glm::dot(a, b) < dotPrescreenLimit(1.0));
}
