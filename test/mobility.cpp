#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "mobility.h"
#include "constants.h"

TEST_CASE("Scattering time") {
    ThermalParameters thermal(300.0, 5e-3, true);
    // hbar / 5 meV is about 131.6 fs
    CHECK(mobility::scattering_time(thermal) == doctest::Approx(1.316424e-13).epsilon(1e-6));
}

TEST_CASE("Mobility from localization lengths") {
    ThermalParameters thermal(300.0, 5e-3, true);
    const double tau = constants::hbar * constants::jtoev / 5e-3;

    SUBCASE("Formula") {
        CHECK(constants::length2_to_cm2 == 1e-16);
        const double l2 = 120.0;
        const double expected = 1e-16 * constants::e * l2 / (2 * tau * constants::k_B * 300.0);
        CHECK(mobility::from_length(l2, thermal) == doctest::Approx(expected).epsilon(1e-14));
        // 120 lattice-parameter^2 at 300 K and 5 meV
        CHECK(mobility::from_length(l2, thermal) == doctest::Approx(1.763).epsilon(1e-3));
    }

    SUBCASE("Equal lengths give equal mobilities") {
        MobilityResult r = mobility::calculate(80.0, 80.0, thermal);
        CHECK(r.mobility_x == r.mobility_y);
        CHECK(r.mobility_avg == r.mobility_x);
    }

    SUBCASE("Average mobility uses the mean length") {
        MobilityResult r = mobility::calculate(100.0, 20.0, thermal);
        CHECK(r.avg_lx2 == 100.0);
        CHECK(r.avg_ly2 == 20.0);
        CHECK(r.mobility_x == doctest::Approx(5.0 * r.mobility_y));
        CHECK(r.mobility_avg == doctest::Approx(0.5 * (r.mobility_x + r.mobility_y)));
    }

    SUBCASE("Mobility scales linearly with L^2 and Gamma") {
        ThermalParameters broader(300.0, 1e-2, true);
        CHECK(mobility::from_length(50.0, broader) == doctest::Approx(2.0 * mobility::from_length(50.0, thermal)));
        CHECK(mobility::from_length(0.0, thermal) == 0.0);
    }
}
