#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <utility.h>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <vector>

// --- Tests for the random class ---
TEST_CASE("utility::random") {
    utility::random rng;
    rng.set_seed(42);

    SUBCASE("Normal deviates have zero mean and unit variance") {
        const int n = 20000;
        double sum = 0.0, sumsq = 0.0;
        for (int i = 0; i < n; ++i) {
            double x = rng.normal();
            sum += x;
            sumsq += x * x;
        }
        double mean = sum / n;
        double var = sumsq / n - mean * mean;
        CHECK(std::abs(mean) < 0.05);
        CHECK(std::abs(var - 1.0) < 0.05);
    }

    SUBCASE("Same seed reproduces the sequence") {
        utility::random a(7), b(7);
        for (int i = 0; i < 10; ++i) {
            CHECK(a.normal() == b.normal());
        }
    }
}

TEST_CASE("utility::random::stream") {
    SUBCASE("A stream depends only on (seed, index)") {
        utility::random a = utility::random::stream(123, 5);
        utility::random b = utility::random::stream(123, 5);
        for (int i = 0; i < 10; ++i) {
            CHECK(a.normal() == b.normal());
        }
    }

    SUBCASE("Different indices give different streams") {
        utility::random a = utility::random::stream(123, 0);
        utility::random b = utility::random::stream(123, 1);
        utility::random c = utility::random::stream(124, 0);
        double xa = a.normal();
        CHECK(xa != b.normal());
        CHECK(xa != c.normal());
    }
}

// --- Tests for the parameters class ---
TEST_CASE("utility::parameters") {
    // Create a temporary INI file for testing
    const std::string filename = "test_params.in";
    std::ofstream test_file(filename);
    test_file << R"(
# This is a comment
; so is this
[crystal]
nx = 4
ny = 8 # another comment
atoms = "0.0, 0.0, 0.0; 0.5, 0.5, 0.0"
lattice_vecs = 7.9, 0, 0; 0, 6.1, 0; 0, 0, 16

[transport]
plane = 1, 2
distances = 4.99, 7.9, 6.1

[simulation]
temp = 300.0
realizations = 10_000
seed = 4000000000
negative_seed = -5
is_hole = true
name = "My Test"
broken = 1.5, 2.0; 3.0
)";
    test_file.close();

    utility::parameters params(filename);

    SUBCASE("Reading values") {
        CHECK(params.getInt("crystal", "nx") == 4);
        CHECK(params.getInt("crystal", "ny") == 8);
        CHECK(params.getDouble("simulation", "temp") == 300.0);
        CHECK(params.getInt("simulation", "realizations") == 10000);
        CHECK(params.getBool("simulation", "is_hole") == true);
        CHECK(params.getString("simulation", "name") == "My Test");
    }

    SUBCASE("Seeds use the full unsigned range") {
        CHECK(params.getUnsigned("simulation", "seed") == 4000000000u);
        CHECK(params.getUnsigned("simulation", "realizations") == 10000u);
        CHECK(params.getUnsigned("simulation", "missing_seed", 17u) == 17u);
        CHECK_THROWS_AS(params.getInt("simulation", "seed"), ConfigurationError);
        CHECK_THROWS_AS(params.getUnsigned("simulation", "negative_seed"), ConfigurationError);
        CHECK_THROWS_AS(params.getUnsigned("simulation", "name"), ConfigurationError);
    }

    SUBCASE("Reading vectors and matrices") {
        std::vector<int> plane = params.getIntVector("transport", "plane");
        REQUIRE(plane.size() == 2);
        CHECK(plane[0] == 1);
        CHECK(plane[1] == 2);

        std::vector<double> d = params.getDoubleVector("transport", "distances");
        REQUIRE(d.size() == 3);
        CHECK(d[0] == 4.99);
        CHECK(d[2] == 6.1);

        arma::mat atoms = params.getMatrix("crystal", "atoms");
        CHECK(atoms.n_rows == 2);
        CHECK(atoms.n_cols == 3);
        CHECK(atoms(1, 0) == 0.5);
        CHECK(atoms(1, 2) == 0.0);

        arma::mat lv = params.getMatrix("crystal", "lattice_vecs");
        CHECK(lv.n_rows == 3);
        CHECK(lv.n_cols == 3);
        CHECK(lv(0, 0) == 7.9);
        CHECK(lv(1, 1) == 6.1);
        CHECK(lv(2, 2) == 16.0);
    }

    SUBCASE("Default values") {
        CHECK(params.getInt("crystal", "nz", 1) == 1);
        CHECK(params.getDouble("simulation", "inverse_htau", 5e-3) == 5e-3);
        CHECK(params.getBool("simulation", "is_electron", false) == false);
        CHECK(params.getString("output", "file", "tlt_mobility") == "tlt_mobility");
    }

    SUBCASE("Malformed values are not masked by defaults") {
        CHECK_THROWS_AS(params.getInt("simulation", "name", 3), ConfigurationError);
    }

    SUBCASE("Error handling") {
        CHECK_THROWS_AS(params.getInt("non_existent_section", "key"), ConfigurationError);
        CHECK_THROWS_AS(params.getString("crystal", "non_existent_key"), ConfigurationError);
        CHECK_THROWS_AS(params.getInt("simulation", "name"), ConfigurationError); // "My Test" is not an int
        CHECK_THROWS_AS(params.getMatrix("simulation", "broken"), ConfigurationError); // ragged rows
        CHECK_THROWS_AS(params.getDouble("simulation", "temp_missing"), std::runtime_error);
        CHECK_THROWS_AS(utility::parameters("does_not_exist.in"), ConfigurationError);
    }

    SUBCASE("Checkers") {
        CHECK(params.hasSection("crystal") == true);
        CHECK(params.hasSection("non_existent_section") == false);
        CHECK(params.hasKey("crystal", "nx") == true);
        CHECK(params.hasKey("crystal", "non_existent_key") == false);
        CHECK(params.hasKey("non_existent_section", "key") == false);
    }

    // Clean up the main test file
    std::remove(filename.c_str());
}

TEST_CASE("utility::io::format") {
    const std::ios_base::fmtflags flags = std::cout.flags();
    const std::streamsize precision = std::cout.precision();

    CHECK(utility::io::format("x = ", std::scientific, std::setprecision(2), 1.5, " A") == "x = 1.50e+00 A");
    CHECK(utility::io::format(std::fixed, std::setprecision(3), 0.25) == "0.250");

    CHECK(std::cout.flags() == flags);
    CHECK(std::cout.precision() == precision);
}

TEST_CASE("utility::interrupt") {
    utility::interrupt::reset();
    CHECK_FALSE(utility::interrupt::requested());
    utility::interrupt::request();
    CHECK(utility::interrupt::requested());
    utility::interrupt::reset();
    CHECK_FALSE(utility::interrupt::requested());
}
