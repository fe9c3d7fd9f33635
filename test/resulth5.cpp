#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "resulth5.h"
#include "h5utils.h"
#include <cstdio>
#include <unistd.h>

TEST_CASE("Result archive") {
    Lattice lat(arma::mat{{0.0, 0.0, 0.0}}, arma::mat{{5.0, 0.0, 0.0}, {0.0, 5.0, 0.0}, {0.0, 0.0, 20.0}}, 3, 2, 1);
    TransportPlane plane(0, 1);
    InteractionMap interactions = interaction::classify(lat, InteractionTable({5.0}, 100.0), plane);
    ThermalParameters thermal(250.0, 4e-3, false);

    LocalizationAccumulator acc(3);
    acc.add(0, LocalizationSample{10.0, 20.0});
    acc.add(1, LocalizationSample{12.0, 18.0});
    acc.add(2, LocalizationSample{14.0, 22.0});
    MobilityResult result = mobility::calculate(acc.mean_lx2(), acc.mean_ly2(), thermal);

    std::string filename;
    {
        ResultWriter writer("test_results", "archive");
        filename = writer.filename();
        writer.write_system(lat, interactions);
        writer.write_samples(acc);
        writer.write_result(result, acc, thermal, 1234u);
    }
    CHECK(filename == "test_results/archive.h5");

    hid_t file_id = H5Fopen(filename.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
    REQUIRE(file_id >= 0);

    CHECK(hdf5::read_scalar(file_id, "/result/avg_lx2") == doctest::Approx(12.0));
    CHECK(hdf5::read_scalar(file_id, "/result/avg_ly2") == doctest::Approx(20.0));
    CHECK(hdf5::read_scalar(file_id, "/result/mobility_avg") == doctest::Approx(result.mobility_avg));
    CHECK(hdf5::read_scalar(file_id, "/result/temp") == 250.0);
    CHECK(hdf5::read_scalar(file_id, "/result/is_hole") == 0.0);
    CHECK(hdf5::read_scalar(file_id, "/result/realizations") == 3.0);
    CHECK(hdf5::read_scalar(file_id, "/result/seed") == 1234.0);

    hsize_t dims[2] = {0, 0};
    REQUIRE(H5LTget_dataset_info(file_id, "/system/interactions", dims, nullptr, nullptr) >= 0);
    CHECK(dims[0] == static_cast<hsize_t>(lat.n_sites()));
    CHECK(dims[1] == static_cast<hsize_t>(lat.n_sites()));

    REQUIRE(H5LTget_dataset_info(file_id, "/system/positions", dims, nullptr, nullptr) >= 0);
    CHECK(dims[0] == static_cast<hsize_t>(lat.n_sites()));
    CHECK(dims[1] == 3);

    // row-major on disk: second row is site 1
    arma::mat positions_t(3, lat.n_sites());
    REQUIRE(H5LTread_dataset_double(file_id, "/system/positions", positions_t.memptr()) >= 0);
    CHECK(arma::approx_equal(positions_t.t(), lat.positions(), "absdiff", 0.0));

    arma::vec lx2(3);
    REQUIRE(H5LTread_dataset_double(file_id, "/samples/lx2", lx2.memptr()) >= 0);
    CHECK(lx2(2) == 14.0);

    H5Fclose(file_id);
    std::remove(filename.c_str());
    rmdir("test_results");
}

TEST_CASE("Unwritable location") {
    CHECK_THROWS_AS(ResultWriter("/proc/tltmob_no_such_dir", "archive"), std::runtime_error);
}
