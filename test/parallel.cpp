#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include <mpi.h>

#include "parallel.h"
#include "lattice.h"
#include "interaction.h"
#include "model/disordered_tb.h"
#include <cmath>

int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    int res = context.run();

    MPI_Finalize();
    return res;
}

TEST_CASE("Distributed realizations match a serial run") {
    Lattice lat(arma::mat{{0.0, 0.0, 0.0}, {0.5, 0.5, 0.0}},
                arma::mat{{7.9, 0.0, 0.0}, {0.0, 6.1, 0.0}, {0.0, 0.0, 16.0}}, 2, 3, 1);
    TransportPlane plane(0, 1);
    InteractionMap interactions = interaction::classify(lat, InteractionTable({4.9905, 7.90, 6.10}, 6.10), plane);
    DisorderedTightBinding model(Couplings(0.0, {0.085, -0.02, 0.03}, 0.0, {0.03, 0.01, 0.015}),
                                 interactions.types);
    ThermalParameters thermal(300.0, 5e-3, true);
    TLT tlt(model, lat.positions(), plane, thermal);

    int world_size;
    MPI_Comm_size(MPI_COMM_WORLD, &world_size);

    const unsigned int seed = parallel::broadcast_seed(31, MPI_COMM_WORLD);
    CHECK(seed == 31);

    LocalizationAccumulator distributed = parallel::run(tlt, 25, seed, MPI_COMM_WORLD);
    LocalizationAccumulator serial = tlt.run(25, seed);

    CHECK(distributed.count() == 25);
    CHECK(distributed.samples_lx2().is_finite());
    CHECK(arma::approx_equal(distributed.samples_lx2(), serial.samples_lx2(), "absdiff", 0.0));
    CHECK(arma::approx_equal(distributed.samples_ly2(), serial.samples_ly2(), "absdiff", 0.0));
    CHECK(distributed.mean_lx2() == doctest::Approx(serial.mean_lx2()).epsilon(1e-12));
    CHECK(distributed.mean_ly2() == doctest::Approx(serial.mean_ly2()).epsilon(1e-12));
    CHECK(distributed.stderr_lx2() == doctest::Approx(serial.stderr_lx2()).epsilon(1e-8));

    if (world_size == 1) {
        CHECK(distributed.mean_lx2() == serial.mean_lx2());
    }
}

TEST_CASE("Reduction of a partial accumulator") {
    int rank, world_size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &world_size);

    // every rank contributes realization `rank`
    LocalizationAccumulator local(world_size);
    local.add(rank, LocalizationSample{1.0 + rank, 2.0 * (1.0 + rank)});

    LocalizationAccumulator total = parallel::reduce(local, MPI_COMM_WORLD);
    CHECK(total.count() == world_size);
    for (int r = 0; r < world_size; ++r) {
        CHECK(total.samples_lx2()(r) == 1.0 + r);
        CHECK(total.samples_ly2()(r) == 2.0 * (1.0 + r));
    }
    CHECK(total.mean_lx2() == doctest::Approx(0.5 * (world_size + 1)));
    CHECK(total.mean_ly2() == doctest::Approx(world_size + 1.0));
}
