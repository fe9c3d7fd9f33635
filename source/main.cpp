#include <mpi.h>

#include <lattice.h>
#include <interaction.h>
#include <model/disordered_tb.h>
#include <localization.h>
#include <tlt.h>
#include <parallel.h>
#include <mobility.h>
#include <resulth5.h>
#include <utility.h>

#include <iomanip>
#include <chrono>
#include <ctime>

namespace {
    const char* pbc_name(PbcMode mode) {
        return mode == PbcMode::MinimumImage ? "minimum_image" : "whole_array";
    }
}

int main(int argc, char** argv) {
    // -----------------------------------------------------------------
    //                         MPI Initialization
    // -----------------------------------------------------------------

    MPI_Init(&argc, &argv);

    int world_size;
    MPI_Comm_size(MPI_COMM_WORLD, &world_size);

    int rank;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);

    int master = 0;

    utility::interrupt::install();

    try {
        // -----------------------------------------------------------------
        //          Parameter Handling (all validation before any work)
        // -----------------------------------------------------------------
        const std::string param_file = (argc > 1) ? argv[1] : "parameters.in";
        utility::parameters params(param_file);

        Lattice lat(params);
        TransportPlane plane(params);
        InteractionTable table(params);
        Couplings couplings(params);
        ThermalParameters thermal(params);

        const int n_realizations = params.getInt("simulation", "realizations", 250);
        if (n_realizations < 1) {
            throw ConfigurationError("simulation.realizations must be >= 1");
        }
        unsigned int seed = params.getUnsigned("simulation", "seed",
                                               static_cast<unsigned int>(std::time(nullptr)));
        seed = parallel::broadcast_seed(seed, MPI_COMM_WORLD);

        const std::string output = params.getString("output", "file", "tlt_mobility");

        utility::io::print_info(
            "TLT mobility calculation\n",
            "  parameter file   = ", param_file, '\n',
            "  sites            = ", lat.n_sites(), " (", lat.n_orb(), " per cell, ",
            lat.nx(), "x", lat.ny(), "x", lat.nz(), ")\n",
            "  transport plane  = (", plane.p, ", ", plane.q, ")\n",
            "  pbc              = ", pbc_name(table.pbc), '\n',
            "  carrier          = ", (thermal.is_hole ? "hole" : "electron"), '\n',
            "  realizations     = ", n_realizations, " on ", world_size, " rank(s), seed ", seed, '\n'
        );

        // -----------------------------------------------------------------
        //                 System construction
        // -----------------------------------------------------------------
        InteractionMap interactions = interaction::classify(lat, table, plane);
        DisorderedTightBinding model(couplings, interactions.types);
        TLT tlt(model, lat.positions(), plane, thermal);

        // -----------------------------------------------------------------
        //                 Monte Carlo over disorder realizations
        // -----------------------------------------------------------------
        const auto t0 = std::chrono::steady_clock::now();
        LocalizationAccumulator acc = parallel::run(tlt, n_realizations, seed, MPI_COMM_WORLD);
        const double elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - t0).count();

        MobilityResult result = mobility::calculate(acc.mean_lx2(), acc.mean_ly2(), thermal);

        // -----------------------------------------------------------------
        //                         Finalization
        // -----------------------------------------------------------------
        utility::io::print_info(utility::io::format(
            "Realizations finished in ", std::fixed, std::setprecision(2), elapsed, " seconds\n",
            std::scientific, std::setprecision(6),
            "  <Lx^2>           = ", result.avg_lx2, " +- ", acc.stderr_lx2(), " lattice-parameter^2\n",
            "  <Ly^2>           = ", result.avg_ly2, " +- ", acc.stderr_ly2(), " lattice-parameter^2\n",
            "  mobility x       = ", result.mobility_x, " cm^2/Vs\n",
            "  mobility y       = ", result.mobility_y, " cm^2/Vs\n",
            "  mobility average = ", result.mobility_avg, " cm^2/Vs\n"
        ));

        if (rank == master) {
            ResultWriter writer("results", output);
            writer.write_system(lat, interactions);
            writer.write_samples(acc);
            writer.write_result(result, acc, thermal, seed);
            utility::io::print_info("Results written to ", writer.filename(), '\n');
        }

    } catch (const InterruptedError& e) {
        std::cerr << "ERROR: " << e.what() << " No result written." << std::endl;
        MPI_Abort(MPI_COMM_WORLD, 130);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        MPI_Abort(MPI_COMM_WORLD, 1);
    }

    MPI_Finalize();

    return 0;
}
