/*
/   MPI distribution of Monte Carlo realizations.
/
/   Realizations are dealt round-robin over the ranks of a communicator
/   (rank k runs k, k + size, ...). Every rank ends with the full,
/   reduced accumulator.
*/

#pragma once

#include <mpi.h>

#include <measurement.h>
#include <tlt.h>

namespace parallel {

    // sum counts, sums and per-realization samples over all ranks
    LocalizationAccumulator reduce(const LocalizationAccumulator& local, MPI_Comm comm);

    LocalizationAccumulator run(const TLT& tlt, int n_realizations, unsigned int seed, MPI_Comm comm);

    // rank 0's value on every rank
    unsigned int broadcast_seed(unsigned int seed, MPI_Comm comm);

} // namespace parallel
