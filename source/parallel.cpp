#include <parallel.h>

namespace parallel {

LocalizationAccumulator reduce(const LocalizationAccumulator& local, MPI_Comm comm) {
    const int n = static_cast<int>(local.samples_lx2().n_elem);

    // samples this rank did not run are NaN locally, send zeros for them
    arma::vec lx2 = local.samples_lx2();
    arma::vec ly2 = local.samples_ly2();
    lx2.replace(arma::datum::nan, 0.0);
    ly2.replace(arma::datum::nan, 0.0);

    arma::vec all_lx2(n, arma::fill::zeros);
    arma::vec all_ly2(n, arma::fill::zeros);
    MPI_Allreduce(lx2.memptr(), all_lx2.memptr(), n, MPI_DOUBLE, MPI_SUM, comm);
    MPI_Allreduce(ly2.memptr(), all_ly2.memptr(), n, MPI_DOUBLE, MPI_SUM, comm);

    arma::vec2 sums = local.sums();
    arma::vec2 total_sums;
    MPI_Allreduce(sums.memptr(), total_sums.memptr(), 2, MPI_DOUBLE, MPI_SUM, comm);

    int count = local.count();
    int total_count = 0;
    MPI_Allreduce(&count, &total_count, 1, MPI_INT, MPI_SUM, comm);

    LocalizationAccumulator total(n);
    total.set_totals(total_count, total_sums, all_lx2, all_ly2);
    return total;
}

LocalizationAccumulator run(const TLT& tlt, int n_realizations, unsigned int seed, MPI_Comm comm) {
    int rank, world_size;
    MPI_Comm_rank(comm, &rank);
    MPI_Comm_size(comm, &world_size);

    LocalizationAccumulator local = tlt.run(n_realizations, seed, rank, world_size);
    return reduce(local, comm);
}

unsigned int broadcast_seed(unsigned int seed, MPI_Comm comm) {
    MPI_Bcast(&seed, 1, MPI_UNSIGNED, 0, comm);
    return seed;
}

} // namespace parallel
