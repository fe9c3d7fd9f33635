#include <tlt.h>

// --- Constructor ---
TLT::TLT(const ModelBase& model, const arma::mat& positions,
         const TransportPlane& plane, const ThermalParameters& thermal)
    : model_(model), positions_(positions), plane_(plane), thermal_(thermal)
{
    if (static_cast<int>(positions_.n_rows) != model_.n_size() || positions_.n_cols != 3) {
        throw DimensionError("Positions (" + std::to_string(positions_.n_rows) + " x "
                             + std::to_string(positions_.n_cols) + ") do not match a model of "
                             + std::to_string(model_.n_size()) + " sites.");
    }
}

LocalizationSample TLT::realization(utility::random& rng) const {
    arma::mat H = model_.sample_hamiltonian(rng);
    return localization::calculate(H, positions_, plane_, thermal_);
}

LocalizationSample TLT::realization(unsigned int seed, int index) const {
    utility::random rng = utility::random::stream(seed, static_cast<unsigned int>(index));
    return realization(rng);
}

LocalizationAccumulator TLT::run(int n_realizations, unsigned int seed, int first, int stride) const {
    if (n_realizations < 1) {
        throw ConfigurationError("Number of realizations must be >= 1.");
    }
    if (first < 0 || stride < 1) {
        throw std::invalid_argument("Invalid realization split.");
    }

    LocalizationAccumulator acc(n_realizations);
    for (int r = first; r < n_realizations; r += stride) {
        if (utility::interrupt::requested()) {
            throw InterruptedError("Interrupted after " + std::to_string(acc.count()) + " realizations.");
        }
        acc.add(r, realization(seed, r));
    }
    return acc;
}
