#include <model/disordered_tb.h>
#include <linalg.h>
#include <string>

namespace {
    std::array<double, 3> require_triple(const std::vector<double>& values, const std::string& name) {
        if (values.size() != 3) {
            throw ConfigurationError(name + " needs exactly 3 values (one per interaction type), got "
                                     + std::to_string(values.size()));
        }
        return {values[0], values[1], values[2]};
    }
}

Couplings::Couplings(double onsite, const std::vector<double>& transfer,
                     double onsite_disorder, const std::vector<double>& transfer_disorder)
    : j_ii(onsite), j_ij(require_triple(transfer, "j_ij")),
      sigma_ii(onsite_disorder), sigma_ij(require_triple(transfer_disorder, "sigma_ij"))
{}

Couplings::Couplings(const utility::parameters& params)
    : Couplings(params.getDouble("coupling", "j_ii", 0.0),
                params.getDoubleVector("coupling", "j_ij"),
                params.getDouble("coupling", "sigma_ii", 0.0),
                params.getDoubleVector("coupling", "sigma_ij"))
{}

DisorderedTightBinding::DisorderedTightBinding(const Couplings& couplings, const arma::imat& types)
    : couplings_(couplings), ns_(static_cast<int>(types.n_rows))
{
    if (types.n_rows != types.n_cols || types.n_rows == 0) {
        throw DimensionError("Interaction matrix must be square and non-empty.");
    }

    H0_    = build_matrix(types, couplings_.j_ii, couplings_.j_ij);
    sigma_ = build_matrix(types, couplings_.sigma_ii, couplings_.sigma_ij);
}

DisorderedTightBinding::DisorderedTightBinding(const utility::parameters& params, const arma::imat& types)
    : DisorderedTightBinding(Couplings(params), types)
{}

// diagonal <- diagonal value, off-diagonal type t in {1,2,3} <- per_type[t-1], rest 0.
// Types are read from the lower triangle and mirrored, so the result is
// symmetric even for a type matrix from the whole-array PBC mode.
arma::mat DisorderedTightBinding::build_matrix(const arma::imat& types, double diagonal,
                                               const std::array<double, 3>& per_type) const {
    arma::mat M(ns_, ns_, arma::fill::zeros);
    for (int j = 0; j < ns_; ++j) {
        M(j, j) = diagonal;
        for (int i = j + 1; i < ns_; ++i) {
            const arma::sword t = types(i, j);
            if (t >= 1 && t <= 3) {
                M(i, j) = per_type[t - 1];
                M(j, i) = M(i, j);
            }
        }
    }
    return M;
}

int DisorderedTightBinding::n_size() const { return ns_; }
const arma::mat& DisorderedTightBinding::get_H0() const { return H0_; }
const arma::mat& DisorderedTightBinding::get_sigma() const { return sigma_; }

arma::mat DisorderedTightBinding::sample_hamiltonian(utility::random& rng) const {
    arma::mat G = linalg::symmetric_gaussian(ns_, rng);
    arma::mat H = H0_ + sigma_ % G;
    if (!H.is_finite()) {
        throw NumericalError("Sampled Hamiltonian contains non-finite entries.");
    }
    return H;
}
