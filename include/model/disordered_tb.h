/*
/   This module provides the static-disorder tight-binding model of
/   transient localization theory.
/
/     H = H_ii + H_ij + Sigma o G
/
/   H_ii  : onsite energy on the diagonal
/   H_ij  : transfer integral J_t for pairs of interaction type t = 1, 2, 3
/   Sigma : disorder magnitudes, sigma_ii on the diagonal, sigma_t off it
/   G     : symmetric Gaussian ensemble sample, fresh per realization
*/

#pragma once

#include <model_base.h>
#include <array>
#include <vector>

// Coupling and disorder magnitudes, energies in eV
struct Couplings {
    double j_ii;
    std::array<double, 3> j_ij;
    double sigma_ii;
    std::array<double, 3> sigma_ij;

    Couplings(double onsite, const std::vector<double>& transfer,
              double onsite_disorder, const std::vector<double>& transfer_disorder);
    explicit Couplings(const utility::parameters& params);
};

class DisorderedTightBinding : public ModelBase {
    private:
        Couplings couplings_;
        int ns_;

        // --- Pre-calculated Matrices ---
        arma::mat H0_;
        arma::mat sigma_;

        arma::mat build_matrix(const arma::imat& types, double diagonal,
                               const std::array<double, 3>& per_type) const;

    public:
        DisorderedTightBinding(const Couplings& couplings, const arma::imat& types);
        DisorderedTightBinding(const utility::parameters& params, const arma::imat& types);

        const Couplings& couplings() const { return couplings_; }

        // --- Implementations of the ModelBase virtual functions ---
        int n_size() const override;
        const arma::mat& get_H0() const override;
        const arma::mat& get_sigma() const override;
        arma::mat sample_hamiltonian(utility::random& rng) const override;
};
