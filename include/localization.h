/*
/   Localization length of one disorder realization.
/
/     L^2 = (1/Z) sum_{n,m} w_n |<n|x|m>|^2 (E_n - E_m)^2 * 2 / (Gamma^2 + (E_n - E_m)^2)
/
/   w_n = exp(s * beta * E_n), s = +1 for holes (top of the band),
/   s = -1 for electrons (bottom of the band), Z = sum_n w_n.
*/

#pragma once

#include <armadillo>

#include <interaction.h>
#include <linalg.h>
#include <utility.h>

struct ThermalParameters {
    double temp;           // K
    double inverse_htau;   // Gamma = hbar / tau, eV
    bool is_hole;

    ThermalParameters(double temperature, double gamma, bool hole);
    explicit ThermalParameters(const utility::parameters& params);

    // 1 / (k_B T) in 1/eV
    double beta() const;
    // +1 for holes, -1 for electrons
    double sign() const { return is_hole ? 1.0 : -1.0; }
};

struct LocalizationSample {
    double lx2;
    double ly2;
};

namespace localization {

    // normalized Boltzmann populations w_n / Z
    arma::vec populations(const arma::vec& energies, const ThermalParameters& thermal);

    LocalizationSample lengths(const linalg::Eigensystem& eig, const arma::mat& positions,
                               const TransportPlane& plane, const ThermalParameters& thermal);

    // diagonalize + lengths
    LocalizationSample calculate(const arma::mat& H, const arma::mat& positions,
                                 const TransportPlane& plane, const ThermalParameters& thermal);

} // namespace localization
