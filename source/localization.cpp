#include <localization.h>
#include <constants.h>
#include <cmath>

// ----------------------------------------------------------------------------
// ThermalParameters
// ----------------------------------------------------------------------------

ThermalParameters::ThermalParameters(double temperature, double gamma, bool hole)
    : temp(temperature), inverse_htau(gamma), is_hole(hole)
{
    if (!(temp > 0.0) || !std::isfinite(temp)) {
        throw ConfigurationError("Temperature must be positive, got " + std::to_string(temp));
    }
    if (!(inverse_htau > 0.0) || !std::isfinite(inverse_htau)) {
        throw ConfigurationError("inverse_htau must be positive, got " + std::to_string(inverse_htau));
    }
}

ThermalParameters::ThermalParameters(const utility::parameters& params)
    : ThermalParameters(params.getDouble("simulation", "temp", 300.0),
                        params.getDouble("simulation", "inverse_htau", 5e-3),
                        params.getBool("simulation", "is_hole", true))
{}

double ThermalParameters::beta() const {
    return 1.0 / (constants::k_B * constants::jtoev * temp);
}

namespace localization {

arma::vec populations(const arma::vec& energies, const ThermalParameters& thermal) {
    /*
        w_n / Z, exponents shifted by their maximum so that exp() stays finite
    */
    arma::vec exponent = thermal.sign() * thermal.beta() * energies;
    arma::vec weights = arma::exp(exponent - exponent.max());
    const double partition = arma::accu(weights);
    if (!std::isfinite(partition) || partition <= 0.0) {
        throw NumericalError("Partition function is not finite.");
    }
    return weights / partition;
}

LocalizationSample lengths(const linalg::Eigensystem& eig, const arma::mat& positions,
                           const TransportPlane& plane, const ThermalParameters& thermal) {
    const arma::vec& E = eig.energies;
    const arma::mat& V = eig.vectors;
    if (positions.n_rows != E.n_elem || positions.n_cols != 3) {
        throw DimensionError("Positions do not match the Hamiltonian size.");
    }

    const arma::vec p = populations(E, thermal);
    const arma::mat dE = linalg::energy_differences(E);

    // 2 / (Gamma^2 + dE^2)
    const double gamma2 = thermal.inverse_htau * thermal.inverse_htau;
    const arma::mat kernel = 2.0 / (gamma2 + arma::square(dE));

    // (E_n - E_m) <n|x|m>
    const arma::mat mx = linalg::to_eigenbasis(V, positions.col(plane.p)) % dE;
    const arma::mat my = linalg::to_eigenbasis(V, positions.col(plane.q)) % dE;

    // sum_n p_n sum_m (...)_{nm}
    LocalizationSample sample;
    sample.lx2 = arma::dot(p, arma::sum(arma::square(mx) % kernel, 1));
    sample.ly2 = arma::dot(p, arma::sum(arma::square(my) % kernel, 1));

    if (!std::isfinite(sample.lx2) || !std::isfinite(sample.ly2)) {
        throw NumericalError("Localization length is not finite.");
    }
    return sample;
}

LocalizationSample calculate(const arma::mat& H, const arma::mat& positions,
                             const TransportPlane& plane, const ThermalParameters& thermal) {
    return lengths(linalg::eigensystem(H), positions, plane, thermal);
}

} // namespace localization
