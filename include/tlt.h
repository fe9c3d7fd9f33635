/*
/   This module is the core TLT Monte Carlo engine.
/
/   One realization = one frozen disorder sample of the model Hamiltonian
/   followed by the localization-length solve. Realization r always draws
/   from utility::random::stream(seed, r), so any split of the realizations
/   (serial, strided over MPI ranks) gives the same samples.
/
/   It is a generic engine that operates on the ModelBase interface.
*/

#pragma once

#include <armadillo>

#include <model_base.h>
#include <localization.h>
#include <measurement.h>
#include <utility.h>

class TLT {
private:
    const ModelBase& model_;
    arma::mat positions_;
    TransportPlane plane_;
    ThermalParameters thermal_;

public:
    TLT(const ModelBase& model, const arma::mat& positions,
        const TransportPlane& plane, const ThermalParameters& thermal);

    const ThermalParameters& thermal() const { return thermal_; }
    const TransportPlane& plane() const { return plane_; }

    LocalizationSample realization(utility::random& rng) const;
    LocalizationSample realization(unsigned int seed, int index) const;

    // realizations first, first + stride, ... below n_realizations.
    // Throws InterruptedError when an interrupt was requested; any failing
    // realization aborts the whole run.
    LocalizationAccumulator run(int n_realizations, unsigned int seed,
                                int first = 0, int stride = 1) const;
};
