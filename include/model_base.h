/*
/   This file defines the abstract base class for all static-disorder
/   tight-binding models sampled by the TLT engine.
*/

#pragma once

#include <armadillo>
#include <utility.h>

class ModelBase {
    public:
        virtual ~ModelBase() = default;

        // --- Basic Properties ---
        virtual int n_size() const = 0;

        // --- Hamiltonian Components ---
        // deterministic part of H
        virtual const arma::mat& get_H0() const = 0;
        // standard deviation of each matrix element
        virtual const arma::mat& get_sigma() const = 0;

        // --- Disorder ---
        // one frozen disorder realization, drawn from the given stream
        virtual arma::mat sample_hamiltonian(utility::random& rng) const = 0;
};
