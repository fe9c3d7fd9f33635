/*
/   Dense linear algebra helpers for the localization solver:
/   symmetric Gaussian ensemble sampling, guarded symmetric
/   eigendecomposition, and diagonal-operator basis changes.
*/

#pragma once

#include <armadillo>
#include <utility.h>

namespace linalg {

    // --- Eigensystem of a real symmetric matrix ---
    struct Eigensystem {
        arma::vec energies;   // ascending
        arma::mat vectors;    // orthonormal columns, vectors.col(n) = |n>
    };

    // --- Free Functions for regular Matrix Operations ---
    arma::mat diag_mul_mat(const arma::vec& diag, const arma::mat& mat);

    // V^T * diag(d) * V
    arma::mat to_eigenbasis(const arma::mat& V, const arma::vec& diag);

    // dE(n, m) = E_n - E_m
    arma::mat energy_differences(const arma::vec& energies);

    // Symmetric Gaussian ensemble: iid N(0,1) lower triangle (with diagonal),
    // mirrored onto the upper triangle.
    arma::mat symmetric_gaussian(arma::uword n, utility::random& rng);

    // Throws NumericalError on non-finite entries or failed convergence.
    Eigensystem eigensystem(const arma::mat& H);

    bool is_symmetric(const arma::mat& M);

} // namespace linalg
