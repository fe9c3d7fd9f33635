/*
/   This module defines the geometry of the simulation supercell:
/   a unit cell of molecular sites (fractional coordinates) replicated
/   nx * ny * nz times.
/
/   Site ordering: outer loop over cells (a, b, c) with c fastest,
/   inner loop over the sites of the unit cell.
*/

#pragma once

#include <armadillo>
#include <array>
#include <utility.h>

class Lattice {
private:
    arma::mat atoms_;         // K x 3, fractional
    arma::mat lattice_vecs_;  // 3 x 3, rows are a1, a2, a3
    int nx_, ny_, nz_;
    int n_orb_;

    arma::mat positions_;     // N x 3, fractional, cached

    void build_positions();

public:
    Lattice(const arma::mat& atoms, const arma::mat& lattice_vecs, int nx, int ny, int nz);
    explicit Lattice(const utility::parameters& params);

    /* ---------- basic info ---------- */
    int n_orb() const noexcept;
    int n_sites() const noexcept;
    int nx() const noexcept;
    int ny() const noexcept;
    int nz() const noexcept;
    std::array<int, 3> dims() const noexcept;

    const arma::mat& lattice_vecs() const noexcept;

    /* ---------- positions ---------- */
    // fractional, in units of the lattice parameters
    const arma::mat& positions() const noexcept;
    // cart = positions * lattice_vecs^T
    arma::mat cartesian() const;
    // period of the supercell along each Cartesian axis, n_axis * lattice_vecs(axis, axis)
    arma::vec3 supercell_lengths() const;
};
