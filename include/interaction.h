/*
/   Pairwise interaction classification under periodic boundaries.
/
/   Every ordered site pair (i, j) gets an integer type code:
/     0     : no interaction
/     1..K  : distance matches the k-th configured cutoff
/     3     : distance matches the translation distance (overrides the above)
/   Type-1 pairs are then split by direction inside the transport plane:
/   opposite displacement signs along the two plane axes keep type 1,
/   equal signs become type 2.
*/

#pragma once

#include <armadillo>
#include <vector>

#include <lattice.h>
#include <utility.h>

enum class PbcMode {
    MinimumImage,   // per pair, against the supercell period
    WholeArray      // one test per axis over all pairs, unit-cell length
};

PbcMode pbc_mode_from_string(const std::string& name);

// Pair of Cartesian axes spanning the 2D transport plane (ex: yz plane is {1, 2})
struct TransportPlane {
    int p;
    int q;

    TransportPlane(int p_axis, int q_axis);
    explicit TransportPlane(const utility::parameters& params);
};

struct InteractionTable {
    std::vector<double> distances;   // cutoffs, type code = position + 1
    double translation_dist;
    double tolerance = 1e-4;
    PbcMode pbc = PbcMode::MinimumImage;

    InteractionTable(std::vector<double> cutoffs, double translation, PbcMode mode = PbcMode::MinimumImage);
    explicit InteractionTable(const utility::parameters& params);
};

struct InteractionMap {
    arma::imat types;            // N x N type codes
    arma::cube displacements;    // N x N x 3, slice k = Cartesian component k of r_i - r_j
    arma::mat distances;         // N x N Euclidean distances after the PBC correction
};

namespace interaction {

    // disp(i, j, k) = cart(i, k) - cart(j, k)
    arma::cube pair_displacements(const arma::mat& cart);

    void apply_pbc(arma::cube& disp, const Lattice& lat, PbcMode mode);

    arma::mat pair_distances(const arma::cube& disp);

    // The three stages overwrite in order: cutoff match, translation override, type-1 split
    arma::imat assign_types(const arma::mat& distances, const arma::cube& disp,
                            const InteractionTable& table, const TransportPlane& plane);

    InteractionMap classify(const Lattice& lat, const InteractionTable& table, const TransportPlane& plane);

} // namespace interaction
