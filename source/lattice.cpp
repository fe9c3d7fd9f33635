#include <lattice.h>
#include <stdexcept>
#include <string>

// ----------------------------------------------------------------------------
// Lattice Class Implementation
// ----------------------------------------------------------------------------

// Constructor
Lattice::Lattice(const arma::mat& atoms, const arma::mat& lattice_vecs, int nx, int ny, int nz)
    : atoms_(atoms), lattice_vecs_(lattice_vecs),
      nx_(nx), ny_(ny), nz_(nz), n_orb_(static_cast<int>(atoms.n_rows))
{
    if (nx_ < 1 || ny_ < 1 || nz_ < 1) {
        throw DimensionError("Supercell replication counts must be >= 1, got ("
                             + std::to_string(nx_) + ", " + std::to_string(ny_) + ", "
                             + std::to_string(nz_) + ")");
    }
    if (n_orb_ == 0) {
        throw DimensionError("Unit cell contains no atoms.");
    }
    if (atoms_.n_cols != 3) {
        throw DimensionError("Atom coordinates must have 3 components, got "
                             + std::to_string(atoms_.n_cols));
    }
    if (lattice_vecs_.n_rows != 3 || lattice_vecs_.n_cols != 3) {
        throw DimensionError("Lattice vectors must form a 3x3 matrix.");
    }
    if (!atoms_.is_finite() || !lattice_vecs_.is_finite()) {
        throw DimensionError("Unit cell contains non-finite coordinates.");
    }

    build_positions();
}

Lattice::Lattice(const utility::parameters& params)
    : Lattice(params.getMatrix("crystal", "atoms"),
              params.getMatrix("crystal", "lattice_vecs"),
              params.getInt("crystal", "nx", 1),
              params.getInt("crystal", "ny", 1),
              params.getInt("crystal", "nz", 1))
{}

void Lattice::build_positions() {
    positions_.set_size(n_sites(), 3);

    arma::uword count = 0;
    for (int a = 0; a < nx_; ++a) {
        for (int b = 0; b < ny_; ++b) {
            for (int c = 0; c < nz_; ++c) {
                const arma::rowvec offset = {static_cast<double>(a),
                                             static_cast<double>(b),
                                             static_cast<double>(c)};
                for (int orb = 0; orb < n_orb_; ++orb) {
                    positions_.row(count) = atoms_.row(orb) + offset;
                    ++count;
                }
            }
        }
    }
}

// --- Basic Info ---
int Lattice::n_orb() const noexcept { return n_orb_; }
int Lattice::n_sites() const noexcept { return nx_ * ny_ * nz_ * n_orb_; }
int Lattice::nx() const noexcept { return nx_; }
int Lattice::ny() const noexcept { return ny_; }
int Lattice::nz() const noexcept { return nz_; }
std::array<int, 3> Lattice::dims() const noexcept { return {nx_, ny_, nz_}; }

const arma::mat& Lattice::lattice_vecs() const noexcept { return lattice_vecs_; }

// --- Positions ---
const arma::mat& Lattice::positions() const noexcept { return positions_; }

arma::mat Lattice::cartesian() const {
    return positions_ * lattice_vecs_.t();
}

arma::vec3 Lattice::supercell_lengths() const {
    arma::vec3 lengths;
    const std::array<int, 3> n = dims();
    for (int axis = 0; axis < 3; ++axis) {
        lengths(axis) = n[axis] * lattice_vecs_(axis, axis);
    }
    return lengths;
}
