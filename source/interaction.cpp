#include <interaction.h>
#include <algorithm>
#include <cctype>
#include <cmath>

PbcMode pbc_mode_from_string(const std::string& name) {
    std::string value = name;
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return std::tolower(c);
    });
    if (value == "minimum_image") return PbcMode::MinimumImage;
    if (value == "whole_array") return PbcMode::WholeArray;
    throw ConfigurationError("Unknown pbc mode '" + name + "' (expected minimum_image or whole_array)");
}

// ----------------------------------------------------------------------------
// TransportPlane
// ----------------------------------------------------------------------------

TransportPlane::TransportPlane(int p_axis, int q_axis) : p(p_axis), q(q_axis) {
    if (p < 0 || p > 2 || q < 0 || q > 2 || p == q) {
        throw ConfigurationError("Transport plane must be two distinct axes in {0, 1, 2}, got ("
                                 + std::to_string(p) + ", " + std::to_string(q) + ")");
    }
}

namespace {
    TransportPlane plane_from_params(const utility::parameters& params) {
        std::vector<int> axes = params.getIntVector("transport", "plane");
        if (axes.size() != 2) {
            throw ConfigurationError("transport.plane needs exactly 2 axis indices, got "
                                     + std::to_string(axes.size()));
        }
        return TransportPlane(axes[0], axes[1]);
    }
}

TransportPlane::TransportPlane(const utility::parameters& params)
    : TransportPlane(plane_from_params(params)) {}

// ----------------------------------------------------------------------------
// InteractionTable
// ----------------------------------------------------------------------------

InteractionTable::InteractionTable(std::vector<double> cutoffs, double translation, PbcMode mode)
    : distances(std::move(cutoffs)), translation_dist(translation), pbc(mode)
{
    if (distances.empty()) {
        throw ConfigurationError("At least one interaction distance is required.");
    }
    for (double d : distances) {
        if (!std::isfinite(d) || d < 0.0) {
            throw ConfigurationError("Interaction distances must be finite and non-negative.");
        }
    }
    if (!std::isfinite(translation_dist)) {
        throw ConfigurationError("translation_dist must be finite.");
    }
}

InteractionTable::InteractionTable(const utility::parameters& params)
    : InteractionTable(params.getDoubleVector("transport", "distances"),
                       params.getDouble("transport", "translation_dist"),
                       pbc_mode_from_string(params.getString("transport", "pbc", "minimum_image")))
{}

namespace interaction {

arma::cube pair_displacements(const arma::mat& cart) {
    const arma::uword N = cart.n_rows;
    arma::cube disp(N, N, 3);
    for (arma::uword k = 0; k < 3; ++k) {
        const arma::vec x = cart.col(k);
        // x_i - x_j
        disp.slice(k) = arma::repmat(x, 1, N) - arma::repmat(x.t(), N, 1);
    }
    return disp;
}

void apply_pbc(arma::cube& disp, const Lattice& lat, PbcMode mode) {
    if (mode == PbcMode::MinimumImage) {
        const arma::vec3 L = lat.supercell_lengths();
        for (arma::uword k = 0; k < 3; ++k) {
            const double half = 0.5 * L(k);
            disp.slice(k).transform([&](double d) {
                if (d > half) return d - L(k);
                if (d < -half) return d + L(k);
                return d;
            });
        }
        return;
    }

    // WholeArray: shift every entry on an axis once any entry leaves [-L/2, L/2]
    for (arma::uword k = 0; k < 3; ++k) {
        const double L = lat.lattice_vecs()(k, k);
        const arma::mat& component = disp.slice(k);
        if (arma::any(arma::vectorise(component) > L / 2.0)) {
            disp.slice(k) -= L;
        } else if (arma::any(arma::vectorise(component) < -L / 2.0)) {
            disp.slice(k) += L;
        }
    }
}

arma::mat pair_distances(const arma::cube& disp) {
    arma::mat r2 = arma::square(disp.slice(0)) + arma::square(disp.slice(1)) + arma::square(disp.slice(2));
    return arma::sqrt(r2);
}

namespace {
    int sign(double x) {
        return (x > 0.0) - (x < 0.0);
    }
}

arma::imat assign_types(const arma::mat& distances, const arma::cube& disp,
                        const InteractionTable& table, const TransportPlane& plane) {
    const arma::uword N = distances.n_rows;
    arma::imat types(N, N, arma::fill::zeros);

    // a) cutoff match, later cutoffs overwrite earlier ones
    for (std::size_t idx = 0; idx < table.distances.size(); ++idx) {
        const double d = table.distances[idx];
        const arma::uvec hits = arma::find(arma::abs(distances - d) <= table.tolerance);
        types.elem(hits).fill(static_cast<arma::sword>(idx + 1));
    }

    // b) translation distance always wins
    const arma::uvec translations = arma::find(arma::abs(distances - table.translation_dist) <= table.tolerance);
    types.elem(translations).fill(3);

    // c) split type 1 by direction in the transport plane
    const arma::mat& dp = disp.slice(plane.p);
    const arma::mat& dq = disp.slice(plane.q);
    for (arma::uword j = 0; j < N; ++j) {
        for (arma::uword i = 0; i < N; ++i) {
            if (types(i, j) != 1) continue;
            if (sign(dp(i, j)) == sign(dq(i, j))) {
                types(i, j) = 2;
            }
        }
    }

    return types;
}

InteractionMap classify(const Lattice& lat, const InteractionTable& table, const TransportPlane& plane) {
    InteractionMap map;
    map.displacements = pair_displacements(lat.cartesian());
    apply_pbc(map.displacements, lat, table.pbc);
    map.distances = pair_distances(map.displacements);
    map.types = assign_types(map.distances, map.displacements, table, plane);
    return map;
}

} // namespace interaction
