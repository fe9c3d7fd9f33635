#include <linalg.h>

namespace linalg {

// ----------------------------------------------------------------------------
// basic matrix operations
// ----------------------------------------------------------------------------

arma::mat diag_mul_mat(const arma::vec& diag, const arma::mat& mat) {
    /*
        D * M
    */
    return arma::diagmat(diag) * mat;
}

arma::mat to_eigenbasis(const arma::mat& V, const arma::vec& diag) {
    /*
        O'_{nm} = <n|O|m> = sum_i V_{in} o_i V_{im}
    */
    if (V.n_rows != diag.n_elem) {
        throw DimensionError("Operator size does not match the eigenvector basis.");
    }
    return V.t() * diag_mul_mat(diag, V);
}

arma::mat energy_differences(const arma::vec& energies) {
    const arma::uword n = energies.n_elem;
    return arma::repmat(energies, 1, n) - arma::repmat(energies.t(), n, 1);
}

// ----------------------------------------------------------------------------
// random matrices
// ----------------------------------------------------------------------------

arma::mat symmetric_gaussian(arma::uword n, utility::random& rng) {
    /*
        G = tril(X) + tril(X, -1)^T,  X_ij ~ N(0, 1)
    */
    arma::mat X(n, n);
    // column-major fill keeps the draw order of a full n x n sample
    X.imbue([&]() { return rng.normal(); });

    arma::mat G = arma::trimatl(X);
    G += arma::trimatl(X, -1).t();
    return G;
}

// ----------------------------------------------------------------------------
// eigendecomposition
// ----------------------------------------------------------------------------

Eigensystem eigensystem(const arma::mat& H) {
    if (H.n_rows != H.n_cols) {
        throw DimensionError("Hamiltonian must be square.");
    }
    if (!H.is_finite()) {
        throw NumericalError("Hamiltonian contains non-finite entries.");
    }

    Eigensystem eig;
    bool success = arma::eig_sym(eig.energies, eig.vectors, H);
    if (!success) {
        throw NumericalError("Eigendecomposition failed in eigensystem");
    }
    return eig;
}

bool is_symmetric(const arma::mat& M) {
    if (M.n_rows != M.n_cols) return false;
    return arma::approx_equal(M, M.t(), "absdiff", 0.0);
}

} // namespace linalg
