/*
/   Physical constants (CODATA 2018, SI exact values).
*/

#pragma once

namespace constants {
    constexpr double e     = 1.602176634e-19;     // elementary charge, C
    constexpr double hbar  = 1.054571817e-34;     // reduced Planck constant, J s
    constexpr double k_B   = 1.380649e-23;        // Boltzmann constant, J / K
    constexpr double jtoev = 6.241509074460763e+18;  // J -> eV

    // squared lattice-parameter units -> cm^2, for a lattice parameter of 1 Angstrom
    constexpr double length2_to_cm2 = 1e-16;
}
