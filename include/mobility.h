/*
/   TLT mobility from averaged squared localization lengths.
/
/     tau = hbar / Gamma
/     mu  = e * L^2 / (2 tau k_B T)      (L^2 in lattice-parameter^2 -> cm^2 / V s)
*/

#pragma once

#include <localization.h>

struct MobilityResult {
    double avg_lx2;
    double avg_ly2;
    double mobility_x;
    double mobility_y;
    double mobility_avg;
};

namespace mobility {

    // scattering time in seconds
    double scattering_time(const ThermalParameters& thermal);

    // mobility in cm^2 / (V s) for a squared localization length in lattice-parameter^2
    double from_length(double l2, const ThermalParameters& thermal);

    MobilityResult calculate(double avg_lx2, double avg_ly2, const ThermalParameters& thermal);

} // namespace mobility
