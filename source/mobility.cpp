#include <mobility.h>
#include <constants.h>

namespace mobility {

double scattering_time(const ThermalParameters& thermal) {
    return constants::hbar * constants::jtoev / thermal.inverse_htau;
}

double from_length(double l2, const ThermalParameters& thermal) {
    const double tau = scattering_time(thermal);
    return constants::length2_to_cm2 * constants::e * l2 / (2 * tau * constants::k_B * thermal.temp);
}

MobilityResult calculate(double avg_lx2, double avg_ly2, const ThermalParameters& thermal) {
    MobilityResult result;
    result.avg_lx2 = avg_lx2;
    result.avg_ly2 = avg_ly2;
    result.mobility_x = from_length(avg_lx2, thermal);
    result.mobility_y = from_length(avg_ly2, thermal);
    result.mobility_avg = constants::length2_to_cm2 * constants::e * 0.5 * (avg_lx2 + avg_ly2)
                          / (2 * scattering_time(thermal) * constants::k_B * thermal.temp);
    return result;
}

} // namespace mobility
