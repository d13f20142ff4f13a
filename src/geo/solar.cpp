#include "tid_music/geo/solar.hpp"
#include "tid_music/geo/fov.hpp"

#include <algorithm>
#include <cmath>

namespace tid_music::geo {

namespace {

constexpr double kPi = 3.14159265358979323846;

double rad(double deg) { return deg * kPi / 180.0; }
double deg(double r) { return r * 180.0 / kPi; }

struct SolarPosition {
    double declination_rad;
    double eq_time_min;
};

SolarPosition solar_position(EpochSeconds t) {
    const double jd = static_cast<double>(t) / 86400.0 + 2440587.5;
    const double jc = (jd - 2451545.0) / 36525.0;

    const double mean_long = std::fmod(280.46646 + jc * (36000.76983 + jc * 0.0003032), 360.0);
    const double mean_anom = 357.52911 + jc * (35999.05029 - 0.0001537 * jc);
    const double ecc = 0.016708634 - jc * (0.000042037 + 0.0000001267 * jc);

    const double m = rad(mean_anom);
    const double eq_ctr = std::sin(m) * (1.914602 - jc * (0.004817 + 0.000014 * jc)) +
                          std::sin(2.0 * m) * (0.019993 - 0.000101 * jc) +
                          std::sin(3.0 * m) * 0.000289;
    const double true_long = mean_long + eq_ctr;
    const double omega = rad(125.04 - 1934.136 * jc);
    const double app_long = true_long - 0.00569 - 0.00478 * std::sin(omega);

    const double mean_obliq =
        23.0 + (26.0 + (21.448 - jc * (46.815 + jc * (0.00059 - jc * 0.001813))) / 60.0) / 60.0;
    const double obliq = rad(mean_obliq + 0.00256 * std::cos(omega));

    SolarPosition pos;
    pos.declination_rad = std::asin(std::sin(obliq) * std::sin(rad(app_long)));

    const double y = std::pow(std::tan(obliq / 2.0), 2);
    const double l0 = rad(mean_long);
    pos.eq_time_min = 4.0 * deg(y * std::sin(2.0 * l0) - 2.0 * ecc * std::sin(m) +
                                4.0 * ecc * y * std::sin(m) * std::cos(2.0 * l0) -
                                0.5 * y * y * std::sin(4.0 * l0) -
                                1.25 * ecc * ecc * std::sin(2.0 * m));
    return pos;
}

double true_solar_minutes(EpochSeconds t, double lon, double eq_time_min) {
    EpochSeconds sec_of_day = t % 86400;
    if (sec_of_day < 0) sec_of_day += 86400;
    double tst = static_cast<double>(sec_of_day) / 60.0 + eq_time_min + 4.0 * lon;
    tst = std::fmod(tst, 1440.0);
    if (tst < 0.0) tst += 1440.0;
    return tst;
}

} // namespace

double solar_zenith_deg(EpochSeconds t, double lat, double lon) {
    const SolarPosition pos = solar_position(t);
    const double tst = true_solar_minutes(t, lon, pos.eq_time_min);
    const double hour_angle = rad(tst / 4.0 - 180.0);

    const double phi = rad(lat);
    double c = std::sin(phi) * std::sin(pos.declination_rad) +
               std::cos(phi) * std::cos(pos.declination_rad) * std::cos(hour_angle);
    return deg(std::acos(std::clamp(c, -1.0, 1.0)));
}

double solar_local_time(EpochSeconds t, double lon) {
    const SolarPosition pos = solar_position(t);
    return true_solar_minutes(t, lon, pos.eq_time_min) / 60.0;
}

SolarTerminator::SolarTerminator(double height_km)
    : horizon_zenith_deg_(90.0 + deg(std::acos(kEarthRadiusKm / (kEarthRadiusKm + std::max(0.0, height_km))))) {}

bool SolarTerminator::is_daylight(EpochSeconds t, double lat, double lon) const {
    return solar_zenith_deg(t, lat, lon) < horizon_zenith_deg_;
}

} // namespace tid_music::geo
