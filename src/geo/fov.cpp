#include "tid_music/geo/fov.hpp"

#include <algorithm>
#include <cmath>

namespace tid_music::geo {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kDeg2Rad = kPi / 180.0;
constexpr double kRad2Deg = 180.0 / kPi;

double wrap_lon(double lon) {
    lon = std::fmod(lon + 540.0, 360.0);
    if (lon < 0.0) lon += 360.0;
    return lon - 180.0;
}

} // namespace

double ground_angle_rad(double range_km, double height_km) {
    const double re = kEarthRadiusKm;
    const double rh = kEarthRadiusKm + height_km;
    if (range_km < height_km) {
        return -1.0;
    }
    double c = (re * re + rh * rh - range_km * range_km) / (2.0 * re * rh);
    if (c > 1.0 || c < -1.0) {
        return -1.0;
    }
    return std::acos(c);
}

GeoPoint destination(double lat, double lon, double azimuth_deg, double angle_rad) {
    const double phi1 = lat * kDeg2Rad;
    const double lam1 = lon * kDeg2Rad;
    const double az = azimuth_deg * kDeg2Rad;

    const double sin_phi2 = std::sin(phi1) * std::cos(angle_rad) +
                            std::cos(phi1) * std::sin(angle_rad) * std::cos(az);
    const double phi2 = std::asin(std::clamp(sin_phi2, -1.0, 1.0));
    const double lam2 = lam1 + std::atan2(std::sin(az) * std::sin(angle_rad) * std::cos(phi1),
                                          std::cos(angle_rad) - std::sin(phi1) * sin_phi2);

    GeoPoint p;
    p.lat = phi2 * kRad2Deg;
    p.lon = wrap_lon(lam2 * kRad2Deg);
    p.valid = true;
    return p;
}

void local_xy(double lat, double lon, double lat0, double lon0, double& x_km, double& y_km) {
    double dlon = wrap_lon(lon - lon0);
    x_km = kEarthRadiusKm * dlon * kDeg2Rad * std::cos(lat0 * kDeg2Rad);
    y_km = kEarthRadiusKm * (lat - lat0) * kDeg2Rad;
}

GeoPoint GroundScatterFov::locate(const RadarSite& site, int beam, int gate) const {
    const double slant = site.slant_range_km(gate);
    if (slant < bad_range_km_) {
        return {};
    }
    const double theta = ground_angle_rad(0.5 * slant, height_km_);
    if (theta < 0.0) {
        return {};
    }
    return destination(site.lat, site.lon, site.beam_azimuth_deg(beam), theta);
}

GeoPoint IonosphericFov::locate(const RadarSite& site, int beam, int gate) const {
    const double theta = ground_angle_rad(site.slant_range_km(gate), height_km_);
    if (theta < 0.0) {
        return {};
    }
    return destination(site.lat, site.lon, site.beam_azimuth_deg(beam), theta);
}

std::unique_ptr<FieldOfView> make_fov(FovModel model, double reflection_height_km,
                                      double bad_range_km) {
    if (model == FovModel::IS) {
        return std::make_unique<IonosphericFov>(reflection_height_km);
    }
    return std::make_unique<GroundScatterFov>(reflection_height_km, bad_range_km);
}

} // namespace tid_music::geo
