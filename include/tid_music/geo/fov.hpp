#pragma once

#include "tid_music/core/types.hpp"
#include "tid_music/geo/radar_site.hpp"

#include <memory>

namespace tid_music::geo {

constexpr double kEarthRadiusKm = 6371.0;

struct GeoPoint {
    double lat = 0.0;
    double lon = 0.0;
    bool valid = false;
};

// Maps a (beam, gate) cell to the geographic location of its scatter.
class FieldOfView {
public:
    virtual ~FieldOfView() = default;

    virtual GeoPoint locate(const RadarSite& site, int beam, int gate) const = 0;
    virtual FovModel model() const = 0;
};

// Ground scatter: the echo returns from the ground after an ionospheric
// reflection, so the reflection point sits at half the slant range.
class GroundScatterFov : public FieldOfView {
public:
    GroundScatterFov(double reflection_height_km, double bad_range_km)
        : height_km_(reflection_height_km), bad_range_km_(bad_range_km) {}

    GeoPoint locate(const RadarSite& site, int beam, int gate) const override;
    FovModel model() const override { return FovModel::GS; }

private:
    double height_km_;
    double bad_range_km_;
};

// Ionospheric scatter: the full slant range reaches the scattering volume.
class IonosphericFov : public FieldOfView {
public:
    explicit IonosphericFov(double reflection_height_km)
        : height_km_(reflection_height_km) {}

    GeoPoint locate(const RadarSite& site, int beam, int gate) const override;
    FovModel model() const override { return FovModel::IS; }

private:
    double height_km_;
};

std::unique_ptr<FieldOfView> make_fov(FovModel model, double reflection_height_km,
                                      double bad_range_km);

// Earth-centred angle (rad) between the site and the ground projection of a
// point at `height_km` and straight-line distance `range_km`. Negative when
// the geometry has no solution.
double ground_angle_rad(double range_km, double height_km);

// Great-circle destination from (lat, lon) along `azimuth_deg`.
GeoPoint destination(double lat, double lon, double azimuth_deg, double angle_rad);

// Local tangent plane about (lat0, lon0): x east, y north, in km.
void local_xy(double lat, double lon, double lat0, double lon0, double& x_km, double& y_km);

} // namespace tid_music::geo
