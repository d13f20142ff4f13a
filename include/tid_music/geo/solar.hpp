#pragma once

#include "tid_music/core/types.hpp"

namespace tid_music::geo {

// Solar zenith angle (deg) at a ground point, NOAA low-precision ephemeris.
double solar_zenith_deg(EpochSeconds t, double lat, double lon);

// Apparent solar time (hours, [0, 24)) at a longitude.
double solar_local_time(EpochSeconds t, double lon);

// Decides whether a point is sunlit. Injected so tests can force
// deterministic day/night.
class TerminatorModel {
public:
    virtual ~TerminatorModel() = default;
    virtual bool is_daylight(EpochSeconds t, double lat, double lon) const = 0;
};

// Sunlit at `height_km`: the sun is above the horizon seen from that height,
// which lowers the ground horizon by acos(Re / (Re + h)).
class SolarTerminator : public TerminatorModel {
public:
    explicit SolarTerminator(double height_km);

    bool is_daylight(EpochSeconds t, double lat, double lon) const override;

    double horizon_zenith_deg() const { return horizon_zenith_deg_; }

private:
    double horizon_zenith_deg_;
};

} // namespace tid_music::geo
