#pragma once

#include <string>

namespace tid_music::geo {

// Hardware description of one coherent-scatter radar.
struct RadarSite {
  std::string code;
  double lat = 0.0;            // geographic latitude (deg)
  double lon = 0.0;            // geographic longitude (deg, east positive)
  double boresight_deg = 0.0;  // azimuth of the boresight (deg east of north)
  double beam_sep_deg = 3.24;
  int n_beams = 16;
  int n_gates = 75;
  double first_range_km = 180.0;
  double range_sep_km = 45.0;

  // Azimuth of a beam centre, beams spread symmetrically about boresight.
  double beam_azimuth_deg(int beam) const {
    return boresight_deg +
           (static_cast<double>(beam) - 0.5 * static_cast<double>(n_beams - 1)) *
               beam_sep_deg;
  }

  // Slant range to the centre of a range gate.
  double slant_range_km(int gate) const {
    return first_range_km + range_sep_km * (static_cast<double>(gate) + 0.5);
  }
};

} // namespace tid_music::geo
