#pragma once

#include "tid_music/geo/radar_site.hpp"

#include <array>
#include <filesystem>
#include <map>
#include <string>
#include <yaml-cpp/yaml.h>

namespace tid_music::config {

namespace fs = std::filesystem;

struct PipelineConfig {
  int nprocs = 4;
  bool multiproc = true;
  bool recompute = false;
  std::string category_filter; // empty = no filter
};

struct StorageConfig {
  std::string catalog_dir = "catalog";
  std::string array_dir = "arrays";
  std::string raw_dir = "raw";
  std::string log_dir = "logs";
};

struct EventsConfig {
  int duration_minutes = 120;
  int step_minutes = 120;
};

struct GridConfig {
  std::string fov_model = "GS";  // GS | IS
  int gscat = 1;                 // 0 ionospheric | 1 ground | 3 all
  std::array<int, 2> beam_limits{-1, -1}; // inclusive, -1 = open
  std::array<int, 2> gate_limits{-1, -1};
  double bad_range_km = 500.0;   // GS mode only
  double reflection_height_km = 300.0;
  double time_resolution_s = 0.0; // 0 = detect native cadence
  std::string interpolation = "linear"; // nearest | linear
  double max_gap_s = 300.0;
  std::string spatial_taper = "none";   // none | hanning
};

struct QualityConfig {
  double uptime_min_minutes = 110.0;
  double rti_fraction_threshold = 0.675;
  double terminator_fraction_threshold = 1.0;
  double terminator_height_km = 250.0;
};

struct SpectralConfig {
  double band_min_hz = 0.00025;
  double band_max_hz = 0.001;
  std::string window = "hanning"; // none | hanning
  bool detrend = true;
  double filter_cutoff_hz = 0.0;  // 0 disables the high-pass pre-filter
  int filter_numtaps = 101;
};

struct ClassifierConfig {
  std::string mode = "percentile"; // percentile | absolute
  double percentile = 90.0;
  double absolute_threshold = 0.0;
};

struct MusicConfig {
  int num_freqs = 1;
  double kx_max = 0.05; // rad/km
  double ky_max = 0.05;
  double dk = 0.001;
  std::string subspace_mode = "gap"; // fixed | gap
  int n_signals = 1;                 // fixed mode
  double gap_ratio_max = 0.5;        // gap mode: no signal above this ratio
  int min_channels = 3;
  int freq_avg_bins = 0;             // covariance averaged over bin +- n
  double peak_threshold = 0.35;      // of the normalized pseudospectrum
  int peak_neighborhood = 10;        // cells
  int max_signals = 5;
  double wavelength_min_km = 100.0;
  double wavelength_max_km = 3000.0;
};

struct Config {
  PipelineConfig pipeline;
  StorageConfig storage;
  EventsConfig events;
  GridConfig grid;
  QualityConfig quality;
  SpectralConfig spectral;
  ClassifierConfig classifier;
  MusicConfig music;
  std::map<std::string, geo::RadarSite> radars;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  // Throws ConfigurationError for an unknown radar code.
  const geo::RadarSite &radar(const std::string &code) const;

  // Worker count honouring multiproc.
  int worker_count() const;
};

} // namespace tid_music::config
