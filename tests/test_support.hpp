#pragma once

#include "tid_music/config/configuration.hpp"
#include "tid_music/geo/solar.hpp"
#include "tid_music/io/array_store.hpp"
#include "tid_music/io/raw_source.hpp"

#include <atomic>
#include <filesystem>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace tid_music::testing {

class TempDir {
public:
  TempDir() {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            ("tid_music_test_" + std::to_string(rd()) + std::to_string(rd()));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

class VectorRawSource : public io::RawDataSource {
public:
  explicit VectorRawSource(std::vector<io::RawSample> samples)
      : samples_(std::move(samples)) {}

  std::vector<io::RawSample> read(const std::string &, EpochSeconds start,
                                  EpochSeconds end) override {
    ++reads;
    std::vector<io::RawSample> out;
    for (const auto &s : samples_) {
      if (s.time >= start && s.time < end)
        out.push_back(s);
    }
    return out;
  }

  std::atomic<int> reads{0};

private:
  std::vector<io::RawSample> samples_;
};

class MemoryArrayStore : public io::ArrayStore {
public:
  void write(const core::EventId &id, const std::string &stage,
             const io::ArrayBundle &bundle) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++writes[stage];
    bundles_[id.key() + "/" + stage] = bundle;
  }

  io::ArrayBundle read(const core::EventId &id,
                       const std::string &stage) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++reads[stage];
    auto it = bundles_.find(id.key() + "/" + stage);
    if (it == bundles_.end())
      throw StorageError("missing " + stage + " arrays for " + id.key());
    return it->second;
  }

  bool exists(const core::EventId &id, const std::string &stage) override {
    std::lock_guard<std::mutex> lock(mutex_);
    return bundles_.count(id.key() + "/" + stage) > 0;
  }

  int total_calls() const {
    int n = 0;
    for (const auto &kv : writes)
      n += kv.second;
    for (const auto &kv : reads)
      n += kv.second;
    return n;
  }

  std::map<std::string, int> writes;
  std::map<std::string, int> reads;

private:
  std::mutex mutex_;
  std::map<std::string, io::ArrayBundle> bundles_;
};

class FixedTerminator : public geo::TerminatorModel {
public:
  explicit FixedTerminator(bool daylight) : daylight_(daylight) {}
  bool is_daylight(EpochSeconds, double, double) const override {
    return daylight_;
  }

private:
  bool daylight_;
};

// Small site whose every cell maps in ground-scatter geometry.
inline geo::RadarSite test_site() {
  geo::RadarSite site;
  site.code = "tst";
  site.lat = 45.0;
  site.lon = -100.0;
  site.boresight_deg = 0.0;
  site.beam_sep_deg = 3.24;
  site.n_beams = 4;
  site.n_gates = 6;
  site.first_range_km = 600.0;
  site.range_sep_km = 45.0;
  return site;
}

inline config::Config test_config(const std::filesystem::path &root) {
  config::Config cfg;
  cfg.storage.catalog_dir = (root / "catalog").string();
  cfg.storage.array_dir = (root / "arrays").string();
  cfg.storage.raw_dir = (root / "raw").string();
  cfg.storage.log_dir = (root / "logs").string();
  cfg.pipeline.nprocs = 2;
  cfg.grid.fov_model = "GS";
  cfg.grid.gscat = 1;
  cfg.grid.time_resolution_s = 60.0;
  cfg.quality.uptime_min_minutes = 90.0;
  cfg.quality.terminator_fraction_threshold = 1.0;
  cfg.spectral.detrend = false;
  cfg.spectral.window = "none";
  cfg.radars["tst"] = test_site();
  return cfg;
}

} // namespace tid_music::testing
