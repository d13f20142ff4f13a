#include "tid_music/config/configuration.hpp"
#include "tid_music/core/errors.hpp"
#include "tid_music/core/types.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>

namespace tid_music::config {

static bool is_odd(int v) {
    return (v % 2) != 0;
}

static void read_int_pair(const YAML::Node& n, std::array<int, 2>& out) {
    if (n && n.IsSequence() && n.size() == 2) {
        out[0] = n[0].as<int>();
        out[1] = n[1].as<int>();
    }
}

static void check_limits(const std::array<int, 2>& lim, const std::string& name) {
    if (lim[0] < -1 || lim[1] < -1) {
        throw ValidationError(name + " entries must be >= -1");
    }
    if (lim[0] >= 0 && lim[1] >= 0 && lim[1] < lim[0]) {
        throw ValidationError(name + " must be [min,max] with max >= min");
    }
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigurationError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["pipeline"]) {
            auto p = node["pipeline"];
            if (p["nprocs"]) cfg.pipeline.nprocs = p["nprocs"].as<int>();
            if (p["multiproc"]) cfg.pipeline.multiproc = p["multiproc"].as<bool>();
            if (p["recompute"]) cfg.pipeline.recompute = p["recompute"].as<bool>();
            if (p["category_filter"]) cfg.pipeline.category_filter = p["category_filter"].as<std::string>();
        }

        if (node["storage"]) {
            auto s = node["storage"];
            if (s["catalog_dir"]) cfg.storage.catalog_dir = s["catalog_dir"].as<std::string>();
            if (s["array_dir"]) cfg.storage.array_dir = s["array_dir"].as<std::string>();
            if (s["raw_dir"]) cfg.storage.raw_dir = s["raw_dir"].as<std::string>();
            if (s["log_dir"]) cfg.storage.log_dir = s["log_dir"].as<std::string>();
        }

        if (node["events"]) {
            auto e = node["events"];
            if (e["duration_minutes"]) cfg.events.duration_minutes = e["duration_minutes"].as<int>();
            if (e["step_minutes"]) cfg.events.step_minutes = e["step_minutes"].as<int>();
        }

        if (node["grid"]) {
            auto g = node["grid"];
            if (g["fov_model"]) cfg.grid.fov_model = g["fov_model"].as<std::string>();
            if (g["gscat"]) cfg.grid.gscat = g["gscat"].as<int>();
            read_int_pair(g["beam_limits"], cfg.grid.beam_limits);
            read_int_pair(g["gate_limits"], cfg.grid.gate_limits);
            if (g["bad_range_km"]) cfg.grid.bad_range_km = g["bad_range_km"].as<double>();
            if (g["reflection_height_km"]) cfg.grid.reflection_height_km = g["reflection_height_km"].as<double>();
            if (g["time_resolution_s"]) cfg.grid.time_resolution_s = g["time_resolution_s"].as<double>();
            if (g["interpolation"]) cfg.grid.interpolation = g["interpolation"].as<std::string>();
            if (g["max_gap_s"]) cfg.grid.max_gap_s = g["max_gap_s"].as<double>();
            if (g["spatial_taper"]) cfg.grid.spatial_taper = g["spatial_taper"].as<std::string>();
        }

        if (node["quality"]) {
            auto q = node["quality"];
            if (q["uptime_min_minutes"]) cfg.quality.uptime_min_minutes = q["uptime_min_minutes"].as<double>();
            if (q["rti_fraction_threshold"]) {
                cfg.quality.rti_fraction_threshold = q["rti_fraction_threshold"].as<double>();
            }
            if (q["terminator_fraction_threshold"]) {
                cfg.quality.terminator_fraction_threshold = q["terminator_fraction_threshold"].as<double>();
            }
            if (q["terminator_height_km"]) cfg.quality.terminator_height_km = q["terminator_height_km"].as<double>();
        }

        if (node["spectral"]) {
            auto s = node["spectral"];
            if (s["band_min_hz"]) cfg.spectral.band_min_hz = s["band_min_hz"].as<double>();
            if (s["band_max_hz"]) cfg.spectral.band_max_hz = s["band_max_hz"].as<double>();
            if (s["window"]) cfg.spectral.window = s["window"].as<std::string>();
            if (s["detrend"]) cfg.spectral.detrend = s["detrend"].as<bool>();
            if (s["filter_cutoff_hz"]) cfg.spectral.filter_cutoff_hz = s["filter_cutoff_hz"].as<double>();
            if (s["filter_numtaps"]) cfg.spectral.filter_numtaps = s["filter_numtaps"].as<int>();
        }

        if (node["classifier"]) {
            auto c = node["classifier"];
            if (c["mode"]) cfg.classifier.mode = c["mode"].as<std::string>();
            if (c["percentile"]) cfg.classifier.percentile = c["percentile"].as<double>();
            if (c["absolute_threshold"]) cfg.classifier.absolute_threshold = c["absolute_threshold"].as<double>();
        }

        if (node["music"]) {
            auto m = node["music"];
            if (m["num_freqs"]) cfg.music.num_freqs = m["num_freqs"].as<int>();
            if (m["kx_max"]) cfg.music.kx_max = m["kx_max"].as<double>();
            if (m["ky_max"]) cfg.music.ky_max = m["ky_max"].as<double>();
            if (m["dk"]) cfg.music.dk = m["dk"].as<double>();
            if (m["subspace_mode"]) cfg.music.subspace_mode = m["subspace_mode"].as<std::string>();
            if (m["n_signals"]) cfg.music.n_signals = m["n_signals"].as<int>();
            if (m["gap_ratio_max"]) cfg.music.gap_ratio_max = m["gap_ratio_max"].as<double>();
            if (m["min_channels"]) cfg.music.min_channels = m["min_channels"].as<int>();
            if (m["freq_avg_bins"]) cfg.music.freq_avg_bins = m["freq_avg_bins"].as<int>();
            if (m["peak_threshold"]) cfg.music.peak_threshold = m["peak_threshold"].as<double>();
            if (m["peak_neighborhood"]) cfg.music.peak_neighborhood = m["peak_neighborhood"].as<int>();
            if (m["max_signals"]) cfg.music.max_signals = m["max_signals"].as<int>();
            if (m["wavelength_min_km"]) cfg.music.wavelength_min_km = m["wavelength_min_km"].as<double>();
            if (m["wavelength_max_km"]) cfg.music.wavelength_max_km = m["wavelength_max_km"].as<double>();
        }

        if (node["radars"] && node["radars"].IsMap()) {
            for (const auto& it : node["radars"]) {
                const std::string code = it.first.as<std::string>();
                const YAML::Node r = it.second;
                geo::RadarSite site;
                site.code = code;
                if (r["lat"]) site.lat = r["lat"].as<double>();
                if (r["lon"]) site.lon = r["lon"].as<double>();
                if (r["boresight_deg"]) site.boresight_deg = r["boresight_deg"].as<double>();
                if (r["beam_sep_deg"]) site.beam_sep_deg = r["beam_sep_deg"].as<double>();
                if (r["n_beams"]) site.n_beams = r["n_beams"].as<int>();
                if (r["n_gates"]) site.n_gates = r["n_gates"].as<int>();
                if (r["first_range_km"]) site.first_range_km = r["first_range_km"].as<double>();
                if (r["range_sep_km"]) site.range_sep_km = r["range_sep_km"].as<double>();
                cfg.radars[code] = site;
            }
        }
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigurationError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["pipeline"]["nprocs"] = pipeline.nprocs;
    node["pipeline"]["multiproc"] = pipeline.multiproc;
    node["pipeline"]["recompute"] = pipeline.recompute;
    node["pipeline"]["category_filter"] = pipeline.category_filter;

    node["storage"]["catalog_dir"] = storage.catalog_dir;
    node["storage"]["array_dir"] = storage.array_dir;
    node["storage"]["raw_dir"] = storage.raw_dir;
    node["storage"]["log_dir"] = storage.log_dir;

    node["events"]["duration_minutes"] = events.duration_minutes;
    node["events"]["step_minutes"] = events.step_minutes;

    node["grid"]["fov_model"] = grid.fov_model;
    node["grid"]["gscat"] = grid.gscat;
    node["grid"]["beam_limits"].push_back(grid.beam_limits[0]);
    node["grid"]["beam_limits"].push_back(grid.beam_limits[1]);
    node["grid"]["gate_limits"].push_back(grid.gate_limits[0]);
    node["grid"]["gate_limits"].push_back(grid.gate_limits[1]);
    node["grid"]["bad_range_km"] = grid.bad_range_km;
    node["grid"]["reflection_height_km"] = grid.reflection_height_km;
    node["grid"]["time_resolution_s"] = grid.time_resolution_s;
    node["grid"]["interpolation"] = grid.interpolation;
    node["grid"]["max_gap_s"] = grid.max_gap_s;
    node["grid"]["spatial_taper"] = grid.spatial_taper;

    node["quality"]["uptime_min_minutes"] = quality.uptime_min_minutes;
    node["quality"]["rti_fraction_threshold"] = quality.rti_fraction_threshold;
    node["quality"]["terminator_fraction_threshold"] = quality.terminator_fraction_threshold;
    node["quality"]["terminator_height_km"] = quality.terminator_height_km;

    node["spectral"]["band_min_hz"] = spectral.band_min_hz;
    node["spectral"]["band_max_hz"] = spectral.band_max_hz;
    node["spectral"]["window"] = spectral.window;
    node["spectral"]["detrend"] = spectral.detrend;
    node["spectral"]["filter_cutoff_hz"] = spectral.filter_cutoff_hz;
    node["spectral"]["filter_numtaps"] = spectral.filter_numtaps;

    node["classifier"]["mode"] = classifier.mode;
    node["classifier"]["percentile"] = classifier.percentile;
    node["classifier"]["absolute_threshold"] = classifier.absolute_threshold;

    node["music"]["num_freqs"] = music.num_freqs;
    node["music"]["kx_max"] = music.kx_max;
    node["music"]["ky_max"] = music.ky_max;
    node["music"]["dk"] = music.dk;
    node["music"]["subspace_mode"] = music.subspace_mode;
    node["music"]["n_signals"] = music.n_signals;
    node["music"]["gap_ratio_max"] = music.gap_ratio_max;
    node["music"]["min_channels"] = music.min_channels;
    node["music"]["freq_avg_bins"] = music.freq_avg_bins;
    node["music"]["peak_threshold"] = music.peak_threshold;
    node["music"]["peak_neighborhood"] = music.peak_neighborhood;
    node["music"]["max_signals"] = music.max_signals;
    node["music"]["wavelength_min_km"] = music.wavelength_min_km;
    node["music"]["wavelength_max_km"] = music.wavelength_max_km;

    for (const auto& [code, site] : radars) {
        YAML::Node r;
        r["lat"] = site.lat;
        r["lon"] = site.lon;
        r["boresight_deg"] = site.boresight_deg;
        r["beam_sep_deg"] = site.beam_sep_deg;
        r["n_beams"] = site.n_beams;
        r["n_gates"] = site.n_gates;
        r["first_range_km"] = site.first_range_km;
        r["range_sep_km"] = site.range_sep_km;
        node["radars"][code] = r;
    }

    return node;
}

void Config::validate() const {
    if (pipeline.nprocs < 1 || pipeline.nprocs > 256) {
        throw ValidationError("pipeline.nprocs must be in [1,256]");
    }
    if (!pipeline.category_filter.empty() &&
        string_to_category(pipeline.category_filter) == Category::UNCLASSIFIED) {
        throw ValidationError("pipeline.category_filter must be 'quiet', 'disturbed' or empty");
    }

    if (storage.catalog_dir.empty() || storage.array_dir.empty()) {
        throw ValidationError("storage.catalog_dir and storage.array_dir must be set");
    }

    if (events.duration_minutes < 1) {
        throw ValidationError("events.duration_minutes must be >= 1");
    }
    if (events.step_minutes < 1) {
        throw ValidationError("events.step_minutes must be >= 1");
    }

    FovModel fov;
    if (!string_to_fov_model(grid.fov_model, fov)) {
        throw ValidationError("grid.fov_model must be 'GS' or 'IS'");
    }
    if (grid.gscat != 0 && grid.gscat != 1 && grid.gscat != 3) {
        throw ValidationError("grid.gscat must be 0, 1 or 3");
    }
    check_limits(grid.beam_limits, "grid.beam_limits");
    check_limits(grid.gate_limits, "grid.gate_limits");
    if (grid.bad_range_km < 0.0) {
        throw ValidationError("grid.bad_range_km must be >= 0");
    }
    if (grid.reflection_height_km <= 0.0) {
        throw ValidationError("grid.reflection_height_km must be > 0");
    }
    if (grid.time_resolution_s < 0.0) {
        throw ValidationError("grid.time_resolution_s must be >= 0");
    }
    if (grid.interpolation != "nearest" && grid.interpolation != "linear") {
        throw ValidationError("grid.interpolation must be 'nearest' or 'linear'");
    }
    if (grid.max_gap_s < 0.0) {
        throw ValidationError("grid.max_gap_s must be >= 0");
    }
    if (grid.spatial_taper != "none" && grid.spatial_taper != "hanning") {
        throw ValidationError("grid.spatial_taper must be 'none' or 'hanning'");
    }

    if (quality.uptime_min_minutes < 0.0 ||
        quality.uptime_min_minutes > static_cast<double>(events.duration_minutes)) {
        throw ValidationError("quality.uptime_min_minutes must be in [0, events.duration_minutes]");
    }
    if (quality.rti_fraction_threshold < 0.0 || quality.rti_fraction_threshold > 1.0) {
        throw ValidationError("quality.rti_fraction_threshold must be in [0,1]");
    }
    if (quality.terminator_fraction_threshold < 0.0 || quality.terminator_fraction_threshold > 1.0) {
        throw ValidationError("quality.terminator_fraction_threshold must be in [0,1]");
    }
    if (quality.terminator_height_km < 0.0) {
        throw ValidationError("quality.terminator_height_km must be >= 0");
    }

    if (spectral.band_min_hz < 0.0 || spectral.band_max_hz <= spectral.band_min_hz) {
        throw ValidationError("spectral band must be [min,max] with 0 <= min < max");
    }
    if (spectral.window != "none" && spectral.window != "hanning") {
        throw ValidationError("spectral.window must be 'none' or 'hanning'");
    }
    if (spectral.filter_cutoff_hz < 0.0) {
        throw ValidationError("spectral.filter_cutoff_hz must be >= 0");
    }
    if (spectral.filter_numtaps < 3 || !is_odd(spectral.filter_numtaps)) {
        throw ValidationError("spectral.filter_numtaps must be odd and >= 3");
    }

    if (classifier.mode != "percentile" && classifier.mode != "absolute") {
        throw ValidationError("classifier.mode must be 'percentile' or 'absolute'");
    }
    if (classifier.percentile < 0.0 || classifier.percentile > 100.0) {
        throw ValidationError("classifier.percentile must be in [0,100]");
    }

    if (music.num_freqs < 1) {
        throw ValidationError("music.num_freqs must be >= 1");
    }
    if (music.kx_max <= 0.0 || music.ky_max <= 0.0) {
        throw ValidationError("music.kx_max and music.ky_max must be > 0");
    }
    if (music.dk <= 0.0 || music.dk > std::min(music.kx_max, music.ky_max)) {
        throw ValidationError("music.dk must be in (0, min(kx_max, ky_max)]");
    }
    if (music.subspace_mode != "fixed" && music.subspace_mode != "gap") {
        throw ValidationError("music.subspace_mode must be 'fixed' or 'gap'");
    }
    if (music.n_signals < 1) {
        throw ValidationError("music.n_signals must be >= 1");
    }
    if (music.gap_ratio_max <= 0.0 || music.gap_ratio_max > 1.0) {
        throw ValidationError("music.gap_ratio_max must be in (0,1]");
    }
    if (music.min_channels < 2) {
        throw ValidationError("music.min_channels must be >= 2");
    }
    if (music.freq_avg_bins < 0) {
        throw ValidationError("music.freq_avg_bins must be >= 0");
    }
    if (music.peak_threshold < 0.0 || music.peak_threshold > 1.0) {
        throw ValidationError("music.peak_threshold must be in [0,1]");
    }
    if (music.peak_neighborhood < 1) {
        throw ValidationError("music.peak_neighborhood must be >= 1");
    }
    if (music.max_signals < 1) {
        throw ValidationError("music.max_signals must be >= 1");
    }
    if (music.wavelength_min_km <= 0.0 || music.wavelength_max_km <= music.wavelength_min_km) {
        throw ValidationError("music wavelength range must be [min,max] with 0 < min < max");
    }

    for (const auto& [code, site] : radars) {
        if (site.n_beams < 1 || site.n_gates < 1) {
            throw ValidationError("radars." + code + ": n_beams and n_gates must be >= 1");
        }
        if (site.range_sep_km <= 0.0 || site.first_range_km < 0.0) {
            throw ValidationError("radars." + code + ": invalid range geometry");
        }
        if (std::fabs(site.lat) > 90.0) {
            throw ValidationError("radars." + code + ": lat must be in [-90,90]");
        }
    }
}

const geo::RadarSite& Config::radar(const std::string& code) const {
    auto it = radars.find(code);
    if (it == radars.end()) {
        throw ConfigurationError("no hardware description for radar '" + code + "'");
    }
    return it->second;
}

int Config::worker_count() const {
    return pipeline.multiproc ? std::max(1, pipeline.nprocs) : 1;
}

} // namespace tid_music::config
