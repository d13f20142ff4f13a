#include "tid_music/io/raw_source.hpp"
#include "tid_music/core/errors.hpp"
#include "tid_music/core/utils.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <map>

namespace tid_music::io {

namespace {

constexpr const char* kHeader = "time,beam,gate,power,velocity,gflg";

RawSample parse_row(const std::string& line, const fs::path& path, size_t line_no) {
    auto fields = core::split(line, ',');
    if (fields.size() != 6) {
        throw StorageError(path.string() + ":" + std::to_string(line_no) +
                           ": expected 6 columns, got " + std::to_string(fields.size()));
    }

    RawSample s;
    try {
        const std::string t = core::trim(fields[0]);
        const size_t digits_from = (!t.empty() && t[0] == '-') ? 1 : 0;
        bool numeric = t.size() > digits_from &&
                       t.find_first_not_of("0123456789", digits_from) == std::string::npos;
        s.time = numeric ? static_cast<EpochSeconds>(std::stoll(t)) : core::parse_utc(t);
        s.beam = std::stoi(fields[1]);
        s.gate = std::stoi(fields[2]);
        s.power_db = std::stod(fields[3]);
        const std::string vel = core::trim(fields[4]);
        if (!vel.empty() && core::to_lower(vel) != "nan") {
            s.velocity = std::stod(vel);
        }
        s.scatter = int_to_scatter_type(std::stoi(fields[5]));
    } catch (const std::invalid_argument&) {
        throw StorageError(path.string() + ":" + std::to_string(line_no) + ": malformed row");
    } catch (const std::out_of_range&) {
        throw StorageError(path.string() + ":" + std::to_string(line_no) + ": value out of range");
    } catch (const ConfigurationError&) {
        throw StorageError(path.string() + ":" + std::to_string(line_no) + ": malformed time");
    }

    if (s.beam < 0 || s.gate < 0 || !std::isfinite(s.power_db)) {
        throw StorageError(path.string() + ":" + std::to_string(line_no) +
                           ": negative index or non-finite power");
    }
    return s;
}

} // namespace

fs::path CsvRawDataSource::day_file(const std::string& radar, EpochSeconds day) const {
    return raw_dir_ / radar / (core::format_utc_day(day) + ".csv");
}

std::vector<RawSample> CsvRawDataSource::read(const std::string& radar, EpochSeconds start,
                                              EpochSeconds end) {
    std::vector<RawSample> out;
    if (end <= start) {
        return out;
    }

    for (EpochSeconds day = core::utc_day_start(start); day < end; day += 86400) {
        fs::path path = day_file(radar, day);
        if (!fs::exists(path)) {
            continue;
        }

        std::ifstream in(path);
        if (!in) {
            throw StorageError("Cannot open raw file: " + path.string());
        }

        std::string line;
        size_t line_no = 0;
        while (std::getline(in, line)) {
            ++line_no;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty() || line[0] == '#') continue;
            if (line_no == 1 && core::starts_with(line, "time")) continue;

            RawSample s = parse_row(line, path, line_no);
            if (s.time >= start && s.time < end) {
                out.push_back(s);
            }
        }
    }
    return out;
}

void CsvRawDataSource::append(const std::string& radar,
                              const std::vector<RawSample>& samples) const {
    std::map<EpochSeconds, std::vector<const RawSample*>> by_day;
    for (const auto& s : samples) {
        by_day[core::utc_day_start(s.time)].push_back(&s);
    }

    for (const auto& [day, rows] : by_day) {
        fs::path path = day_file(radar, day);
        fs::create_directories(path.parent_path());
        const bool fresh = !fs::exists(path);

        std::ofstream out(path, std::ios::app);
        if (!out) {
            throw StorageError("Cannot write raw file: " + path.string());
        }
        if (fresh) {
            out << kHeader << "\n";
        }
        out << std::setprecision(10);
        for (const RawSample* s : rows) {
            out << s->time << "," << s->beam << "," << s->gate << "," << s->power_db << ",";
            if (s->velocity) out << *s->velocity;
            out << "," << scatter_type_to_int(s->scatter) << "\n";
        }
        if (!out) {
            throw StorageError("Write failed: " + path.string());
        }
    }
}

} // namespace tid_music::io
