#pragma once

#include "tid_music/core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tid_music::io {

struct RawSample {
    EpochSeconds time = 0;
    int beam = 0;
    int gate = 0;
    double power_db = 0.0;
    std::optional<double> velocity;  // m/s
    ScatterType scatter = ScatterType::UNKNOWN;
};

// Source of calibrated backscatter samples for one radar.
class RawDataSource {
public:
    virtual ~RawDataSource() = default;

    // Samples with start <= time < end, in no particular order.
    virtual std::vector<RawSample> read(const std::string& radar, EpochSeconds start,
                                        EpochSeconds end) = 0;
};

// <raw_dir>/<radar>/<YYYYMMDD>.csv with a header line
// time,beam,gate,power,velocity,gflg
class CsvRawDataSource : public RawDataSource {
public:
    explicit CsvRawDataSource(fs::path raw_dir) : raw_dir_(std::move(raw_dir)) {}

    std::vector<RawSample> read(const std::string& radar, EpochSeconds start,
                                EpochSeconds end) override;

    fs::path day_file(const std::string& radar, EpochSeconds day) const;

    // Appends samples to their day files, writing headers for new files.
    void append(const std::string& radar, const std::vector<RawSample>& samples) const;

private:
    fs::path raw_dir_;
};

} // namespace tid_music::io
