#pragma once

#include "tid_music/core/event_id.hpp"
#include "tid_music/io/fits_io.hpp"

#include <string>

namespace tid_music::io {

// Durable storage of per-event, per-stage array bundles. Each (event, stage)
// lives at its own location; a write is all-or-nothing.
class ArrayStore {
public:
    virtual ~ArrayStore() = default;

    virtual void write(const core::EventId& id, const std::string& stage,
                       const ArrayBundle& bundle) = 0;
    virtual ArrayBundle read(const core::EventId& id, const std::string& stage) = 0;
    virtual bool exists(const core::EventId& id, const std::string& stage) = 0;
};

// <array_dir>/<radar>/<start>-<end>/<stage>.fits
class FitsArrayStore : public ArrayStore {
public:
    explicit FitsArrayStore(fs::path root) : root_(std::move(root)) {}

    void write(const core::EventId& id, const std::string& stage,
               const ArrayBundle& bundle) override;
    ArrayBundle read(const core::EventId& id, const std::string& stage) override;
    bool exists(const core::EventId& id, const std::string& stage) override;

    fs::path path_for(const core::EventId& id, const std::string& stage) const;

private:
    fs::path root_;
};

} // namespace tid_music::io
