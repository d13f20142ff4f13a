#pragma once

#include "tid_music/core/event_id.hpp"
#include "tid_music/core/process_state.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tid_music::catalog {

using json = nlohmann::json;

enum class FilterOp { EQ, NE, LT, LE, GT, GE };

struct FieldFilter {
    std::string path;  // dotted, e.g. "classifier.threshold"
    FilterOp op = FilterOp::EQ;
    json value;
};

struct EventQuery {
    std::vector<FieldFilter> filters;
    std::string sort_field;
    bool descending = false;
    size_t limit = 0;  // 0 = unlimited

    EventQuery& where(const std::string& path, FilterOp op, json value) {
        filters.push_back({path, op, std::move(value)});
        return *this;
    }
    EventQuery& sort_by(const std::string& field, bool desc = false) {
        sort_field = field;
        descending = desc;
        return *this;
    }
};

// Field lookup on a dotted path; null when any component is missing.
json field_at(const json& doc, const std::string& dotted_path);
bool matches(const json& doc, const FieldFilter& filter);

// Durable store of event documents keyed by event identity.
class EventCatalog {
public:
    virtual ~EventCatalog() = default;

    virtual std::optional<json> get(const core::EventId& id) = 0;

    // Applies `patch` as a JSON merge patch. Atomic per document; throws
    // StorageError when the event does not exist.
    virtual void update_fields(const core::EventId& id, const json& patch) = 0;

    virtual std::vector<json> query(const EventQuery& q) = 0;

    // Existing identities are left untouched. Returns the number inserted.
    virtual size_t insert_many(const std::vector<json>& docs) = 0;
};

// <catalog_dir>/<radar>/<start>-<end>.json, one document per event.
class JsonEventCatalog : public EventCatalog {
public:
    explicit JsonEventCatalog(fs::path root) : root_(std::move(root)) {}

    std::optional<json> get(const core::EventId& id) override;
    void update_fields(const core::EventId& id, const json& patch) override;
    std::vector<json> query(const EventQuery& q) override;
    size_t insert_many(const std::vector<json>& docs) override;

    fs::path path_for(const core::EventId& id) const;

private:
    std::mutex& stripe(const core::EventId& id);

    static constexpr size_t kStripes = 64;

    fs::path root_;
    std::array<std::mutex, kStripes> stripes_;
};

// Fresh document for a new window, at process level none.
json new_event_document(const core::EventId& id);
core::EventId event_id_from_document(const json& doc);
core::ProcessLevel level_of(const json& doc);
Category category_of(const json& doc);

} // namespace tid_music::catalog
