#include "tid_music/catalog/event_catalog.hpp"
#include "tid_music/core/errors.hpp"
#include "tid_music/core/utils.hpp"

#include <algorithm>
#include <functional>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace tid_music::catalog {

namespace {

// Advisory lock on a sidecar file, held for the lifetime of the object.
class FileLock {
public:
    explicit FileLock(const fs::path& path) {
        fd_ = ::open(path.c_str(), O_RDWR | O_CREAT, 0644);
        if (fd_ < 0) {
            throw StorageError("Cannot open lock file: " + path.string());
        }
        if (::flock(fd_, LOCK_EX) != 0) {
            ::close(fd_);
            throw StorageError("Cannot lock: " + path.string());
        }
    }
    ~FileLock() {
        if (fd_ >= 0) {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
        }
    }
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    int fd_ = -1;
};

fs::path lock_path(const fs::path& doc) {
    return doc.parent_path() / ("." + doc.filename().string() + ".lock");
}

json load_document(const fs::path& path) {
    try {
        return json::parse(core::read_text(path));
    } catch (const json::parse_error& e) {
        throw StorageError("Corrupt catalog document " + path.string() + ": " + e.what());
    }
}

void store_document(const fs::path& path, const json& doc) {
    try {
        core::write_text_atomic(path, doc.dump(2, ' ', false, json::error_handler_t::replace));
    } catch (const IOError& e) {
        throw StorageError(e.what());
    }
}

bool compare(const json& lhs, FilterOp op, const json& rhs) {
    switch (op) {
        case FilterOp::EQ: return lhs == rhs;
        case FilterOp::NE: return lhs != rhs;
        default: break;
    }
    // Ordering is only defined between values of comparable kinds.
    const bool both_numbers = lhs.is_number() && rhs.is_number();
    const bool both_strings = lhs.is_string() && rhs.is_string();
    if (!both_numbers && !both_strings) {
        return false;
    }
    switch (op) {
        case FilterOp::LT: return lhs < rhs;
        case FilterOp::LE: return lhs <= rhs;
        case FilterOp::GT: return lhs > rhs;
        case FilterOp::GE: return lhs >= rhs;
        default: return false;
    }
}

} // namespace

json field_at(const json& doc, const std::string& dotted_path) {
    const json* cur = &doc;
    for (const auto& part : core::split(dotted_path, '.')) {
        if (!cur->is_object()) return json();
        auto it = cur->find(part);
        if (it == cur->end()) return json();
        cur = &(*it);
    }
    return *cur;
}

bool matches(const json& doc, const FieldFilter& filter) {
    return compare(field_at(doc, filter.path), filter.op, filter.value);
}

json new_event_document(const core::EventId& id) {
    json doc;
    doc["radar"] = id.radar;
    doc["start"] = core::format_utc(id.start);
    doc["end"] = core::format_utc(id.end);
    doc["start_epoch"] = id.start;
    doc["end_epoch"] = id.end;
    doc["process_level"] = core::process_level_to_string(core::ProcessLevel::NONE);
    doc["category"] = category_to_string(Category::UNCLASSIFIED);
    doc["no_data"] = false;
    doc["signals"] = json::array();
    doc["updated_at"] = core::get_iso_timestamp();
    return doc;
}

core::EventId event_id_from_document(const json& doc) {
    if (!doc.contains("radar") || !doc.contains("start_epoch") || !doc.contains("end_epoch")) {
        throw StorageError("event document lacks radar/start_epoch/end_epoch");
    }
    core::EventId id;
    id.radar = doc["radar"].get<std::string>();
    id.start = doc["start_epoch"].get<EpochSeconds>();
    id.end = doc["end_epoch"].get<EpochSeconds>();
    return id;
}

core::ProcessLevel level_of(const json& doc) {
    return core::string_to_process_level(doc.value("process_level", std::string("none")));
}

Category category_of(const json& doc) {
    return string_to_category(doc.value("category", std::string("unclassified")));
}

fs::path JsonEventCatalog::path_for(const core::EventId& id) const {
    return root_ / id.radar / (id.window_name() + ".json");
}

std::mutex& JsonEventCatalog::stripe(const core::EventId& id) {
    return stripes_[std::hash<std::string>{}(id.key()) % kStripes];
}

std::optional<json> JsonEventCatalog::get(const core::EventId& id) {
    const fs::path p = path_for(id);
    std::lock_guard<std::mutex> lock(stripe(id));
    if (!fs::exists(p)) {
        return std::nullopt;
    }
    return load_document(p);
}

void JsonEventCatalog::update_fields(const core::EventId& id, const json& patch) {
    if (!patch.is_object()) {
        throw StorageError("update for " + id.key() + " is not an object");
    }
    const fs::path p = path_for(id);

    std::lock_guard<std::mutex> lock(stripe(id));
    if (!fs::exists(p)) {
        throw StorageError("no catalog entry for " + id.key());
    }
    FileLock file_lock(lock_path(p));

    json doc = load_document(p);
    doc.merge_patch(patch);
    doc["updated_at"] = core::get_iso_timestamp();
    store_document(p, doc);
}

std::vector<json> JsonEventCatalog::query(const EventQuery& q) {
    std::vector<json> out;
    if (!fs::exists(root_)) {
        return out;
    }

    // A radar equality filter narrows the scan to one directory.
    std::vector<fs::path> dirs;
    for (const auto& f : q.filters) {
        if (f.path == "radar" && f.op == FilterOp::EQ && f.value.is_string()) {
            dirs.push_back(root_ / f.value.get<std::string>());
        }
    }
    if (dirs.empty()) {
        for (const auto& entry : fs::directory_iterator(root_)) {
            if (entry.is_directory()) dirs.push_back(entry.path());
        }
    }
    std::sort(dirs.begin(), dirs.end());

    for (const auto& dir : dirs) {
        if (!fs::is_directory(dir)) continue;
        std::vector<fs::path> files;
        for (const auto& entry : fs::directory_iterator(dir)) {
            const std::string name = entry.path().filename().string();
            if (entry.is_regular_file() && core::ends_with(name, ".json") && name[0] != '.') {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end());

        for (const auto& file : files) {
            json doc = load_document(file);
            bool keep = std::all_of(q.filters.begin(), q.filters.end(),
                                    [&](const FieldFilter& f) { return matches(doc, f); });
            if (keep) out.push_back(std::move(doc));
        }
    }

    if (!q.sort_field.empty()) {
        std::stable_sort(out.begin(), out.end(), [&](const json& a, const json& b) {
            const json va = field_at(a, q.sort_field);
            const json vb = field_at(b, q.sort_field);
            return q.descending ? vb < va : va < vb;
        });
    }
    if (q.limit > 0 && out.size() > q.limit) {
        out.resize(q.limit);
    }
    return out;
}

size_t JsonEventCatalog::insert_many(const std::vector<json>& docs) {
    size_t inserted = 0;
    for (const auto& doc : docs) {
        const core::EventId id = event_id_from_document(doc);
        const fs::path p = path_for(id);

        std::lock_guard<std::mutex> lock(stripe(id));
        fs::create_directories(p.parent_path());
        FileLock file_lock(lock_path(p));
        if (fs::exists(p)) {
            continue;
        }
        store_document(p, doc);
        ++inserted;
    }
    return inserted;
}

} // namespace tid_music::catalog
