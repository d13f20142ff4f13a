#include "tid_music/io/array_store.hpp"
#include "tid_music/core/errors.hpp"

namespace tid_music::io {

fs::path FitsArrayStore::path_for(const core::EventId& id, const std::string& stage) const {
    return root_ / id.radar / id.window_name() / (stage + ".fits");
}

void FitsArrayStore::write(const core::EventId& id, const std::string& stage,
                           const ArrayBundle& bundle) {
    try {
        write_bundle(path_for(id, stage), bundle);
    } catch (const fs::filesystem_error& e) {
        throw StorageError(std::string("array store write failed: ") + e.what());
    }
}

ArrayBundle FitsArrayStore::read(const core::EventId& id, const std::string& stage) {
    fs::path p = path_for(id, stage);
    if (!fs::exists(p)) {
        throw StorageError("no '" + stage + "' arrays for " + id.key());
    }
    return read_bundle(p);
}

bool FitsArrayStore::exists(const core::EventId& id, const std::string& stage) {
    std::error_code ec;
    return fs::is_regular_file(path_for(id, stage), ec);
}

} // namespace tid_music::io
