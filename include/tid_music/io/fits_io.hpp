#pragma once

#include "tid_music/core/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tid_music::io {

// Typed FITS header values. Keywords are limited to 8 characters.
struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value) { set(key, std::string(value)); }
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
};

// Row-major N-dimensional array of doubles.
struct NdArray {
    std::vector<long> shape;
    std::vector<double> data;

    NdArray() = default;
    NdArray(std::vector<long> shape_, std::vector<double> data_)
        : shape(std::move(shape_)), data(std::move(data_)) {}

    size_t expected_size() const;
    long dim(size_t i) const { return i < shape.size() ? shape[i] : 0; }
};

// Named arrays plus attributes persisted as one unit.
struct ArrayBundle {
    std::map<std::string, NdArray> arrays;
    FitsHeader attrs;

    const NdArray& array(const std::string& name) const;
};

NdArray from_matrix(const Matrix2Dd& m);
Matrix2Dd to_matrix(const NdArray& a);
NdArray from_vector(const std::vector<double>& v);

// One image HDU per array (EXTNAME = name), attributes on the primary HDU.
// Writes to a sibling temporary file and renames it into place.
void write_bundle(const fs::path& path, const ArrayBundle& bundle);
ArrayBundle read_bundle(const fs::path& path);

} // namespace tid_music::io
