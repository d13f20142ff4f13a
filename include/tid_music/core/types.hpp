#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cctype>
#include <complex>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace tid_music {

namespace fs = std::filesystem;

// Matrix types
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using ComplexMatrix2D = Eigen::Matrix<std::complex<double>, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using MaskMatrix = Eigen::Matrix<uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXd = Eigen::VectorXd;
using VectorXcd = Eigen::VectorXcd;

// UTC seconds since the Unix epoch
using EpochSeconds = int64_t;

inline std::string trim_upper(const std::string& s) {
    std::string norm = s;
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    norm.erase(norm.begin(),
               std::find_if(norm.begin(), norm.end(), not_space));
    norm.erase(std::find_if(norm.rbegin(), norm.rend(), not_space).base(),
               norm.end());
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return norm;
}

// Field-of-view model
enum class FovModel {
    GS,  // ground scatter, reflection-point mapping
    IS   // ionospheric scatter, direct mapping
};

inline std::string fov_model_to_string(FovModel model) {
    switch (model) {
        case FovModel::GS: return "GS";
        case FovModel::IS: return "IS";
        default: return "UNKNOWN";
    }
}

inline bool string_to_fov_model(const std::string& s, FovModel& out) {
    const std::string norm = trim_upper(s);
    if (norm == "GS") { out = FovModel::GS; return true; }
    if (norm == "IS") { out = FovModel::IS; return true; }
    return false;
}

// Scatter classification carried by each raw sample
enum class ScatterType {
    IONOSPHERIC = 0,
    GROUND = 1,
    UNKNOWN = -1
};

inline int scatter_type_to_int(ScatterType type) {
    return static_cast<int>(type);
}

inline ScatterType int_to_scatter_type(int i) {
    if (i == 0) return ScatterType::IONOSPHERIC;
    if (i == 1) return ScatterType::GROUND;
    return ScatterType::UNKNOWN;
}

// Scatter selection (gscat): 0 ionospheric, 1 ground, 3 all
inline bool scatter_selected(ScatterType type, int gscat) {
    switch (gscat) {
        case 0: return type == ScatterType::IONOSPHERIC;
        case 1: return type == ScatterType::GROUND;
        case 3: return true;
        default: return false;
    }
}

// Event classification
enum class Category {
    UNCLASSIFIED,
    QUIET,
    DISTURBED
};

inline std::string category_to_string(Category c) {
    switch (c) {
        case Category::QUIET: return "quiet";
        case Category::DISTURBED: return "disturbed";
        default: return "unclassified";
    }
}

inline Category string_to_category(const std::string& s) {
    const std::string norm = trim_upper(s);
    if (norm == "QUIET") return Category::QUIET;
    if (norm == "DISTURBED") return Category::DISTURBED;
    return Category::UNCLASSIFIED;
}

} // namespace tid_music
