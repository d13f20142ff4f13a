#include "tid_music/io/fits_io.hpp"
#include "tid_music/core/errors.hpp"
#include "tid_music/core/utils.hpp"

#include <fitsio.h>
#include <algorithm>
#include <mutex>
#include <set>

namespace tid_music::io {

namespace {

// cfitsio is not guaranteed to be built reentrant.
std::mutex& fits_mutex() {
    static std::mutex m;
    return m;
}

constexpr int kMaxDims = 8;

const std::set<std::string>& structural_keys() {
    static const std::set<std::string> keys = {
        "SIMPLE", "BITPIX", "NAXIS", "EXTEND", "XTENSION", "PCOUNT",
        "GCOUNT", "EXTNAME", "BSCALE", "BZERO", "EMPTYDIM", "END"};
    return keys;
}

bool is_structural(const std::string& key) {
    if (structural_keys().count(key)) return true;
    return key.size() > 5 && key.compare(0, 5, "NAXIS") == 0;
}

std::string fits_status_text(int status) {
    char text[FLEN_STATUS];
    fits_get_errstatus(status, text);
    return std::string(text);
}

void check_key(const std::string& key) {
    if (key.empty() || key.size() > 8) {
        throw FitsError("FITS keyword must be 1-8 characters: '" + key + "'");
    }
}

void write_header(fitsfile* fptr, const FitsHeader& header, int& status) {
    for (const auto& [key, value] : header.string_values) {
        fits_update_key(fptr, TSTRING, key.c_str(),
                        const_cast<char*>(value.c_str()), nullptr, &status);
    }
    for (const auto& [key, value] : header.numeric_values) {
        double val = value;
        fits_update_key(fptr, TDOUBLE, key.c_str(), &val, nullptr, &status);
    }
    for (const auto& [key, value] : header.int_values) {
        int val = value;
        fits_update_key(fptr, TINT, key.c_str(), &val, nullptr, &status);
    }
}

FitsHeader read_header(fitsfile* fptr) {
    FitsHeader header;
    int status = 0;
    int nkeys = 0;
    fits_get_hdrspace(fptr, &nkeys, nullptr, &status);
    if (status) {
        return header;
    }

    char card[FLEN_CARD];
    for (int i = 1; i <= nkeys; ++i) {
        status = 0;
        if (fits_read_record(fptr, i, card, &status)) continue;

        char keyname[FLEN_KEYWORD];
        char value[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        int keylen = 0;
        if (fits_get_keyname(card, keyname, &keylen, &status)) continue;

        std::string key(keyname);
        if (key.empty() || key == "COMMENT" || key == "HISTORY" || is_structural(key)) {
            continue;
        }

        if (fits_parse_value(card, value, comment, &status)) continue;
        char dtype = 'C';
        if (fits_get_keytype(value, &dtype, &status)) continue;

        std::string val_str(value);
        val_str.erase(0, val_str.find_first_not_of(" '"));
        val_str.erase(val_str.find_last_not_of(" '") + 1);

        switch (dtype) {
            case 'I':
                try {
                    header.set(key, std::stoi(val_str));
                } catch (const std::exception&) {
                    header.set(key, std::stod(val_str));
                }
                break;
            case 'F':
                header.set(key, std::stod(val_str));
                break;
            default:
                header.set(key, val_str);
                break;
        }
    }
    return header;
}

std::string shape_to_string(const std::vector<long>& shape) {
    std::vector<std::string> parts;
    for (long d : shape) parts.push_back(std::to_string(d));
    return core::join(parts, "x");
}

std::vector<long> shape_from_string(const std::string& s) {
    std::vector<long> shape;
    for (const auto& p : core::split(s, 'x')) {
        if (!p.empty()) shape.push_back(std::stol(p));
    }
    return shape;
}

void check_keys(const FitsHeader& header) {
    for (const auto& kv : header.string_values) check_key(kv.first);
    for (const auto& kv : header.numeric_values) check_key(kv.first);
    for (const auto& kv : header.int_values) check_key(kv.first);
}

void write_bundle_locked(const fs::path& path, const ArrayBundle& bundle) {
    check_keys(bundle.attrs);

    fitsfile* fptr = nullptr;
    int status = 0;

    std::string filepath = "!" + path.string();
    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string() + " (" +
                        fits_status_text(status) + ")");
    }

    fits_create_img(fptr, DOUBLE_IMG, 0, nullptr, &status);
    write_header(fptr, bundle.attrs, status);
    if (status) {
        int ignore = 0;
        fits_close_file(fptr, &ignore);
        throw FitsError("Cannot write primary header: " + path.string() + " (" +
                        fits_status_text(status) + ")");
    }

    for (const auto& [name, arr] : bundle.arrays) {
        if (arr.shape.size() > static_cast<size_t>(kMaxDims)) {
            int ignore = 0;
            fits_close_file(fptr, &ignore);
            throw FitsError("Array '" + name + "' has too many dimensions");
        }
        if (arr.data.size() != arr.expected_size()) {
            int ignore = 0;
            fits_close_file(fptr, &ignore);
            throw FitsError("Array '" + name + "' data does not match its shape");
        }

        const bool empty = arr.data.empty();
        // FITS axis order is fastest-varying first.
        std::vector<long> naxes(arr.shape.rbegin(), arr.shape.rend());
        int naxis = empty ? 0 : static_cast<int>(naxes.size());
        fits_create_img(fptr, DOUBLE_IMG, naxis, empty ? nullptr : naxes.data(), &status);
        fits_update_key(fptr, TSTRING, "EXTNAME", const_cast<char*>(name.c_str()),
                        nullptr, &status);
        if (empty) {
            std::string dims = shape_to_string(arr.shape);
            fits_update_key(fptr, TSTRING, "EMPTYDIM", const_cast<char*>(dims.c_str()),
                            nullptr, &status);
        } else {
            std::vector<long> fpixel(naxes.size(), 1);
            fits_write_pix(fptr, TDOUBLE, fpixel.data(),
                           static_cast<LONGLONG>(arr.data.size()),
                           const_cast<double*>(arr.data.data()), &status);
        }
        if (status) {
            int ignore = 0;
            fits_close_file(fptr, &ignore);
            throw FitsError("Cannot write array '" + name + "' to " + path.string() + " (" +
                            fits_status_text(status) + ")");
        }
    }

    fits_close_file(fptr, &status);
    if (status) {
        throw FitsError("Cannot close FITS file: " + path.string());
    }
}

} // namespace

std::optional<std::string> FitsHeader::get_string(const std::string& key) const {
    auto it = string_values.find(key);
    if (it != string_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> FitsHeader::get_double(const std::string& key) const {
    auto it = numeric_values.find(key);
    if (it != numeric_values.end()) {
        return it->second;
    }
    auto iit = int_values.find(key);
    if (iit != int_values.end()) {
        return static_cast<double>(iit->second);
    }
    return std::nullopt;
}

std::optional<int> FitsHeader::get_int(const std::string& key) const {
    auto it = int_values.find(key);
    if (it != int_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void FitsHeader::set(const std::string& key, const std::string& value) {
    string_values[key] = value;
}

void FitsHeader::set(const std::string& key, double value) {
    numeric_values[key] = value;
}

void FitsHeader::set(const std::string& key, int value) {
    int_values[key] = value;
}

size_t NdArray::expected_size() const {
    if (shape.empty()) return 0;
    size_t n = 1;
    for (long d : shape) n *= static_cast<size_t>(std::max(0L, d));
    return n;
}

const NdArray& ArrayBundle::array(const std::string& name) const {
    auto it = arrays.find(name);
    if (it == arrays.end()) {
        throw StorageError("array bundle has no array '" + name + "'");
    }
    return it->second;
}

NdArray from_matrix(const Matrix2Dd& m) {
    NdArray a;
    a.shape = {static_cast<long>(m.rows()), static_cast<long>(m.cols())};
    a.data.assign(m.data(), m.data() + m.size());
    return a;
}

Matrix2Dd to_matrix(const NdArray& a) {
    if (a.shape.size() != 2 || a.data.size() != a.expected_size()) {
        throw StorageError("array is not a 2-D matrix");
    }
    Matrix2Dd m(a.shape[0], a.shape[1]);
    std::copy(a.data.begin(), a.data.end(), m.data());
    return m;
}

NdArray from_vector(const std::vector<double>& v) {
    return NdArray({static_cast<long>(v.size())}, v);
}

void write_bundle(const fs::path& path, const ArrayBundle& bundle) {
    fs::create_directories(path.parent_path());
    const fs::path tmp = core::unique_temp_path(path);
    {
        std::lock_guard<std::mutex> lock(fits_mutex());
        try {
            write_bundle_locked(tmp, bundle);
        } catch (const FitsError&) {
            std::error_code ec;
            fs::remove(tmp, ec);
            throw;
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw FitsError("Cannot move " + tmp.string() + " into place: " + path.string());
    }
}

ArrayBundle read_bundle(const fs::path& path) {
    std::lock_guard<std::mutex> lock(fits_mutex());

    fitsfile* fptr = nullptr;
    int status = 0;
    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    ArrayBundle bundle;
    bundle.attrs = read_header(fptr);

    int nhdus = 0;
    fits_get_num_hdus(fptr, &nhdus, &status);
    for (int hdu = 2; hdu <= nhdus && !status; ++hdu) {
        int hdutype = 0;
        fits_movabs_hdu(fptr, hdu, &hdutype, &status);
        if (status || hdutype != IMAGE_HDU) continue;

        char extname[FLEN_VALUE] = {0};
        fits_read_key(fptr, TSTRING, "EXTNAME", extname, nullptr, &status);
        if (status) {
            int ignore = 0;
            fits_close_file(fptr, &ignore);
            throw FitsError("HDU " + std::to_string(hdu) + " has no EXTNAME: " + path.string());
        }

        int naxis = 0;
        int bitpix = 0;
        long naxes[kMaxDims] = {0};
        fits_get_img_param(fptr, kMaxDims, &bitpix, &naxis, naxes, &status);
        if (status) break;

        NdArray arr;
        if (naxis == 0) {
            char dims[FLEN_VALUE] = {0};
            int kstatus = 0;
            fits_read_key(fptr, TSTRING, "EMPTYDIM", dims, nullptr, &kstatus);
            if (!kstatus) arr.shape = shape_from_string(dims);
        } else {
            arr.shape.assign(naxes, naxes + naxis);
            std::reverse(arr.shape.begin(), arr.shape.end());
            arr.data.resize(arr.expected_size());
            std::vector<long> fpixel(static_cast<size_t>(naxis), 1);
            fits_read_pix(fptr, TDOUBLE, fpixel.data(), static_cast<LONGLONG>(arr.data.size()),
                          nullptr, arr.data.data(), nullptr, &status);
            if (status) break;
        }
        bundle.arrays[extname] = std::move(arr);
    }

    if (status) {
        int ignore = 0;
        fits_close_file(fptr, &ignore);
        throw FitsError("Cannot read FITS data: " + path.string() + " (" +
                        fits_status_text(status) + ")");
    }

    fits_close_file(fptr, &status);
    return bundle;
}

} // namespace tid_music::io
