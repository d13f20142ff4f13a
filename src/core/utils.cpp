#include "tid_music/core/utils.hpp"
#include "tid_music/core/errors.hpp"
#include "tid_music/core/event_id.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <thread>

#include <openssl/evp.h>

namespace tid_music::core {

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string get_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_';

    const char* hex = "0123456789abcdef";
    for (int i = 0; i < 8; ++i) {
        oss << hex[dis(gen)];
    }

    return oss.str();
}

EpochSeconds parse_utc(const std::string& text) {
    std::string s = trim(text);
    if (!s.empty() && (s.back() == 'Z' || s.back() == 'z')) {
        s.pop_back();
    }
    std::replace(s.begin(), s.end(), 'T', ' ');

    static const char* kFormats[] = {"%Y-%m-%d %H:%M:%S", "%Y-%m-%d %H:%M",
                                     "%Y-%m-%d"};
    for (const char* fmt : kFormats) {
        std::tm tm_buf{};
        std::istringstream iss(s);
        iss >> std::get_time(&tm_buf, fmt);
        if (iss.fail()) continue;
        iss >> std::ws;
        if (!iss.eof()) continue;
        return static_cast<EpochSeconds>(timegm(&tm_buf));
    }
    throw ValidationError("cannot parse UTC time '" + text + "'");
}

std::string format_utc(EpochSeconds t) {
    std::time_t tt = static_cast<std::time_t>(t);
    std::tm tm_buf;
    gmtime_r(&tt, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string format_compact_utc(EpochSeconds t) {
    std::time_t tt = static_cast<std::time_t>(t);
    std::tm tm_buf;
    gmtime_r(&tt, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d.%H%M");
    return oss.str();
}

std::string format_utc_day(EpochSeconds t) {
    std::time_t tt = static_cast<std::time_t>(t);
    std::tm tm_buf;
    gmtime_r(&tt, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d");
    return oss.str();
}

EpochSeconds utc_day_start(EpochSeconds t) {
    const EpochSeconds day = 86400;
    EpochSeconds q = t / day;
    if (t < 0 && t % day != 0) --q;
    return q * day;
}

std::string read_text(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

fs::path unique_temp_path(const fs::path& target) {
    static std::atomic<uint64_t> counter{0};
    std::ostringstream oss;
    oss << target.filename().string() << ".tmp."
        << std::hash<std::thread::id>{}(std::this_thread::get_id()) << "."
        << counter.fetch_add(1);
    return target.parent_path() / oss.str();
}

void write_text_atomic(const fs::path& path, const std::string& text) {
    fs::create_directories(path.parent_path());
    const fs::path tmp = unique_temp_path(path);
    {
        std::ofstream file(tmp, std::ios::out | std::ios::trunc);
        if (!file) {
            throw IOError("Cannot create file: " + tmp.string());
        }
        file << text;
        file.flush();
        if (!file) {
            throw IOError("Cannot write file: " + tmp.string());
        }
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw IOError("Cannot rename into place: " + path.string());
    }
}

std::string sha256_bytes(const std::vector<uint8_t>& data) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return "";
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        return "";
    }
    if (!data.empty()) {
        if (EVP_DigestUpdate(ctx, data.data(), data.size()) != 1) {
            EVP_MD_CTX_free(ctx);
            return "";
        }
    }
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &hash_len) != 1) {
        EVP_MD_CTX_free(ctx);
        return "";
    }
    EVP_MD_CTX_free(ctx);

    std::ostringstream oss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

std::string sha256_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    return sha256_bytes(data);
}

double compute_median(std::vector<double> values) {
    return compute_percentile(std::move(values), 50.0);
}

double compute_percentile(std::vector<double> values, double percentile) {
    if (values.empty()) return 0.0;

    std::sort(values.begin(), values.end());

    const double p = std::min(std::max(percentile, 0.0), 100.0);
    const double idx = p / 100.0 * static_cast<double>(values.size() - 1);
    size_t lower = static_cast<size_t>(idx);
    size_t upper = std::min(lower + 1, values.size() - 1);
    const double frac = idx - static_cast<double>(lower);

    return values[lower] * (1.0 - frac) + values[upper] * frac;
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size()) return false;
    return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    if (prefix.size() > str.size()) return false;
    return str.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(str);
    std::string part;
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::ostringstream oss;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) oss << delimiter;
        oss << parts[i];
    }
    return oss.str();
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    const auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    const auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

std::string EventId::window_name() const {
    return format_compact_utc(start) + "-" + format_compact_utc(end);
}

std::string EventId::key() const {
    return radar + "/" + window_name();
}

} // namespace tid_music::core
