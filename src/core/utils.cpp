#include "vw_guider/core/utils.hpp"
#include "vw_guider/core/errors.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <regex>
#include <sstream>

#include <sys/stat.h>

namespace vw_guider::core {

std::string get_iso_timestamp() {
    return format_iso_timestamp(std::chrono::system_clock::now());
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

TimePoint parse_iso_timestamp(const std::string& text) {
    static const std::regex re(
        R"(^\s*(\d{4})-(\d{2})-(\d{2})[T ](\d{1,2}):(\d{2}):(\d{2})(?:\.(\d+))?\s*Z?\s*$)");
    std::smatch m;
    if (!std::regex_match(text, m, re)) {
        throw ValidationError("Malformed ISO timestamp: '" + text + "'");
    }

    std::tm tm_buf{};
    tm_buf.tm_year = std::stoi(m[1].str()) - 1900;
    tm_buf.tm_mon = std::stoi(m[2].str()) - 1;
    tm_buf.tm_mday = std::stoi(m[3].str());
    tm_buf.tm_hour = std::stoi(m[4].str());
    tm_buf.tm_min = std::stoi(m[5].str());
    tm_buf.tm_sec = std::stoi(m[6].str());

    if (tm_buf.tm_mon < 0 || tm_buf.tm_mon > 11 || tm_buf.tm_mday < 1 ||
        tm_buf.tm_mday > 31 || tm_buf.tm_hour > 23 || tm_buf.tm_min > 59 ||
        tm_buf.tm_sec > 60) {
        throw ValidationError("Out-of-range ISO timestamp: '" + text + "'");
    }

    std::time_t secs = timegm(&tm_buf);
    TimePoint tp = std::chrono::system_clock::from_time_t(secs);

    if (m[7].matched) {
        // Fractional seconds, truncated to microseconds
        std::string frac = m[7].str().substr(0, 6);
        while (frac.size() < 6) frac.push_back('0');
        tp += std::chrono::microseconds(std::stol(frac));
    }
    return tp;
}

std::string format_iso_timestamp(const TimePoint& tp) {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    auto since_epoch = tp.time_since_epoch();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
        time_t_val -= 1;
    }

    std::tm tm_buf;
    gmtime_r(&time_t_val, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

TimePoint file_mtime_as_timepoint(const fs::path& path) {
    struct stat st;
    if (::stat(path.string().c_str(), &st) != 0) {
        throw IOError("Cannot stat file: " + path.string());
    }
    return std::chrono::system_clock::from_time_t(st.st_mtime);
}

std::vector<fs::path> discover_files(const fs::path& dir, const std::string& pattern) {
    std::vector<fs::path> files;

    if (!fs::exists(dir) || !fs::is_directory(dir)) {
        return files;
    }

    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file()) {
            std::string filename = entry.path().filename().string();
            if (glob_match(pattern, filename)) {
                files.push_back(entry.path());
            }
        }
    }

    std::sort(files.begin(), files.end());
    return files;
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

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream file(path);
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }
    file << text;
}

double median_of(std::vector<double> v) {
    if (v.empty()) return kNaN;
    const size_t n = v.size();
    const size_t mid = n / 2;
    std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid), v.end());
    const double hi = v[mid];
    if ((n % 2) == 1) return hi;
    const double lo = *std::max_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid));
    return 0.5 * (lo + hi);
}

double mean_of(const std::vector<double>& v) {
    if (v.empty()) return kNaN;
    double sum = 0.0;
    for (double x : v) sum += x;
    return sum / static_cast<double>(v.size());
}

double stddev_of(const std::vector<double>& v) {
    if (v.empty()) return kNaN;
    const double mean = mean_of(v);
    double var = 0.0;
    for (double x : v) {
        const double d = x - mean;
        var += d * d;
    }
    var /= static_cast<double>(v.size());
    return std::sqrt(var);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n'\"";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::ostringstream oss;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) oss << delimiter;
        oss << parts[i];
    }
    return oss.str();
}

bool glob_match(const std::string& pattern, const std::string& str) {
    std::string regex_pattern;
    for (char c : pattern) {
        switch (c) {
            case '*': regex_pattern += ".*"; break;
            case '?': regex_pattern += "."; break;
            case '.': regex_pattern += "\\."; break;
            case '[': regex_pattern += "["; break;
            case ']': regex_pattern += "]"; break;
            default: regex_pattern += c; break;
        }
    }

    std::regex re(regex_pattern, std::regex::icase);
    return std::regex_match(str, re);
}

} // namespace vw_guider::core
