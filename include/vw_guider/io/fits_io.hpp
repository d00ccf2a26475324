#pragma once

#include "vw_guider/core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vw_guider::io {

struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;
    std::map<std::string, bool> bool_values;
    std::vector<std::string> comments;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;
    std::optional<bool> get_bool(const std::string& key) const;

    // Numeric value of a key stored as float or integer, NaN when absent
    double get_number_or_nan(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
    void set(const std::string& key, bool value);
};

bool is_fits_image_path(const fs::path& path);

std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path);

// Reads only the primary header
FitsHeader read_fits_header(const fs::path& path);

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header);

} // namespace vw_guider::io
