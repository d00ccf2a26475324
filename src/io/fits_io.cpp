#include "vw_guider/io/fits_io.hpp"
#include "vw_guider/core/errors.hpp"
#include "vw_guider/core/utils.hpp"

#include <fitsio.h>

#include <limits>

namespace vw_guider::io {

namespace {

template <typename Map>
std::optional<typename Map::mapped_type> find_value(const Map& values, const std::string& key) {
    auto it = values.find(key);
    if (it == values.end()) return std::nullopt;
    return it->second;
}

} // namespace

std::optional<std::string> FitsHeader::get_string(const std::string& key) const {
    return find_value(string_values, key);
}

std::optional<double> FitsHeader::get_double(const std::string& key) const {
    return find_value(numeric_values, key);
}

std::optional<int> FitsHeader::get_int(const std::string& key) const {
    return find_value(int_values, key);
}

std::optional<bool> FitsHeader::get_bool(const std::string& key) const {
    return find_value(bool_values, key);
}

double FitsHeader::get_number_or_nan(const std::string& key) const {
    if (auto d = get_double(key)) return *d;
    if (auto i = get_int(key)) return static_cast<double>(*i);
    return kNaN;
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

void FitsHeader::set(const std::string& key, bool value) {
    bool_values[key] = value;
}

bool is_fits_image_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".fit" || ext == ".fits" || ext == ".fts";
}

namespace {

// Owns an open cfitsio handle
class FitsFile {
public:
    FitsFile() = default;
    FitsFile(const FitsFile&) = delete;
    FitsFile& operator=(const FitsFile&) = delete;
    ~FitsFile() {
        if (fptr_) {
            int status = 0;
            fits_close_file(fptr_, &status);
        }
    }

    void open_readonly(const fs::path& path) {
        int status = 0;
        if (fits_open_file(&fptr_, path.string().c_str(), READONLY, &status)) {
            fptr_ = nullptr;
            throw FitsError("Cannot open FITS file: " + path.string());
        }
    }

    // Overwrites an existing file
    void create(const fs::path& path) {
        int status = 0;
        const std::string name = "!" + path.string();
        if (fits_create_file(&fptr_, name.c_str(), &status)) {
            fptr_ = nullptr;
            throw FitsError("Cannot create FITS file: " + path.string());
        }
    }

    fitsfile* get() const { return fptr_; }

private:
    fitsfile* fptr_ = nullptr;
};

void write_header_keys(fitsfile* fptr, const FitsHeader& header, int& status) {
    // Longer names would need HIERARCH cards
    auto fits_key = [](const std::string& key) { return key.size() <= 8; };

    for (const auto& [key, value] : header.string_values) {
        if (!fits_key(key)) continue;
        fits_update_key(fptr, TSTRING, key.c_str(), const_cast<char*>(value.c_str()), nullptr,
                        &status);
    }
    for (const auto& [key, value] : header.numeric_values) {
        if (!fits_key(key)) continue;
        double v = value;
        fits_update_key(fptr, TDOUBLE, key.c_str(), &v, nullptr, &status);
    }
    for (const auto& [key, value] : header.int_values) {
        if (!fits_key(key)) continue;
        int v = value;
        fits_update_key(fptr, TINT, key.c_str(), &v, nullptr, &status);
    }
    for (const auto& [key, value] : header.bool_values) {
        if (!fits_key(key)) continue;
        int v = value ? 1 : 0;
        fits_update_key(fptr, TLOGICAL, key.c_str(), &v, nullptr, &status);
    }
    for (const auto& text : header.comments) {
        fits_write_comment(fptr, text.c_str(), &status);
    }
}

// COMMENT cards cfitsio adds to every primary header it creates
bool is_format_boilerplate(const std::string& text) {
    return text.find("FITS (Flexible Image Transport System) format") != std::string::npos ||
           text.find("and Astrophysics', volume 376") != std::string::npos;
}

FitsHeader parse_header(fitsfile* fptr) {
    FitsHeader header;
    int status = 0;

    char card[FLEN_CARD];
    int nkeys = 0;
    fits_get_hdrspace(fptr, &nkeys, nullptr, &status);
    if (status) {
        return header;
    }

    for (int i = 1; i <= nkeys; ++i) {
        status = 0;
        fits_read_record(fptr, i, card, &status);
        if (status) continue;

        char keyname[FLEN_KEYWORD];
        char value[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        int keylen = 0;

        fits_get_keyname(card, keyname, &keylen, &status);
        if (status) continue;

        std::string key(keyname);
        if (key == "COMMENT") {
            std::string text(card);
            text = text.size() > 8 ? core::trim(text.substr(8)) : "";
            if (!text.empty() && !is_format_boilerplate(text)) header.comments.push_back(text);
            continue;
        }
        if (key.empty() || key == "HISTORY" || key == "END") {
            continue;
        }

        fits_parse_value(card, value, comment, &status);
        if (status) continue;

        char dtype;
        fits_get_keytype(value, &dtype, &status);
        if (status) {
            status = 0;
            dtype = 'C';
        }

        std::string val_str = core::trim(value);

        switch (dtype) {
            case 'C':
                header.set(key, val_str);
                break;
            case 'L':
                header.set(key, val_str == "T" || val_str == "1");
                break;
            case 'I':
                try {
                    header.set(key, std::stoi(val_str));
                } catch (const std::exception&) {
                    header.set(key, val_str);
                }
                break;
            case 'F':
                try {
                    header.set(key, std::stod(val_str));
                } catch (const std::exception&) {
                    header.set(key, val_str);
                }
                break;
            default:
                header.set(key, val_str);
                break;
        }
    }
    return header;
}

} // namespace

std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path) {
    FitsFile file;
    file.open_readonly(path);

    int status = 0;
    int bitpix = 0;
    int naxis = 0;
    long naxes[3] = {0, 0, 0};
    if (fits_get_img_param(file.get(), 3, &bitpix, &naxis, naxes, &status)) {
        throw FitsError("Cannot read FITS image parameters: " + path.string());
    }
    if (naxis < 2 || naxes[0] < 1 || naxes[1] < 1) {
        throw FitsError("Not a 2-D FITS image: " + path.string());
    }

    // Guide cameras are monochrome; only the first plane of a cube is read.
    // Row-major storage matches the FITS pixel order (x fastest).
    Matrix2Df data(naxes[1], naxes[0]);
    long first[3] = {1, 1, 1};
    float blank = std::numeric_limits<float>::quiet_NaN();
    int any_blank = 0;
    if (fits_read_pix(file.get(), TFLOAT, first, static_cast<LONGLONG>(data.size()), &blank,
                      data.data(), &any_blank, &status)) {
        throw FitsError("Cannot read FITS pixel data: " + path.string());
    }

    return {std::move(data), parse_header(file.get())};
}

FitsHeader read_fits_header(const fs::path& path) {
    FitsFile file;
    file.open_readonly(path);
    return parse_header(file.get());
}

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header) {
    FitsFile file;
    file.create(path);

    int status = 0;
    long naxes[2] = {static_cast<long>(data.cols()), static_cast<long>(data.rows())};
    if (fits_create_img(file.get(), FLOAT_IMG, 2, naxes, &status)) {
        throw FitsError("Cannot create FITS image: " + path.string());
    }

    write_header_keys(file.get(), header, status);
    if (status) {
        throw FitsError("Cannot write FITS header: " + path.string());
    }

    long first[2] = {1, 1};
    if (fits_write_pix(file.get(), TFLOAT, first, static_cast<LONGLONG>(data.size()),
                       const_cast<float*>(data.data()), &status)) {
        throw FitsError("Cannot write FITS pixel data: " + path.string());
    }
}

} // namespace vw_guider::io
