#include "vw_guider/io/records_io.hpp"
#include "vw_guider/core/errors.hpp"
#include "vw_guider/core/utils.hpp"
#include "vw_guider/io/fits_io.hpp"

#include <cmath>

namespace vw_guider::io {

using json = nlohmann::json;

namespace {

json num(double v) {
    if (std::isfinite(v)) return v;
    return nullptr;
}

double num_or_nan(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return kNaN;
    return j[key].get<double>();
}

} // namespace

json to_json(const ExposureRecord& r) {
    json j;
    j["id"] = r.id;
    j["target"] = r.target;
    j["dither"] = r.dither;
    j["chunk_index"] = r.chunk_index;
    j["start_time"] = core::format_iso_timestamp(r.start);
    j["exptime"] = num(r.exptime);
    j["airmass"] = num(r.airmass);
    j["n_frames"] = r.n_frames;
    j["n_failed_fits"] = r.n_failed_fits;

    if (r.centroid) {
        j["centroid_x_mean"] = num(r.centroid->mean.x);
        j["centroid_y_mean"] = num(r.centroid->mean.y);
        j["centroid_x_std"] = num(r.centroid->std.x);
        j["centroid_y_std"] = num(r.centroid->std.y);
    } else {
        j["centroid_x_mean"] = nullptr;
        j["centroid_y_mean"] = nullptr;
        j["centroid_x_std"] = nullptr;
        j["centroid_y_std"] = nullptr;
    }

    j["fwhm_mean"] = r.fwhm_arcsec ? num(r.fwhm_arcsec->mean) : json(nullptr);
    j["fwhm_std"] = r.fwhm_arcsec ? num(r.fwhm_arcsec->std) : json(nullptr);
    j["flux_rate_mean"] = r.flux_rate ? num(r.flux_rate->mean) : json(nullptr);
    j["flux_rate_std"] = r.flux_rate ? num(r.flux_rate->std) : json(nullptr);
    return j;
}

json to_json(const ChunkRecord& r) {
    json j;
    j["target"] = r.target;
    j["chunk_index"] = r.chunk_index;
    j["n_exposures"] = r.n_exposures;
    j["start_time"] = core::format_iso_timestamp(r.start_time);
    j["end_time"] = core::format_iso_timestamp(r.end_time);
    j["fid_x_mean"] = r.mean_fiducial ? num(r.mean_fiducial->x) : json(nullptr);
    j["fid_y_mean"] = r.mean_fiducial ? num(r.mean_fiducial->y) : json(nullptr);
    j["exposure_ids"] = r.exposure_ids;
    j["exposure_paths"] = r.exposure_paths;
    j["is_sky"] = r.is_sky;
    return j;
}

ChunkRecord chunk_record_from_json(const json& j) {
    ChunkRecord r;
    try {
        r.target = j.at("target").get<std::string>();
        r.chunk_index = j.at("chunk_index").get<int>();
        r.n_exposures = j.at("n_exposures").get<int>();
        r.start_time = core::parse_iso_timestamp(j.at("start_time").get<std::string>());
        r.end_time = core::parse_iso_timestamp(j.at("end_time").get<std::string>());
        const double fx = num_or_nan(j, "fid_x_mean");
        const double fy = num_or_nan(j, "fid_y_mean");
        if (std::isfinite(fx) && std::isfinite(fy)) {
            r.mean_fiducial = Point2D{fx, fy};
        }
        r.exposure_ids = j.at("exposure_ids").get<std::vector<std::string>>();
        if (j.contains("exposure_paths")) {
            r.exposure_paths = j.at("exposure_paths").get<std::vector<std::string>>();
        }
        r.is_sky = j.value("is_sky", false);
    } catch (const json::exception& e) {
        throw ValidationError(std::string("Malformed chunk record: ") + e.what());
    }
    return r;
}

void write_exposure_records(const fs::path& path, const std::vector<ExposureRecord>& records) {
    json arr = json::array();
    for (const auto& r : records) {
        arr.push_back(to_json(r));
    }
    core::write_text(path, arr.dump(2));
}

void write_chunk_records(const fs::path& path, const std::vector<ChunkRecord>& records) {
    json arr = json::array();
    for (const auto& r : records) {
        arr.push_back(to_json(r));
    }
    core::write_text(path, arr.dump(2));
}

std::vector<ChunkRecord> read_chunk_records(const fs::path& path) {
    json doc;
    try {
        doc = json::parse(core::read_text(path));
    } catch (const json::exception& e) {
        throw IOError("Cannot parse " + path.string() + ": " + e.what());
    }
    if (!doc.is_array()) {
        throw IOError(path.string() + ": expected a JSON array of chunk records");
    }

    std::vector<ChunkRecord> records;
    for (const auto& j : doc) {
        records.push_back(chunk_record_from_json(j));
    }
    return records;
}

void write_stacked_fits(const fs::path& path, const Matrix2Df& image,
                        const std::string& target, int chunk_index, int n_frames) {
    FitsHeader header;
    header.set("TARGET", target);
    header.set("CHUNK", chunk_index);
    header.set("NFRAMES", n_frames);
    header.set("BUNIT", std::string("counts/s"));
    write_fits_float(path, image, header);
}

} // namespace vw_guider::io
