#pragma once

#include "vw_guider/core/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace vw_guider::io {

// Aggregate guide statistics of one exposure
struct ExposureRecord {
    std::string id;
    std::string target;
    int dither = 1;
    int chunk_index = -1;   // -1: calibration or not part of any chunk
    TimePoint start;
    double exptime = kNaN;
    double airmass = kNaN;
    int n_frames = 0;
    int n_failed_fits = 0;
    std::optional<CentroidStats> centroid;
    std::optional<MeanStd> fwhm_arcsec;
    std::optional<MeanStd> flux_rate;
};

// Summary of one dither chunk
struct ChunkRecord {
    std::string target;
    int chunk_index = 0;
    int n_exposures = 0;
    TimePoint start_time;
    TimePoint end_time;
    std::optional<Point2D> mean_fiducial;
    std::vector<std::string> exposure_ids;
    std::vector<std::string> exposure_paths;
    bool is_sky = false;
};

nlohmann::json to_json(const ExposureRecord& record);
nlohmann::json to_json(const ChunkRecord& record);
ChunkRecord chunk_record_from_json(const nlohmann::json& j);

void write_exposure_records(const fs::path& path, const std::vector<ExposureRecord>& records);
void write_chunk_records(const fs::path& path, const std::vector<ChunkRecord>& records);
std::vector<ChunkRecord> read_chunk_records(const fs::path& path);

// Stacked image with TARGET, CHUNK and NFRAMES keywords
void write_stacked_fits(const fs::path& path, const Matrix2Df& image,
                        const std::string& target, int chunk_index, int n_frames);

} // namespace vw_guider::io
