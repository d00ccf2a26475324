#pragma once

#include "vw_guider/core/types.hpp"

#include <optional>
#include <string>

namespace vw_guider::io {
struct FrameIndexEntry;
}

namespace vw_guider::guider {

struct FrameMetadata {
    fs::path path;
    TimePoint timestamp;
    double exptime = kNaN;
    double airmass = kNaN;
};

// Rectangular sub-region of a frame. origin_x/origin_y are the frame
// coordinates (in the requested pixel convention) of the cutout's pixel (0, 0).
struct Cutout {
    Matrix2Df data;
    int origin_x = 0;
    int origin_y = 0;

    bool empty() const { return data.size() == 0; }
    int width() const { return static_cast<int>(data.cols()); }
    int height() const { return static_cast<int>(data.rows()); }
};

// One guide-camera frame. File-backed frames read their pixels on first
// access and can drop them again with release().
class FrameSource {
public:
    explicit FrameSource(FrameMetadata metadata);
    FrameSource(Matrix2Df data, FrameMetadata metadata);

    static FrameSource from_index_entry(const io::FrameIndexEntry& entry);

    const FrameMetadata& metadata() const { return metadata_; }
    const TimePoint& timestamp() const { return metadata_.timestamp; }
    double exptime() const { return metadata_.exptime; }
    double airmass() const { return metadata_.airmass; }
    std::string name() const;

    // Loads the pixel data if needed. Throws IOError/FitsError.
    const Matrix2Df& data();
    void load();
    // Frees the pixel buffer of a file-backed frame; no-op for in-memory frames
    void release();

    bool is_loaded() const { return data_.has_value(); }
    bool is_file_backed() const { return !metadata_.path.empty(); }

    // Square cutout of edge `size` centred on (cx, cy), clamped to the frame.
    // Coordinates follow pixel_origin (1 = FITS convention, 0 = array indices).
    // Returns an empty cutout when the centre is not finite or the region
    // does not overlap the frame.
    Cutout cutout(double cx, double cy, int size, int pixel_origin = 1);

private:
    FrameMetadata metadata_;
    std::optional<Matrix2Df> data_;
};

} // namespace vw_guider::guider
