#include "vw_guider/guider/frame_source.hpp"
#include "vw_guider/core/errors.hpp"
#include "vw_guider/io/fits_io.hpp"
#include "vw_guider/io/frame_index.hpp"

#include <algorithm>
#include <cmath>

namespace vw_guider::guider {

FrameSource::FrameSource(FrameMetadata metadata) : metadata_(std::move(metadata)) {}

FrameSource::FrameSource(Matrix2Df data, FrameMetadata metadata)
    : metadata_(std::move(metadata)), data_(std::move(data)) {
    metadata_.path.clear();
}

FrameSource FrameSource::from_index_entry(const io::FrameIndexEntry& entry) {
    FrameMetadata meta;
    meta.path = entry.path;
    meta.timestamp = entry.timestamp;
    meta.exptime = entry.exptime;
    meta.airmass = entry.airmass;
    return FrameSource(std::move(meta));
}

std::string FrameSource::name() const {
    if (is_file_backed()) {
        return metadata_.path.filename().string();
    }
    return "<memory>";
}

void FrameSource::load() {
    if (data_) return;
    if (!is_file_backed()) {
        throw IOError("In-memory frame has no pixel data");
    }
    auto [pixels, header] = io::read_fits_float(metadata_.path);
    (void)header;
    data_ = std::move(pixels);
}

const Matrix2Df& FrameSource::data() {
    load();
    return *data_;
}

void FrameSource::release() {
    if (is_file_backed()) {
        data_.reset();
    }
}

Cutout FrameSource::cutout(double cx, double cy, int size, int pixel_origin) {
    Cutout out;
    if (!std::isfinite(cx) || !std::isfinite(cy) || size <= 0) {
        return out;
    }

    const Matrix2Df& img = data();
    const int w = static_cast<int>(img.cols());
    const int h = static_cast<int>(img.rows());

    const double ix = cx - pixel_origin;
    const double iy = cy - pixel_origin;
    const double half = static_cast<double>(size) / 2.0;

    const double left = std::floor(ix - half);
    const double top = std::floor(iy - half);
    // Centres far off the frame give no overlap
    if (left >= w || top >= h || left + size <= 0.0 || top + size <= 0.0) {
        return out;
    }

    const int x0 = std::max(0, static_cast<int>(left));
    const int y0 = std::max(0, static_cast<int>(top));
    const int x1 = std::min(w, static_cast<int>(left) + size);
    const int y1 = std::min(h, static_cast<int>(top) + size);

    if (x1 <= x0 || y1 <= y0) {
        return out;
    }

    out.data = img.block(y0, x0, y1 - y0, x1 - x0);
    out.origin_x = x0 + pixel_origin;
    out.origin_y = y0 + pixel_origin;
    return out;
}

} // namespace vw_guider::guider
