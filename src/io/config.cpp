#include "vw_guider/config/configuration.hpp"
#include "vw_guider/core/errors.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

namespace vw_guider::config {

static void read_double_pair(const YAML::Node& n, std::array<double, 2>& out,
                             const std::string& what) {
    if (!n || !n.IsSequence() || n.size() != 2) {
        throw ConfigError(what + " must be a sequence of two numbers");
    }
    out[0] = n[0].as<double>();
    out[1] = n[1].as<double>();
}

static void read_optional_sigma(const YAML::Node& n, std::optional<double>& out) {
    if (!n) return;
    if (n.IsNull()) {
        out.reset();
        return;
    }
    out = n.as<double>();
}

static YAML::Node optional_to_yaml(const std::optional<double>& v) {
    if (v) return YAML::Node(*v);
    return YAML::Node(YAML::NodeType::Null);
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["paths"]) {
        auto p = node["paths"];
        if (p["guider_dir"]) cfg.paths.guider_dir = p["guider_dir"].as<std::string>();
        if (p["exposure_dir"]) cfg.paths.exposure_dir = p["exposure_dir"].as<std::string>();
        if (p["output_dir"]) cfg.paths.output_dir = p["output_dir"].as<std::string>();
    }

    if (node["instrument"]) {
        auto in = node["instrument"];
        if (in["pixel_scale_arcsec"]) cfg.instrument.pixel_scale_arcsec = in["pixel_scale_arcsec"].as<double>();
        if (in["pixel_origin"]) cfg.instrument.pixel_origin = in["pixel_origin"].as<int>();
        if (in["calibration_targets"]) {
            cfg.instrument.calibration_targets =
                in["calibration_targets"].as<std::vector<std::string>>();
        }
        if (in["dither_offsets"]) {
            auto d = in["dither_offsets"];
            if (!d.IsMap()) {
                throw ConfigError("instrument.dither_offsets must be a map of dither index to [dx, dy]");
            }
            cfg.instrument.dither_offsets.clear();
            for (const auto& kv : d) {
                const int key = kv.first.as<int>();
                std::array<double, 2> off{0.0, 0.0};
                read_double_pair(kv.second, off,
                                 "instrument.dither_offsets." + std::to_string(key));
                cfg.instrument.dither_offsets[key] = off;
            }
        }
    }

    if (node["fitting"]) {
        auto f = node["fitting"];
        if (f["search_size"]) cfg.fitting.search_size = f["search_size"].as<int>();
        if (f["window"]) cfg.fitting.window = f["window"].as<int>();
        if (f["stddev_guess"]) cfg.fitting.stddev_guess = f["stddev_guess"].as<double>();
        if (f["stddev_min"]) cfg.fitting.stddev_min = f["stddev_min"].as<double>();
        if (f["max_iterations"]) cfg.fitting.max_iterations = f["max_iterations"].as<int>();
        if (f["fwhm_fail_px"]) cfg.fitting.fwhm_fail_px = f["fwhm_fail_px"].as<double>();
        if (f["timeout_s"]) cfg.fitting.timeout_s = f["timeout_s"].as<double>();
        if (f["guess_mode"]) cfg.fitting.guess_mode = f["guess_mode"].as<std::string>();
        if (f["refine_at_guess"]) cfg.fitting.refine_at_guess = f["refine_at_guess"].as<bool>();
        if (f["release_frames"]) cfg.fitting.release_frames = f["release_frames"].as<bool>();
    }

    if (node["statistics"]) {
        auto s = node["statistics"];
        read_optional_sigma(s["clip_sigma"], cfg.statistics.clip_sigma);
        read_optional_sigma(s["flux_rate_clip_sigma"], cfg.statistics.flux_rate_clip_sigma);
        if (s["max_clip_iterations"]) cfg.statistics.max_clip_iterations = s["max_clip_iterations"].as<int>();
        if (s["min_frames"]) cfg.statistics.min_frames = s["min_frames"].as<int>();
    }

    if (node["stacking"]) {
        auto st = node["stacking"];
        if (st["enabled"]) cfg.stacking.enabled = st["enabled"].as<bool>();
        read_optional_sigma(st["clip_sigma"], cfg.stacking.clip_sigma);
    }

    if (node["runtime"]) {
        auto r = node["runtime"];
        if (r["workers"]) cfg.runtime.workers = r["workers"].as<int>();
    }

    if (node["fiducials"]) {
        auto fid = node["fiducials"];
        if (!fid.IsMap()) {
            throw ConfigError("fiducials must be a map of target name to [x, y]");
        }
        for (const auto& kv : fid) {
            const std::string target = kv.first.as<std::string>();
            std::array<double, 2> xy{kNaN, kNaN};
            read_double_pair(kv.second, xy, "fiducials." + target);
            cfg.fiducials[target] = xy;
        }
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["paths"]["guider_dir"] = paths.guider_dir;
    node["paths"]["exposure_dir"] = paths.exposure_dir;
    node["paths"]["output_dir"] = paths.output_dir;

    node["instrument"]["pixel_scale_arcsec"] = instrument.pixel_scale_arcsec;
    node["instrument"]["pixel_origin"] = instrument.pixel_origin;
    node["instrument"]["calibration_targets"] = instrument.calibration_targets;
    for (const auto& [dither, off] : instrument.dither_offsets) {
        YAML::Node pair;
        pair.push_back(off[0]);
        pair.push_back(off[1]);
        pair.SetStyle(YAML::EmitterStyle::Flow);
        node["instrument"]["dither_offsets"][dither] = pair;
    }

    node["fitting"]["search_size"] = fitting.search_size;
    node["fitting"]["window"] = fitting.window;
    node["fitting"]["stddev_guess"] = fitting.stddev_guess;
    node["fitting"]["stddev_min"] = fitting.stddev_min;
    node["fitting"]["max_iterations"] = fitting.max_iterations;
    node["fitting"]["fwhm_fail_px"] = fitting.fwhm_fail_px;
    node["fitting"]["timeout_s"] = fitting.timeout_s;
    node["fitting"]["guess_mode"] = fitting.guess_mode;
    node["fitting"]["refine_at_guess"] = fitting.refine_at_guess;
    node["fitting"]["release_frames"] = fitting.release_frames;

    node["statistics"]["clip_sigma"] = optional_to_yaml(statistics.clip_sigma);
    node["statistics"]["flux_rate_clip_sigma"] = optional_to_yaml(statistics.flux_rate_clip_sigma);
    node["statistics"]["max_clip_iterations"] = statistics.max_clip_iterations;
    node["statistics"]["min_frames"] = statistics.min_frames;

    node["stacking"]["enabled"] = stacking.enabled;
    node["stacking"]["clip_sigma"] = optional_to_yaml(stacking.clip_sigma);

    node["runtime"]["workers"] = runtime.workers;

    for (const auto& [target, xy] : fiducials) {
        YAML::Node pair;
        pair.push_back(xy[0]);
        pair.push_back(xy[1]);
        pair.SetStyle(YAML::EmitterStyle::Flow);
        node["fiducials"][target] = pair;
    }

    return node;
}

void Config::validate() const {
    if (!(instrument.pixel_scale_arcsec > 0.0)) {
        throw ValidationError("instrument.pixel_scale_arcsec must be > 0");
    }
    if (instrument.pixel_origin != 0 && instrument.pixel_origin != 1) {
        throw ValidationError("instrument.pixel_origin must be 0 or 1");
    }
    for (const auto& [dither, off] : instrument.dither_offsets) {
        if (dither < 1) {
            throw ValidationError("instrument.dither_offsets keys must be >= 1");
        }
        if (!std::isfinite(off[0]) || !std::isfinite(off[1])) {
            throw ValidationError("instrument.dither_offsets values must be finite");
        }
    }

    if (fitting.window < 3) {
        throw ValidationError("fitting.window must be >= 3");
    }
    if (fitting.search_size < fitting.window) {
        throw ValidationError("fitting.search_size must be >= fitting.window");
    }
    if (!(fitting.stddev_guess > 0.0)) {
        throw ValidationError("fitting.stddev_guess must be > 0");
    }
    if (!(fitting.stddev_min > 0.0)) {
        throw ValidationError("fitting.stddev_min must be > 0");
    }
    if (fitting.max_iterations < 1) {
        throw ValidationError("fitting.max_iterations must be >= 1");
    }
    if (!(fitting.fwhm_fail_px > 0.0)) {
        throw ValidationError("fitting.fwhm_fail_px must be > 0");
    }
    if (fitting.timeout_s < 0.0) {
        throw ValidationError("fitting.timeout_s must be >= 0");
    }
    if (!string_to_guess_mode(fitting.guess_mode)) {
        throw ValidationError("fitting.guess_mode must be 'fixed' or 'chained'");
    }

    if (statistics.clip_sigma && !(*statistics.clip_sigma > 0.0)) {
        throw ValidationError("statistics.clip_sigma must be > 0 or null");
    }
    if (statistics.flux_rate_clip_sigma && !(*statistics.flux_rate_clip_sigma > 0.0)) {
        throw ValidationError("statistics.flux_rate_clip_sigma must be > 0 or null");
    }
    if (statistics.max_clip_iterations < 1) {
        throw ValidationError("statistics.max_clip_iterations must be >= 1");
    }
    if (statistics.min_frames < 1) {
        throw ValidationError("statistics.min_frames must be >= 1");
    }

    if (stacking.clip_sigma && !(*stacking.clip_sigma > 0.0)) {
        throw ValidationError("stacking.clip_sigma must be > 0 or null");
    }

    if (runtime.workers < 0) {
        throw ValidationError("runtime.workers must be >= 0");
    }
}

GuessMode Config::guess_mode() const {
    auto mode = string_to_guess_mode(fitting.guess_mode);
    if (!mode) {
        throw ValidationError("fitting.guess_mode must be 'fixed' or 'chained'");
    }
    return *mode;
}

std::optional<Point2D> Config::fiducial_for(const std::string& target) const {
    auto it = fiducials.find(target);
    if (it == fiducials.end()) {
        it = fiducials.find("default");
    }
    if (it == fiducials.end()) {
        return std::nullopt;
    }
    return Point2D{it->second[0], it->second[1]};
}

} // namespace vw_guider::config
