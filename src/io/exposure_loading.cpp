#include "vw_guider/io/exposure_loading.hpp"
#include "vw_guider/config/configuration.hpp"
#include "vw_guider/core/errors.hpp"
#include "vw_guider/core/utils.hpp"
#include "vw_guider/io/fits_io.hpp"

#include <algorithm>
#include <iostream>
#include <set>

namespace vw_guider::io {

namespace {

// "NGC 7331 dither 2" -> ("NGC 7331", 3). The header counts dithers from 0.
std::pair<std::string, int> parse_object_name(const std::string& object) {
    std::string name = object;
    int dither = 1;

    const auto pos = object.find("dither");
    if (pos != std::string::npos) {
        name = object.substr(0, pos);
        const std::string rest = core::trim(object.substr(pos + 6));
        try {
            size_t used = 0;
            const int k = std::stoi(rest, &used);
            if (used == rest.size() && k >= 0) {
                dither = k + 1;
            }
        } catch (const std::exception&) {
            dither = 1;
        }
    }

    name = core::trim(name);
    // Older logs abbreviated PGC designations
    for (auto pgc = name.find("PGC"); pgc != std::string::npos; pgc = name.find("PGC", pgc + 1)) {
        name.replace(pgc, 3, "P");
    }
    if (name.empty()) {
        name = "Unknown";
    }
    return {name, dither};
}

Point2D fiducial_for_exposure(const Exposure& exp, const config::Config& cfg) {
    auto base = cfg.fiducial_for(exp.target);
    if (!base) {
        return Point2D{};
    }
    if (exp.dither <= 1 || exp.is_calibration(cfg.instrument.calibration_targets)) {
        return *base;
    }

    auto it = cfg.instrument.dither_offsets.find(exp.dither);
    if (it == cfg.instrument.dither_offsets.end()) {
        std::cerr << "[EXPOSURE] " << exp.id << ": no offset configured for dither "
                  << exp.dither << ", using the dither 1 fiducial" << std::endl;
        return *base;
    }
    return Point2D{base->x + it->second[0], base->y + it->second[1]};
}

} // namespace

Exposure load_exposure_from_fits(const fs::path& path, const config::Config& cfg) {
    const FitsHeader header = read_fits_header(path);

    Exposure exp;
    exp.id = path.stem().string();
    exp.path = path;

    auto date_obs = header.get_string("DATE-OBS");
    if (!date_obs) {
        throw ValidationError(path.filename().string() + ": DATE-OBS missing");
    }
    exp.start = core::parse_iso_timestamp(*date_obs);

    auto [target, dither] = parse_object_name(header.get_string("OBJECT").value_or("Unknown"));
    exp.target = target;
    exp.dither = dither;

    exp.exptime = header.get_number_or_nan("EXPTIME");
    exp.focus = header.get_number_or_nan("FOCUS");
    exp.airmass = header.get_number_or_nan("AIRMASS");
    exp.comment = core::join(header.comments, " ");

    exp.fiducial = fiducial_for_exposure(exp, cfg);
    return exp;
}

void sort_by_start_time(std::vector<Exposure>& exposures) {
    std::stable_sort(exposures.begin(), exposures.end(),
                     [](const Exposure& a, const Exposure& b) { return a.start < b.start; });
}

std::vector<Exposure> load_exposures(const std::vector<fs::path>& paths,
                                     const config::Config& cfg) {
    std::vector<Exposure> exposures;
    std::set<std::string> ids;

    for (const auto& p : paths) {
        Exposure exp;
        try {
            exp = load_exposure_from_fits(p, cfg);
        } catch (const VwGuiderError& e) {
            std::cerr << "[EXPOSURE] Skipping " << p.string() << ": " << e.what() << std::endl;
            continue;
        }
        if (!ids.insert(exp.id).second) {
            throw ValidationError("Duplicate exposure id: " + exp.id);
        }
        exposures.push_back(std::move(exp));
    }

    sort_by_start_time(exposures);
    return exposures;
}

std::vector<Exposure> load_exposures_from_dir(const fs::path& dir, const config::Config& cfg) {
    if (!fs::is_directory(dir)) {
        throw IOError("Exposure directory does not exist: " + dir.string());
    }
    return load_exposures(core::discover_files(dir, "*.fits"), cfg);
}

std::map<std::string, int> target_counts(const std::vector<Exposure>& exposures,
                                         bool remove_calibration,
                                         const std::vector<std::string>& calibration_targets) {
    std::map<std::string, int> counts;
    for (const auto& exp : exposures) {
        if (remove_calibration && exp.is_calibration(calibration_targets)) continue;
        ++counts[exp.target];
    }
    return counts;
}

} // namespace vw_guider::io
