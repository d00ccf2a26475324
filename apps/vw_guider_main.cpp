#include "vw_guider/chunking/dither_chunker.hpp"
#include "vw_guider/config/configuration.hpp"
#include "vw_guider/core/errors.hpp"
#include "vw_guider/core/events.hpp"
#include "vw_guider/core/utils.hpp"
#include "vw_guider/fitting/point_source_fit.hpp"
#include "vw_guider/guider/frame_source.hpp"
#include "vw_guider/io/exposure_loading.hpp"
#include "vw_guider/io/fits_io.hpp"
#include "vw_guider/io/frame_index.hpp"
#include "vw_guider/io/records_io.hpp"
#include "vw_guider/pipeline/guide_processing.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cctype>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace vw_guider;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitRuntime = 2;

void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

json number_or_null(double v) {
    if (std::isfinite(v)) return v;
    return nullptr;
}

void validate_config(const config::Config& cfg) {
    try {
        cfg.validate();
    } catch (const ValidationError& e) {
        throw ConfigError(e.what());
    }
}

// Empty path: built-in defaults
config::Config load_config(const std::string& path) {
    config::Config cfg = path.empty() ? config::Config{} : config::Config::load(path);
    validate_config(cfg);
    return cfg;
}

std::string safe_file_component(const std::string& s) {
    std::string out;
    for (char c : s) {
        out += (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_') ? c : '_';
    }
    return out;
}

std::vector<Exposure> load_exposures_for(const config::Config& cfg, const std::string& override_dir) {
    const std::string dir = override_dir.empty() ? cfg.paths.exposure_dir : override_dir;
    if (dir.empty()) {
        throw ConfigError("No exposure directory given (paths.exposure_dir or --exposures)");
    }
    return io::load_exposures_from_dir(dir, cfg);
}

int cmd_index(const std::string& guider_dir, bool force, bool prune) {
    const std::string run_id = core::get_run_id();
    core::EventEmitter emitter(std::cout);

    io::FrameIndexOptions options;
    options.force_rebuild = force;
    options.prune_missing = prune;

    emitter.phase_start(run_id, Phase::INDEX);
    io::FrameIndex index = io::FrameIndex::build(guider_dir, options);

    json extra;
    extra["n_frames"] = index.size();
    if (!index.empty()) {
        extra["first"] = core::format_iso_timestamp(index.entries().front().timestamp);
        extra["last"] = core::format_iso_timestamp(index.entries().back().timestamp);
    }
    extra["cache"] = (fs::path(guider_dir) / options.cache_name).string();
    emitter.phase_end(run_id, Phase::INDEX, "ok", extra);
    return kExitOk;
}

int cmd_chunks(const config::Config& cfg, const std::string& exposure_dir,
               const std::string& out_dir) {
    const std::string run_id = core::get_run_id();
    core::EventEmitter emitter(std::cout);

    emitter.phase_start(run_id, Phase::LOAD_EXPOSURES);
    auto exposures = load_exposures_for(cfg, exposure_dir);
    emitter.phase_end(run_id, Phase::LOAD_EXPOSURES, "ok", {{"n_exposures", exposures.size()}});

    emitter.phase_start(run_id, Phase::CHUNK);
    if (exposures.empty()) {
        emitter.phase_end(run_id, Phase::CHUNK, "skipped", {{"reason", "no exposures"}});
        return kExitOk;
    }
    const auto chunks = chunking::chunk_all_targets(exposures);
    const auto records = chunking::chunk_records(chunks);
    emitter.phase_end(run_id, Phase::CHUNK, "ok",
                      {{"n_targets", chunks.size()}, {"n_chunks", records.size()}});

    const fs::path out = out_dir.empty() ? fs::path(cfg.paths.output_dir) : fs::path(out_dir);
    fs::create_directories(out);
    io::write_chunk_records(out / "dither_chunks.json", records);
    std::cout << "[CHUNK] Wrote " << records.size() << " chunks to "
              << (out / "dither_chunks.json").string() << std::endl;
    return kExitOk;
}

void run_pipeline(const config::Config& cfg, const std::string& exposure_dir,
                  core::EventEmitter& emitter, const std::string& run_id) {
    emitter.phase_start(run_id, Phase::INDEX);
    const io::FrameIndex index = io::FrameIndex::build(cfg.paths.guider_dir);
    emitter.phase_end(run_id, Phase::INDEX, "ok", {{"n_frames", index.size()}});

    emitter.phase_start(run_id, Phase::LOAD_EXPOSURES);
    const auto exposures = load_exposures_for(cfg, exposure_dir);
    emitter.phase_end(run_id, Phase::LOAD_EXPOSURES, "ok", {{"n_exposures", exposures.size()}});

    emitter.phase_start(run_id, Phase::FIT);
    auto batch = pipeline::process_exposures(exposures, index, cfg, cfg.guess_mode(), emitter, run_id);
    emitter.phase_end(run_id, Phase::FIT, "ok",
                      {{"n_total", batch.n_total},
                       {"n_processed", batch.n_processed},
                       {"n_excluded", batch.n_excluded},
                       {"n_skipped", batch.n_skipped},
                       {"n_failed_fits", batch.n_failed_fits}});

    emitter.phase_start(run_id, Phase::CHUNK);
    chunking::ChunkMap chunks;
    if (!exposures.empty()) {
        chunks = chunking::chunk_all_targets(exposures);
    }
    const auto chunk_recs = chunking::chunk_records(chunks);
    emitter.phase_end(run_id, Phase::CHUNK, "ok", {{"n_chunks", chunk_recs.size()}});

    const fs::path out(cfg.paths.output_dir);
    fs::create_directories(out);

    int n_stacked = 0;
    int n_stack_skipped = 0;
    if (cfg.stacking.enabled) {
        emitter.phase_start(run_id, Phase::STACK);
        int current = 0;
        const int total = static_cast<int>(chunk_recs.size());
        for (const auto& [target, list] : chunks) {
            for (const auto& chunk : list) {
                ++current;
                if (!chunk.is_sky() || chunk.exposures().front().is_calibration(
                                           cfg.instrument.calibration_targets)) {
                    continue;
                }
                try {
                    auto stacked = pipeline::stack_chunk(chunk, batch.sequences, cfg);
                    const fs::path p = out / ("stack_" + safe_file_component(target) + "_" +
                                              std::to_string(chunk.chunk_index()) + ".fits");
                    io::write_stacked_fits(p, stacked.image, target, chunk.chunk_index(),
                                           stacked.n_frames);
                    ++n_stacked;
                } catch (const VwGuiderError& e) {
                    ++n_stack_skipped;
                    emitter.warning(run_id, "Stack " + target + "/" +
                                                std::to_string(chunk.chunk_index()) + ": " + e.what());
                }
                emitter.phase_progress(run_id, Phase::STACK, current, total, target);
            }
        }
        emitter.phase_end(run_id, Phase::STACK, "ok",
                          {{"n_stacked", n_stacked}, {"n_skipped", n_stack_skipped}});
    }

    emitter.phase_start(run_id, Phase::WRITE);
    io::write_exposure_records(out / "exposure_stats.json",
                               pipeline::exposure_records(batch, chunks, cfg));
    io::write_chunk_records(out / "dither_chunks.json", chunk_recs);
    emitter.phase_end(run_id, Phase::WRITE, "ok", {{"output_dir", out.string()}});

    emitter.phase_start(run_id, Phase::DONE);
    emitter.phase_end(run_id, Phase::DONE, "ok", json::object());
}

int cmd_process(config::Config cfg, const std::string& exposure_dir,
                const std::string& guider_dir, const std::string& out_dir, bool chained,
                int workers, bool no_stack) {
    if (!guider_dir.empty()) cfg.paths.guider_dir = guider_dir;
    if (!out_dir.empty()) cfg.paths.output_dir = out_dir;
    if (workers >= 0) cfg.runtime.workers = workers;
    if (chained) cfg.fitting.guess_mode = "chained";
    if (no_stack) cfg.stacking.enabled = false;
    validate_config(cfg);

    if (cfg.paths.guider_dir.empty()) {
        throw ConfigError("No guider directory given (paths.guider_dir or --guider-dir)");
    }

    const std::string run_id = core::get_run_id();
    core::EventEmitter emitter(std::cout);
    emitter.run_start(run_id, {{"guider_dir", cfg.paths.guider_dir},
                               {"output_dir", cfg.paths.output_dir},
                               {"guess_mode", guess_mode_to_string(cfg.guess_mode())}});

    try {
        run_pipeline(cfg, exposure_dir, emitter, run_id);
    } catch (const std::exception& e) {
        emitter.error(run_id, e.what());
        emitter.run_end(run_id, false, "failed");
        throw;
    }
    emitter.run_end(run_id, true, "ok");
    return kExitOk;
}

int cmd_fit_frame(const std::string& path, double x, double y, const config::Config& cfg) {
    auto [data, header] = io::read_fits_float(path);

    guider::FrameMetadata meta;
    meta.exptime = header.get_number_or_nan("EXPTIME");
    meta.airmass = header.get_number_or_nan("AIRMASS");
    guider::FrameSource frame(std::move(data), meta);

    guider::Cutout cut = frame.cutout(x, y, cfg.fitting.search_size, cfg.instrument.pixel_origin);
    std::optional<Point2D> guess;
    if (cfg.fitting.refine_at_guess) {
        guess = Point2D{x, y};
    }
    fitting::PointSourceFit fit(std::move(cut), frame.exptime(), guess,
                                fitting::PointSourceFitOptions::from_config(cfg));

    const auto& p = fit.params();
    const Point2D c = fit.center();
    json result;
    result["path"] = path;
    result["center_x"] = number_or_null(c.x);
    result["center_y"] = number_or_null(c.y);
    result["amplitude"] = number_or_null(p.amplitude);
    result["stddev_x"] = number_or_null(p.stddev_x);
    result["stddev_y"] = number_or_null(p.stddev_y);
    result["background"] = number_or_null(p.background);
    result["fwhm_pix"] = number_or_null(fit.fwhm_pix());
    result["fwhm_arcsec"] = number_or_null(fit.fwhm_arcsec());
    result["flux_rate"] = number_or_null(fit.total_flux_rate());
    result["has_failed"] = fit.has_failed();
    result["converged"] = fit.converged();
    result["evaluations"] = fit.evaluations();
    result["status"] = fit.status();
    print_json(result);
    return kExitOk;
}

int cmd_default_config(const std::string& path) {
    config::Config cfg;
    if (path.empty()) {
        YAML::Emitter out;
        out << cfg.to_yaml();
        std::cout << out.c_str() << std::endl;
        return kExitOk;
    }
    cfg.save(path);
    std::cout << "Wrote default config to " << path << std::endl;
    return kExitOk;
}

void print_usage() {
    std::cout << "Usage: vw_guider_cli <command> [options]\n"
              << "\nCommands:\n"
              << "  index --guider-dir DIR [--force] [--prune]   Build or update the guide-frame index\n"
              << "  chunks --config FILE [--exposures DIR] [--out DIR]\n"
              << "                                  Group exposures into dither chunks\n"
              << "  process --config FILE [--exposures DIR] [--guider-dir DIR] [--out DIR]\n"
              << "          [--chained] [--workers N] [--no-stack]\n"
              << "                                  Fit guide frames, chunk, stack and write results\n"
              << "  fit-frame <file> --x X --y Y [--config FILE]  Fit the guide star of one frame\n"
              << "  default-config [path]           Print or write the default config\n"
              << "\nExit codes: 0 ok, 1 usage or config error, 2 runtime failure\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return kExitUsage;
    }

    std::string command = argv[1];

    auto get_arg = [&](const char* name) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    auto get_positional = [&](int pos) -> std::string {
        int count = 0;
        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] != '-') {
                if (count == pos) return argv[i];
                ++count;
            } else if (i + 1 < argc && argv[i + 1][0] != '-' &&
                       std::strcmp(argv[i], "--force") != 0 &&
                       std::strcmp(argv[i], "--prune") != 0 &&
                       std::strcmp(argv[i], "--chained") != 0 &&
                       std::strcmp(argv[i], "--no-stack") != 0) {
                ++i; // Skip argument value
            }
        }
        return "";
    };

    auto parse_double = [](const std::string& s, double& out) -> bool {
        try {
            size_t used = 0;
            out = std::stod(s, &used);
            return used == s.size();
        } catch (const std::exception&) {
            return false;
        }
    };

    try {
        if (command == "index") {
            const std::string dir = get_arg("--guider-dir");
            if (dir.empty()) {
                std::cerr << "index requires --guider-dir\n";
                return kExitUsage;
            }
            return cmd_index(dir, has_flag("--force"), has_flag("--prune"));
        }

        if (command == "chunks") {
            const auto cfg = load_config(get_arg("--config"));
            return cmd_chunks(cfg, get_arg("--exposures"), get_arg("--out"));
        }

        if (command == "process") {
            int workers = -1;
            const std::string w = get_arg("--workers");
            if (!w.empty()) {
                double v = 0.0;
                if (!parse_double(w, v) || v < 0.0) {
                    std::cerr << "--workers expects a non-negative integer\n";
                    return kExitUsage;
                }
                workers = static_cast<int>(v);
            }
            return cmd_process(load_config(get_arg("--config")), get_arg("--exposures"),
                               get_arg("--guider-dir"), get_arg("--out"),
                               has_flag("--chained"), workers, has_flag("--no-stack"));
        }

        if (command == "fit-frame") {
            const std::string path = get_positional(0);
            double x = 0.0;
            double y = 0.0;
            if (path.empty() || !parse_double(get_arg("--x"), x) ||
                !parse_double(get_arg("--y"), y)) {
                std::cerr << "fit-frame requires <file> --x X --y Y\n";
                return kExitUsage;
            }
            return cmd_fit_frame(path, x, y, load_config(get_arg("--config")));
        }

        if (command == "default-config") {
            return cmd_default_config(get_positional(0));
        }

        if (command == "help" || command == "--help" || command == "-h") {
            print_usage();
            return kExitOk;
        }
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        return kExitUsage;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitRuntime;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage();
    return kExitUsage;
}
