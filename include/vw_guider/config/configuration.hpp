#pragma once

#include "vw_guider/core/types.hpp"

#include <array>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace vw_guider::config {

namespace fs = std::filesystem;

struct PathsConfig {
  std::string guider_dir;
  std::string exposure_dir;
  std::string output_dir = "output";
};

struct InstrumentConfig {
  double pixel_scale_arcsec = 0.533;
  int pixel_origin = 1; // 1: FITS/ds9 convention, 0: array indices
  std::vector<std::string> calibration_targets{
      "biases", "autofocus", "domeflats", "arcs",
      "test",   "skyflats",  "twilight",  "twilights"};
  // Guide-star offset (pixels) of each dither position relative to dither 1
  std::map<int, std::array<double, 2>> dither_offsets{
      {1, {0.0, 0.0}},  {2, {5.3, 2.8}}, {3, {0.0, 5.6}},
      {4, {-1.5, 2.8}}, {5, {3.8, 0.0}}, {6, {3.8, 5.8}}};
};

struct FittingConfig {
  int search_size = 70;     // coarse cutout edge length (px)
  int window = 20;          // fit sub-window edge length (px)
  double stddev_guess = 3.0;
  double stddev_min = 0.5;
  int max_iterations = 200;
  double fwhm_fail_px = 30.0;
  double timeout_s = 0.0;   // 0 disables the wall-clock limit
  std::string guess_mode = "fixed"; // fixed | chained
  bool refine_at_guess = false;     // centre the sub-window on the guess instead of the cutout peak
  bool release_frames = true;
};

struct StatisticsConfig {
  std::optional<double> clip_sigma = 2.5;
  std::optional<double> flux_rate_clip_sigma; // unclipped by default
  int max_clip_iterations = 5;
  int min_frames = 2;
};

struct StackingConfig {
  bool enabled = true;
  std::optional<double> clip_sigma = 2.5;
};

struct RuntimeConfig {
  int workers = 0; // 0 = hardware concurrency
};

struct Config {
  PathsConfig paths;
  InstrumentConfig instrument;
  FittingConfig fitting;
  StatisticsConfig statistics;
  StackingConfig stacking;
  RuntimeConfig runtime;
  std::map<std::string, std::array<double, 2>> fiducials;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  GuessMode guess_mode() const;
  // Fiducial position for a target (dither 1), falling back to "default"
  std::optional<Point2D> fiducial_for(const std::string &target) const;
};

} // namespace vw_guider::config
