#pragma once
#include <string>

#include "analysis_service.hpp"
#include "pose_estimator.hpp"
#include "report.hpp"
#include "video_analyzer.hpp"

struct AppConfig {
  PoseConfig pose;
  AnalysisConfig analysis;
  ServiceConfig service;
  OutputConfig output;
  std::string log_level{"info"};
};

// Throws YAML::Exception on unreadable or malformed files, std::invalid_argument
// on values outside their allowed set.
AppConfig load_config(const std::string& path);

// debug | info | warn | error; anything else leaves the level unchanged.
void apply_log_level(const std::string& level);
