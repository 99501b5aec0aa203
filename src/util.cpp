#include "util.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <stdexcept>

AppConfig load_config(const std::string& path) {
  YAML::Node y = YAML::LoadFile(path);
  AppConfig c{};

  if (y["pose"]) {
    auto p = y["pose"];
    if (p["model_path"]) c.pose.model_path = p["model_path"].as<std::string>();
    if (p["input_width"] && p["input_height"]) {
      c.pose.input_size = cv::Size(p["input_width"].as<int>(), p["input_height"].as<int>());
    }
    if (p["person_threshold"]) c.pose.person_threshold = p["person_threshold"].as<float>();
    if (p["nms_threshold"]) c.pose.nms_threshold = p["nms_threshold"].as<float>();
    if (p["use_cuda"]) c.pose.use_cuda = p["use_cuda"].as<bool>();
  }

  if (y["analysis"]) {
    auto a = y["analysis"];
    if (a["default_exercise"]) {
      const auto name = a["default_exercise"].as<std::string>();
      auto ex = parse_exercise_type(name);
      if (!ex) throw std::invalid_argument("Unknown exercise type in config: " + name);
      c.analysis.default_exercise = *ex;
    }
    if (a["progress_log_interval"])
      c.analysis.progress_log_interval = a["progress_log_interval"].as<int>();
    if (a["fallback_fps"]) c.analysis.fallback_fps = a["fallback_fps"].as<double>();
  }

  if (y["service"]) {
    auto s = y["service"];
    if (s["host"]) c.service.host = s["host"].as<std::string>();
    if (s["port"]) c.service.port = s["port"].as<int>();
    if (s["worker_threads"]) c.service.worker_threads = s["worker_threads"].as<int>();
    if (s["max_retained_jobs"])
      c.service.max_retained_jobs = s["max_retained_jobs"].as<std::size_t>();
  }

  if (y["output"]) {
    auto o = y["output"];
    if (o["json_output_path"]) c.output.json_output_path = o["json_output_path"].as<std::string>();
    if (o["csv_output_path"]) c.output.csv_output_path = o["csv_output_path"].as<std::string>();
  }

  if (y["logging"] && y["logging"]["level"]) c.log_level = y["logging"]["level"].as<std::string>();

  return c;
}

void apply_log_level(const std::string& level) {
  if (level == "debug") {
    spdlog::set_level(spdlog::level::debug);
  } else if (level == "info") {
    spdlog::set_level(spdlog::level::info);
  } else if (level == "warn") {
    spdlog::set_level(spdlog::level::warn);
  } else if (level == "error") {
    spdlog::set_level(spdlog::level::err);
  } else {
    spdlog::warn("Unknown log level '{}', keeping current level", level);
  }
}
