#include <httplib.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <CLI/CLI.hpp>
#include <atomic>
#include <filesystem>
#include <stdexcept>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>

#include "analysis_service.hpp"
#include "analyze_command.hpp"
#include "metrics.hpp"
#include "pose_estimator.hpp"
#include "report.hpp"
#include "util.hpp"

namespace {

int run_serve(const AppConfig& app) {
  MetricsRegistry metrics;
  const PoseConfig pose_cfg = app.pose;
  AnalysisService service([pose_cfg] { return create_pose_estimator(pose_cfg); }, app.analysis,
                          metrics, app.service.worker_threads, app.service.max_retained_jobs);

  std::atomic<bool> ready{false};
  httplib::Server svr;

  svr.Get("/healthz", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content("{\"status\":\"ok\"}", "application/json");
  });

  svr.Get("/readyz", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content(std::string("{\"ready\":") + (ready ? "true" : "false") + "}",
                    "application/json");
  });

  svr.Post("/analyses", [&](const httplib::Request& req, httplib::Response& res) {
    AnalysisRequest request;
    try {
      request = parse_analysis_request(req.body, app.analysis.default_exercise);
    } catch (const std::invalid_argument& e) {
      res.status = 400;
      res.set_content(nlohmann::json{{"error", e.what()}}.dump(), "application/json");
      return;
    }

    const std::string id = service.submit(request.video_path, request.exercise, request.video_id);
    res.status = 202;
    res.set_content(nlohmann::json{{"job_id", id}, {"status", "pending"}}.dump(), "application/json");
  });

  svr.Get(R"(/analyses/([\w-]+))", [&](const httplib::Request& req, httplib::Response& res) {
    auto job = service.job(req.matches[1]);
    if (!job) {
      res.status = 404;
      res.set_content("{\"error\":\"unknown job\"}", "application/json");
      return;
    }
    const bool frames = req.has_param("frames") && req.get_param_value("frames") == "1";
    res.set_content(job_to_json(*job, frames).dump(2), "application/json");
  });

  svr.Get(R"(/analyses/([\w-]+)/frames)", [&](const httplib::Request& req, httplib::Response& res) {
    auto job = service.job(req.matches[1]);
    if (!job) {
      res.status = 404;
      res.set_content("{\"error\":\"unknown job\"}", "application/json");
      return;
    }
    if (job->status != JobStatus::Completed || !job->result) {
      res.status = 409;
      res.set_content(nlohmann::json{{"status", to_string(job->status)}}.dump(),
                      "application/json");
      return;
    }
    res.set_content(frames_to_csv(job->result->frame_analyses), "text/csv");
  });

  svr.Get("/metrics", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content(metrics.prometheus_text(metrics.snapshot()), "text/plain; version=0.0.4");
  });

  service.start();
  ready = true;

  spdlog::info("HTTP server listening on {}:{}", app.service.host, app.service.port);
  if (!svr.listen(app.service.host, app.service.port)) {
    spdlog::error("Failed to bind {}:{}", app.service.host, app.service.port);
    service.stop();
    return 1;
  }

  service.stop();
  spdlog::info("Shutdown complete.");
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  CLI::App cli_app{"FormScope-RT: squat and deadlift form analysis from video"};

  std::string cfg_path = "configs/config.yaml";
  cli_app.add_option("-c,--config", cfg_path, "Configuration file path");

  bool show_version = false;
  cli_app.add_flag("-v,--version", show_version, "Show version information");

  auto* analyze = cli_app.add_subcommand("analyze", "Analyze one video and print the report");
  std::string video_path;
  std::string exercise_name;
  std::string video_id;
  std::string json_out;
  std::string csv_out;
  analyze->add_option("--video", video_path, "Input video file")->required();
  analyze->add_option("--exercise", exercise_name, "Exercise type")
      ->check(CLI::IsMember({"squat", "deadlift"}));
  analyze->add_option("--id", video_id, "Video identifier for the report");
  analyze->add_option("--json", json_out, "Write the JSON report here instead of stdout");
  analyze->add_option("--csv", csv_out, "Write the per-frame log here");

  auto* serve = cli_app.add_subcommand("serve", "Run the HTTP analysis service");
  int port_override = 0;
  serve->add_option("--port", port_override, "Listen port")->check(CLI::Range(1, 65535));

  try {
    cli_app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return cli_app.exit(e);
  }

  if (show_version) {
    std::cout << "FormScope-RT v1.0.0" << std::endl;
    std::cout << "Pose-based rep counting and form scoring for squats and deadlifts" << std::endl;
    return 0;
  }

  spdlog::set_pattern("[%H:%M:%S.%e] %^[%l]%$ %v");

  AppConfig app;
  if (std::filesystem::exists(cfg_path)) {
    try {
      app = load_config(cfg_path);
    } catch (const YAML::Exception& e) {
      spdlog::error("Invalid config {}: {}", cfg_path, e.what());
      return 1;
    } catch (const std::invalid_argument& e) {
      spdlog::error("Invalid config {}: {}", cfg_path, e.what());
      return 1;
    }
    spdlog::info("FormScope-RT starting (config: {})", cfg_path);
  } else {
    spdlog::warn("Config {} not found, using defaults", cfg_path);
  }
  apply_log_level(app.log_level);

  if (*analyze) {
    ExerciseType exercise = app.analysis.default_exercise;
    if (!exercise_name.empty()) exercise = *parse_exercise_type(exercise_name);
    if (!json_out.empty()) app.output.json_output_path = json_out;
    if (!csv_out.empty()) app.output.csv_output_path = csv_out;
    const PoseConfig pose_cfg = app.pose;
    return run_analyze(app, video_path, exercise, video_id,
                       [pose_cfg] { return create_pose_estimator(pose_cfg); });
  }

  if (*serve) {
    if (port_override > 0) app.service.port = port_override;
    return run_serve(app);
  }

  std::cout << cli_app.help() << std::endl;
  return 1;
}
