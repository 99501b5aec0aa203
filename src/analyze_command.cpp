#include "analyze_command.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "frame_source.hpp"
#include "metrics.hpp"
#include "report.hpp"
#include "video_analyzer.hpp"

int run_analyze(const AppConfig& app, const std::string& video, ExerciseType exercise,
                const std::string& video_id, const EstimatorFactory& make_estimator) {
  std::unique_ptr<VideoFileSource> source;
  try {
    source = std::make_unique<VideoFileSource>(video);
  } catch (const ResourceNotFound& e) {
    spdlog::error("{}", e.what());
    return 2;
  } catch (const UnreadableResource& e) {
    spdlog::error("{}", e.what());
    return 3;
  }

  MetricsRegistry metrics;
  std::unique_ptr<PoseEstimator> estimator;
  try {
    estimator = make_estimator();
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    return 1;
  }

  spdlog::info("Starting {} analysis for {}", to_string(exercise), source->path());
  VideoAnalyzer analyzer(*estimator, app.analysis, &metrics);
  VideoAnalysisResult result;
  try {
    result = analyzer.analyze(*source, exercise, video_id);
  } catch (const std::exception& e) {
    spdlog::error("Analysis failed: {}", e.what());
    return 1;
  }
  source.reset();

  try {
    if (app.output.json_output_path.empty()) {
      std::cout << nlohmann::json(result).dump(2) << std::endl;
    } else {
      write_json_report(result, app.output.json_output_path);
    }
    if (!app.output.csv_output_path.empty()) {
      write_frame_csv(result.frame_analyses, app.output.csv_output_path);
    }
  } catch (const std::exception& e) {
    spdlog::error("Failed to write output: {}", e.what());
    return 1;
  }

  const auto s = metrics.snapshot();
  spdlog::info("Pose inference p50={:.1f}ms p95={:.1f}ms, pose found in {:.1f}% of frames",
               s.pose_p50, s.pose_p95, s.pose_hit_rate * 100.0);
  return 0;
}
