#include "video_analyzer.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cmath>
#include <utility>

#include "frame_classifier.hpp"
#include "rep_segmenter.hpp"

using namespace std::chrono;

namespace {

double round1(double v) { return std::round(v * 10.0) / 10.0; }

}  // namespace

VideoAnalyzer::VideoAnalyzer(PoseEstimator& estimator, AnalysisConfig cfg,
                             MetricsRegistry* metrics)
    : estimator_(estimator), cfg_(std::move(cfg)), metrics_(metrics) {}

VideoAnalysisResult VideoAnalyzer::analyze(FrameSource& source, ExerciseType exercise,
                                           const std::string& video_id) {
  const double reported_fps = source.fps();
  const double fps = reported_fps > 0 ? reported_fps : cfg_.fallback_fps;
  if (reported_fps <= 0) {
    spdlog::warn("Source reports fps={}, using fallback {}", reported_fps, cfg_.fallback_fps);
  }
  const int64_t reported_frames = source.frame_count();

  spdlog::info("Video properties: {} frames, {} FPS, {:.2f}s", reported_frames, fps,
               reported_frames > 0 ? static_cast<double>(reported_frames) / fps : 0.0);

  ClassifierState classifier;
  SegmentationState segmentation;

  VideoAnalysisResult result;
  result.video_id = video_id.empty() ? make_video_id() : video_id;
  result.exercise_type = exercise;
  result.fps = fps;

  std::size_t skipped = 0;
  int frame_number = 0;
  cv::Mat frame;

  while (source.next(frame)) {
    auto t0 = steady_clock::now();

    std::optional<KeypointSet> kp = estimator_.estimate(frame);
    if (metrics_) metrics_->add_pose(estimator_.last_inference_ms());

    if (!kp) {
      ++skipped;
      if (metrics_) metrics_->inc_no_pose();
    } else {
      const double timestamp = static_cast<double>(frame_number) / fps;
      FrameAnalysis fa = classify_frame(*kp, exercise, frame_number, timestamp, classifier);
      result.frame_analyses.push_back(fa);
      if (auto rep = update_segmentation(segmentation, fa, exercise, fps)) {
        result.reps.push_back(std::move(*rep));
      }
      if (metrics_) {
        metrics_->inc_frame();
        metrics_->add_frame(duration<double, std::milli>(steady_clock::now() - t0).count());
      }
    }

    ++frame_number;
    if (cfg_.progress_log_interval > 0 && frame_number % cfg_.progress_log_interval == 0 &&
        reported_frames > 0) {
      spdlog::info("Processing progress: {:.1f}%",
                   100.0 * frame_number / static_cast<double>(reported_frames));
    }
  }

  if (auto rep = flush_segmentation(segmentation, fps)) {
    result.reps.push_back(std::move(*rep));
  }

  result.total_frames = reported_frames > 0 ? reported_frames : frame_number;
  result.duration = static_cast<double>(result.total_frames) / fps;
  result.total_reps = static_cast<int>(result.reps.size());
  result.summary = compute_summary(result.frame_analyses, result.reps, skipped);
  result.average_form_score = result.summary.average_form_score;

  if (metrics_) metrics_->add_reps(result.reps.size());

  spdlog::info("Video analysis complete: {} reps detected ({} of {} frames with pose)",
               result.total_reps, result.frame_analyses.size(), frame_number);
  return result;
}

VideoAnalysisResult VideoAnalyzer::analyze_file(const std::string& path, ExerciseType exercise,
                                                const std::string& video_id) {
  spdlog::info("Starting {} analysis for {}", to_string(exercise), path);
  VideoFileSource source(path);
  return analyze(source, exercise, video_id);
}

VideoSummary compute_summary(const std::vector<FrameAnalysis>& frames,
                             const std::vector<RepAnalysis>& reps, std::size_t frames_skipped) {
  VideoSummary s;
  s.frames_skipped = frames_skipped;
  if (frames.empty()) return s;

  double score_sum = 0.0;
  std::size_t good = 0;
  for (const auto& f : frames) {
    score_sum += f.form_score;
    if (f.is_good_form) ++good;
  }
  const double n = static_cast<double>(frames.size());

  double rep_sum = 0.0;
  for (const auto& r : reps) rep_sum += r.average_form_score;

  s.average_form_score = round1(score_sum / n);
  s.good_form_percentage = round1(static_cast<double>(good) / n * 100.0);
  s.average_rep_score = reps.empty() ? 0.0 : round1(rep_sum / static_cast<double>(reps.size()));
  s.total_frames_analyzed = frames.size();
  s.frames_with_pose = frames.size();
  return s;
}

std::string make_video_id() {
  const double secs =
      duration<double>(system_clock::now().time_since_epoch()).count();
  return fmt::format("video_{:.6f}", secs);
}
