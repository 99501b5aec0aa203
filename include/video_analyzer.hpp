#pragma once
#include <string>
#include <vector>

#include "frame_source.hpp"
#include "metrics.hpp"
#include "pose_estimator.hpp"
#include "types.hpp"

struct AnalysisConfig {
  ExerciseType default_exercise{ExerciseType::Squat};
  int progress_log_interval{30};  // frames
  double fallback_fps{30.0};      // used when the container reports fps <= 0
};

// Drives one video at a time through pose estimation, frame classification and
// rep segmentation. Classifier and segmentation state live only for the
// duration of a single analyze() call, so one analyzer can be reused across
// videos. Not thread-safe: give each worker its own analyzer and estimator.
class VideoAnalyzer {
public:
  VideoAnalyzer(PoseEstimator& estimator, AnalysisConfig cfg, MetricsRegistry* metrics = nullptr);

  // Frames where the estimator finds no pose are skipped. Exceptions thrown by
  // the source or the estimator abort the run and propagate unchanged.
  VideoAnalysisResult analyze(FrameSource& source, ExerciseType exercise,
                              const std::string& video_id = "");

  // Opens `path` and analyzes it. Throws ResourceNotFound or UnreadableResource.
  VideoAnalysisResult analyze_file(const std::string& path, ExerciseType exercise,
                                   const std::string& video_id = "");

private:
  PoseEstimator& estimator_;
  AnalysisConfig cfg_;
  MetricsRegistry* metrics_;
};

VideoSummary compute_summary(const std::vector<FrameAnalysis>& frames,
                             const std::vector<RepAnalysis>& reps, std::size_t frames_skipped);

std::string make_video_id();
