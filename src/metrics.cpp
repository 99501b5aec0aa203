#include "metrics.hpp"
#include <sstream>

StatSnapshot MetricsRegistry::snapshot() const {
  StatSnapshot s{};
  s.pose_p50 = pose_.perc(50);   s.pose_p95 = pose_.perc(95);   s.pose_p99 = pose_.perc(99);
  s.frame_p50 = frame_.perc(50); s.frame_p95 = frame_.perc(95); s.frame_p99 = frame_.perc(99);
  s.video_p50 = video_.perc(50); s.video_p95 = video_.perc(95);
  s.frames_analyzed = frames_analyzed_.load();
  s.frames_without_pose = frames_without_pose_.load();
  s.reps_detected = reps_detected_.load();
  s.videos_completed = videos_completed_.load();
  s.videos_failed = videos_failed_.load();
  const auto seen = s.frames_analyzed + s.frames_without_pose;
  s.pose_hit_rate = seen ? (static_cast<double>(s.frames_analyzed) / static_cast<double>(seen)) : 0.0;
  return s;
}

std::string MetricsRegistry::prometheus_text(const StatSnapshot& s) const {
  std::ostringstream os;
  os << "pose_inference_ms{quantile=\"0.5\"} "  << s.pose_p50 << "\n";
  os << "pose_inference_ms{quantile=\"0.95\"} " << s.pose_p95 << "\n";
  os << "pose_inference_ms{quantile=\"0.99\"} " << s.pose_p99 << "\n";

  os << "frame_analysis_ms{quantile=\"0.5\"} "  << s.frame_p50 << "\n";
  os << "frame_analysis_ms{quantile=\"0.95\"} " << s.frame_p95 << "\n";
  os << "frame_analysis_ms{quantile=\"0.99\"} " << s.frame_p99 << "\n";

  os << "video_analysis_seconds{quantile=\"0.5\"} "  << s.video_p50 << "\n";
  os << "video_analysis_seconds{quantile=\"0.95\"} " << s.video_p95 << "\n";

  os << "frames_analyzed_total " << s.frames_analyzed << "\n";
  os << "frames_without_pose_total " << s.frames_without_pose << "\n";
  os << "reps_detected_total " << s.reps_detected << "\n";
  os << "videos_completed_total " << s.videos_completed << "\n";
  os << "videos_failed_total " << s.videos_failed << "\n";

  os << "pose_hit_rate " << s.pose_hit_rate << "\n";
  return os.str();
}
