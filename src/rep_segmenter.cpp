#include "rep_segmenter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <numeric>

namespace {

RepAnalysis finalize_rep(SegmentationState& s, int end_frame, double fps) {
  const auto& frames = s.buffer;

  RepAnalysis rep;
  rep.rep_number = ++s.reps_completed;
  rep.start_frame = s.rep_start_frame.value_or(frames.front().frame_number);
  rep.end_frame = end_frame;
  rep.duration = static_cast<double>(frames.size()) / fps;

  const double score_sum =
      std::accumulate(frames.begin(), frames.end(), 0.0,
                      [](double acc, const FrameAnalysis& f) { return acc + f.form_score; });
  rep.average_form_score = score_sum / static_cast<double>(frames.size());

  rep.max_depth_angle = std::min_element(frames.begin(), frames.end(),
                                         [](const FrameAnalysis& a, const FrameAnalysis& b) {
                                           return a.hip_angle < b.hip_angle;
                                         })
                            ->hip_angle;

  const bool leaned = std::any_of(frames.begin(), frames.end(), [](const FrameAnalysis& f) {
    return f.spine_angle > kForwardLeanSpineAngle;
  });
  if (leaned) rep.form_issues.insert(kIssueForwardLean);
  if (rep.max_depth_angle > kInsufficientDepthHipAngle)
    rep.form_issues.insert(kIssueInsufficientDepth);

  rep.phase_timings = phase_timings(frames, fps);

  spdlog::debug("Rep {} finalized: frames {}-{}, {:.2f}s, depth {:.1f}, score {:.1f}",
                rep.rep_number, rep.start_frame, rep.end_frame, rep.duration,
                rep.max_depth_angle, rep.average_form_score);

  s.buffer.clear();
  s.rep_start_frame.reset();
  return rep;
}

}  // namespace

double bottom_entry_angle(ExerciseType exercise) {
  return exercise == ExerciseType::Squat ? 70.0 : 100.0;
}

std::map<RepPhase, double> phase_timings(const std::vector<FrameAnalysis>& frames, double fps) {
  std::map<RepPhase, int> counts{
      {RepPhase::Descent, 0}, {RepPhase::Bottom, 0}, {RepPhase::Ascent, 0}, {RepPhase::Top, 0}};
  for (const auto& f : frames) counts[f.rep_phase]++;

  std::map<RepPhase, double> out;
  for (const auto& [phase, n] : counts) out[phase] = static_cast<double>(n) / fps;
  return out;
}

std::optional<RepAnalysis> update_segmentation(SegmentationState& state, const FrameAnalysis& frame,
                                               ExerciseType exercise, double fps) {
  state.buffer.push_back(frame);

  if (!state.in_bottom) {
    if (frame.hip_angle < bottom_entry_angle(exercise)) {
      state.in_bottom = true;
      state.rep_start_frame = frame.frame_number;
    }
    return std::nullopt;
  }

  if (frame.hip_angle > kRepExitHipAngle) {
    state.in_bottom = false;
    return finalize_rep(state, frame.frame_number, fps);
  }
  return std::nullopt;
}

std::optional<RepAnalysis> flush_segmentation(SegmentationState& state, double fps) {
  if (state.buffer.empty()) return std::nullopt;
  state.in_bottom = false;
  return finalize_rep(state, state.buffer.back().frame_number, fps);
}
