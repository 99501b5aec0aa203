#pragma once
#include <map>
#include <optional>
#include <vector>

#include "types.hpp"

// Hip angle that must be exceeded to leave the bottom position. Shared by both
// exercises even though entry thresholds differ.
constexpr double kRepExitHipAngle = 150.0;

constexpr double kForwardLeanSpineAngle = 15.0;
constexpr double kInsufficientDepthHipAngle = 90.0;

inline constexpr const char* kIssueForwardLean = "Excessive forward lean";
inline constexpr const char* kIssueInsufficientDepth = "Insufficient depth";

double bottom_entry_angle(ExerciseType exercise);

// Per-video rep segmentation state: idle until the hip drops below the entry
// angle, in_bottom until it rises above kRepExitHipAngle. Every frame goes into
// `buffer` regardless of state.
struct SegmentationState {
  bool in_bottom{false};
  std::optional<int> rep_start_frame;
  int reps_completed{0};
  std::vector<FrameAnalysis> buffer;
};

// Feeds one frame. Returns the finalized rep when this frame completes one.
std::optional<RepAnalysis> update_segmentation(SegmentationState& state, const FrameAnalysis& frame,
                                               ExerciseType exercise, double fps);

// End of video: finalizes whatever is still buffered, even if the bottom
// position was never left (or never reached).
std::optional<RepAnalysis> flush_segmentation(SegmentationState& state, double fps);

std::map<RepPhase, double> phase_timings(const std::vector<FrameAnalysis>& frames, double fps);
