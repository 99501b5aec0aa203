#pragma once
#include "types.hpp"

// Per-video running state of the classifier. Create one per analysis run.
struct ClassifierState {
  double previous_hip_angle{180.0};
};

constexpr int kGoodFormScore = 70;

// Phase label for the current hip angle. Reads and then updates
// state.previous_hip_angle, which decides descent vs. ascent between the
// top and bottom bands.
RepPhase determine_phase(double hip_angle, ExerciseType exercise, ClassifierState& state);

// 100 minus a spine-lean penalty (capped at 40), plus a depth bonus for squats
// below 90 degrees (capped at 10). Clamped to [0, 100].
int compute_form_score(double hip_angle, double spine_angle, ExerciseType exercise);

FrameAnalysis classify_frame(const KeypointSet& kp, ExerciseType exercise, int frame_number,
                             double timestamp, ClassifierState& state);
