#include "frame_classifier.hpp"

#include <algorithm>
#include <cmath>

#include "geometry.hpp"

namespace {

struct PhaseBands {
  double top;
  double bottom;
};

PhaseBands bands_for(ExerciseType exercise) {
  switch (exercise) {
    case ExerciseType::Squat:
      return {150.0, 90.0};
    case ExerciseType::Deadlift:
      return {160.0, 100.0};
  }
  return {150.0, 90.0};
}

}  // namespace

RepPhase determine_phase(double hip_angle, ExerciseType exercise, ClassifierState& state) {
  const PhaseBands b = bands_for(exercise);
  RepPhase phase;
  if (hip_angle > b.top) {
    phase = RepPhase::Top;
  } else if (hip_angle < b.bottom) {
    phase = RepPhase::Bottom;
  } else if (hip_angle < state.previous_hip_angle) {
    phase = RepPhase::Descent;
  } else {
    phase = RepPhase::Ascent;
  }
  state.previous_hip_angle = hip_angle;
  return phase;
}

int compute_form_score(double hip_angle, double spine_angle, ExerciseType exercise) {
  double score = 100.0;

  // 5 degrees of lean are free
  const double spine_penalty = std::max(0.0, std::abs(spine_angle) - 5.0) * 2.0;
  score -= std::min(spine_penalty, 40.0);

  if (exercise == ExerciseType::Squat && hip_angle < 90.0) {
    const double depth_bonus = (90.0 - hip_angle) / 20.0 * 10.0;
    score += std::min(depth_bonus, 10.0);
  }

  score = std::max(0.0, std::min(100.0, score));
  return static_cast<int>(score);
}

FrameAnalysis classify_frame(const KeypointSet& kp, ExerciseType exercise, int frame_number,
                             double timestamp, ClassifierState& state) {
  FrameAnalysis fa;
  fa.frame_number = frame_number;
  fa.timestamp = timestamp;
  fa.hip_angle = hip_angle(kp);
  fa.spine_angle = spine_angle(kp);
  fa.knee_angle = knee_angle(kp);
  fa.rep_phase = determine_phase(fa.hip_angle, exercise, state);
  fa.form_score = compute_form_score(fa.hip_angle, fa.spine_angle, exercise);
  fa.is_good_form = fa.form_score >= kGoodFormScore;
  return fa;
}
