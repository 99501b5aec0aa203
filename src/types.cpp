#include "types.hpp"

const char* to_string(ExerciseType e) {
  switch (e) {
    case ExerciseType::Squat:
      return "squat";
    case ExerciseType::Deadlift:
      return "deadlift";
  }
  return "squat";
}

const char* to_string(RepPhase p) {
  switch (p) {
    case RepPhase::Descent:
      return "descent";
    case RepPhase::Bottom:
      return "bottom";
    case RepPhase::Ascent:
      return "ascent";
    case RepPhase::Top:
      return "top";
  }
  return "top";
}

const char* to_string(BodyPart p) {
  switch (p) {
    case BodyPart::Nose:
      return "nose";
    case BodyPart::LeftShoulder:
      return "left_shoulder";
    case BodyPart::RightShoulder:
      return "right_shoulder";
    case BodyPart::LeftHip:
      return "left_hip";
    case BodyPart::RightHip:
      return "right_hip";
    case BodyPart::LeftKnee:
      return "left_knee";
    case BodyPart::RightKnee:
      return "right_knee";
    case BodyPart::LeftAnkle:
      return "left_ankle";
    case BodyPart::RightAnkle:
      return "right_ankle";
  }
  return "nose";
}

std::optional<ExerciseType> parse_exercise_type(const std::string& s) {
  if (s == "squat") return ExerciseType::Squat;
  if (s == "deadlift") return ExerciseType::Deadlift;
  return std::nullopt;
}

std::optional<RepPhase> parse_rep_phase(const std::string& s) {
  if (s == "descent") return RepPhase::Descent;
  if (s == "bottom") return RepPhase::Bottom;
  if (s == "ascent") return RepPhase::Ascent;
  if (s == "top") return RepPhase::Top;
  return std::nullopt;
}
