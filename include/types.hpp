#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

enum class ExerciseType { Squat, Deadlift };

enum class RepPhase { Descent, Bottom, Ascent, Top };

// Body parts tracked per frame. Order is the storage order inside KeypointSet.
enum class BodyPart {
  Nose,
  LeftShoulder,
  RightShoulder,
  LeftHip,
  RightHip,
  LeftKnee,
  RightKnee,
  LeftAnkle,
  RightAnkle,
};

constexpr std::size_t kBodyPartCount = 9;

struct Landmark {
  double x{0}, y{0}, z{0};
  double visibility{0};
};

// One frame's worth of landmarks. Complete by construction: a frame where the
// estimator found nobody is represented by an empty std::optional<KeypointSet>.
struct KeypointSet {
  std::array<Landmark, kBodyPartCount> points{};

  const Landmark& operator[](BodyPart p) const { return points[static_cast<std::size_t>(p)]; }
  Landmark& operator[](BodyPart p) { return points[static_cast<std::size_t>(p)]; }
};

struct FrameAnalysis {
  int frame_number{0};
  double timestamp{0};
  double hip_angle{0};
  double spine_angle{0};
  double knee_angle{0};
  int form_score{0};
  bool is_good_form{false};
  RepPhase rep_phase{RepPhase::Top};
};

struct RepAnalysis {
  int rep_number{0};
  int start_frame{0};
  int end_frame{0};
  double duration{0};
  double max_depth_angle{0};
  double average_form_score{0};
  std::set<std::string> form_issues;
  std::map<RepPhase, double> phase_timings;
};

struct VideoSummary {
  double average_form_score{0};
  double good_form_percentage{0};
  double average_rep_score{0};
  std::size_t total_frames_analyzed{0};
  std::size_t frames_with_pose{0};
  std::size_t frames_skipped{0};
};

struct VideoAnalysisResult {
  std::string video_id;
  ExerciseType exercise_type{ExerciseType::Squat};
  int64_t total_frames{0};
  double fps{0};
  double duration{0};
  int total_reps{0};
  double average_form_score{0};
  std::vector<RepAnalysis> reps;
  std::vector<FrameAnalysis> frame_analyses;
  VideoSummary summary;
};

const char* to_string(ExerciseType e);
const char* to_string(RepPhase p);
const char* to_string(BodyPart p);

std::optional<ExerciseType> parse_exercise_type(const std::string& s);
std::optional<RepPhase> parse_rep_phase(const std::string& s);
