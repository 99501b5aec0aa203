#pragma once
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "analysis_service.hpp"
#include "types.hpp"

struct OutputConfig {
  std::string json_output_path;  // empty: stdout
  std::string csv_output_path;   // empty: no frame log
};

NLOHMANN_JSON_SERIALIZE_ENUM(ExerciseType, {
                                               {ExerciseType::Squat, "squat"},
                                               {ExerciseType::Deadlift, "deadlift"},
                                           })

NLOHMANN_JSON_SERIALIZE_ENUM(RepPhase, {
                                           {RepPhase::Descent, "descent"},
                                           {RepPhase::Bottom, "bottom"},
                                           {RepPhase::Ascent, "ascent"},
                                           {RepPhase::Top, "top"},
                                       })

void to_json(nlohmann::json& j, const FrameAnalysis& f);
void to_json(nlohmann::json& j, const RepAnalysis& r);
void to_json(nlohmann::json& j, const VideoSummary& s);
void to_json(nlohmann::json& j, const VideoAnalysisResult& r);

// Job status document; embeds the full result once completed unless
// `include_frames` is false, in which case frame_analyses is omitted.
nlohmann::json job_to_json(const AnalysisJob& job, bool include_frames = true);

// Body of POST /analyses: {"video_path": str, "exercise_type"?: str, "video_id"?: str}.
struct AnalysisRequest {
  std::string video_path;
  ExerciseType exercise{ExerciseType::Squat};
  std::string video_id;
};

// Throws std::invalid_argument, with a message fit for the client, on malformed
// JSON, a missing or non-string video_path, a non-string video_id, or an
// exercise_type other than "squat" / "deadlift".
AnalysisRequest parse_analysis_request(const std::string& body, ExerciseType default_exercise);

// Per-frame table, one row per analyzed frame, header first.
std::string frames_to_csv(const std::vector<FrameAnalysis>& frames);

// Both throw std::runtime_error if the file cannot be written. Parent
// directories are created as needed.
void write_json_report(const VideoAnalysisResult& result, const std::string& path);
void write_frame_csv(const std::vector<FrameAnalysis>& frames, const std::string& path);
