#include "report.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace {

std::ofstream open_output(const std::string& path) {
  std::filesystem::path p(path);
  std::filesystem::path directory = p.parent_path();
  if (!directory.empty() && !std::filesystem::exists(directory)) {
    std::filesystem::create_directories(directory);
    spdlog::info("Created output directory: {}", directory.string());
  }
  std::ofstream file(path, std::ios::out | std::ios::trunc);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open file for writing: " + path);
  }
  return file;
}

}  // namespace

void to_json(nlohmann::json& j, const FrameAnalysis& f) {
  j = nlohmann::json{{"frame_number", f.frame_number}, {"timestamp", f.timestamp},
                     {"hip_angle", f.hip_angle},       {"spine_angle", f.spine_angle},
                     {"knee_angle", f.knee_angle},     {"form_score", f.form_score},
                     {"is_good_form", f.is_good_form}, {"rep_phase", f.rep_phase}};
}

void to_json(nlohmann::json& j, const RepAnalysis& r) {
  nlohmann::json timings = nlohmann::json::object();
  for (const auto& [phase, secs] : r.phase_timings) timings[to_string(phase)] = secs;

  j = nlohmann::json{{"rep_number", r.rep_number},
                     {"start_frame", r.start_frame},
                     {"end_frame", r.end_frame},
                     {"duration", r.duration},
                     {"max_depth_angle", r.max_depth_angle},
                     {"average_form_score", r.average_form_score},
                     {"form_issues", r.form_issues},
                     {"phase_timings", timings}};
}

void to_json(nlohmann::json& j, const VideoSummary& s) {
  j = nlohmann::json{{"average_form_score", s.average_form_score},
                     {"good_form_percentage", s.good_form_percentage},
                     {"average_rep_score", s.average_rep_score},
                     {"total_frames_analyzed", s.total_frames_analyzed},
                     {"frames_with_pose", s.frames_with_pose},
                     {"frames_skipped", s.frames_skipped}};
}

void to_json(nlohmann::json& j, const VideoAnalysisResult& r) {
  j = nlohmann::json{{"video_id", r.video_id},
                     {"exercise_type", r.exercise_type},
                     {"total_frames", r.total_frames},
                     {"fps", r.fps},
                     {"duration", r.duration},
                     {"total_reps", r.total_reps},
                     {"average_form_score", r.average_form_score},
                     {"reps", r.reps},
                     {"frame_analyses", r.frame_analyses},
                     {"summary", r.summary}};
}

nlohmann::json job_to_json(const AnalysisJob& job, bool include_frames) {
  nlohmann::json j{{"job_id", job.id},
                   {"video_id", job.video_id},
                   {"video_path", job.video_path},
                   {"exercise_type", job.exercise},
                   {"status", to_string(job.status)}};
  if (job.status == JobStatus::Completed && job.result) {
    nlohmann::json r = *job.result;
    if (!include_frames) r.erase("frame_analyses");
    j["result"] = std::move(r);
  } else if (job.status == JobStatus::Failed) {
    j["error"] = job.error;
  }
  return j;
}

AnalysisRequest parse_analysis_request(const std::string& body, ExerciseType default_exercise) {
  nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    throw std::invalid_argument("request body must be a JSON object");
  }
  if (!j.contains("video_path") || !j["video_path"].is_string()) {
    throw std::invalid_argument("video_path must be a string");
  }

  AnalysisRequest req;
  req.video_path = j["video_path"].get<std::string>();
  req.exercise = default_exercise;

  if (j.contains("exercise_type")) {
    std::optional<ExerciseType> ex;
    if (j["exercise_type"].is_string()) ex = parse_exercise_type(j["exercise_type"].get<std::string>());
    if (!ex) throw std::invalid_argument("exercise_type must be squat or deadlift");
    req.exercise = *ex;
  }

  if (j.contains("video_id")) {
    if (!j["video_id"].is_string()) throw std::invalid_argument("video_id must be a string");
    req.video_id = j["video_id"].get<std::string>();
  }
  return req;
}

std::string frames_to_csv(const std::vector<FrameAnalysis>& frames) {
  std::ostringstream os;
  os << "frame_number,timestamp,hip_angle,spine_angle,knee_angle,form_score,is_good_form,"
        "rep_phase\n";
  os << std::fixed;
  for (const auto& f : frames) {
    os << f.frame_number << "," << std::setprecision(4) << f.timestamp << ","
       << std::setprecision(2) << f.hip_angle << "," << f.spine_angle << "," << f.knee_angle
       << "," << f.form_score << "," << (f.is_good_form ? 1 : 0) << "," << to_string(f.rep_phase)
       << "\n";
  }
  return os.str();
}

void write_json_report(const VideoAnalysisResult& result, const std::string& path) {
  std::ofstream file = open_output(path);
  file << nlohmann::json(result).dump(2) << "\n";
  spdlog::info("Analysis report written to {}", path);
}

void write_frame_csv(const std::vector<FrameAnalysis>& frames, const std::string& path) {
  std::ofstream file = open_output(path);
  file << frames_to_csv(frames);
  spdlog::info("Frame log written to {} ({} rows)", path, frames.size());
}
