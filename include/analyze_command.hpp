#pragma once
#include <string>

#include "analysis_service.hpp"
#include "types.hpp"
#include "util.hpp"

// One synchronous analysis for the `analyze` subcommand. Writes the JSON report
// to app.output.json_output_path (stdout when empty) and the frame CSV when
// configured. Returns the process exit code: 0 on success, 2 when the video
// does not exist, 3 when it cannot be opened, 1 for any other failure. The
// video is opened before the estimator is built.
int run_analyze(const AppConfig& app, const std::string& video, ExerciseType exercise,
                const std::string& video_id, const EstimatorFactory& make_estimator);
