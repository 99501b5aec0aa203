#include <gtest/gtest.h>
#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "analyze_command.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;

namespace {

class ThrowingPoseEstimator : public PoseEstimator {
public:
    std::optional<KeypointSet> estimate(const cv::Mat&) override {
        throw std::runtime_error("inference backend failure");
    }
};

}  // namespace

class AnalyzeCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = fs::temp_directory_path() / "formscope_analyze_tests";
        fs::create_directories(test_dir);
        app.output.json_output_path = (test_dir / "report.json").string();
        app.pose.model_path = (test_dir / "no_such_model.onnx").string();
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    // The real estimator factory against a model file that does not exist
    EstimatorFactory missing_model_factory() {
        return [this]() -> std::unique_ptr<PoseEstimator> {
            factory_calls++;
            return create_pose_estimator(app.pose);
        };
    }

    std::string read_file(const fs::path& p) {
        std::ifstream in(p);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    fs::path test_dir;
    AppConfig app;
    int factory_calls{0};
};

TEST_F(AnalyzeCommandTest, MissingVideoWinsOverMissingModel) {
    int code = run_analyze(app, (test_dir / "absent.mp4").string(), ExerciseType::Squat, "",
                           missing_model_factory());
    EXPECT_EQ(code, 2);
    EXPECT_EQ(factory_calls, 0);
    EXPECT_FALSE(fs::exists(app.output.json_output_path));
}

TEST_F(AnalyzeCommandTest, UnreadableVideoWinsOverMissingModel) {
    const fs::path garbage = test_dir / "garbage.mp4";
    {
        std::ofstream f(garbage, std::ios::binary);
        f << "not a video";
    }
    int code = run_analyze(app, garbage.string(), ExerciseType::Squat, "", missing_model_factory());
    EXPECT_EQ(code, 3);
    EXPECT_EQ(factory_calls, 0);
}

TEST_F(AnalyzeCommandTest, MissingModelWithReadableVideo) {
    const fs::path video = test_dir / "clip.avi";
    ASSERT_TRUE(test_helpers::write_mjpg_video(video.string(), 3, 30.0));

    int code = run_analyze(app, video.string(), ExerciseType::Squat, "", missing_model_factory());
    EXPECT_EQ(code, 1);
    EXPECT_EQ(factory_calls, 1);
}

TEST_F(AnalyzeCommandTest, WritesReportAndFrameLog) {
    const fs::path video = test_dir / "squat.avi";
    const std::vector<double> hips = {170, 150, 120, 90, 60, 62, 100, 140, 165};
    ASSERT_TRUE(test_helpers::write_mjpg_video(video.string(), static_cast<int>(hips.size()), 30.0));
    app.output.csv_output_path = (test_dir / "logs" / "frames.csv").string();

    EstimatorFactory factory = [hips]() -> std::unique_ptr<PoseEstimator> {
        return std::make_unique<test_helpers::SequencePoseEstimator>(hips);
    };
    int code = run_analyze(app, video.string(), ExerciseType::Squat, "cli-run", factory);
    ASSERT_EQ(code, 0);

    nlohmann::json report = nlohmann::json::parse(read_file(app.output.json_output_path));
    EXPECT_EQ(report["video_id"], "cli-run");
    EXPECT_EQ(report["exercise_type"], "squat");
    EXPECT_EQ(report["total_reps"], 1);
    EXPECT_EQ(report["frame_analyses"].size(), hips.size());

    std::string csv = read_file(app.output.csv_output_path);
    EXPECT_EQ(std::count(csv.begin(), csv.end(), '\n'), static_cast<std::ptrdiff_t>(hips.size()) + 1);
}

TEST_F(AnalyzeCommandTest, EstimatorFailureMidRunExitsWithOne) {
    const fs::path video = test_dir / "clip.avi";
    ASSERT_TRUE(test_helpers::write_mjpg_video(video.string(), 4, 30.0));

    EstimatorFactory factory = []() -> std::unique_ptr<PoseEstimator> {
        return std::make_unique<ThrowingPoseEstimator>();
    };
    EXPECT_EQ(run_analyze(app, video.string(), ExerciseType::Deadlift, "", factory), 1);
    EXPECT_FALSE(fs::exists(app.output.json_output_path));
}
