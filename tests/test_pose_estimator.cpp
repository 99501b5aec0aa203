#include <gtest/gtest.h>
#include <stdexcept>
#include "pose_estimator.hpp"

class PoseDecodeTest : public ::testing::Test {
protected:
    static constexpr int kRows = 56;

    // Writes one candidate person into column `col`. Each COCO keypoint k sits
    // at (base_x + 10k, base_y + 5k) in model coordinates with confidence 0.8.
    void put_person(cv::Mat& out, int col, float score, cv::Rect2f box, float base_x, float base_y) {
        out.at<float>(0, col) = box.x + box.width / 2.0f;
        out.at<float>(1, col) = box.y + box.height / 2.0f;
        out.at<float>(2, col) = box.width;
        out.at<float>(3, col) = box.height;
        out.at<float>(4, col) = score;
        for (int k = 0; k < 17; ++k) {
            out.at<float>(5 + k * 3, col) = base_x + 10.0f * k;
            out.at<float>(5 + k * 3 + 1, col) = base_y + 5.0f * k;
            out.at<float>(5 + k * 3 + 2, col) = 0.8f;
        }
    }

    Letterbox identity() { return compute_letterbox(cv::Size(640, 640), cv::Size(640, 640)); }
};

TEST(LetterboxTest, WideFrameIsPaddedVertically) {
    Letterbox lb = compute_letterbox(cv::Size(1280, 720), cv::Size(640, 640));
    EXPECT_FLOAT_EQ(lb.scale, 0.5f);
    EXPECT_EQ(lb.x_offset, 0);
    EXPECT_EQ(lb.y_offset, 140);
    EXPECT_EQ(lb.source_size, cv::Size(1280, 720));
}

TEST(LetterboxTest, TallFrameIsPaddedHorizontally) {
    Letterbox lb = compute_letterbox(cv::Size(480, 960), cv::Size(640, 640));
    EXPECT_FLOAT_EQ(lb.scale, 640.0f / 960.0f);
    EXPECT_EQ(lb.x_offset, 160);
    EXPECT_EQ(lb.y_offset, 0);
}

TEST_F(PoseDecodeTest, MapsCocoIndicesToBodyParts) {
    cv::Mat out = cv::Mat::zeros(kRows, 4, CV_32F);
    put_person(out, 2, 0.9f, cv::Rect2f(200, 100, 200, 400), 100.0f, 200.0f);

    auto kp = decode_yolo_pose(out, identity(), 0.5f, 0.45f);
    ASSERT_TRUE(kp.has_value());

    // nose is COCO 0, left hip 11, right ankle 16
    EXPECT_NEAR((*kp)[BodyPart::Nose].x, 100.0 / 640.0, 1e-6);
    EXPECT_NEAR((*kp)[BodyPart::Nose].y, 200.0 / 640.0, 1e-6);
    EXPECT_NEAR((*kp)[BodyPart::LeftShoulder].x, 150.0 / 640.0, 1e-6);
    EXPECT_NEAR((*kp)[BodyPart::LeftHip].x, 210.0 / 640.0, 1e-6);
    EXPECT_NEAR((*kp)[BodyPart::LeftHip].y, 255.0 / 640.0, 1e-6);
    EXPECT_NEAR((*kp)[BodyPart::RightAnkle].x, 260.0 / 640.0, 1e-6);
    EXPECT_NEAR((*kp)[BodyPart::RightAnkle].y, 280.0 / 640.0, 1e-6);
    EXPECT_NEAR((*kp)[BodyPart::RightKnee].visibility, 0.8, 1e-6);
    EXPECT_DOUBLE_EQ((*kp)[BodyPart::LeftKnee].z, 0.0);
}

TEST_F(PoseDecodeTest, UndoesLetterbox) {
    Letterbox lb = compute_letterbox(cv::Size(1280, 720), cv::Size(640, 640));
    cv::Mat out = cv::Mat::zeros(kRows, 1, CV_32F);
    put_person(out, 0, 0.9f, cv::Rect2f(200, 200, 200, 200), 320.0f, 320.0f);

    auto kp = decode_yolo_pose(out, lb, 0.5f, 0.45f);
    ASSERT_TRUE(kp.has_value());
    // (320 - 0) / 0.5 = 640 of 1280, (320 - 140) / 0.5 = 360 of 720
    EXPECT_NEAR((*kp)[BodyPart::Nose].x, 0.5, 1e-6);
    EXPECT_NEAR((*kp)[BodyPart::Nose].y, 0.5, 1e-6);
}

TEST_F(PoseDecodeTest, ClampsPointsInPadding) {
    Letterbox lb = compute_letterbox(cv::Size(1280, 720), cv::Size(640, 640));
    cv::Mat out = cv::Mat::zeros(kRows, 1, CV_32F);
    // Keypoints start inside the top padding band
    put_person(out, 0, 0.9f, cv::Rect2f(200, 200, 200, 200), 10.0f, 10.0f);

    auto kp = decode_yolo_pose(out, lb, 0.5f, 0.45f);
    ASSERT_TRUE(kp.has_value());
    EXPECT_DOUBLE_EQ((*kp)[BodyPart::Nose].y, 0.0);
    for (const auto& p : kp->points) {
        EXPECT_GE(p.x, 0.0);
        EXPECT_LE(p.x, 1.0);
        EXPECT_GE(p.y, 0.0);
        EXPECT_LE(p.y, 1.0);
    }
}

TEST_F(PoseDecodeTest, LowScoreMeansNoPerson) {
    cv::Mat out = cv::Mat::zeros(kRows, 3, CV_32F);
    put_person(out, 1, 0.3f, cv::Rect2f(200, 100, 200, 400), 100.0f, 200.0f);
    EXPECT_FALSE(decode_yolo_pose(out, identity(), 0.5f, 0.45f).has_value());
}

TEST_F(PoseDecodeTest, EmptyOutputMeansNoPerson) {
    cv::Mat out = cv::Mat::zeros(kRows, 8, CV_32F);
    EXPECT_FALSE(decode_yolo_pose(out, identity(), 0.5f, 0.45f).has_value());
}

TEST_F(PoseDecodeTest, MostConfidentPersonWins) {
    cv::Mat out = cv::Mat::zeros(kRows, 3, CV_32F);
    put_person(out, 0, 0.70f, cv::Rect2f(10, 10, 100, 200), 20.0f, 20.0f);
    put_person(out, 1, 0.95f, cv::Rect2f(400, 300, 100, 200), 400.0f, 320.0f);
    put_person(out, 2, 0.60f, cv::Rect2f(200, 300, 100, 200), 200.0f, 320.0f);

    auto kp = decode_yolo_pose(out, identity(), 0.5f, 0.45f);
    ASSERT_TRUE(kp.has_value());
    EXPECT_NEAR((*kp)[BodyPart::Nose].x, 400.0 / 640.0, 1e-6);
    EXPECT_NEAR((*kp)[BodyPart::Nose].y, 320.0 / 640.0, 1e-6);
}

TEST_F(PoseDecodeTest, RejectsWrongShape) {
    cv::Mat wrong_rows = cv::Mat::zeros(84, 4, CV_32F);
    EXPECT_FALSE(decode_yolo_pose(wrong_rows, identity(), 0.5f, 0.45f).has_value());

    cv::Mat wrong_type = cv::Mat::zeros(kRows, 4, CV_8U);
    EXPECT_FALSE(decode_yolo_pose(wrong_type, identity(), 0.5f, 0.45f).has_value());
}

TEST_F(PoseDecodeTest, RejectsEmptySourceSize) {
    cv::Mat out = cv::Mat::zeros(kRows, 1, CV_32F);
    put_person(out, 0, 0.9f, cv::Rect2f(200, 200, 200, 200), 320.0f, 320.0f);
    EXPECT_FALSE(decode_yolo_pose(out, Letterbox{}, 0.5f, 0.45f).has_value());
}

TEST(YoloPoseEstimatorTest, DefaultConfig) {
    YoloPoseEstimator est;
    EXPECT_EQ(est.getConfig().input_size, cv::Size(640, 640));
    EXPECT_FLOAT_EQ(est.getConfig().person_threshold, 0.5f);
    EXPECT_FALSE(est.getConfig().use_cuda);
}

TEST(YoloPoseEstimatorTest, MissingModelFailsInitialization) {
    PoseConfig cfg;
    cfg.model_path = "definitely/not/here/pose.onnx";
    YoloPoseEstimator est(cfg);
    EXPECT_FALSE(est.initialize());

    // Uninitialized estimator reports no pose instead of crashing
    cv::Mat frame(64, 64, CV_8UC3, cv::Scalar(0, 0, 0));
    EXPECT_FALSE(est.estimate(frame).has_value());
}

TEST(YoloPoseEstimatorTest, FactoryThrowsOnMissingModel) {
    PoseConfig cfg;
    cfg.model_path = "definitely/not/here/pose.onnx";
    EXPECT_THROW(create_pose_estimator(cfg), std::runtime_error);
}
