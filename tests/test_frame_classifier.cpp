#include <gtest/gtest.h>
#include <vector>
#include "frame_classifier.hpp"
#include "test_helpers.hpp"

class PhaseTest : public ::testing::Test {
protected:
    ClassifierState state;
};

TEST_F(PhaseTest, InitialPreviousAngleIsExtended) {
    EXPECT_DOUBLE_EQ(state.previous_hip_angle, 180.0);
}

TEST_F(PhaseTest, SquatBands) {
    EXPECT_EQ(determine_phase(151.0, ExerciseType::Squat, state), RepPhase::Top);
    EXPECT_EQ(determine_phase(89.0, ExerciseType::Squat, state), RepPhase::Bottom);
    // Boundaries themselves fall into the direction band
    EXPECT_EQ(determine_phase(90.0, ExerciseType::Squat, state), RepPhase::Ascent);
    EXPECT_EQ(determine_phase(150.0, ExerciseType::Squat, state), RepPhase::Ascent);
}

TEST_F(PhaseTest, DeadliftBands) {
    EXPECT_EQ(determine_phase(161.0, ExerciseType::Deadlift, state), RepPhase::Top);
    EXPECT_EQ(determine_phase(155.0, ExerciseType::Deadlift, state), RepPhase::Descent);
    EXPECT_EQ(determine_phase(99.0, ExerciseType::Deadlift, state), RepPhase::Bottom);
    EXPECT_EQ(determine_phase(100.0, ExerciseType::Deadlift, state), RepPhase::Ascent);
}

TEST_F(PhaseTest, DirectionFollowsPreviousAngle) {
    EXPECT_EQ(determine_phase(120.0, ExerciseType::Squat, state), RepPhase::Descent);
    EXPECT_DOUBLE_EQ(state.previous_hip_angle, 120.0);
    EXPECT_EQ(determine_phase(110.0, ExerciseType::Squat, state), RepPhase::Descent);
    EXPECT_EQ(determine_phase(125.0, ExerciseType::Squat, state), RepPhase::Ascent);
    // Holding still counts as ascent
    EXPECT_EQ(determine_phase(125.0, ExerciseType::Squat, state), RepPhase::Ascent);
}

TEST_F(PhaseTest, TopAndBottomFramesStillUpdatePreviousAngle) {
    determine_phase(60.0, ExerciseType::Squat, state);
    EXPECT_DOUBLE_EQ(state.previous_hip_angle, 60.0);
    EXPECT_EQ(determine_phase(100.0, ExerciseType::Squat, state), RepPhase::Ascent);
}

TEST(FormScoreTest, UprightStandingIsPerfect) {
    EXPECT_EQ(compute_form_score(170.0, 0.0, ExerciseType::Squat), 100);
    EXPECT_EQ(compute_form_score(170.0, 5.0, ExerciseType::Deadlift), 100);
}

TEST(FormScoreTest, SpinePenalty) {
    EXPECT_EQ(compute_form_score(170.0, 10.0, ExerciseType::Squat), 90);
    EXPECT_EQ(compute_form_score(170.0, -10.0, ExerciseType::Squat), 90);
    EXPECT_EQ(compute_form_score(170.0, 20.0, ExerciseType::Deadlift), 70);
    // Penalty caps at 40
    EXPECT_EQ(compute_form_score(170.0, 30.0, ExerciseType::Squat), 60);
    EXPECT_EQ(compute_form_score(170.0, 179.0, ExerciseType::Deadlift), 60);
}

TEST(FormScoreTest, SquatDepthBonus) {
    EXPECT_EQ(compute_form_score(80.0, 15.0, ExerciseType::Squat), 85);  // 100 - 20 + 5
    EXPECT_EQ(compute_form_score(70.0, 15.0, ExerciseType::Squat), 90);  // bonus capped at 10
    EXPECT_EQ(compute_form_score(40.0, 0.0, ExerciseType::Squat), 100);  // clamped
    EXPECT_EQ(compute_form_score(89.0, 15.0, ExerciseType::Squat), 80);  // 80.5 truncates
}

TEST(FormScoreTest, DeadliftGetsNoDepthBonus) {
    EXPECT_EQ(compute_form_score(70.0, 15.0, ExerciseType::Deadlift), 80);
    EXPECT_EQ(compute_form_score(80.0, 15.0, ExerciseType::Deadlift), 80);
}

TEST(FormScoreTest, AlwaysWithinRange) {
    const std::vector<double> hips = {-1e6, -90.0, 0.0, 45.0, 89.9, 90.0, 150.0, 360.0, 1e6};
    const std::vector<double> spines = {-1e6, -45.0, -5.0, 0.0, 4.9, 25.0, 180.0, 1e6};
    for (auto ex : {ExerciseType::Squat, ExerciseType::Deadlift}) {
        for (double h : hips) {
            for (double s : spines) {
                int score = compute_form_score(h, s, ex);
                EXPECT_GE(score, 0);
                EXPECT_LE(score, 100);
            }
        }
    }
}

TEST(ClassifyFrameTest, PopulatesAllFields) {
    ClassifierState state;
    KeypointSet kp = test_helpers::pose_with_angles(81.0, 12.0);

    FrameAnalysis fa = classify_frame(kp, ExerciseType::Squat, 42, 1.4, state);

    EXPECT_EQ(fa.frame_number, 42);
    EXPECT_DOUBLE_EQ(fa.timestamp, 1.4);
    EXPECT_NEAR(fa.hip_angle, 81.0, 1e-6);
    EXPECT_NEAR(fa.spine_angle, 12.0, 1e-6);
    EXPECT_NEAR(fa.knee_angle, 99.0, 1e-6);
    EXPECT_EQ(fa.rep_phase, RepPhase::Bottom);
    EXPECT_EQ(fa.form_score, 90);  // 100 - 14 + 4.5
    EXPECT_TRUE(fa.is_good_form);
    EXPECT_NEAR(state.previous_hip_angle, 81.0, 1e-6);
}

TEST(ClassifyFrameTest, GoodFormThreshold) {
    ClassifierState state;
    FrameAnalysis at = classify_frame(test_helpers::pose_with_angles(170.0, 19.9),
                                      ExerciseType::Deadlift, 0, 0.0, state);
    EXPECT_EQ(at.form_score, 70);
    EXPECT_TRUE(at.is_good_form);

    FrameAnalysis below = classify_frame(test_helpers::pose_with_angles(170.0, 20.6),
                                         ExerciseType::Deadlift, 1, 0.033, state);
    EXPECT_EQ(below.form_score, 68);
    EXPECT_FALSE(below.is_good_form);
}

TEST(ClassifyFrameTest, DegenerateKeypointsDoNotThrow) {
    ClassifierState state;
    KeypointSet kp;
    FrameAnalysis fa;
    EXPECT_NO_THROW(fa = classify_frame(kp, ExerciseType::Squat, 0, 0.0, state));
    EXPECT_DOUBLE_EQ(fa.hip_angle, 180.0);
    EXPECT_DOUBLE_EQ(fa.spine_angle, 0.0);
    EXPECT_EQ(fa.rep_phase, RepPhase::Top);
    EXPECT_EQ(fa.form_score, 100);
}
