#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/dnn.hpp>
#include <opencv2/opencv.hpp>

#include "types.hpp"

// Pose estimator configuration
struct PoseConfig {
  std::string model_path = "models/yolo11n-pose.onnx";
  cv::Size input_size{640, 640};
  float person_threshold = 0.5f;
  float nms_threshold = 0.45f;
  bool use_cuda = false;  // OpenCV DNN CUDA backend instead of CPU
};

// Single-subject pose estimation on one BGR frame. Returns nullopt when no
// person is detected; that is an expected outcome, not an error.
class PoseEstimator {
public:
  virtual ~PoseEstimator() = default;
  virtual std::optional<KeypointSet> estimate(const cv::Mat& frame) = 0;

  // Wall time of the most recent estimate() call.
  virtual float last_inference_ms() const { return 0.0f; }
};

// Geometry of the letterbox applied before inference, needed to map model
// coordinates back onto the source frame.
struct Letterbox {
  float scale{1.0f};
  int x_offset{0};
  int y_offset{0};
  cv::Size source_size;
};

Letterbox compute_letterbox(const cv::Size& source, const cv::Size& target);

// Decodes a YOLO-pose head laid out as [56, N]: cx, cy, w, h, person score,
// then 17 COCO keypoints as (x, y, conf). Keeps the best person after NMS and
// returns its 9 tracked body parts normalized to [0, 1] frame coordinates.
std::optional<KeypointSet> decode_yolo_pose(const cv::Mat& output, const Letterbox& lb,
                                            float person_threshold, float nms_threshold);

// YOLO-pose ONNX model run through OpenCV DNN
class YoloPoseEstimator : public PoseEstimator {
public:
  explicit YoloPoseEstimator(const PoseConfig& config = PoseConfig{});

  bool initialize();
  std::optional<KeypointSet> estimate(const cv::Mat& frame) override;
  float last_inference_ms() const override { return last_inference_ms_; }

  const PoseConfig& getConfig() const { return config_; }

private:
  PoseConfig config_;
  cv::dnn::Net net_;
  bool initialized_{false};
  float last_inference_ms_{0.0f};

  cv::Mat preprocess(const cv::Mat& frame, Letterbox& lb) const;
};

// Factory; throws std::runtime_error if the model cannot be loaded.
std::unique_ptr<PoseEstimator> create_pose_estimator(const PoseConfig& config = PoseConfig{});
