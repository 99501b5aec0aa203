#include "pose_estimator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <utility>

using namespace std::chrono;

namespace {

constexpr int kBoxFields = 5;  // cx, cy, w, h, person score
constexpr int kCocoKeypoints = 17;
constexpr int kPoseRows = kBoxFields + kCocoKeypoints * 3;

// COCO keypoint index for each tracked body part, in BodyPart order.
constexpr std::array<int, kBodyPartCount> kCocoIndex = {
    0,   // nose
    5,   // left shoulder
    6,   // right shoulder
    11,  // left hip
    12,  // right hip
    13,  // left knee
    14,  // right knee
    15,  // left ankle
    16,  // right ankle
};

}  // namespace

Letterbox compute_letterbox(const cv::Size& source, const cv::Size& target) {
  Letterbox lb;
  lb.source_size = source;
  lb.scale = std::min(static_cast<float>(target.width) / static_cast<float>(source.width),
                      static_cast<float>(target.height) / static_cast<float>(source.height));
  const int new_w = static_cast<int>(static_cast<float>(source.width) * lb.scale);
  const int new_h = static_cast<int>(static_cast<float>(source.height) * lb.scale);
  lb.x_offset = (target.width - new_w) / 2;
  lb.y_offset = (target.height - new_h) / 2;
  return lb;
}

std::optional<KeypointSet> decode_yolo_pose(const cv::Mat& output, const Letterbox& lb,
                                            float person_threshold, float nms_threshold) {
  if (output.dims != 2 || output.rows != kPoseRows || output.type() != CV_32F) {
    spdlog::warn("Pose output shape mismatch: expected {}xN float, got {}x{}", kPoseRows,
                 output.rows, output.cols);
    return std::nullopt;
  }
  if (lb.source_size.width <= 0 || lb.source_size.height <= 0) return std::nullopt;

  std::vector<cv::Rect> boxes;
  std::vector<float> scores;
  std::vector<int> columns;

  for (int i = 0; i < output.cols; ++i) {
    const float score = output.at<float>(4, i);
    if (score < person_threshold) continue;

    const float cx = output.at<float>(0, i);
    const float cy = output.at<float>(1, i);
    const float w = output.at<float>(2, i);
    const float h = output.at<float>(3, i);
    boxes.emplace_back(static_cast<int>(cx - w / 2.0f), static_cast<int>(cy - h / 2.0f),
                       static_cast<int>(w), static_cast<int>(h));
    scores.push_back(score);
    columns.push_back(i);
  }
  if (boxes.empty()) return std::nullopt;

  std::vector<int> keep;
  cv::dnn::NMSBoxes(boxes, scores, person_threshold, nms_threshold, keep);
  if (keep.empty()) return std::nullopt;

  // Single subject: the most confident surviving person wins.
  const int best = *std::max_element(keep.begin(), keep.end(),
                                     [&](int a, int b) { return scores[a] < scores[b]; });
  const int col = columns[best];

  const double src_w = lb.source_size.width;
  const double src_h = lb.source_size.height;

  KeypointSet kp;
  for (std::size_t p = 0; p < kBodyPartCount; ++p) {
    const int row = kBoxFields + kCocoIndex[p] * 3;
    const double px = (output.at<float>(row, col) - static_cast<float>(lb.x_offset)) / lb.scale;
    const double py = (output.at<float>(row + 1, col) - static_cast<float>(lb.y_offset)) / lb.scale;
    kp.points[p].x = std::clamp(px / src_w, 0.0, 1.0);
    kp.points[p].y = std::clamp(py / src_h, 0.0, 1.0);
    kp.points[p].z = 0.0;
    kp.points[p].visibility = output.at<float>(row + 2, col);
  }
  return kp;
}

YoloPoseEstimator::YoloPoseEstimator(const PoseConfig& config) : config_(config) {}

bool YoloPoseEstimator::initialize() {
  spdlog::info("Initializing pose estimator...");

  if (!std::filesystem::exists(config_.model_path)) {
    spdlog::error("Pose model not found: {}", config_.model_path);
    return false;
  }

  try {
    net_ = cv::dnn::readNetFromONNX(config_.model_path);
  } catch (const cv::Exception& e) {
    spdlog::error("Failed to load pose model {}: {}", config_.model_path, e.what());
    return false;
  }
  if (net_.empty()) {
    spdlog::error("Pose model {} produced an empty network", config_.model_path);
    return false;
  }

  if (config_.use_cuda) {
    net_.setPreferableBackend(cv::dnn::DNN_BACKEND_CUDA);
    net_.setPreferableTarget(cv::dnn::DNN_TARGET_CUDA);
  } else {
    net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
    net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
  }

  initialized_ = true;
  spdlog::info("Pose estimator initialized successfully");
  spdlog::info("  - Model: {}", config_.model_path);
  spdlog::info("  - Input: {}x{}", config_.input_size.width, config_.input_size.height);
  spdlog::info("  - Backend: {}", config_.use_cuda ? "CUDA" : "CPU");
  return true;
}

cv::Mat YoloPoseEstimator::preprocess(const cv::Mat& frame, Letterbox& lb) const {
  lb = compute_letterbox(frame.size(), config_.input_size);

  cv::Mat resized;
  cv::Size new_size(static_cast<int>(static_cast<float>(frame.cols) * lb.scale),
                    static_cast<int>(static_cast<float>(frame.rows) * lb.scale));
  cv::resize(frame, resized, new_size);

  cv::Mat padded(config_.input_size, frame.type(), cv::Scalar(114, 114, 114));
  resized.copyTo(padded(cv::Rect(lb.x_offset, lb.y_offset, new_size.width, new_size.height)));

  cv::Mat blob;
  cv::dnn::blobFromImage(padded, blob, 1.0 / 255.0, config_.input_size, cv::Scalar(), true, false);
  return blob;
}

std::optional<KeypointSet> YoloPoseEstimator::estimate(const cv::Mat& frame) {
  if (!initialized_ || frame.empty()) return std::nullopt;

  auto t0 = high_resolution_clock::now();

  Letterbox lb;
  net_.setInput(preprocess(frame, lb));
  cv::Mat out = net_.forward();

  last_inference_ms_ =
      static_cast<float>(duration_cast<microseconds>(high_resolution_clock::now() - t0).count()) /
      1000.0f;

  // [1, 56, N] -> [56, N]
  if (out.dims != 3 || out.size[0] != 1) {
    spdlog::warn("Unexpected pose output rank {}", out.dims);
    return std::nullopt;
  }
  cv::Mat rows(out.size[1], out.size[2], CV_32F, out.ptr<float>());
  return decode_yolo_pose(rows, lb, config_.person_threshold, config_.nms_threshold);
}

std::unique_ptr<PoseEstimator> create_pose_estimator(const PoseConfig& config) {
  auto est = std::make_unique<YoloPoseEstimator>(config);
  if (!est->initialize()) {
    throw std::runtime_error("Pose estimator initialization failed");
  }
  return est;
}
