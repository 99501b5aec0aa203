#include "frame_source.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

#include "errors.hpp"

VideoFileSource::VideoFileSource(const std::string& path) : path_(path) {
  if (!std::filesystem::exists(path)) {
    throw ResourceNotFound(path);
  }
  if (!cap_.open(path) || !cap_.isOpened()) {
    spdlog::error("Failed to open input: {}", path);
    throw UnreadableResource(path);
  }
  fps_ = cap_.get(cv::CAP_PROP_FPS);
  frame_count_ = static_cast<int64_t>(cap_.get(cv::CAP_PROP_FRAME_COUNT));
}

VideoFileSource::~VideoFileSource() {
  if (cap_.isOpened()) cap_.release();
}

bool VideoFileSource::next(cv::Mat& out) {
  cap_ >> out;
  return !out.empty();
}
