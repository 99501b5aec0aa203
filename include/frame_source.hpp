#pragma once
#include <cstdint>
#include <string>

#include <opencv2/opencv.hpp>

// Sequential supplier of decoded frames for one video.
class FrameSource {
public:
  virtual ~FrameSource() = default;

  // Fills `out` with the next BGR frame. Returns false once the stream is exhausted.
  virtual bool next(cv::Mat& out) = 0;

  virtual double fps() const = 0;
  virtual int64_t frame_count() const = 0;
};

// Video file decoded through cv::VideoCapture. The capture is released when the
// source is destroyed, including when analysis unwinds with an exception.
class VideoFileSource : public FrameSource {
public:
  // Throws ResourceNotFound if `path` does not exist, UnreadableResource if
  // OpenCV cannot open it.
  explicit VideoFileSource(const std::string& path);
  ~VideoFileSource() override;

  VideoFileSource(const VideoFileSource&) = delete;
  VideoFileSource& operator=(const VideoFileSource&) = delete;

  bool next(cv::Mat& out) override;
  double fps() const override { return fps_; }
  int64_t frame_count() const override { return frame_count_; }
  const std::string& path() const { return path_; }

private:
  std::string path_;
  cv::VideoCapture cap_;
  double fps_{0};
  int64_t frame_count_{0};
};
