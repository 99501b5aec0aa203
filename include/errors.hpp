#pragma once
#include <stdexcept>
#include <string>

// Failures that abort one video analysis. Nothing here is fatal to the process.
class AnalysisError : public std::runtime_error {
public:
  explicit AnalysisError(const std::string& what) : std::runtime_error(what) {}
};

// The video path does not exist.
class ResourceNotFound : public AnalysisError {
public:
  explicit ResourceNotFound(const std::string& path)
      : AnalysisError("Video file not found: " + path) {}
};

// The path exists but cannot be opened or decoded as video.
class UnreadableResource : public AnalysisError {
public:
  explicit UnreadableResource(const std::string& path)
      : AnalysisError("Cannot open video file: " + path) {}
};
