#pragma once
#include <atomic>
#include <cstddef>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "metrics.hpp"
#include "pose_estimator.hpp"
#include "types.hpp"
#include "video_analyzer.hpp"

struct ServiceConfig {
  std::string host{"0.0.0.0"};
  int port{8080};
  int worker_threads{2};
  std::size_t max_retained_jobs{100};  // finished jobs kept for lookup, oldest evicted first
};

enum class JobStatus { Pending, Processing, Completed, Failed };

const char* to_string(JobStatus s);

struct AnalysisJob {
  std::string id;
  std::string video_path;
  ExerciseType exercise{ExerciseType::Squat};
  std::string video_id;
  JobStatus status{JobStatus::Pending};
  std::optional<VideoAnalysisResult> result;  // set only when Completed
  std::string error;                          // set only when Failed
};

using EstimatorFactory = std::function<std::unique_ptr<PoseEstimator>()>;

// Runs video analyses on a pool of worker threads, away from whatever thread
// submits them. Each worker builds its own PoseEstimator through the factory,
// so concurrent runs share nothing mutable except the metrics registry.
// Only the most recent `max_retained_jobs` finished jobs stay queryable.
class AnalysisService {
public:
  AnalysisService(EstimatorFactory factory, AnalysisConfig analysis, MetricsRegistry& m,
                  int worker_threads, std::size_t max_retained_jobs = 100);
  ~AnalysisService();

  void start();  // Spawn workers
  void stop();   // Finish queued jobs, then join workers
  bool running() const { return running_.load(); }

  // Queues a job. While the service is not running the job is recorded as
  // Failed straight away, since no worker would ever pick it up.
  std::string submit(const std::string& video_path, ExerciseType exercise,
                     const std::string& video_id = "");

  std::optional<AnalysisJob> job(const std::string& id) const;

  // Blocks until the job is Completed or Failed, or until the service has
  // stopped. Throws std::out_of_range for an unknown or evicted id.
  AnalysisJob wait(const std::string& id);

  size_t pending() const;

private:
  EstimatorFactory factory_;
  AnalysisConfig analysis_;
  MetricsRegistry& metrics_;
  int worker_threads_;
  std::size_t max_retained_;

  mutable std::mutex mu_;
  std::condition_variable queue_cv_;
  std::condition_variable done_cv_;
  std::deque<std::string> queue_;
  std::unordered_map<std::string, std::shared_ptr<AnalysisJob>> jobs_;
  std::deque<std::string> finished_;  // terminal job ids, oldest first
  uint64_t next_id_{1};

  std::atomic<bool> running_{false};
  bool stopped_{false};  // guarded by mu_; set once workers have joined
  std::vector<std::thread> workers_;

  void worker_loop(int index);
  void finish(const std::string& id, std::optional<VideoAnalysisResult> result,
              const std::string& error);
  void retire_locked(const std::string& id);
};
