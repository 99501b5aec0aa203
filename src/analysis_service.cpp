#include "analysis_service.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

#include "errors.hpp"

using namespace std::chrono;

const char* to_string(JobStatus s) {
  switch (s) {
    case JobStatus::Pending:
      return "pending";
    case JobStatus::Processing:
      return "processing";
    case JobStatus::Completed:
      return "completed";
    case JobStatus::Failed:
      return "failed";
  }
  return "pending";
}

AnalysisService::AnalysisService(EstimatorFactory factory, AnalysisConfig analysis,
                                 MetricsRegistry& m, int worker_threads,
                                 std::size_t max_retained_jobs)
    : factory_(std::move(factory)),
      analysis_(std::move(analysis)),
      metrics_(m),
      worker_threads_(std::max(1, worker_threads)),
      max_retained_(std::max<std::size_t>(1, max_retained_jobs)) {}

AnalysisService::~AnalysisService() { stop(); }

void AnalysisService::start() {
  if (running_.exchange(true)) return;
  {
    std::lock_guard<std::mutex> g(mu_);
    stopped_ = false;
  }
  spdlog::info("Starting analysis service with {} worker(s)", worker_threads_);
  for (int i = 0; i < worker_threads_; ++i) {
    workers_.emplace_back([this, i] { worker_loop(i); });
  }
}

void AnalysisService::stop() {
  if (!running_.exchange(false)) return;
  queue_cv_.notify_all();
  for (auto& t : workers_) {
    if (t.joinable()) t.join();
  }
  workers_.clear();
  {
    std::lock_guard<std::mutex> g(mu_);
    stopped_ = true;
  }
  done_cv_.notify_all();
  spdlog::info("Analysis service stopped");
}

std::string AnalysisService::submit(const std::string& video_path, ExerciseType exercise,
                                    const std::string& video_id) {
  auto job = std::make_shared<AnalysisJob>();
  job->video_path = video_path;
  job->exercise = exercise;
  job->video_id = video_id.empty() ? make_video_id() : video_id;

  std::string id;
  bool queued = false;
  {
    std::lock_guard<std::mutex> g(mu_);
    id = "job-" + std::to_string(next_id_++);
    job->id = id;
    jobs_.emplace(id, job);
    if (running_.load()) {
      queue_.push_back(id);
      queued = true;
    } else {
      job->status = JobStatus::Failed;
      job->error = "Analysis service is not running";
      retire_locked(id);
    }
  }

  if (!queued) {
    spdlog::warn("Rejected {} ({}): service is not running", id, video_path);
    metrics_.inc_failed();
    done_cv_.notify_all();
    return id;
  }
  queue_cv_.notify_one();
  spdlog::info("Queued {} ({}, {})", id, video_path, to_string(exercise));
  return id;
}

std::optional<AnalysisJob> AnalysisService::job(const std::string& id) const {
  std::lock_guard<std::mutex> g(mu_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) return std::nullopt;
  return *it->second;
}

AnalysisJob AnalysisService::wait(const std::string& id) {
  std::unique_lock<std::mutex> lk(mu_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) throw std::out_of_range("Unknown job: " + id);
  // Shared ownership keeps the job alive if it is evicted while we sleep.
  std::shared_ptr<AnalysisJob> job = it->second;
  done_cv_.wait(lk, [&] {
    return job->status == JobStatus::Completed || job->status == JobStatus::Failed || stopped_;
  });
  return *job;
}

size_t AnalysisService::pending() const {
  std::lock_guard<std::mutex> g(mu_);
  return queue_.size();
}

void AnalysisService::worker_loop(int index) {
  std::unique_ptr<PoseEstimator> estimator;

  while (true) {
    std::string id;
    std::string path;
    std::string video_id;
    ExerciseType exercise{ExerciseType::Squat};
    {
      std::unique_lock<std::mutex> lk(mu_);
      queue_cv_.wait(lk, [&] { return !queue_.empty() || !running_.load(); });
      if (queue_.empty()) break;  // stopped and drained
      id = queue_.front();
      queue_.pop_front();
      AnalysisJob& job = *jobs_.at(id);
      job.status = JobStatus::Processing;
      path = job.video_path;
      video_id = job.video_id;
      exercise = job.exercise;
    }

    spdlog::info("Worker {} processing {}", index, id);
    auto t0 = steady_clock::now();
    try {
      if (!estimator) estimator = factory_();
      VideoAnalyzer analyzer(*estimator, analysis_, &metrics_);
      VideoAnalysisResult result = analyzer.analyze_file(path, exercise, video_id);
      metrics_.add_video(duration<double>(steady_clock::now() - t0).count());
      metrics_.inc_completed();
      finish(id, std::move(result), "");
    } catch (const AnalysisError& e) {
      spdlog::error("{} failed: {}", id, e.what());
      metrics_.inc_failed();
      finish(id, std::nullopt, e.what());
    } catch (const std::exception& e) {
      spdlog::error("{} failed with unexpected error: {}", id, e.what());
      metrics_.inc_failed();
      finish(id, std::nullopt, e.what());
    }
  }
}

void AnalysisService::finish(const std::string& id, std::optional<VideoAnalysisResult> result,
                             const std::string& error) {
  {
    std::lock_guard<std::mutex> g(mu_);
    AnalysisJob& job = *jobs_.at(id);
    if (result) {
      job.status = JobStatus::Completed;
      job.result = std::move(result);
      spdlog::info("{} completed: {} reps, average form {:.1f}", id, job.result->total_reps,
                   job.result->average_form_score);
    } else {
      job.status = JobStatus::Failed;
      job.error = error;
    }
    retire_locked(id);
  }
  done_cv_.notify_all();
}

void AnalysisService::retire_locked(const std::string& id) {
  finished_.push_back(id);
  while (finished_.size() > max_retained_) {
    spdlog::debug("Evicting {} from job history", finished_.front());
    jobs_.erase(finished_.front());
    finished_.pop_front();
  }
}
