#pragma once
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

class RollingHist {
public:
  explicit RollingHist(size_t cap = 512) : cap_(cap) {}
  void add(double x) {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.size() == cap_) vals_.pop_front();
    vals_.push_back(x);
  }
  // Percentile p in [0,100]
  double perc(double p) const {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.empty()) return 0.0;
    std::vector<double> v(vals_.begin(), vals_.end());
    std::sort(v.begin(), v.end());
    double rank = (p / 100.0) * static_cast<double>(v.size() - 1);
    size_t lo = static_cast<size_t>(rank);
    size_t hi = std::min(v.size() - 1, lo + 1);
    double frac = rank - static_cast<double>(lo);
    return v[lo] + (v[hi] - v[lo]) * frac;
  }
  size_t size() const {
    std::lock_guard<std::mutex> g(mu_);
    return vals_.size();
  }

private:
  size_t cap_;
  mutable std::mutex mu_;
  std::deque<double> vals_;
};

struct StatSnapshot {
  double pose_p50{0}, pose_p95{0}, pose_p99{0};
  double frame_p50{0}, frame_p95{0}, frame_p99{0};
  double video_p50{0}, video_p95{0};
  uint64_t frames_analyzed{0};
  uint64_t frames_without_pose{0};
  uint64_t reps_detected{0};
  uint64_t videos_completed{0};
  uint64_t videos_failed{0};
  double pose_hit_rate{0};
};

// Shared across concurrent analyses; every member is internally synchronized.
class MetricsRegistry {
public:
  void add_pose(double ms) { pose_.add(ms); }
  void add_frame(double ms) { frame_.add(ms); }
  void add_video(double secs) { video_.add(secs); }

  void inc_frame() { frames_analyzed_.fetch_add(1, std::memory_order_relaxed); }
  void inc_no_pose() { frames_without_pose_.fetch_add(1, std::memory_order_relaxed); }
  void add_reps(uint64_t n) { reps_detected_.fetch_add(n, std::memory_order_relaxed); }
  void inc_completed() { videos_completed_.fetch_add(1, std::memory_order_relaxed); }
  void inc_failed() { videos_failed_.fetch_add(1, std::memory_order_relaxed); }

  uint64_t frames_analyzed() const { return frames_analyzed_.load(std::memory_order_relaxed); }
  uint64_t frames_without_pose() const {
    return frames_without_pose_.load(std::memory_order_relaxed);
  }
  uint64_t videos_completed() const { return videos_completed_.load(std::memory_order_relaxed); }
  uint64_t videos_failed() const { return videos_failed_.load(std::memory_order_relaxed); }

  StatSnapshot snapshot() const;
  std::string prometheus_text(const StatSnapshot& s) const;

private:
  RollingHist pose_, frame_, video_;
  std::atomic<uint64_t> frames_analyzed_{0};
  std::atomic<uint64_t> frames_without_pose_{0};
  std::atomic<uint64_t> reps_detected_{0};
  std::atomic<uint64_t> videos_completed_{0};
  std::atomic<uint64_t> videos_failed_{0};
};
