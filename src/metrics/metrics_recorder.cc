#include "jwtgate/metrics/metrics_recorder.h"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace jwtgate {
namespace metrics {

namespace {

const int kInitialStatuses[] = {200, 401, 405, 500};

std::string format_bound(double bound) {
  std::ostringstream oss;
  oss << std::setprecision(6) << bound;
  return oss.str();
}

}  // namespace

const std::array<double, PrometheusRecorder::kBucketCount>&
PrometheusRecorder::bucket_bounds() {
  static const std::array<double, kBucketCount> bounds = []() {
    std::array<double, kBucketCount> b{};
    double value = 1e-7;
    for (size_t i = 0; i < kBucketCount; ++i) {
      b[i] = value;
      value *= 3;
    }
    return b;
  }();
  return bounds;
}

PrometheusRecorder::PrometheusRecorder() {
  for (auto& bucket : buckets_) {
    bucket.store(0, std::memory_order_relaxed);
  }
}

void PrometheusRecorder::initialize() {
  for (int status : kInitialStatuses) {
    counter_for(status);
  }
}

std::atomic<uint64_t>& PrometheusRecorder::counter_for(int status) {
  std::lock_guard<std::mutex> lock(counters_mutex_);
  auto& slot = status_counters_[status];
  if (!slot) {
    slot = std::make_unique<std::atomic<uint64_t>>(0);
  }
  return *slot;
}

void PrometheusRecorder::increment_status(int status) {
  counter_for(status).fetch_add(1, std::memory_order_relaxed);
}

void PrometheusRecorder::observe_validation_seconds(double seconds) {
  if (!(seconds >= 0)) {
    seconds = 0;
  }
  const auto& bounds = bucket_bounds();
  // Buckets are stored non-cumulatively and summed at render time
  for (size_t i = 0; i < kBucketCount; ++i) {
    if (seconds <= bounds[i]) {
      buckets_[i].fetch_add(1, std::memory_order_relaxed);
      break;
    }
  }
  observation_count_.fetch_add(1, std::memory_order_relaxed);
  sum_nanos_.fetch_add(static_cast<uint64_t>(std::llround(seconds * 1e9)),
                       std::memory_order_relaxed);
}

uint64_t PrometheusRecorder::status_count(int status) const {
  std::lock_guard<std::mutex> lock(counters_mutex_);
  auto it = status_counters_.find(status);
  if (it == status_counters_.end()) {
    return 0;
  }
  return it->second->load(std::memory_order_relaxed);
}

std::string PrometheusRecorder::render() const {
  std::ostringstream out;

  out << "# HELP " << kRequestsName
      << " Number of requests by response status.\n";
  out << "# TYPE " << kRequestsName << " counter\n";
  {
    std::lock_guard<std::mutex> lock(counters_mutex_);
    for (const auto& entry : status_counters_) {
      out << kRequestsName << "{status=\"" << entry.first << "\"} "
          << entry.second->load(std::memory_order_relaxed) << "\n";
    }
  }

  out << "# HELP " << kValidationTimeName
      << " Time spent validating tokens.\n";
  out << "# TYPE " << kValidationTimeName << " histogram\n";
  const auto& bounds = bucket_bounds();
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBucketCount; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    out << kValidationTimeName << "_bucket{le=\"" << format_bound(bounds[i])
        << "\"} " << cumulative << "\n";
  }
  const uint64_t count = observation_count_.load(std::memory_order_relaxed);
  out << kValidationTimeName << "_bucket{le=\"+Inf\"} " << count << "\n";
  out << kValidationTimeName << "_sum "
      << static_cast<double>(sum_nanos_.load(std::memory_order_relaxed)) / 1e9
      << "\n";
  out << kValidationTimeName << "_count " << count << "\n";

  return out.str();
}

}  // namespace metrics
}  // namespace jwtgate
