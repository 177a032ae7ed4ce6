#ifndef JWTGATE_METRICS_METRICS_RECORDER_H
#define JWTGATE_METRICS_METRICS_RECORDER_H

#include <array>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>

/**
 * @file metrics_recorder.h
 * @brief Request accounting seam and its Prometheus implementation
 */

namespace jwtgate {
namespace metrics {

/**
 * @brief Sink for the service's request metrics
 */
class MetricsRecorder {
 public:
  virtual ~MetricsRecorder() = default;

  // One call per response
  virtual void increment_status(int status) = 0;

  // One call per verification attempt
  virtual void observe_validation_seconds(double seconds) = 0;

  // Prometheus text exposition format 0.0.4
  virtual std::string render() const = 0;
};

class NullRecorder : public MetricsRecorder {
 public:
  void increment_status(int) override {}
  void observe_validation_seconds(double) override {}
  std::string render() const override { return ""; }
};

/**
 * @brief Counter and histogram exposed in Prometheus text format
 *
 * http_requests_total{status} and
 * nginx_subrequest_auth_jwt_token_validation_time_seconds with buckets
 * 1e-7 * 3^i for i in [0, 6).
 */
class PrometheusRecorder : public MetricsRecorder {
 public:
  static constexpr const char* kRequestsName = "http_requests_total";
  static constexpr const char* kValidationTimeName =
      "nginx_subrequest_auth_jwt_token_validation_time_seconds";
  static constexpr size_t kBucketCount = 6;

  PrometheusRecorder();

  // Pre-creates the 200, 401, 405 and 500 series so they export zeros
  void initialize();

  void increment_status(int status) override;
  void observe_validation_seconds(double seconds) override;
  std::string render() const override;

  uint64_t status_count(int status) const;
  uint64_t observation_count() const {
    return observation_count_.load(std::memory_order_relaxed);
  }

  static const std::array<double, kBucketCount>& bucket_bounds();

 private:
  std::atomic<uint64_t>& counter_for(int status);

  mutable std::mutex counters_mutex_;
  std::map<int, std::unique_ptr<std::atomic<uint64_t>>> status_counters_;

  std::array<std::atomic<uint64_t>, kBucketCount> buckets_;
  std::atomic<uint64_t> observation_count_{0};
  // Sum in nanoseconds so it can be accumulated atomically
  std::atomic<uint64_t> sum_nanos_{0};
};

}  // namespace metrics
}  // namespace jwtgate

#endif  // JWTGATE_METRICS_METRICS_RECORDER_H
