#pragma once

/**
 * @file Metrics.hpp
 * @brief Counters, histograms and gauges for orchestrator operations
 *
 * Metric names:
 * - prism_cascade_total             (counter)
 * - prism_cascade_errors_total      (counter)
 * - prism_cascade_duration_seconds  (histogram)
 * - prism_bo_objective              (histogram)
 * - prism_threads                   (gauge)
 *
 * NullMetrics discards everything. InProcessMetrics keeps values in memory
 * and renders Prometheus text exposition.
 */

#include <array>
#include <cmath>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace prism {

namespace metric_names {
inline constexpr const char *kCascadeTotal = "prism_cascade_total";
inline constexpr const char *kCascadeErrors = "prism_cascade_errors_total";
inline constexpr const char *kCascadeDuration = "prism_cascade_duration_seconds";
inline constexpr const char *kObjective = "prism_bo_objective";
inline constexpr const char *kThreads = "prism_threads";
} // namespace metric_names

/**
 * @brief Metrics sink. All methods must be safe to call from any thread.
 */
class Metrics {
  public:
    virtual ~Metrics() = default;

    virtual void Increment(const std::string &counter, double by = 1.0) = 0;
    virtual void Observe(const std::string &histogram, double value) = 0;
    virtual void Set(const std::string &gauge, double value) = 0;

    /// Prometheus text format (empty for NullMetrics)
    [[nodiscard]] virtual std::string Render() const = 0;

    [[nodiscard]] virtual std::string Name() const = 0;
};

class NullMetrics : public Metrics {
  public:
    void Increment(const std::string &, double) override {}
    void Observe(const std::string &, double) override {}
    void Set(const std::string &, double) override {}
    [[nodiscard]] std::string Render() const override { return ""; }
    [[nodiscard]] std::string Name() const override { return "none"; }
};

class InProcessMetrics : public Metrics {
  public:
    /// Upper bounds shared by every histogram (+Inf implied)
    static constexpr std::array<double, 14> kBuckets = {0.005, 0.01, 0.025, 0.05, 0.075,
                                                        0.1,   0.25, 0.5,   0.75, 1.0,
                                                        2.5,   5.0,  7.5,   10.0};

    void Increment(const std::string &counter, double by = 1.0) override {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[counter] += by;
    }

    void Observe(const std::string &histogram, double value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto &h = histograms_[histogram];
        if (h.buckets.empty()) {
            h.buckets.assign(kBuckets.size(), 0);
        }
        for (std::size_t i = 0; i < kBuckets.size(); ++i) {
            if (value <= kBuckets[i]) {
                ++h.buckets[i];
            }
        }
        ++h.count;
        if (std::isfinite(value)) {
            h.sum += value;
        }
    }

    void Set(const std::string &gauge, double value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[gauge] = value;
    }

    [[nodiscard]] double CounterValue(const std::string &counter) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find(counter);
        return it == counters_.end() ? 0.0 : it->second;
    }

    [[nodiscard]] uint64_t HistogramCount(const std::string &histogram) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = histograms_.find(histogram);
        return it == histograms_.end() ? 0 : it->second.count;
    }

    [[nodiscard]] double GaugeValue(const std::string &gauge) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = gauges_.find(gauge);
        return it == gauges_.end() ? 0.0 : it->second;
    }

    [[nodiscard]] std::string Render() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream os;
        for (const auto &[name, value] : counters_) {
            os << "# TYPE " << name << " counter\n" << name << " " << value << "\n";
        }
        for (const auto &[name, value] : gauges_) {
            os << "# TYPE " << name << " gauge\n" << name << " " << value << "\n";
        }
        for (const auto &[name, h] : histograms_) {
            os << "# TYPE " << name << " histogram\n";
            for (std::size_t i = 0; i < kBuckets.size(); ++i) {
                os << name << "_bucket{le=\"" << kBuckets[i] << "\"} " << h.buckets[i] << "\n";
            }
            os << name << "_bucket{le=\"+Inf\"} " << h.count << "\n";
            os << name << "_sum " << h.sum << "\n";
            os << name << "_count " << h.count << "\n";
        }
        return os.str();
    }

    [[nodiscard]] std::string Name() const override { return "in-process"; }

  private:
    struct Histogram {
        std::vector<uint64_t> buckets; ///< Cumulative counts per kBuckets entry
        uint64_t count = 0;
        double sum = 0.0;
    };

    mutable std::mutex mutex_;
    std::map<std::string, double> counters_;
    std::map<std::string, double> gauges_;
    std::map<std::string, Histogram> histograms_;
};

/// Backend chosen from configuration
[[nodiscard]] inline std::shared_ptr<Metrics> MakeMetrics(bool enabled) {
    if (enabled) {
        return std::make_shared<InProcessMetrics>();
    }
    return std::make_shared<NullMetrics>();
}

} // namespace prism
