#include "call_bridge/metrics.hpp"

#include <iomanip>
#include <sstream>

namespace call_bridge {

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {0.05, 0.1, 0.25, 0.5, 0.75, 1.0, 2.5, 5.0, 10.0, 30.0};
}

void Metrics::call_started() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_started_;
    ++calls_active_;
}

void Metrics::call_finished() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (calls_active_ > 0) {
        --calls_active_;
    }
}

void Metrics::vad_commit() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++vad_commits_;
}

void Metrics::vad_discard() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++vad_discards_;
}

void Metrics::realtime_connect_failure() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++connect_failures_;
}

Metrics::HistogramSeries& Metrics::histogram_for(const std::string& tool) {
    auto& series = tool_latency_[tool];
    if (series.buckets.empty()) {
        series.buckets.assign(histogram_bounds_.size() + 1, 0);
    }
    return series;
}

void Metrics::observe_tool_call(const std::string& tool, bool success, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++tool_calls_[{tool, success ? "success" : "error"}];
    auto& histogram = histogram_for(tool);
    histogram.count += 1;
    histogram.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            histogram.buckets[i] += 1;
        }
    }
    histogram.buckets.back() += 1;
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    out << "# HELP calls_started_total Calls that reached the start handshake\n";
    out << "# TYPE calls_started_total counter\n";
    out << "calls_started_total " << calls_started_ << "\n";

    out << "# HELP calls_active Calls currently bridged\n";
    out << "# TYPE calls_active gauge\n";
    out << "calls_active " << calls_active_ << "\n";

    out << "# HELP vad_commits_total Caller turns committed to the AI session\n";
    out << "# TYPE vad_commits_total counter\n";
    out << "vad_commits_total " << vad_commits_ << "\n";

    out << "# HELP vad_discards_total Speech segments dropped below the minimums\n";
    out << "# TYPE vad_discards_total counter\n";
    out << "vad_discards_total " << vad_discards_ << "\n";

    out << "# HELP realtime_connect_failures_total Realtime sessions that could not be opened\n";
    out << "# TYPE realtime_connect_failures_total counter\n";
    out << "realtime_connect_failures_total " << connect_failures_ << "\n";

    out << "# HELP tool_calls_total Tool calls handled\n";
    out << "# TYPE tool_calls_total counter\n";
    for (const auto& item : tool_calls_) {
        out << "tool_calls_total{tool=\"" << item.first.first << "\",status=\""
            << item.first.second << "\"} " << item.second << "\n";
    }

    out << "# HELP tool_call_seconds Tool call handling time in seconds\n";
    out << "# TYPE tool_call_seconds histogram\n";
    for (const auto& item : tool_latency_) {
        const auto& tool = item.first;
        const auto& series = item.second;
        for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
            out << "tool_call_seconds_bucket{tool=\"" << tool
                << "\",le=\"" << histogram_bounds_[i] << "\"} "
                << series.buckets[i] << "\n";
        }
        out << "tool_call_seconds_bucket{tool=\"" << tool
            << "\",le=\"+Inf\"} " << series.buckets.back() << "\n";
        out << "tool_call_seconds_count{tool=\"" << tool << "\"} " << series.count << "\n";
        out << "tool_call_seconds_sum{tool=\"" << tool << "\"} " << series.sum << "\n";
    }

    return out.str();
}

}
