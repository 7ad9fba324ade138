#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace call_bridge {

class Metrics {
public:
    static Metrics& instance();

    void call_started();
    void call_finished();
    void vad_commit();
    void vad_discard();
    void realtime_connect_failure();
    void observe_tool_call(const std::string& tool, bool success, double seconds);
    std::string render_prometheus() const;

private:
    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    HistogramSeries& histogram_for(const std::string& tool);

    mutable std::mutex mutex_;
    uint64_t calls_started_ = 0;
    int64_t calls_active_ = 0;
    uint64_t vad_commits_ = 0;
    uint64_t vad_discards_ = 0;
    uint64_t connect_failures_ = 0;
    std::map<std::pair<std::string, std::string>, uint64_t> tool_calls_;
    std::map<std::string, HistogramSeries> tool_latency_;
    std::vector<double> histogram_bounds_;
};

}
