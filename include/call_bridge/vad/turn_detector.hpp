#pragma once

#include <functional>

#include "call_bridge/config.hpp"

namespace call_bridge {
namespace vad {

struct SegmentStats {
    int active_speech_frames = 0;
    int frames_since_commit = 0;
    double average_energy = 0.0;
    bool forced = false;
};

// Energy based turn-taking over fixed-size frames. Callbacks run synchronously
// inside process_frame.
class TurnDetector {
public:
    using SpeechStartCallback = std::function<void()>;
    using SegmentCallback = std::function<void(const SegmentStats&)>;

    explicit TurnDetector(VadConfig config);

    void set_on_speech_start(SpeechStartCallback cb);
    void set_on_commit(SegmentCallback cb);
    void set_on_discard(SegmentCallback cb);

    void process_frame(double energy);
    void reset();

    bool speaking() const { return speaking_; }
    int active_speech_frames() const { return active_speech_frames_; }
    int consecutive_silence_frames() const { return consecutive_silence_frames_; }
    int frames_since_commit() const { return frames_since_commit_; }

private:
    void count_active(double energy);
    void evaluate_segment(bool forced);
    void fire_speech_start();

    VadConfig config_;

    bool speaking_ = false;
    int consecutive_silence_frames_ = 0;
    int active_speech_frames_ = 0;
    double cumulative_energy_ = 0.0;
    int frames_since_commit_ = 0;

    SpeechStartCallback on_speech_start_;
    SegmentCallback on_commit_;
    SegmentCallback on_discard_;
};

}
}
