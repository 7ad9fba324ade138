#include "call_bridge/vad/turn_detector.hpp"

#include <utility>

namespace call_bridge {
namespace vad {

TurnDetector::TurnDetector(VadConfig config)
    : config_(std::move(config)) {
    config_.validate();
}

void TurnDetector::set_on_speech_start(SpeechStartCallback cb) {
    on_speech_start_ = std::move(cb);
}

void TurnDetector::set_on_commit(SegmentCallback cb) {
    on_commit_ = std::move(cb);
}

void TurnDetector::set_on_discard(SegmentCallback cb) {
    on_discard_ = std::move(cb);
}

void TurnDetector::process_frame(double energy) {
    if (!speaking_) {
        if (energy < config_.speech_threshold) {
            return;
        }
        speaking_ = true;
        frames_since_commit_ = 1;
        count_active(energy);
        fire_speech_start();
        return;
    }

    ++frames_since_commit_;
    if (energy >= config_.silence_threshold) {
        count_active(energy);
    } else {
        ++consecutive_silence_frames_;
    }

    if (consecutive_silence_frames_ >= config_.silence_frames_to_commit) {
        evaluate_segment(false);
    } else if (frames_since_commit_ >= config_.max_segment_frames) {
        evaluate_segment(true);
    }
}

void TurnDetector::reset() {
    speaking_ = false;
    consecutive_silence_frames_ = 0;
    active_speech_frames_ = 0;
    cumulative_energy_ = 0.0;
    frames_since_commit_ = 0;
}

void TurnDetector::count_active(double energy) {
    ++active_speech_frames_;
    cumulative_energy_ += energy;
    consecutive_silence_frames_ = 0;
}

void TurnDetector::evaluate_segment(bool forced) {
    SegmentStats stats;
    stats.active_speech_frames = active_speech_frames_;
    stats.frames_since_commit = frames_since_commit_;
    stats.average_energy = active_speech_frames_ > 0
                               ? cumulative_energy_ / active_speech_frames_
                               : 0.0;
    stats.forced = forced;

    const bool accepted = stats.active_speech_frames >= config_.min_speech_frames &&
                          stats.average_energy >= config_.min_average_energy;
    reset();

    if (accepted) {
        if (on_commit_) {
            on_commit_(stats);
        }
    } else if (on_discard_) {
        on_discard_(stats);
    }
}

void TurnDetector::fire_speech_start() {
    if (on_speech_start_) {
        on_speech_start_();
    }
}

}
}
