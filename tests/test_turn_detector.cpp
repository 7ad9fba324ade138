#include <catch2/catch_test_macros.hpp>

#include "call_bridge/vad/turn_detector.hpp"

#include <stdexcept>
#include <vector>

using namespace call_bridge;

namespace {

struct Recorder {
    int starts = 0;
    std::vector<vad::SegmentStats> commits;
    std::vector<vad::SegmentStats> discards;

    void attach(vad::TurnDetector& detector) {
        detector.set_on_speech_start([this]() { ++starts; });
        detector.set_on_commit([this](const vad::SegmentStats& stats) { commits.push_back(stats); });
        detector.set_on_discard([this](const vad::SegmentStats& stats) { discards.push_back(stats); });
    }
};

void feed(vad::TurnDetector& detector, double energy, int frames) {
    for (int i = 0; i < frames; ++i) {
        detector.process_frame(energy);
    }
}

}

TEST_CASE("silent stream never commits") {
    vad::TurnDetector detector(VadConfig{});
    Recorder recorder;
    recorder.attach(detector);

    feed(detector, 0.0, 2000);
    feed(detector, 0.01, 2000);

    REQUIRE(recorder.starts == 0);
    REQUIRE(recorder.commits.empty());
    REQUIRE(recorder.discards.empty());
    REQUIRE_FALSE(detector.speaking());
}

TEST_CASE("energy between the thresholds never starts speech") {
    vad::TurnDetector detector(VadConfig{});
    Recorder recorder;
    recorder.attach(detector);

    feed(detector, 0.02, 2000);

    REQUIRE(recorder.starts == 0);
    REQUIRE(recorder.commits.empty());
    REQUIRE(recorder.discards.empty());
    REQUIRE_FALSE(detector.speaking());
}

TEST_CASE("energy between the thresholds keeps an ongoing turn alive") {
    vad::TurnDetector detector(VadConfig{});
    Recorder recorder;
    recorder.attach(detector);

    feed(detector, 0.1, 10);
    feed(detector, 0.02, 40);

    REQUIRE(detector.speaking());
    REQUIRE(detector.consecutive_silence_frames() == 0);
    REQUIRE(detector.active_speech_frames() == 50);
    REQUIRE(recorder.commits.empty());
    REQUIRE(recorder.discards.empty());
}

TEST_CASE("speech followed by enough silence commits once") {
    vad::TurnDetector detector(VadConfig{});
    Recorder recorder;
    recorder.attach(detector);

    feed(detector, 0.1, 10);
    REQUIRE(detector.speaking());
    feed(detector, 0.0, 24);
    REQUIRE(recorder.commits.empty());
    feed(detector, 0.0, 1);

    REQUIRE(recorder.starts == 1);
    REQUIRE(recorder.commits.size() == 1);
    REQUIRE(recorder.commits[0].active_speech_frames == 10);
    REQUIRE_FALSE(recorder.commits[0].forced);
    REQUIRE(recorder.discards.empty());

    feed(detector, 0.0, 500);
    REQUIRE(recorder.commits.size() == 1);
}

TEST_CASE("counters reset after a commit") {
    vad::TurnDetector detector(VadConfig{});
    feed(detector, 0.1, 10);
    feed(detector, 0.0, 25);

    REQUIRE_FALSE(detector.speaking());
    REQUIRE(detector.active_speech_frames() == 0);
    REQUIRE(detector.consecutive_silence_frames() == 0);
    REQUIRE(detector.frames_since_commit() == 0);
}

TEST_CASE("short burst is discarded") {
    vad::TurnDetector detector(VadConfig{});
    Recorder recorder;
    recorder.attach(detector);

    feed(detector, 0.2, 3);
    feed(detector, 0.0, 25);

    REQUIRE(recorder.commits.empty());
    REQUIRE(recorder.discards.size() == 1);
    REQUIRE(recorder.discards[0].active_speech_frames == 3);
}

TEST_CASE("quiet speech below the average energy floor is discarded") {
    vad::TurnDetector detector(VadConfig{});
    Recorder recorder;
    recorder.attach(detector);

    feed(detector, 0.031, 1);
    feed(detector, 0.02, 20);
    feed(detector, 0.0, 25);

    REQUIRE(recorder.commits.empty());
    REQUIRE(recorder.discards.size() == 1);
}

TEST_CASE("silence between words resets the silence counter") {
    vad::TurnDetector detector(VadConfig{});
    Recorder recorder;
    recorder.attach(detector);

    feed(detector, 0.1, 10);
    feed(detector, 0.0, 20);
    feed(detector, 0.1, 5);
    feed(detector, 0.0, 20);
    REQUIRE(recorder.commits.empty());
    feed(detector, 0.0, 5);

    REQUIRE(recorder.starts == 1);
    REQUIRE(recorder.commits.size() == 1);
    REQUIRE(recorder.commits[0].active_speech_frames == 15);
}

TEST_CASE("continuous speech is force committed at the segment ceiling") {
    vad::TurnDetector detector(VadConfig{});
    Recorder recorder;
    recorder.attach(detector);

    feed(detector, 0.05, 1000);

    REQUIRE(recorder.commits.size() == 1);
    REQUIRE(recorder.commits[0].forced);
    REQUIRE(recorder.commits[0].frames_since_commit == 750);
    REQUIRE(recorder.starts == 2);
}

TEST_CASE("reset clears state without callbacks") {
    vad::TurnDetector detector(VadConfig{});
    Recorder recorder;
    recorder.attach(detector);

    feed(detector, 0.1, 30);
    detector.reset();
    feed(detector, 0.0, 100);

    REQUIRE_FALSE(detector.speaking());
    REQUIRE(recorder.commits.empty());
    REQUIRE(recorder.discards.empty());
}

TEST_CASE("invalid thresholds are rejected") {
    VadConfig config;
    config.silence_threshold = 0.05;
    config.speech_threshold = 0.03;
    REQUIRE_THROWS_AS(vad::TurnDetector(config), std::runtime_error);
}
