#include "recording/stillness_recorder.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace jugsync {

namespace {

constexpr double kBufferMarginS = 2.0;
constexpr double kFrameHeadroom = 1.2;
// Combined IMU rate of all devices stays well under this.
constexpr double kMaxSampleRateHz = 1000.0;

int64_t secondsToNs(double s) {
    return static_cast<int64_t>(std::llround(s * 1e9));
}

}  // namespace

StillnessRecorder::StillnessRecorder(const MotionConfig& config, double fps, RecordingSessionController& controller)
    : config_(config),
      controller_(controller),
      detector_(config),
      frames_(secondsToNs(config.record_duration_s + config.stillness_duration_s + kBufferMarginS),
              static_cast<std::size_t>(std::ceil((config.record_duration_s + config.stillness_duration_s +
                                                  kBufferMarginS) * std::max(1.0, fps) * kFrameHeadroom))),
      samples_(secondsToNs(config.record_duration_s + config.stillness_duration_s + kBufferMarginS),
               static_cast<std::size_t>(std::ceil((config.record_duration_s + config.stillness_duration_s +
                                                   kBufferMarginS) * kMaxSampleRateHz))) {}

MotionReading StillnessRecorder::onFrame(const cv::Mat& frame_bgr, int64_t timestamp_ns) {
    frames_.push(timestamp_ns, frame_bgr.clone());
    const MotionReading reading = detector_.update(frame_bgr, timestamp_ns);
    if (reading.triggered) {
        writeClip(reading.stillness_start_ns);
    }
    return reading;
}

void StillnessRecorder::onSample(const TelemetrySample& sample) {
    samples_.push(sample.timestamp_ns, sample);
}

void StillnessRecorder::writeClip(int64_t stillness_start_ns) {
    if (controller_.state() == RecordingState::Active) {
        triggers_skipped_ += 1;
        std::cout << "motion: stillness detected during a manual clip, auto clip skipped\n";
        return;
    }

    const int64_t start_ns = stillness_start_ns - secondsToNs(config_.record_duration_s);
    std::vector<TimedFrame> frames = frames_.between(start_ns, stillness_start_ns);
    std::vector<TelemetrySample> samples;
    for (auto& entry : samples_.between(start_ns, stillness_start_ns)) {
        samples.push_back(std::move(entry.second));
    }

    std::cout << "motion: stillness detected, writing " << frames.size() << " frames / " << samples.size()
              << " samples\n";
    std::string error;
    if (!controller_.writeBufferedClip("auto", frames, samples, error)) {
        triggers_skipped_ += 1;
        std::cerr << "motion: auto clip not written: " << error << "\n";
        return;
    }
    clips_written_ += 1;
}

}  // namespace jugsync
