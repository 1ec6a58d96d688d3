#pragma once

#include <cstdint>

#include <opencv2/core.hpp>

#include "core/config.hpp"
#include "core/timed_ring_buffer.hpp"
#include "core/types.hpp"
#include "motion/motion_detector.hpp"
#include "recording/recording_session.hpp"

namespace jugsync {

// Buffers recent frames and samples and, when the scene comes to rest after
// motion, hands the record_duration_s before the rest to the controller as an
// "auto" clip. Buffers hold record + stillness + 2 s.
class StillnessRecorder {
public:
    StillnessRecorder(const MotionConfig& config, double fps, RecordingSessionController& controller);

    // frame_bgr is copied into the buffer.
    MotionReading onFrame(const cv::Mat& frame_bgr, int64_t timestamp_ns);
    void onSample(const TelemetrySample& sample);

    std::size_t bufferedFrames() const { return frames_.size(); }
    std::size_t bufferedSamples() const { return samples_.size(); }
    uint64_t clipsWritten() const { return clips_written_; }
    uint64_t triggersSkipped() const { return triggers_skipped_; }
    const MotionDetector& detector() const { return detector_; }

private:
    void writeClip(int64_t stillness_start_ns);

    MotionConfig config_;
    RecordingSessionController& controller_;
    MotionDetector detector_;
    TimedRingBuffer<cv::Mat> frames_;
    TimedRingBuffer<TelemetrySample> samples_;
    uint64_t clips_written_{0};
    uint64_t triggers_skipped_{0};
};

}  // namespace jugsync
