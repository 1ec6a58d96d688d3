#include "recording/stillness_recorder.hpp"

#include "core/time_utils.hpp"

#include <filesystem>
#include <iostream>
#include <map>

namespace {

struct SinkLog {
    std::map<std::string, uint64_t> frames;                                // by path
    std::map<std::string, std::vector<jugsync::TelemetrySample>> samples;  // by path
};

class CountingVideoSink : public jugsync::IVideoSink {
public:
    CountingVideoSink(std::string path, SinkLog& log) : path_(std::move(path)), log_(log) {}

    bool write(const cv::Mat&, std::string&) override {
        log_.frames[path_] = ++frames_;
        return true;
    }
    bool close(std::string&) override { return true; }
    const std::string& path() const override { return path_; }
    uint64_t frameCount() const override { return frames_; }

private:
    std::string path_;
    SinkLog& log_;
    uint64_t frames_{0};
};

class CollectingTelemetrySink : public jugsync::ITelemetrySink {
public:
    CollectingTelemetrySink(std::string path, SinkLog& log) : path_(std::move(path)), log_(log) {}

    bool writeSamples(const std::vector<jugsync::TelemetrySample>& samples, std::string&) override {
        auto& out = log_.samples[path_];
        out.insert(out.end(), samples.begin(), samples.end());
        count_ += samples.size();
        return true;
    }
    bool close(std::string&) override { return true; }
    const std::string& path() const override { return path_; }
    uint64_t sampleCount() const override { return count_; }

private:
    std::string path_;
    SinkLog& log_;
    uint64_t count_{0};
};

class MemoryFactory : public jugsync::IClipSinkFactory {
public:
    explicit MemoryFactory(SinkLog& log) : log_(log) {}

    std::unique_ptr<jugsync::IVideoSink> openVideo(const std::string& path, const jugsync::ClipContext&,
                                                   std::string&) override {
        return std::make_unique<CountingVideoSink>(path, log_);
    }
    std::unique_ptr<jugsync::ITelemetrySink> openTelemetry(const std::string& path, const std::string&,
                                                           const jugsync::ClipContext&, std::string&) override {
        return std::make_unique<CollectingTelemetrySink>(path, log_);
    }

private:
    SinkLog& log_;
};

constexpr int64_t kMs = 1000000LL;
constexpr int64_t kBaseNs = 1700000000LL * 1000000000LL;

// 10 fps frames and 20 Hz samples over [0, end_ms]. The scene is dark until
// 1.0 s, flickers until 1.4 s, then holds bright from 1.4 s on.
void playScene(jugsync::StillnessRecorder& recorder, int64_t end_ms) {
    const cv::Mat dark(32, 32, CV_8UC3, cv::Scalar::all(0));
    const cv::Mat bright(32, 32, CV_8UC3, cv::Scalar::all(255));
    for (int64_t t = 0; t <= end_ms; t += 50) {
        jugsync::TelemetrySample sample;
        sample.device = "left";
        sample.timestamp_ns = kBaseNs + t * kMs;
        sample.sequence = static_cast<uint64_t>(t / 50);
        recorder.onSample(sample);
        if (t % 100 != 0) {
            continue;
        }
        const bool lit = t >= 1000 && (t >= 1400 || (t / 100) % 2 == 0);
        recorder.onFrame(lit ? bright : dark, kBaseNs + t * kMs);
    }
}

}  // namespace

int main() {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "jugsync_test_stillness_recorder";
    std::error_code ec;
    fs::remove_all(dir, ec);

    jugsync::MotionConfig motion;
    motion.motion_threshold = 500.0;
    motion.stillness_threshold = 100.0;
    motion.stillness_duration_s = 0.45;
    motion.record_duration_s = 1.0;
    motion.blur_kernel = 1;

    jugsync::RecordingConfig recording;
    recording.flush_every = 4;
    const auto fixed = std::chrono::system_clock::from_time_t(1700000000);
    jugsync::WallClock clock = [fixed] { return fixed; };

    {
        SinkLog log;
        jugsync::RecordingSessionController controller((dir / "session_auto").string(), {"left"}, recording,
                                                       std::make_shared<MemoryFactory>(log), clock);
        std::string error;
        if (controller.writeBufferedClip("auto", {}, {}, error) || error.empty()) {
            std::cerr << "an empty buffered clip must be refused\n";
            return 1;
        }

        jugsync::StillnessRecorder recorder(motion, 10.0, controller);
        playScene(recorder, 3000);

        if (recorder.clipsWritten() != 1U || controller.clips().size() != 1U) {
            std::cerr << "one still period should write exactly one auto clip, wrote " << recorder.clipsWritten()
                      << "\n";
            return 1;
        }
        if (controller.state() != jugsync::RecordingState::Idle) {
            std::cerr << "auto clip must leave the controller idle\n";
            return 1;
        }

        // The first unchanged frame is at 1.5 s, so the clip spans [0.5 s, 1.5 s].
        const jugsync::ClipSummary& clip = controller.clips()[0];
        const std::string token = jugsync::formatTimestampToken(fixed + std::chrono::milliseconds(500));
        const std::string video = (dir / "session_auto" / ("auto_" + token + ".mp4")).string();
        if (clip.kind != "auto" || clip.token != token || clip.video_path != video) {
            std::cerr << "auto clip should be named auto_<token>.mp4, got " << clip.video_path << "\n";
            return 1;
        }
        if (clip.frames != 11U || log.frames[video] != 11U) {
            std::cerr << "clip should hold the 11 frames of [0.5 s, 1.5 s], got " << clip.frames << "\n";
            return 1;
        }
        const auto& samples = log.samples[clip.telemetry_paths.at("left")];
        if (clip.samples_per_device.at("left") != 21U || samples.size() != 21U ||
            samples.front().timestamp_ns != kBaseNs + 500 * kMs ||
            samples.back().timestamp_ns != kBaseNs + 1500 * kMs) {
            std::cerr << "clip should hold the 21 samples of the same window\n";
            return 1;
        }
        if (clip.start_time_ms != 1700000000500LL || clip.stop_time_ms != 1700000001500LL) {
            std::cerr << "clip times should follow the buffered frames\n";
            return 1;
        }
        if (recorder.bufferedFrames() == 0U || recorder.bufferedFrames() > 42U) {
            std::cerr << "frame buffer should stay within its capacity\n";
            return 1;
        }
    }

    // A trigger during a manual clip is skipped, the manual clip is untouched.
    {
        SinkLog log;
        jugsync::RecordingSessionController controller((dir / "session_manual").string(), {"left"}, recording,
                                                       std::make_shared<MemoryFactory>(log), clock);
        std::string error;
        if (!controller.toggle(error)) {
            std::cerr << "manual clip should start: " << error << "\n";
            return 1;
        }
        jugsync::StillnessRecorder recorder(motion, 10.0, controller);
        playScene(recorder, 3000);
        if (recorder.clipsWritten() != 0U || recorder.triggersSkipped() != 1U ||
            controller.state() != jugsync::RecordingState::Active) {
            std::cerr << "stillness during a manual clip must not write an auto clip\n";
            return 1;
        }
        controller.finalize();
        if (controller.clips().size() != 1U || controller.clips()[0].kind != "manual") {
            std::cerr << "only the manual clip should be recorded\n";
            return 1;
        }
    }

    fs::remove_all(dir, ec);
    return 0;
}
