#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <opencv2/core.hpp>

#include "core/config.hpp"
#include "core/types.hpp"
#include "recording/clip_sinks.hpp"

namespace jugsync {

enum class RecordingState {
    Idle,
    Active,
};

const char* recordingStateName(RecordingState state);

struct SinkFailure {
    std::string sink;  // "video" or the device name
    std::string path;
    std::string error;
};

struct ClipSummary {
    std::string kind;  // file prefix: "manual" or "auto"
    std::string token;
    int clip_index{0};
    std::string video_path;
    uint64_t frames{0};
    std::map<std::string, std::string> telemetry_paths;
    std::map<std::string, uint64_t> samples_per_device;
    std::vector<SinkFailure> failures;
    int64_t start_time_ms{0};
    int64_t stop_time_ms{0};
};

using WallClock = std::function<std::chrono::system_clock::time_point()>;
using TimedFrame = std::pair<int64_t, cv::Mat>;  // wall-clock ns, BGR

std::string makeSessionDirName(std::chrono::system_clock::time_point tp);

// Manual start/stop recording and buffered (auto) clips. Every file of one
// clip shares a timestamp token:
//   <session_dir>/<kind>_<token>.mp4
//   <session_dir>/<device>_<token>.csv
// Only the consumer thread touches the controller.
class RecordingSessionController {
public:
    RecordingSessionController(std::string session_dir, std::vector<std::string> devices,
                               const RecordingConfig& config,
                               std::shared_ptr<IClipSinkFactory> factory = nullptr,
                               WallClock clock = WallClock{});
    ~RecordingSessionController();

    RecordingSessionController(const RecordingSessionController&) = delete;
    RecordingSessionController& operator=(const RecordingSessionController&) = delete;

    // Idle -> Active opens a new clip; Active -> Idle closes it. Returns false
    // only when a clip cannot start at all (session directory unusable).
    bool toggle(std::string& error);
    void onSample(const TelemetrySample& sample);
    void onFrame(const cv::Mat& frame_bgr);
    // Closes an active clip. Safe to call any number of times.
    void finalize();

    // Writes a complete clip from already-captured media in one call. The
    // token comes from the first frame's time. Fails while a manual clip is
    // active or when frames is empty.
    bool writeBufferedClip(const std::string& kind, const std::vector<TimedFrame>& frames,
                           const std::vector<TelemetrySample>& samples, std::string& error);

    RecordingState state() const { return state_; }
    const std::string& sessionDir() const { return session_dir_; }
    const std::string& sessionId() const { return session_id_; }
    std::optional<std::string> activeToken() const;
    const std::vector<ClipSummary>& clips() const { return clips_; }
    std::size_t bufferedSamples(const std::string& device) const;

private:
    struct DeviceTrack {
        std::unique_ptr<ITelemetrySink> sink;
        std::string path;
        std::vector<TelemetrySample> buffer;
        bool failed{false};
    };

    struct ActiveClip {
        std::string kind;
        ClipContext context;
        std::unique_ptr<IVideoSink> video;
        std::string video_path;
        bool video_failed{false};
        std::map<std::string, DeviceTrack> tracks;
        std::vector<SinkFailure> failures;
    };

    std::string allocateToken(std::chrono::system_clock::time_point tp);
    bool startClip(const std::string& kind, std::chrono::system_clock::time_point start, std::string& error);
    void stopClip(std::chrono::system_clock::time_point stop);
    void flushTrack(const std::string& device, DeviceTrack& track);
    void failTrack(const std::string& device, DeviceTrack& track, const std::string& error);
    void failVideo(const std::string& error);

    std::string session_dir_;
    std::string session_id_;
    std::vector<std::string> devices_;
    RecordingConfig config_;
    std::shared_ptr<IClipSinkFactory> factory_;
    WallClock clock_;

    RecordingState state_{RecordingState::Idle};
    std::optional<ActiveClip> active_;
    std::set<std::string> used_tokens_;
    std::vector<ClipSummary> clips_;
};

}  // namespace jugsync
