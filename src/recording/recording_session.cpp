#include "recording/recording_session.hpp"

#include <ctime>
#include <filesystem>
#include <iostream>

#include "core/time_utils.hpp"

namespace jugsync {

namespace fs = std::filesystem;

namespace {

int64_t toEpochMs(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromEpochNs(int64_t ns) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::nanoseconds(ns)));
}

std::string sessionIdFromDir(const std::string& dir) {
    fs::path p(dir);
    if (p.filename().empty()) {
        p = p.parent_path();
    }
    return p.filename().string();
}

}  // namespace

const char* recordingStateName(RecordingState state) {
    return state == RecordingState::Active ? "active" : "idle";
}

std::string makeSessionDirName(std::chrono::system_clock::time_point tp) {
    return "session_" + formatTimestampToken(tp);
}

RecordingSessionController::RecordingSessionController(std::string session_dir, std::vector<std::string> devices,
                                                       const RecordingConfig& config,
                                                       std::shared_ptr<IClipSinkFactory> factory, WallClock clock)
    : session_dir_(std::move(session_dir)),
      session_id_(sessionIdFromDir(session_dir_)),
      devices_(std::move(devices)),
      config_(config),
      factory_(factory ? std::move(factory) : std::make_shared<DefaultClipSinkFactory>(config)),
      clock_(clock ? std::move(clock) : WallClock([] { return std::chrono::system_clock::now(); })) {}

RecordingSessionController::~RecordingSessionController() {
    finalize();
}

std::optional<std::string> RecordingSessionController::activeToken() const {
    if (!active_.has_value()) {
        return std::nullopt;
    }
    return active_->context.token;
}

std::size_t RecordingSessionController::bufferedSamples(const std::string& device) const {
    if (!active_.has_value()) {
        return 0;
    }
    const auto it = active_->tracks.find(device);
    return it == active_->tracks.end() ? 0 : it->second.buffer.size();
}

std::string RecordingSessionController::allocateToken(std::chrono::system_clock::time_point tp) {
    const std::string base = formatTimestampToken(tp);
    std::string token = base;
    for (int n = 2; used_tokens_.count(token) != 0; ++n) {
        token = base + "_" + std::to_string(n);
    }
    used_tokens_.insert(token);
    return token;
}

bool RecordingSessionController::toggle(std::string& error) {
    if (state_ == RecordingState::Active) {
        stopClip(clock_());
        return true;
    }
    return startClip("manual", clock_(), error);
}

bool RecordingSessionController::writeBufferedClip(const std::string& kind, const std::vector<TimedFrame>& frames,
                                                   const std::vector<TelemetrySample>& samples, std::string& error) {
    if (state_ == RecordingState::Active) {
        error = "clip " + active_->context.token + " is already recording";
        return false;
    }
    if (frames.empty()) {
        error = "no buffered frames to write";
        return false;
    }
    if (!startClip(kind, fromEpochNs(frames.front().first), error)) {
        return false;
    }
    for (const auto& sample : samples) {
        onSample(sample);
    }
    for (const auto& frame : frames) {
        onFrame(frame.second);
    }
    stopClip(fromEpochNs(frames.back().first));
    return true;
}

bool RecordingSessionController::startClip(const std::string& kind, std::chrono::system_clock::time_point start,
                                           std::string& error) {
    std::error_code ec;
    fs::create_directories(session_dir_, ec);
    if (ec) {
        error = "cannot create session directory " + session_dir_ + ": " + ec.message();
        std::cerr << "recording: " << error << "\n";
        return false;
    }

    ActiveClip clip;
    clip.kind = kind;
    clip.context.session_id = session_id_;
    clip.context.start_time_ms = toEpochMs(start);
    clip.context.token = allocateToken(start);
    clip.context.clip_index = static_cast<int>(clips_.size()) + 1;

    clip.video_path = (fs::path(session_dir_) / (kind + "_" + clip.context.token + ".mp4")).string();
    std::string sink_error;
    clip.video = factory_->openVideo(clip.video_path, clip.context, sink_error);
    if (!clip.video) {
        clip.video_failed = true;
        clip.failures.push_back({"video", clip.video_path, sink_error});
        std::cerr << "recording: video sink failed for clip " << clip.context.token << ": " << sink_error << "\n";
    }

    for (const auto& device : devices_) {
        DeviceTrack track;
        track.path = (fs::path(session_dir_) / (device + "_" + clip.context.token + ".csv")).string();
        track.buffer.reserve(static_cast<std::size_t>(config_.flush_every));
        sink_error.clear();
        track.sink = factory_->openTelemetry(track.path, device, clip.context, sink_error);
        if (!track.sink) {
            track.failed = true;
            clip.failures.push_back({device, track.path, sink_error});
            std::cerr << "recording: telemetry sink for " << device << " failed: " << sink_error << "\n";
        }
        clip.tracks.emplace(device, std::move(track));
    }

    active_.emplace(std::move(clip));
    state_ = RecordingState::Active;
    std::cout << "recording: " << kind << " clip " << active_->context.clip_index << " started, token="
              << active_->context.token << " dir=" << session_dir_ << "\n";
    return true;
}

void RecordingSessionController::stopClip(std::chrono::system_clock::time_point stop) {
    if (!active_.has_value()) {
        state_ = RecordingState::Idle;
        return;
    }

    ActiveClip& clip = *active_;
    ClipSummary summary;
    summary.kind = clip.kind;
    summary.token = clip.context.token;
    summary.clip_index = clip.context.clip_index;
    summary.start_time_ms = clip.context.start_time_ms;
    summary.video_path = clip.video_path;

    for (auto& entry : clip.tracks) {
        DeviceTrack& track = entry.second;
        flushTrack(entry.first, track);
        if (!track.failed && track.sink) {
            std::string error;
            if (!track.sink->close(error)) {
                failTrack(entry.first, track, error);
            }
        }
        summary.telemetry_paths[entry.first] = track.path;
        summary.samples_per_device[entry.first] = track.sink ? track.sink->sampleCount() : 0;
    }

    if (clip.video) {
        summary.frames = clip.video->frameCount();
        if (!clip.video_failed) {
            std::string error;
            if (!clip.video->close(error)) {
                failVideo(error);
            }
        }
    }

    summary.failures = clip.failures;
    summary.stop_time_ms = toEpochMs(stop);

    std::cout << "recording: clip " << summary.clip_index << " stopped, token=" << summary.token
              << " frames=" << summary.frames;
    for (const auto& entry : summary.samples_per_device) {
        std::cout << " " << entry.first << "=" << entry.second;
    }
    if (!summary.failures.empty()) {
        std::cout << " failed_sinks=" << summary.failures.size();
    }
    std::cout << "\n";

    clips_.push_back(std::move(summary));
    active_.reset();
    state_ = RecordingState::Idle;
}

void RecordingSessionController::onSample(const TelemetrySample& sample) {
    if (!active_.has_value()) {
        return;
    }
    auto it = active_->tracks.find(sample.device);
    if (it == active_->tracks.end() || it->second.failed) {
        return;
    }
    DeviceTrack& track = it->second;
    track.buffer.push_back(sample);
    if (track.buffer.size() >= static_cast<std::size_t>(config_.flush_every)) {
        flushTrack(it->first, track);
    }
}

void RecordingSessionController::onFrame(const cv::Mat& frame_bgr) {
    if (!active_.has_value() || active_->video_failed || !active_->video) {
        return;
    }
    std::string error;
    if (!active_->video->write(frame_bgr, error)) {
        failVideo(error);
    }
}

void RecordingSessionController::finalize() {
    if (state_ == RecordingState::Active) {
        stopClip(clock_());
    }
}

void RecordingSessionController::flushTrack(const std::string& device, DeviceTrack& track) {
    if (track.failed || track.buffer.empty() || !track.sink) {
        track.buffer.clear();
        return;
    }
    std::string error;
    if (!track.sink->writeSamples(track.buffer, error)) {
        failTrack(device, track, error);
    }
    track.buffer.clear();
}

void RecordingSessionController::failTrack(const std::string& device, DeviceTrack& track, const std::string& error) {
    track.failed = true;
    track.buffer.clear();
    if (track.sink) {
        std::string close_error;
        if (!track.sink->close(close_error)) {
            std::cerr << "recording: closing failed sink " << track.path << ": " << close_error << "\n";
        }
    }
    active_->failures.push_back({device, track.path, error});
    std::cerr << "recording: telemetry sink for " << device << " failed, excluded from clip: " << error << "\n";
}

void RecordingSessionController::failVideo(const std::string& error) {
    active_->video_failed = true;
    if (active_->video) {
        std::string close_error;
        if (!active_->video->close(close_error)) {
            std::cerr << "recording: closing failed video sink: " << close_error << "\n";
        }
    }
    active_->failures.push_back({"video", active_->video_path, error});
    std::cerr << "recording: video sink failed, excluded from clip: " << error << "\n";
}

}  // namespace jugsync
