#include "recording/clip_sinks.hpp"

#include <iomanip>
#include <iostream>
#include <ostream>

#include <opencv2/imgproc.hpp>

namespace jugsync {

namespace {

int fourccFromString(const std::string& code) {
    if (code.size() != 4) {
        return cv::VideoWriter::fourcc('m', 'p', '4', 'v');
    }
    return cv::VideoWriter::fourcc(code[0], code[1], code[2], code[3]);
}

// Epoch seconds with all nine fractional digits; a double cannot hold epoch nanoseconds.
void writeEpochSeconds(std::ostream& out, int64_t timestamp_ns) {
    const char fill = out.fill();
    out << (timestamp_ns / 1000000000LL) << '.' << std::setw(9) << std::setfill('0')
        << (timestamp_ns % 1000000000LL) << std::setfill(fill);
}

}  // namespace

OpenCvVideoSink::OpenCvVideoSink(std::string path, double fps, const std::string& fourcc)
    : path_(std::move(path)), fps_(fps), fourcc_(fourccFromString(fourcc)) {}

OpenCvVideoSink::~OpenCvVideoSink() {
    if (writer_.isOpened()) {
        writer_.release();
    }
}

bool OpenCvVideoSink::write(const cv::Mat& frame_bgr, std::string& error) {
    if (frame_bgr.empty()) {
        return true;
    }

    try {
        if (!writer_.isOpened()) {
            size_ = frame_bgr.size();
            if (!writer_.open(path_, fourcc_, fps_, size_, frame_bgr.channels() == 3)) {
                error = "cannot open video writer for " + path_;
                return false;
            }
        }

        if (frame_bgr.size() != size_) {
            cv::Mat resized;
            cv::resize(frame_bgr, resized, size_);
            writer_.write(resized);
        } else {
            writer_.write(frame_bgr);
        }
    } catch (const cv::Exception& e) {
        error = "video write failed for " + path_ + ": " + e.what();
        return false;
    }
    frames_ += 1;
    return true;
}

bool OpenCvVideoSink::close(std::string& error) {
    try {
        if (writer_.isOpened()) {
            writer_.release();
        }
    } catch (const cv::Exception& e) {
        error = "video finalize failed for " + path_ + ": " + e.what();
        return false;
    }
    return true;
}

CsvTelemetrySink::CsvTelemetrySink(std::string path, std::string device)
    : path_(std::move(path)), device_(std::move(device)) {}

CsvTelemetrySink::~CsvTelemetrySink() {
    if (out_.is_open()) {
        out_.close();
    }
}

bool CsvTelemetrySink::open(const ClipContext& clip, std::string& error) {
    out_.open(path_, std::ios::out | std::ios::trunc);
    if (!out_.is_open()) {
        error = "cannot open telemetry file " + path_;
        return false;
    }
    out_ << "# Session ID: " << clip.session_id << "\n"
         << "# Device ID: " << device_ << "\n"
         << "# Clip: " << clip.token << "\n"
         << "# Start Time: " << clip.start_time_ms << "\n"
         << kColumns << "\n";
    out_.flush();
    if (!out_) {
        error = "cannot write header to " + path_;
        return false;
    }
    return true;
}

bool CsvTelemetrySink::writeSamples(const std::vector<TelemetrySample>& samples, std::string& error) {
    if (!out_.is_open()) {
        error = "telemetry file not open: " + path_;
        return false;
    }

    out_ << std::setprecision(9);
    for (const auto& s : samples) {
        writeEpochSeconds(out_, s.timestamp_ns);
        out_ << ','
             << s.accel[0] << ',' << s.accel[1] << ',' << s.accel[2] << ','
             << s.gyro[0] << ',' << s.gyro[1] << ',' << s.gyro[2] << ','
             << s.accel_magnitude << ',' << s.gyro_magnitude << ','
             << s.device_timestamp_ns << ',' << s.sequence << ',' << s.device << "\n";
    }
    out_.flush();
    if (!out_) {
        error = "write failed for " + path_;
        return false;
    }
    samples_ += samples.size();
    return true;
}

bool CsvTelemetrySink::close(std::string& error) {
    if (!out_.is_open()) {
        return true;
    }
    out_ << "# Sample Count: " << samples_ << "\n";
    out_.flush();
    const bool ok = static_cast<bool>(out_);
    out_.close();
    if (!ok) {
        error = "cannot finalize " + path_;
    }
    return ok;
}

DefaultClipSinkFactory::DefaultClipSinkFactory(const RecordingConfig& config)
    : config_(config) {}

std::unique_ptr<IVideoSink> DefaultClipSinkFactory::openVideo(const std::string& path, const ClipContext&,
                                                              std::string&) {
    return std::make_unique<OpenCvVideoSink>(path, config_.video_fps, config_.video_fourcc);
}

std::unique_ptr<ITelemetrySink> DefaultClipSinkFactory::openTelemetry(const std::string& path,
                                                                      const std::string& device,
                                                                      const ClipContext& clip,
                                                                      std::string& error) {
    auto sink = std::make_unique<CsvTelemetrySink>(path, device);
    if (!sink->open(clip, error)) {
        return nullptr;
    }
    return sink;
}

}  // namespace jugsync
