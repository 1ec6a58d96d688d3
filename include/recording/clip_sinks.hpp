#pragma once

#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include "core/config.hpp"
#include "core/types.hpp"

namespace jugsync {

struct ClipContext {
    std::string session_id;
    std::string token;
    int clip_index{0};
    int64_t start_time_ms{0};
};

class IVideoSink {
public:
    virtual ~IVideoSink() = default;
    virtual bool write(const cv::Mat& frame_bgr, std::string& error) = 0;
    virtual bool close(std::string& error) = 0;
    virtual const std::string& path() const = 0;
    virtual uint64_t frameCount() const = 0;
};

class ITelemetrySink {
public:
    virtual ~ITelemetrySink() = default;
    // Writes and flushes one batch.
    virtual bool writeSamples(const std::vector<TelemetrySample>& samples, std::string& error) = 0;
    virtual bool close(std::string& error) = 0;
    virtual const std::string& path() const = 0;
    virtual uint64_t sampleCount() const = 0;
};

class IClipSinkFactory {
public:
    virtual ~IClipSinkFactory() = default;
    virtual std::unique_ptr<IVideoSink> openVideo(const std::string& path, const ClipContext& clip,
                                                  std::string& error) = 0;
    virtual std::unique_ptr<ITelemetrySink> openTelemetry(const std::string& path, const std::string& device,
                                                          const ClipContext& clip, std::string& error) = 0;
};

// cv::VideoWriter opened lazily with the first frame's size.
class OpenCvVideoSink : public IVideoSink {
public:
    OpenCvVideoSink(std::string path, double fps, const std::string& fourcc);
    ~OpenCvVideoSink() override;

    bool write(const cv::Mat& frame_bgr, std::string& error) override;
    bool close(std::string& error) override;
    const std::string& path() const override { return path_; }
    uint64_t frameCount() const override { return frames_; }

private:
    std::string path_;
    double fps_;
    int fourcc_;
    cv::Size size_;
    cv::VideoWriter writer_;
    uint64_t frames_{0};
};

class CsvTelemetrySink : public ITelemetrySink {
public:
    static constexpr const char* kColumns =
        "timestamp,accel_x,accel_y,accel_z,gyro_x,gyro_y,gyro_z,accel_magnitude,gyro_magnitude,"
        "device_timestamp_ns,sequence,watch_name";

    CsvTelemetrySink(std::string path, std::string device);
    ~CsvTelemetrySink() override;

    bool open(const ClipContext& clip, std::string& error);
    bool writeSamples(const std::vector<TelemetrySample>& samples, std::string& error) override;
    bool close(std::string& error) override;
    const std::string& path() const override { return path_; }
    uint64_t sampleCount() const override { return samples_; }

private:
    std::string path_;
    std::string device_;
    std::ofstream out_;
    uint64_t samples_{0};
};

class DefaultClipSinkFactory : public IClipSinkFactory {
public:
    explicit DefaultClipSinkFactory(const RecordingConfig& config);

    std::unique_ptr<IVideoSink> openVideo(const std::string& path, const ClipContext& clip,
                                          std::string& error) override;
    std::unique_ptr<ITelemetrySink> openTelemetry(const std::string& path, const std::string& device,
                                                  const ClipContext& clip, std::string& error) override;

private:
    RecordingConfig config_;
};

}  // namespace jugsync
