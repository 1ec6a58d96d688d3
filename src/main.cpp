#include "calibration/ball_identifier.hpp"
#include "calibration/ball_profile.hpp"
#include "calibration/ball_profile_store.hpp"
#include "calibration/roi_calibrator.hpp"
#include "camera/camera_calibration.hpp"
#include "camera/capture_watchdog.hpp"
#include "camera/video_frame_source.hpp"
#include "core/config.hpp"
#include "core/time_utils.hpp"
#include "display/overlay_renderer.hpp"
#include "pose/pose_detector.hpp"
#include "recording/recording_session.hpp"
#include "recording/stillness_recorder.hpp"
#include "stream/device_stream_manager.hpp"

#include <atomic>
#include <algorithm>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <getopt.h>

#include <opencv2/highgui.hpp>

#ifdef __linux__
#include <poll.h>
#include <unistd.h>
#endif

namespace {

std::atomic<bool> g_running{true};

void onSignal(int) {
    g_running.store(false);
}

constexpr char kDefaultConfigPath[] = "config/config.yaml";
constexpr char kRecordWindow[] = "jugsync record";
constexpr char kCalibrateWindow[] = "jugsync calibrate";
constexpr int kCalibrateWarmupFrames = 30;

struct CliOptions {
    std::string command;
    std::string config_path{kDefaultConfigPath};
    bool config_given{false};
    std::string calibration_path;
    std::optional<int> camera_index;
    std::vector<std::string> device_specs;
    std::optional<std::string> output_dir;
    std::string profile_name{"Unnamed Ball"};
    bool preview{true};
    bool toggle_stdin{false};
    bool auto_record{false};
};

void printUsage(std::ostream& os) {
    os << "usage: jugsync <record|calibrate|devices> [options]\n"
       << "  --config <path>         YAML config (default " << kDefaultConfigPath << ")\n"
       << "  --calibration <path>    camera calibration YAML (K/D)\n"
       << "  --camera <index>        camera device index\n"
       << "  --device name=ip[:port] IMU device, repeatable; replaces configured devices\n"
       << "  --output <dir>          recordings root directory\n"
       << "  --profile-name <name>   name for a new ball profile (calibrate)\n"
       << "  --no-preview            run without a preview window\n"
       << "  --toggle-stdin          Enter on stdin toggles recording / captures a profile\n"
       << "  --auto                  also save a clip whenever motion comes to rest (record)\n";
}

bool parseArgs(int argc, char** argv, CliOptions& out, std::string& error) {
    enum LongOnly {
        kConfig = 1000,
        kCalibration,
        kCamera,
        kDevice,
        kOutput,
        kProfileName,
        kNoPreview,
        kToggleStdin,
        kAuto,
        kHelp,
    };
    static const option kOptions[] = {
        {"config", required_argument, nullptr, kConfig},
        {"calibration", required_argument, nullptr, kCalibration},
        {"camera", required_argument, nullptr, kCamera},
        {"device", required_argument, nullptr, kDevice},
        {"output", required_argument, nullptr, kOutput},
        {"profile-name", required_argument, nullptr, kProfileName},
        {"no-preview", no_argument, nullptr, kNoPreview},
        {"toggle-stdin", no_argument, nullptr, kToggleStdin},
        {"auto", no_argument, nullptr, kAuto},
        {"help", no_argument, nullptr, kHelp},
        {nullptr, 0, nullptr, 0},
    };

    if (argc >= 2 && std::string(argv[1]) == "--help") {
        error.clear();
        return false;
    }
    if (argc < 2 || argv[1][0] == '-') {
        error = "missing command";
        return false;
    }
    out.command = argv[1];

    optind = 2;
    int opt = 0;
    while ((opt = getopt_long(argc, argv, "", kOptions, nullptr)) != -1) {
        switch (opt) {
            case kConfig:
                out.config_path = optarg;
                out.config_given = true;
                break;
            case kCalibration:
                out.calibration_path = optarg;
                break;
            case kCamera:
                try {
                    out.camera_index = std::stoi(optarg);
                } catch (const std::exception&) {
                    error = std::string("invalid --camera index '") + optarg + "'";
                    return false;
                }
                break;
            case kDevice:
                out.device_specs.emplace_back(optarg);
                break;
            case kOutput:
                out.output_dir = optarg;
                break;
            case kProfileName:
                out.profile_name = optarg;
                break;
            case kNoPreview:
                out.preview = false;
                break;
            case kToggleStdin:
                out.toggle_stdin = true;
                break;
            case kAuto:
                out.auto_record = true;
                break;
            case kHelp:
                error.clear();
                return false;
            default:
                error = "unrecognized option";
                return false;
        }
    }
    if (optind < argc) {
        error = std::string("unexpected argument '") + argv[optind] + "'";
        return false;
    }
    return true;
}

bool buildConfig(const CliOptions& opts, jugsync::AppConfig& cfg, std::string& error) {
    if (opts.config_given || std::filesystem::exists(opts.config_path)) {
        if (!jugsync::loadConfig(opts.config_path, cfg, error)) {
            return false;
        }
    } else {
        std::cout << "config: " << opts.config_path << " not found, using defaults\n";
    }

    if (opts.camera_index.has_value()) {
        cfg.camera.device_index = *opts.camera_index;
    }
    if (!opts.calibration_path.empty()) {
        cfg.camera.calibration_file = opts.calibration_path;
    }
    if (opts.output_dir.has_value()) {
        cfg.recording.output_dir = *opts.output_dir;
    }
    if (!opts.device_specs.empty()) {
        cfg.devices.clear();
        for (const auto& spec : opts.device_specs) {
            jugsync::DeviceConfig device;
            if (!jugsync::parseDeviceSpec(spec, device, error)) {
                return false;
            }
            cfg.devices.push_back(device);
        }
    }
    return jugsync::validateConfig(cfg, error);
}

std::vector<jugsync::DeviceEndpoint> endpointsFrom(const jugsync::AppConfig& cfg) {
    std::vector<jugsync::DeviceEndpoint> endpoints;
    endpoints.reserve(cfg.devices.size());
    for (const auto& device : cfg.devices) {
        endpoints.push_back(jugsync::endpointFromConfig(device));
    }
    return endpoints;
}

// Counts Enter presses on stdin without blocking shutdown.
class StdinToggleReader {
public:
    ~StdinToggleReader() { stop(); }

    void start() {
        running_.store(true);
        thread_ = std::thread(&StdinToggleReader::run, this);
    }

    void stop() {
        if (!running_.exchange(false)) {
            return;
        }
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    int takePending() { return pending_.exchange(0); }

private:
    void run() {
#ifdef __linux__
        char buf[256];
        while (running_.load() && g_running.load()) {
            pollfd pfd{STDIN_FILENO, POLLIN, 0};
            if (poll(&pfd, 1, 100) <= 0) {
                continue;
            }
            const ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
            if (n <= 0) {
                break;
            }
            pending_.fetch_add(static_cast<int>(std::count(buf, buf + n, '\n')));
        }
#endif
    }

    std::atomic<bool> running_{false};
    std::atomic<int> pending_{0};
    std::thread thread_;
};

bool openCamera(const jugsync::AppConfig& cfg, jugsync::VideoFrameSource& camera, const char* without_calibration) {
    jugsync::CameraCalibration calibration;
    std::string error;
    if (calibration.loadFromFile(cfg.camera.calibration_file, error)) {
        camera.setCalibration(calibration);
    } else {
        std::cerr << "calibration: " << error << ", " << without_calibration << "\n";
    }

    if (!camera.open(error)) {
        std::cerr << "camera: " << error << "\n";
        return false;
    }
    std::cout << "camera: source " << camera.description() << "\n";
    return true;
}

int runRecord(const jugsync::AppConfig& cfg, const CliOptions& opts) {
    jugsync::VideoFrameSource camera(cfg.camera);
    if (!openCamera(cfg, camera, "3D ball positions disabled")) {
        return 1;
    }

    std::string error;
    auto pose = jugsync::createPoseDetector(cfg.pose.backend, error);
    if (!pose) {
        std::cerr << "pose: " << error << "\n";
        return 1;
    }

    jugsync::BallProfileStore store(cfg.calibration.profiles_dir);
    if (!store.load(error)) {
        std::cerr << "calibration: " << error << ", ball overlay disabled\n";
    }
    const jugsync::BallIdentifier identifier;

    jugsync::DeviceStreamManager streams(jugsync::streamOptionsFromConfig(cfg.stream));
    if (!streams.start(endpointsFrom(cfg), error)) {
        std::cerr << "stream: " << error << "\n";
        return 1;
    }
    if (cfg.devices.empty()) {
        std::cout << "stream: no IMU devices configured, recording video only\n";
    }

    const auto session_dir = std::filesystem::path(cfg.recording.output_dir) /
                             jugsync::makeSessionDirName(std::chrono::system_clock::now());
    jugsync::RecordingSessionController controller(session_dir.string(), streams.deviceNames(), cfg.recording);

    StdinToggleReader stdin_toggles;
    if (opts.toggle_stdin) {
        stdin_toggles.start();
    }
    std::cout << "record: " << (opts.preview ? "SPACE" : "") << (opts.preview && opts.toggle_stdin ? " or " : "")
              << (opts.toggle_stdin ? "Enter" : "") << " toggles recording, session " << session_dir.string()
              << ". Ctrl+C to stop.\n";
    if (!opts.preview && !opts.toggle_stdin) {
        std::cout << "record: no toggle input available (--no-preview without --toggle-stdin)\n";
    }

    std::optional<jugsync::StillnessRecorder> stillness;
    if (opts.auto_record) {
        stillness.emplace(cfg.motion, cfg.recording.video_fps, controller);
        std::cout << "record: auto clips on, " << cfg.motion.record_duration_s << "s before "
                  << cfg.motion.stillness_duration_s << "s of stillness\n";
    }
    jugsync::MotionReading motion;

    auto drainSamples = [&]() {
        uint64_t n = 0;
        for (const auto& sample : streams.drain()) {
            controller.onSample(sample);
            if (stillness.has_value()) {
                stillness->onSample(sample);
            }
            ++n;
        }
        return n;
    };

    auto shutdown = [&]() {
        stdin_toggles.stop();
        drainSamples();
        controller.finalize();
        streams.stop();
        camera.close();
        if (opts.preview) {
            cv::destroyAllWindows();
        }
    };

    auto toggle = [&controller]() {
        std::string toggle_error;
        if (!controller.toggle(toggle_error)) {
            std::cerr << "recording: " << toggle_error << "\n";
        }
    };

    jugsync::CaptureWatchdog watchdog(cfg.camera.max_grab_failures);
    uint64_t frames = 0;
    uint64_t samples = 0;
    int64_t window_start_ns = jugsync::nowSteadyNs();
    while (g_running.load()) {
        // Samples first, so the queue keeps draining while the camera stalls.
        samples += drainSamples();

        jugsync::AlignedFrame frame;
        if (!camera.grab(frame, error)) {
            if (!watchdog.onFailure(error)) {
                std::cerr << "record: " << watchdog.fatalMessage() << "\n";
                shutdown();
                return 1;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            continue;
        }
        watchdog.onSuccess();

        controller.onFrame(frame.color_bgr);
        if (stillness.has_value()) {
            motion = stillness->onFrame(frame.color_bgr, frame.timestamp_ns);
        }
        ++frames;

        for (int n = stdin_toggles.takePending(); n > 0; --n) {
            toggle();
        }

        if (opts.preview) {
            cv::Mat view = frame.color_bgr.clone();
            const auto landmarks = pose->detect(view);
            if (landmarks.has_value()) {
                view = pose->drawLandmarks(view, *landmarks);
                view = pose->drawHands(view, pose->handPositions(*landmarks, view.size()));
            }
            if (!store.all().empty()) {
                jugsync::OverlayRenderer::renderBalls(view, identifier.process(frame, camera.intrinsics(), store.all()));
            }

            std::vector<jugsync::DeviceOverlayLine> lines;
            const int64_t now_ns = jugsync::nowWallNs();
            for (const auto& status : streams.deviceStatus()) {
                jugsync::DeviceOverlayLine line;
                line.name = status.name;
                line.connected = status.connected;
                line.latest = streams.latestFor(status.name);
                line.age_s = line.latest.has_value() ? line.latest->ageSeconds(now_ns) : 0.0;
                lines.push_back(line);
            }
            jugsync::OverlayRenderer::renderDevices(view, lines);

            jugsync::RecordingOverlayStatus rec;
            rec.recording = controller.state() == jugsync::RecordingState::Active;
            rec.token = controller.activeToken().value_or("");
            rec.clips_recorded = static_cast<int>(controller.clips().size());
            jugsync::OverlayRenderer::renderRecordingStatus(view, rec);
            if (stillness.has_value()) {
                jugsync::OverlayRenderer::renderMotionStatus(view, motion, cfg.motion);
            }

            cv::imshow(kRecordWindow, view);
            const int key = cv::waitKey(1) & 0xFF;
            if (key == ' ') {
                toggle();
            } else if (key == 'q' || key == 27) {
                g_running.store(false);
            }
        }

        const int64_t now_ns = jugsync::nowSteadyNs();
        if (now_ns - window_start_ns >= 1000000000LL) {
            const auto totals = streams.totals();
            std::cout << "[record] state=" << jugsync::recordingStateName(controller.state())
                      << " fps=" << frames << " samples=" << samples
                      << " clips=" << controller.clips().size()
                      << " parse_errors=" << totals.parse_errors
                      << " queue_dropped=" << totals.queue_dropped;
            if (stillness.has_value()) {
                std::cout << " motion=" << static_cast<int64_t>(motion.value)
                          << " buffered_frames=" << stillness->bufferedFrames();
            }
            std::cout << "\n";
            frames = 0;
            samples = 0;
            window_start_ns = now_ns;
        }
    }

    shutdown();

    for (const auto& clip : controller.clips()) {
        std::cout << "record: " << clip.kind << " clip " << clip.clip_index << " " << clip.token << " -> " << clip.video_path
                  << " (" << clip.frames << " frames";
        for (const auto& entry : clip.samples_per_device) {
            std::cout << ", " << entry.first << "=" << entry.second;
        }
        std::cout << ")";
        for (const auto& failure : clip.failures) {
            std::cout << " FAILED " << failure.sink << ": " << failure.error;
        }
        std::cout << "\n";
    }
    return 0;
}

int runCalibrate(const jugsync::AppConfig& cfg, const CliOptions& opts) {
    jugsync::VideoFrameSource camera(cfg.camera);
    if (!openCamera(cfg, camera, "ball size model will not be derived")) {
        return 1;
    }

    std::string error;
    jugsync::BallProfileStore store(cfg.calibration.profiles_dir);
    if (!store.load(error)) {
        std::cerr << "calibration: " << error << "\n";
        return 1;
    }

    jugsync::ColorModelParams params;
    params.std_multiplier = cfg.calibration.std_multiplier;
    params.saturation_floor = cfg.calibration.saturation_floor;
    params.value_floor = cfg.calibration.value_floor;

    StdinToggleReader stdin_toggles;
    if (opts.toggle_stdin) {
        stdin_toggles.start();
    }
    std::cout << "calibrate: place the ball inside the circle; "
              << (opts.preview ? "SPACE/c captures, +/- resizes, q quits" : "capturing after warm-up") << "\n";

    jugsync::CaptureWatchdog watchdog(cfg.camera.max_grab_failures);
    float radius_scale = 0.125F;
    int frames_seen = 0;
    bool captured = false;
    while (g_running.load() && !captured) {
        jugsync::AlignedFrame frame;
        if (!camera.grab(frame, error)) {
            if (!watchdog.onFailure(error)) {
                std::cerr << "calibrate: " << watchdog.fatalMessage() << "\n";
                stdin_toggles.stop();
                camera.close();
                if (opts.preview) {
                    cv::destroyAllWindows();
                }
                return 1;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            continue;
        }
        watchdog.onSuccess();
        ++frames_seen;

        const cv::Size size = frame.color_bgr.size();
        const cv::Point2f center(size.width * 0.5F, size.height * 0.5F);
        const float radius = std::max(4.0F, std::min(size.width, size.height) * radius_scale);

        bool capture = stdin_toggles.takePending() > 0;
        if (opts.preview) {
            cv::Mat view = frame.color_bgr.clone();
            jugsync::OverlayRenderer::renderCalibrationRoi(view, center, radius, "profile: " + opts.profile_name);
            cv::imshow(kCalibrateWindow, view);
            const int key = cv::waitKey(1) & 0xFF;
            if (key == ' ' || key == 'c') {
                capture = true;
            } else if (key == '+' || key == '=') {
                radius_scale = std::min(0.45F, radius_scale + 0.01F);
            } else if (key == '-') {
                radius_scale = std::max(0.02F, radius_scale - 0.01F);
            } else if (key == 'q' || key == 27) {
                break;
            }
        } else if (!opts.toggle_stdin && frames_seen >= kCalibrateWarmupFrames) {
            capture = true;
        }
        if (!capture) {
            continue;
        }

        jugsync::BallProfile profile(opts.profile_name);
        profile.setRadiusConfidence(cfg.calibration.radius_confidence_factor);
        profile.setCircularityMin(cfg.calibration.circularity_min);
        if (!jugsync::calibrateFromCircle(frame, center, radius, camera.intrinsics(), params, profile, error)) {
            std::cerr << "calibration: " << error << ", try again\n";
            continue;
        }

        store.add(profile);
        if (!store.save(error)) {
            std::cerr << "calibration: " << error << "\n";
            return 1;
        }
        const auto& low = *profile.hsvLow();
        const auto& high = *profile.hsvHigh();
        std::cout << "calibrate: saved '" << profile.name() << "' (" << profile.id() << ") hsv_low=["
                  << low[0] << "," << low[1] << "," << low[2] << "] hsv_high=[" << high[0] << "," << high[1]
                  << "," << high[2] << "] radius_m=";
        if (profile.radiusM().has_value()) {
            std::cout << *profile.radiusM();
        } else {
            std::cout << "unset";
        }
        std::cout << " -> " << store.filePath() << "\n";
        captured = true;
    }

    stdin_toggles.stop();
    camera.close();
    if (opts.preview) {
        cv::destroyAllWindows();
    }
    return 0;
}

int runDevices(const jugsync::AppConfig& cfg) {
    if (cfg.devices.empty()) {
        std::cerr << "devices: no IMU devices configured (use --device name=ip)\n";
        return 1;
    }

    std::string error;
    jugsync::DeviceStreamManager streams(jugsync::streamOptionsFromConfig(cfg.stream));
    if (!streams.start(endpointsFrom(cfg), error)) {
        std::cerr << "stream: " << error << "\n";
        return 1;
    }

    std::size_t completed = 0;
    int64_t window_start_ns = jugsync::nowSteadyNs();
    while (g_running.load()) {
        completed += streams.waitAndDrain(std::chrono::milliseconds(200)).size();
        if (jugsync::nowSteadyNs() - window_start_ns < 1000000000LL) {
            continue;
        }
        window_start_ns = jugsync::nowSteadyNs();

        const int64_t now_ns = jugsync::nowWallNs();
        for (const auto& status : streams.deviceStatus()) {
            std::cout << "[devices] name=" << status.name << " connected=" << status.connected
                      << " reconnects=" << status.reconnects << " received=" << status.stats.received
                      << " completed=" << status.stats.completed << " parse_errors=" << status.stats.parse_errors
                      << " stale_dropped=" << status.stats.stale_dropped;
            const auto latest = streams.latestFor(status.name);
            if (latest.has_value()) {
                std::cout << " accel=(" << latest->accel[0] << "," << latest->accel[1] << "," << latest->accel[2]
                          << ") gyro=(" << latest->gyro[0] << "," << latest->gyro[1] << "," << latest->gyro[2]
                          << ") |a|=" << latest->accel_magnitude << " age_s=" << latest->ageSeconds(now_ns);
            }
            if (!status.connected && !status.last_error.empty()) {
                std::cout << " last_error=\"" << status.last_error << "\"";
            }
            std::cout << "\n";
        }
        std::cout << "[devices] samples_per_s=" << completed << " queue_dropped=" << streams.queueDropCount() << "\n";
        completed = 0;
    }

    streams.stop();
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    CliOptions opts;
    std::string error;
    if (!parseArgs(argc, argv, opts, error)) {
        if (!error.empty()) {
            std::cerr << "jugsync: " << error << "\n";
        }
        printUsage(error.empty() ? std::cout : std::cerr);
        return error.empty() ? 0 : 1;
    }

    jugsync::AppConfig cfg;
    if (!buildConfig(opts, cfg, error)) {
        std::cerr << "config: " << error << "\n";
        return 1;
    }

    if (opts.command == "record") {
        return runRecord(cfg, opts);
    }
    if (opts.command == "calibrate") {
        return runCalibrate(cfg, opts);
    }
    if (opts.command == "devices") {
        return runDevices(cfg);
    }

    std::cerr << "jugsync: unknown command '" << opts.command << "'\n";
    printUsage(std::cerr);
    return 1;
}
