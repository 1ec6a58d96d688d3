#include "calibration/ball_identifier.hpp"

#include <cmath>

#include <opencv2/imgproc.hpp>

#include "core/math_utils.hpp"

namespace jugsync {

namespace {

std::optional<double> blobDepth(const cv::Mat& depth_m, const cv::Mat& mask, const cv::Point2f& center) {
    if (depth_m.empty() || depth_m.type() != CV_32F) {
        return std::nullopt;
    }

    // Mean over valid pixels of the blob, centroid as fallback.
    cv::Mat valid = (depth_m > 0.0F) & mask;
    if (cv::countNonZero(valid) > 0) {
        return cv::mean(depth_m, valid)[0];
    }
    const int x = static_cast<int>(center.x);
    const int y = static_cast<int>(center.y);
    if (x < 0 || y < 0 || x >= depth_m.cols || y >= depth_m.rows) {
        return std::nullopt;
    }
    const float d = depth_m.at<float>(y, x);
    if (!(d > 0.0F) || !std::isfinite(d)) {
        return std::nullopt;
    }
    return static_cast<double>(d);
}

}  // namespace

BallIdentifier::BallIdentifier(int min_blob_area_px)
    : min_blob_area_px_(min_blob_area_px) {}

std::vector<Blob> BallIdentifier::detectBlobs(const cv::Mat& hsv, const std::vector<BallProfile>& profiles) const {
    std::vector<Blob> out;
    if (hsv.empty()) {
        return out;
    }

    cv::Mat combined = cv::Mat::zeros(hsv.size(), CV_8UC1);
    for (const auto& profile : profiles) {
        if (!profile.hasColorModel()) {
            continue;
        }
        const cv::Vec3i& lo = *profile.hsvLow();
        const cv::Vec3i& hi = *profile.hsvHigh();
        cv::Mat mask;
        cv::inRange(hsv, cv::Scalar(lo[0], lo[1], lo[2]), cv::Scalar(hi[0], hi[1], hi[2]), mask);
        combined |= mask;
    }

    const cv::Mat kernel = cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(5, 5));
    cv::morphologyEx(combined, combined, cv::MORPH_OPEN, kernel);
    cv::morphologyEx(combined, combined, cv::MORPH_CLOSE, kernel);

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(combined, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
    for (auto& contour : contours) {
        if (cv::contourArea(contour) < static_cast<double>(min_blob_area_px_)) {
            continue;
        }
        Blob blob;
        cv::minEnclosingCircle(contour, blob.center, blob.radius_px);
        blob.contour = std::move(contour);
        out.push_back(std::move(blob));
    }
    return out;
}

std::vector<IdentifiedBall> BallIdentifier::identify(const std::vector<Blob>& blobs,
                                                     const cv::Mat& hsv,
                                                     const cv::Mat& depth_m,
                                                     const std::optional<CameraIntrinsics>& intrinsics,
                                                     const std::vector<BallProfile>& profiles) const {
    std::vector<IdentifiedBall> out;
    if (hsv.empty() || profiles.empty()) {
        return out;
    }

    const double fx = intrinsics.has_value() ? intrinsics->fx : 0.0;
    for (const auto& blob : blobs) {
        if (blob.radius_px < kMinRadiusPx || blob.contour.size() < 3) {
            continue;
        }

        cv::Mat mask = cv::Mat::zeros(hsv.size(), CV_8UC1);
        cv::drawContours(mask, std::vector<std::vector<cv::Point>>{blob.contour}, -1, cv::Scalar(255), cv::FILLED);
        if (cv::countNonZero(mask) == 0) {
            continue;
        }
        const cv::Scalar mean_hsv = cv::mean(hsv, mask);
        const cv::Vec3d blob_hsv(mean_hsv[0], mean_hsv[1], mean_hsv[2]);

        const auto depth = blobDepth(depth_m, mask, blob.center);
        const double blob_circularity = circularity(cv::contourArea(blob.contour), cv::arcLength(blob.contour, true));

        for (const auto& profile : profiles) {
            if (!profile.matchesColor(blob_hsv)) {
                continue;
            }
            if (depth.has_value() && !profile.acceptsPixelRadius(blob.radius_px, *depth, fx)) {
                continue;
            }
            if (!profile.acceptsCircularity(blob_circularity)) {
                continue;
            }

            IdentifiedBall ball;
            ball.profile_id = profile.id();
            ball.name = profile.name();
            ball.center = blob.center;
            ball.radius_px = blob.radius_px;
            ball.depth_m = depth.value_or(0.0);
            if (depth.has_value() && intrinsics.has_value()) {
                ball.position_m = backProject(blob.center, *depth, *intrinsics);
            }
            cv::Mat hsv_px(1, 1, CV_8UC3, cv::Scalar(mean_hsv[0], mean_hsv[1], mean_hsv[2]));
            cv::Mat bgr_px;
            cv::cvtColor(hsv_px, bgr_px, cv::COLOR_HSV2BGR);
            const cv::Vec3b bgr = bgr_px.at<cv::Vec3b>(0, 0);
            ball.color_bgr = cv::Scalar(bgr[0], bgr[1], bgr[2]);
            out.push_back(ball);
            break;
        }
    }
    return out;
}

std::vector<IdentifiedBall> BallIdentifier::process(const AlignedFrame& frame,
                                                    const std::optional<CameraIntrinsics>& intrinsics,
                                                    const std::vector<BallProfile>& profiles) const {
    if (frame.color_bgr.empty()) {
        return {};
    }
    cv::Mat hsv;
    cv::cvtColor(frame.color_bgr, hsv, cv::COLOR_BGR2HSV);
    const auto blobs = detectBlobs(hsv, profiles);
    return identify(blobs, hsv, frame.depth_m, intrinsics, profiles);
}

std::optional<cv::Point3d> BallIdentifier::backProject(const cv::Point2f& pixel, double depth_m,
                                                       const CameraIntrinsics& intrinsics) {
    if (!intrinsics.valid() || depth_m <= 0.0) {
        return std::nullopt;
    }
    return cv::Point3d(
        (static_cast<double>(pixel.x) - intrinsics.cx) * depth_m / intrinsics.fx,
        (static_cast<double>(pixel.y) - intrinsics.cy) * depth_m / intrinsics.fy,
        depth_m);
}

}  // namespace jugsync
