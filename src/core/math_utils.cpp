#include "core/math_utils.hpp"

#include <algorithm>
#include <cmath>

namespace jugsync {

namespace {
constexpr double kPi = 3.14159265358979323846;
}

double norm3(const cv::Vec3d& v) {
    return std::sqrt(v[0] * v[0] + v[1] * v[1] + v[2] * v[2]);
}

void meanStdPerChannel(const std::vector<cv::Vec3d>& samples, cv::Vec3d& mean, cv::Vec3d& stddev) {
    mean = cv::Vec3d(0.0, 0.0, 0.0);
    stddev = cv::Vec3d(0.0, 0.0, 0.0);
    if (samples.empty()) {
        return;
    }

    const double n = static_cast<double>(samples.size());
    for (const auto& s : samples) {
        mean += s;
    }
    mean /= n;

    cv::Vec3d var(0.0, 0.0, 0.0);
    for (const auto& s : samples) {
        const cv::Vec3d d = s - mean;
        var += d.mul(d);
    }
    for (int c = 0; c < 3; ++c) {
        stddev[c] = std::sqrt(var[c] / n);
    }
}

double median(std::vector<double> values) {
    if (values.empty()) {
        return 0.0;
    }
    const std::size_t mid = values.size() / 2;
    std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid), values.end());
    const double upper = values[mid];
    if ((values.size() % 2) == 1) {
        return upper;
    }
    const double lower = *std::max_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid));
    return 0.5 * (lower + upper);
}

double circularity(double area, double perimeter) {
    if (perimeter <= 0.0) {
        return 0.0;
    }
    return 4.0 * kPi * area / (perimeter * perimeter);
}

}  // namespace jugsync
