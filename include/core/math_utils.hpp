#pragma once

#include <vector>

#include <opencv2/core.hpp>

namespace jugsync {

double norm3(const cv::Vec3d& v);

// Per-channel mean and population standard deviation.
void meanStdPerChannel(const std::vector<cv::Vec3d>& samples, cv::Vec3d& mean, cv::Vec3d& stddev);

double median(std::vector<double> values);
double circularity(double area, double perimeter);

}  // namespace jugsync
