#include "camera/camera_calibration.hpp"

#include <fstream>
#include <regex>
#include <vector>

#include <opencv2/core/persistence.hpp>

namespace jugsync {

namespace {

// Reads either an !!opencv-matrix or a (nested) YAML sequence into a CV_64F Mat.
bool readMatrix(const cv::FileNode& node, cv::Mat& out) {
    if (node.empty()) {
        return false;
    }
    if (node.isMap()) {
        node >> out;
        if (out.empty()) {
            return false;
        }
        out.convertTo(out, CV_64F);
        return true;
    }
    if (!node.isSeq() || node.size() == 0) {
        return false;
    }

    std::vector<std::vector<double>> rows;
    if (node[0].isSeq()) {
        for (const auto& row_node : node) {
            std::vector<double> row;
            for (const auto& v : row_node) {
                row.push_back(static_cast<double>(v));
            }
            rows.push_back(row);
        }
    } else {
        std::vector<double> row;
        for (const auto& v : node) {
            row.push_back(static_cast<double>(v));
        }
        rows.push_back(row);
    }

    const int cols = static_cast<int>(rows.front().size());
    out = cv::Mat(static_cast<int>(rows.size()), cols, CV_64F);
    for (int r = 0; r < out.rows; ++r) {
        if (static_cast<int>(rows[r].size()) != cols) {
            return false;
        }
        for (int c = 0; c < cols; ++c) {
            out.at<double>(r, c) = rows[r][c];
        }
    }
    return true;
}

std::vector<double> numbersIn(const std::string& line) {
    static const std::regex number_re(R"([+-]?(?:\d+\.?\d*|\.\d+)(?:[eE][+-]?\d+)?)");
    std::vector<double> out;
    for (auto it = std::sregex_iterator(line.begin(), line.end(), number_re); it != std::sregex_iterator(); ++it) {
        out.push_back(std::stod(it->str()));
    }
    return out;
}

// Line scanner for files FileStorage rejects (no %YAML header, flow lists).
bool readPlainCalibration(const std::string& file_path, cv::Mat& K, cv::Mat& D, int& width, int& height) {
    std::ifstream ifs(file_path);
    if (!ifs.is_open()) {
        return false;
    }

    std::vector<double>* target = nullptr;
    std::vector<double> k_vals;
    std::vector<double> d_vals;
    std::string line;
    while (std::getline(ifs, line)) {
        const auto first = line.find_first_not_of(" \t");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }
        const std::string t = line.substr(first);
        if (t.rfind("camera_matrix:", 0) == 0 || t.rfind("K:", 0) == 0) {
            target = &k_vals;
        } else if (t.rfind("dist_coeff:", 0) == 0 || t.rfind("D:", 0) == 0) {
            target = &d_vals;
        } else if (t.rfind("image_width:", 0) == 0) {
            const auto nums = numbersIn(t);
            width = nums.empty() ? 0 : static_cast<int>(nums[0]);
            target = nullptr;
            continue;
        } else if (t.rfind("image_height:", 0) == 0) {
            const auto nums = numbersIn(t);
            height = nums.empty() ? 0 : static_cast<int>(nums[0]);
            target = nullptr;
            continue;
        } else if (t[0] != '-' && t[0] != '[' && t.find(':') != std::string::npos) {
            target = nullptr;
            continue;
        }

        if (target != nullptr) {
            const auto colon = t.find(':');
            const auto nums = numbersIn(colon == std::string::npos ? t : t.substr(colon + 1));
            target->insert(target->end(), nums.begin(), nums.end());
        }
    }

    if (k_vals.size() < 9 || d_vals.size() < 4) {
        return false;
    }
    K = cv::Mat(3, 3, CV_64F);
    for (int i = 0; i < 9; ++i) {
        K.at<double>(i / 3, i % 3) = k_vals[i];
    }
    D = cv::Mat(d_vals, true).reshape(1, 1);
    return true;
}

}  // namespace

bool CameraCalibration::loadFromFile(const std::string& file_path, std::string& error) {
    K_.release();
    D_.release();
    image_width_ = 0;
    image_height_ = 0;

    bool parsed = false;
    try {
        const cv::FileStorage fs(file_path, cv::FileStorage::READ);
        if (fs.isOpened()) {
            const bool got_k = readMatrix(fs["K"], K_) || readMatrix(fs["camera_matrix"], K_);
            const bool got_d = readMatrix(fs["D"], D_) || readMatrix(fs["dist_coeff"], D_);
            if (!fs["image_width"].empty()) {
                fs["image_width"] >> image_width_;
            }
            if (!fs["image_height"].empty()) {
                fs["image_height"] >> image_height_;
            }
            parsed = got_k && got_d;
        }
    } catch (const cv::Exception&) {
        parsed = false;
    }

    if (!parsed) {
        parsed = readPlainCalibration(file_path, K_, D_, image_width_, image_height_);
    }

    if (!D_.empty() && D_.cols == 1 && D_.rows > 1) {
        D_ = D_.t();
    }

    if (!parsed || !isValid()) {
        error = "calibration file " + file_path + " has no valid camera_matrix/dist_coeff (or K/D)";
        return false;
    }
    error.clear();
    return true;
}

bool CameraCalibration::isValid() const {
    return K_.rows == 3 && K_.cols == 3 && D_.total() >= 4 && K_.at<double>(0, 0) > 0.0 &&
           K_.at<double>(1, 1) > 0.0;
}

std::optional<CameraIntrinsics> CameraCalibration::intrinsics(int width, int height) const {
    if (!isValid()) {
        return std::nullopt;
    }
    CameraIntrinsics out;
    out.fx = K_.at<double>(0, 0);
    out.fy = K_.at<double>(1, 1);
    out.cx = K_.at<double>(0, 2);
    out.cy = K_.at<double>(1, 2);
    out.width = width > 0 ? width : image_width_;
    out.height = height > 0 ? height : image_height_;

    // K scales with resolution when the stream differs from the calibrated size.
    if (image_width_ > 0 && image_height_ > 0 && out.width > 0 && out.height > 0) {
        const double sx = static_cast<double>(out.width) / image_width_;
        const double sy = static_cast<double>(out.height) / image_height_;
        out.fx *= sx;
        out.cx *= sx;
        out.fy *= sy;
        out.cy *= sy;
    }
    return out;
}

}  // namespace jugsync
