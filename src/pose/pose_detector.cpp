#include "pose/pose_detector.hpp"

#include <iostream>

namespace jugsync {

std::unique_ptr<IPoseDetector> createPoseDetector(const std::string& backend, std::string& error) {
    if (backend.empty() || backend == "none") {
        std::cout << "pose: no landmark backend configured, hand tracking disabled\n";
        error.clear();
        return std::make_unique<NullPoseDetector>();
    }
    error = "unknown pose backend '" + backend + "' (available: none)";
    return nullptr;
}

}  // namespace jugsync
