#include "calibration/ball_profile_store.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace jugsync {

BallProfileStore::BallProfileStore(std::string directory)
    : directory_(std::move(directory)),
      file_path_((std::filesystem::path(directory_) / "ball_profiles.json").string()) {}

bool BallProfileStore::load(std::string& error) {
    profiles_.clear();

    std::error_code ec;
    if (!std::filesystem::exists(file_path_, ec)) {
        std::cout << "calibration: profile file not found: " << file_path_ << ", no profiles loaded\n";
        error.clear();
        return true;
    }

    std::ifstream ifs(file_path_);
    if (!ifs.is_open()) {
        error = "failed to open profile file: " + file_path_;
        return false;
    }

    nlohmann::json doc;
    try {
        ifs >> doc;
    } catch (const nlohmann::json::exception& e) {
        error = "failed to parse " + file_path_ + ": " + e.what();
        return false;
    }
    if (!doc.is_array()) {
        error = file_path_ + " must contain a JSON array of profiles";
        return false;
    }

    std::vector<BallProfile> loaded;
    loaded.reserve(doc.size());
    for (const auto& record : doc) {
        std::string record_error;
        auto profile = BallProfile::fromJson(record, record_error);
        if (!profile.has_value()) {
            error = file_path_ + ": " + record_error;
            return false;
        }
        loaded.push_back(std::move(*profile));
    }

    profiles_ = std::move(loaded);
    std::cout << "calibration: loaded " << profiles_.size() << " ball profiles from " << file_path_ << "\n";
    error.clear();
    return true;
}

bool BallProfileStore::save(std::string& error) const {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        error = "failed to create profile directory " + directory_ + ": " + ec.message();
        return false;
    }

    nlohmann::json doc = nlohmann::json::array();
    for (const auto& profile : profiles_) {
        doc.push_back(profile.toJson());
    }

    // Write-then-rename: the store file is never left truncated.
    const std::string tmp_path = file_path_ + ".tmp";
    {
        std::ofstream ofs(tmp_path, std::ios::trunc);
        if (!ofs.is_open()) {
            error = "failed to open " + tmp_path + " for writing";
            return false;
        }
        ofs << doc.dump(4) << '\n';
        ofs.flush();
        if (!ofs) {
            error = "failed to write " + tmp_path;
            return false;
        }
    }
    std::filesystem::rename(tmp_path, file_path_, ec);
    if (ec) {
        error = "failed to replace " + file_path_ + ": " + ec.message();
        return false;
    }

    std::cout << "calibration: saved " << profiles_.size() << " ball profiles to " << file_path_ << "\n";
    error.clear();
    return true;
}

void BallProfileStore::add(const BallProfile& profile) {
    const auto it = std::find_if(profiles_.begin(), profiles_.end(),
                                 [&](const BallProfile& p) { return p.id() == profile.id(); });
    if (it != profiles_.end()) {
        *it = profile;
        return;
    }
    profiles_.push_back(profile);
}

bool BallProfileStore::remove(const std::string& profile_id) {
    const auto it = std::remove_if(profiles_.begin(), profiles_.end(),
                                   [&](const BallProfile& p) { return p.id() == profile_id; });
    if (it == profiles_.end()) {
        return false;
    }
    profiles_.erase(it, profiles_.end());
    return true;
}

const BallProfile* BallProfileStore::find(const std::string& profile_id) const {
    for (const auto& profile : profiles_) {
        if (profile.id() == profile_id) {
            return &profile;
        }
    }
    return nullptr;
}

}  // namespace jugsync
