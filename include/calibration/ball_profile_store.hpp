#pragma once

#include <string>
#include <vector>

#include "calibration/ball_profile.hpp"

namespace jugsync {

// Profiles persisted as a JSON array in <dir>/ball_profiles.json.
class BallProfileStore {
public:
    explicit BallProfileStore(std::string directory);

    const std::string& filePath() const { return file_path_; }

    // A missing file is not an error; the store is simply empty.
    bool load(std::string& error);
    bool save(std::string& error) const;

    void add(const BallProfile& profile);
    bool remove(const std::string& profile_id);
    const BallProfile* find(const std::string& profile_id) const;
    const std::vector<BallProfile>& all() const { return profiles_; }

private:
    std::string directory_;
    std::string file_path_;
    std::vector<BallProfile> profiles_;
};

}  // namespace jugsync
