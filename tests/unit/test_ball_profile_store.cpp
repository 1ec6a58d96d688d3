#include "calibration/ball_profile_store.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

int main() {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "jugsync_test_profile_store";
    fs::remove_all(dir);

    jugsync::BallProfileStore store(dir.string());
    std::string error;
    if (!store.load(error) || !store.all().empty()) {
        std::cerr << "missing store file should load as empty: " << error << "\n";
        return 1;
    }

    jugsync::BallProfile red("red");
    if (!red.deriveColorModel({{0.0, 200.0, 200.0}, {4.0, 210.0, 220.0}})) {
        std::cerr << "red color model failed\n";
        return 1;
    }
    jugsync::BallProfile green("green");
    store.add(red);
    store.add(green);

    // Same id replaces instead of duplicating.
    red.setName("red (renamed)");
    store.add(red);
    if (store.all().size() != 2U || store.find(red.id()) == nullptr || store.find(red.id())->name() != "red (renamed)") {
        std::cerr << "add with existing id should replace\n";
        return 1;
    }

    if (!store.save(error)) {
        std::cerr << "save failed: " << error << "\n";
        return 1;
    }
    if (store.filePath() != (dir / "ball_profiles.json").string() || !fs::exists(store.filePath())) {
        std::cerr << "store file not written to <dir>/ball_profiles.json\n";
        return 1;
    }
    if (fs::exists(store.filePath() + ".tmp")) {
        std::cerr << "temporary file left behind\n";
        return 1;
    }

    jugsync::BallProfileStore reloaded(dir.string());
    if (!reloaded.load(error) || reloaded.all().size() != 2U) {
        std::cerr << "reload failed: " << error << "\n";
        return 1;
    }
    const jugsync::BallProfile* r = reloaded.find(red.id());
    if (r == nullptr || !r->hasColorModel() || *r->hsvLow() != *red.hsvLow()) {
        std::cerr << "reloaded profile lost its color model\n";
        return 1;
    }

    if (!reloaded.remove(green.id()) || reloaded.remove(green.id()) || reloaded.all().size() != 1U) {
        std::cerr << "remove mismatch\n";
        return 1;
    }

    {
        std::ofstream ofs(store.filePath(), std::ios::trunc);
        ofs << "{ not json";
    }
    jugsync::BallProfileStore corrupt(dir.string());
    if (corrupt.load(error) || error.empty()) {
        std::cerr << "malformed store file must be reported\n";
        return 1;
    }

    fs::remove_all(dir);
    return 0;
}
