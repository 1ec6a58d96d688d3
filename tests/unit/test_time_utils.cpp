#include "core/time_utils.hpp"

#include <cctype>
#include <iostream>

int main() {
    const std::string token = jugsync::formatTimestampToken(std::chrono::system_clock::now());
    if (token.size() != 15 || token[8] != '_') {
        std::cerr << "token should look like YYYYmmdd_HHMMSS, got " << token << "\n";
        return 1;
    }
    for (std::size_t i = 0; i < token.size(); ++i) {
        if (i != 8 && !std::isdigit(static_cast<unsigned char>(token[i]))) {
            std::cerr << "non-digit in token " << token << "\n";
            return 1;
        }
    }

    const auto base = std::chrono::system_clock::from_time_t(1700000000);
    if (jugsync::formatTimestampToken(base) != jugsync::formatTimestampToken(base + std::chrono::milliseconds(400)) ||
        jugsync::formatTimestampToken(base) == jugsync::formatTimestampToken(base + std::chrono::seconds(1))) {
        std::cerr << "token resolution should be one second\n";
        return 1;
    }

    const int64_t a = jugsync::nowSteadyNs();
    const int64_t b = jugsync::nowSteadyNs();
    if (b < a) {
        std::cerr << "steady clock went backwards\n";
        return 1;
    }
    if (jugsync::nowWallNs() < 1500000000LL * 1000000000LL) {
        std::cerr << "wall clock should be epoch-based\n";
        return 1;
    }
    return 0;
}
