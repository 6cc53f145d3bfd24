#pragma once
#include <string>
#include <random>
#include <sstream>

namespace docgate::core::config {

    // Generates "<prefix>-" followed by 8 random hex characters, e.g. "job-3fa09c1e"
    inline std::string generate_id(const std::string& prefix) {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix << "-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace docgate::core::config
