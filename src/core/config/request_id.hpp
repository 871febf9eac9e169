#pragma once
#include <random>
#include <sstream>
#include <string>

namespace toolgate::core::config {

    // Generates an 8-character hex ID with the given prefix, e.g. "req-3fa09c1b".
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

    inline std::string generate_request_id() {
        return generate_id("req");
    }

    inline std::string generate_session_id() {
        return generate_id("sess");
    }

} // namespace toolgate::core::config
