#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/gate_errors.hpp"

namespace toolgate::tools {

constexpr std::size_t kDefaultMaxOutputBytes = 1024 * 1024;

struct ProcessRequest {
    std::string command;
    std::filesystem::path working_directory = ".";
    std::uint32_t timeout_ms = 120000;
    std::shared_ptr<std::atomic_bool> cancel_token;
    // Per stream. Past it the rest is discarded and the process group killed.
    std::size_t max_output_bytes = kDefaultMaxOutputBytes;
};

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    bool truncated = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Current environment minus loader injection variables (LD_*, DYLD_*), as
// "KEY=value" entries.
std::vector<std::string> sanitized_environment();

// Runs the command under /bin/sh with a sanitized environment, killing it on
// timeout, on output overflow, or when the cancel token fires.
core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request);

}  // namespace toolgate::tools
