// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fetchr/core/external_engine.hpp>
#include <fetchr/core/log.hpp>
#include <fetchr/core/url.hpp>
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace fetchr::core {

namespace {

// RAII wrapper for posix_spawn_file_actions_t
struct SpawnActions {
    posix_spawn_file_actions_t actions{};
    bool valid{false};

    SpawnActions() { valid = posix_spawn_file_actions_init(&actions) == 0; }
    ~SpawnActions() { if (valid) posix_spawn_file_actions_destroy(&actions); }

    SpawnActions(const SpawnActions&) = delete;
    SpawnActions& operator=(const SpawnActions&) = delete;
};

} // namespace

Aria2cEngine::Aria2cEngine(std::string program, std::uint32_t connections)
    : program_(std::move(program))
    , connections_(std::max<std::uint32_t>(connections, 1)) {}

std::vector<std::string>
Aria2cEngine::build_command(const EngineRequest& request, const std::filesystem::path& output) const {
    std::string n = std::to_string(connections_);
    std::vector<std::string> argv{
        program_,
        request.url,
        "-d", output.parent_path().empty() ? std::string(".") : output.parent_path().string(),
        "-o", output.filename().string(),
        "-x", n,
        "-s", n,
        "--allow-overwrite=true",
        "--auto-file-renaming=false",
        "--console-log-level=warn",
        "--summary-interval=0",
    };

    for (const auto& [key, value] : request.headers) {
        if (to_lower(key) == "range") continue;
        argv.push_back("--header");
        argv.push_back(key + ": " + value);
    }
    argv.push_back("--header");
    argv.push_back("Range: bytes=" + request.range.to_string());

    if (!request.verify_tls) {
        argv.push_back("--check-certificate=false");
    }
    if (!request.proxy.empty()) {
        argv.push_back("--all-proxy");
        argv.push_back(request.proxy);
    }
    return argv;
}

std::error_code
Aria2cEngine::fetch(const EngineRequest& request, const std::filesystem::path& output, std::stop_token stoken) noexcept {
    std::vector<std::string> args;
    try {
        args = build_command(request, output);
    } catch (const std::bad_alloc&) {
        return std::make_error_code(std::errc::not_enough_memory);
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    SpawnActions actions;
    if (!actions.valid) {
        return make_error_code(DownloadErrc::engine_failed);
    }
    posix_spawn_file_actions_addopen(&actions.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_addopen(&actions.actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);

    pid_t pid = -1;
    int rc = posix_spawnp(&pid, program_.c_str(), &actions.actions, nullptr, argv.data(), environ);
    if (rc != 0) {
        log::get()->error("Could not start {}: {}", program_, std::generic_category().message(rc));
        return make_error_code(DownloadErrc::engine_failed);
    }

    log::get()->debug("Started {} (pid {}) for {} range {}", program_, pid, request.url, request.range.to_string());

    int status = 0;
    bool killed = false;
    while (true) {
        pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) break;
        if (done < 0) {
            if (errno == EINTR) continue;
            return make_error_code(DownloadErrc::engine_failed);
        }
        if (!killed && stoken.stop_requested()) {
            ::kill(pid, SIGTERM);
            killed = true;
        }
        std::this_thread::sleep_for(poll_interval_);
    }

    if (killed) {
        return make_error_code(DownloadErrc::cancelled);
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        log::get()->warn("{} exited with status {} for {}", program_,
                         WIFEXITED(status) ? WEXITSTATUS(status) : -1, request.url);
        return make_error_code(DownloadErrc::engine_failed);
    }
    return {};
}

} // namespace fetchr::core
