// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fetchr/cli/commands.hpp>
#include <fetchr/cli/progress_bar.hpp>
#include <fetchr/core/download_service.hpp>
#include <fetchr/core/error.hpp>
#include <fetchr/core/host_policy.hpp>
#include <fetchr/core/http_session.hpp>
#include <fetchr/core/log.hpp>
#include <fetchr/core/proxy_pool.hpp>
#include <fetchr/core/url.hpp>
#include <fetchr/version.hpp>
#include <algorithm>
#include <charconv>
#include <chrono>
#include <csignal>
#include <ctime>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <pthread.h>
#include <signal.h>

using namespace fetchr::core;

namespace chrono = std::chrono;

namespace fetchr::cli {

namespace {

// curl global state for the lifetime of one command
struct CurlGlobal {
    CurlGlobal() noexcept { HttpSession::global_init(); }
    ~CurlGlobal() { HttpSession::global_cleanup(); }
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

// Turns SIGINT/SIGTERM into a stop request. The signals are blocked in
// this thread and inherited blocked by every thread spawned after it.
class InterruptWatcher {
public:
    explicit InterruptWatcher(std::stop_source source) {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &signals_, nullptr);

        thread_ = std::jthread([this, source](std::stop_token own) mutable {
            const timespec poll{0, 200'000'000};
            while (!own.stop_requested()) {
                if (sigtimedwait(&signals_, nullptr, &poll) > 0) {
                    log::get()->warn("Interrupted, stopping transfers (partial data is kept)");
                    source.request_stop();
                    return;
                }
            }
        });
    }

    ~InterruptWatcher() {
        thread_.request_stop();
        thread_.join();
        pthread_sigmask(SIG_UNBLOCK, &signals_, nullptr);
    }

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

private:
    sigset_t signals_{};
    std::jthread thread_;
};

// Folds the progress of concurrent resources into one bar
class ProgressBoard {
public:
    explicit ProgressBoard(bool enabled)
        : enabled_(enabled)
        , bar_(0, "Downloading")
        , started_(chrono::steady_clock::now()) {}

    void update(const ResourceDescriptor& resource, std::uint64_t downloaded, std::uint64_t total) {
        if (!enabled_) return;
        std::lock_guard lock(mutex_);
        resources_[resource.filename] = {downloaded, total};

        std::uint64_t done = 0;
        std::uint64_t all = 0;
        for (const auto& [name, entry] : resources_) {
            done += entry.first;
            all += entry.second;
        }

        auto elapsed = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - started_);
        std::uint64_t speed = elapsed.count() > 0
                            ? done * 1000 / static_cast<std::uint64_t>(elapsed.count())
                            : 0;

        if (resources_.size() > 1) {
            bar_.label(std::to_string(resources_.size()) + " files");
        } else {
            bar_.label(resource.filename);
        }
        bar_.total(all);
        bar_.update(done, speed);
    }

    void finish(bool ok) {
        if (!enabled_) return;
        std::lock_guard lock(mutex_);
        if (resources_.empty()) return;
        if (ok) {
            bar_.finish();
        } else {
            bar_.clear();
        }
    }

private:
    bool enabled_;
    ProgressBar bar_;
    chrono::steady_clock::time_point started_;
    std::map<std::string, std::pair<std::uint64_t, std::uint64_t>> resources_;
    std::mutex mutex_;
};

std::expected<HostPolicyTable, std::error_code>
load_policies(const CliArgs& args, const Settings& settings) noexcept {
    if (!args.hosts_config.empty()) {
        return HostPolicyTable::load(args.hosts_config);
    }
    if (settings.hosts_config) {
        return HostPolicyTable::load(*settings.hosts_config);
    }
    return HostPolicyTable::defaults();
}

// nullptr when no proxy list is configured
std::expected<std::shared_ptr<const ProxyPool>, std::error_code>
load_proxies(const CliArgs& args, const Settings& settings) noexcept {
    std::filesystem::path path;
    if (!args.proxies_file.empty()) {
        path = args.proxies_file;
    } else if (settings.proxies_file) {
        path = *settings.proxies_file;
    } else {
        return std::shared_ptr<const ProxyPool>{};
    }

    auto pool = ProxyPool::load(path);
    if (!pool) {
        return std::unexpected(pool.error());
    }
    if (pool->empty()) {
        log::get()->warn("Proxy list {} has no entries, connecting directly", path.string());
    }
    return std::make_shared<const ProxyPool>(std::move(*pool));
}

void print_stats(const AdmissionStats& stats) {
    std::cout << "Submitted: " << stats.submitted
              << "  Succeeded: " << stats.succeeded
              << "  Failed: " << stats.failed
              << "  Success rate: " << static_cast<int>(stats.success_rate) << "%\n";
    std::cout << "Global slots: " << stats.global_in_use << "/" << stats.global_limit << "\n";
    for (const auto& [host, limit] : stats.host_limits) {
        auto active = stats.active.find(host);
        std::cout << "  " << host << ": "
                  << (active != stats.active.end() ? active->second : 0) << "/" << limit << "\n";
    }
}

bool parse_count(const char* text, std::uint32_t& out) noexcept {
    std::string_view view{text};
    std::uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(view.data(), view.data() + view.size(), value);
    if (ec != std::errc{} || ptr != view.data() + view.size() || value == 0) {
        return false;
    }
    out = value;
    return true;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto value_of = [&](int& i, std::string_view option) -> const char* {
        if (i + 1 >= argc) {
            args.error = std::string(option) + " requires a value";
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }
        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-i" || arg == "--info") {
            args.info = true;
        } else if (arg == "-s" || arg == "--stats") {
            args.stats = true;
        } else if (arg == "-d" || arg == "--directory") {
            if (const char* v = value_of(i, arg)) args.output_dir = v;
        } else if (arg == "-c" || arg == "--hosts") {
            if (const char* v = value_of(i, arg)) args.hosts_config = v;
        } else if (arg == "-p" || arg == "--proxies") {
            if (const char* v = value_of(i, arg)) args.proxies_file = v;
        } else if (arg == "-n" || arg == "--segments") {
            if (const char* v = value_of(i, arg); v && !parse_count(v, args.segments)) {
                args.error = "invalid segment count '" + std::string(v) + "'";
            }
        } else if (arg.starts_with("http://") || arg.starts_with("https://")) {
            args.urls.push_back(arg);
        } else {
            args.error = "unrecognized argument '" + arg + "'";
        }

        if (!args.error.empty()) {
            return args;
        }
    }

    return args;
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const CliArgs& args, const Settings& settings) noexcept {
    try {
        auto policies = load_policies(args, settings);
        if (!policies) {
            std::cerr << "Error: cannot load host policies: " << policies.error().message() << std::endl;
            return std::unexpected(policies.error());
        }

        auto proxies = load_proxies(args, settings);
        if (!proxies) {
            std::cerr << "Error: cannot load proxy list: " << proxies.error().message() << std::endl;
            return std::unexpected(proxies.error());
        }

        CurlGlobal curl;
        HttpSession session;

        ServiceOptions options;
        options.global_limit = settings.max_concurrent;
        options.proxies = std::move(*proxies);
        if (args.segments > 0) {
            options.parallelism = args.segments;
        }

        DownloadService service(session, std::move(*policies), options);

        std::filesystem::path target_dir = args.output_dir.empty()
                                         ? settings.download_dir
                                         : std::filesystem::path{args.output_dir};

        std::stop_source stop;
        InterruptWatcher watcher(stop);

        ProgressBoard board(!args.quiet);
        auto results = service.download_all(
            args.urls, target_dir,
            [&board](const ResourceDescriptor& resource, std::uint64_t downloaded, std::uint64_t total) {
                board.update(resource, downloaded, total);
            },
            stop.get_token());

        const bool all_ok = std::all_of(results.begin(), results.end(), [](const auto& r) { return r.ok(); });
        board.finish(all_ok);

        for (const auto& r : results) {
            if (r.ok()) {
                std::cout << (r.skipped ? "Present: " : "Saved: ") << r.outcome->string() << "\n";
            } else {
                std::cout << "Failed: " << r.url;
                if (!r.filename.empty()) std::cout << " (" << r.filename << ")";
                std::cout << ": " << r.outcome.error().message() << "\n";
            }
        }

        if (args.stats) {
            print_stats(service.admission().stats());
        }

        if (stop.stop_requested()) {
            return 130;
        }
        return all_ok ? 0 : 1;
    } catch (const std::exception& e) {
        log::get()->critical("{}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::transfer_failed));
    }
}

CliResult info(const CliArgs& args, const Settings& settings) noexcept {
    try {
        auto policies = load_policies(args, settings);
        if (!policies) {
            std::cerr << "Error: cannot load host policies: " << policies.error().message() << std::endl;
            return std::unexpected(policies.error());
        }

        CurlGlobal curl;
        HttpSession session;
        DownloadService service(session, std::move(*policies));

        int exit_code = 0;
        for (const auto& url : args.urls) {
            auto descriptors = service.resolve(url);
            if (!descriptors) {
                std::cout << "Error: " << url << ": " << descriptors.error().message() << std::endl;
                exit_code = 1;
                continue;
            }

            std::cout << "URL: " << url << "\n";
            std::cout << "Host policy: " << match_host_key(host_key(url), service.policies().keys()) << "\n";
            for (const auto& d : *descriptors) {
                std::cout << "  File: " << d.filename << "\n";
                std::cout << "  Size: "
                          << (d.size_known() ? ProgressBar::format_bytes(d.total_size) : std::string("unknown"))
                          << "\n";
                std::cout << "  Source: " << d.url << "\n";
            }
        }
        return exit_code;
    } catch (const std::exception& e) {
        log::get()->critical("{}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::resolve_failed));
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "fetchr " << program_name << " - Segmented, resumable HTTP downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL>...\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar, warnings only)\n";
    std::cout << "  -d, --directory <DIR>   Save to specified directory\n";
    std::cout << "  -n, --segments <N>      Connections per file (default: host policy)\n";
    std::cout << "  -c, --hosts <FILE>      Host policy file (JSON)\n";
    std::cout << "  -p, --proxies <FILE>    Proxy list, one URL per line, for hosts with use_proxy\n";
    std::cout << "  -i, --info              Resolve and show files without downloading\n";
    std::cout << "  -s, --stats             Print admission statistics when done\n";
    std::cout << "\n";
    std::cout << "ENVIRONMENT:\n";
    std::cout << "  FETCHR_DOWNLOAD_DIR, FETCHR_HOSTS_CONFIG, FETCHR_PROXIES_PATH, FETCHR_LOG_LEVEL,\n";
    std::cout << "  FETCHR_MAX_CONCURRENT\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/file.zip\n";
    std::cout << "  " << program_name << " -n 8 -d isos https://example.com/large.iso\n";
    std::cout << "  " << program_name << " -c hosts.json https://pixeldrain.com/u/abc\n";
    std::cout << "\n";
    std::cout << "Interrupted downloads resume from their .partN files on the next run.\n";
}

void print_version() noexcept {
    std::cout << "fetchr " << fetchr::version.to_string() << std::endl;
    std::cout << "Built " << fetchr::BUILD_DATE << " " << fetchr::BUILD_TIME << "\n";
    std::cout << "\n";
    std::cout << "Built with C++23, libcurl, spdlog, nlohmann/json\n";
}

} // namespace fetchr::cli
