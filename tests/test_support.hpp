// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fetchr/core/config.hpp>
#include <fetchr/core/error.hpp>
#include <fetchr/core/external_engine.hpp>
#include <fetchr/core/http_session.hpp>
#include <fetchr/core/segment_worker.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace fetchr::test {

namespace fs = std::filesystem;

// Scratch directory removed on scope exit
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        path_ = fs::temp_directory_path() / ("fetchr-test-" + std::to_string(gen()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const fs::path& path() const noexcept { return path_; }
    [[nodiscard]] fs::path operator/(const std::string& name) const { return path_ / name; }

private:
    fs::path path_;
};

inline void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

[[nodiscard]] inline std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

// Deterministic, non-repeating-looking payload
[[nodiscard]] inline std::string make_body(std::size_t size) {
    std::string body(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        body[i] = static_cast<char>('a' + (i * 7 + i / 26) % 26);
    }
    return body;
}

// Retry schedule and buffers small enough for unit tests
[[nodiscard]] inline core::TransferConfig fast_config(std::uint32_t retries = 3) {
    core::TransferConfig config;
    config.retry.retries = retries;
    config.retry.backoff_unit = std::chrono::milliseconds{1};
    config.chunk_size = 4;
    config.segment_progress_interval = std::chrono::milliseconds{0};
    config.job_progress_interval = std::chrono::milliseconds{0};
    return config;
}

[[nodiscard]] inline core::WorkerOptions fast_options(std::uint32_t retries = 3) {
    core::WorkerOptions options;
    options.config = fast_config(retries);
    return options;
}

struct FakeResource {
    std::string body;
    bool ranges{true};            // Honors Range with 206
    bool advertise_ranges{true};  // Accept-Ranges: bytes on HEAD
    bool allow_head{true};        // 405 otherwise
    bool report_length{true};     // Content-Length on HEAD
    std::int32_t status{200};     // Status of a full response
    std::string disposition;      // Content-Disposition filename
};

// One scripted misbehaviour, consumed by the next matching GET
struct Fault {
    enum class Kind {
        transport_error,   // Connection fails before any byte
        truncate,          // Only `bytes` of the slice, then a clean end
        ignore_range,      // 200 with the whole body
        oversize,          // The slice followed by `bytes` extra bytes
        status,            // `status` with an empty body
        block              // Hang until stopped
    };

    Kind kind{Kind::transport_error};
    std::size_t bytes{0};
    std::int32_t status{500};
    std::optional<std::uint64_t> range_first;  // Only requests starting here
};

// In-memory HttpTransport; thread safe
class FakeTransport final : public core::HttpTransport {
public:
    void add(const std::string& url, FakeResource resource) {
        std::lock_guard lock(mutex_);
        resources_[url] = std::move(resource);
    }

    void fault(const std::string& url, Fault f, std::size_t times = 1) {
        std::lock_guard lock(mutex_);
        for (std::size_t i = 0; i < times; ++i) {
            faults_[url].push_back(f);
        }
    }

    void clear_faults() {
        std::lock_guard lock(mutex_);
        faults_.clear();
    }

    [[nodiscard]] std::vector<core::HttpRequest> gets() const {
        std::lock_guard lock(mutex_);
        return gets_;
    }

    [[nodiscard]] std::size_t get_count() const {
        std::lock_guard lock(mutex_);
        return gets_.size();
    }

    [[nodiscard]] std::size_t head_count() const {
        std::lock_guard lock(mutex_);
        return heads_;
    }

    // Body slice size handed to the handler per call
    std::size_t slice{3};

    std::expected<core::HttpResponse, std::error_code>
    head(const core::HttpRequest& request) noexcept override {
        std::lock_guard lock(mutex_);
        ++heads_;
        auto it = resources_.find(request.url);
        core::HttpResponse response;
        if (it == resources_.end()) {
            response.status_code = 404;
            return response;
        }
        const auto& res = it->second;
        if (!res.allow_head) {
            response.status_code = 405;
            return response;
        }
        fill(response, res, res.status);
        return response;
    }

    std::expected<core::HttpResponse, std::error_code>
    get(const core::HttpRequest& request, const core::BodyHandler& on_body, std::stop_token stoken) noexcept override {
        std::optional<FakeResource> res;
        std::optional<Fault> fault;
        {
            std::lock_guard lock(mutex_);
            gets_.push_back(request);
            if (auto it = resources_.find(request.url); it != resources_.end()) {
                res = it->second;
            }
            fault = take_fault(request);
        }

        core::HttpResponse response;
        if (!res) {
            response.status_code = 404;
            return response;
        }

        if (fault && fault->kind == Fault::Kind::transport_error) {
            return std::unexpected(make_error_code(core::DownloadErrc::network_error));
        }
        if (fault && fault->kind == Fault::Kind::block) {
            std::mutex m;
            std::condition_variable_any cv;
            std::unique_lock lock(m);
            cv.wait_for(lock, stoken, std::chrono::seconds{10}, [] { return false; });
            return std::unexpected(make_error_code(core::DownloadErrc::cancelled));
        }
        if (fault && fault->kind == Fault::Kind::status) {
            response.status_code = fault->status;
            return response;
        }

        std::string payload = res->body;
        std::int32_t status = res->status;
        const bool honor_range = res->ranges && !(fault && fault->kind == Fault::Kind::ignore_range);

        if (request.range && honor_range) {
            auto first = request.range->first;
            auto last = std::min<std::uint64_t>(request.range->last.value_or(payload.size() - 1), payload.size() - 1);
            if (first >= payload.size()) {
                response.status_code = 416;
                return response;
            }
            payload = payload.substr(first, last - first + 1);
            status = 206;
        }

        if (fault && fault->kind == Fault::Kind::truncate) {
            payload.resize(std::min(payload.size(), fault->bytes));
        }
        if (fault && fault->kind == Fault::Kind::oversize) {
            payload.append(fault->bytes, '#');
        }

        fill(response, *res, status);
        response.content_length = payload.size();

        for (std::size_t pos = 0; pos < payload.size(); pos += slice) {
            if (stoken.stop_requested()) {
                return std::unexpected(make_error_code(core::DownloadErrc::cancelled));
            }
            auto n = std::min(slice, payload.size() - pos);
            if (!on_body(status, payload.data() + pos, n)) {
                return response;
            }
        }
        return response;
    }

private:
    static void fill(core::HttpResponse& response, const FakeResource& res, std::int32_t status) {
        response.status_code = status;
        response.content_length = res.report_length ? res.body.size() : 0;
        response.accepts_ranges = res.advertise_ranges;
        response.filename = res.disposition;
        response.content_type = "application/octet-stream";
    }

    std::optional<Fault> take_fault(const core::HttpRequest& request) {
        auto it = faults_.find(request.url);
        if (it == faults_.end()) return std::nullopt;
        auto& queue = it->second;
        for (auto f = queue.begin(); f != queue.end(); ++f) {
            if (f->range_first && (!request.range || request.range->first != *f->range_first)) {
                continue;
            }
            Fault taken = *f;
            queue.erase(f);
            return taken;
        }
        return std::nullopt;
    }

    std::map<std::string, FakeResource> resources_;
    std::map<std::string, std::deque<Fault>> faults_;
    std::vector<core::HttpRequest> gets_;
    std::size_t heads_{0};
    mutable std::mutex mutex_;
};

// Engine that serves byte ranges out of a FakeTransport resource
class FakeEngine final : public core::ExternalEngine {
public:
    explicit FakeEngine(std::string body) : body_(std::move(body)) {}

    std::error_code fetch(const core::EngineRequest& request, const fs::path& output,
                          std::stop_token stoken) noexcept override {
        ++calls;
        {
            std::lock_guard lock(mutex_);
            last = request;
        }
        if (stoken.stop_requested()) {
            return make_error_code(core::DownloadErrc::cancelled);
        }
        if (fail_next.fetch_sub(1) > 0) {
            return make_error_code(core::DownloadErrc::engine_failed);
        }
        auto first = request.range.first;
        auto last_byte = request.range.last.value_or(body_.size() - 1);
        write_file(output, body_.substr(first, last_byte - first + 1));
        return {};
    }

    std::string_view name() const noexcept override { return "fake"; }

    std::atomic<int> calls{0};
    std::atomic<int> fail_next{0};
    core::EngineRequest last;

private:
    std::string body_;
    std::mutex mutex_;
};

} // namespace fetchr::test
