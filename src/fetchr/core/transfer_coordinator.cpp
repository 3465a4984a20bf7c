// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fetchr/core/transfer_coordinator.hpp>
#include <fetchr/core/assembler.hpp>
#include <fetchr/core/log.hpp>
#include <fetchr/core/segment_store.hpp>
#include <fetchr/disk/append_file.hpp>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

namespace fetchr::core {

namespace {

std::error_code validate(const ResourceDescriptor& descriptor) noexcept {
    if (descriptor.url.empty()) {
        return make_error_code(DownloadErrc::invalid_config);
    }
    if (!is_safe_filename(descriptor.filename)) {
        log::get()->error("Refusing unsafe filename \"{}\" for {}", descriptor.filename, descriptor.url);
        return make_error_code(DownloadErrc::invalid_filename);
    }
    return {};
}

std::error_code prepare_dir(const std::filesystem::path& dir) noexcept {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    return ec;
}

// Serializes progress reports from many workers and throttles them
class ProgressAggregator {
public:
    ProgressAggregator(const SegmentStore& store, const std::vector<Segment>& segments,
                       std::uint64_t total, const ProgressCallback& on_progress,
                       std::chrono::milliseconds interval)
        : store_(store), segments_(segments), total_(total)
        , on_progress_(on_progress), interval_(interval) {}

    // The callback runs outside the lock so a slow caller never holds up workers
    void tick(bool force = false) {
        if (!on_progress_) return;
        std::uint64_t downloaded = 0;
        {
            std::lock_guard lock(mutex_);
            auto now = std::chrono::steady_clock::now();
            if (!force && now - last_ < interval_) return;
            last_ = now;
            downloaded = store_.downloaded_bytes(segments_);
        }
        on_progress_(downloaded, total_);
    }

private:
    const SegmentStore& store_;
    const std::vector<Segment>& segments_;
    std::uint64_t total_;
    const ProgressCallback& on_progress_;
    std::chrono::milliseconds interval_;
    std::chrono::steady_clock::time_point last_{};
    std::mutex mutex_;
};

} // namespace

//=============================================================================
// TransferCoordinator
//=============================================================================

TransferCoordinator::TransferCoordinator(HttpTransport& transport, WorkerOptions options)
    : transport_(transport)
    , options_(std::move(options)) {}

std::expected<std::filesystem::path, TransferError>
TransferCoordinator::run(const ResourceDescriptor& descriptor,
                         const std::filesystem::path& target_dir,
                         std::uint32_t parallelism,
                         const ProgressCallback& on_progress,
                         std::stop_token stoken) noexcept {
    if (auto ec = validate(descriptor); ec) {
        return std::unexpected(TransferError{ec});
    }
    if (!descriptor.size_known()) {
        return run_streamed(descriptor, target_dir, on_progress, stoken);
    }

    try {
        if (auto ec = prepare_dir(target_dir); ec) {
            log::get()->error("Cannot create {}: {}", target_dir.string(), ec.message());
            return std::unexpected(TransferError{ec});
        }

        const auto segments = plan(descriptor.total_size, parallelism);
        const auto final_path = target_dir / descriptor.filename;
        SegmentStore store(target_dir, descriptor.filename);

        auto classes = store.classify(segments);
        log::get()->info("{}: {} segments, {} complete, {} partial, {} missing, {} corrupted",
                         descriptor.filename, segments.size(), classes.complete.size(),
                         classes.partial.size(), classes.missing.size(), classes.corrupted.size());
        if (!classes.corrupted.empty()) {
            store.cleanup_corrupted(segments);
        }

        ProgressAggregator progress(store, segments, descriptor.total_size, on_progress,
                                    options_.config.job_progress_interval);
        SegmentProgressCallback on_segment = [&progress](std::uint32_t, std::uint64_t, std::uint64_t) {
            progress.tick();
        };

        SegmentWorker worker(transport_, options_);
        std::vector<std::expected<std::filesystem::path, std::error_code>> results(
            segments.size(), std::unexpected(make_error_code(DownloadErrc::segment_failed)));

        {
            std::vector<std::jthread> threads;
            threads.reserve(segments.size());
            for (std::size_t i = 0; i < segments.size(); ++i) {
                threads.emplace_back([&, i] {
                    results[i] = worker.fetch(descriptor, segments[i], target_dir, stoken, on_segment);
                });
            }
        } // Join all; failures never cancel siblings

        progress.tick(true);

        TransferError error;
        error.total_bytes = descriptor.total_size;
        error.segment_count = static_cast<std::uint32_t>(segments.size());
        bool range_unsupported = false;

        for (std::size_t i = 0; i < segments.size(); ++i) {
            if (results[i]) {
                error.preserved_bytes += segments[i].expected_size();
                continue;
            }
            error.failed_segments.push_back(segments[i].index);
            if (results[i].error() == DownloadErrc::range_unsupported) {
                range_unsupported = true;
            }
        }

        if (!error.failed_segments.empty()) {
            if (stoken.stop_requested()) {
                error.code = make_error_code(DownloadErrc::cancelled);
            } else if (range_unsupported) {
                error.code = make_error_code(DownloadErrc::range_unsupported);
            } else {
                error.code = make_error_code(DownloadErrc::transfer_failed);
            }
            log::get()->error("{}: {}", descriptor.filename, error.message());
            return std::unexpected(std::move(error));
        }

        Assembler assembler(options_.config.assembly);
        if (auto assembled = assembler.assemble(target_dir, descriptor.filename, segments); !assembled) {
            error.code = assembled.error();
            error.preserved_bytes = store.downloaded_bytes(segments);
            return std::unexpected(std::move(error));
        }

        log::get()->info("Downloaded {} ({} bytes)", final_path.string(), descriptor.total_size);
        return final_path;
    } catch (const std::exception& e) {
        log::get()->error("{}: {}", descriptor.filename, e.what());
        return std::unexpected(TransferError{make_error_code(DownloadErrc::transfer_failed)});
    }
}

std::expected<std::filesystem::path, TransferError>
TransferCoordinator::run_streamed(const ResourceDescriptor& descriptor,
                                  const std::filesystem::path& target_dir,
                                  const ProgressCallback& on_progress,
                                  std::stop_token stoken) noexcept {
    if (auto ec = validate(descriptor); ec) {
        return std::unexpected(TransferError{ec});
    }

    try {
        if (auto ec = prepare_dir(target_dir); ec) {
            log::get()->error("Cannot create {}: {}", target_dir.string(), ec.message());
            return std::unexpected(TransferError{ec});
        }

        const auto part = segment_path(target_dir, descriptor.filename, 0);
        const auto final_path = target_dir / descriptor.filename;
        const auto& retry = options_.config.retry;

        log::get()->info("{}: single connection{}", descriptor.filename,
                         descriptor.size_known() ? "" : ", size unknown");

        std::error_code ec;
        for (std::uint32_t attempt_no = 0; attempt_no < retry.attempts(); ++attempt_no) {
            ec = stream_once(descriptor, part, on_progress, stoken);
            if (!ec || ec == DownloadErrc::cancelled || stoken.stop_requested()) {
                break;
            }
            if (attempt_no + 1 < retry.attempts()) {
                auto delay = retry.delay(attempt_no);
                log::get()->warn("{}: attempt {}/{} failed: {}, retrying in {} ms", descriptor.filename,
                                 attempt_no + 1, retry.attempts(), ec.message(), delay.count());
                if (!sleep_for(delay, stoken)) {
                    ec = make_error_code(DownloadErrc::cancelled);
                    break;
                }
            }
        }

        TransferError error;
        error.total_bytes = descriptor.total_size;
        error.segment_count = 1;

        if (ec) {
            error.code = (stoken.stop_requested() || ec == DownloadErrc::cancelled)
                       ? make_error_code(DownloadErrc::cancelled)
                       : make_error_code(DownloadErrc::transfer_failed);
            error.failed_segments.push_back(0);
            log::get()->error("{}: {} ({})", descriptor.filename, error.message(), ec.message());
            return std::unexpected(std::move(error));
        }

        if (auto rename_ec = disk::rename_file(part, final_path); rename_ec) {
            log::get()->error("Cannot move {} into place: {}", part.string(), rename_ec.message());
            error.code = make_error_code(DownloadErrc::assembly_failed);
            return std::unexpected(std::move(error));
        }

        log::get()->info("Downloaded {}", final_path.string());
        return final_path;
    } catch (const std::exception& e) {
        log::get()->error("{}: {}", descriptor.filename, e.what());
        return std::unexpected(TransferError{make_error_code(DownloadErrc::transfer_failed)});
    }
}

std::error_code TransferCoordinator::stream_once(const ResourceDescriptor& descriptor,
                                                 const std::filesystem::path& part,
                                                 const ProgressCallback& on_progress,
                                                 std::stop_token stoken) const {
    HttpRequest request;
    request.url = descriptor.url;
    request.headers = descriptor.headers;
    for (const auto& [name, value] : options_.extra_headers) {
        request.headers[name] = value;
    }
    request.verify_tls = options_.verify_tls;
    request.proxy = options_.proxies ? options_.proxies->pick() : std::string{};

    // Without ranges there is nothing to resume, every attempt starts over
    auto file = disk::AppendFile::open(part, disk::OpenMode::truncate);
    if (!file) {
        return file.error();
    }

    disk::ChunkBuffer buffer(options_.config.chunk_size);
    std::uint64_t received = 0;
    std::error_code abort_reason;
    auto last_report = std::chrono::steady_clock::time_point{};

    auto flush = [&]() -> std::error_code {
        if (buffer.empty()) return {};
        auto ec = file->write(buffer.data(), buffer.size());
        buffer.reset();
        if (!ec && options_.config.sync_each_chunk) {
            ec = file->sync();
        }
        return ec;
    };

    BodyHandler on_body = [&](std::int32_t status, const char* data, std::size_t size) -> bool {
        if (stoken.stop_requested()) {
            abort_reason = make_error_code(DownloadErrc::cancelled);
            return false;
        }
        if (auto ec = status_to_error(status); ec) {
            abort_reason = ec;
            return false;
        }
        while (size > 0) {
            std::size_t n = buffer.append(data, size);
            data += n;
            size -= n;
            received += n;
            if (buffer.full()) {
                if (auto ec = flush(); ec) {
                    abort_reason = ec;
                    return false;
                }
            }
        }
        auto now = std::chrono::steady_clock::now();
        if (on_progress && now - last_report >= options_.config.job_progress_interval) {
            last_report = now;
            on_progress(received, descriptor.total_size);
        }
        return true;
    };

    auto response = transport_.get(request, on_body, stoken);

    if (auto ec = flush(); ec) {
        return ec;
    }
    file->close();

    if (abort_reason) {
        return abort_reason;
    }
    if (!response) {
        return response.error();
    }
    if (auto ec = status_to_error(response->status_code); ec) {
        return ec;
    }
    if (descriptor.size_known() && received != descriptor.total_size) {
        log::get()->warn("{}: received {} bytes, expected {}", descriptor.filename, received, descriptor.total_size);
        return make_error_code(received < descriptor.total_size ? DownloadErrc::short_read
                                                                : DownloadErrc::size_mismatch);
    }
    if (on_progress) {
        on_progress(received, descriptor.size_known() ? descriptor.total_size : received);
    }
    return {};
}

} // namespace fetchr::core
