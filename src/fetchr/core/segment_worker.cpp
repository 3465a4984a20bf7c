// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fetchr/core/segment_worker.hpp>
#include <fetchr/core/log.hpp>
#include <fetchr/disk/append_file.hpp>
#include <condition_variable>
#include <mutex>

namespace fetchr::core {

namespace {

void discard_scratch(const std::filesystem::path& scratch) noexcept {
    if (auto ec = disk::remove_file(scratch); ec) {
        log::get()->warn("Could not remove {}: {}", scratch.string(), ec.message());
    }
}

} // namespace

struct SegmentWorker::Attempt {
    const ResourceDescriptor& descriptor;
    const Segment& segment;
    const SegmentStore& store;
    const std::filesystem::path& artifact;
    std::stop_token stoken;
    const SegmentProgressCallback& on_progress;
    std::chrono::steady_clock::time_point last_report{};

    void report(std::uint64_t segment_bytes, std::chrono::milliseconds interval, bool force = false) {
        if (!on_progress) return;
        auto now = std::chrono::steady_clock::now();
        if (!force && now - last_report < interval) return;
        last_report = now;
        on_progress(segment.index, segment_bytes, descriptor.total_size);
    }
};

bool sleep_for(std::chrono::milliseconds delay, std::stop_token stoken) {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    cv.wait_for(lock, stoken, delay, [] { return false; });
    return !stoken.stop_requested();
}

//=============================================================================
// SegmentWorker
//=============================================================================

SegmentWorker::SegmentWorker(HttpTransport& transport, WorkerOptions options)
    : transport_(transport)
    , options_(std::move(options)) {}

std::expected<std::filesystem::path, std::error_code>
SegmentWorker::fetch(const ResourceDescriptor& descriptor,
                     const Segment& segment,
                     const std::filesystem::path& dir,
                     std::stop_token stoken,
                     const SegmentProgressCallback& on_progress) const noexcept {
    try {
        SegmentStore store(dir, descriptor.filename);
        auto artifact = store.path(segment.index);
        Attempt ctx{descriptor, segment, store, artifact, stoken, on_progress};

        const auto& retry = options_.config.retry;
        for (std::uint32_t attempt_no = 0; attempt_no < retry.attempts(); ++attempt_no) {
            if (stoken.stop_requested()) {
                return std::unexpected(make_error_code(DownloadErrc::cancelled));
            }

            auto ec = attempt(ctx);
            if (!ec) {
                log::get()->debug("Segment {} of {} complete ({} bytes)",
                                  segment.index, descriptor.filename, segment.expected_size());
                ctx.report(segment.expected_size(), options_.config.segment_progress_interval, true);
                return artifact;
            }

            if (ec == DownloadErrc::cancelled || stoken.stop_requested()) {
                log::get()->debug("Segment {} of {} cancelled", segment.index, descriptor.filename);
                return std::unexpected(make_error_code(DownloadErrc::cancelled));
            }
            if (ec == DownloadErrc::range_unsupported) {
                log::get()->error("Segment {} of {}: server ignored the Range header",
                                  segment.index, descriptor.filename);
                return std::unexpected(ec);
            }

            if (attempt_no + 1 < retry.attempts()) {
                auto delay = retry.delay(attempt_no);
                log::get()->warn("Segment {} of {} attempt {}/{} failed: {}, retrying in {} ms",
                                 segment.index, descriptor.filename, attempt_no + 1, retry.attempts(),
                                 ec.message(), delay.count());
                if (!sleep_for(delay, stoken)) {
                    return std::unexpected(make_error_code(DownloadErrc::cancelled));
                }
            } else {
                log::get()->error("Segment {} of {} failed after {} attempts: {}",
                                  segment.index, descriptor.filename, retry.attempts(), ec.message());
            }
        }
        return std::unexpected(make_error_code(DownloadErrc::segment_failed));
    } catch (const std::exception& e) {
        log::get()->error("Segment {} of {}: {}", segment.index, descriptor.filename, e.what());
        return std::unexpected(make_error_code(DownloadErrc::segment_failed));
    }
}

std::error_code SegmentWorker::attempt(Attempt& ctx) const {
    auto st = ctx.store.status(ctx.segment);

    if (st.state == SegmentState::complete) {
        return {};
    }

    std::uint64_t existing = st.bytes;
    if (st.state == SegmentState::corrupted) {
        log::get()->warn("Segment {} of {} has {} bytes, expected {}; refetching",
                         ctx.segment.index, ctx.descriptor.filename, st.bytes, ctx.segment.expected_size());
        if (auto ec = disk::remove_file(ctx.artifact); ec) {
            return ec;
        }
        existing = 0;
    }

    std::uint64_t current_start = ctx.segment.start_byte + existing;
    if (existing > 0) {
        log::get()->debug("Segment {} of {} resuming at byte {}",
                          ctx.segment.index, ctx.descriptor.filename, current_start);
    }

    return options_.engine ? attempt_engine(ctx, current_start) : attempt_http(ctx, current_start);
}

std::error_code SegmentWorker::attempt_http(Attempt& ctx, std::uint64_t current_start) const {
    const auto& seg = ctx.segment;
    const std::uint64_t requested = seg.end_byte - current_start + 1;
    const std::uint64_t existing = current_start - seg.start_byte;
    const bool whole_resource = current_start == 0 && seg.end_byte + 1 == ctx.descriptor.total_size;

    HttpRequest request;
    request.url = ctx.descriptor.url;
    request.headers = request_headers(ctx.descriptor);
    request.range = ByteRange{current_start, seg.end_byte};
    request.verify_tls = options_.verify_tls;
    request.proxy = options_.proxies ? options_.proxies->pick() : std::string{};

    disk::ChunkBuffer buffer(options_.config.chunk_size);

    auto file = disk::AppendFile::open(ctx.artifact);
    if (!file) {
        return file.error();
    }

    std::uint64_t received = 0;
    std::error_code abort_reason;

    auto flush = [&]() -> std::error_code {
        if (buffer.empty()) return {};
        auto ec = file->write(buffer.data(), buffer.size());
        buffer.reset();
        if (!ec && options_.config.sync_each_chunk) {
            ec = file->sync();
        }
        return ec;
    };

    auto accept_status = [&](std::int32_t status) -> std::error_code {
        if (status == 206) return {};
        if (status == 200) {
            if (options_.accept_full_response && whole_resource) return {};
            return make_error_code(DownloadErrc::range_unsupported);
        }
        if (auto ec = status_to_error(status); ec) return ec;
        return make_error_code(DownloadErrc::unexpected_status);
    };

    BodyHandler on_body = [&](std::int32_t status, const char* data, std::size_t size) -> bool {
        if (ctx.stoken.stop_requested()) {
            abort_reason = make_error_code(DownloadErrc::cancelled);
            return false;
        }
        if (auto ec = accept_status(status); ec) {
            abort_reason = ec;
            return false;
        }

        // Never write past end_byte
        std::uint64_t room = requested - received;
        bool overflow = size > room;
        std::size_t take = overflow ? static_cast<std::size_t>(room) : size;

        while (take > 0) {
            std::size_t n = buffer.append(data, take);
            data += n;
            take -= n;
            received += n;
            if (buffer.full()) {
                if (auto ec = flush(); ec) {
                    abort_reason = ec;
                    return false;
                }
                ctx.report(existing + received, options_.config.segment_progress_interval);
            }
        }

        if (overflow) {
            abort_reason = make_error_code(DownloadErrc::size_mismatch);
            return false;
        }
        return true;
    };

    auto response = transport_.get(request, on_body, ctx.stoken);

    // Keep what arrived before a failure so the next attempt resumes after it
    if (auto ec = flush(); ec) {
        return ec;
    }
    file->close();
    ctx.report(existing + received, options_.config.segment_progress_interval);

    if (abort_reason) {
        return abort_reason;
    }
    if (!response) {
        return response.error();
    }
    // Status of an empty body never reached the handler
    if (auto ec = accept_status(response->status_code); ec) {
        return ec;
    }
    if (received != requested) {
        log::get()->debug("Segment {} of {} short read: {} of {} bytes",
                          seg.index, ctx.descriptor.filename, received, requested);
        return make_error_code(DownloadErrc::short_read);
    }
    return {};
}

std::error_code SegmentWorker::attempt_engine(Attempt& ctx, std::uint64_t current_start) const {
    const auto& seg = ctx.segment;
    const std::uint64_t requested = seg.end_byte - current_start + 1;

    EngineRequest request;
    request.url = ctx.descriptor.url;
    request.headers = request_headers(ctx.descriptor);
    request.range = ByteRange{current_start, seg.end_byte};
    request.verify_tls = options_.verify_tls;
    request.proxy = options_.proxies ? options_.proxies->pick() : std::string{};

    auto scratch = ctx.artifact;
    scratch += ".engine";

    if (auto ec = disk::remove_file(scratch); ec) {
        return ec;
    }

    auto ec = options_.engine->fetch(request, scratch, ctx.stoken);
    if (ec) {
        discard_scratch(scratch);
        return ec;
    }

    auto size = disk::file_size(scratch);
    if (!size) {
        return make_error_code(DownloadErrc::short_read);
    }
    if (*size > requested) {
        discard_scratch(scratch);
        return make_error_code(DownloadErrc::size_mismatch);
    }

    auto file = disk::AppendFile::open(ctx.artifact);
    if (!file) {
        return file.error();
    }
    auto copied = file->append_from(scratch);
    if (copied && options_.config.sync_each_chunk) {
        if (auto sync_ec = file->sync(); sync_ec) {
            return sync_ec;
        }
    }
    file->close();
    discard_scratch(scratch);

    if (!copied) {
        return copied.error();
    }
    ctx.report(current_start - seg.start_byte + *copied, options_.config.segment_progress_interval);
    return *copied == requested ? std::error_code{} : make_error_code(DownloadErrc::short_read);
}

Headers SegmentWorker::request_headers(const ResourceDescriptor& descriptor) const {
    Headers headers = descriptor.headers;
    for (const auto& [name, value] : options_.extra_headers) {
        headers[name] = value;
    }
    return headers;
}

} // namespace fetchr::core
