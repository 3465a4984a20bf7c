// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fetchr/core/assembler.hpp>
#include <fetchr/core/log.hpp>
#include <fetchr/core/resource.hpp>
#include <fetchr/core/segment_store.hpp>
#include <fetchr/disk/append_file.hpp>

namespace fetchr::core {

std::filesystem::path assembling_path(const std::filesystem::path& final_path) {
    auto path = final_path;
    path += ".assembling";
    return path;
}

std::expected<std::uint64_t, std::error_code>
Assembler::assemble(const std::filesystem::path& dir,
                    const std::string& filename,
                    const std::vector<Segment>& segments) const noexcept {
    const auto failed = [] { return std::unexpected(make_error_code(DownloadErrc::assembly_failed)); };

    if (!is_safe_filename(filename)) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_filename));
    }

    const auto final_path = dir / filename;

    try {
        SegmentStore store(dir, filename);

        // Validate everything before touching the output
        for (const auto& seg : segments) {
            auto st = store.status(seg);
            if (st.state != SegmentState::complete) {
                log::get()->error("Cannot assemble {}: segment {} has {} bytes, expected {}",
                                  final_path.string(), seg.index, st.bytes, seg.expected_size());
                return failed();
            }
        }

        const auto temp = assembling_path(final_path);
        const auto expected = total_expected(segments);

        {
            auto out = disk::AppendFile::open(temp, disk::OpenMode::truncate);
            if (!out) {
                log::get()->error("Cannot create {}: {}", temp.string(), out.error().message());
                return failed();
            }

            for (const auto& seg : segments) {
                auto artifact = store.path(seg.index);
                auto copied = out->append_from(artifact);
                if (!copied) {
                    log::get()->error("Copying {} failed: {}", artifact.string(), copied.error().message());
                    out->close();
                    if (auto ec = disk::remove_file(temp); ec) {
                        log::get()->warn("Could not remove {}: {}", temp.string(), ec.message());
                    }
                    return failed();
                }
                if (mode_ == AssemblyMode::delete_as_copied) {
                    if (auto ec = disk::remove_file(artifact); ec) {
                        log::get()->warn("Could not remove {}: {}", artifact.string(), ec.message());
                    }
                }
            }

            if (auto ec = out->sync(); ec) {
                log::get()->warn("fsync of {} failed: {}", temp.string(), ec.message());
            }
        }

        auto size = disk::file_size(temp);
        if (!size || *size != expected) {
            log::get()->error("Assembled {} has {} bytes, expected {}",
                              temp.string(), size ? *size : 0, expected);
            if (auto ec = disk::remove_file(temp); ec) {
                log::get()->warn("Could not remove {}: {}", temp.string(), ec.message());
            }
            return failed();
        }

        if (auto ec = disk::rename_file(temp, final_path); ec) {
            log::get()->error("Cannot move {} into place: {}", temp.string(), ec.message());
            if (auto rm = disk::remove_file(temp); rm) {
                log::get()->warn("Could not remove {}: {}", temp.string(), rm.message());
            }
            return failed();
        }

        if (mode_ == AssemblyMode::atomic) {
            for (const auto& seg : segments) {
                auto artifact = store.path(seg.index);
                if (auto ec = disk::remove_file(artifact); ec) {
                    log::get()->warn("Could not remove {}: {}", artifact.string(), ec.message());
                }
            }
        }

        log::get()->info("Assembled {} ({} bytes from {} segments)", final_path.string(), expected, segments.size());
        return expected;
    } catch (const std::exception& e) {
        log::get()->error("Assembly of {} failed: {}", final_path.string(), e.what());
        return failed();
    }
}

} // namespace fetchr::core
