// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/disk/reassembler.hpp>
#include <volley/disk/random_access_file.hpp>
#include <volley/core/log.hpp>
#include <algorithm>
#include <format>
#include <vector>

namespace volley::disk {

namespace fs = std::filesystem;

OutputPaths OutputPaths::for_output(const fs::path& output) {
    OutputPaths paths;
    paths.output = output;
    paths.temp_file = output;
    paths.temp_file += ".volley.part";
    paths.parts_dir = output;
    paths.parts_dir += ".volley.parts";
    return paths;
}

fs::path OutputPaths::chunk_path(std::uint32_t index) const {
    return parts_dir / std::format("chunk_{}", index);
}

std::error_code Reassembler::prepare() noexcept {
    if (mode_ != core::SinkMode::part_files) return {};

    std::error_code ec;
    fs::create_directories(paths_.parts_dir, ec);
    return ec ? errno_to_error_code(ec.value()) : std::error_code{};
}

std::error_code Reassembler::assemble(const core::ChunkPlan& plan, std::uint64_t total_size) noexcept {
    std::uint64_t actual = 0;

    if (mode_ == core::SinkMode::part_files) {
        if (auto ec = concatenate(plan, actual)) {
            return ec;
        }
    } else {
        std::error_code ec;
        actual = fs::file_size(paths_.temp_file, ec);
        if (ec) {
            return errno_to_error_code(ec.value());
        }
    }

    if (actual != total_size) {
        VOLLEY_ERROR("Reassembly size mismatch: expected {} bytes, have {}", total_size, actual);
        return make_error_code(core::DownloadErrc::integrity_error);
    }

    return commit();
}

std::error_code Reassembler::concatenate(const core::ChunkPlan& plan, std::uint64_t& copied) noexcept {
    copied = 0;

    std::vector<const core::ChunkPlanEntry*> ordered;
    std::vector<std::byte> buffer;
    try {
        ordered.reserve(plan.size());
        for (const auto& entry : plan) ordered.push_back(&entry);
        buffer.resize(core::COPY_BUFFER_SIZE);
    } catch (...) {
        return make_error_code(DiskErrc::allocation_failed);
    }
    std::ranges::sort(ordered, {}, &core::ChunkPlanEntry::index);

    auto out = RandomAccessFile::open(paths_.temp_file.native(), OpenMode::create_truncate);
    if (!out) {
        return out.error();
    }

    for (const auto* entry : ordered) {
        auto part = RandomAccessFile::open(paths_.chunk_path(entry->index).native(), OpenMode::read_only);
        if (!part) {
            // A missing part for a zero-length chunk is not an error
            if (entry->empty()) continue;
            return part.error();
        }

        std::uint64_t part_bytes = 0;
        for (;;) {
            auto n = part->read(part_bytes, buffer.data(), buffer.size());
            if (!n) return n.error();
            if (*n == 0) break;

            if (auto ec = out->write(copied, buffer.data(), *n)) {
                return ec;
            }
            part_bytes += *n;
            copied += *n;
        }

        if (entry->bounded() && part_bytes != entry->byte_count) {
            VOLLEY_ERROR("Part {} holds {} bytes, plan says {}", entry->index, part_bytes, entry->byte_count);
            return make_error_code(core::DownloadErrc::integrity_error);
        }
    }

    if (auto ec = out->flush()) {
        return ec;
    }
    out->close();

    std::error_code ec;
    fs::remove_all(paths_.parts_dir, ec);
    if (ec) {
        VOLLEY_WARN("Could not remove {}: {}", paths_.parts_dir.string(), ec.message());
    }
    return {};
}

std::error_code Reassembler::commit() noexcept {
    std::error_code ec;
    fs::rename(paths_.temp_file, paths_.output, ec);
    if (ec) {
        VOLLEY_ERROR("Could not move {} to {}: {}", paths_.temp_file.string(), paths_.output.string(), ec.message());
        return make_error_code(DiskErrc::rename_failed);
    }
    VOLLEY_INFO("Saved {}", paths_.output.string());
    return {};
}

void Reassembler::discard() noexcept {
    std::error_code ec;
    fs::remove(paths_.temp_file, ec);
    fs::remove_all(paths_.parts_dir, ec);
}

} // namespace volley::disk
