// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/core/config.hpp>
#include <volley/core/range_planner.hpp>
#include <volley/disk/error.hpp>
#include <cstdint>
#include <filesystem>

namespace volley::disk {

// Final output path and the temp artifacts derived from it
struct OutputPaths {
    std::filesystem::path output;
    std::filesystem::path temp_file;    // <output>.volley.part
    std::filesystem::path parts_dir;    // <output>.volley.parts

    [[nodiscard]] static OutputPaths for_output(const std::filesystem::path& output);

    [[nodiscard]] std::filesystem::path chunk_path(std::uint32_t index) const;
};

// Turns finished chunk sinks into the output file. The output only ever appears
// through a rename of a fully verified temp file.
class Reassembler {
public:
    Reassembler(OutputPaths paths, core::SinkMode mode)
        : paths_(std::move(paths)), mode_(mode) {}

    // Create the directory holding part files (part_files mode only)
    [[nodiscard]] std::error_code prepare() noexcept;

    // single_file: verify the temp file length equals total_size.
    // part_files: concatenate parts in index order, verifying each against its plan entry.
    // Then rename into place. Size mismatches are DownloadErrc::integrity_error.
    [[nodiscard]] std::error_code assemble(const core::ChunkPlan& plan, std::uint64_t total_size) noexcept;

    // Remove every temp artifact; the output path is never touched
    void discard() noexcept;

    [[nodiscard]] const OutputPaths& paths() const noexcept { return paths_; }

private:
    [[nodiscard]] std::error_code concatenate(const core::ChunkPlan& plan, std::uint64_t& copied) noexcept;
    [[nodiscard]] std::error_code commit() noexcept;

    OutputPaths paths_;
    core::SinkMode mode_;
};

} // namespace volley::disk
