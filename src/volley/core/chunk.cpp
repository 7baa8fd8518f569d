// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/chunk.hpp>
#include <volley/core/log.hpp>
#include <condition_variable>
#include <random>

namespace volley::core {

namespace {

double jitter_sample() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    return std::uniform_real_distribution<double>{0.0, 1.0}(rng);
}

// True when a 200 for this chunk still yields exactly the requested bytes
bool covers_whole_resource(const ChunkPlanEntry& entry, const ResourceInfo& resource) noexcept {
    return entry.start_offset == 0
        && resource.total_size
        && entry.byte_count == *resource.total_size;
}

std::error_code unexpected(long status) noexcept {
    auto ec = status_to_error(status);
    return ec ? ec : make_error_code(DownloadErrc::unexpected_status);
}

} // namespace

std::string_view to_string(ChunkStatus status) noexcept {
    switch (status) {
        case ChunkStatus::pending:      return "pending";
        case ChunkStatus::in_progress:  return "in_progress";
        case ChunkStatus::retrying:     return "retrying";
        case ChunkStatus::complete:     return "complete";
        case ChunkStatus::failed:       return "failed";
    }
    return "unknown";
}

//=============================================================================
// ChunkState
//=============================================================================

std::error_code ChunkState::error() const noexcept {
    std::lock_guard lock(error_mutex_);
    return error_;
}

void ChunkState::set_error(std::error_code ec) noexcept {
    std::lock_guard lock(error_mutex_);
    error_ = ec;
}

ChunkSnapshot ChunkState::snapshot() const noexcept {
    return ChunkSnapshot{entry_, status(), bytes_written(), attempt_count(), error()};
}

std::uint32_t ChunkState::begin_attempt() noexcept {
    bytes_written_.store(0, std::memory_order_relaxed);
    auto n = attempt_count_.fetch_add(1, std::memory_order_relaxed) + 1;
    status_.store(ChunkStatus::in_progress, std::memory_order_release);
    return n;
}

void ChunkState::mark_retrying(std::error_code cause) noexcept {
    set_error(cause);
    status_.store(ChunkStatus::retrying, std::memory_order_release);
}

void ChunkState::mark_complete() noexcept {
    set_error({});
    status_.store(ChunkStatus::complete, std::memory_order_release);
}

void ChunkState::mark_failed(std::error_code ec) noexcept {
    set_error(ec);
    status_.store(ChunkStatus::failed, std::memory_order_release);
}

//=============================================================================
// ChunkFetcher
//=============================================================================

std::error_code ChunkFetcher::fetch(ChunkState& state,
                                    const ResourceInfo& resource,
                                    disk::ChunkSink& sink,
                                    std::stop_token stop) const {
    const auto& entry = state.entry();
    const auto cancelled = make_error_code(DownloadErrc::cancelled);

    if (entry.empty()) {
        state.begin_attempt();
        state.mark_complete();
        return {};
    }

    for (;;) {
        if (stop.stop_requested()) {
            state.mark_failed(cancelled);
            return cancelled;
        }

        auto attempt_no = state.begin_attempt();
        VOLLEY_TRACE("Chunk {} attempt {}", entry.index, attempt_no);

        auto ec = attempt(state, resource, sink, stop);
        if (!ec) {
            if (auto fec = sink.finish()) {
                state.mark_failed(fec);
                return fec;
            }
            state.mark_complete();
            VOLLEY_DEBUG("Chunk {} complete ({} bytes, {} attempts)", entry.index, state.bytes_written(), attempt_no);
            return {};
        }

        if (stop.stop_requested() || ec == cancelled) {
            state.mark_failed(cancelled);
            return cancelled;
        }

        if (!is_transient(ec) || policy_.exhausted(attempt_no)) {
            state.mark_failed(ec);
            return ec;
        }

        auto delay = policy_.backoff(attempt_no, policy_.jitter > 0.0 ? jitter_sample() : 0.0);
        state.mark_retrying(ec);
        VOLLEY_WARN("Chunk {} attempt {}/{} failed: {}; retrying in {} ms",
                    entry.index, attempt_no, policy_.max_retries, ec.message(), delay.count());

        if (!wait(delay, stop)) {
            state.mark_failed(cancelled);
            return cancelled;
        }

        if (auto rec = sink.reset()) {
            state.mark_failed(rec);
            return rec;
        }
    }
}

std::error_code ChunkFetcher::attempt(ChunkState& state,
                                      const ResourceInfo& resource,
                                      disk::ChunkSink& sink,
                                      std::stop_token stop) const {
    const auto& entry = state.entry();
    const bool bounded = entry.bounded();
    const bool ranged = bounded && resource.supports_ranges;
    const bool whole = covers_whole_resource(entry, resource);

    std::optional<ByteRange> range;
    if (ranged) {
        range = ByteRange{entry.start_offset, entry.end_offset};
    }

    ResponseHandler handler;
    handler.on_head = [&](const ResponseHead& head) -> std::error_code {
        if (ranged && head.status == 206) {
            if (head.content_range && head.content_range->first != entry.start_offset) {
                return make_error_code(DownloadErrc::invalid_range);
            }
        } else if (head.status == 200) {
            // Server sent the whole body: only usable when that is what we asked for
            if (ranged && !whole) {
                return make_error_code(DownloadErrc::range_ignored);
            }
        } else {
            return unexpected(head.status);
        }

        if (bounded && head.content_length && *head.content_length != entry.byte_count) {
            return make_error_code(DownloadErrc::length_mismatch);
        }
        return {};
    };

    handler.on_body = [&](std::span<const std::byte> data) -> std::error_code {
        if (bounded && state.bytes_written() + data.size() > entry.byte_count) {
            return make_error_code(DownloadErrc::length_mismatch);
        }
        if (auto ec = sink.write(data)) {
            return ec;
        }
        state.add_bytes(data.size());
        return {};
    };

    auto result = transport_.fetch(resource.url, range, options_, handler, stop);
    if (!result) {
        return result.error();
    }

    if (bounded && state.bytes_written() != entry.byte_count) {
        // Stream closed early
        return make_error_code(DownloadErrc::length_mismatch);
    }
    return {};
}

bool ChunkFetcher::wait(std::chrono::milliseconds delay, std::stop_token stop) {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    cv.wait_for(lock, stop, delay, [] { return false; });
    return !stop.stop_requested();
}

} // namespace volley::core
