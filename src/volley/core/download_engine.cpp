// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/download_engine.hpp>
#include <volley/core/log.hpp>
#include <volley/core/url.hpp>
#include <volley/disk/reassembler.hpp>
#include <volley/version.hpp>
#include <algorithm>
#include <condition_variable>
#include <exception>
#include <memory>
#include <format>
#include <thread>

namespace volley::core {

using namespace std::chrono;

namespace {

// Removes temp artifacts on every exit path except a committed success
struct TempArtifacts {
    disk::Reassembler& reassembler;
    bool committed{false};

    ~TempArtifacts() {
        if (!committed) reassembler.discard();
    }
};

} // namespace

std::string_view to_string(DownloadState state) noexcept {
    switch (state) {
        case DownloadState::idle:          return "idle";
        case DownloadState::probing:       return "probing";
        case DownloadState::planning:      return "planning";
        case DownloadState::downloading:   return "downloading";
        case DownloadState::reassembling:  return "reassembling";
        case DownloadState::succeeded:     return "succeeded";
        case DownloadState::failed:        return "failed";
        case DownloadState::cancelled:     return "cancelled";
    }
    return "unknown";
}

std::string_view to_string(Phase phase) noexcept {
    switch (phase) {
        case Phase::setup:       return "setup";
        case Phase::probe:       return "probe";
        case Phase::plan:        return "planning";
        case Phase::download:    return "download";
        case Phase::reassemble:  return "reassembly";
    }
    return "unknown";
}

//=============================================================================
// JobError
//=============================================================================

JobError JobError::make(std::error_code ec, Phase phase, std::string detail) {
    return JobError{ec, classify(ec), phase, std::nullopt, 0, std::move(detail)};
}

std::string JobError::message() const {
    std::string out{to_string(kind)};

    if (chunk) {
        if (chunk->bounded()) {
            out += std::format(" in chunk {} [{}-{}]", chunk->index, chunk->start_offset, chunk->end_offset);
        } else {
            out += std::format(" in chunk {} [{}-]", chunk->index, chunk->start_offset);
        }
    } else {
        out += std::format(" during {}", to_string(phase));
    }

    if (attempts > 0) {
        out += std::format(" after {} attempt{}", attempts, attempts == 1 ? "" : "s");
    }

    out += ": ";
    out += code.message();
    if (!detail.empty()) {
        out += std::format(" ({})", detail);
    }
    return out;
}

//=============================================================================
// Job
//=============================================================================

struct DownloadEngine::Job {
    Job(const DownloadEngine& engine, ResourceInfo info, ChunkPlan chunk_plan,
        disk::OutputPaths out, std::stop_source source)
        : resource(std::move(info))
        , plan(std::move(chunk_plan))
        , paths(std::move(out))
        , fetcher(engine.transport_, engine.transfer_options(), engine.config_.retry_policy())
        , aggregator(engine.chunks_, resource.total_size)
        , stop_source(std::move(source))
        , stop(stop_source.get_token()) {}

    ResourceInfo resource;
    ChunkPlan plan;
    disk::OutputPaths paths;
    disk::FileWriter writer;            // single_file mode only
    ChunkFetcher fetcher;
    ProgressAggregator aggregator;
    std::stop_source stop_source;
    std::stop_token stop;

    std::atomic<std::size_t> cursor{0}; // Next chunk index to launch

    std::mutex done_mutex;
    std::condition_variable done_cv;
    std::size_t finished_workers{0};
};

//=============================================================================
// DownloadEngine
//=============================================================================

DownloadEngine::DownloadEngine(Transport& transport, DownloadConfig config) noexcept
    : transport_(transport)
    , config_(std::move(config)) {}

DownloadEngine::~DownloadEngine() = default;

TransferOptions DownloadEngine::transfer_options() const {
    TransferOptions options;
    options.timeout = config_.timeout;
    options.user_agent = config_.user_agent.empty() ? version.user_agent() : config_.user_agent;
    options.verify_tls = config_.verify_tls;
    return options;
}

std::expected<ResourceInfo, JobError> DownloadEngine::probe(std::string_view url_str) {
    auto url = Url::parse(url_str);
    if (!url) {
        return fail(JobError::make(url.error(), Phase::setup, std::string(url_str)));
    }

    set_state(DownloadState::probing);
    auto info = transport_.probe(url->full(), transfer_options());
    if (!info) {
        return fail(JobError::make(info.error(), Phase::probe, url->full()));
    }

    if (info->total_size) {
        VOLLEY_INFO("{}: {} bytes, ranges {}", info->url, *info->total_size,
                    info->supports_ranges ? "supported" : "not supported");
    } else {
        VOLLEY_INFO("{}: size unknown, streaming as a single chunk", info->url);
    }
    return *info;
}

std::expected<ChunkPlan, std::error_code> DownloadEngine::make_plan(const ResourceInfo& resource) const {
    if (!resource.known_size()) {
        return plan_unbounded();
    }

    auto total = *resource.total_size;
    if (!resource.supports_ranges) {
        return plan_single(total);
    }
    if (config_.chunk_size > 0) {
        return plan_fixed(total, config_.chunk_size);
    }
    return plan(total, config_.concurrency);
}

std::expected<DownloadReport, JobError>
DownloadEngine::run(std::string_view url_str, const std::filesystem::path& output) {
    auto started = steady_clock::now();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        chunks_.clear();
        progress_ = {};
    }
    auto source = arm_stop_source();

    if (auto ec = config_.validate()) {
        return fail(JobError::make(ec, Phase::setup));
    }
    if (source.stop_requested()) {
        return fail(JobError::make(DownloadErrc::cancelled, Phase::setup));
    }

    auto resource = probe(url_str);
    if (!resource) {
        return std::unexpected(std::move(resource.error()));
    }
    if (cancel_requested_.load(std::memory_order_acquire)) {
        return fail(JobError::make(DownloadErrc::cancelled, Phase::probe));
    }

    set_state(DownloadState::planning);
    auto chunk_plan = make_plan(*resource);
    if (!chunk_plan) {
        return fail(JobError::make(chunk_plan.error(), Phase::plan));
    }
    if (validate_plan(*chunk_plan, resource->total_size.value_or(UNBOUNDED))) {
        return fail(JobError::make(DownloadErrc::integrity_error, Phase::plan, "plan does not cover the resource"));
    }
    VOLLEY_DEBUG("Planned {} chunk(s), {} worker(s), {} sink",
                 chunk_plan->size(), std::min<std::size_t>(config_.concurrency, chunk_plan->size()),
                 to_string(config_.sink_mode));

    std::filesystem::path target = output;
    if (target.empty()) {
        // Already parsed successfully by probe()
        target = default_output_name(*Url::parse(url_str), resource->filename);
    }

    auto paths = disk::OutputPaths::for_output(target);
    disk::Reassembler reassembler(paths, config_.sink_mode);
    TempArtifacts temp{reassembler};

    reset_chunks(*chunk_plan);
    auto job = std::make_unique<Job>(*this, *resource, std::move(*chunk_plan), paths, source);
    if (auto ec = reassembler.prepare()) {
        return fail(JobError::make(ec, Phase::download, paths.parts_dir.string()));
    }

    set_state(DownloadState::downloading);
    auto error = download(*job);
    if (error && error->code == DownloadErrc::range_ignored) {
        // Range support was advertised but the server sends whole bodies: fall back to one stream
        VOLLEY_WARN("Server ignored range request for chunk {}; downloading as a single stream",
                    error->chunk ? error->chunk->index : 0);
        resource->supports_ranges = false;
        reassembler.discard();
        if (auto ec = reassembler.prepare()) {
            return fail(JobError::make(ec, Phase::download, paths.parts_dir.string()));
        }

        auto single = plan_single(*resource->total_size);
        reset_chunks(single);
        job = std::make_unique<Job>(*this, *resource, std::move(single), paths, arm_stop_source());
        error = download(*job);
    }
    if (error) {
        return fail(std::move(*error));
    }

    set_state(DownloadState::reassembling);
    auto bytes = resource->total_size.value_or(job->aggregator.bytes_complete());
    if (auto ec = reassembler.assemble(job->plan, bytes)) {
        return fail(JobError::make(ec, Phase::reassemble, target.string()));
    }
    temp.committed = true;

    DownloadReport report;
    report.resource = *resource;
    report.output_path = target.string();
    report.bytes = bytes;
    report.chunks = job->plan.size();
    for (const auto& chunk : chunks_) {
        report.total_attempts += chunk->attempt_count();
    }
    report.elapsed = duration_cast<milliseconds>(steady_clock::now() - started);

    set_state(DownloadState::succeeded);
    update_progress(job->aggregator);
    return report;
}

std::stop_source DownloadEngine::arm_stop_source() {
    std::stop_source source;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_source_ = source;
    }
    // A cancel() that landed before the swap still applies
    if (cancel_requested_.load(std::memory_order_acquire)) {
        source.request_stop();
    }
    return source;
}

void DownloadEngine::reset_chunks(const ChunkPlan& chunk_plan) {
    std::lock_guard<std::mutex> lock(mutex_);
    chunks_.clear();
    chunks_.reserve(chunk_plan.size());
    for (const auto& entry : chunk_plan) {
        chunks_.push_back(std::make_unique<ChunkState>(entry));
    }
}

std::optional<JobError> DownloadEngine::download(Job& job) {
    if (config_.sink_mode == SinkMode::single_file) {
        if (auto ec = job.writer.open(job.paths.temp_file, job.resource.total_size.value_or(0))) {
            return JobError::make(ec, Phase::download, job.paths.temp_file.string());
        }
    }

    const auto worker_count = std::min<std::size_t>(config_.concurrency, job.plan.size());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        download_start_ = steady_clock::now();
        last_sample_time_ = download_start_;
        last_sample_bytes_ = 0;
    }

    {
        std::vector<std::jthread> workers;
        workers.reserve(worker_count);
        for (std::size_t i = 0; i < worker_count; ++i) {
            workers.emplace_back([this, &job] { worker(job); });
        }

        // Monitor loop: sample progress until every worker has drained the queue
        std::unique_lock<std::mutex> lock(job.done_mutex);
        while (!job.done_cv.wait_for(lock, PROGRESS_SAMPLE_INTERVAL,
                                     [&] { return job.finished_workers == worker_count; })) {
            lock.unlock();
            update_progress(job.aggregator);
            lock.lock();
        }
    }
    update_progress(job.aggregator);

    std::error_code flush_ec;
    if (job.writer.is_open()) {
        flush_ec = job.writer.flush();
        job.writer.close();
    }

    if (auto failure = job.aggregator.first_failure()) {
        auto error = JobError::make(failure->error, Phase::download);
        error.chunk = failure->entry;
        error.attempts = failure->attempts;
        return error;
    }
    if (job.aggregator.succeeded()) {
        // Every byte is in; a cancel arriving now is ignored
        if (flush_ec) {
            return JobError::make(flush_ec, Phase::download, job.paths.temp_file.string());
        }
        return std::nullopt;
    }
    if (cancel_requested_.load(std::memory_order_acquire)) {
        return JobError::make(DownloadErrc::cancelled, Phase::download);
    }
    return JobError::make(DownloadErrc::integrity_error, Phase::download, "chunks left unfinished");
}

void DownloadEngine::worker(Job& job) {
    const auto cancelled = make_error_code(DownloadErrc::cancelled);

    for (;;) {
        auto i = job.cursor.fetch_add(1, std::memory_order_relaxed);
        if (i >= chunks_.size()) break;

        auto& chunk = *chunks_[i];
        if (job.stop.stop_requested()) {
            // Never launched
            chunk.mark_failed(cancelled);
            continue;
        }

        std::error_code ec;
        auto sink = open_sink(job, chunk.entry());
        if (!sink) {
            ec = sink.error();
            chunk.mark_failed(ec);
        } else {
            ec = job.fetcher.fetch(chunk, job.resource, **sink, job.stop);
        }

        if (ec && ec != cancelled && job.aggregator.record_failure(chunk, ec)) {
            VOLLEY_ERROR("Chunk {} failed after {} attempt(s): {}; cancelling remaining chunks",
                         chunk.entry().index, chunk.attempt_count(), ec.message());
            job.stop_source.request_stop();
        }
    }

    {
        std::lock_guard<std::mutex> lock(job.done_mutex);
        ++job.finished_workers;
    }
    job.done_cv.notify_all();
}

std::expected<std::unique_ptr<disk::ChunkSink>, std::error_code>
DownloadEngine::open_sink(Job& job, const ChunkPlanEntry& entry) {
    if (config_.sink_mode == SinkMode::part_files) {
        auto sink = disk::PartFileSink::create(job.paths.chunk_path(entry.index), entry.byte_count);
        if (!sink) {
            return std::unexpected(sink.error());
        }
        return std::unique_ptr<disk::ChunkSink>(std::move(*sink));
    }
    return std::make_unique<disk::RegionSink>(job.writer, entry.start_offset, entry.byte_count);
}

void DownloadEngine::cancel() noexcept {
    if (cancel_requested_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    stop_source_.request_stop();

    auto s = state();
    if (s != DownloadState::idle && s != DownloadState::succeeded
        && s != DownloadState::failed && s != DownloadState::cancelled) {
        VOLLEY_INFO("Cancelling download");
    }
}

DownloadProgress DownloadEngine::progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_;
}

std::vector<ChunkSnapshot> DownloadEngine::chunk_states() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ChunkSnapshot> out;
    out.reserve(chunks_.size());
    for (const auto& chunk : chunks_) {
        out.push_back(chunk->snapshot());
    }
    return out;
}

void DownloadEngine::update_progress(const ProgressAggregator& aggregator) {
    // Gather chunk data without holding the lock (atomics)
    auto counts = aggregator.counts();
    auto bytes = aggregator.bytes_complete();
    auto percent = aggregator.overall_progress() * 100.0;
    auto now = steady_clock::now();

    DownloadProgress snap;
    ProgressCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto interval = duration_cast<milliseconds>(now - last_sample_time_).count();
        if (interval > 0) {
            // A retry rewinds a chunk, so the byte count can go down
            auto delta = bytes > last_sample_bytes_ ? bytes - last_sample_bytes_ : 0;
            progress_.speed_bps = delta * 1000 / static_cast<std::uint64_t>(interval);
            last_sample_bytes_ = bytes;
            last_sample_time_ = now;
        }
        auto elapsed = duration_cast<milliseconds>(now - download_start_).count();
        if (elapsed > 0) {
            progress_.average_speed_bps = bytes * 1000 / static_cast<std::uint64_t>(elapsed);
        }

        progress_.total_bytes = aggregator.total_size();
        progress_.downloaded_bytes = bytes;
        progress_.active_chunks = counts.active;
        progress_.completed_chunks = counts.completed;
        progress_.failed_chunks = counts.failed;
        progress_.retrying_chunks = counts.retrying;
        progress_.total_chunks = static_cast<std::uint32_t>(chunks_.size());
        progress_.percent = percent;
        progress_.state = state();

        progress_.eta_seconds = 0;
        if (progress_.total_bytes && progress_.speed_bps > 0 && *progress_.total_bytes > bytes) {
            progress_.eta_seconds = (*progress_.total_bytes - bytes) / progress_.speed_bps;
        }
        snap = progress_;
    }

    {
        std::lock_guard<std::mutex> cb_lock(callback_mutex_);
        cb = callback_;
    }
    if (cb) {
        try {
            cb(snap);
        } catch (const std::exception& e) {
            VOLLEY_WARN("Progress callback threw: {}", e.what());
        } catch (...) {
            VOLLEY_WARN("Progress callback threw a non-standard exception");
        }
    }
}

void DownloadEngine::set_state(DownloadState state) noexcept {
    auto previous = state_.exchange(state, std::memory_order_acq_rel);
    if (previous != state) {
        VOLLEY_DEBUG("State {} -> {}", to_string(previous), to_string(state));
    }
}

std::unexpected<JobError> DownloadEngine::fail(JobError error) {
    if (error.kind == ErrorClass::cancelled) {
        set_state(DownloadState::cancelled);
        VOLLEY_INFO("Download cancelled");
    } else {
        set_state(DownloadState::failed);
        VOLLEY_DEBUG("Job failed: {}", error.message());
    }
    return std::unexpected(std::move(error));
}

} // namespace volley::core
