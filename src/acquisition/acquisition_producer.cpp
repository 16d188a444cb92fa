// acquisition_producer.cpp - Device-to-ring-buffer acquisition loop

#include "acquisition_producer.hpp"
#include "fastdaq/errors.hpp"
#include "fastdaq/logging.hpp"

#include <algorithm>

namespace fastdaq {

namespace {
constexpr int MAX_BACKOFF_MS = 1000;
}

double rateAccuracyPercent(double requested_samples, double acquired_samples) {
    if (requested_samples <= 0.0) return 0.0;
    return acquired_samples / requested_samples * 100.0;
}

AcquisitionProducer::Config AcquisitionProducer::Config::fromPipeline(const PipelineConfig& config) {
    Config c;
    c.channels = config.numChannels();
    c.sample_rate_hz = config.sample_rate_hz;
    c.samples_per_block = config.blockSize();
    c.read_timeout = std::chrono::milliseconds(config.read_timeout_ms);
    c.max_read_retries = config.max_read_retries;
    c.retry_backoff_ms = config.retry_backoff_ms;
    c.rate_window_s = config.rate_window_s;
    return c;
}

AcquisitionProducer::AcquisitionProducer(IDaqDevice& device, ChannelRingBuffer& buffer,
                                         MemoryPool& pool, const Config& config)
    : device_(device)
    , buffer_(buffer)
    , pool_(pool)
    , config_(config)
{
}

void AcquisitionProducer::requestStop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_.store(true, std::memory_order_release);
    }
    wait_cv_.notify_all();
}

bool AcquisitionProducer::backoff(int attempt) {
    int shift = std::min(attempt - 1, 16);
    int delay_ms = std::min(config_.retry_backoff_ms << shift, MAX_BACKOFF_MS);
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, std::chrono::milliseconds(delay_ms),
                      [this] { return stop_.load(std::memory_order_acquire); });
    return !stop_.load(std::memory_order_acquire);
}

void AcquisitionProducer::recordRate(Clock::time_point now, uint64_t total) {
    rate_points_.emplace_back(now, total);

    // Keep the newest point at or before the window start as the base
    auto window = std::chrono::duration<double>(config_.rate_window_s);
    while (rate_points_.size() >= 2 &&
           std::chrono::duration<double>(now - rate_points_[1].first) >= window) {
        rate_points_.pop_front();
    }
    windowRate(now, stats_);
}

void AcquisitionProducer::windowRate(Clock::time_point now, Stats& out) const {
    if (rate_points_.empty()) return;

    auto window = std::chrono::duration<double>(config_.rate_window_s);
    auto base = rate_points_.begin();
    for (auto it = rate_points_.begin(); it != rate_points_.end(); ++it) {
        if (std::chrono::duration<double>(now - it->first) < window) break;
        base = it;
    }

    double dt = std::chrono::duration<double>(now - base->first).count();
    if (dt <= 0.0) return;
    double acquired = static_cast<double>(rate_points_.back().second - base->second);
    out.achieved_rate_hz = acquired / dt;
    out.rate_accuracy_pct = rateAccuracyPercent(config_.sample_rate_hz * dt, acquired);
    out.rate_valid = true;
}

void AcquisitionProducer::run() {
    const size_t n = config_.samples_per_block;
    const size_t channels = config_.channels;
    const size_t block_doubles = (channels + 1) * n;

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_ = Stats{};
        stats_.running = true;
        push_ms_total_ = 0.0;
        start_time_ = Clock::now();
        last_read_time_ = start_time_;
        rate_points_.clear();
        rate_points_.emplace_back(start_time_, 0);
    }

    LOG_ACQ(INFO, "Producer started: %zu ch @ %.0f Hz, %zu samples/block, device=%s",
            channels, config_.sample_rate_hz, n, device_.name().c_str());

    uint64_t sample_index = 0;
    int timeouts_in_row = 0;

    while (!stop_.load(std::memory_order_acquire)) {
        PooledBlock block = pool_.acquire(block_doubles);
        MutableSampleSpan all = block.span();
        MutableSampleSpan timestamps = all.subspan(0, n);
        MutableSampleSpan values = all.subspan(n, channels * n);

        ReadResult rr = device_.readBlock(n, config_.read_timeout, values);
        if (stop_.load(std::memory_order_acquire)) break;

        if (rr.status == ReadStatus::TIMEOUT) {
            timeouts_in_row++;
            {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                stats_.timeouts++;
            }
            if (timeouts_in_row > config_.max_read_retries) {
                {
                    std::lock_guard<std::mutex> lock(stats_mutex_);
                    stats_.stalls++;
                }
                LOG_ACQ(WARN, "Acquisition stall: %d consecutive timeouts (%s)",
                        timeouts_in_row, rr.error.c_str());
                if (stall_cb_) stall_cb_(timeouts_in_row, rr.error);
                timeouts_in_row = 0;
                continue;
            }
            LOG_ACQ(DEBUG, "Read timeout %d/%d, backing off", timeouts_in_row, config_.max_read_retries);
            pool_.release(std::move(block));
            if (!backoff(timeouts_in_row)) break;
            continue;
        }

        if (rr.status == ReadStatus::FAULT) {
            {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                stats_.running = false;
            }
            LOG_ACQ(ERROR, "Device fault after %llu samples: %s",
                    static_cast<unsigned long long>(sample_index), rr.error.c_str());
            throw AcquisitionFault("device " + device_.name() + ": " + rr.error);
        }

        timeouts_in_row = 0;

        // Timestamps come from the sample clock, not the wall clock
        for (size_t i = 0; i < n; ++i) {
            timestamps[i] = static_cast<double>(sample_index + i) * 1000.0 / config_.sample_rate_hz;
        }

        SampleBlock sb;
        sb.timestamps_ms = timestamps;
        sb.values = values;
        sb.channels = channels;
        sb.samples = n;

        auto push_start = Clock::now();
        size_t overwritten = buffer_.push(sb);
        auto push_end = Clock::now();
        pool_.release(std::move(block));

        sample_index += n;
        double push_ms = std::chrono::duration<double, std::milli>(push_end - push_start).count();

        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.blocks_acquired++;
            stats_.samples_acquired = sample_index;
            stats_.samples_overwritten += overwritten;
            push_ms_total_ += push_ms;
            stats_.avg_push_ms = push_ms_total_ / static_cast<double>(stats_.blocks_acquired);
            stats_.max_push_ms = std::max(stats_.max_push_ms, push_ms);
            last_read_time_ = push_end;
            recordRate(push_end, sample_index);
        }

        if (overwritten > 0 && overrun_cb_) overrun_cb_(overwritten);
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.running = false;
    }
    LOG_ACQ(INFO, "Producer stopped after %llu samples",
            static_cast<unsigned long long>(sample_index));
}

AcquisitionProducer::Stats AcquisitionProducer::getStats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    Stats s = stats_;
    if (s.running) {
        auto now = Clock::now();
        s.elapsed_s = std::chrono::duration<double>(now - start_time_).count();
        // The window ends now, so a device that went silent loses accuracy
        if (s.rate_valid || s.elapsed_s >= config_.rate_window_s) windowRate(now, s);
    } else {
        s.elapsed_s = std::chrono::duration<double>(last_read_time_ - start_time_).count();
    }
    return s;
}

} // namespace fastdaq
