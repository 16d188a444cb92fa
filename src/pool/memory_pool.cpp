// memory_pool.cpp - Reusable sample storage implementation

#include "memory_pool.hpp"
#include "fastdaq/logging.hpp"

#include <stdexcept>

namespace fastdaq {

// ============================================================================
// PooledBlock
// ============================================================================

PooledBlock::PooledBlock(MemoryPool* pool, std::vector<double>&& storage, Origin origin, uint64_t epoch)
    : pool_(pool)
    , storage_(std::move(storage))
    , origin_(origin)
    , epoch_(epoch)
{
}

PooledBlock::~PooledBlock() {
    returnToPool();
}

PooledBlock::PooledBlock(PooledBlock&& other) noexcept
    : pool_(other.pool_)
    , storage_(std::move(other.storage_))
    , origin_(other.origin_)
    , epoch_(other.epoch_)
{
    other.pool_ = nullptr;
    other.storage_.clear();
}

PooledBlock& PooledBlock::operator=(PooledBlock&& other) noexcept {
    if (this != &other) {
        returnToPool();
        pool_ = other.pool_;
        storage_ = std::move(other.storage_);
        origin_ = other.origin_;
        epoch_ = other.epoch_;
        other.pool_ = nullptr;
        other.storage_.clear();
    }
    return *this;
}

void PooledBlock::returnToPool() {
    if (pool_ && !storage_.empty()) {
        pool_->giveBack(std::move(storage_), origin_, epoch_);
    }
    pool_ = nullptr;
    storage_ = std::vector<double>();
}

// ============================================================================
// MemoryPool
// ============================================================================

MemoryPool::MemoryPool(const Config& config)
    : config_(config)
{
}

PooledBlock MemoryPool::acquire(size_t size) {
    if (size == 0) {
        throw std::invalid_argument("MemoryPool::acquire: size must be positive");
    }

    ExhaustionCallback cb;
    size_t outstanding_now = 0;
    PooledBlock block;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.acquires++;

        if (config_.bypass) {
            stats_.allocations++;
            return PooledBlock(this, std::vector<double>(size), PooledBlock::Origin::BYPASS, epoch_);
        }

        if (outstanding_ >= config_.max_outstanding) {
            // Degrade instead of failing: hand out unpooled storage
            stats_.allocations++;
            stats_.exhaustion_events++;
            outstanding_now = outstanding_;
            cb = exhaustion_cb_;

            auto now = std::chrono::steady_clock::now();
            if (now - last_exhaustion_log_ >= std::chrono::seconds(1)) {
                last_exhaustion_log_ = now;
                LOG_PERF(WARN, "Memory pool exhausted (%zu outstanding, %llu fallbacks so far)",
                         outstanding_, static_cast<unsigned long long>(stats_.exhaustion_events));
            }
            block = PooledBlock(this, std::vector<double>(size), PooledBlock::Origin::ONE_OFF, epoch_);
        } else {
            // Newest idle block of the right size
            auto it = idle_.end();
            while (it != idle_.begin()) {
                --it;
                if (it->size() == size) break;
            }

            std::vector<double> storage;
            if (it != idle_.end() && it->size() == size) {
                storage = std::move(*it);
                idle_.erase(it);
                idle_bytes_ -= size * sizeof(double);
                stats_.pool_hits++;
            } else {
                storage.resize(size);
                stats_.allocations++;
                trimIdle();
            }
            outstanding_++;
            block = PooledBlock(this, std::move(storage), PooledBlock::Origin::POOLED, epoch_);
        }
    }

    if (cb) cb(outstanding_now);
    return block;
}

void MemoryPool::release(PooledBlock&& block) {
    if (!block.valid()) return;
    if (block.pool_ != this) {
        throw std::invalid_argument("MemoryPool::release: block belongs to another pool");
    }
    block.returnToPool();
}

void MemoryPool::giveBack(std::vector<double>&& storage, PooledBlock::Origin origin, uint64_t epoch) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.releases++;

    if (origin != PooledBlock::Origin::POOLED) {
        return;   // storage freed by the caller's destructor
    }
    if (epoch != epoch_) {
        return;   // written off by forceReleaseAll()
    }

    if (outstanding_ > 0) outstanding_--;

    size_t bytes = storage.size() * sizeof(double);
    idle_bytes_ += bytes;
    idle_.push_back(std::move(storage));
    trimIdle();
}

void MemoryPool::trimIdle() {
    while (!idle_.empty() &&
           (idle_.size() > config_.max_idle_blocks || idle_bytes_ > config_.max_idle_bytes)) {
        idle_bytes_ -= idle_.front().size() * sizeof(double);
        idle_.pop_front();
        stats_.evictions++;
    }
}

size_t MemoryPool::forceReleaseAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t written_off = outstanding_;
    if (written_off > 0) {
        LOG_PERF(WARN, "Force-releasing %zu outstanding pool blocks", written_off);
    }
    stats_.forced_releases += written_off;
    outstanding_ = 0;
    epoch_++;
    return written_off;
}

void MemoryPool::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    idle_.clear();
    idle_bytes_ = 0;
}

void MemoryPool::setExhaustionCallback(ExhaustionCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    exhaustion_cb_ = std::move(cb);
}

MemoryPool::Stats MemoryPool::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats s = stats_;
    s.outstanding = outstanding_;
    s.idle_blocks = idle_.size();
    s.idle_bytes = idle_bytes_;
    return s;
}

} // namespace fastdaq
