#pragma once

#include "encoder_config.hpp"
#include "struct_cache.hpp"
#include "worker.hpp"
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>

namespace urlform {

// Recycles workers across encode calls. Grows on demand; keeps at most
// `max_idle_workers` idle workers between calls.
class WorkerPool {
public:
    // Exclusive use of one worker, returned to the pool on destruction
    class Lease {
    public:
        Lease(WorkerPool& pool, std::unique_ptr<Worker> worker)
            : pool_(&pool), worker_(std::move(worker)) {}

        ~Lease() {
            if (worker_) {
                pool_->release(std::move(worker_));
            }
        }

        Lease(Lease&& other) noexcept
            : pool_(other.pool_), worker_(std::move(other.worker_)) {}

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease& operator=(Lease&&) = delete;

        Worker& operator*() const { return *worker_; }
        Worker* operator->() const { return worker_.get(); }

    private:
        WorkerPool* pool_;
        std::unique_ptr<Worker> worker_;
    };

    WorkerPool(const EncoderConfig& config, StructCache& cache)
        : config_(config), cache_(cache), max_idle_(config.max_idle_workers) {}

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Get an idle worker or create a new one
    Lease acquire() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!idle_.empty()) {
                auto worker = std::move(idle_.back());
                idle_.pop_back();
                ++active_;
                return Lease(*this, std::move(worker));
            }
        }

        auto worker = std::make_unique<Worker>(config_, cache_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++active_;
            ++created_;
        }
        return Lease(*this, std::move(worker));
    }

    // Reset a worker and keep it for reuse if the pool has room
    void release(std::unique_ptr<Worker> worker) {
        worker->reset();

        std::lock_guard<std::mutex> lock(mutex_);
        --active_;
        if (idle_.size() < max_idle_) {
            idle_.push_back(std::move(worker));
        }
    }

    // Drop all idle workers
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.clear();
    }

    struct Stats {
        std::size_t idle_workers{0};
        std::size_t active_workers{0};
        std::size_t created_workers{0};
    };

    Stats get_stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        Stats stats;
        stats.idle_workers = idle_.size();
        stats.active_workers = active_;
        stats.created_workers = created_;
        return stats;
    }

private:
    const EncoderConfig& config_;
    StructCache& cache_;
    std::size_t max_idle_;
    std::deque<std::unique_ptr<Worker>> idle_;
    std::size_t active_{0};
    std::size_t created_{0};
    mutable std::mutex mutex_;
};

}  // namespace urlform
