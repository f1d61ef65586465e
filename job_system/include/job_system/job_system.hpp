#ifndef JOB_SYSTEM_JOB_SYSTEM_HPP
#define JOB_SYSTEM_JOB_SYSTEM_HPP

#include <job_system/job.hpp>
#include <algorithm>
#include <thread>
#include <vector>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <new>
#include <stdexcept>
#include <random>
#include <string>

namespace job_system {

/**
 * Work-stealing thread pool.
 * Jobs are always submitted on behalf of a JobBatch; callers await the batch,
 * never the whole pool, so independent operations can share one JobSystem.
 */
template<typename JobType>
class JobSystem {
private:
    struct QueuedJob {
        JobPtr<JobType> job;
        BatchPtr batch;
        std::size_t index = 0;
    };

    struct WorkerData {
        std::deque<QueuedJob> tasks;  // Supports both LIFO and FIFO
        std::mutex mutex;
        std::condition_variable cv;
        std::thread thread;
        std::atomic<bool> stop{false};
        std::atomic<size_t> jobs_executed{0};
        std::atomic<size_t> jobs_skipped{0};   // Dropped because their batch was cancelled
        std::atomic<size_t> jobs_stolen{0};
    };

    std::vector<std::unique_ptr<WorkerData>> workers_;
    std::atomic<size_t> round_robin_{0};
    std::atomic<bool> is_running_{false};
    size_t num_threads_;

    // Try to steal half the tasks from a victim worker
    std::vector<QueuedJob> try_steal_from(WorkerData* victim) {
        std::vector<QueuedJob> stolen;
        std::unique_lock<std::mutex> lock(victim->mutex, std::try_to_lock);

        if (!lock.owns_lock() || victim->tasks.empty()) {
            return stolen;
        }

        // Steal from front (oldest) to minimize contention with the owner
        size_t steal_count = std::max(size_t(1), victim->tasks.size() / 2);
        stolen.reserve(steal_count);

        for (size_t i = 0; i < steal_count && !victim->tasks.empty(); ++i) {
            stolen.push_back(std::move(victim->tasks.front()));
            victim->tasks.pop_front();
        }

        return stolen;
    }

    void run_job(WorkerData* data, QueuedJob& entry) {
        JobBatch& batch = *entry.batch;

        if (batch.is_cancelled()) {
            entry.job.reset();
            data->jobs_skipped.fetch_add(1);
            batch.mark_completed();
            return;
        }

        // Worker threads must not throw; failures are handed to the batch
        try {
            entry.job->execute();
        } catch (const std::bad_alloc&) {
            batch.record_failure(entry.index, ErrorType::OutOfMemory, std::current_exception());
        } catch (const AbortedException&) {
            batch.record_failure(entry.index, ErrorType::Aborted, std::current_exception());
        } catch (const std::exception&) {
            batch.record_failure(entry.index, ErrorType::Exception, std::current_exception());
        } catch (...) {
            batch.record_failure(entry.index, ErrorType::Unhandled, std::current_exception());
        }

        // Release the job's captures before the waiter is woken
        entry.job.reset();
        data->jobs_executed.fetch_add(1);
        batch.mark_completed();
    }

    void worker_loop(WorkerData* data) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<size_t> dist(0, workers_.size() - 1);

        while (true) {
            QueuedJob entry;
            bool has_job = false;

            {
                std::unique_lock<std::mutex> lock(data->mutex);

                // If no local work, try stealing before waiting
                if (data->tasks.empty() && !data->stop.load()) {
                    lock.unlock();

                    for (size_t attempt = 0; attempt < workers_.size(); ++attempt) {
                        auto* victim = workers_[dist(gen)].get();
                        if (victim == data) continue;

                        auto stolen = try_steal_from(victim);
                        if (!stolen.empty()) {
                            std::lock_guard<std::mutex> local_lock(data->mutex);
                            for (auto& stolen_job : stolen) {
                                data->tasks.push_back(std::move(stolen_job));
                            }
                            data->jobs_stolen.fetch_add(stolen.size());
                            break;
                        }
                    }

                    lock.lock();
                }

                data->cv.wait_for(lock, std::chrono::milliseconds(1), [data] {
                    return data->stop.load() || !data->tasks.empty();
                });

                if (data->stop.load() && data->tasks.empty()) {
                    break;
                }

                if (!data->tasks.empty()) {
                    entry = std::move(data->tasks.back());
                    data->tasks.pop_back();
                    has_job = true;
                }
            }

            if (has_job) {
                run_job(data, entry);
            }
        }
    }

    void enqueue(WorkerData* worker, QueuedJob entry, ScheduleMode mode) {
        {
            std::lock_guard<std::mutex> lock(worker->mutex);
            if (mode == ScheduleMode::LIFO) {
                // LIFO: push to back, pop from back
                worker->tasks.push_back(std::move(entry));
            } else {
                // FIFO: push to front, pop from back (oldest at back)
                worker->tasks.push_front(std::move(entry));
            }
        }
        worker->cv.notify_one();
    }

public:
    explicit JobSystem(size_t num_threads = 0)
        : num_threads_(num_threads == 0 ? std::thread::hardware_concurrency() : num_threads) {
        if (num_threads_ == 0) num_threads_ = 1;

        workers_.reserve(num_threads_);
        for (size_t i = 0; i < num_threads_; ++i) {
            workers_.emplace_back(std::make_unique<WorkerData>());
        }
    }

    JobSystem(const JobSystem&) = delete;
    JobSystem& operator=(const JobSystem&) = delete;

    ~JobSystem() {
        shutdown();
    }

    void start() {
        if (is_running_.load()) return;

        for (auto& worker : workers_) {
            worker->stop.store(false);
        }

        for (size_t i = 0; i < workers_.size(); ++i) {
            auto* worker = workers_[i].get();
            worker->thread = std::thread([this, worker] {
                worker_loop(worker);
            });
        }

        is_running_.store(true);
    }

    // Queued jobs are drained before the workers exit
    void shutdown() {
        if (!is_running_.load()) return;

        for (auto& worker : workers_) {
            {
                std::lock_guard<std::mutex> lock(worker->mutex);
                worker->stop.store(true);
            }
            worker->cv.notify_all();
        }

        for (auto& worker : workers_) {
            if (worker->thread.joinable()) {
                worker->thread.join();
            }
        }

        is_running_.store(false);
    }

    BatchPtr create_batch() const {
        return std::make_shared<JobBatch>();
    }

    void submit(const BatchPtr& batch, JobPtr<JobType> job, ScheduleMode mode = ScheduleMode::LIFO) {
        if (!is_running_.load()) {
            throw std::runtime_error("JobSystem is not running");
        }

        size_t worker_idx = round_robin_.fetch_add(1) % workers_.size();
        size_t index = batch->add_submitted();
        enqueue(workers_[worker_idx].get(), QueuedJob{std::move(job), batch, index}, mode);
    }

    void submit_to_worker(size_t worker_id, const BatchPtr& batch, JobPtr<JobType> job,
                          ScheduleMode mode = ScheduleMode::LIFO) {
        if (!is_running_.load()) {
            throw std::runtime_error("JobSystem is not running");
        }

        if (worker_id >= workers_.size()) {
            throw std::out_of_range("Invalid worker ID");
        }

        size_t index = batch->add_submitted();
        enqueue(workers_[worker_id].get(), QueuedJob{std::move(job), batch, index}, mode);
    }

    template<typename F>
    void submit_function(const BatchPtr& batch, F&& func, JobType job_type, int priority = 0,
                         ScheduleMode mode = ScheduleMode::LIFO) {
        submit(batch, make_job(std::forward<F>(func), job_type, priority), mode);
    }

    size_t get_num_workers() const {
        return workers_.size();
    }

    bool is_running() const {
        return is_running_.load();
    }

    struct SystemStatistics {
        size_t total_jobs_executed;
        size_t total_jobs_stolen;
        size_t total_jobs_skipped;
    };

    SystemStatistics get_statistics() const {
        SystemStatistics stats{0, 0, 0};
        for (const auto& worker : workers_) {
            stats.total_jobs_executed += worker->jobs_executed.load();
            stats.total_jobs_stolen += worker->jobs_stolen.load();
            stats.total_jobs_skipped += worker->jobs_skipped.load();
        }
        return stats;
    }
};

} // namespace job_system

#endif // JOB_SYSTEM_JOB_SYSTEM_HPP
