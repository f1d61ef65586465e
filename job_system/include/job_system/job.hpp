#ifndef JOB_SYSTEM_JOB_HPP
#define JOB_SYSTEM_JOB_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace job_system {

// Error types that can occur during job execution
enum class ErrorType {
    None = 0,
    OutOfMemory,   // std::bad_alloc caught
    Aborted,       // AbortedException caught (batch cancelled while running)
    Exception,     // std::exception caught
    Unhandled      // Non-std::exception type caught
};

// Thrown by a job that noticed its batch was cancelled
class AbortedException : public std::runtime_error {
public:
    AbortedException() : std::runtime_error("Operation aborted") {}
};

/**
 * Group of jobs submitted together and awaited together.
 * Several batches may share one JobSystem. Each batch keeps its own
 * completion counters, the first failure raised by one of its jobs and a
 * cancellation flag that makes workers skip its queued jobs.
 */
class JobBatch {
public:
    static constexpr std::size_t NO_JOB = std::numeric_limits<std::size_t>::max();

    JobBatch() = default;
    JobBatch(const JobBatch&) = delete;
    JobBatch& operator=(const JobBatch&) = delete;

    // Reserve a slot for a new job, returns its index within the batch
    std::size_t add_submitted() {
        return submitted_.fetch_add(1, std::memory_order_acq_rel);
    }

    void mark_completed() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            completed_.fetch_add(1, std::memory_order_acq_rel);
        }
        cv_.notify_all();
    }

    // First failure wins; later ones are dropped. A failure cancels the batch.
    void record_failure(std::size_t job_index, ErrorType type, std::exception_ptr error) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (error_type_.load(std::memory_order_relaxed) == ErrorType::None) {
                first_error_ = std::move(error);
                failed_job_index_ = job_index;
                error_type_.store(type, std::memory_order_release);
            }
        }
        cancelled_.store(true, std::memory_order_release);
        cv_.notify_all();
    }

    void cancel() {
        cancelled_.store(true, std::memory_order_release);
        cv_.notify_all();
    }

    bool is_cancelled() const {
        return cancelled_.load(std::memory_order_acquire);
    }

    // For long-running jobs that poll for cancellation
    const std::atomic<bool>* cancellation_flag() const {
        return &cancelled_;
    }

    ErrorType get_error_type() const {
        return error_type_.load(std::memory_order_acquire);
    }

    bool has_error() const {
        return get_error_type() != ErrorType::None;
    }

    std::exception_ptr first_error() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return first_error_;
    }

    std::size_t failed_job_index() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return failed_job_index_;
    }

    std::size_t get_pending_count() const {
        std::size_t submitted = submitted_.load(std::memory_order_acquire);
        std::size_t completed = completed_.load(std::memory_order_acquire);
        return submitted > completed ? submitted - completed : 0;
    }

    // Block until every submitted job has run or been skipped
    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return all_completed(); });
    }

    // Wait for completion with abort callback.
    // Stops waiting as soon as a job failed or abort_check returns true.
    // Returns true if it stopped early, false if every job completed.
    template<typename AbortCheck>
    bool wait_with_abort(AbortCheck&& abort_check) {
        while (true) {
            if (abort_check() || has_error()) {
                return true;
            }

            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, std::chrono::milliseconds(50), [this] {
                return all_completed() || has_error();
            });

            if (all_completed() && !has_error()) {
                return false;
            }
        }
    }

    const char* get_error_description() const {
        switch (get_error_type()) {
            case ErrorType::None: return "No error";
            case ErrorType::OutOfMemory: return "Out of memory";
            case ErrorType::Aborted: return "Aborted";
            case ErrorType::Exception: return "Exception thrown";
            case ErrorType::Unhandled: return "Unhandled exception type";
        }
        return "Unknown error";
    }

private:
    bool all_completed() const {
        return completed_.load(std::memory_order_acquire) ==
               submitted_.load(std::memory_order_acquire);
    }

    std::atomic<std::size_t> submitted_{0};
    std::atomic<std::size_t> completed_{0};
    std::atomic<bool> cancelled_{false};
    std::atomic<ErrorType> error_type_{ErrorType::None};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::exception_ptr first_error_;
    std::size_t failed_job_index_ = NO_JOB;
};

using BatchPtr = std::shared_ptr<JobBatch>;

template<typename JobType>
class Job {
public:
    virtual ~Job() = default;

    virtual void execute() = 0;
    virtual JobType get_type() const = 0;
    virtual int get_priority() const { return 0; }
};

template<typename JobType, typename Func>
class FunctionJob : public Job<JobType> {
private:
    Func function_;
    JobType type_;
    int priority_;

public:
    template<typename F>
    FunctionJob(F&& func, JobType type, int priority = 0)
        : function_(std::forward<F>(func)), type_(type), priority_(priority) {}

    void execute() override {
        static_assert(std::is_invocable_v<Func&>, "Function must be callable");
        function_();
    }

    JobType get_type() const override {
        return type_;
    }

    int get_priority() const override {
        return priority_;
    }
};

template<typename JobType, typename Func>
auto make_job(Func&& func, JobType type, int priority = 0) {
    return std::make_unique<FunctionJob<JobType, std::decay_t<Func>>>(
        std::forward<Func>(func), type, priority);
}

template<typename JobType>
using JobPtr = std::unique_ptr<Job<JobType>>;

enum class ScheduleMode {
    LIFO,  // Last In, First Out (cache-friendly for related tasks)
    FIFO   // First In, First Out (fair scheduling)
};

} // namespace job_system

#endif // JOB_SYSTEM_JOB_HPP
