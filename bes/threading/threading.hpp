#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace bes {
namespace threading {

using std::mutex;
using lock = std::unique_lock<mutex>;
using std::condition_variable;
using task = std::function<void()>;

namespace impl {

class notification_queue {
public:
    // Tries to acquire the lock to get a task. If unsuccessful, or if the
    // queue is empty, returns an empty task.
    task try_pop();

    // Acquires the lock and pops a task, waiting for one to be enqueued if
    // necessary. If quit_ is set and the queue is empty, returns an empty task.
    task pop();

    // Acquires the lock, pushes the task and notifies waiting threads.
    void push(task&& tsk);

    // Tries to acquire the lock: if successful, pushes the task, notifies
    // waiting threads and returns true. If unsuccessful returns false.
    bool try_push(task& tsk);

    // Finish popping all waiting tasks on queue then stop trying to pop
    // new tasks
    void quit();

private:
    std::deque<task> q_tasks_;

    // Lock and signal on task availability change.
    mutex q_mutex_;
    condition_variable q_tasks_available_;

    // Flag to handle exit from all threads.
    bool quit_ = false;
};

}// namespace impl

// Pool of worker threads, one notification queue per thread. The thread
// that constructs the task system counts as a worker: it executes tasks
// while waiting on a task_group.
class task_system {
private:
    // Number of notification queues.
    unsigned count_;

    // Worker threads.
    std::vector<std::thread> threads_;

    // Queue index for the running thread. A value of -1 indicates that
    // the executing thread is not one in threads_ or the main thread.
    static thread_local unsigned current_task_queue_;

    std::vector<impl::notification_queue> q_;

    // Total number of tasks pushed, used to spread tasks over queues.
    std::atomic<unsigned> index_{0};

public:
    // Create zero new threads. Only worker thread is the main thread.
    task_system();

    // Create nthreads-1 new std::threads running run_tasks_loop(tid)
    explicit task_system(int nthreads);

    task_system(const task_system&) = delete;
    task_system& operator=(const task_system&) = delete;

    // Quits the notification queues and joins the threads.
    ~task_system();

    // Pushes the task onto a queue, trying each queue round-robin starting
    // from a rotating index, forcing a push if all queues are busy.
    void async(task tsk);

    // The main function that all worker std::threads execute.
    void run_tasks_loop(int i);

    // Try to dequeue and run a single task. Returns without executing a task
    // if no tasks are available or if no lock can be acquired.
    void try_run_task();

    // Number of threads in pool, including master thread.
    int get_num_threads() const { return (int)count_; }
};

class task_group {
private:
    // For tracking exceptions raised inside the task_system.
    // If multiple tasks raise exceptions, any exception can be
    // saved and returned. Once an exception has been raised, the
    // rest of the tasks don't need to be executed.
    struct exception_state {
        std::atomic<bool> error_{false};
        std::exception_ptr exception_;
        std::mutex mutex_;

        operator bool() const {
            return error_.load(std::memory_order_relaxed);
        }

        void set(std::exception_ptr ex) {
            error_.store(true, std::memory_order_relaxed);
            lock ex_lock{mutex_};
            exception_ = std::move(ex);
        }

        // Clear exception state but return old state.
        std::exception_ptr reset() {
            auto ex = std::move(exception_);
            error_.store(false, std::memory_order_relaxed);
            exception_ = nullptr;
            return ex;
        }
    };

    // Number of tasks that are queued but not yet executed.
    std::atomic<std::size_t> in_flight_{0};

    // Set by run(), cleared by wait(). Used to check task completion status in destructor.
    bool running_ = false;

    task_system* task_system_;
    exception_state exception_status_;

public:
    task_group(task_system* ts):
        task_system_{ts}
    {}

    task_group(const task_group&) = delete;
    task_group& operator=(const task_group&) = delete;

    template <typename F>
    class wrap {
        F f_;
        std::atomic<std::size_t>& counter_;
        exception_state& exception_status_;

    public:
        template <typename F2>
        explicit wrap(F2&& other, std::atomic<std::size_t>& c, exception_state& ex):
            f_(std::forward<F2>(other)),
            counter_(c),
            exception_status_(ex)
        {}

        wrap(wrap&& other):
            f_(std::move(other.f_)),
            counter_(other.counter_),
            exception_status_(other.exception_status_)
        {}

        // std::function requires a copyable target; the wrapped task is
        // never called more than once.
        wrap(const wrap& other):
            f_(other.f_),
            counter_(other.counter_),
            exception_status_(other.exception_status_)
        {}

        void operator()() {
            if (!exception_status_) {
                try {
                    f_();
                }
                catch (...) {
                    exception_status_.set(std::current_exception());
                }
            }
            --counter_;
        }
    };

    template <typename F>
    using callable = typename std::decay<F>::type;

    template<typename F>
    void run(F&& f) {
        running_ = true;
        ++in_flight_;
        task_system_->async(wrap<callable<F>>(std::forward<F>(f), in_flight_, exception_status_));
    }

    // Wait till all tasks in this group are done, participating in their
    // execution. Rethrows the first exception raised by a task, if any.
    void wait() {
        while (in_flight_) {
            task_system_->try_run_task();
        }
        running_ = false;

        if (auto ex = exception_status_.reset()) {
            std::rethrow_exception(ex);
        }
    }

    ~task_group() {
        if (running_) std::terminate();
    }
};

///////////////////////////////////////////////////////////////////////
// algorithms
///////////////////////////////////////////////////////////////////////
struct parallel_for {
    // Creates a task group, enqueues tasks in batches and waits for their
    // completion. Returning from apply is a barrier: every f(i) has run.
    template <typename F>
    static void apply(int left, int right, int batch_size, task_system* ts, F f) {
        if (right<=left) return;
        if (!ts || ts->get_num_threads()==1 || right-left<=batch_size) {
            for (int i = left; i < right; ++i) f(i);
            return;
        }

        task_group g(ts);
        for (int i = left; i < right; i += batch_size) {
            g.run([=] {
                int r = i + batch_size < right ? i + batch_size : right;
                for (int j = i; j < r; ++j) {
                    f(j);
                }
            });
        }
        g.wait();
    }

    template <typename F>
    static void apply(int left, int right, task_system* ts, F f) {
        apply(left, right, 1, ts, std::move(f));
    }
};

} // namespace threading

using task_system_handle = std::shared_ptr<threading::task_system>;

} // namespace bes
