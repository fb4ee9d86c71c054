#include <stdexcept>
#include <thread>

#include <bes/assert.hpp>
#include <bes/besexcept.hpp>

#include "threading/threading.hpp"
#include "util/scope_exit.hpp"

using namespace bes::threading::impl;
using namespace bes::threading;
using namespace bes;

task notification_queue::try_pop() {
    lock q_lock{q_mutex_, std::try_to_lock};

    if (q_lock && !q_tasks_.empty()) {
        task tsk = std::move(q_tasks_.front());
        q_tasks_.pop_front();
        return tsk;
    }
    return {};
}

task notification_queue::pop() {
    lock q_lock{q_mutex_};

    while (q_tasks_.empty() && !quit_) {
        q_tasks_available_.wait(q_lock);
    }
    if (q_tasks_.empty()) {
        return {};
    }
    task tsk = std::move(q_tasks_.front());
    q_tasks_.pop_front();
    return tsk;
}

bool notification_queue::try_push(task& tsk) {
    {
        lock q_lock{q_mutex_, std::try_to_lock};
        if (!q_lock) return false;

        q_tasks_.push_back(std::move(tsk));
        tsk = nullptr;
    }
    q_tasks_available_.notify_all();
    return true;
}

void notification_queue::push(task&& tsk) {
    {
        lock q_lock{q_mutex_};
        q_tasks_.push_back(std::move(tsk));
    }
    q_tasks_available_.notify_all();
}

void notification_queue::quit() {
    {
        lock q_lock{q_mutex_};
        quit_ = true;
    }
    q_tasks_available_.notify_all();
}

void task_system::run_tasks_loop(int index) {
    auto guard = util::on_scope_exit([] { current_task_queue_ = -1; });
    current_task_queue_ = index;

    while (true) {
        task tsk;
        for (unsigned n = 0; n<count_; ++n) {
            tsk = q_[(index + n) % count_].try_pop();
            if (tsk) break;
        }
        // If a task can not be acquired, force a pop from the queue. This is a blocking action.
        if (!tsk) tsk = q_[index].pop();
        if (!tsk) break;

        tsk();
    }
}

void task_system::try_run_task() {
    unsigned i = current_task_queue_+1==0? 0: current_task_queue_;
    bes_assert(i<count_);

    for (unsigned n = 0; n != count_; n++) {
        if (auto tsk = q_[(i + n) % count_].try_pop()) {
            tsk();
            return;
        }
    }
}

thread_local unsigned task_system::current_task_queue_ = -1;

task_system::task_system(): task_system(1) {}

task_system::task_system(int nthreads):
    count_(nthreads>0? nthreads: 0),
    q_(nthreads>0? nthreads: 0)
{
    if (nthreads <= 0) {
        throw zero_thread_requested_error(nthreads<0? 0u: (unsigned)nthreads);
    }

    // Main thread
    current_task_queue_ = 0;

    for (unsigned i = 1; i < count_; i++) {
        threads_.emplace_back([this, i]{run_tasks_loop(i);});
    }
}

task_system::~task_system() {
    current_task_queue_ = -1;
    for (auto& e: q_) e.quit();
    for (auto& e: threads_) e.join();
}

void task_system::async(task tsk) {
    auto i = index_++;

    for (unsigned n = 0; n != count_; n++) {
        if (q_[(i + n) % count_].try_push(tsk)) return;
    }
    q_[i % count_].push(std::move(tsk));
}
