#include <memory>

#include <bes/besexcept.hpp>
#include <bes/context.hpp>

#include "execution_context.hpp"
#include "threading/threading.hpp"

namespace bes {

execution_context::execution_context(const proc_allocation& resources) {
    if (resources.num_threads==0) {
        throw zero_thread_requested_error(0);
    }
    thread_pool = std::make_shared<threading::task_system>((int)resources.num_threads);
}

context make_context(const proc_allocation& p) {
    return std::make_shared<execution_context>(p);
}

unsigned num_threads(context ctx) {
    return ctx->thread_pool->get_num_threads();
}

} // namespace bes
