#pragma once

#include <memory>

#include <bes/context.hpp>

#include "threading/threading.hpp"

namespace bes {

// execution_context is a simple container for the state relating to
// execution resources.
//
// Note: the public API uses an opaque handle bes::context for
// execution_context, to hide implementation details of the
// container from the public API.

struct execution_context {
    task_system_handle thread_pool;

    execution_context(const proc_allocation& resources = proc_allocation{});
};

} // namespace bes
