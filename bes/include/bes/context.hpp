#pragma once

#include <memory>

namespace bes {

// A description of local computation resources to use in a computation.
// By default, a proc_allocation will comprise one thread.

struct proc_allocation {
    unsigned long num_threads;

    proc_allocation(): proc_allocation(1) {}

    explicit proc_allocation(unsigned long threads):
        num_threads(threads)
    {}
};

// bes::execution_context encapsulates the execution resources used in
// a simulation, namely the task system thread pool.

// Forward declare execution_context.
struct execution_context;

// bes::context is an opaque handle for the execution context for use
// in the public API, implemented as a shared pointer.
using context = std::shared_ptr<execution_context>;

context make_context(const proc_allocation& resources = proc_allocation{});

unsigned num_threads(context);

} // namespace bes
