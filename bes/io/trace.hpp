#pragma once

// Internal DEBUG macro for diagnostic output.

#include <iostream>
#include <mutex>

#include "io/locked_ostream.hpp"

// DEBUG << ...;
//
// Emit arguments to std::cerr followed by a newline.
// DEBUG output to std::cerr is serialized.

#define DEBUG bes::impl::emit_nl_locked(std::cerr.rdbuf())

namespace bes {

namespace impl {
    struct emit_nl_locked: public io::locked_ostream {
        emit_nl_locked(std::streambuf* buf):
            io::locked_ostream(buf),
            lock_(this->guard())
        {}

        ~emit_nl_locked() {
            if (rdbuf()) {
                (*this) << std::endl;
            }
        }

    private:
        std::unique_lock<std::mutex> lock_;
    };
} // namespace impl

} // namespace bes
