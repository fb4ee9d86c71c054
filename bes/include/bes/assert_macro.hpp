#pragma once

#ifdef BES_HAVE_ASSERTIONS

#define bes_assert(condition) \
do { \
    if (!(condition)) { \
        bes::global_failed_assertion_handler(#condition, __FILE__, __LINE__, __func__); \
    } \
} while (false)

#else

#define bes_assert(condition) \
do { \
    if (false) { (void)(condition); } \
} while (false)

#endif // def BES_HAVE_ASSERTIONS
