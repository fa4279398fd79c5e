// Runtime switches for patch application, sourced from GRAFT_* environment flags.
#pragma once
#include <cstdarg>
#include <cstdio>
#include <cstdlib>

namespace graft
{

    namespace detail
    {
        inline bool env_flag_enabled(const char *name)
        {
            const char *v = std::getenv(name);
            return v && (v[0] == '1' || v[0] == 't' || v[0] == 'T' || v[0] == 'y' || v[0] == 'Y');
        }
    }

    struct ApplyOptions
    {
        bool trace = false;                  // GRAFT_TRACE: one stderr line per applied patch
        bool warn_duplicate_thrown = false;  // GRAFT_WARN_THROWN: several Thrown inserts for one target

        static ApplyOptions from_env()
        {
            ApplyOptions o;
            o.trace = detail::env_flag_enabled("GRAFT_TRACE");
            o.warn_duplicate_thrown = detail::env_flag_enabled("GRAFT_WARN_THROWN");
            return o;
        }
    };

    // printf-style trace line to stderr, e.g. trace(opts, "[patch][delete] node=%u\n", id)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    inline void trace(const ApplyOptions &o, const char *fmt, ...)
    {
        if (!o.trace)
            return;
        va_list ap;
        va_start(ap, fmt);
        std::vfprintf(stderr, fmt, ap);
        va_end(ap);
    }

} // namespace graft
