#pragma once
#include <cstring>
#include <ctime>
#include <iostream>
#include <sstream>

/** \file blp/debug.hpp debugging output macros
 *
 * The BLP_DBG family of macros write diagnostic messages (contraction progress, chosen weighting
 * matrix, thread layout) to stderr.  They expand to nothing useful unless the library is compiled
 * with `-DBLP_DEBUG` (the `BLP_DEBUG` CMake option).
 */

#ifdef BLP_DEBUG
#define BLP_DEBUG_BOOL true
#else
#define BLP_DEBUG_BOOL false
#endif

namespace blp {
/// \internal Strips everything up to the last "/blp/" from a source path.
inline const char* _debug_file(const char *f) {
    const char *last = nullptr;
    for (const char *p = std::strstr(f, "/blp/"); p; p = std::strstr(p + 1, "/blp/")) last = p;
    return last ? last + 1 : f;
}
}

#define _blp_dbg(prefix, stuff) std::ostringstream _blp_s; _blp_s << prefix << blp::_debug_file(__FILE__) << ":" << __LINE__ << ":" << __func__ << "(): " << stuff << "\n"; std::cerr << _blp_s.str() << std::flush

/** Debugging macro.  BLP_DBG(a << b << c); sends a << b << c to std::cerr, prefixed with the
 * file/line/function and followed by a newline.
 *
 * Does nothing unless compiled with `-DBLP_DEBUG`.
 */
#define BLP_DBG(stuff) do { if (BLP_DEBUG_BOOL) { _blp_dbg("", stuff); } } while (0)

/// Debugging macro for a single variable: BLP_DBGVAR(x) is BLP_DBG("x = " << (x))
#define BLP_DBGVAR(x) BLP_DBG(#x " = " << (x))

#define _blp_tstr std::time_t _blp_t = std::time(nullptr); char _blp_tstr[100]; std::strftime(_blp_tstr, sizeof(_blp_tstr), "[%c] ", std::localtime(&_blp_t))

/// Like BLP_DBG, but also prefixes the output with the current date and time.
#define BLP_TDBG(stuff) do { if (BLP_DEBUG_BOOL) { _blp_tstr; _blp_dbg(_blp_tstr, stuff); } } while (0)
