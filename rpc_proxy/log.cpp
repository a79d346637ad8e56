/*
    This file is part of gm wallet (devrpc).

    gm wallet is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 2 of the License, or
    (at your option) any later version.

    gm wallet is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with gm wallet.  If not, see <http://www.gnu.org/licenses/>.

    This program is released under the GPL with the additional exemption
    that compiling, linking, and/or using OpenSSL is allowed.
    You are free to remove this exemption from derived works.
*/

#include "gm/log.hpp"
#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace {
std::atomic<int> g_level{static_cast<int>(gm::LogLevel::info)};
gm::LogSink g_sink;

const char* level_name(gm::LogLevel level) {
    switch (level) {
        case gm::LogLevel::debug: return "debug";
        case gm::LogLevel::info: return "info";
        case gm::LogLevel::warn: return "warn";
        case gm::LogLevel::error: return "error";
        case gm::LogLevel::off: break;
    }
    return "off";
}
} // namespace

namespace gm {

void set_log_level(LogLevel level) {
    g_level = static_cast<int>(level);
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load());
}

bool parse_log_level(const std::string& s, LogLevel& out) {
    for (LogLevel l : {LogLevel::debug, LogLevel::info, LogLevel::warn, LogLevel::error, LogLevel::off}) {
        if (s == level_name(l)) {
            out = l;
            return true;
        }
    }
    return false;
}

void set_log_sink(LogSink sink) {
    g_sink = std::move(sink);
}

void log_printf(LogLevel level, const char* tag, const char* fmt, ...) {
    if (level == LogLevel::off || static_cast<int>(level) < g_level.load()) return;
    char buf[1024];
    va_list ap;
    va_start(ap, fmt);
    vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);
    if (g_sink) {
        g_sink(level, std::string("[") + tag + "] " + buf);
        return;
    }
    fprintf(stderr, "[%s] %s: %s\n", tag, level_name(level), buf);
}

} // namespace gm
