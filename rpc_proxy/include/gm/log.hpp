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

#pragma once
#include <functional>
#include <string>

namespace gm {

enum class LogLevel { debug = 0, info, warn, error, off };

using LogSink = std::function<void(LogLevel, const std::string&)>;

void set_log_level(LogLevel level);
LogLevel log_level();

// Parses "debug", "info", "warn", "error" or "off". False on anything else.
bool parse_log_level(const std::string& s, LogLevel& out);

// Install before any server starts; the sink is not guarded.
void set_log_sink(LogSink sink);

void log_printf(LogLevel level, const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

} // namespace gm

#define GM_LOG_DEBUG(tag, ...) ::gm::log_printf(::gm::LogLevel::debug, tag, __VA_ARGS__)
#define GM_LOG_INFO(tag, ...) ::gm::log_printf(::gm::LogLevel::info, tag, __VA_ARGS__)
#define GM_LOG_WARN(tag, ...) ::gm::log_printf(::gm::LogLevel::warn, tag, __VA_ARGS__)
#define GM_LOG_ERROR(tag, ...) ::gm::log_printf(::gm::LogLevel::error, tag, __VA_ARGS__)
