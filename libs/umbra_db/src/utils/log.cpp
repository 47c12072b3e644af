/*
 * Umbra Ledger
 * Copyright (C) 2025 Joshua Olson
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */


#include "log.h"
#include <atomic>
#include <cstdio>
#include <ctime>
#include <mutex>

static std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
static std::mutex g_log_mtx;

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel get_log_level() {
    return static_cast<LogLevel>(g_level.load());
}

bool set_log_level(const std::string &name) {
    if (name == "debug")      set_log_level(LogLevel::Debug);
    else if (name == "info")  set_log_level(LogLevel::Info);
    else if (name == "warn")  set_log_level(LogLevel::Warn);
    else if (name == "error") set_log_level(LogLevel::Error);
    else if (name == "off")   set_log_level(LogLevel::Off);
    else return false;
    return true;
}

static const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default:              return "";
    }
}

static void vlog(LogLevel level, const char* target, const char* fmt, va_list args) {
    if (static_cast<int>(level) < g_level.load()) return;

    char stamp[32];
    std::time_t now = std::time(nullptr);
    std::tm tm_buf;
    gmtime_r(&now, &tm_buf);
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);

    std::lock_guard<std::mutex> lock(g_log_mtx);
    fprintf(stderr, "%s %-5s %s: ", stamp, level_name(level), target);
    vfprintf(stderr, fmt, args);
    fputc('\n', stderr);
}

void log_debug(const char* target, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Debug, target, fmt, args);
    va_end(args);
}

void log_info(const char* target, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Info, target, fmt, args);
    va_end(args);
}

void log_warn(const char* target, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Warn, target, fmt, args);
    va_end(args);
}

void log_error(const char* target, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Error, target, fmt, args);
    va_end(args);
}
