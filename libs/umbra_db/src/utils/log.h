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


#pragma once
#include <cstdarg>
#include <string>

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    Off   = 4,
};

void set_log_level(LogLevel level);
LogLevel get_log_level();
// accepts debug, info, warn, error, off. Unknown names leave the level unchanged.
bool set_log_level(const std::string &name);

void log_debug(const char* target, const char* fmt, ...)
    __attribute__((format(printf, 2, 3)));
void log_info(const char* target, const char* fmt, ...)
    __attribute__((format(printf, 2, 3)));
void log_warn(const char* target, const char* fmt, ...)
    __attribute__((format(printf, 2, 3)));
void log_error(const char* target, const char* fmt, ...)
    __attribute__((format(printf, 2, 3)));
