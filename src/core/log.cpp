/*
 * This file is part of the pping project.
 * pping sweeps a set of IPv4 hosts with ICMP echo requests and reports
 * round-trip latency per host.
 * Copyright (C) 2020  The pping Authors.
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
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "log.h"
#include <array>
#include <cstring>
#include <cerrno>
#include <stdexcept>
#include <iostream>
#include <boost/date_time/posix_time/posix_time.hpp>
using namespace std;
using namespace boost::posix_time;

Log::Level Log::level(INFO);
ofstream Log::output;
mutex Log::log_mutex;

static const array<string, 6> name = {{"ALL", "INFO", "WARN", "ERROR", "FATAL", "OFF"}};

void Log::log(const string &message, Level level) {
#ifdef ENABLE_LOG
    if (level >= Log::level) {
        lock_guard<std::mutex> lock(Log::log_mutex);
        cout << message << endl;
        if (output.is_open()) {
            output << message << endl;
        }
    }
#else // ENABLE_LOG
    (void)message;
    (void)level;
#endif // ENABLE_LOG
}

void Log::log_with_date_time(const string &message, Level level) {
#ifdef ENABLE_LOG
    if (level < Log::level) {
        return;
    }
    ptime now = second_clock::local_time();
    string level_string = " [" + name[level] + "] ";
    log(to_simple_string(now) + level_string + message, level);
#else // ENABLE_LOG
    (void)message;
    (void)level;
#endif // ENABLE_LOG
}

void Log::log_with_endpoint(const boost::asio::ip::address_v4 &address, const string &message, Level level) {
#ifdef ENABLE_LOG
    log_with_date_time(address.to_string() + ' ' + message, level);
#else // ENABLE_LOG
    (void)address;
    (void)message;
    (void)level;
#endif // ENABLE_LOG
}

void Log::redirect(const string &filename) {
    ofstream tmp(filename, ios_base::out | ios_base::app);
    if (!tmp.is_open()) {
        throw runtime_error(filename + ": " + strerror(errno));
    }
    lock_guard<std::mutex> lock(Log::log_mutex);
    if (output.is_open()) {
        output.close();
    }
    output = move(tmp);
}

void Log::stop() {
    lock_guard<std::mutex> lock(Log::log_mutex);
    if (output.is_open()) {
        output.close();
    }
}
