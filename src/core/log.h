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

#ifndef _LOG_H_
#define _LOG_H_

#include <fstream>
#include <mutex>
#include <string>
#include <boost/asio/ip/address_v4.hpp>

#ifdef ERROR // windows.h
#undef ERROR
#endif // ERROR

class Log {
public:
    enum Level {
        ALL = 0,
        INFO = 1,
        WARN = 2,
        ERROR = 3,
        FATAL = 4,
        OFF = 5
    };
    static Level level;
    static std::ofstream output;
    static void log(const std::string &message, Level level = ALL);
    static void log_with_date_time(const std::string &message, Level level = ALL);
    static void log_with_endpoint(const boost::asio::ip::address_v4 &address, const std::string &message, Level level = ALL);
    static void redirect(const std::string &filename);
    static void stop();
private:
    static std::mutex log_mutex;
};

#endif // _LOG_H_
