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

#ifndef _SHUTDOWN_H_
#define _SHUTDOWN_H_

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

// Fan-out of a single quit request to a fixed set of long-running consumers.
// Every consumer's stop function runs exactly once, no matter how often
// broadcast() is called or from which thread. The completion handler runs
// once, after every consumer acknowledged or the grace period ran out.
class ShutdownBroadcast {
public:
    typedef std::function<void()> stop_function;
    // timed_out lists the consumers that never acknowledged.
    typedef std::function<void(const std::vector<std::string> &timed_out)> completion_handler;

    ShutdownBroadcast(boost::asio::io_context &io_context, std::chrono::milliseconds grace);

    // Consumers must all be registered before the first broadcast().
    void add_consumer(const std::string &name, stop_function stop);
    void on_complete(completion_handler handler);
    void broadcast();
    void acknowledge(const std::string &name);
    bool requested() const;

private:
    struct consumer {
        std::string name;
        stop_function stop;
        bool acknowledged;
    };

    void try_complete();
    void complete(const std::vector<std::string> &timed_out);

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::steady_timer grace_timer_;
    std::chrono::milliseconds grace_;
    std::vector<consumer> consumers_;
    completion_handler completion_;
    std::atomic<bool> requested_;
    bool broadcasted_;
    bool completed_;
};

#endif // _SHUTDOWN_H_
