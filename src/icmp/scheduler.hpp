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

#ifndef _SCHEDULER_HPP_
#define _SCHEDULER_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

struct probe_key {
    std::size_t target_id;
    std::uint64_t sequence;
};

// Round-robin sweep: one probe per target per sweep, one dispatch per tick.
// The interval is flow control for the receive buffer, not a correctness
// requirement, and may be tuned freely.
class scheduler {
public:
    typedef std::function<void(const probe_key &)> dispatch_handler;
    typedef std::function<void()> stopped_handler;

    typedef boost::asio::strand<boost::asio::io_context::executor_type> strand_type;

    scheduler(boost::asio::io_context &io_context, std::size_t target_count,
              std::chrono::microseconds interval);
    // Ticks run on strand, so dispatch is serialized with the owner's other
    // work on it and the next tick waits for the previous dispatch.
    scheduler(boost::asio::io_context &io_context, strand_type strand, std::size_t target_count,
              std::chrono::microseconds interval);

    // Sweep index i maps to target i mod N, sequence i div N.
    static probe_key key_for(std::uint64_t index, std::size_t target_count);

    void start(dispatch_handler dispatch, stopped_handler on_stopped);
    void stop();
    std::uint64_t dispatched() const;

private:
    void tick();
    void finish();

    strand_type strand_;
    boost::asio::steady_timer timer_;
    std::size_t target_count_;
    std::chrono::microseconds interval_;
    std::uint64_t index_;
    bool running_;
    bool stop_requested_;
    dispatch_handler dispatch_;
    stopped_handler stopped_handler_;
};

#endif // _SCHEDULER_HPP_
