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

#ifndef _TRANSPORT_HPP_
#define _TRANSPORT_HPP_

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/system/error_code.hpp>

typedef std::chrono::steady_clock probe_clock;

// One echo request as handed to a transport.
struct probe_request {
    std::size_t target_id;
    unsigned short sequence_number;   // wire value, the logical sequence mod 65536
    boost::asio::ip::address_v4 address;
};

// Everything the receive loop can emit, one event per datagram (or one
// read_error when the loop dies).
struct inbound_event {
    enum kind_t { echo_reply, not_echo_reply, parse_error, read_error };

    kind_t kind{parse_error};
    probe_clock::time_point arrival;
    unsigned short identifier{0};
    unsigned short sequence_number{0};
    unsigned char type{0};
    boost::asio::ip::address_v4 source;
    std::string error;
};

// The engine side of the single socket: one writer multiplexed across probes,
// one reader loop. transceiver is the raw-socket implementation.
class transport {
public:
    // error is empty on success, otherwise the cause of the send failure.
    typedef std::function<void(const std::string &error)> send_handler;
    typedef std::function<void(const inbound_event &)> receive_handler;
    typedef std::function<void()> stopped_handler;

    // Returns once the socket is ready; probes may be sent afterwards.
    virtual void open() = 0;
    virtual void async_send(const probe_request &request, send_handler handler) = 0;
    // Runs until stop() or a read error; on_stopped is called exactly once.
    virtual void start_receive(receive_handler handler, stopped_handler on_stopped) = 0;
    // Ends the receive loop; sends issued afterwards fail.
    virtual void stop() = 0;
    virtual ~transport() = default;
};

#endif // _TRANSPORT_HPP_
