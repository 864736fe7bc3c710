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

#ifndef _LOOPBACK_TRANSPORT_H_
#define _LOOPBACK_TRANSPORT_H_

#include <cstddef>
#include <functional>
#include <set>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include "icmp/transport.hpp"

// In-process stand-in for the raw socket: every probe is answered at once
// unless its destination is listed in drop (no reply) or fail (send error).
// Hosts are picked by address because the engine renumbers targets after
// warm-up.
class loopback_transport : public transport {
public:
    std::set<boost::asio::ip::address_v4> drop;
    std::set<boost::asio::ip::address_v4> fail;
    // Warm-up outcomes for these hosts are held back until the first sweep probe.
    std::set<boost::asio::ip::address_v4> late;
    unsigned short identifier_offset = 0;   // added to every reply identifier
    std::size_t read_error_after = 0;       // 0 disables the injected read error
    std::size_t sent = 0;
    bool opened = false;

    explicit loopback_transport(boost::asio::io_context &io_context) :
        strand_(boost::asio::make_strand(io_context)) {}

    void open() override {
        opened = true;
    }

    void async_send(const probe_request &request, send_handler handler) override {
        boost::asio::post(strand_, [this, request, handler]() {
            ++sent;
            if (held_ && request.sequence_number != 0xFFFF) {
                std::function<void()> held;
                held.swap(held_);
                held();
            }
            if (stop_requested_) {
                handler("transceiver stopped");
                return;
            }
            if (request.sequence_number == 0xFFFF && late.count(request.address)) {
                held_ = [this, request, handler]() {
                    deliver(request, handler);
                };
                return;
            }
            deliver(request, handler);
        });
    }

    void start_receive(receive_handler handler, stopped_handler on_stopped) override {
        boost::asio::post(strand_, [this, handler, on_stopped]() {
            receive_handler_ = handler;
            stopped_handler_ = on_stopped;
            receiving_ = true;
            if (stop_requested_) {
                finish();
            }
        });
    }

    void stop() override {
        boost::asio::post(strand_, [this]() {
            stop_requested_ = true;
            finish();
        });
    }

private:
    void deliver(const probe_request &request, const send_handler &handler) {
        if (fail.count(request.address)) {
            handler("No route to host");
            return;
        }
        handler(std::string());
        if (!receiving_) {
            return;
        }
        if (read_error_after != 0 && sent >= read_error_after) {
            inbound_event event;
            event.kind = inbound_event::read_error;
            event.arrival = probe_clock::now();
            event.error = "Network is down";
            receive_handler_(event);
            finish();
            return;
        }
        if (drop.count(request.address)) {
            return;
        }
        inbound_event event;
        event.kind = inbound_event::echo_reply;
        event.arrival = probe_clock::now();
        event.identifier = static_cast<unsigned short>(request.target_id + identifier_offset);
        event.sequence_number = request.sequence_number;
        event.source = request.address;
        receive_handler_(event);
    }

    void finish() {
        if (!receiving_) {
            return;
        }
        receiving_ = false;
        stopped_handler handler;
        handler.swap(stopped_handler_);
        if (handler) {
            handler();
        }
    }

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    receive_handler receive_handler_;
    stopped_handler stopped_handler_;
    std::function<void()> held_;
    bool receiving_ = false;
    bool stop_requested_ = false;
};

#endif // _LOOPBACK_TRANSPORT_H_
