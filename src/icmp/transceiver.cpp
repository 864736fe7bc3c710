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

#include "transceiver.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include "icmp.hpp"
#include "core/log.h"
using namespace std;
using namespace boost::asio::ip;

transceiver::transceiver(boost::asio::io_context &io_context) :
    strand_(boost::asio::make_strand(io_context)),
    socket_(io_context),
    receiving_(false),
    stop_requested_(false) {}

void transceiver::open() {
    socket_.open(icmp::v4());
    socket_.bind(icmp::endpoint(address_v4::any(), 0));
    // Best effort; the kernel may cap it.
    boost::system::error_code ec;
    socket_.set_option(boost::asio::socket_base::receive_buffer_size(1 << 20), ec);
    if (ec) {
        Log::log_with_date_time("cannot enlarge receive buffer: " + ec.message(), Log::WARN);
    }
}

void transceiver::async_send(const probe_request &request, send_handler handler) {
    boost::asio::post(strand_, [this, request, handler]() {
        if (stop_requested_) {
            handler("transceiver stopped");
            return;
        }
        shared_ptr<string> packet;
        try {
            // The body carries the destination address; it has no meaning to the receiver.
            packet = make_shared<string>(encode_echo_request(request.target_id,
                                                             request.sequence_number,
                                                             request.address.to_string()));
        } catch (const invalid_argument &e) {
            handler(string("encode: ") + e.what());
            return;
        }
        if (!socket_.is_open()) {
            handler("socket is not open");
            return;
        }
        icmp::endpoint destination(request.address, 0);
        socket_.async_send_to(boost::asio::buffer(*packet), destination,
            boost::asio::bind_executor(strand_, [packet, handler](const boost::system::error_code error, size_t length) {
                if (error) {
                    handler(error.message());
                    return;
                }
                if (length != packet->size()) {
                    handler("short write: got " + to_string(length) + "; want " + to_string(packet->size()));
                    return;
                }
                handler(string());
            }));
    });
}

void transceiver::start_receive(receive_handler handler, stopped_handler on_stopped) {
    boost::asio::post(strand_, [this, handler, on_stopped]() {
        receive_handler_ = handler;
        stopped_handler_ = on_stopped;
        receiving_ = true;
        if (stop_requested_) {
            finish_receive();
            return;
        }
        async_receive();
    });
}

void transceiver::stop() {
    boost::asio::post(strand_, [this]() {
        if (stop_requested_) {
            return;
        }
        stop_requested_ = true;
        boost::system::error_code ec;
        socket_.cancel(ec);
    });
}

void transceiver::async_receive() {
    socket_.async_receive(boost::asio::buffer(receive_buf_, MAX_LENGTH),
        boost::asio::bind_executor(strand_, [this](const boost::system::error_code error, size_t length) {
            handle_receive(error, length);
        }));
}

void transceiver::handle_receive(const boost::system::error_code &error, size_t length) {
    inbound_event event;
    event.arrival = probe_clock::now();
    if (error == boost::asio::error::operation_aborted || stop_requested_) {
        finish_receive();
        return;
    }
    if (error) {
        event.kind = inbound_event::read_error;
        event.error = error.message();
        receive_handler_(event);
        finish_receive();
        return;
    }

    icmp_message message = decode_datagram(receive_buf_, length);
    event.source = message.source;
    event.type = message.type;
    switch (message.status) {
        case icmp_message::echo_reply:
            event.kind = inbound_event::echo_reply;
            event.identifier = message.identifier;
            event.sequence_number = message.sequence_number;
            break;
        case icmp_message::not_echo_reply:
            event.kind = inbound_event::not_echo_reply;
            break;
        case icmp_message::malformed:
            event.kind = inbound_event::parse_error;
            event.error = message.error;
            break;
    }
    receive_handler_(event);
    async_receive();
}

void transceiver::finish_receive() {
    if (!receiving_) {
        return;
    }
    receiving_ = false;
    stopped_handler handler;
    handler.swap(stopped_handler_);
    receive_handler_ = nullptr;
    if (handler) {
        handler();
    }
}
