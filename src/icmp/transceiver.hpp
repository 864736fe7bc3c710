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

#ifndef _TRANSCEIVER_HPP_
#define _TRANSCEIVER_HPP_

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/icmp.hpp>
#include <boost/asio/strand.hpp>
#include "transport.hpp"

#define MAX_LENGTH  8192

// Raw IPv4 ICMP socket bound to 0.0.0.0. Every socket operation is initiated
// on the transceiver's strand, so sends from many probes and the single
// receive loop never touch the socket concurrently.
class transceiver : public transport {
public:
    explicit transceiver(boost::asio::io_context &io_context);
    void open() override;
    void async_send(const probe_request &request, send_handler handler) override;
    void start_receive(receive_handler handler, stopped_handler on_stopped) override;
    void stop() override;

private:
    void async_receive();
    void handle_receive(const boost::system::error_code &error, std::size_t length);
    void finish_receive();

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::ip::icmp::socket socket_;
    unsigned char receive_buf_[MAX_LENGTH]{};
    receive_handler receive_handler_;
    stopped_handler stopped_handler_;
    bool receiving_;
    bool stop_requested_;
};

#endif // _TRANSCEIVER_HPP_
