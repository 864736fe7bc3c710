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

#ifndef _QUITKEY_H_
#define _QUITKEY_H_

#include <functional>
#include <termios.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/strand.hpp>

// Watches a terminal for the quit key. The terminal is switched to
// unbuffered no-echo mode while watching and restored on stop.
class QuitKey {
public:
    typedef std::function<void()> handler;

    QuitKey(boost::asio::io_context &io_context, int fd, char key = 'q');
    ~QuitKey();

    static bool is_terminal(int fd);

    // on_quit runs when the key is read, on_stopped once the reader exits.
    void start(handler on_quit, handler on_stopped);
    void stop();

private:
    void async_read();
    void finish();
    void restore_terminal();

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::posix::stream_descriptor input_;
    char key_;
    char read_buf_[1];
    bool saved_;
    struct termios saved_mode_;
    bool running_;
    bool stop_requested_;
    handler quit_handler_;
    handler stopped_handler_;
};

#endif // _QUITKEY_H_
