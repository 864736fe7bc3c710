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

#include "quitkey.h"
#include <cerrno>
#include <cstring>
#include <string>
#include <unistd.h>
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include "log.h"
using namespace std;

QuitKey::QuitKey(boost::asio::io_context &io_context, int fd, char key) :
    strand_(boost::asio::make_strand(io_context)),
    input_(io_context, ::dup(fd)),
    key_(key),
    read_buf_(),
    saved_(false),
    saved_mode_(),
    running_(false),
    stop_requested_(false) {
    if (tcgetattr(input_.native_handle(), &saved_mode_) == 0) {
        struct termios raw = saved_mode_;
        raw.c_lflag &= ~(ICANON | ECHO);
        raw.c_cc[VMIN] = 1;
        raw.c_cc[VTIME] = 0;
        if (tcsetattr(input_.native_handle(), TCSANOW, &raw) == 0) {
            saved_ = true;
        } else {
            Log::log_with_date_time(string("cannot switch terminal mode: ") + strerror(errno), Log::WARN);
        }
    }
}

QuitKey::~QuitKey() {
    restore_terminal();
}

bool QuitKey::is_terminal(int fd) {
    return isatty(fd) == 1;
}

void QuitKey::start(handler on_quit, handler on_stopped) {
    boost::asio::post(strand_, [this, on_quit, on_stopped]() {
        quit_handler_ = on_quit;
        stopped_handler_ = on_stopped;
        running_ = true;
        if (stop_requested_) {
            finish();
            return;
        }
        async_read();
    });
}

void QuitKey::stop() {
    boost::asio::post(strand_, [this]() {
        if (stop_requested_) {
            return;
        }
        stop_requested_ = true;
        boost::system::error_code ec;
        input_.cancel(ec);
    });
}

void QuitKey::async_read() {
    input_.async_read_some(boost::asio::buffer(read_buf_, sizeof(read_buf_)),
        boost::asio::bind_executor(strand_, [this](const boost::system::error_code error, size_t length) {
            if (error || stop_requested_) {
                if (error && error != boost::asio::error::operation_aborted) {
                    Log::log_with_date_time("stop reading keyboard: " + error.message(), Log::WARN);
                }
                finish();
                return;
            }
            if (length == 1 && read_buf_[0] == key_ && quit_handler_) {
                quit_handler_();
            }
            async_read();
        }));
}

void QuitKey::finish() {
    if (!running_) {
        return;
    }
    running_ = false;
    restore_terminal();
    quit_handler_ = nullptr;
    handler on_stopped;
    on_stopped.swap(stopped_handler_);
    if (on_stopped) {
        on_stopped();
    }
}

void QuitKey::restore_terminal() {
    if (saved_) {
        tcsetattr(input_.native_handle(), TCSANOW, &saved_mode_);
        saved_ = false;
    }
}
