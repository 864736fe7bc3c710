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

#include "scheduler.hpp"
#include <stdexcept>
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
using namespace std;

scheduler::scheduler(boost::asio::io_context &io_context, size_t target_count,
                     chrono::microseconds interval) :
    scheduler(io_context, boost::asio::make_strand(io_context), target_count, interval) {}

scheduler::scheduler(boost::asio::io_context &io_context, strand_type strand, size_t target_count,
                     chrono::microseconds interval) :
    strand_(strand),
    timer_(io_context),
    target_count_(target_count),
    interval_(interval),
    index_(0),
    running_(false),
    stop_requested_(false) {
    if (target_count_ == 0) {
        throw invalid_argument("scheduler needs at least one target");
    }
}

probe_key scheduler::key_for(uint64_t index, size_t target_count) {
    probe_key key;
    key.target_id = static_cast<size_t>(index % target_count);
    key.sequence = index / target_count;
    return key;
}

void scheduler::start(dispatch_handler dispatch, stopped_handler on_stopped) {
    boost::asio::post(strand_, [this, dispatch, on_stopped]() {
        dispatch_ = dispatch;
        stopped_handler_ = on_stopped;
        running_ = true;
        tick();
    });
}

void scheduler::stop() {
    boost::asio::post(strand_, [this]() {
        if (stop_requested_) {
            return;
        }
        stop_requested_ = true;
        timer_.cancel();
    });
}

uint64_t scheduler::dispatched() const {
    return index_;
}

void scheduler::tick() {
    if (stop_requested_) {
        finish();
        return;
    }
    // The probe task itself runs elsewhere; a slow or failing send never
    // holds up the sweep.
    dispatch_(key_for(index_, target_count_));
    ++index_;

    timer_.expires_after(interval_);
    timer_.async_wait(boost::asio::bind_executor(strand_, [this](const boost::system::error_code) {
        tick();
    }));
}

void scheduler::finish() {
    if (!running_) {
        return;
    }
    running_ = false;
    stopped_handler handler;
    handler.swap(stopped_handler_);
    dispatch_ = nullptr;
    if (handler) {
        handler();
    }
}
