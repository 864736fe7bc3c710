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

#include "shutdown.h"
#include <stdexcept>
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include "log.h"
using namespace std;

ShutdownBroadcast::ShutdownBroadcast(boost::asio::io_context &io_context, chrono::milliseconds grace) :
    strand_(boost::asio::make_strand(io_context)),
    grace_timer_(io_context),
    grace_(grace),
    requested_(false),
    broadcasted_(false),
    completed_(false) {}

void ShutdownBroadcast::add_consumer(const string &name, stop_function stop) {
    if (requested_) {
        throw logic_error("shutdown consumer " + name + " registered after broadcast");
    }
    consumers_.push_back(consumer{name, stop, false});
}

void ShutdownBroadcast::on_complete(completion_handler handler) {
    completion_ = handler;
}

void ShutdownBroadcast::broadcast() {
    if (requested_.exchange(true)) {
        return;
    }
    boost::asio::post(strand_, [this]() {
        broadcasted_ = true;
        Log::log_with_date_time("stopping " + to_string(consumers_.size()) + " tasks", Log::INFO);
        for (auto &c : consumers_) {
            stop_function stop;
            stop.swap(c.stop);
            if (stop) {
                stop();
            }
        }
        grace_timer_.expires_after(grace_);
        grace_timer_.async_wait(boost::asio::bind_executor(strand_, [this](const boost::system::error_code error) {
            if (error == boost::asio::error::operation_aborted || completed_) {
                return;
            }
            vector<string> missing;
            for (const auto &c : consumers_) {
                if (!c.acknowledged) {
                    missing.push_back(c.name);
                }
            }
            complete(missing);
        }));
        try_complete();
    });
}

void ShutdownBroadcast::acknowledge(const string &name) {
    boost::asio::post(strand_, [this, name]() {
        for (auto &c : consumers_) {
            if (c.name == name && !c.acknowledged) {
                c.acknowledged = true;
                Log::log_with_date_time(name + " stopped", Log::ALL);
                break;
            }
        }
        if (broadcasted_) {
            try_complete();
        }
    });
}

bool ShutdownBroadcast::requested() const {
    return requested_;
}

void ShutdownBroadcast::try_complete() {
    if (completed_) {
        return;
    }
    for (const auto &c : consumers_) {
        if (!c.acknowledged) {
            return;
        }
    }
    grace_timer_.cancel();
    complete(vector<string>());
}

void ShutdownBroadcast::complete(const vector<string> &timed_out) {
    completed_ = true;
    for (const auto &name : timed_out) {
        Log::log_with_date_time(name + " did not stop within the grace period", Log::WARN);
    }
    completion_handler handler;
    handler.swap(completion_);
    if (handler) {
        handler(timed_out);
    }
}
