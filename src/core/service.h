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

#ifndef _SERVICE_H_
#define _SERVICE_H_

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include "config.h"
#include "quitkey.h"
#include "shutdown.h"
#include "icmp/aggregator.hpp"
#include "icmp/correlator.hpp"
#include "icmp/scheduler.hpp"
#include "icmp/transport.hpp"

// The probing engine. Owns the event loop, the transport, the sweep and the
// correlation state. Every mutation of the pending table and the statistics
// happens on correlation_strand; the other components only post to it.
class Service {
public:
    typedef std::function<std::unique_ptr<transport>(boost::asio::io_context &)> transport_factory;

    // Warm-up probes use a wire sequence the sweep only reaches after 65535
    // sweeps, so a late warm-up reply cannot match a fresh sweep probe.
    static const std::uint64_t warmup_sequence = 0xFFFF;

    Service(const Config &config, const std::vector<probe_target> &targets);
    Service(const Config &config, const std::vector<probe_target> &targets, transport_factory factory);
    // Blocks until the sweep has been shut down and the results are flushed.
    void run();
    // Safe from any thread, any number of times.
    void stop();
    boost::asio::io_context &service();

    const std::vector<probe_target> &targets() const;
    const aggregator *results() const;
    const sweep_summary &summary() const;
    std::uint64_t anomalies() const;
    std::uint64_t discarded() const;
    ~Service();

private:
    enum phase_t { idle, warming_up, sweeping, finished };
    enum warmup_state { waiting, reachable, unreachable };

    void run_io();
    void handle_inbound(const inbound_event &event);
    bool late_warmup_reply(const inbound_event &event) const;
    void start_warmup();
    void handle_warmup_outcome(const probe_outcome &outcome);
    void finish_warmup();
    void begin_sweep(const std::vector<probe_target> &survivors);
    void dispatch(const probe_key &key);
    void send_probe(std::size_t target_id, std::uint64_t sequence, const boost::asio::ip::address_v4 &address);
    void report(const probe_outcome &outcome);
    std::string describe(std::size_t target_id) const;
    void async_expire();
    void stop_sweep();
    void finalize();

    const Config &config;
    boost::asio::io_context io_context;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard;
    boost::asio::strand<boost::asio::io_context::executor_type> correlation_strand;
    boost::asio::steady_timer warmup_timer;
    boost::asio::steady_timer expiry_timer;
    std::unique_ptr<transport> link;
    ShutdownBroadcast shutdown;
    std::unique_ptr<QuitKey> quit_key;

    std::vector<probe_target> candidates;
    std::vector<probe_target> live_targets;
    std::vector<warmup_state> warmup_states;
    std::size_t warmup_remaining;
    phase_t phase;
    bool sweep_stop_requested;

    std::unique_ptr<correlator> pending;
    std::unique_ptr<aggregator> stats;
    std::unique_ptr<scheduler> sweep;
    probe_clock::time_point start_time;
    sweep_summary final_summary;
    std::uint64_t anomaly_count;
    std::uint64_t discarded_count;

    std::string fatal_error;
    std::mutex error_mutex;
    std::exception_ptr worker_error;
};

#endif // _SERVICE_H_
