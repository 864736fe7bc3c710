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

#include "service.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <thread>
#include <unistd.h>
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include "log.h"
#include "icmp/transceiver.hpp"
using namespace std;
using namespace boost::asio::ip;

const uint64_t Service::warmup_sequence;

namespace {
    unique_ptr<transport> raw_socket_transport(boost::asio::io_context &io_context) {
        return unique_ptr<transport>(new transceiver(io_context));
    }
}

Service::Service(const Config &config, const vector<probe_target> &targets) :
    Service(config, targets, raw_socket_transport) {}

Service::Service(const Config &config, const vector<probe_target> &targets, transport_factory factory) :
    config(config),
    work_guard(boost::asio::make_work_guard(io_context)),
    correlation_strand(boost::asio::make_strand(io_context)),
    warmup_timer(io_context),
    expiry_timer(io_context),
    link(factory(io_context)),
    shutdown(io_context, chrono::milliseconds(config.grace_ms)),
    candidates(targets),
    warmup_remaining(0),
    phase(idle),
    sweep_stop_requested(false),
    anomaly_count(0),
    discarded_count(0) {
    config.validate();
    if (candidates.empty()) {
        throw runtime_error("no targets to ping");
    }
    if (config.quit_key && QuitKey::is_terminal(STDIN_FILENO)) {
        quit_key.reset(new QuitKey(io_context, STDIN_FILENO));
    }

    // Both stops go through correlation_strand in this order: the sweep
    // stops issuing probes before the receive loop is cancelled.
    shutdown.add_consumer("scheduler", [this]() {
        boost::asio::post(correlation_strand, [this]() {
            stop_sweep();
        });
    });
    shutdown.add_consumer("receive loop", [this]() {
        boost::asio::post(correlation_strand, [this]() {
            link->stop();
        });
    });
    if (quit_key) {
        shutdown.add_consumer("keyboard", [this]() {
            quit_key->stop();
        });
    }
    shutdown.on_complete([this](const vector<string> &) {
        // Anything already queued on the strand is handled before this.
        boost::asio::post(correlation_strand, [this]() {
            finalize();
        });
    });
}

void Service::run() {
    link->open();
    Log::log_with_date_time("icmp socket ready", Log::INFO);

    link->start_receive([this](const inbound_event &event) {
        boost::asio::post(correlation_strand, [this, event]() {
            handle_inbound(event);
        });
    }, [this]() {
        shutdown.acknowledge("receive loop");
    });
    if (quit_key) {
        quit_key->start([this]() {
            stop();
        }, [this]() {
            shutdown.acknowledge("keyboard");
        });
        Log::log("Press q to quit.", Log::FATAL);
    }

    boost::asio::post(correlation_strand, [this]() {
        if (sweep_stop_requested) {
            return;
        }
        if (config.warmup) {
            start_warmup();
        } else {
            begin_sweep(candidates);
        }
    });

    vector<thread> workers;
    for (int i = 1; i < config.threads; ++i) {
        workers.emplace_back([this]() {
            run_io();
        });
    }
    run_io();
    for (auto &worker : workers) {
        worker.join();
    }

    if (worker_error) {
        rethrow_exception(worker_error);
    }
    if (!fatal_error.empty()) {
        throw runtime_error(fatal_error);
    }
}

void Service::run_io() {
    try {
        io_context.run();
    } catch (...) {
        {
            lock_guard<mutex> lock(error_mutex);
            if (!worker_error) {
                worker_error = current_exception();
            }
        }
        io_context.stop();
    }
}

void Service::stop() {
    shutdown.broadcast();
}

boost::asio::io_context &Service::service() {
    return io_context;
}

void Service::handle_inbound(const inbound_event &event) {
    switch (event.kind) {
        case inbound_event::read_error:
            Log::log_with_date_time("receive loop failed: " + event.error, Log::ERROR);
            stop();
            return;
        case inbound_event::parse_error:
            ++discarded_count;
            Log::log_with_endpoint(event.source, "discarded datagram: " + event.error, Log::WARN);
            return;
        case inbound_event::not_echo_reply:
            ++discarded_count;
            Log::log_with_endpoint(event.source, "got icmp type " + to_string(event.type) + "; want echo reply", Log::ALL);
            return;
        case inbound_event::echo_reply:
            break;
    }

    if (phase == warming_up) {
        handle_warmup_outcome(pending->on_reply(event.identifier, event.sequence_number, event.arrival));
    } else if (phase == sweeping) {
        if (late_warmup_reply(event)) {
            ++discarded_count;
            Log::log_with_endpoint(event.source, "late warm-up reply for id " + to_string(event.identifier), Log::ALL);
            return;
        }
        report(pending->on_reply(event.identifier, event.sequence_number, event.arrival));
    } else {
        ++discarded_count;
    }
}

bool Service::late_warmup_reply(const inbound_event &event) const {
    // Until the sweep itself reaches wire sequence 0xFFFF, such a reply can
    // only answer a warm-up probe, whose id is a candidate index.
    return config.warmup && event.sequence_number == warmup_sequence
        && sweep->dispatched() / live_targets.size() < warmup_sequence;
}

void Service::start_warmup() {
    phase = warming_up;
    pending.reset(new correlator(candidates.size()));
    warmup_states.assign(candidates.size(), waiting);
    warmup_remaining = candidates.size();
    for (size_t i = 0; i < candidates.size(); ++i) {
        pending->on_pending(i, warmup_sequence, probe_clock::now());
        send_probe(i, warmup_sequence, candidates[i].address);
    }
    warmup_timer.expires_after(chrono::milliseconds(config.warmup_timeout_ms));
    warmup_timer.async_wait(boost::asio::bind_executor(correlation_strand, [this](const boost::system::error_code error) {
        if (error == boost::asio::error::operation_aborted) {
            return;
        }
        finish_warmup();
    }));
}

void Service::handle_warmup_outcome(const probe_outcome &outcome) {
    switch (outcome.kind) {
        case probe_outcome::matched:
            if (warmup_states[outcome.target_id] != waiting) {
                return;
            }
            warmup_states[outcome.target_id] = reachable;
            Log::log_with_endpoint(candidates[outcome.target_id].address, "(" + candidates[outcome.target_id].label
                                   + ") answered in " + aggregator::format_ms(outcome.round_trip, 2) + "ms", Log::INFO);
            break;
        case probe_outcome::failed:
            if (warmup_states[outcome.target_id] != waiting) {
                return;
            }
            warmup_states[outcome.target_id] = unreachable;
            Log::log_with_date_time("Failed to ping IP " + candidates[outcome.target_id].address.to_string()
                                    + " for " + candidates[outcome.target_id].label + ": " + outcome.cause, Log::ERROR);
            break;
        case probe_outcome::out_of_range:
            ++anomaly_count;
            Log::log_with_date_time("Received invalid id: " + to_string(outcome.target_id), Log::WARN);
            return;
        default:
            return;
    }
    if (--warmup_remaining == 0) {
        warmup_timer.cancel();
        finish_warmup();
    }
}

void Service::finish_warmup() {
    if (phase != warming_up) {
        return;
    }
    vector<probe_target> survivors;
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (warmup_states[i] == reachable) {
            survivors.push_back(candidates[i]);
        } else if (warmup_states[i] == waiting) {
            Log::log_with_date_time("no reply from " + candidates[i].address.to_string() + " for "
                                    + candidates[i].label + "; excluded", Log::ERROR);
        }
    }
    pending.reset();
    if (survivors.empty()) {
        phase = finished;
        fatal_error = "unable to reach any of the provided targets";
        stop();
        return;
    }
    if (sweep_stop_requested) {
        phase = finished;
        return;
    }
    begin_sweep(survivors);
}

void Service::begin_sweep(const vector<probe_target> &survivors) {
    live_targets = survivors;
    pending.reset(new correlator(live_targets.size()));
    stats.reset(new aggregator(live_targets, !config.output.empty()));
    phase = sweeping;
    start_time = probe_clock::now();
    Log::log("Pinging " + to_string(live_targets.size()) + " hosts...", Log::FATAL);

    sweep.reset(new scheduler(io_context, correlation_strand, live_targets.size(),
                              chrono::microseconds(config.interval_us)));
    sweep->start([this](const probe_key &key) {
        dispatch(key);
    }, [this]() {
        shutdown.acknowledge("scheduler");
    });
    if (config.pending_timeout_ms > 0) {
        async_expire();
    }
}

// Called by the scheduler on correlation_strand.
void Service::dispatch(const probe_key &key) {
    if (phase != sweeping || sweep_stop_requested) {
        return;
    }
    // The pending entry exists before the request hits the wire, so its
    // reply always finds it.
    report(pending->on_pending(key.target_id, key.sequence, probe_clock::now()));
    send_probe(key.target_id, key.sequence, live_targets[key.target_id].address);
}

void Service::send_probe(size_t target_id, uint64_t sequence, const address_v4 &address) {
    probe_request request;
    request.target_id = target_id;
    request.sequence_number = static_cast<unsigned short>(sequence & 0xFFFF);
    request.address = address;
    const phase_t sent_in = phase;
    link->async_send(request, [this, target_id, sequence, sent_in](const string &error) {
        if (error.empty()) {
            return;
        }
        boost::asio::post(correlation_strand, [this, target_id, sequence, sent_in, error]() {
            if (phase != sent_in) {
                // A warm-up id is a candidate index, not a live one.
                Log::log_with_date_time("dropped late failure for probe " + to_string(sequence)
                                        + " to id " + to_string(target_id) + ": " + error, Log::ALL);
                return;
            }
            if (phase == warming_up) {
                handle_warmup_outcome(pending->on_failure(target_id, sequence, error));
            } else if (phase == sweeping) {
                report(pending->on_failure(target_id, sequence, error));
            }
        });
    });
}

void Service::report(const probe_outcome &outcome) {
    switch (outcome.kind) {
        case probe_outcome::none:
            break;
        case probe_outcome::matched: {
            const target_stats &s = stats->on_matched(outcome);
            if (s.count == 1 || s.count % static_cast<uint64_t>(config.report_every) == 0) {
                Log::log_with_date_time(describe(outcome.target_id) + " Pinged "
                    + live_targets[outcome.target_id].address.to_string() + " in "
                    + aggregator::format_ms(outcome.round_trip, 4) + "ms. " + to_string(s.count)
                    + " pings. min/max/avg: " + aggregator::format_ms(s.min, 2) + "/"
                    + aggregator::format_ms(s.max, 2) + "/" + aggregator::format_ms(s.average(), 2) + "ms", Log::INFO);
            }
            break;
        }
        case probe_outcome::unsolicited:
            Log::log_with_date_time(describe(outcome.target_id) + " Response received without a corresponding request (seq "
                                    + to_string(outcome.sequence) + ")", Log::WARN);
            break;
        case probe_outcome::failed:
            stats->on_failed(outcome);
            Log::log_with_date_time(describe(outcome.target_id) + " probe " + to_string(outcome.sequence)
                                    + " failed: " + outcome.cause, Log::ERROR);
            break;
        case probe_outcome::out_of_range:
            ++anomaly_count;
            Log::log_with_date_time("Received invalid id: " + to_string(outcome.target_id), Log::WARN);
            break;
        case probe_outcome::overwritten:
            ++anomaly_count;
            Log::log_with_date_time(describe(outcome.target_id) + " sequence " + to_string(outcome.sequence)
                                    + " " + outcome.cause, Log::WARN);
            break;
    }
}

string Service::describe(size_t target_id) const {
    return "[" + to_string(target_id) + " " + live_targets.at(target_id).label + "]";
}

void Service::async_expire() {
    chrono::milliseconds timeout(config.pending_timeout_ms);
    expiry_timer.expires_after(max(timeout / 4, chrono::milliseconds(1)));
    expiry_timer.async_wait(boost::asio::bind_executor(correlation_strand, [this, timeout](const boost::system::error_code error) {
        if (error == boost::asio::error::operation_aborted || phase != sweeping) {
            return;
        }
        for (const auto &outcome : pending->expire(probe_clock::now(), timeout)) {
            report(outcome);
        }
        async_expire();
    }));
}

void Service::stop_sweep() {
    sweep_stop_requested = true;
    warmup_timer.cancel();
    if (sweep) {
        sweep->stop();
    } else {
        // Still warming up (or never started): there is no loop to wait for.
        shutdown.acknowledge("scheduler");
    }
}

void Service::finalize() {
    phase = finished;
    warmup_timer.cancel();
    expiry_timer.cancel();
    if (stats) {
        size_t unanswered = pending ? pending->drain() : 0;
        final_summary = stats->summarize(probe_clock::now() - start_time, unanswered);
        Log::log(aggregator::summary_line(final_summary), Log::FATAL);
        if (unanswered > 0) {
            Log::log_with_date_time(to_string(unanswered) + " probes were still waiting for a reply", Log::INFO);
        }
        if (final_summary.total_failed > 0) {
            Log::log_with_date_time(to_string(final_summary.total_failed) + " probes failed", Log::INFO);
        }
        if (!config.output.empty()) {
            ofstream out(config.output, ios::out | ios::trunc);
            if (!out.is_open()) {
                Log::log_with_date_time("Error writing to file " + config.output + ": " + strerror(errno), Log::ERROR);
            } else {
                stats->write_csv(out);
                out.flush();
                if (!out) {
                    Log::log_with_date_time("Error writing to file " + config.output, Log::ERROR);
                }
            }
        }
    }
    work_guard.reset();
    io_context.stop();
}

const vector<probe_target> &Service::targets() const {
    return live_targets;
}

const aggregator *Service::results() const {
    return stats.get();
}

const sweep_summary &Service::summary() const {
    return final_summary;
}

uint64_t Service::anomalies() const {
    return anomaly_count;
}

uint64_t Service::discarded() const {
    return discarded_count;
}

Service::~Service() = default;
