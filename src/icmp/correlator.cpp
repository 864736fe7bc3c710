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

#include "correlator.hpp"
using namespace std;

namespace {
    unsigned short wire_sequence(uint64_t sequence) {
        return static_cast<unsigned short>(sequence & 0xFFFF);
    }
}

correlator::correlator(size_t target_count) :
    requests(target_count),
    anomaly_count(0) {}

bool correlator::in_range(size_t target_id) const {
    return target_id < requests.size();
}

probe_outcome correlator::on_pending(size_t target_id, uint64_t sequence, probe_clock::time_point now) {
    probe_outcome outcome;
    outcome.target_id = target_id;
    outcome.sequence = sequence;
    if (!in_range(target_id)) {
        ++anomaly_count;
        outcome.kind = probe_outcome::out_of_range;
        return outcome;
    }
    pending_request request{target_id, sequence, now};
    auto result = requests[target_id].insert(make_pair(wire_sequence(sequence), request));
    if (!result.second) {
        // Either the scheduler reused a key or the wire sequence wrapped onto
        // an entry that never resolved. The newest probe wins.
        ++anomaly_count;
        outcome.kind = probe_outcome::overwritten;
        outcome.cause = "replaced pending sequence " + to_string(result.first->second.sequence);
        result.first->second = request;
    }
    return outcome;
}

probe_outcome correlator::on_reply(size_t target_id, unsigned short sequence_number,
                                   probe_clock::time_point arrival) {
    probe_outcome outcome;
    outcome.target_id = target_id;
    outcome.sequence = sequence_number;
    if (!in_range(target_id)) {
        ++anomaly_count;
        outcome.kind = probe_outcome::out_of_range;
        return outcome;
    }
    auto &table = requests[target_id];
    auto it = table.find(sequence_number);
    if (it == table.end()) {
        outcome.kind = probe_outcome::unsolicited;
        return outcome;
    }
    pending_request request = it->second;
    table.erase(it);

    outcome.kind = probe_outcome::matched;
    outcome.sequence = request.sequence;
    if (arrival > request.sent_at) {
        outcome.round_trip = arrival - request.sent_at;
    }
    return outcome;
}

probe_outcome correlator::on_failure(size_t target_id, uint64_t sequence, const string &cause) {
    probe_outcome outcome;
    outcome.target_id = target_id;
    outcome.sequence = sequence;
    outcome.cause = cause;
    if (!in_range(target_id)) {
        ++anomaly_count;
        outcome.kind = probe_outcome::out_of_range;
        return outcome;
    }
    auto &table = requests[target_id];
    auto it = table.find(wire_sequence(sequence));
    if (it != table.end() && it->second.sequence == sequence) {
        table.erase(it);
    }
    outcome.kind = probe_outcome::failed;
    return outcome;
}

vector<probe_outcome> correlator::expire(probe_clock::time_point now, probe_clock::duration max_age) {
    vector<probe_outcome> expired;
    for (auto &table : requests) {
        for (auto it = table.begin(); it != table.end();) {
            if (now - it->second.sent_at < max_age) {
                ++it;
                continue;
            }
            probe_outcome outcome;
            outcome.kind = probe_outcome::failed;
            outcome.target_id = it->second.target_id;
            outcome.sequence = it->second.sequence;
            outcome.cause = "timeout";
            expired.push_back(outcome);
            it = table.erase(it);
        }
    }
    return expired;
}

size_t correlator::drain() {
    size_t count = pending_count();
    for (auto &table : requests) {
        table.clear();
    }
    return count;
}

bool correlator::is_pending(size_t target_id, uint64_t sequence) const {
    if (!in_range(target_id)) {
        return false;
    }
    auto it = requests[target_id].find(wire_sequence(sequence));
    return it != requests[target_id].end() && it->second.sequence == sequence;
}

size_t correlator::pending_count() const {
    size_t count = 0;
    for (const auto &table : requests) {
        count += table.size();
    }
    return count;
}

size_t correlator::target_count() const {
    return requests.size();
}

uint64_t correlator::anomalies() const {
    return anomaly_count;
}
