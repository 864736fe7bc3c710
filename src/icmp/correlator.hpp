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

#ifndef _CORRELATOR_HPP_
#define _CORRELATOR_HPP_

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "transport.hpp"

struct pending_request {
    std::size_t target_id;
    std::uint64_t sequence;
    probe_clock::time_point sent_at;
};

struct probe_outcome {
    enum kind_t {
        none,           // bookkeeping only, nothing to report
        matched,
        unsolicited,    // no pending entry: late, duplicate or already failed
        failed,
        out_of_range,   // target id outside [0, N)
        overwritten     // a pending entry already existed for the key
    };

    kind_t kind{none};
    std::size_t target_id{0};
    std::uint64_t sequence{0};
    probe_clock::duration round_trip{probe_clock::duration::zero()};
    std::string cause;
};

// Owner of the in-flight table. Not thread-safe: every call must come from
// the same serialized context (the service's correlation strand).
//
// Entries are keyed by (target id, wire sequence). The logical sequence is
// kept in the entry, so a reply reports the full sequence it matched.
class correlator {
public:
    explicit correlator(std::size_t target_count);

    probe_outcome on_pending(std::size_t target_id, std::uint64_t sequence,
                             probe_clock::time_point now);
    probe_outcome on_reply(std::size_t target_id, unsigned short sequence_number,
                           probe_clock::time_point arrival);
    probe_outcome on_failure(std::size_t target_id, std::uint64_t sequence,
                             const std::string &cause);
    // Fails every entry older than max_age; the outcomes are in target order.
    std::vector<probe_outcome> expire(probe_clock::time_point now,
                                      probe_clock::duration max_age);
    // Forgets every entry and returns how many there were.
    std::size_t drain();

    bool is_pending(std::size_t target_id, std::uint64_t sequence) const;
    std::size_t pending_count() const;
    std::size_t target_count() const;
    std::uint64_t anomalies() const;

private:
    bool in_range(std::size_t target_id) const;

    std::vector<std::map<unsigned short, pending_request> > requests;
    std::uint64_t anomaly_count;
};

#endif // _CORRELATOR_HPP_
