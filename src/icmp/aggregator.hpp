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

#ifndef _AGGREGATOR_HPP_
#define _AGGREGATOR_HPP_

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>
#include <boost/asio/ip/address_v4.hpp>
#include "correlator.hpp"

struct probe_target {
    std::string label;  // host name as given by the user
    boost::asio::ip::address_v4 address;
};

struct target_stats {
    std::uint64_t count{0};
    std::uint64_t failures{0};
    probe_clock::duration min{probe_clock::duration::max()};
    probe_clock::duration max{probe_clock::duration::zero()};
    probe_clock::duration sum{probe_clock::duration::zero()};

    probe_clock::duration average() const;
};

struct sweep_summary {
    std::uint64_t total_matched{0};
    std::uint64_t total_failed{0};
    std::size_t unanswered{0};
    double elapsed_seconds{0};
    double rate{0};     // matches per second
};

// Per-target statistics and the optional sample record. Lives on the same
// strand as the correlator; not thread-safe on its own.
class aggregator {
public:
    aggregator(const std::vector<probe_target> &targets, bool record_samples);

    const target_stats &on_matched(const probe_outcome &outcome);
    const target_stats &on_failed(const probe_outcome &outcome);

    const target_stats &stats(std::size_t target_id) const;
    const probe_target &target(std::size_t target_id) const;
    std::size_t target_count() const;
    std::uint64_t total_matched() const;

    sweep_summary summarize(probe_clock::duration elapsed, std::size_t unanswered) const;

    // One row per target: label, address, then every sample in arrival order.
    const std::vector<std::vector<std::string> > &rows() const;
    void write_csv(std::ostream &out) const;

    static std::string format_ms(probe_clock::duration duration, int decimals);
    static std::string summary_line(const sweep_summary &summary);

private:
    std::vector<probe_target> targets;
    std::vector<target_stats> data;
    std::vector<std::vector<std::string> > records;
    bool record_samples;
    std::uint64_t matched_total;
    std::uint64_t failed_total;
};

#endif // _AGGREGATOR_HPP_
