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

#include "aggregator.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>
using namespace std;

namespace {
    string csv_field(const string &field) {
        if (field.find_first_of(",\"\r\n") == string::npos) {
            return field;
        }
        string quoted("\"");
        for (char c : field) {
            if (c == '"') {
                quoted += '"';
            }
            quoted += c;
        }
        return quoted + '"';
    }
}

probe_clock::duration target_stats::average() const {
    if (count == 0) {
        return probe_clock::duration::zero();
    }
    return sum / static_cast<probe_clock::rep>(count);
}

aggregator::aggregator(const vector<probe_target> &targets_, bool record_samples_) :
    targets(targets_),
    data(targets_.size()),
    record_samples(record_samples_),
    matched_total(0),
    failed_total(0) {
    if (record_samples) {
        records.reserve(targets.size());
        for (const auto &t : targets) {
            records.push_back(vector<string>{t.label, t.address.to_string()});
        }
    }
}

const target_stats &aggregator::on_matched(const probe_outcome &outcome) {
    target_stats &stats = data.at(outcome.target_id);
    stats.min = std::min(stats.min, outcome.round_trip);
    stats.max = std::max(stats.max, outcome.round_trip);
    stats.sum += outcome.round_trip;
    ++stats.count;
    ++matched_total;
    if (record_samples) {
        records[outcome.target_id].push_back(format_ms(outcome.round_trip, 4));
    }
    return stats;
}

const target_stats &aggregator::on_failed(const probe_outcome &outcome) {
    target_stats &stats = data.at(outcome.target_id);
    ++stats.failures;
    ++failed_total;
    return stats;
}

const target_stats &aggregator::stats(size_t target_id) const {
    return data.at(target_id);
}

const probe_target &aggregator::target(size_t target_id) const {
    return targets.at(target_id);
}

size_t aggregator::target_count() const {
    return targets.size();
}

uint64_t aggregator::total_matched() const {
    return matched_total;
}

sweep_summary aggregator::summarize(probe_clock::duration elapsed, size_t unanswered) const {
    sweep_summary summary;
    summary.total_matched = matched_total;
    summary.total_failed = failed_total;
    summary.unanswered = unanswered;
    summary.elapsed_seconds = chrono::duration_cast<chrono::duration<double> >(elapsed).count();
    if (summary.elapsed_seconds > 0) {
        summary.rate = static_cast<double>(matched_total) / summary.elapsed_seconds;
    }
    return summary;
}

const vector<vector<string> > &aggregator::rows() const {
    return records;
}

void aggregator::write_csv(ostream &out) const {
    for (const auto &row : records) {
        for (size_t i = 0; i < row.size(); ++i) {
            if (i != 0) {
                out << ',';
            }
            out << csv_field(row[i]);
        }
        out << '\n';
    }
}

string aggregator::format_ms(probe_clock::duration duration, int decimals) {
    double ms = chrono::duration_cast<chrono::duration<double, milli> >(duration).count();
    ostringstream oss;
    oss << fixed << setprecision(decimals) << ms;
    return oss.str();
}

string aggregator::summary_line(const sweep_summary &summary) {
    ostringstream oss;
    oss << "Pinged " << summary.total_matched << " times in "
        << fixed << setprecision(4) << summary.elapsed_seconds << " seconds ("
        << setprecision(2) << summary.rate << " pings/sec).";
    return oss.str();
}
