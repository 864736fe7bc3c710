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

#include <chrono>
#include <set>
#include <utility>
#include <vector>
#include "icmp/aggregator.hpp"
#include "icmp/correlator.hpp"
#include "test_harness.h"
using namespace std;
using namespace std::chrono;

namespace {
    const probe_clock::time_point t0 = probe_clock::time_point() + hours(1);

    bool test_reply_matches_pending() {
        correlator c(2);
        CHECK(c.on_pending(1, 0, t0).kind == probe_outcome::none);
        CHECK(c.is_pending(1, 0));
        probe_outcome outcome = c.on_reply(1, 0, t0 + microseconds(1500));
        CHECK(outcome.kind == probe_outcome::matched);
        CHECK(outcome.target_id == 1);
        CHECK(outcome.sequence == 0);
        CHECK(outcome.round_trip == microseconds(1500));
        CHECK(!c.is_pending(1, 0));
        CHECK(c.pending_count() == 0);
        return true;
    }

    bool test_reply_without_request_is_unsolicited() {
        correlator c(2);
        aggregator a(vector<probe_target>(2), false);
        probe_outcome outcome = c.on_reply(0, 7, t0);
        CHECK(outcome.kind == probe_outcome::unsolicited);
        CHECK(a.stats(0).count == 0);
        CHECK(c.anomalies() == 0);
        return true;
    }

    bool test_duplicate_reply() {
        correlator c(1);
        c.on_pending(0, 3, t0);
        CHECK(c.on_reply(0, 3, t0 + milliseconds(2)).kind == probe_outcome::matched);
        CHECK(c.on_reply(0, 3, t0 + milliseconds(3)).kind == probe_outcome::unsolicited);
        return true;
    }

    bool test_out_of_range_is_rejected_for_every_event() {
        correlator c(3);
        CHECK(c.on_pending(3, 0, t0).kind == probe_outcome::out_of_range);
        CHECK(c.on_reply(3, 0, t0).kind == probe_outcome::out_of_range);
        CHECK(c.on_reply(65535, 0, t0).kind == probe_outcome::out_of_range);
        CHECK(c.on_failure(1000, 0, "x").kind == probe_outcome::out_of_range);
        CHECK(c.pending_count() == 0);
        CHECK(c.anomalies() == 4);
        CHECK(!c.is_pending(3, 0));
        return true;
    }

    bool test_duplicate_pending_overwrites() {
        correlator c(1);
        c.on_pending(0, 4, t0);
        probe_outcome outcome = c.on_pending(0, 4, t0 + milliseconds(5));
        CHECK(outcome.kind == probe_outcome::overwritten);
        CHECK(c.pending_count() == 1);
        CHECK(c.anomalies() == 1);
        // The newer send time is the one measured against.
        CHECK(c.on_reply(0, 4, t0 + milliseconds(6)).round_trip == milliseconds(1));
        return true;
    }

    bool test_failure_removes_pending() {
        correlator c(2);
        c.on_pending(0, 0, t0);
        probe_outcome outcome = c.on_failure(0, 0, "short write: got 4; want 16");
        CHECK(outcome.kind == probe_outcome::failed);
        CHECK(outcome.cause == "short write: got 4; want 16");
        CHECK(c.pending_count() == 0);
        CHECK(c.on_reply(0, 0, t0).kind == probe_outcome::unsolicited);
        // A failure for a probe that was never registered is still reported.
        CHECK(c.on_failure(1, 9, "encode").kind == probe_outcome::failed);
        return true;
    }

    bool test_wire_sequence_wraps() {
        correlator c(1);
        c.on_pending(0, 65536 + 3, t0);
        CHECK(c.is_pending(0, 65539));
        CHECK(!c.is_pending(0, 3));
        // A stale failure for the older probe on the same wire key leaves it alone.
        CHECK(c.on_failure(0, 3, "late").kind == probe_outcome::failed);
        CHECK(c.is_pending(0, 65539));
        probe_outcome outcome = c.on_reply(0, 3, t0 + milliseconds(1));
        CHECK(outcome.kind == probe_outcome::matched);
        CHECK(outcome.sequence == 65539);
        return true;
    }

    bool test_round_trip_never_negative() {
        correlator c(1);
        c.on_pending(0, 0, t0);
        probe_outcome outcome = c.on_reply(0, 0, t0 - milliseconds(1));
        CHECK(outcome.kind == probe_outcome::matched);
        CHECK(outcome.round_trip == probe_clock::duration::zero());
        return true;
    }

    bool test_expire_fails_old_entries() {
        correlator c(2);
        c.on_pending(0, 0, t0);
        c.on_pending(1, 0, t0 + milliseconds(80));
        auto expired = c.expire(t0 + milliseconds(100), milliseconds(50));
        CHECK(expired.size() == 1);
        CHECK(expired[0].kind == probe_outcome::failed);
        CHECK(expired[0].target_id == 0);
        CHECK(expired[0].cause == "timeout");
        CHECK(c.pending_count() == 1);
        CHECK(c.is_pending(1, 0));
        return true;
    }

    bool test_drain() {
        correlator c(2);
        c.on_pending(0, 0, t0);
        c.on_pending(1, 0, t0);
        c.on_pending(1, 1, t0);
        CHECK(c.drain() == 3);
        CHECK(c.pending_count() == 0);
        CHECK(c.drain() == 0);
        return true;
    }

    bool test_one_entry_per_key() {
        correlator c(3);
        set<pair<size_t, uint64_t> > keys;
        for (uint64_t i = 0; i < 3000; ++i) {
            size_t id = static_cast<size_t>(i % 3);
            uint64_t seq = i / 3;
            CHECK(c.on_pending(id, seq, t0).kind == probe_outcome::none);
            keys.insert(make_pair(id, seq));
            if (i % 2 == 0) {
                CHECK(c.on_reply(static_cast<unsigned short>(id), static_cast<unsigned short>(seq), t0).kind == probe_outcome::matched);
                keys.erase(make_pair(id, seq));
            }
            CHECK(c.pending_count() == keys.size());
        }
        CHECK(c.anomalies() == 0);
        return true;
    }

    // Three targets probed at 0, 1 and 2 ms; only 0 and 2 answer. Without
    // an expiry policy the probe to target 1 just stays pending.
    bool test_three_target_sweep() {
        vector<probe_target> targets(3);
        correlator c(3);
        aggregator a(targets, true);
        for (size_t id = 0; id < 3; ++id) {
            c.on_pending(id, 0, t0 + milliseconds(id));
        }
        a.on_matched(c.on_reply(0, 0, t0 + milliseconds(10)));
        a.on_matched(c.on_reply(2, 0, t0 + milliseconds(14)));

        CHECK(a.stats(0).count == 1);
        CHECK(a.stats(0).min == milliseconds(10));
        CHECK(a.stats(1).count == 0);
        CHECK(a.stats(2).count == 1);
        CHECK(a.stats(2).max == milliseconds(12));
        CHECK(c.pending_count() == 1);
        CHECK(c.is_pending(1, 0));
        CHECK(a.total_matched() == 2);
        return true;
    }
}

int main() {
    run_test("reply matches pending request", test_reply_matches_pending);
    run_test("reply without request is unsolicited", test_reply_without_request_is_unsolicited);
    run_test("duplicate reply", test_duplicate_reply);
    run_test("out of range ids are rejected", test_out_of_range_is_rejected_for_every_event);
    run_test("duplicate pending overwrites", test_duplicate_pending_overwrites);
    run_test("failure removes pending entry", test_failure_removes_pending);
    run_test("wire sequence wraps", test_wire_sequence_wraps);
    run_test("round trip never negative", test_round_trip_never_negative);
    run_test("expire fails old entries", test_expire_fails_old_entries);
    run_test("drain", test_drain);
    run_test("at most one entry per key", test_one_entry_per_key);
    run_test("three target sweep", test_three_target_sweep);
    return test_result();
}
