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

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include "core/config.h"
#include "test_harness.h"
using namespace std;

namespace {
    bool throws_runtime_error(const string &JSON) {
        Config config;
        try {
            config.populate(JSON);
        } catch (const runtime_error &) {
            return true;
        }
        return false;
    }

    bool test_defaults() {
        Config config;
        CHECK(config.targets.empty());
        CHECK(config.interval_us == 1000);
        CHECK(config.threads == 2);
        CHECK(config.warmup);
        CHECK(config.grace_ms == 500);
        CHECK(config.pending_timeout_ms == 0);
        CHECK(config.report_every == 100);
        CHECK(config.output.empty());
        CHECK(config.log_level == Log::INFO);
        config.validate();
        return true;
    }

    bool test_populate_overrides() {
        Config config;
        config.populate(string(R"({
            "targets": ["192.0.2.1", "example.com"],
            "interval_us": 250,
            "threads": 4,
            "warmup": false,
            "pending_timeout_ms": 2000,
            "output": "samples.csv",
            "log_level": 3
        })"));
        CHECK(config.targets.size() == 2);
        CHECK(config.targets[1] == "example.com");
        CHECK(config.interval_us == 250);
        CHECK(config.threads == 4);
        CHECK(!config.warmup);
        CHECK(config.pending_timeout_ms == 2000);
        CHECK(config.output == "samples.csv");
        CHECK(config.log_level == Log::ERROR);
        // Keys that are absent keep their defaults.
        CHECK(config.grace_ms == 500);
        return true;
    }

    bool test_rejects_bad_documents() {
        CHECK(throws_runtime_error("{not json"));
        CHECK(throws_runtime_error("[1, 2]"));
        CHECK(throws_runtime_error(R"({"interval_us": "fast"})"));
        CHECK(throws_runtime_error(R"({"interval_us": 0})"));
        CHECK(throws_runtime_error(R"({"threads": 0})"));
        CHECK(throws_runtime_error(R"({"grace_ms": -1})"));
        CHECK(throws_runtime_error(R"({"report_every": 0})"));
        CHECK(throws_runtime_error(R"({"log_level": 9})"));
        CHECK(throws_runtime_error(R"({"targets": "192.0.2.1"})"));
        return true;
    }

    bool test_load_file() {
        const string path = "pping_test_config.json";
        {
            ofstream out(path);
            out << R"({"targets": ["127.0.0.1"], "grace_ms": 50})";
        }
        Config config;
        config.load(path);
        remove(path.c_str());
        CHECK(config.targets.size() == 1);
        CHECK(config.grace_ms == 50);
        return true;
    }

    bool test_override_threads() {
        Config config;
        config.populate(string(R"({"threads": 3})"));
        config.override_threads(0);
        CHECK(config.threads == 3);
        config.validate();
        config.override_threads(8);
        CHECK(config.threads == 8);
        return true;
    }

    bool test_load_missing_file() {
        Config config;
        try {
            config.load("/nonexistent/pping.json");
        } catch (const runtime_error &e) {
            return string(e.what()).find("/nonexistent/pping.json") != string::npos;
        }
        return false;
    }
}

int main() {
    run_test("defaults", test_defaults);
    run_test("populate overrides", test_populate_overrides);
    run_test("rejects bad documents", test_rejects_bad_documents);
    run_test("load file", test_load_file);
    run_test("load missing file", test_load_missing_file);
    run_test("override threads", test_override_threads);
    return test_result();
}
