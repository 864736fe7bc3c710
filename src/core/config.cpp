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

#include "config.h"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>
using namespace std;
using json = nlohmann::json;

Config::Config() :
    interval_us(1000),
    threads(2),
    warmup(true),
    warmup_timeout_ms(1000),
    grace_ms(500),
    pending_timeout_ms(0),
    report_every(100),
    log_level(Log::INFO),
    quit_key(true) {}

void Config::load(const string &filename) {
    ifstream ifs(filename);
    if (!ifs.is_open()) {
        throw runtime_error(filename + ": " + strerror(errno));
    }
    json tree;
    try {
        ifs >> tree;
    } catch (const json::parse_error &e) {
        throw runtime_error(filename + ": " + e.what());
    }
    populate(tree);
}

void Config::populate(const string &JSON) {
    json tree;
    try {
        tree = json::parse(JSON);
    } catch (const json::parse_error &e) {
        throw runtime_error(string("config: ") + e.what());
    }
    populate(tree);
}

void Config::populate(const json &tree) {
    if (!tree.is_object()) {
        throw runtime_error("config: top level must be an object");
    }
    try {
        targets = tree.value("targets", targets);
        interval_us = tree.value("interval_us", interval_us);
        threads = tree.value("threads", threads);
        warmup = tree.value("warmup", warmup);
        warmup_timeout_ms = tree.value("warmup_timeout_ms", warmup_timeout_ms);
        grace_ms = tree.value("grace_ms", grace_ms);
        pending_timeout_ms = tree.value("pending_timeout_ms", pending_timeout_ms);
        report_every = tree.value("report_every", report_every);
        output = tree.value("output", output);
        int level = tree.value("log_level", static_cast<int>(log_level));
        if (level < Log::ALL || level > Log::OFF) {
            throw runtime_error("config: log_level must be between 0 and 5");
        }
        log_level = static_cast<Log::Level>(level);
        log_file = tree.value("log_file", log_file);
        quit_key = tree.value("quit_key", quit_key);
    } catch (const json::type_error &e) {
        throw runtime_error(string("config: ") + e.what());
    }
    validate();
}

void Config::validate() const {
    if (interval_us <= 0) {
        throw runtime_error("config: interval_us must be positive");
    }
    if (threads < 1) {
        throw runtime_error("config: threads must be at least 1");
    }
    if (warmup_timeout_ms <= 0) {
        throw runtime_error("config: warmup_timeout_ms must be positive");
    }
    if (grace_ms < 0) {
        throw runtime_error("config: grace_ms must not be negative");
    }
    if (pending_timeout_ms < 0) {
        throw runtime_error("config: pending_timeout_ms must not be negative");
    }
    if (report_every < 1) {
        throw runtime_error("config: report_every must be at least 1");
    }
    // The target index travels as the 16-bit ICMP identifier.
    if (targets.size() > 65536) {
        throw runtime_error("config: targets holds more than 65536 hosts");
    }
}

void Config::override_threads(int count) {
    if (count != 0) {
        threads = count;
    }
}
