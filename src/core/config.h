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

#ifndef _CONFIG_H_
#define _CONFIG_H_

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "log.h"

class Config {
public:
    std::vector<std::string> targets;
    int64_t interval_us;
    int threads;
    bool warmup;
    int64_t warmup_timeout_ms;
    int64_t grace_ms;
    int64_t pending_timeout_ms;   // 0 keeps unanswered probes pending until shutdown
    int64_t report_every;
    std::string output;
    Log::Level log_level;
    std::string log_file;
    bool quit_key;

    Config();
    void load(const std::string &filename);
    void populate(const std::string &JSON);
    void populate(const nlohmann::json &tree);
    void validate() const;
    // Command line thread count: 0 keeps the configured value.
    void override_threads(int count);
};

#endif // _CONFIG_H_
