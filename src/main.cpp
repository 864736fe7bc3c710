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

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio/ip/icmp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>
#include <boost/version.hpp>
#include <nlohmann/json.hpp>

#include "core/config.h"
#include "core/log.h"
#include "core/service.h"
#include "core/version.h"

using namespace std;
using namespace boost::asio;
namespace po = boost::program_options;

// Resolves every host to its first IPv4 address. Hosts that do not resolve
// are reported and dropped; the order of the rest is kept.
vector<probe_target> resolve_targets(const vector<string> &hosts) {
    io_context resolver_context;
    ip::icmp::resolver resolver(resolver_context);
    vector<probe_target> targets;
    for (const auto &host : hosts) {
        boost::system::error_code ec;
        auto results = resolver.resolve(ip::icmp::v4(), host, "", ec);
        if (ec || results.empty()) {
            Log::log_with_date_time("Could not get IP for " + host + ": "
                                    + (ec ? ec.message() : string("no IPv4 address")), Log::ERROR);
            continue;
        }
        probe_target target;
        target.label = host;
        target.address = results.begin()->endpoint().address().to_v4();
        targets.push_back(target);
    }
    return targets;
}

void signal_async_wait(signal_set &sig, Service &service) {
    sig.async_wait([&](const boost::system::error_code error, int signum) {
        if (error) {
            return;
        }
        Log::log_with_date_time("got signal: " + to_string(signum), Log::WARN);
        service.stop();
    });
}

int main(int argc, const char *argv[]) {
    try {
        string config_file;
        string log_file;
        string output_file;
        int64_t interval_us = 0;
        int threads = 0;
        bool test;

        po::options_description desc("options");
        desc.add_options()
            ("config,c", po::value<string>(&config_file)->value_name("CONFIG"), "specify config file")
            ("help,h", "print help message")
            ("interval,i", po::value<int64_t>(&interval_us)->value_name("INTERVAL_US"), "pause between two probes in microseconds")
            ("log,l", po::value<string>(&log_file)->value_name("LOG"), "specify log file location")
            ("output,o", po::value<string>(&output_file)->value_name("OUTPUT"), "write the samples to OUTPUT in CSV format")
            ("threads,p", po::value<int>(&threads)->value_name("THREADS"), "number of io threads; 0 keeps the configured value, -1 prints the default and quits")
            ("test,t", po::bool_switch(&test), "test config file")
            ("version,v", "print version and build info")
        ;
        po::options_description hidden;
        hidden.add_options()
            ("host", po::value<vector<string> >(), "host to ping")
        ;
        po::options_description all;
        all.add(desc).add(hidden);
        po::positional_options_description positional;
        positional.add("host", -1);

        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
        po::notify(vm);
        if (vm.count("help")) {
            Log::log(string("usage: ") + argv[0] + " [-htv] [-c CONFIG] [-o OUTPUT] [-i INTERVAL_US] [-p THREADS] [-l LOG] host...", Log::FATAL);
            cerr << desc;
            exit(EXIT_SUCCESS);
        }
        if (vm.count("version")) {
            Log::log("pping " + Version::get_version(), Log::FATAL);
            Log::log(string("Boost ") + BOOST_LIB_VERSION + ", nlohmann/json "
                     + to_string(NLOHMANN_JSON_VERSION_MAJOR) + "." + to_string(NLOHMANN_JSON_VERSION_MINOR)
                     + "." + to_string(NLOHMANN_JSON_VERSION_PATCH), Log::FATAL);
            exit(EXIT_SUCCESS);
        }
        if (vm.count("threads") && threads < 0) {
            Log::log("default threads = " + to_string(max(1u, thread::hardware_concurrency())), Log::FATAL);
            exit(EXIT_SUCCESS);
        }

        Config config;
        if (vm.count("config")) {
            config.load(config_file);
        }
        if (vm.count("host")) {
            config.targets = vm["host"].as<vector<string> >();
        }
        if (vm.count("interval")) {
            config.interval_us = interval_us;
        }
        if (vm.count("threads")) {
            config.override_threads(threads);
        }
        if (vm.count("output")) {
            config.output = output_file;
        }
        if (vm.count("log")) {
            config.log_file = log_file;
        }
        config.validate();
        Log::level = config.log_level;
        if (!config.log_file.empty()) {
            Log::redirect(config.log_file);
        }
        if (test) {
            Log::log("The config file looks good.", Log::OFF);
            exit(EXIT_SUCCESS);
        }
        if (config.targets.empty()) {
            throw runtime_error("No hosts provided.");
        }

        vector<probe_target> targets = resolve_targets(config.targets);
        if (targets.empty()) {
            throw runtime_error("Unable to find ips for any of the provided hosts.");
        }

        {
            Service service(config, targets);
            signal_set sig(service.service());
            sig.add(SIGINT);
            sig.add(SIGTERM);
            signal_async_wait(sig, service);
            service.run();
        }
        Log::stop();
        exit(EXIT_SUCCESS);
    } catch (const exception &e) {
        Log::log_with_date_time(string("fatal: ") + e.what(), Log::FATAL);
        Log::log_with_date_time("exiting. . . ", Log::FATAL);
        Log::stop();
        exit(EXIT_FAILURE);
    }
}
