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

#include <stdexcept>
#include <string>
#include <vector>
#include "icmp/icmp.hpp"
#include "icmp/ipv4.hpp"
#include "test_harness.h"
using namespace std;

namespace {
    string icmp_message_bytes(unsigned char type, unsigned short id, unsigned short seq, const string &body) {
        icmp_header header;
        header.type(type);
        header.code(0);
        header.identifier(id);
        header.sequence_number(seq);
        header.compute_checksum(body.data(), body.data() + body.size());
        return header.data() + body;
    }

    vector<unsigned char> datagram(const string &icmp, size_t options = 0, unsigned char protocol = 1) {
        size_t header_length = 20 + options;
        vector<unsigned char> bytes(header_length, 0);
        bytes[0] = static_cast<unsigned char>(0x40 | (header_length / 4));
        size_t total = header_length + icmp.size();
        bytes[2] = static_cast<unsigned char>(total >> 8);
        bytes[3] = static_cast<unsigned char>(total & 0xFF);
        bytes[8] = 64;
        bytes[9] = protocol;
        unsigned char source[4] = {10, 0, 0, 7};
        unsigned char destination[4] = {10, 0, 0, 1};
        for (int i = 0; i < 4; ++i) {
            bytes[12 + i] = source[i];
            bytes[16 + i] = destination[i];
        }
        bytes.insert(bytes.end(), icmp.begin(), icmp.end());
        return bytes;
    }

    bool test_encode_echo_request() {
        string packet = encode_echo_request(3, 513, "10.0.0.7");
        CHECK(packet.size() == 8 + 8);
        const unsigned char *p = reinterpret_cast<const unsigned char *>(packet.data());
        CHECK(p[0] == icmp_header::echo_request);
        CHECK(p[1] == 0);
        icmp_header header(p);
        CHECK(header.identifier() == 3);
        CHECK(header.sequence_number() == 513);
        CHECK(packet.substr(8) == "10.0.0.7");
        CHECK(internet_checksum(p, packet.size()) == 0);
        return true;
    }

    bool test_encode_odd_body_checksum() {
        string packet = encode_echo_request(65535, 65535, "abc");
        CHECK(internet_checksum(reinterpret_cast<const unsigned char *>(packet.data()), packet.size()) == 0);
        return true;
    }

    bool test_encode_rejects_wide_identifier() {
        try {
            encode_echo_request(70000, 0, "");
        } catch (const invalid_argument &) {
            return true;
        }
        return false;
    }

    bool test_decode_echo_reply() {
        auto bytes = datagram(icmp_message_bytes(icmp_header::echo_reply, 2, 41, "payload"));
        icmp_message message = decode_datagram(bytes.data(), bytes.size());
        CHECK(message.status == icmp_message::echo_reply);
        CHECK(message.identifier == 2);
        CHECK(message.sequence_number == 41);
        CHECK(message.source.to_string() == "10.0.0.7");
        return true;
    }

    bool test_decode_with_ip_options() {
        auto bytes = datagram(icmp_message_bytes(icmp_header::echo_reply, 9, 1, ""), 4);
        icmp_message message = decode_datagram(bytes.data(), bytes.size());
        CHECK(message.status == icmp_message::echo_reply);
        CHECK(message.identifier == 9);
        ipv4_header header(bytes.data());
        CHECK(header.header_length() == 24);
        CHECK(header.version() == 4);
        CHECK(header.time_to_live() == 64);
        CHECK(header.destination_address().to_string() == "10.0.0.1");
        return true;
    }

    bool test_decode_other_types_are_notices() {
        auto request = datagram(icmp_message_bytes(icmp_header::echo_request, 1, 1, "x"));
        icmp_message message = decode_datagram(request.data(), request.size());
        CHECK(message.status == icmp_message::not_echo_reply);
        CHECK(message.type == icmp_header::echo_request);

        auto unreachable = datagram(icmp_message_bytes(icmp_header::destination_unreachable, 0, 0, "quoted"));
        message = decode_datagram(unreachable.data(), unreachable.size());
        CHECK(message.status == icmp_message::not_echo_reply);
        CHECK(message.type == icmp_header::destination_unreachable);
        return true;
    }

    bool test_decode_malformed() {
        auto good = datagram(icmp_message_bytes(icmp_header::echo_reply, 1, 1, "body"));

        CHECK(decode_datagram(good.data(), 10).status == icmp_message::malformed);
        // Header claims more bytes than were received.
        auto truncated = good;
        truncated[0] = 0x4F;
        CHECK(decode_datagram(truncated.data(), 30).status == icmp_message::malformed);
        // Too short for an ICMP header.
        CHECK(decode_datagram(good.data(), 24).status == icmp_message::malformed);

        auto corrupt = good;
        corrupt.back() ^= 0xFF;
        icmp_message message = decode_datagram(corrupt.data(), corrupt.size());
        CHECK(message.status == icmp_message::malformed);
        CHECK(message.error == "bad icmp checksum");

        auto tcp = datagram(icmp_message_bytes(icmp_header::echo_reply, 1, 1, ""), 0, 6);
        CHECK(decode_datagram(tcp.data(), tcp.size()).status == icmp_message::malformed);

        auto ipv6 = good;
        ipv6[0] = 0x65;
        CHECK(decode_datagram(ipv6.data(), ipv6.size()).status == icmp_message::malformed);
        return true;
    }
}

int main() {
    run_test("encode echo request", test_encode_echo_request);
    run_test("encode odd-length body", test_encode_odd_body_checksum);
    run_test("encode rejects identifier above 16 bits", test_encode_rejects_wide_identifier);
    run_test("decode echo reply", test_decode_echo_reply);
    run_test("decode skips ip options", test_decode_with_ip_options);
    run_test("decode other icmp types", test_decode_other_types_are_notices);
    run_test("decode malformed datagrams", test_decode_malformed);
    return test_result();
}
