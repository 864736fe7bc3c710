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

#include "icmp.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include "ipv4.hpp"
using namespace std;

namespace {
    const size_t max_body_length = 65535 - 20 - icmp_header::length;
}

icmp_header::icmp_header() {
    std::fill(rep_, rep_ + sizeof(rep_), 0);
}
icmp_header::icmp_header(const unsigned char *data) {
    memcpy(rep_, data, sizeof(rep_));
}
string icmp_header::data() const {
    return string(reinterpret_cast<const char *>(rep_), sizeof(rep_));
}
unsigned char icmp_header::type() const { return rep_[0]; }
unsigned char icmp_header::code() const { return rep_[1]; }
unsigned short icmp_header::checksum() const { return decode(2, 3); }
unsigned short icmp_header::identifier() const { return decode(4, 5); }
unsigned short icmp_header::sequence_number() const { return decode(6, 7); }

void icmp_header::type(unsigned char n) { rep_[0] = n; }
void icmp_header::code(unsigned char n) { rep_[1] = n; }
void icmp_header::checksum(unsigned short n) { encode(2, 3, n); }
void icmp_header::identifier(unsigned short n) { encode(4, 5, n); }
void icmp_header::sequence_number(unsigned short n) { encode(6, 7, n); }

unsigned short icmp_header::decode(int a, int b) const
{ return (rep_[a] << 8) + rep_[b]; }

void icmp_header::encode(int a, int b, unsigned short n)
{
    rep_[a] = static_cast<unsigned char>(n >> 8);
    rep_[b] = static_cast<unsigned char>(n & 0xFF);
}

void icmp_header::compute_checksum(char const *body_begin, char const *body_end)
{
    unsigned int sum = (type() << 8) + code() + identifier() + sequence_number();

    char const *body_iter = body_begin;
    while (body_iter != body_end)
    {
        sum += (static_cast<unsigned char>(*body_iter++) << 8);
        if (body_iter != body_end)
            sum += static_cast<unsigned char>(*body_iter++);
    }

    sum = (sum >> 16) + (sum & 0xFFFF);
    sum += (sum >> 16);
    checksum(static_cast<unsigned short>(~sum));
}

unsigned short internet_checksum(const unsigned char *data, size_t length) {
    unsigned long sum = 0;
    size_t i = 0;
    for (; i + 1 < length; i += 2) {
        sum += (data[i] << 8) + data[i + 1];
    }
    if (i < length) {
        sum += data[i] << 8;
    }
    while (sum >> 16) {
        sum = (sum >> 16) + (sum & 0xFFFF);
    }
    return static_cast<unsigned short>(~sum);
}

string encode_echo_request(unsigned long identifier, unsigned short sequence_number,
                           const string &body) {
    if (identifier > 0xFFFF) {
        throw invalid_argument("identifier " + to_string(identifier) + " does not fit in 16 bits");
    }
    if (body.size() > max_body_length) {
        throw invalid_argument("echo body of " + to_string(body.size()) + " bytes is too large");
    }
    icmp_header echo_request;
    echo_request.type(icmp_header::echo_request);
    echo_request.code(0);
    echo_request.identifier(static_cast<unsigned short>(identifier));
    echo_request.sequence_number(sequence_number);
    echo_request.compute_checksum(body.data(), body.data() + body.size());
    return echo_request.data() + body;
}

icmp_message decode_datagram(const unsigned char *data, size_t length) {
    icmp_message message;
    if (length < ipv4_header::min_length) {
        message.error = "truncated ipv4 header: " + to_string(length) + " bytes";
        return message;
    }
    if ((data[0] >> 4) != 4) {
        message.error = "not an ipv4 datagram";
        return message;
    }
    size_t header_length = (data[0] & 0xF) * 4;
    if (header_length < ipv4_header::min_length || header_length > length) {
        message.error = "bad ipv4 header length: " + to_string(header_length);
        return message;
    }
    ipv4_header ipv4_hdr(data);
    message.source = ipv4_hdr.source_address();
    if (ipv4_hdr.protocol() != ipv4_header::protocol_icmp) {
        message.error = "unexpected ip protocol " + to_string(ipv4_hdr.protocol());
        return message;
    }

    const unsigned char *icmp_begin = data + header_length;
    size_t icmp_length = length - header_length;
    if (icmp_length < icmp_header::length) {
        message.error = "truncated icmp header: " + to_string(icmp_length) + " bytes";
        return message;
    }
    if (internet_checksum(icmp_begin, icmp_length) != 0) {
        message.error = "bad icmp checksum";
        return message;
    }

    icmp_header icmp_hdr(icmp_begin);
    message.type = icmp_hdr.type();
    message.code = icmp_hdr.code();
    if (icmp_hdr.type() != icmp_header::echo_reply) {
        message.status = icmp_message::not_echo_reply;
        return message;
    }
    message.status = icmp_message::echo_reply;
    message.identifier = icmp_hdr.identifier();
    message.sequence_number = icmp_hdr.sequence_number();
    return message;
}
