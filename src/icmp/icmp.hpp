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

#ifndef _ICMP_HPP_
#define _ICMP_HPP_

#include <cstddef>
#include <string>
#include <boost/asio/ip/address_v4.hpp>

// Eight byte ICMP header: type, code, checksum, then identifier and sequence
// number, all multi-byte fields in network byte order.
class icmp_header
{
public:
    enum { echo_reply = 0, destination_unreachable = 3, source_quench = 4,
        redirect = 5, echo_request = 8, time_exceeded = 11, parameter_problem = 12,
        timestamp_request = 13, timestamp_reply = 14, info_request = 15,
        info_reply = 16, address_request = 17, address_reply = 18 };
    enum { length = 8 };

    icmp_header();
    explicit icmp_header(const unsigned char *data);
    std::string data() const;
    unsigned char type() const;
    unsigned char code() const;
    unsigned short checksum() const;
    unsigned short identifier() const;
    unsigned short sequence_number() const;

    void type(unsigned char n);
    void code(unsigned char n);
    void checksum(unsigned short n);
    void identifier(unsigned short n);
    void sequence_number(unsigned short n);

    void compute_checksum(char const *body_begin, char const *body_end);
private:
    unsigned short decode(int a, int b) const;

    void encode(int a, int b, unsigned short n);
    unsigned char rep_[length];
};

// One inbound datagram after decoding. Only echo replies carry a meaningful
// identifier/sequence pair; every other ICMP type is a not_echo_reply notice.
struct icmp_message {
    enum status_t { echo_reply, not_echo_reply, malformed };

    status_t status{malformed};
    unsigned char type{0};
    unsigned char code{0};
    unsigned short identifier{0};
    unsigned short sequence_number{0};
    boost::asio::ip::address_v4 source;
    std::string error;
};

// RFC 1071 one's-complement sum over an arbitrary byte range.
unsigned short internet_checksum(const unsigned char *data, std::size_t length);

// Builds a type 8 message. Throws std::invalid_argument when the identifier
// does not fit the 16-bit field or the body does not fit an IPv4 datagram.
std::string encode_echo_request(unsigned long identifier, unsigned short sequence_number,
                                const std::string &body);

// Decodes a datagram as delivered by a raw IPv4 ICMP socket, that is with
// the IPv4 header in front of the ICMP message.
icmp_message decode_datagram(const unsigned char *data, std::size_t length);

#endif // _ICMP_HPP_
