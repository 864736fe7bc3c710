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

#ifndef _IPV4_HPP_
#define _IPV4_HPP_

#include <boost/asio/ip/address_v4.hpp>

// Read-only view of a received IPv4 header. Only the fields the receive path
// looks at are exposed. Byte offsets:
//   0     version (high nibble), header length in 32-bit words (low nibble)
//   2-3   total length
//   8     time to live
//   9     protocol
//   12-15 source address
//   16-19 destination address
// Options, if any, follow up to header_length() bytes.
class ipv4_header
{
public:
    enum { min_length = 20, max_length = 60, protocol_icmp = 1 };

    ipv4_header();
    // data must hold at least header_length() bytes; decode_datagram checks.
    explicit ipv4_header(const unsigned char *data);

    unsigned char version() const;
    unsigned short header_length() const;
    unsigned short total_length() const;
    unsigned int time_to_live() const;
    unsigned char protocol() const;

    boost::asio::ip::address_v4 source_address() const;
    boost::asio::ip::address_v4 destination_address() const;

private:
    unsigned short decode(int a, int b) const;

    unsigned char rep_[max_length];
};

#endif // _IPV4_HPP_
