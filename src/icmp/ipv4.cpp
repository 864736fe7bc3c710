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

#include "ipv4.hpp"
#include <algorithm>
#include <cstring>

ipv4_header::ipv4_header() { std::fill(rep_, rep_ + sizeof(rep_), 0); }
ipv4_header::ipv4_header(const unsigned char *data): ipv4_header() {
    memcpy(rep_, data, (data[0] & 0xF) * 4);
}

unsigned char ipv4_header::version() const { return (rep_[0] >> 4) & 0xF; }
unsigned short ipv4_header::header_length() const { return (rep_[0] & 0xF) * 4; }
unsigned short ipv4_header::total_length() const { return decode(2, 3); }
unsigned int ipv4_header::time_to_live() const { return rep_[8]; }
unsigned char ipv4_header::protocol() const { return rep_[9]; }

boost::asio::ip::address_v4 ipv4_header::source_address() const
{
    boost::asio::ip::address_v4::bytes_type bytes
            = { { rep_[12], rep_[13], rep_[14], rep_[15] } };
    return boost::asio::ip::address_v4(bytes);
}

boost::asio::ip::address_v4 ipv4_header::destination_address() const
{
    boost::asio::ip::address_v4::bytes_type bytes
            = { { rep_[16], rep_[17], rep_[18], rep_[19] } };
    return boost::asio::ip::address_v4(bytes);
}

unsigned short ipv4_header::decode(int a, int b) const
{ return (rep_[a] << 8) + rep_[b]; }
