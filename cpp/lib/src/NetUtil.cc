/** \file    NetUtil.cc
 *  \brief   Implementation of network-related utility functions.
 *  \author  Dr. Johannes Ruscheinski
 */

/*
 *  Copyright 2002-2009 Project iVia.
 *  Copyright 2002-2009 The Regents of The University of California.
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as published
 *  by the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software
 *  Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */

#include "NetUtil.h"
#include <stdexcept>
#include <vector>
#include <arpa/inet.h>
#include "StringUtil.h"
#include "util.h"


namespace NetUtil {


std::string IpAddress::toString() const {
    char buffer[INET6_ADDRSTRLEN];
    if (unlikely(::inet_ntop(family_ == IPV4 ? AF_INET : AF_INET6, bytes_.data(), buffer, sizeof buffer) == nullptr))
        throw std::runtime_error("in NetUtil::IpAddress::toString: inet_ntop(3) failed!");

    return buffer;
}


bool StringToIpAddress(const std::string &s, IpAddress * const ip_address) {
    *ip_address = IpAddress();
    if (::inet_pton(AF_INET, s.c_str(), ip_address->bytes_.data()) == 1) {
        ip_address->family_ = IpAddress::IPV4;
        return true;
    }

    const std::string address_without_zone_index(s.substr(0, s.find('%')));
    if (::inet_pton(AF_INET6, address_without_zone_index.c_str(), ip_address->bytes_.data()) == 1) {
        ip_address->family_ = IpAddress::IPV6;
        return true;
    }

    return false;
}


bool StringToNetworkAddressAndPrefixLength(const std::string &s, IpAddress * const network_address, unsigned * const prefix_length) {
    const auto slash_pos(s.find('/'));
    if (slash_pos == std::string::npos)
        return false;

    if (not StringToIpAddress(s.substr(0, slash_pos), network_address))
        return false;

    return StringUtil::ToUnsigned(s.substr(slash_pos + 1), prefix_length) and *prefix_length <= network_address->getBitCount();
}


bool IsInNetwork(const IpAddress &ip_address, const IpAddress &network_address, const unsigned prefix_length) {
    if (ip_address.family_ != network_address.family_)
        return false;

    const unsigned full_bytes(prefix_length / 8u);
    for (unsigned i(0); i < full_bytes; ++i) {
        if (ip_address.bytes_[i] != network_address.bytes_[i])
            return false;
    }

    const unsigned remaining_bits(prefix_length % 8u);
    if (remaining_bits == 0)
        return true;

    const uint8_t mask(static_cast<uint8_t>(0xFFu << (8u - remaining_bits)));
    return (ip_address.bytes_[full_bytes] & mask) == (network_address.bytes_[full_bytes] & mask);
}


namespace {


struct Network {
    IpAddress address_;
    unsigned prefix_length_;
};


class NetworkTable {
    std::vector<Network> networks_;
public:
    explicit NetworkTable(const std::vector<std::string> &cidr_strings);
    bool contains(const IpAddress &ip_address) const;
};


NetworkTable::NetworkTable(const std::vector<std::string> &cidr_strings) {
    for (const auto &cidr_string : cidr_strings) {
        Network network;
        if (unlikely(not StringToNetworkAddressAndPrefixLength(cidr_string, &network.address_, &network.prefix_length_)))
            throw std::runtime_error("in NetUtil::NetworkTable::NetworkTable: bad network \"" + cidr_string + "\"!");
        networks_.emplace_back(network);
    }
}


bool NetworkTable::contains(const IpAddress &ip_address) const {
    for (const auto &network : networks_) {
        if (IsInNetwork(ip_address, network.address_, network.prefix_length_))
            return true;
    }

    return false;
}


const NetworkTable &GetPrivateNetworks() {
    static const NetworkTable private_networks({
        "0.0.0.0/8", "10.0.0.0/8", "127.0.0.0/8", "169.254.0.0/16", "172.16.0.0/12", "192.0.0.0/24", "192.0.2.0/24",
        "192.168.0.0/16", "198.18.0.0/15", "198.51.100.0/24", "203.0.113.0/24", "240.0.0.0/4", "255.255.255.255/32",
        "::1/128", "::/128", "::ffff:0:0/96", "64:ff9b:1::/48", "100::/64", "2001::/23", "2001:db8::/32", "2002::/16",
        "fc00::/7", "fe80::/10" });
    return private_networks;
}


// Globally reachable exceptions to the private networks above.
const NetworkTable &GetPrivateNetworkExceptions() {
    static const NetworkTable private_network_exceptions({
        "192.0.0.9/32", "192.0.0.10/32", "2001:1::1/128", "2001:1::2/128", "2001:3::/32", "2001:4:112::/48", "2001:20::/28",
        "2001:30::/28" });
    return private_network_exceptions;
}


const NetworkTable &GetReservedNetworks() {
    static const NetworkTable reserved_networks({
        "240.0.0.0/4", "::/8", "100::/8", "200::/7", "400::/6", "800::/5", "1000::/4", "4000::/3", "6000::/3", "8000::/3",
        "a000::/3", "c000::/3", "e000::/4", "f000::/5", "f800::/6", "fe00::/9" });
    return reserved_networks;
}


const NetworkTable &GetMulticastNetworks() {
    static const NetworkTable multicast_networks({ "224.0.0.0/4", "ff00::/8" });
    return multicast_networks;
}


const NetworkTable &GetLoopbackNetworks() {
    static const NetworkTable loopback_networks({ "127.0.0.0/8", "::1/128" });
    return loopback_networks;
}


} // unnamed namespace


bool IsPrivate(const IpAddress &ip_address) {
    return GetPrivateNetworks().contains(ip_address) and not GetPrivateNetworkExceptions().contains(ip_address);
}


bool IsLoopback(const IpAddress &ip_address) {
    return GetLoopbackNetworks().contains(ip_address);
}


bool IsReserved(const IpAddress &ip_address) {
    return GetReservedNetworks().contains(ip_address);
}


bool IsMulticast(const IpAddress &ip_address) {
    return GetMulticastNetworks().contains(ip_address);
}


} // namespace NetUtil
