/** \file    NetUtil.h
 *  \brief   Declaration of network-related utility functions.
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

#ifndef NETUTIL_H
#define NETUTIL_H


#include <array>
#include <string>
#include <cinttypes>


namespace NetUtil {


/** \brief  An IPv4 or IPv6 address, stored in network byte order. */
struct IpAddress {
    enum Family { IPV4, IPV6 };
    Family family_;
    std::array<uint8_t, 16> bytes_; // Only the first 4 bytes are used for IPv4 addresses.
public:
    IpAddress(): family_(IPV4), bytes_() { }

    inline size_t size() const { return family_ == IPV4 ? 4 : 16; }
    inline unsigned getBitCount() const { return family_ == IPV4 ? 32 : 128; }
    std::string toString() const;
};


/** \brief  Parses a literal IPv4 address in dotted quad notation or a literal IPv6 address.
 *  \note   IPv6 addresses may carry a zone index, e.g. "fe80::1%eth0", which will be ignored.  Brackets are not accepted.
 *  \return True if "s" was a literal IP address, else false.
 */
bool StringToIpAddress(const std::string &s, IpAddress * const ip_address);


/** \brief  Expects strings of the form 138.23.0.0/16 or 2001:db8::/32 which get parsed into a network address and the
 *          length of the network prefix.
 *  \return True on success and false upon failure.
 */
bool StringToNetworkAddressAndPrefixLength(const std::string &s, IpAddress * const network_address, unsigned * const prefix_length);


/** \return True if the first "prefix_length" bits of "ip_address" and "network_address" are identical. */
bool IsInNetwork(const IpAddress &ip_address, const IpAddress &network_address, const unsigned prefix_length);


/** The following classification functions use the IANA special-purpose address registries. */

/** \return True for addresses that are not globally reachable, e.g. RFC 1918 and unique local addresses. */
bool IsPrivate(const IpAddress &ip_address);

bool IsLoopback(const IpAddress &ip_address);

/** \return True for addresses in blocks that the IETF has reserved for future use. */
bool IsReserved(const IpAddress &ip_address);

bool IsMulticast(const IpAddress &ip_address);


/** \return False if any of the above classification functions returns true for "ip_address". */
inline bool IsPublicAddress(const IpAddress &ip_address) {
    return not (IsPrivate(ip_address) or IsLoopback(ip_address) or IsReserved(ip_address) or IsMulticast(ip_address));
}


} // namespace NetUtil


#endif // ifndef NETUTIL_H
