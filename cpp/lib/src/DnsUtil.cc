/** \file    DnsUtil.cc
 *  \brief   Implementation of DNS utility functions.
 *  \author  Dr. Johannes Ruscheinski
 */

/*
 *  Copyright 2002-2009 Project iVia.
 *  Copyright 2002-2009 The Regents of The University of California.
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as
 *  published by the Free Software Foundation; either version 2 of the License,
 *  or (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software Foundation, Inc.,
 *  59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */

#include "DnsUtil.h"
#include <algorithm>
#include <cstring>
#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>


namespace DnsUtil {


bool ResolveHostname(const std::string &hostname, std::vector<std::string> * const ip_addresses, std::string * const error_message) {
    ip_addresses->clear();
    error_message->clear();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof hints);
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo *results;
    const int retcode(::getaddrinfo(hostname.c_str(), nullptr, &hints, &results));
    if (retcode != 0) {
        *error_message = "getaddrinfo(3) failed for \"" + hostname + "\": " + std::string(::gai_strerror(retcode));
        return false;
    }

    for (const struct addrinfo *result(results); result != nullptr; result = result->ai_next) {
        char buffer[INET6_ADDRSTRLEN];
        const void *address;
        if (result->ai_family == AF_INET)
            address = &reinterpret_cast<const struct sockaddr_in *>(result->ai_addr)->sin_addr;
        else if (result->ai_family == AF_INET6)
            address = &reinterpret_cast<const struct sockaddr_in6 *>(result->ai_addr)->sin6_addr;
        else
            continue;

        if (::inet_ntop(result->ai_family, address, buffer, sizeof buffer) == nullptr)
            continue;
        if (std::find(ip_addresses->cbegin(), ip_addresses->cend(), buffer) == ip_addresses->cend())
            ip_addresses->emplace_back(buffer);
    }
    ::freeaddrinfo(results);

    if (ip_addresses->empty()) {
        *error_message = "no IPv4 or IPv6 addresses found for \"" + hostname + "\"!";
        return false;
    }

    return true;
}


} // namespace DnsUtil
