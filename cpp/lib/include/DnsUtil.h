/** \file    DnsUtil.h
 *  \brief   Declarations for DNS utility functions.
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

#ifndef DNS_UTIL_H
#define DNS_UTIL_H


#include <string>
#include <vector>


namespace DnsUtil {


/** \brief   Maps "hostname" to all of its IPv4 and IPv6 addresses with the help of getaddrinfo(3).
 *  \param   ip_addresses   The textual representations of the addresses, duplicates removed, in resolver order.
 *  \param   error_message  A description of the problem if we return false.
 *  \return  True if at least one address was found, else false.
 */
bool ResolveHostname(const std::string &hostname, std::vector<std::string> * const ip_addresses, std::string * const error_message);


} // namespace DnsUtil


#endif // ifndef DNS_UTIL_H
