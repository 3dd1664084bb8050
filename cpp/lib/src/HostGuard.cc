/** \file   HostGuard.cc
 *  \brief  Implementation of class HostGuard.
 *  \author The scrape_tools developers
 *
 *  \copyright 2026 The scrape_tools developers.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include "HostGuard.h"
#include <unordered_set>
#include "DnsUtil.h"
#include "NetUtil.h"
#include "ScrapeError.h"
#include "util.h"


namespace {


const std::unordered_set<std::string> BLOCKED_HOSTS{ "localhost", "127.0.0.1", "0.0.0.0" };
const std::string INVALID_SCHEME_MESSAGE("Only HTTP/S URLs are supported.");
const std::string LOCAL_TARGET_MESSAGE("Local targets are not allowed.");
const std::string PRIVATE_ADDRESS_MESSAGE("Private or internal addresses are blocked.");


bool DefaultResolver(const std::string &hostname, std::vector<std::string> * const ip_addresses) {
    std::string error_message;
    if (DnsUtil::ResolveHostname(hostname, ip_addresses, &error_message))
        return true;

    LOG_DEBUG(error_message);
    return false;
}


} // unnamed namespace


HostGuard::HostGuard(): resolver_(DefaultResolver) {
}


bool HostGuard::isAllowedHost(const std::string &hostname, std::string * const reason) const {
    if (hostname.empty() or BLOCKED_HOSTS.find(hostname) != BLOCKED_HOSTS.cend()) {
        *reason = LOCAL_TARGET_MESSAGE;
        return false;
    }

    NetUtil::IpAddress ip_address;
    if (NetUtil::StringToIpAddress(hostname, &ip_address)) {
        if (NetUtil::IsPublicAddress(ip_address))
            return true;
        *reason = PRIVATE_ADDRESS_MESSAGE;
        return false;
    }

    std::vector<std::string> resolved_addresses;
    if (not resolver_(hostname, &resolved_addresses)) {
        LOG_DEBUG("can't resolve \"" + hostname + "\", allowing it");
        return true;
    }

    for (const auto &resolved_address : resolved_addresses) {
        if (not NetUtil::StringToIpAddress(resolved_address, &ip_address)) {
            LOG_WARNING("resolver returned a bogus address \"" + resolved_address + "\" for \"" + hostname + "\"");
            continue;
        }

        if (not NetUtil::IsPublicAddress(ip_address)) {
            LOG_DEBUG("\"" + hostname + "\" resolves to the non-public address " + resolved_address);
            *reason = PRIVATE_ADDRESS_MESSAGE;
            return false;
        }
    }

    return true;
}


bool HostGuard::isAllowedUrl(const Url &url, std::string * const reason) const {
    if (url.getScheme() != "http" and url.getScheme() != "https") {
        *reason = INVALID_SCHEME_MESSAGE;
        return false;
    }

    return isAllowedHost(url.getHostname(), reason);
}


void HostGuard::validate(const Url &url) const {
    if (url.getScheme() != "http" and url.getScheme() != "https")
        throw ScrapeError(ScrapeError::INVALID_SCHEME, INVALID_SCHEME_MESSAGE);

    std::string reason;
    if (not isAllowedHost(url.getHostname(), &reason))
        throw ScrapeError(ScrapeError::HOST_NOT_ALLOWED, reason);
}
