/** \file   HostGuard.h
 *  \brief  Rejects target URLs that would make us talk to local, private or otherwise non-public hosts.
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
#pragma once


#include <functional>
#include <string>
#include <vector>
#include "Url.h"


class HostGuard {
public:
    /** Maps a hostname to IP addresses in textual form.  Returns false if the name could not be resolved. */
    typedef std::function<bool(const std::string &hostname, std::vector<std::string> * const ip_addresses)> Resolver;
private:
    Resolver resolver_;
public:
    /** Uses DnsUtil::ResolveHostname(). */
    HostGuard();

    explicit HostGuard(const Resolver &resolver): resolver_(resolver) { }

    /** \brief  Checks the scheme and the host of "url".
     *  \throws ScrapeError with kind INVALID_SCHEME unless the scheme is "http" or "https" and with kind HOST_NOT_ALLOWED
     *          if the host is a local name or if the host or any address it resolves to is not a public address.
     *  \note   Hosts that can't be resolved are allowed.
     */
    void validate(const Url &url) const;

    /** \brief  The host part of validate().
     *  \param  hostname  Lowercase and without IPv6 brackets, as returned by Url::getHostname().
     *  \param  reason    Set to a brief explanation if we return false.
     */
    bool isAllowedHost(const std::string &hostname, std::string * const reason) const;

    /** \brief  Non-throwing version of validate().
     *  \note   Can be used as a Downloader::RedirectValidator.
     */
    bool isAllowedUrl(const Url &url, std::string * const reason) const;
};
