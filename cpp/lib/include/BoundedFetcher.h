/** \file   BoundedFetcher.h
 *  \brief  Downloads HTML pages subject to size, media type and time limits.
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


#include <string>
#include <vector>
#include "Downloader.h"
#include "HostGuard.h"
#include "ScrapeTools.h"
#include "Url.h"


struct FetchResult {
    std::string html_;         // Valid UTF-8.
    std::string content_type_; // As sent by the server.
    size_t bytes_read_;        // Before UTF-8 sanitising.
public:
    FetchResult(): bytes_read_(0) { }
};


class BoundedFetcher {
public:
    static constexpr size_t DEFAULT_MAX_BODY_SIZE = 1000000;
    static const std::vector<std::string> HTML_MEDIA_TYPES;

    struct Params {
        std::string user_agent_;
        unsigned connect_timeout_; // In ms.
        unsigned time_limit_;      // In ms, includes all redirects.
        size_t max_body_size_;
        long max_redirect_count_;
        std::vector<std::string> resolve_overrides_;
    public:
        explicit Params(const std::string &user_agent = ScrapeTools::DEFAULT_USER_AGENT,
                        const unsigned connect_timeout = Downloader::DEFAULT_CONNECT_TIMEOUT, const unsigned time_limit = 15000,
                        const size_t max_body_size = DEFAULT_MAX_BODY_SIZE,
                        const long max_redirect_count = Downloader::DEFAULT_MAX_REDIRECTS,
                        const std::vector<std::string> &resolve_overrides = {})
            : user_agent_(user_agent), connect_timeout_(connect_timeout), time_limit_(time_limit), max_body_size_(max_body_size),
              max_redirect_count_(max_redirect_count), resolve_overrides_(resolve_overrides) { }
    };
private:
    Params params_;
    const HostGuard &host_guard_;
public:
    /** \note "host_guard" vets redirect targets and must outlive the fetcher. */
    BoundedFetcher(const Params &params, const HostGuard &host_guard): params_(params), host_guard_(host_guard) { }

    /** \brief  Downloads "url", following redirects.
     *  \param  warnings  An informational "Content-Type: ..." entry will be appended on success.
     *  \throws ScrapeError with one of the kinds UPSTREAM_TIMEOUT, UPSTREAM_CONNECTION_ERROR, UPSTREAM_HTTP_ERROR,
     *          UNSUPPORTED_MEDIA_TYPE, PAYLOAD_TOO_LARGE or HOST_NOT_ALLOWED, the latter for a redirect to a blocked host.
     *  \note   The size limit is enforced against the declared content length as well as while the body is being received.
     */
    FetchResult fetch(const Url &url, std::vector<std::string> * const warnings) const;
};
