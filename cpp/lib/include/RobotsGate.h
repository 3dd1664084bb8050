/** \file   RobotsGate.h
 *  \brief  Decides whether we may fetch a URL according to its site's robots.txt.
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
#include "RobotsDotTxt.h"
#include "ScrapeTools.h"
#include "Url.h"


class RobotsGate {
public:
    struct Params {
        std::string user_agent_;
        unsigned connect_timeout_; // In ms.
        unsigned time_limit_;      // In ms.
        size_t max_body_size_;
        long max_redirect_count_;
        std::vector<std::string> resolve_overrides_;
    public:
        explicit Params(const std::string &user_agent = ScrapeTools::DEFAULT_USER_AGENT,
                        const unsigned connect_timeout = Downloader::DEFAULT_CONNECT_TIMEOUT, const unsigned time_limit = 15000,
                        const size_t max_body_size = 500000, const long max_redirect_count = Downloader::DEFAULT_MAX_REDIRECTS,
                        const std::vector<std::string> &resolve_overrides = {})
            : user_agent_(user_agent), connect_timeout_(connect_timeout), time_limit_(time_limit), max_body_size_(max_body_size),
              max_redirect_count_(max_redirect_count), resolve_overrides_(resolve_overrides) { }
    };

    static const std::string DOWNLOAD_FAILED_WARNING;
private:
    Params params_;
    const HostGuard &host_guard_;
public:
    /** \note "host_guard" vets redirect targets and must outlive the gate. */
    RobotsGate(const Params &params, const HostGuard &host_guard): params_(params), host_guard_(host_guard) { }

    /** \brief  Downloads the robots.txt file of the site "url" belongs to and checks whether we may fetch "url".
     *  \param  warnings  DOWNLOAD_FAILED_WARNING will be appended if the robots.txt file could not be retrieved.
     *  \return False if the site's robots.txt forbids access to "url" for our user agent, else true.
     *  \note   If robots.txt could not be downloaded because of a network problem, a server error or an oversized
     *          response, access is granted.  A 401 or 403 response denies access, any other 4xx response grants it.
     */
    bool check(const Url &url, std::vector<std::string> * const warnings) const;

    /** \brief  The same policy as check() but also hands back the parsed robots.txt file.
     *  \param  robots_dot_txt  Left untouched unless the file could be downloaded.
     */
    bool check(const Url &url, std::vector<std::string> * const warnings, RobotsDotTxt * const robots_dot_txt) const;
};
