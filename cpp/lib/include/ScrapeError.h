/** \file   ScrapeError.h
 *  \brief  The exception type for terminal failures of a scrape request.
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


#include <stdexcept>
#include <string>


class ScrapeError : public std::runtime_error {
public:
    enum Kind {
        INVALID_REQUEST,
        INVALID_SCHEME,
        HOST_NOT_ALLOWED,
        FORBIDDEN_BY_ROBOTS,
        UPSTREAM_TIMEOUT,
        UPSTREAM_CONNECTION_ERROR,
        UPSTREAM_HTTP_ERROR,
        UNSUPPORTED_MEDIA_TYPE,
        PAYLOAD_TOO_LARGE,
        LOGIN_WALL_DETECTED,
        INTERNAL_ERROR
    };
private:
    Kind kind_;
    unsigned upstream_status_; // Only set for UPSTREAM_HTTP_ERROR.
public:
    ScrapeError(const Kind kind, const std::string &message, const unsigned upstream_status = 0)
        : std::runtime_error(message), kind_(kind), upstream_status_(upstream_status) { }

    inline Kind getKind() const { return kind_; }
    inline unsigned getUpstreamStatus() const { return upstream_status_; }
    inline bool hasUpstreamStatus() const { return upstream_status_ != 0; }

    /** \return The HTTP status code an inbound request that failed with "kind" should be answered with. */
    static unsigned GetHttpStatus(const Kind kind);

    /** \return A stable, upper-case name for "kind", e.g. "HOST_NOT_ALLOWED". */
    static std::string KindToString(const Kind kind);
};
