/** \file   ScrapeError.cc
 *  \brief  Implementation of the ScrapeError helpers.
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
#include "ScrapeError.h"
#include "util.h"


unsigned ScrapeError::GetHttpStatus(const Kind kind) {
    switch (kind) {
    case INVALID_SCHEME:
    case HOST_NOT_ALLOWED:
    case LOGIN_WALL_DETECTED:
        return 400;
    case FORBIDDEN_BY_ROBOTS:
        return 403;
    case PAYLOAD_TOO_LARGE:
        return 413;
    case UNSUPPORTED_MEDIA_TYPE:
        return 415;
    case INVALID_REQUEST:
        return 422;
    case UPSTREAM_CONNECTION_ERROR:
    case UPSTREAM_HTTP_ERROR:
        return 502;
    case UPSTREAM_TIMEOUT:
        return 504;
    case INTERNAL_ERROR:
        return 500;
    }

    LOG_ERROR("unknown kind " + std::to_string(static_cast<int>(kind)) + "!");
}


std::string ScrapeError::KindToString(const Kind kind) {
    switch (kind) {
    case INVALID_REQUEST:
        return "INVALID_REQUEST";
    case INVALID_SCHEME:
        return "INVALID_SCHEME";
    case HOST_NOT_ALLOWED:
        return "HOST_NOT_ALLOWED";
    case FORBIDDEN_BY_ROBOTS:
        return "FORBIDDEN_BY_ROBOTS";
    case UPSTREAM_TIMEOUT:
        return "UPSTREAM_TIMEOUT";
    case UPSTREAM_CONNECTION_ERROR:
        return "UPSTREAM_CONNECTION_ERROR";
    case UPSTREAM_HTTP_ERROR:
        return "UPSTREAM_HTTP_ERROR";
    case UNSUPPORTED_MEDIA_TYPE:
        return "UNSUPPORTED_MEDIA_TYPE";
    case PAYLOAD_TOO_LARGE:
        return "PAYLOAD_TOO_LARGE";
    case LOGIN_WALL_DETECTED:
        return "LOGIN_WALL_DETECTED";
    case INTERNAL_ERROR:
        return "INTERNAL_ERROR";
    }

    LOG_ERROR("unknown kind " + std::to_string(static_cast<int>(kind)) + "!");
}
