/** \file   RobotsGate.cc
 *  \brief  Implementation of class RobotsGate.
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
#include "RobotsGate.h"
#include "util.h"


const std::string RobotsGate::DOWNLOAD_FAILED_WARNING("robots.txt could not be downloaded; assuming allow.");


bool RobotsGate::check(const Url &url, std::vector<std::string> * const warnings) const {
    RobotsDotTxt robots_dot_txt;
    return check(url, warnings, &robots_dot_txt);
}


bool RobotsGate::check(const Url &url, std::vector<std::string> * const warnings, RobotsDotTxt * const robots_dot_txt) const {
    const Url robots_dot_txt_url(url.getRobotsDotTxtUrl());

    Downloader::Params downloader_params(params_.user_agent_, params_.connect_timeout_, params_.max_redirect_count_,
                                         params_.max_body_size_, /* fail_on_http_error = */ false,
                                         /* acceptable_media_types = */ {}, /* additional_headers = */ {},
                                         params_.resolve_overrides_,
                                         [this](const Url &redirect_url, std::string * const reason) {
                                             return host_guard_.isAllowedUrl(redirect_url, reason);
                                         });
    Downloader downloader(downloader_params);
    if (not downloader.newUrl(robots_dot_txt_url, params_.time_limit_)) {
        LOG_DEBUG("failed to download \"" + robots_dot_txt_url.toString() + "\": " + downloader.getLastErrorMessage());
        warnings->emplace_back(DOWNLOAD_FAILED_WARNING);
        return true;
    }

    const unsigned response_code(downloader.getResponseCode());
    if (response_code == 401 or response_code == 403) {
        LOG_DEBUG("access to \"" + robots_dot_txt_url.toString() + "\" is restricted (" + std::to_string(response_code)
                  + "), assuming the whole site is off limits");
        return false;
    }
    if (response_code >= 400 and response_code < 500) {
        LOG_DEBUG("no robots.txt at \"" + robots_dot_txt_url.toString() + "\" (" + std::to_string(response_code) + ")");
        return true;
    }
    if (response_code < 200 or response_code >= 300) {
        LOG_DEBUG("unexpected status " + std::to_string(response_code) + " for \"" + robots_dot_txt_url.toString() + "\"");
        warnings->emplace_back(DOWNLOAD_FAILED_WARNING);
        return true;
    }

    robots_dot_txt->reinitialize(downloader.getMessageBody());
    const bool access_allowed(robots_dot_txt->accessAllowed(params_.user_agent_, url));
    LOG_DEBUG("robots.txt at \"" + robots_dot_txt_url.toString() + "\" " + (access_allowed ? "allows" : "forbids")
              + " access to \"" + url.toString() + "\"");

    return access_allowed;
}
