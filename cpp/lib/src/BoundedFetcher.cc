/** \file   BoundedFetcher.cc
 *  \brief  Implementation of class BoundedFetcher.
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
#include "BoundedFetcher.h"
#include "ScrapeError.h"
#include "TextUtil.h"
#include "util.h"


const std::vector<std::string> BoundedFetcher::HTML_MEDIA_TYPES{ "text/html", "application/xhtml+xml" };


FetchResult BoundedFetcher::fetch(const Url &url, std::vector<std::string> * const warnings) const {
    Downloader::Params downloader_params(params_.user_agent_, params_.connect_timeout_, params_.max_redirect_count_,
                                         params_.max_body_size_, /* fail_on_http_error = */ true, HTML_MEDIA_TYPES,
                                         /* additional_headers = */ {}, params_.resolve_overrides_,
                                         [this](const Url &redirect_url, std::string * const reason) {
                                             return host_guard_.isAllowedUrl(redirect_url, reason);
                                         });
    Downloader downloader(downloader_params);
    if (not downloader.newUrl(url, params_.time_limit_)) {
        const std::string &error_message(downloader.getLastErrorMessage());
        LOG_DEBUG("fetching \"" + url.toString() + "\" failed (" + Downloader::ErrorTypeToString(downloader.getErrorType()) + "): "
                  + error_message);
        switch (downloader.getErrorType()) {
        case Downloader::TIMEOUT:
            throw ScrapeError(ScrapeError::UPSTREAM_TIMEOUT, "Request failed: " + error_message);
        case Downloader::HTTP_ERROR:
            throw ScrapeError(ScrapeError::UPSTREAM_HTTP_ERROR, "Request failed: " + error_message, downloader.getResponseCode());
        case Downloader::UNSUPPORTED_MEDIA_TYPE:
            throw ScrapeError(ScrapeError::UNSUPPORTED_MEDIA_TYPE, "Unsupported content type.");
        case Downloader::BODY_TOO_LARGE:
            throw ScrapeError(ScrapeError::PAYLOAD_TOO_LARGE, "Page is too large to fetch safely.");
        case Downloader::REDIRECT_BLOCKED:
            throw ScrapeError(ScrapeError::HOST_NOT_ALLOWED, error_message);
        case Downloader::CONNECTION_ERROR:
        case Downloader::TOO_MANY_REDIRECTS:
        case Downloader::NO_ERROR:
            break;
        }
        throw ScrapeError(ScrapeError::UPSTREAM_CONNECTION_ERROR, "Request failed: " + error_message);
    }

    FetchResult fetch_result;
    fetch_result.bytes_read_ = downloader.getMessageBody().size();
    fetch_result.html_ = TextUtil::SanitizeUTF8(downloader.getMessageBody());
    fetch_result.content_type_ = downloader.getContentType();
    LOG_DEBUG("fetched " + std::to_string(fetch_result.bytes_read_) + " bytes from \"" + downloader.getEffectiveUrl().toString() + "\" after "
              + std::to_string(downloader.getRedirectUrls().size() - 1) + " redirect(s)");

    warnings->emplace_back("Content-Type: " + fetch_result.content_type_);
    return fetch_result;
}
