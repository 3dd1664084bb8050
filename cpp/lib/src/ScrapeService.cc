/** \file   ScrapeService.cc
 *  \brief  Implementation of class ScrapeService.
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
#include "ScrapeService.h"
#include <chrono>
#include "ScrapeReport.h"
#include "ScrapeTools.h"
#include "util.h"


namespace {


std::string ExtractUrl(const std::string &request_body) {
    const nlohmann::json request(nlohmann::json::parse(request_body, /* cb = */ nullptr, /* allow_exceptions = */ false));
    if (not request.is_object())
        throw ScrapeError(ScrapeError::INVALID_REQUEST, "Request body must be a JSON object.");

    const auto url(request.find("url"));
    if (url == request.end() or not url->is_string() or url->get<std::string>().empty())
        throw ScrapeError(ScrapeError::INVALID_REQUEST, "Request body must contain a \"url\" string.");

    return url->get<std::string>();
}


} // unnamed namespace


ServiceResponse ScrapeService::handleScrapeRequest(const std::string &request_body) const {
    const auto start_time(std::chrono::steady_clock::now());
    std::string url;
    try {
        url = ExtractUrl(request_body);
        LOG_INFO("scraping " + url);

        const ScrapeResult result(pipeline_.scrape(url));
        const auto elapsed_time(
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time).count());
        LOG_INFO("scraped " + url + ": 200 after " + std::to_string(elapsed_time) + " ms");

        return ServiceResponse(200, ScrapeReport::ToJSON(result));
    } catch (const ScrapeError &scrape_error) {
        LOG_WARNING("scrape of \"" + url + "\" failed with " + ScrapeError::KindToString(scrape_error.getKind()) + ": "
                    + scrape_error.what());
        return ErrorToResponse(scrape_error);
    } catch (const std::exception &x) {
        LOG_WARNING("unexpected failure while scraping \"" + url + "\": " + std::string(x.what()));
        return ErrorToResponse(ScrapeError(ScrapeError::INTERNAL_ERROR, "Internal server error."));
    }
}


nlohmann::json ScrapeService::GetHealthStatus() {
    return { { "status", "ok" }, { "name", ScrapeTools::APP_NAME }, { "version", ScrapeTools::VERSION } };
}


ServiceResponse ScrapeService::ErrorToResponse(const ScrapeError &scrape_error) {
    nlohmann::json body{ { "detail", scrape_error.what() }, { "error", ScrapeError::KindToString(scrape_error.getKind()) } };
    if (scrape_error.hasUpstreamStatus())
        body["upstream_status"] = scrape_error.getUpstreamStatus();

    return ServiceResponse(ScrapeError::GetHttpStatus(scrape_error.getKind()), body);
}
