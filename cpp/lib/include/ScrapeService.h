/** \file   ScrapeService.h
 *  \brief  Maps inbound scrape requests onto the pipeline and pipeline outcomes onto HTTP statuses and JSON bodies.
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
#include <nlohmann/json.hpp>
#include "ScrapeError.h"
#include "ScrapePipeline.h"


struct ServiceResponse {
    unsigned status_;
    nlohmann::json body_;
public:
    ServiceResponse(const unsigned status, const nlohmann::json &body): status_(status), body_(body) { }
};


class ScrapeService {
    const ScrapePipeline &pipeline_;
public:
    explicit ScrapeService(const ScrapePipeline &pipeline): pipeline_(pipeline) { }

    /** \param  request_body  Expected to be a JSON object with a string member "url".
     *  \return 200 and the scrape report or an error status with a body as generated by ErrorToResponse().
     *  \note   Never throws.
     */
    ServiceResponse handleScrapeRequest(const std::string &request_body) const;

    /** \return {"status": "ok", "name": ..., "version": ...} */
    static nlohmann::json GetHealthStatus();

    /** \return {"detail": <message>, "error": <kind>} with an additional "upstream_status" member for upstream HTTP
     *          errors, and the status that goes with the kind of error.
     */
    static ServiceResponse ErrorToResponse(const ScrapeError &scrape_error);
};
