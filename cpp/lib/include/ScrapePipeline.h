/** \file   ScrapePipeline.h
 *  \brief  Runs a single scrape request from URL validation to the assembled result.
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


#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "BoundedFetcher.h"
#include "EnrichmentClient.h"
#include "HostGuard.h"
#include "HtmlExtractor.h"
#include "IniFile.h"
#include "RobotsGate.h"


struct ScrapeResult {
    std::string fetched_url_;
    HtmlExtractor::ExtractionRecord record_;
    std::optional<EnrichmentResult> enrichment_;
    std::vector<std::string> warnings_; // Robots warnings first, then fetch warnings.
};


class ScrapePipeline {
public:
    static const std::string ROBOTS_FORBIDS_MESSAGE;

    struct Params {
        RobotsGate::Params robots_params_;
        BoundedFetcher::Params fetcher_params_;
        EnrichmentClient::Params enrichment_params_;
    public:
        Params() = default;

        /** \brief  Reads the "Fetcher", "Robots" and "Enrichment" sections.
         *  \note   The API key is taken from the environment variable named by "api_key_env" in the "Enrichment" section.
         */
        explicit Params(const IniFile &ini_file);
    };
private:
    const HostGuard &host_guard_;
    RobotsGate robots_gate_;
    BoundedFetcher fetcher_;
    const EnrichmentClient * const enrichment_client_;
public:
    /** \param  enrichment_client  May be NULL to disable enrichment.  If not NULL it must outlive the pipeline, as must
     *                             "host_guard".
     */
    ScrapePipeline(const HostGuard &host_guard, const RobotsGate::Params &robots_params, const BoundedFetcher::Params &fetcher_params,
                   const EnrichmentClient * const enrichment_client);

    /** \brief  Validates "url", consults robots.txt, downloads the page, extracts it and optionally enriches it.
     *  \throws ScrapeError for all terminal failures.  Enrichment problems never cause a failure.
     */
    ScrapeResult scrape(const std::string &url) const;
};


/** \brief  Reads the configuration file "config_filename".
 *  \return An empty configuration if the file does not exist.
 */
std::unique_ptr<IniFile> LoadScrapeConfig(const std::string &config_filename);
