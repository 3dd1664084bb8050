/** \file   ScrapePipeline.cc
 *  \brief  Implementation of class ScrapePipeline.
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
#include "ScrapePipeline.h"
#include <fstream>
#include <cstdlib>
#include "ScrapeError.h"
#include "ScrapeTools.h"
#include "util.h"


const std::string ScrapePipeline::ROBOTS_FORBIDS_MESSAGE("robots.txt forbids scraping.");


ScrapePipeline::Params::Params(const IniFile &ini_file) {
    const std::string user_agent(ini_file.getString("Fetcher", "user_agent", ScrapeTools::DEFAULT_USER_AGENT));
    const unsigned connect_timeout(ini_file.getUnsigned("Fetcher", "connect_timeout", Downloader::DEFAULT_CONNECT_TIMEOUT));
    const unsigned max_redirect_count(ini_file.getUnsigned("Fetcher", "max_redirects", Downloader::DEFAULT_MAX_REDIRECTS));
    if (max_redirect_count > Downloader::MAX_MAX_REDIRECT_COUNT)
        LOG_ERROR("\"max_redirects\" in section \"Fetcher\" must not exceed " + std::to_string(Downloader::MAX_MAX_REDIRECT_COUNT) + "!");

    fetcher_params_ = BoundedFetcher::Params(user_agent, connect_timeout, ini_file.getUnsigned("Fetcher", "time_limit", 15000),
                                             ini_file.getUnsigned("Fetcher", "max_body_size", BoundedFetcher::DEFAULT_MAX_BODY_SIZE),
                                             max_redirect_count);
    robots_params_ = RobotsGate::Params(user_agent, connect_timeout, ini_file.getUnsigned("Robots", "time_limit", 15000),
                                        ini_file.getUnsigned("Robots", "max_body_size", 500000), max_redirect_count);

    const std::string api_key_env(ini_file.getString("Enrichment", "api_key_env", "OPENAI_API_KEY"));
    const char * const api_key(std::getenv(api_key_env.c_str()));
    const double temperature(ini_file.getDouble("Enrichment", "temperature", 0.7));
    if (temperature < 0.0 or temperature > 2.0)
        LOG_ERROR("\"temperature\" in section \"Enrichment\" must be between 0 and 2!");
    enrichment_params_ = EnrichmentClient::Params(api_key == nullptr ? "" : api_key,
                                                  ini_file.getString("Enrichment", "endpoint", EnrichmentClient::DEFAULT_ENDPOINT),
                                                  ini_file.getString("Enrichment", "model", EnrichmentClient::DEFAULT_MODEL),
                                                  ini_file.getUnsigned("Enrichment", "time_limit", 30000),
                                                  ini_file.getUnsigned("Enrichment", "max_text_length", 8000),
                                                  ini_file.getUnsigned("Enrichment", "max_tokens", 1200), temperature);
}


ScrapePipeline::ScrapePipeline(const HostGuard &host_guard, const RobotsGate::Params &robots_params,
                               const BoundedFetcher::Params &fetcher_params, const EnrichmentClient * const enrichment_client)
    : host_guard_(host_guard), robots_gate_(robots_params, host_guard), fetcher_(fetcher_params, host_guard),
      enrichment_client_(enrichment_client)
{
}


ScrapeResult ScrapePipeline::scrape(const std::string &url_string) const {
    Url url(url_string);
    if (not url.isValid() or not url.isAbsolute())
        throw ScrapeError(ScrapeError::INVALID_REQUEST, "Invalid URL: \"" + url_string + "\".");
    url.normalise();

    host_guard_.validate(url);

    ScrapeResult result;
    result.fetched_url_ = url.toString();

    if (not robots_gate_.check(url, &result.warnings_))
        throw ScrapeError(ScrapeError::FORBIDDEN_BY_ROBOTS, ROBOTS_FORBIDS_MESSAGE);

    const FetchResult fetch_result(fetcher_.fetch(url, &result.warnings_));
    LOG_DEBUG("fetched " + std::to_string(fetch_result.bytes_read_) + " bytes from " + result.fetched_url_);

    result.record_ = HtmlExtractor::Extract(fetch_result.html_, url);

    if (enrichment_client_ != nullptr and enrichment_client_->isConfigured())
        result.enrichment_ = enrichment_client_->enrich(result.record_);

    return result;
}


std::unique_ptr<IniFile> LoadScrapeConfig(const std::string &config_filename) {
    std::ifstream config_stream(config_filename);
    if (config_stream.fail()) {
        LOG_INFO("no configuration file \"" + config_filename + "\", using built-in defaults");
        return std::unique_ptr<IniFile>(new IniFile());
    }

    return std::unique_ptr<IniFile>(new IniFile(config_stream, config_filename));
}
