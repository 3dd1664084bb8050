/** \file   EnrichmentClient.h
 *  \brief  Asks a chat completion service for a summary and other insights about an extracted page.
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


#include <optional>
#include <string>
#include <vector>
#include "EnrichmentResponseParser.h"
#include "HtmlExtractor.h"


class EnrichmentClient {
public:
    static const std::string DEFAULT_ENDPOINT;
    static const std::string DEFAULT_MODEL;

    struct Params {
        std::string endpoint_;
        std::string model_;
        std::string api_key_;         // Empty means that enrichment is disabled.
        unsigned time_limit_;         // In ms.
        size_t max_text_length_;      // In characters.
        unsigned max_tokens_;
        double temperature_;
        std::vector<std::string> resolve_overrides_;
    public:
        explicit Params(const std::string &api_key = "", const std::string &endpoint = DEFAULT_ENDPOINT,
                        const std::string &model = DEFAULT_MODEL, const unsigned time_limit = 30000, const size_t max_text_length = 8000,
                        const unsigned max_tokens = 1200, const double temperature = 0.7,
                        const std::vector<std::string> &resolve_overrides = {})
            : endpoint_(endpoint), model_(model), api_key_(api_key), time_limit_(time_limit), max_text_length_(max_text_length),
              max_tokens_(max_tokens), temperature_(temperature), resolve_overrides_(resolve_overrides) { }
    };
protected:
    Params params_;
public:
    explicit EnrichmentClient(const Params &params): params_(params) { }
    virtual ~EnrichmentClient() = default;

    inline bool isConfigured() const { return not params_.api_key_.empty(); }
    inline const Params &getParams() const { return params_; }

    /** \return The parsed model answer or std::nullopt if we're not configured, the service could not be reached or the
     *          answer contained none of the expected sections.
     *  \note   Never throws.  Failures are logged as warnings.
     */
    std::optional<EnrichmentResult> enrich(const HtmlExtractor::ExtractionRecord &record) const;

    /** \return The instructions for the model, including the title, the possibly truncated text and a few counts. */
    std::string buildPrompt(const HtmlExtractor::ExtractionRecord &record) const;

    /** \return The JSON body of a chat completion request for "prompt". */
    std::string buildRequestBody(const std::string &prompt) const;

    /** \brief  Extracts the text of the first choice from a chat completion response.
     *  \return False and sets "error_message" if "response_body" is not a chat completion response.
     */
    static bool ExtractAnswer(const std::string &response_body, std::string * const answer, std::string * const error_message);
protected:
    /** \brief  POSTs "request_body" to the configured endpoint.
     *  \return True if the service answered with a 2xx status, else false in which case "error_message" will be set.
     */
    virtual bool sendCompletionRequest(const std::string &request_body, std::string * const response_body,
                                       std::string * const error_message) const;
};
