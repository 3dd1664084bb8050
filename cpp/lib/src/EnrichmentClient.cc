/** \file   EnrichmentClient.cc
 *  \brief  Implementation of class EnrichmentClient.
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
#include "EnrichmentClient.h"
#include <nlohmann/json.hpp>
#include "Downloader.h"
#include "ScrapeTools.h"
#include "StringUtil.h"
#include "TextUtil.h"
#include "util.h"


const std::string EnrichmentClient::DEFAULT_ENDPOINT("https://api.openai.com/v1/chat/completions");
const std::string EnrichmentClient::DEFAULT_MODEL("gpt-3.5-turbo");


namespace {


const size_t MAX_RESPONSE_SIZE(1000000);
const std::string SYSTEM_MESSAGE("You are a helpful assistant that analyzes web content and extracts structured insights. "
                                 "Always answer in exactly the requested format.");


} // unnamed namespace


std::optional<EnrichmentResult> EnrichmentClient::enrich(const HtmlExtractor::ExtractionRecord &record) const {
    if (not isConfigured())
        return std::nullopt;

    try {
        std::string response_body, error_message;
        if (not sendCompletionRequest(buildRequestBody(buildPrompt(record)), &response_body, &error_message)) {
            LOG_WARNING("enrichment request failed: " + error_message);
            return std::nullopt;
        }

        std::string answer;
        if (not ExtractAnswer(response_body, &answer, &error_message)) {
            LOG_WARNING("bad enrichment response: " + error_message);
            return std::nullopt;
        }

        EnrichmentResult result;
        if (not EnrichmentResponseParser::Parse(answer, &result)) {
            LOG_WARNING("enrichment answer contained none of the expected sections");
            return std::nullopt;
        }

        return result;
    } catch (const std::exception &x) {
        LOG_WARNING("enrichment failed: " + std::string(x.what()));
        return std::nullopt;
    }
}


std::string EnrichmentClient::buildPrompt(const HtmlExtractor::ExtractionRecord &record) const {
    const std::string text(TextUtil::UTF8Truncate(record.full_text_, params_.max_text_length_));

    std::string prompt;
    prompt += "Analyze the following webpage content and provide:\n";
    prompt += "1. A concise summary (2-3 sentences)\n";
    prompt += "2. 3-5 key points or main topics\n";
    prompt += "3. The primary category/type of content (e.g., \"News Article\", \"Product Page\", \"Blog Post\", \"Documentation\", "
              "\"E-commerce\")\n";
    prompt += "4. The overall sentiment (Positive, Negative, Neutral or Mixed)\n";
    prompt += "5. Named entities as a JSON array of objects with \"name\" and \"type\" where type is one of PERSON, ORG, LOCATION "
              "or PRODUCT\n";
    prompt += "6. The main topics\n";
    prompt += "7. 5-10 keywords\n";
    prompt += "8. Notable structured data (prices, dates, contact details, specifications) as a JSON object\n";
    prompt += "9. Further insights about purpose, audience or quality of the page\n\n";

    prompt += "Title: " + (record.title_ ? *record.title_ : std::string("Not provided")) + "\n";
    prompt += "Tables: " + std::to_string(record.tables_.size()) + "\n";
    prompt += "Forms: " + std::to_string(record.forms_.size()) + "\n";
    prompt += "Links: " + std::to_string(record.links_.size()) + "\n";
    prompt += "Content: " + text + "\n\n";

    prompt += "Format your response as:\n"
              "SUMMARY: [your summary here]\n"
              "KEY_POINTS:\n"
              "- [point 1]\n"
              "- [point 2]\n"
              "- [point 3]\n"
              "CATEGORY: [category name]\n"
              "SENTIMENT: [sentiment]\n"
              "ENTITIES: [JSON array]\n"
              "TOPICS:\n"
              "- [topic 1]\n"
              "- [topic 2]\n"
              "KEYWORDS: [comma-separated keywords]\n"
              "STRUCTURED_DATA: [JSON object]\n"
              "INSIGHTS: [your insights here]";

    return prompt;
}


std::string EnrichmentClient::buildRequestBody(const std::string &prompt) const {
    nlohmann::json request_body;
    request_body["model"] = params_.model_;
    request_body["messages"] = nlohmann::json::array({ { { "role", "system" }, { "content", SYSTEM_MESSAGE } },
                                                       { { "role", "user" }, { "content", prompt } } });
    request_body["max_tokens"] = params_.max_tokens_;
    request_body["temperature"] = params_.temperature_;

    return request_body.dump();
}


bool EnrichmentClient::ExtractAnswer(const std::string &response_body, std::string * const answer, std::string * const error_message) {
    const nlohmann::json response(nlohmann::json::parse(response_body, /* cb = */ nullptr, /* allow_exceptions = */ false));
    if (response.is_discarded() or not response.is_object()) {
        *error_message = "response is not a JSON object";
        return false;
    }

    const auto choices(response.find("choices"));
    if (choices == response.end() or not choices->is_array() or choices->empty()) {
        *error_message = "response has no choices";
        return false;
    }

    const auto &first_choice((*choices)[0]);
    if (not first_choice.is_object() or not first_choice.contains("message") or not first_choice["message"].is_object()) {
        *error_message = "first choice has no message";
        return false;
    }

    const auto &message(first_choice["message"]);
    const auto content(message.find("content"));
    if (content == message.end() or not content->is_string()) {
        *error_message = "message has no textual content";
        return false;
    }

    *answer = content->get<std::string>();
    return true;
}


bool EnrichmentClient::sendCompletionRequest(const std::string &request_body, std::string * const response_body,
                                             std::string * const error_message) const
{
    Downloader::Params downloader_params(ScrapeTools::DEFAULT_USER_AGENT, Downloader::DEFAULT_CONNECT_TIMEOUT,
                                         /* max_redirect_count = */ 0, MAX_RESPONSE_SIZE, /* fail_on_http_error = */ true,
                                         /* acceptable_media_types = */ {},
                                         { "Authorization: Bearer " + params_.api_key_, "Content-Type: application/json", "Expect:" },
                                         params_.resolve_overrides_);
    Downloader downloader(downloader_params);
    if (not downloader.postData(Url(params_.endpoint_), request_body, params_.time_limit_)) {
        *error_message = Downloader::ErrorTypeToString(downloader.getErrorType()) + " (" + downloader.getLastErrorMessage() + ")";
        if (downloader.getResponseCode() != 0)
            *error_message += ", HTTP status " + std::to_string(downloader.getResponseCode());
        return false;
    }

    *response_body = downloader.getMessageBody();
    return true;
}
