/** \brief Test cases for EnrichmentClient
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
#define BOOST_TEST_MODULE EnrichmentClient
#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>
#include <string>
#include <nlohmann/json.hpp>
#include "EnrichmentClient.h"
#include "HtmlExtractor.h"
#include "TestHttpServer.h"
#include "TextUtil.h"


namespace {


// Answers every completion request with a canned response and remembers the request.
class CannedEnrichmentClient : public EnrichmentClient {
    bool succeed_;
    std::string response_body_;
public:
    mutable std::string last_request_body_;
    mutable unsigned request_count_;
public:
    CannedEnrichmentClient(const Params &params, const bool succeed, const std::string &response_body)
        : EnrichmentClient(params), succeed_(succeed), response_body_(response_body), request_count_(0) { }
protected:
    bool sendCompletionRequest(const std::string &request_body, std::string * const response_body,
                               std::string * const error_message) const override
    {
        ++request_count_;
        last_request_body_ = request_body;
        if (not succeed_) {
            *error_message = "HTTP_ERROR (HTTP status 429)";
            return false;
        }

        *response_body = response_body_;
        return true;
    }
};


std::string MakeCompletionResponse(const std::string &content) {
    nlohmann::json response;
    response["id"] = "chatcmpl-123";
    response["choices"] = nlohmann::json::array({ { { "index", 0 }, { "message", { { "role", "assistant" }, { "content", content } } } } });
    return response.dump();
}


HtmlExtractor::ExtractionRecord MakeRecord() {
    HtmlExtractor::ExtractionRecord record;
    record.title_ = "Coffee Shop";
    record.full_text_ = "Fresh beans every day.";
    record.links_ = { "https://example.com/a", "https://example.com/b" };
    record.forms_.resize(1);
    return record;
}


const std::string ANSWER("SUMMARY: A coffee shop.\nCATEGORY: E-commerce\nKEYWORDS: coffee, beans");


} // unnamed namespace


BOOST_AUTO_TEST_CASE(Configuration) {
    const EnrichmentClient unconfigured_client((EnrichmentClient::Params()));
    BOOST_CHECK(not unconfigured_client.isConfigured());
    BOOST_CHECK_EQUAL(unconfigured_client.getParams().endpoint_, EnrichmentClient::DEFAULT_ENDPOINT);
    BOOST_CHECK_EQUAL(unconfigured_client.getParams().model_, EnrichmentClient::DEFAULT_MODEL);
    BOOST_CHECK(not unconfigured_client.enrich(MakeRecord()));

    BOOST_CHECK(EnrichmentClient(EnrichmentClient::Params("sk-test")).isConfigured());
}


BOOST_AUTO_TEST_CASE(UnconfiguredClientsSendNothing) {
    const CannedEnrichmentClient client(EnrichmentClient::Params(), /* succeed = */ true, MakeCompletionResponse(ANSWER));
    BOOST_CHECK(not client.enrich(MakeRecord()));
    BOOST_CHECK_EQUAL(client.request_count_, 0u);
}


BOOST_AUTO_TEST_CASE(Prompt) {
    const EnrichmentClient client(EnrichmentClient::Params("sk-test"));
    const std::string prompt(client.buildPrompt(MakeRecord()));
    BOOST_CHECK(prompt.find("Title: Coffee Shop\n") != std::string::npos);
    BOOST_CHECK(prompt.find("Tables: 0\n") != std::string::npos);
    BOOST_CHECK(prompt.find("Forms: 1\n") != std::string::npos);
    BOOST_CHECK(prompt.find("Links: 2\n") != std::string::npos);
    BOOST_CHECK(prompt.find("Content: Fresh beans every day.\n") != std::string::npos);
    for (const auto &label : EnrichmentResponseParser::GetSectionLabels())
        BOOST_CHECK(prompt.find(label + ":") != std::string::npos);

    HtmlExtractor::ExtractionRecord untitled_record(MakeRecord());
    untitled_record.title_.reset();
    BOOST_CHECK(client.buildPrompt(untitled_record).find("Title: Not provided\n") != std::string::npos);
}


BOOST_AUTO_TEST_CASE(PromptTruncatesText) {
    const EnrichmentClient client(EnrichmentClient::Params("sk-test", EnrichmentClient::DEFAULT_ENDPOINT, EnrichmentClient::DEFAULT_MODEL,
                                                           30000, /* max_text_length = */ 10));
    HtmlExtractor::ExtractionRecord record(MakeRecord());
    record.full_text_ = "äöüäöüäöüäöüäöü";
    const std::string prompt(client.buildPrompt(record));
    BOOST_CHECK(prompt.find("Content: äöüäöüäöüä\n") != std::string::npos);
}


BOOST_AUTO_TEST_CASE(RequestBody) {
    const EnrichmentClient client(EnrichmentClient::Params("sk-test", EnrichmentClient::DEFAULT_ENDPOINT, "test-model", 30000, 8000,
                                                           /* max_tokens = */ 500, /* temperature = */ 0.25));
    const nlohmann::json request_body(nlohmann::json::parse(client.buildRequestBody("the prompt")));
    BOOST_CHECK_EQUAL(request_body["model"].get<std::string>(), "test-model");
    BOOST_CHECK_EQUAL(request_body["max_tokens"].get<unsigned>(), 500u);
    BOOST_CHECK_CLOSE(request_body["temperature"].get<double>(), 0.25, 1e-9);
    BOOST_REQUIRE_EQUAL(request_body["messages"].size(), 2u);
    BOOST_CHECK_EQUAL(request_body["messages"][0]["role"].get<std::string>(), "system");
    BOOST_CHECK_EQUAL(request_body["messages"][1]["role"].get<std::string>(), "user");
    BOOST_CHECK_EQUAL(request_body["messages"][1]["content"].get<std::string>(), "the prompt");
}


BOOST_AUTO_TEST_CASE(ExtractAnswer) {
    std::string answer, error_message;
    BOOST_CHECK(EnrichmentClient::ExtractAnswer(MakeCompletionResponse("hello"), &answer, &error_message));
    BOOST_CHECK_EQUAL(answer, "hello");

    BOOST_CHECK(not EnrichmentClient::ExtractAnswer("<html>Bad Gateway</html>", &answer, &error_message));
    BOOST_CHECK_EQUAL(error_message, "response is not a JSON object");
    BOOST_CHECK(not EnrichmentClient::ExtractAnswer("{\"choices\": []}", &answer, &error_message));
    BOOST_CHECK_EQUAL(error_message, "response has no choices");
    BOOST_CHECK(not EnrichmentClient::ExtractAnswer("{\"choices\": [{\"text\": \"legacy\"}]}", &answer, &error_message));
    BOOST_CHECK_EQUAL(error_message, "first choice has no message");
    BOOST_CHECK(not EnrichmentClient::ExtractAnswer("{\"choices\": [{\"message\": {\"content\": null}}]}", &answer, &error_message));
    BOOST_CHECK_EQUAL(error_message, "message has no textual content");
}


BOOST_AUTO_TEST_CASE(Enrich) {
    const CannedEnrichmentClient client(EnrichmentClient::Params("sk-test"), /* succeed = */ true, MakeCompletionResponse(ANSWER));
    const auto result(client.enrich(MakeRecord()));
    BOOST_REQUIRE(result);
    BOOST_CHECK_EQUAL(result->summary_.value_or(""), "A coffee shop.");
    BOOST_CHECK_EQUAL(result->category_.value_or(""), "E-commerce");
    BOOST_REQUIRE_EQUAL(result->keywords_.size(), 2u);
    BOOST_CHECK_EQUAL(client.request_count_, 1u);
    BOOST_CHECK(client.last_request_body_.find("Coffee Shop") != std::string::npos);
}


BOOST_AUTO_TEST_CASE(EnrichFailures) {
    const CannedEnrichmentClient failing_client(EnrichmentClient::Params("sk-test"), /* succeed = */ false, "");
    BOOST_CHECK(not failing_client.enrich(MakeRecord()));

    const CannedEnrichmentClient garbage_client(EnrichmentClient::Params("sk-test"), /* succeed = */ true, "not json");
    BOOST_CHECK(not garbage_client.enrich(MakeRecord()));

    const CannedEnrichmentClient unstructured_client(EnrichmentClient::Params("sk-test"), /* succeed = */ true,
                                                     MakeCompletionResponse("I cannot analyse this page."));
    BOOST_CHECK(not unstructured_client.enrich(MakeRecord()));
}


BOOST_AUTO_TEST_CASE(CompletionRequestOverHttp) {
    TestHttpServer server;
    server.setResponse("/v1/chat/completions", 200, "application/json", MakeCompletionResponse(ANSWER));
    const EnrichmentClient client(EnrichmentClient::Params("sk-secret", server.getUrl("/v1/chat/completions"), "test-model", 5000,
                                                           8000, 1200, 0.7, { server.getResolveOverride() }));

    const auto result(client.enrich(MakeRecord()));
    BOOST_REQUIRE(result);
    BOOST_CHECK_EQUAL(result->category_.value_or(""), "E-commerce");

    const auto requests(server.getRequests());
    BOOST_REQUIRE_EQUAL(requests.size(), 1u);
    BOOST_CHECK_EQUAL(requests[0].method_, "POST");
    BOOST_CHECK(requests[0].headers_.find("Authorization: Bearer sk-secret\r\n") != std::string::npos);
    BOOST_CHECK(requests[0].headers_.find("Content-Type: application/json\r\n") != std::string::npos);
    const nlohmann::json request_body(nlohmann::json::parse(requests[0].body_));
    BOOST_CHECK_EQUAL(request_body["model"].get<std::string>(), "test-model");
}


BOOST_AUTO_TEST_CASE(CompletionRequestRejected) {
    TestHttpServer server;
    server.setResponse("/v1/chat/completions", 401, "application/json", "{\"error\": {\"message\": \"Incorrect API key\"}}");
    const EnrichmentClient client(EnrichmentClient::Params("sk-wrong", server.getUrl("/v1/chat/completions"), "test-model", 5000,
                                                           8000, 1200, 0.7, { server.getResolveOverride() }));
    BOOST_CHECK(not client.enrich(MakeRecord()));
    BOOST_CHECK_EQUAL(server.getRequestCount("/v1/chat/completions"), 1u);
}
