/** \brief Test cases for ScrapePipeline
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
#define BOOST_TEST_MODULE ScrapePipeline
#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>
#include <sstream>
#include <string>
#include <vector>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include "EnrichmentClient.h"
#include "HostGuard.h"
#include "HtmlExtractor.h"
#include "IniFile.h"
#include "RobotsGate.h"
#include "ScrapeError.h"
#include "ScrapePipeline.h"
#include "ScrapeTools.h"
#include "TestHttpServer.h"


namespace {


HostGuard MakeTestHostGuard() {
    return HostGuard([](const std::string &, std::vector<std::string> * const ip_addresses) {
        ip_addresses->emplace_back(TestHttpServer::PUBLIC_ADDRESS);
        return true;
    });
}


class CannedEnrichmentClient : public EnrichmentClient {
public:
    explicit CannedEnrichmentClient(const std::string &api_key): EnrichmentClient(Params(api_key)) { }
protected:
    bool sendCompletionRequest(const std::string &/*request_body*/, std::string * const response_body,
                               std::string * const /*error_message*/) const override
    {
        nlohmann::json response;
        response["choices"] = nlohmann::json::array(
            { { { "message", { { "content", "SUMMARY: A test page.\nCATEGORY: Documentation\nTOPICS: testing, scraping" } } } } });
        *response_body = response.dump();
        return true;
    }
};


// Owns everything a pipeline needs to talk to "server".
class TestPipeline {
    HostGuard host_guard_;
public:
    ScrapePipeline pipeline_;
public:
    TestPipeline(const TestHttpServer &server, const EnrichmentClient * const enrichment_client = nullptr)
        : host_guard_(MakeTestHostGuard()),
          pipeline_(host_guard_,
                    RobotsGate::Params(ScrapeTools::DEFAULT_USER_AGENT, 2000, 5000, 500000, 3, { server.getResolveOverride() }),
                    BoundedFetcher::Params(ScrapeTools::DEFAULT_USER_AGENT, 2000, 5000, BoundedFetcher::DEFAULT_MAX_BODY_SIZE, 3,
                                           { server.getResolveOverride() }),
                    enrichment_client) { }
};


ScrapeError::Kind GetScrapeErrorKind(const ScrapePipeline &pipeline, const std::string &url) {
    try {
        pipeline.scrape(url);
    } catch (const ScrapeError &scrape_error) {
        return scrape_error.getKind();
    }

    BOOST_FAIL("expected scraping " + url + " to fail");
    return ScrapeError::INTERNAL_ERROR;
}


const std::string PAGE(
    "<html lang=\"en\"><head><title>Test Page</title><meta name=\"description\" content=\"A page for tests.\"></head>"
    "<body><h1>Welcome</h1><p>Read the <a href=\"/docs\">documentation</a>.</p><img src=\"logo.png\">"
    "<h2>More</h2><p>See the <a href=\"/faq\">FAQ</a> and the <a href=\"/docs\">docs</a> again.</p></body></html>");


} // unnamed namespace


BOOST_AUTO_TEST_CASE(EndToEnd) {
    TestHttpServer server;
    server.setResponse("/robots.txt", 200, "text/plain", "User-agent: *\nDisallow: /private/\n");
    server.setResponse("/page", 200, "text/html; charset=utf-8", PAGE);
    const TestPipeline test_pipeline(server);

    const ScrapeResult result(test_pipeline.pipeline_.scrape(server.getUrl("/page")));
    BOOST_CHECK_EQUAL(result.fetched_url_, server.getUrl("/page"));
    BOOST_CHECK_EQUAL(result.record_.title_.value_or(""), "Test Page");
    BOOST_CHECK_EQUAL(result.record_.description_.value_or(""), "A page for tests.");
    BOOST_CHECK_EQUAL(result.record_.language_.value_or(""), "en");
    BOOST_REQUIRE_EQUAL(result.record_.links_.size(), 2u);
    BOOST_CHECK_EQUAL(result.record_.links_[0], server.getUrl("/docs"));
    BOOST_CHECK_EQUAL(result.record_.links_[1], server.getUrl("/faq"));
    BOOST_REQUIRE_EQUAL(result.record_.headings_.at("h1").size(), 1u);
    BOOST_CHECK_EQUAL(result.record_.headings_.at("h1")[0], "Welcome");
    BOOST_REQUIRE_EQUAL(result.record_.headings_.at("h2").size(), 1u);
    BOOST_CHECK_EQUAL(result.record_.headings_.at("h2")[0], "More");
    BOOST_CHECK(result.record_.headings_.at("h3").empty());
    BOOST_REQUIRE_EQUAL(result.record_.images_.size(), 1u);
    BOOST_CHECK_EQUAL(result.record_.images_[0], server.getUrl("/logo.png"));
    BOOST_CHECK(not result.enrichment_);

    BOOST_REQUIRE_EQUAL(result.warnings_.size(), 1u);
    BOOST_CHECK_EQUAL(result.warnings_[0], "Content-Type: text/html; charset=utf-8");

    BOOST_CHECK_EQUAL(server.getRequestCount("/robots.txt"), 1u);
    BOOST_CHECK_EQUAL(server.getRequestCount("/page"), 1u);
}


BOOST_AUTO_TEST_CASE(HostNameIsNormalised) {
    TestHttpServer server;
    server.setResponse("/", 200, "text/html", PAGE);
    const TestPipeline test_pipeline(server);

    const ScrapeResult result(test_pipeline.pipeline_.scrape("http://EXAMPLE.test:" + std::to_string(server.getPort())));
    BOOST_CHECK_EQUAL(result.fetched_url_, server.getUrl("/"));
}


BOOST_AUTO_TEST_CASE(Enrichment) {
    TestHttpServer server;
    server.setResponse("/page", 200, "text/html", PAGE);

    const CannedEnrichmentClient enrichment_client("sk-test");
    const TestPipeline test_pipeline(server, &enrichment_client);
    const ScrapeResult result(test_pipeline.pipeline_.scrape(server.getUrl("/page")));
    BOOST_REQUIRE(result.enrichment_);
    BOOST_CHECK_EQUAL(result.enrichment_->summary_.value_or(""), "A test page.");
    BOOST_CHECK_EQUAL(result.enrichment_->category_.value_or(""), "Documentation");
    BOOST_CHECK_EQUAL(result.enrichment_->topics_.size(), 2u);

    const CannedEnrichmentClient unconfigured_client("");
    const TestPipeline unconfigured_pipeline(server, &unconfigured_client);
    BOOST_CHECK(not unconfigured_pipeline.pipeline_.scrape(server.getUrl("/page")).enrichment_);
}


BOOST_AUTO_TEST_CASE(RobotsWarningsComeFirst) {
    TestHttpServer server;
    server.setResponse("/robots.txt", 503, "text/plain", "maintenance");
    server.setResponse("/page", 200, "text/html", PAGE);
    const TestPipeline test_pipeline(server);

    const ScrapeResult result(test_pipeline.pipeline_.scrape(server.getUrl("/page")));
    BOOST_REQUIRE_EQUAL(result.warnings_.size(), 2u);
    BOOST_CHECK_EQUAL(result.warnings_[0], RobotsGate::DOWNLOAD_FAILED_WARNING);
    BOOST_CHECK_EQUAL(result.warnings_[1], "Content-Type: text/html");
}


BOOST_AUTO_TEST_CASE(ForbiddenByRobots) {
    TestHttpServer server;
    server.setResponse("/robots.txt", 200, "text/plain", "User-agent: *\nDisallow: /private/\n");
    server.setResponse("/private/page", 200, "text/html", PAGE);
    const TestPipeline test_pipeline(server);

    try {
        test_pipeline.pipeline_.scrape(server.getUrl("/private/page"));
        BOOST_FAIL("expected robots.txt to forbid access");
    } catch (const ScrapeError &scrape_error) {
        BOOST_CHECK_EQUAL(scrape_error.getKind(), ScrapeError::FORBIDDEN_BY_ROBOTS);
        BOOST_CHECK_EQUAL(ScrapeError::GetHttpStatus(scrape_error.getKind()), 403u);
        BOOST_CHECK_EQUAL(scrape_error.what(), ScrapePipeline::ROBOTS_FORBIDS_MESSAGE);
    }
    BOOST_CHECK_EQUAL(server.getRequestCount("/private/page"), 0u);
}


BOOST_AUTO_TEST_CASE(RejectedUrls) {
    TestHttpServer server;
    const TestPipeline test_pipeline(server);
    const ScrapePipeline &pipeline(test_pipeline.pipeline_);

    BOOST_CHECK_EQUAL(GetScrapeErrorKind(pipeline, "/relative/path"), ScrapeError::INVALID_REQUEST);
    BOOST_CHECK_EQUAL(GetScrapeErrorKind(pipeline, "http://example.test:99999/"), ScrapeError::INVALID_REQUEST);
    BOOST_CHECK_EQUAL(GetScrapeErrorKind(pipeline, "ftp://example.test/file"), ScrapeError::INVALID_SCHEME);
    BOOST_CHECK_EQUAL(GetScrapeErrorKind(pipeline, "http://localhost/"), ScrapeError::HOST_NOT_ALLOWED);
    BOOST_CHECK_EQUAL(GetScrapeErrorKind(pipeline, "http://169.254.169.254/latest/meta-data"), ScrapeError::HOST_NOT_ALLOWED);
    BOOST_CHECK(server.getRequests().empty());
}


BOOST_AUTO_TEST_CASE(FetchFailures) {
    TestHttpServer server;
    server.setResponse("/report.pdf", 200, "application/pdf", "%PDF-1.7");
    server.setResponse("/members", 200, "text/html", "<form id=\"login\"><input name=\"user\"></form>");
    const TestPipeline test_pipeline(server);
    const ScrapePipeline &pipeline(test_pipeline.pipeline_);

    BOOST_CHECK_EQUAL(GetScrapeErrorKind(pipeline, server.getUrl("/report.pdf")), ScrapeError::UNSUPPORTED_MEDIA_TYPE);
    BOOST_CHECK_EQUAL(GetScrapeErrorKind(pipeline, server.getUrl("/missing")), ScrapeError::UPSTREAM_HTTP_ERROR);
    BOOST_CHECK_EQUAL(GetScrapeErrorKind(pipeline, server.getUrl("/members")), ScrapeError::LOGIN_WALL_DETECTED);
}


BOOST_AUTO_TEST_CASE(ParamsFromIniFile) {
    ::setenv("SCRAPE_TEST_API_KEY", "sk-from-env", /* overwrite = */ 1);
    std::istringstream input("[Fetcher]\n"
                             "user_agent = TestBot/2.0\n"
                             "connect_timeout = 1000\n"
                             "time_limit = 2000\n"
                             "max_redirects = 4\n"
                             "max_body_size = 4096\n"
                             "[Robots]\n"
                             "time_limit = 3000\n"
                             "max_body_size = 1024\n"
                             "[Enrichment]\n"
                             "api_key_env = SCRAPE_TEST_API_KEY\n"
                             "endpoint = https://llm.example.com/v1/chat/completions\n"
                             "model = tiny-model\n"
                             "time_limit = 9000\n"
                             "max_text_length = 100\n"
                             "max_tokens = 50\n"
                             "temperature = 0.1\n");
    const ScrapePipeline::Params params(IniFile(input, "test.conf"));

    BOOST_CHECK_EQUAL(params.fetcher_params_.user_agent_, "TestBot/2.0");
    BOOST_CHECK_EQUAL(params.fetcher_params_.connect_timeout_, 1000u);
    BOOST_CHECK_EQUAL(params.fetcher_params_.time_limit_, 2000u);
    BOOST_CHECK_EQUAL(params.fetcher_params_.max_redirect_count_, 4);
    BOOST_CHECK_EQUAL(params.fetcher_params_.max_body_size_, 4096u);

    BOOST_CHECK_EQUAL(params.robots_params_.user_agent_, "TestBot/2.0");
    BOOST_CHECK_EQUAL(params.robots_params_.time_limit_, 3000u);
    BOOST_CHECK_EQUAL(params.robots_params_.max_body_size_, 1024u);

    BOOST_CHECK_EQUAL(params.enrichment_params_.api_key_, "sk-from-env");
    BOOST_CHECK_EQUAL(params.enrichment_params_.endpoint_, "https://llm.example.com/v1/chat/completions");
    BOOST_CHECK_EQUAL(params.enrichment_params_.model_, "tiny-model");
    BOOST_CHECK_EQUAL(params.enrichment_params_.time_limit_, 9000u);
    BOOST_CHECK_EQUAL(params.enrichment_params_.max_text_length_, 100u);
    BOOST_CHECK_EQUAL(params.enrichment_params_.max_tokens_, 50u);
    BOOST_CHECK_CLOSE(params.enrichment_params_.temperature_, 0.1, 1e-9);
    ::unsetenv("SCRAPE_TEST_API_KEY");
}


BOOST_AUTO_TEST_CASE(DefaultParams) {
    ::unsetenv("SCRAPE_TEST_UNSET_KEY");
    std::istringstream input("[Enrichment]\napi_key_env = SCRAPE_TEST_UNSET_KEY\n");
    const ScrapePipeline::Params params(IniFile(input, "test.conf"));

    BOOST_CHECK_EQUAL(params.fetcher_params_.user_agent_, ScrapeTools::DEFAULT_USER_AGENT);
    BOOST_CHECK_EQUAL(params.fetcher_params_.max_body_size_, BoundedFetcher::DEFAULT_MAX_BODY_SIZE);
    BOOST_CHECK_EQUAL(params.fetcher_params_.max_redirect_count_, Downloader::DEFAULT_MAX_REDIRECTS);
    BOOST_CHECK_EQUAL(params.robots_params_.max_body_size_, 500000u);
    BOOST_CHECK(params.enrichment_params_.api_key_.empty());
    BOOST_CHECK_EQUAL(params.enrichment_params_.model_, EnrichmentClient::DEFAULT_MODEL);
}


BOOST_AUTO_TEST_CASE(MissingConfigFile) {
    const auto ini_file(LoadScrapeConfig("/nonexistent/scrape_tools.conf"));
    BOOST_REQUIRE(ini_file != nullptr);
    BOOST_CHECK(ini_file->begin() == ini_file->end());
}
