/** \brief HTTP server that scrapes a public web page on behalf of its clients and answers with a structured JSON report.
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

#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <nlohmann/json.hpp>
#include "EnrichmentClient.h"
#include "HostGuard.h"
#include "IniFile.h"
#include "ScrapeError.h"
#include "ScrapePipeline.h"
#include "ScrapeService.h"
#include "ScrapeTools.h"
#include "StringUtil.h"
#include "util.h"


namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;


namespace {


[[noreturn]] void Usage() {
    std::cerr << "Usage: " << ::progname << " [--min-log-level=(ERROR|WARNING|INFO|DEBUG)] [--config=config_filename]\n"
              << "       The default config file is \"" << ScrapeTools::GetDefaultConfigFilename() << "\".\n";
    std::exit(EXIT_FAILURE);
}


const size_t MAX_REQUEST_BODY_SIZE(64 * 1024);
const std::string HEALTH_PATH("/health");


struct ServerParams {
    std::string address_;
    unsigned short port_;
    unsigned worker_thread_count_;
    std::string endpoint_path_;
    std::set<std::string> allowed_origins_;
public:
    explicit ServerParams(const IniFile &ini_file);
};


ServerParams::ServerParams(const IniFile &ini_file)
    : address_(ini_file.getString("Server", "address", "0.0.0.0")), endpoint_path_(ini_file.getString("Server", "endpoint_path", "/api/scrape"))
{
    const unsigned port(ini_file.getUnsigned("Server", "port", 8000));
    if (port == 0 or port > 65535)
        LOG_ERROR("\"port\" in section \"Server\" must be between 1 and 65535!");
    port_ = static_cast<unsigned short>(port);

    worker_thread_count_ = ini_file.getUnsigned("Server", "worker_threads", 4);
    if (worker_thread_count_ == 0)
        LOG_ERROR("\"worker_threads\" in section \"Server\" must be positive!");

    if (not StringUtil::StartsWith(endpoint_path_, "/"))
        LOG_ERROR("\"endpoint_path\" in section \"Server\" must start with a slash!");

    std::vector<std::string> allowed_origins;
    StringUtil::SplitThenTrimWhite(ini_file.getString("Server", "allowed_origins", "http://localhost:5173 http://127.0.0.1:5173"), ' ',
                                   &allowed_origins);
    allowed_origins_.insert(allowed_origins.cbegin(), allowed_origins.cend());
}


// Serves a single request per connection.
class Session : public std::enable_shared_from_this<Session> {
    tcp::socket socket_;
    beast::flat_buffer buffer_;
    http::request_parser<http::string_body> request_parser_;
    const ServerParams &server_params_;
    const ScrapeService &scrape_service_;
    net::thread_pool &worker_pool_;
public:
    Session(tcp::socket socket, const ServerParams &server_params, const ScrapeService &scrape_service, net::thread_pool &worker_pool)
        : socket_(std::move(socket)), server_params_(server_params), scrape_service_(scrape_service), worker_pool_(worker_pool)
    {
        request_parser_.body_limit(MAX_REQUEST_BODY_SIZE);
    }

    void start() { readRequest(); }
private:
    void readRequest();
    void handleRequest();
    void handleScrapeRequest();
    void sendJSON(const unsigned status, const nlohmann::json &body);
    void sendResponse(const std::shared_ptr<http::response<http::string_body>> &response);
    void addCorsHeaders(http::response<http::string_body> * const response) const;
    std::string getPath() const;
};


void Session::readRequest() {
    http::async_read(socket_, buffer_, request_parser_, [self = shared_from_this()](beast::error_code ec, std::size_t) {
        if (ec == http::error::body_limit) {
            self->sendJSON(413, { { "detail", "Request body is too large." },
                                   { "error", ScrapeError::KindToString(ScrapeError::PAYLOAD_TOO_LARGE) } });
            return;
        }
        if (ec) {
            if (ec != http::error::end_of_stream)
                LOG_WARNING("read error: " + ec.message());
            return;
        }

        self->handleRequest();
    });
}


std::string Session::getPath() const {
    const std::string target(request_parser_.get().target());
    const size_t question_mark_pos(target.find('?'));
    return question_mark_pos == std::string::npos ? target : target.substr(0, question_mark_pos);
}


void Session::handleRequest() {
    const auto &request(request_parser_.get());
    const std::string path(getPath());

    if (path == HEALTH_PATH) {
        if (request.method() == http::verb::get)
            sendJSON(200, ScrapeService::GetHealthStatus());
        else
            sendJSON(405, { { "detail", "Method not allowed." } });
        return;
    }

    if (path != server_params_.endpoint_path_) {
        sendJSON(404, { { "detail", "Not found." } });
        return;
    }

    if (request.method() == http::verb::options) {
        // CORS preflight:
        auto response(std::make_shared<http::response<http::string_body>>(http::status::no_content, request.version()));
        addCorsHeaders(response.get());
        if (response->find(http::field::access_control_allow_origin) != response->end()) {
            response->set(http::field::access_control_allow_methods, "POST");
            const auto requested_headers(request.find(http::field::access_control_request_headers));
            response->set(http::field::access_control_allow_headers,
                          requested_headers == request.end() ? std::string("*") : std::string(requested_headers->value()));
            response->set(http::field::access_control_max_age, "600");
        }
        sendResponse(response);
        return;
    }

    if (request.method() != http::verb::post) {
        sendJSON(405, { { "detail", "Method not allowed." } });
        return;
    }

    handleScrapeRequest();
}


// The pipeline blocks on outbound I/O, so it has to run on the worker pool and not on the I/O threads.
void Session::handleScrapeRequest() {
    net::post(worker_pool_, [self = shared_from_this()]() {
        const ServiceResponse service_response(self->scrape_service_.handleScrapeRequest(self->request_parser_.get().body()));
        net::post(self->socket_.get_executor(), [self, service_response]() {
            self->sendJSON(service_response.status_, service_response.body_);
        });
    });
}


void Session::addCorsHeaders(http::response<http::string_body> * const response) const {
    const auto &request(request_parser_.get());
    const auto origin(request.find(http::field::origin));
    if (origin == request.end())
        return;

    const std::string origin_value(origin->value());
    if (server_params_.allowed_origins_.find(origin_value) == server_params_.allowed_origins_.cend())
        return;

    response->set(http::field::access_control_allow_origin, origin_value);
    response->set(http::field::vary, "Origin");
}


void Session::sendJSON(const unsigned status, const nlohmann::json &body) {
    auto response(std::make_shared<http::response<http::string_body>>(static_cast<http::status>(status), request_parser_.get().version()));
    response->set(http::field::content_type, "application/json");
    addCorsHeaders(response.get());
    response->body() = body.dump(-1, ' ', /* ensure_ascii = */ false, nlohmann::json::error_handler_t::replace);
    sendResponse(response);
}


void Session::sendResponse(const std::shared_ptr<http::response<http::string_body>> &response) {
    response->set(http::field::server, ScrapeTools::APP_NAME + "/" + ScrapeTools::VERSION);
    response->keep_alive(false);
    response->prepare_payload();

    http::async_write(socket_, *response, [self = shared_from_this(), response](beast::error_code ec, std::size_t) {
        if (ec) {
            LOG_WARNING("write error: " + ec.message());
            return;
        }

        beast::error_code shutdown_ec;
        self->socket_.shutdown(tcp::socket::shutdown_send, shutdown_ec);
    });
}


class Listener : public std::enable_shared_from_this<Listener> {
    net::io_context &io_context_;
    tcp::acceptor acceptor_;
    const ServerParams &server_params_;
    const ScrapeService &scrape_service_;
    net::thread_pool &worker_pool_;
public:
    Listener(net::io_context &io_context, const tcp::endpoint &endpoint, const ServerParams &server_params,
             const ScrapeService &scrape_service, net::thread_pool &worker_pool);

    void run() { accept(); }
private:
    void accept();
};


Listener::Listener(net::io_context &io_context, const tcp::endpoint &endpoint, const ServerParams &server_params,
                   const ScrapeService &scrape_service, net::thread_pool &worker_pool)
    : io_context_(io_context), acceptor_(io_context), server_params_(server_params), scrape_service_(scrape_service),
      worker_pool_(worker_pool)
{
    boost::system::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (ec)
        LOG_ERROR("failed to open the acceptor: " + ec.message());
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec)
        LOG_ERROR("failed to set SO_REUSEADDR: " + ec.message());
    acceptor_.bind(endpoint, ec);
    if (ec)
        LOG_ERROR("failed to bind to " + endpoint.address().to_string() + ":" + std::to_string(endpoint.port()) + ": " + ec.message());
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec)
        LOG_ERROR("failed to listen: " + ec.message());
}


void Listener::accept() {
    acceptor_.async_accept(net::make_strand(io_context_), [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
        if (not ec) {
            LOG_DEBUG("accepted connection from " + socket.remote_endpoint(ec).address().to_string());
            std::make_shared<Session>(std::move(socket), self->server_params_, self->scrape_service_, self->worker_pool_)->start();
        } else if (ec == net::error::operation_aborted)
            return;
        else
            LOG_WARNING("accept error: " + ec.message());

        self->accept();
    });
}


} // unnamed namespace


int Main(int argc, char *argv[]) {
    std::string config_filename(ScrapeTools::GetDefaultConfigFilename());
    if (argc == 2) {
        if (not StringUtil::StartsWith(argv[1], "--config="))
            Usage();
        config_filename = argv[1] + std::strlen("--config=");
    } else if (argc != 1)
        Usage();

    const auto ini_file(LoadScrapeConfig(config_filename));
    const ServerParams server_params(*ini_file);
    const ScrapePipeline::Params pipeline_params(*ini_file);

    const HostGuard host_guard;
    const EnrichmentClient enrichment_client(pipeline_params.enrichment_params_);
    if (not enrichment_client.isConfigured())
        LOG_INFO("no API key found, enrichment is disabled");
    const ScrapePipeline pipeline(host_guard, pipeline_params.robots_params_, pipeline_params.fetcher_params_, &enrichment_client);
    const ScrapeService scrape_service(pipeline);

    boost::system::error_code ec;
    const auto address(net::ip::make_address(server_params.address_, ec));
    if (ec)
        LOG_ERROR("bad server address \"" + server_params.address_ + "\": " + ec.message());

    net::io_context io_context;
    net::thread_pool worker_pool(server_params.worker_thread_count_);
    std::make_shared<Listener>(io_context, tcp::endpoint(address, server_params.port_), server_params, scrape_service, worker_pool)->run();

    net::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&io_context](const boost::system::error_code &, int signal_no) {
        LOG_INFO("caught signal " + std::to_string(signal_no) + ", shutting down");
        io_context.stop();
    });

    LOG_INFO("listening on http://" + server_params.address_ + ":" + std::to_string(server_params.port_) + server_params.endpoint_path_);
    io_context.run();

    worker_pool.stop();
    worker_pool.join();

    return EXIT_SUCCESS;
}
