/** \file   TestHttpServer.h
 *  \brief  A loopback HTTP server that answers with canned responses, for tests that exercise outbound requests.
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


#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <boost/asio.hpp>


/** \class  TestHttpServer
 *  \brief  Serves one request per connection on 127.0.0.1 from a background thread.
 *
 *  Tests use the host name TEST_HOSTNAME in their URLs.  curl is pointed at the loopback interface via
 *  getResolveOverride() and a HostGuard with a resolver that returns a public address lets the host pass the guard.
 */
class TestHttpServer {
public:
    static constexpr const char *TEST_HOSTNAME = "example.test";
    static constexpr const char *PUBLIC_ADDRESS = "93.184.216.34";

    struct Request {
        std::string method_;
        std::string target_;
        std::string headers_;
        std::string body_;
    };
private:
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::thread server_thread_;
    mutable std::mutex mutex_;
    std::map<std::string, std::string> targets_to_raw_responses_map_;
    std::vector<Request> requests_;
    std::set<std::string> unanswered_targets_;
    std::vector<boost::asio::ip::tcp::socket> held_sockets_; // Only touched by the server thread.
public:
    TestHttpServer()
        : acceptor_(io_context_, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), /* any port */ 0))
    {
        accept();
        server_thread_ = std::thread([this]() { io_context_.run(); });
    }

    ~TestHttpServer() {
        io_context_.stop();
        server_thread_.join();
    }

    unsigned short getPort() const { return acceptor_.local_endpoint().port(); }

    /** \return E.g. "http://example.test:34567/index.html" for "/index.html". */
    std::string getUrl(const std::string &target) const {
        return "http://" + std::string(TEST_HOSTNAME) + ":" + std::to_string(getPort()) + target;
    }

    /** \return A CURLOPT_RESOLVE entry that maps TEST_HOSTNAME to the loopback address. */
    std::string getResolveOverride() const { return std::string(TEST_HOSTNAME) + ":" + std::to_string(getPort()) + ":127.0.0.1"; }

    /** \note "raw_response" is sent verbatim, followed by closing the connection. */
    void setRawResponse(const std::string &target, const std::string &raw_response) {
        std::lock_guard<std::mutex> mutex_locker(mutex_);
        targets_to_raw_responses_map_[target] = raw_response;
    }

    void setResponse(const std::string &target, const unsigned status, const std::string &content_type, const std::string &body,
                     const std::string &additional_headers = "")
    {
        std::string raw_response("HTTP/1.1 " + std::to_string(status) + " " + (status < 300 ? "OK" : "Whatever") + "\r\n");
        if (not content_type.empty())
            raw_response += "Content-Type: " + content_type + "\r\n";
        raw_response += "Content-Length: " + std::to_string(body.length()) + "\r\n";
        raw_response += additional_headers;
        raw_response += "Connection: close\r\n\r\n";
        raw_response += body;
        setRawResponse(target, raw_response);
    }

    void setRedirect(const std::string &target, const std::string &location) {
        setResponse(target, 302, "text/html", "", "Location: " + location + "\r\n");
    }

    /** \note Requests for "target" are read and recorded but the connection stays open without a response until the
     *        server is destroyed. */
    void setNoResponse(const std::string &target) {
        std::lock_guard<std::mutex> mutex_locker(mutex_);
        unanswered_targets_.emplace(target);
    }

    std::vector<Request> getRequests() const {
        std::lock_guard<std::mutex> mutex_locker(mutex_);
        return requests_;
    }

    size_t getRequestCount(const std::string &target) const {
        std::lock_guard<std::mutex> mutex_locker(mutex_);
        size_t count(0);
        for (const auto &request : requests_) {
            if (request.target_ == target)
                ++count;
        }
        return count;
    }
private:
    void accept() {
        acceptor_.async_accept([this](const boost::system::error_code &ec, boost::asio::ip::tcp::socket socket) {
            if (ec)
                return;
            serve(&socket);
            accept();
        });
    }

    void serve(boost::asio::ip::tcp::socket * const socket) {
        boost::system::error_code ec;
        boost::asio::streambuf buffer;
        boost::asio::read_until(*socket, buffer, "\r\n\r\n", ec);
        if (ec)
            return;

        std::string data(boost::asio::buffers_begin(buffer.data()), boost::asio::buffers_end(buffer.data()));
        const size_t header_end(data.find("\r\n\r\n") + 4);

        Request request;
        const size_t first_space(data.find(' ')), second_space(data.find(' ', first_space + 1));
        request.method_ = data.substr(0, first_space);
        request.target_ = data.substr(first_space + 1, second_space - first_space - 1);
        request.headers_ = data.substr(0, header_end);

        size_t content_length(0);
        for (const std::string header_name : { "Content-Length: ", "content-length: " }) {
            const size_t header_pos(request.headers_.find(header_name));
            if (header_pos != std::string::npos)
                content_length = std::stoul(request.headers_.substr(header_pos + header_name.length()));
        }

        request.body_ = data.substr(header_end);
        if (request.body_.length() < content_length) {
            std::string rest(content_length - request.body_.length(), '\0');
            boost::asio::read(*socket, boost::asio::buffer(&rest[0], rest.length()), ec);
            request.body_ += rest;
        }

        std::string raw_response;
        {
            std::lock_guard<std::mutex> mutex_locker(mutex_);
            requests_.emplace_back(request);
            if (unanswered_targets_.find(request.target_) != unanswered_targets_.cend()) {
                held_sockets_.emplace_back(std::move(*socket));
                return;
            }
            const auto target_and_raw_response(targets_to_raw_responses_map_.find(request.target_));
            raw_response = (target_and_raw_response != targets_to_raw_responses_map_.cend())
                               ? target_and_raw_response->second
                               : "HTTP/1.1 404 Not Found\r\nContent-Type: text/plain\r\nContent-Length: 9\r\nConnection: close\r\n\r\nNot found";
        }

        // The client may hang up on us early, e.g. if the body is too large.  We don't care.
        boost::asio::write(*socket, boost::asio::buffer(raw_response), ec);
        socket->shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        socket->close(ec);
    }
};
