/** \file   Downloader.cc
 *  \brief  Implementation of class Downloader.
 *  \author Dr. Johannes Ruscheinski (johannes.ruscheinski@uni-tuebingen.de)
 *
 *  \copyright 2005-2008 Project iVia.
 *  \copyright 2005-2008 The Regents of The University of California.
 *  \copyright 2015-2021 Universitätsbibliothek Tübingen.
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
#include "Downloader.h"
#include <algorithm>
#include <stdexcept>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include "ScrapeTools.h"
#include "StringUtil.h"


namespace {


int GlobalInit() {
    if (unlikely(::curl_global_init(CURL_GLOBAL_ALL) != 0)) {
        const std::string error_message("curl_global_init(3) failed!\n");
        const ssize_t dummy = ::write(STDERR_FILENO, error_message.c_str(), error_message.length());
        (void)dummy;
        ::_exit(EXIT_FAILURE);
    }

    return 0;
}


int dummy(GlobalInit());


// \return The trimmed value if "header_line" is a header named "header_name", else the empty string.
std::string GetHeaderValue(const std::string &header_line, const std::string &header_name) {
    if (header_line.length() <= header_name.length() or header_line[header_name.length()] != ':'
        or not StringUtil::StartsWith(header_line, header_name, /* ignore_case = */ true))
        return "";

    return StringUtil::TrimWhite(header_line.substr(header_name.length() + 1));
}


} // unnamed namespace


const std::string Downloader::DEFAULT_USER_AGENT_STRING(ScrapeTools::DEFAULT_USER_AGENT);


Downloader::Params::Params(const std::string &user_agent, const unsigned connect_timeout, const long max_redirect_count,
                           const size_t max_body_size, const bool fail_on_http_error,
                           const std::vector<std::string> &acceptable_media_types, const std::vector<std::string> &additional_headers,
                           const std::vector<std::string> &resolve_overrides, const RedirectValidator &redirect_validator)
    : user_agent_(user_agent), connect_timeout_(connect_timeout), max_redirect_count_(max_redirect_count), max_body_size_(max_body_size),
      fail_on_http_error_(fail_on_http_error), acceptable_media_types_(acceptable_media_types), additional_headers_(additional_headers),
      resolve_overrides_(resolve_overrides), redirect_validator_(redirect_validator)
{
    if (unlikely(max_redirect_count_ < 0 or max_redirect_count_ > MAX_MAX_REDIRECT_COUNT))
        throw std::runtime_error("in Downloader::Params::Params: max_redirect_count (= " + std::to_string(max_redirect_count)
                                 + ") must be between 0 and " + std::to_string(MAX_MAX_REDIRECT_COUNT) + "!");
}


Downloader::Downloader(const Params &params)
    : easy_handle_(nullptr), params_(params), curl_error_code_(CURLE_OK), error_type_(NO_ERROR), additional_http_headers_(nullptr),
      resolve_list_(nullptr), is_post_(false), response_code_(0), have_content_length_(false), content_length_(0),
      is_redirect_response_(false)
{
    init();
}


Downloader::~Downloader() {
    if (additional_http_headers_ != nullptr)
        ::curl_slist_free_all(additional_http_headers_);
    if (resolve_list_ != nullptr)
        ::curl_slist_free_all(resolve_list_);
    if (likely(easy_handle_ != nullptr))
        ::curl_easy_cleanup(easy_handle_);
}


void Downloader::init() {
    error_buffer_[0] = '\0';

    easy_handle_ = ::curl_easy_init();
    if (unlikely(easy_handle_ == nullptr))
        throw std::runtime_error("in Downloader::init: curl_easy_init() failed!");

    curlEasySetopt(CURLOPT_HEADER, 0L, "Downloader::init:CURLOPT_HEADER");
    curlEasySetopt(CURLOPT_NOPROGRESS, 1L, "Downloader::init:CURLOPT_NOPROGRESS");
    curlEasySetopt(CURLOPT_NOSIGNAL, 1L, "Downloader::init:CURLOPT_NOSIGNAL");
    curlEasySetopt(CURLOPT_WRITEFUNCTION, WriteFunction, "Downloader::init:CURLOPT_WRITEFUNCTION");
    curlEasySetopt(CURLOPT_WRITEDATA, reinterpret_cast<void *>(this), "Downloader::init:CURLOPT_WRITEDATA");
    curlEasySetopt(CURLOPT_HEADERFUNCTION, HeaderFunction, "Downloader::init:CURLOPT_HEADERFUNCTION");
    curlEasySetopt(CURLOPT_HEADERDATA, reinterpret_cast<void *>(this), "Downloader::init:CURLOPT_HEADERDATA");
    curlEasySetopt(CURLOPT_ERRORBUFFER, error_buffer_, "Downloader::init:CURLOPT_ERRORBUFFER");

    // We follow redirects ourselves, c.f. newUrl().
    curlEasySetopt(CURLOPT_FOLLOWLOCATION, 0L, "Downloader::init:CURLOPT_FOLLOWLOCATION");
#if LIBCURL_VERSION_NUM >= 0x075500
    curlEasySetopt(CURLOPT_PROTOCOLS_STR, "http,https", "Downloader::init:CURLOPT_PROTOCOLS_STR");
#else
    curlEasySetopt(CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS), "Downloader::init:CURLOPT_PROTOCOLS");
#endif

    // Accept any encoding that libcurl can decode.  Our size limit applies to the decoded body.
    curlEasySetopt(CURLOPT_ACCEPT_ENCODING, "", "Downloader::init:CURLOPT_ACCEPT_ENCODING");

    curlEasySetopt(CURLOPT_USERAGENT, params_.user_agent_.c_str(), "Downloader::init:CURLOPT_USERAGENT");

    for (const auto &additional_header : params_.additional_headers_)
        additional_http_headers_ = ::curl_slist_append(additional_http_headers_, additional_header.c_str());
    if (additional_http_headers_ != nullptr)
        curlEasySetopt(CURLOPT_HTTPHEADER, additional_http_headers_, "Downloader::init:CURLOPT_HTTPHEADER");

    for (const auto &resolve_override : params_.resolve_overrides_)
        resolve_list_ = ::curl_slist_append(resolve_list_, resolve_override.c_str());
    if (resolve_list_ != nullptr)
        curlEasySetopt(CURLOPT_RESOLVE, resolve_list_, "Downloader::init:CURLOPT_RESOLVE");
}


bool Downloader::newUrl(const Url &url, const unsigned time_limit) {
    is_post_ = false;
    curlEasySetopt(CURLOPT_HTTPGET, 1L, "Downloader::newUrl:CURLOPT_HTTPGET");

    deadline_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(time_limit);
    redirect_urls_.clear();
    current_url_ = url;
    error_type_ = NO_ERROR;
    last_error_message_.clear();

    for (;;) {
        if (not internalNewUrl(current_url_))
            return false;
        if (not is_redirect_response_)
            return true;

        if (static_cast<long>(redirect_urls_.size()) > params_.max_redirect_count_)
            return setError(TOO_MANY_REDIRECTS, "Too many redirects (> " + std::to_string(params_.max_redirect_count_) + ")!");

        const Url redirect_url(location_);
        if (not redirect_url.isValidWebUrl())
            return setError(CONNECTION_ERROR, "can't follow a redirect to \"" + location_ + "\"!");

        std::string reason;
        if (params_.redirect_validator_ and not params_.redirect_validator_(redirect_url, &reason))
            return setError(REDIRECT_BLOCKED, reason);

        LOG_DEBUG("following a redirect from " + current_url_.toString() + " to " + redirect_url.toString());
        current_url_ = redirect_url;
    }
}


bool Downloader::postData(const Url &url, const std::string &data, const unsigned time_limit) {
    is_post_ = true;
    curlEasySetopt(CURLOPT_POST, 1L, "Downloader::postData:CURLOPT_POST");
    curlEasySetopt(CURLOPT_POSTFIELDSIZE, static_cast<long>(data.size()), "Downloader::postData:CURLOPT_POSTFIELDSIZE");
    curlEasySetopt(CURLOPT_COPYPOSTFIELDS, data.c_str(), "Downloader::postData:CURLOPT_COPYPOSTFIELDS");

    deadline_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(time_limit);
    redirect_urls_.clear();
    current_url_ = url;
    error_type_ = NO_ERROR;
    last_error_message_.clear();

    // We never follow redirects for POSTs, c.f. headerFunction().
    return internalNewUrl(current_url_);
}


const std::string &Downloader::getLastErrorMessage() const {
    if (curl_error_code_ != CURLE_OK and last_error_message_.empty())
        last_error_message_ = ::curl_easy_strerror(curl_error_code_);

    return last_error_message_;
}


std::string Downloader::ErrorTypeToString(const ErrorType error_type) {
    switch (error_type) {
    case NO_ERROR:
        return "NO_ERROR";
    case TIMEOUT:
        return "TIMEOUT";
    case CONNECTION_ERROR:
        return "CONNECTION_ERROR";
    case HTTP_ERROR:
        return "HTTP_ERROR";
    case UNSUPPORTED_MEDIA_TYPE:
        return "UNSUPPORTED_MEDIA_TYPE";
    case BODY_TOO_LARGE:
        return "BODY_TOO_LARGE";
    case REDIRECT_BLOCKED:
        return "REDIRECT_BLOCKED";
    case TOO_MANY_REDIRECTS:
        return "TOO_MANY_REDIRECTS";
    }

    LOG_ERROR("unknown error type " + std::to_string(static_cast<int>(error_type)) + "!");
}


bool Downloader::setError(const ErrorType error_type, const std::string &error_message) {
    error_type_ = error_type;
    last_error_message_ = error_message;
    return false;
}


long Downloader::getRemainingTime() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - std::chrono::steady_clock::now()).count();
}


bool Downloader::internalNewUrl(const Url &url) {
    body_.clear();
    content_type_.clear();
    location_.clear();
    response_code_ = 0;
    have_content_length_ = false;
    content_length_ = 0;
    is_redirect_response_ = false;
    error_buffer_[0] = '\0';
    redirect_urls_.emplace_back(url.toString());

    const long timeout_in_ms(getRemainingTime());
    if (timeout_in_ms <= 0)
        return setError(TIMEOUT, "timeout exceeded");

    curlEasySetopt(CURLOPT_URL, url.toString().c_str(), "Downloader::internalNewUrl:CURLOPT_URL");
    curlEasySetopt(CURLOPT_TIMEOUT_MS, timeout_in_ms, "Downloader::internalNewUrl:CURLOPT_TIMEOUT_MS");
    curlEasySetopt(CURLOPT_CONNECTTIMEOUT_MS, std::min(timeout_in_ms, static_cast<long>(params_.connect_timeout_)),
                   "Downloader::internalNewUrl:CURLOPT_CONNECTTIMEOUT_MS");

    curl_error_code_ = ::curl_easy_perform(easy_handle_);

    // One of our callbacks aborted the transfer?
    if (error_type_ != NO_ERROR)
        return false;

    if (curl_error_code_ != CURLE_OK) {
        const std::string error_message(error_buffer_[0] != '\0' ? error_buffer_ : ::curl_easy_strerror(curl_error_code_));
        return setError(curl_error_code_ == CURLE_OPERATION_TIMEDOUT ? TIMEOUT : CONNECTION_ERROR, error_message);
    }

    long response_code;
    if (::curl_easy_getinfo(easy_handle_, CURLINFO_RESPONSE_CODE, &response_code) == CURLE_OK)
        response_code_ = static_cast<unsigned>(response_code);

    if (is_redirect_response_) {
        char *redirect_url(nullptr);
        if (::curl_easy_getinfo(easy_handle_, CURLINFO_REDIRECT_URL, &redirect_url) != CURLE_OK or redirect_url == nullptr)
            return setError(CONNECTION_ERROR, "can't make sense of the redirect location \"" + location_ + "\"!");
        location_ = redirect_url;
    }

    return true;
}


bool Downloader::finalResponseHeaderIsAcceptable() {
    if (params_.fail_on_http_error_ and (response_code_ < 200 or response_code_ > 299))
        return setError(HTTP_ERROR, "HTTP status " + std::to_string(response_code_));

    if (not params_.acceptable_media_types_.empty()
        and std::none_of(params_.acceptable_media_types_.cbegin(), params_.acceptable_media_types_.cend(),
                         [this](const std::string &media_type) {
                             return StringUtil::FindCaseInsensitive(content_type_, media_type) != std::string::npos;
                         }))
        return setError(UNSUPPORTED_MEDIA_TYPE, "unsupported content type \"" + content_type_ + "\"");

    if (params_.max_body_size_ > 0 and have_content_length_ and content_length_ > params_.max_body_size_)
        return setError(BODY_TOO_LARGE, "declared content length " + std::to_string(content_length_) + " exceeds the limit of "
                                        + std::to_string(params_.max_body_size_) + " bytes");

    return true;
}


size_t Downloader::writeFunction(void *data, size_t size, size_t nmemb) {
    const size_t total_size(size * nmemb);
    if (is_redirect_response_)
        return total_size; // Nobody cares about the body of a redirect.

    if (params_.max_body_size_ > 0 and body_.size() + total_size > params_.max_body_size_) {
        setError(BODY_TOO_LARGE, "body exceeds the limit of " + std::to_string(params_.max_body_size_) + " bytes");
        return 0;
    }

    body_.append(reinterpret_cast<char *>(data), total_size);
    return total_size;
}


size_t Downloader::WriteFunction(void *data, size_t size, size_t nmemb, void *this_pointer) {
    Downloader *downloader(reinterpret_cast<Downloader *>(this_pointer));
    return downloader->writeFunction(data, size, nmemb);
}


size_t Downloader::headerFunction(void *data, size_t size, size_t nmemb) {
    const size_t total_size(size * nmemb);
    const std::string header_line(StringUtil::TrimWhite(std::string(reinterpret_cast<char *>(data), total_size)));

    // A status line starts a new response, e.g. after "100 Continue":
    if (StringUtil::StartsWith(header_line, "HTTP/")) {
        response_code_ = 0;
        content_type_.clear();
        location_.clear();
        have_content_length_ = false;
        content_length_ = 0;
        is_redirect_response_ = false;

        const auto first_space_pos(header_line.find(' '));
        if (first_space_pos != std::string::npos)
            StringUtil::ToUnsigned(header_line.substr(first_space_pos + 1, 3), &response_code_);
        return total_size;
    }

    if (not header_line.empty()) {
        std::string header_value;
        if (not (header_value = GetHeaderValue(header_line, "Content-Type")).empty())
            content_type_ = header_value;
        else if (not (header_value = GetHeaderValue(header_line, "Location")).empty())
            location_ = header_value;
        else if (not (header_value = GetHeaderValue(header_line, "Content-Length")).empty()) {
            char *end_ptr;
            errno = 0;
            const unsigned long long content_length(std::strtoull(header_value.c_str(), &end_ptr, 10));
            if (errno == 0 and *end_ptr == '\0') {
                have_content_length_ = true;
                content_length_ = static_cast<size_t>(content_length);
            }
            errno = 0;
        }
        return total_size;
    }

    // If we make it here we have reached the end of a header.
    if (response_code_ >= 100 and response_code_ < 200)
        return total_size;

    if (response_code_ >= 300 and response_code_ < 400 and not location_.empty() and params_.max_redirect_count_ > 0 and not is_post_) {
        is_redirect_response_ = true;
        return total_size;
    }

    return finalResponseHeaderIsAcceptable() ? total_size : 0;
}


size_t Downloader::HeaderFunction(void *data, size_t size, size_t nmemb, void *this_pointer) {
    Downloader *downloader(reinterpret_cast<Downloader *>(this_pointer));
    return downloader->headerFunction(data, size, nmemb);
}
