/** \file   Downloader.h
 *  \brief  Functions for downloading of web resources.
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
#pragma once


#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include <curl/curl.h>
#include "Url.h"
#include "util.h"


/** \class  Downloader
 *  \brief  Implements an object that can download Web pages and post data to Web services.
 *
 *  Redirects are followed by us rather than by libcurl so that every hop can be vetted by a caller-supplied validator.
 *  Status, media type and declared size of the final response are checked as soon as its header has been received and
 *  the accumulated body size is checked while the body is being received.  Any violation aborts the transfer.
 */
class Downloader {
    CURL *easy_handle_;
public:
    static constexpr long DEFAULT_MAX_REDIRECTS = 10;
    static constexpr long MAX_MAX_REDIRECT_COUNT = 20;
    static constexpr unsigned DEFAULT_CONNECT_TIMEOUT = 5000; // In ms.
    static constexpr unsigned DEFAULT_TIME_LIMIT = 20000;     // In ms.
    static const std::string DEFAULT_USER_AGENT_STRING;

    enum ErrorType {
        NO_ERROR,
        TIMEOUT,
        CONNECTION_ERROR,
        HTTP_ERROR,             //< Non-2xx status with "fail_on_http_error_" set.
        UNSUPPORTED_MEDIA_TYPE, //< The Content-Type matched none of the acceptable media types.
        BODY_TOO_LARGE,         //< Declared or actual body size exceeded "max_body_size_".
        REDIRECT_BLOCKED,       //< The redirect validator refused a redirect target.
        TOO_MANY_REDIRECTS
    };

    /** Returns false and sets "reason" if we must not follow a redirect to the URL passed in as the first argument. */
    typedef std::function<bool(const Url &redirect_url, std::string * const reason)> RedirectValidator;

    struct Params {
        std::string user_agent_;
        unsigned connect_timeout_;           // In ms.
        long max_redirect_count_;            // Must always be between 0 and MAX_MAX_REDIRECT_COUNT.
        size_t max_body_size_;               // In bytes, 0 means unlimited.
        bool fail_on_http_error_;
        std::vector<std::string> acceptable_media_types_; // Substrings of the Content-Type, empty means anything goes.
        std::vector<std::string> additional_headers_;
        std::vector<std::string> resolve_overrides_;      // "host:port:address" entries, c.f. CURLOPT_RESOLVE.
        RedirectValidator redirect_validator_;
    public:
        explicit Params(const std::string &user_agent = DEFAULT_USER_AGENT_STRING, const unsigned connect_timeout = DEFAULT_CONNECT_TIMEOUT,
                        const long max_redirect_count = DEFAULT_MAX_REDIRECTS, const size_t max_body_size = 0,
                        const bool fail_on_http_error = true, const std::vector<std::string> &acceptable_media_types = {},
                        const std::vector<std::string> &additional_headers = {},
                        const std::vector<std::string> &resolve_overrides = {},
                        const RedirectValidator &redirect_validator = RedirectValidator());
    };

    typedef size_t (*WriteFunc)(void *data, size_t size, size_t nmemb, void *this_pointer);
    typedef size_t (*HeaderFunc)(void *data, size_t size, size_t nmemb, void *this_pointer);
private:
    Params params_;
    CURLcode curl_error_code_;
    ErrorType error_type_;
    mutable std::string last_error_message_;
    char error_buffer_[CURL_ERROR_SIZE];
    curl_slist *additional_http_headers_;
    curl_slist *resolve_list_;
    std::string post_data_;
    bool is_post_;
    Url current_url_;
    std::vector<std::string> redirect_urls_;
    std::chrono::steady_clock::time_point deadline_;

    // State of the response currently being received:
    unsigned response_code_;
    std::string content_type_;
    std::string location_;
    bool have_content_length_;
    size_t content_length_;
    bool is_redirect_response_;
    std::string body_;
public:
    explicit Downloader(const Params &params = Params());
    Downloader(const Downloader &rhs) = delete;
    virtual ~Downloader();

    const Downloader &operator=(const Downloader &rhs) = delete;

    /** \brief  Issues a GET request for "url", following redirects.
     *  \param  time_limit  Max. amount of time for the whole operation, including all redirects, in milliseconds.
     *  \return True if we received a complete response that passed all of our checks, else false.
     */
    bool newUrl(const Url &url, const unsigned time_limit = DEFAULT_TIME_LIMIT);
    bool newUrl(const std::string &url, const unsigned time_limit = DEFAULT_TIME_LIMIT) { return newUrl(Url(url), time_limit); }

    /** \brief  Issues a POST request with "data" as the request body.  Redirects are not followed. */
    bool postData(const Url &url, const std::string &data, const unsigned time_limit = DEFAULT_TIME_LIMIT);
    bool postData(const std::string &url, const std::string &data, const unsigned time_limit = DEFAULT_TIME_LIMIT) {
        return postData(Url(url), data, time_limit);
    }

    const std::string &getMessageBody() const { return body_; }

    /** \return The raw value of the Content-Type header of the final response or the empty string if there was none. */
    const std::string &getContentType() const { return content_type_; }

    /** \return The status code of the final response or 0 if we never received a response. */
    unsigned getResponseCode() const { return response_code_; }

    /** \return The URL of the final response. */
    const Url &getEffectiveUrl() const { return current_url_; }

    /** \note Returns \em{all} URLs encountered in downloading the last document, including the original URL. */
    const std::vector<std::string> &getRedirectUrls() const { return redirect_urls_; }

    ErrorType getErrorType() const { return error_type_; }
    const std::string &getLastErrorMessage() const;

    static std::string ErrorTypeToString(const ErrorType error_type);
private:
    void init();
    bool internalNewUrl(const Url &url);
    bool setError(const ErrorType error_type, const std::string &error_message);
    long getRemainingTime() const;
    size_t writeFunction(void *data, size_t size, size_t nmemb);
    static size_t WriteFunction(void *data, size_t size, size_t nmemb, void *this_pointer);
    size_t headerFunction(void *data, size_t size, size_t nmemb);
    static size_t HeaderFunction(void *data, size_t size, size_t nmemb, void *this_pointer);
    bool finalResponseHeaderIsAcceptable();
    template <typename OptionType>
    void curlEasySetopt(const CURLoption option, OptionType value, const std::string &caller_info) {
        if ((curl_error_code_ = ::curl_easy_setopt(easy_handle_, option, value)) != CURLE_OK)
            LOG_ERROR("curl_easy_setopt(" + caller_info + ") failed!");
    }
};
