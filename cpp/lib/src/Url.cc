/** \file    Url.cc
 *  \brief   Implementation of class Url.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Jiangtao Hu
 */

/*
 *  Copyright 2003-2008 Project iVia.
 *  Copyright 2003-2008 The Regents of The University of California.
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as published
 *  by the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software
 *  Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */

#include "Url.h"
#include <cctype>
#include "StringUtil.h"


namespace {


// Strips leading and trailing characters <= 0x20 and removes embedded tabs, carriage returns and linefeeds.
std::string CleanUpReference(const std::string &url) {
    size_t start(0), end(url.length());
    while (start < end and static_cast<unsigned char>(url[start]) <= 0x20u)
        ++start;
    while (end > start and static_cast<unsigned char>(url[end - 1]) <= 0x20u)
        --end;

    std::string cleaned_up_url;
    cleaned_up_url.reserve(end - start);
    for (size_t i(start); i < end; ++i) {
        if (url[i] != '\t' and url[i] != '\r' and url[i] != '\n')
            cleaned_up_url += url[i];
    }

    return cleaned_up_url;
}


// \return The length of a leading scheme followed by a colon or 0 if "url" doesn't start with a scheme.
size_t GetSchemeLength(const std::string &url) {
    if (url.empty() or not std::isalpha(static_cast<unsigned char>(url[0])))
        return 0;

    for (size_t i(1); i < url.length(); ++i) {
        const char ch(url[i]);
        if (ch == ':')
            return i;
        if (not std::isalnum(static_cast<unsigned char>(ch)) and ch != '+' and ch != '-' and ch != '.')
            return 0;
    }

    return 0;
}


} // unnamed namespace


Url::Url(const std::string &url)
    : has_authority_(false), has_username_password_(false), has_port_(false), has_query_(false), has_fragment_(false),
      is_valid_(true)
{
    parse(CleanUpReference(url));
}


Url::Url(const std::string &url, const Url &base_url)
    : has_authority_(false), has_username_password_(false), has_port_(false), has_query_(false), has_fragment_(false),
      is_valid_(true)
{
    const Url reference(url);
    if (not base_url.isAbsolute() or not base_url.isValid())
        *this = reference;
    else
        resolve(reference, base_url);
}


void Url::parse(const std::string &url) {
    std::string rest(url);

    const size_t scheme_length(GetSchemeLength(rest));
    if (scheme_length > 0) {
        scheme_ = StringUtil::ToLower(rest.substr(0, scheme_length));
        rest = rest.substr(scheme_length + 1);
    }

    const size_t hash_pos(rest.find('#'));
    if (hash_pos != std::string::npos) {
        has_fragment_ = true;
        fragment_ = rest.substr(hash_pos + 1);
        rest.resize(hash_pos);
    }

    const size_t question_mark_pos(rest.find('?'));
    if (question_mark_pos != std::string::npos) {
        has_query_ = true;
        query_ = rest.substr(question_mark_pos + 1);
        rest.resize(question_mark_pos);
    }

    if (StringUtil::StartsWith(rest, "//")) {
        has_authority_ = true;
        const size_t path_start(rest.find('/', 2));
        if (not parseAuthority(rest.substr(2, path_start == std::string::npos ? std::string::npos : path_start - 2)))
            is_valid_ = false;
        path_ = (path_start == std::string::npos) ? "" : rest.substr(path_start);
    } else
        path_ = rest;
}


bool Url::parseAuthority(const std::string &authority) {
    std::string host_and_port(authority);
    const size_t at_sign_pos(host_and_port.rfind('@'));
    if (at_sign_pos != std::string::npos) {
        has_username_password_ = true;
        username_password_ = host_and_port.substr(0, at_sign_pos);
        host_and_port = host_and_port.substr(at_sign_pos + 1);
    }

    size_t port_colon_pos;
    if (not host_and_port.empty() and host_and_port[0] == '[') {
        const size_t closing_bracket_pos(host_and_port.find(']'));
        if (closing_bracket_pos == std::string::npos) {
            authority_ = host_and_port;
            return false;
        }
        authority_ = host_and_port.substr(0, closing_bracket_pos + 1);
        if (closing_bracket_pos + 1 == host_and_port.length())
            return true;
        if (host_and_port[closing_bracket_pos + 1] != ':')
            return false;
        port_colon_pos = closing_bracket_pos + 1;
    } else {
        port_colon_pos = host_and_port.rfind(':');
        authority_ = host_and_port.substr(0, port_colon_pos);
        if (port_colon_pos == std::string::npos)
            return true;
    }

    has_port_ = true;
    port_ = host_and_port.substr(port_colon_pos + 1);
    if (port_.empty())
        return true;
    unsigned port_number;
    return StringUtil::ToUnsigned(port_, &port_number) and port_number <= 65535;
}


void Url::resolve(const Url &reference, const Url &base_url) {
    is_valid_ = reference.is_valid_;

    // Non-strict resolution: "http:foo" relative to an HTTP base is the same as "foo".
    const bool use_reference_scheme(reference.isAbsolute()
                                    and (reference.scheme_ != base_url.scheme_ or reference.has_authority_));
    if (use_reference_scheme) {
        *this = reference;
        return;
    }

    scheme_ = base_url.scheme_;
    has_fragment_ = reference.has_fragment_;
    fragment_ = reference.fragment_;

    if (reference.has_authority_) {
        has_authority_ = true;
        has_username_password_ = reference.has_username_password_;
        username_password_ = reference.username_password_;
        authority_ = reference.authority_;
        has_port_ = reference.has_port_;
        port_ = reference.port_;
        path_ = reference.path_;
        has_query_ = reference.has_query_;
        query_ = reference.query_;
        return;
    }

    has_authority_ = base_url.has_authority_;
    has_username_password_ = base_url.has_username_password_;
    username_password_ = base_url.username_password_;
    authority_ = base_url.authority_;
    has_port_ = base_url.has_port_;
    port_ = base_url.port_;

    if (reference.path_.empty()) {
        path_ = base_url.path_;
        has_query_ = reference.has_query_ or base_url.has_query_;
        query_ = reference.has_query_ ? reference.query_ : base_url.query_;
        return;
    }

    has_query_ = reference.has_query_;
    query_ = reference.query_;
    if (reference.path_[0] == '/')
        path_ = RemoveDotSegments(reference.path_);
    else {
        std::string merged_path;
        if (base_url.has_authority_ and base_url.path_.empty())
            merged_path = "/" + reference.path_;
        else {
            const size_t last_slash_pos(base_url.path_.rfind('/'));
            merged_path = (last_slash_pos == std::string::npos) ? reference.path_
                                                                : base_url.path_.substr(0, last_slash_pos + 1) + reference.path_;
        }
        path_ = RemoveDotSegments(merged_path);
    }
}


std::string Url::RemoveDotSegments(const std::string &path) {
    std::string input(path), output;
    while (not input.empty()) {
        if (StringUtil::StartsWith(input, "../"))
            input = input.substr(3);
        else if (StringUtil::StartsWith(input, "./"))
            input = input.substr(2);
        else if (StringUtil::StartsWith(input, "/./"))
            input = input.substr(2);
        else if (input == "/.")
            input = "/";
        else if (StringUtil::StartsWith(input, "/../") or input == "/..") {
            input = (input == "/..") ? "/" : input.substr(3);
            const size_t last_slash_pos(output.rfind('/'));
            output.resize(last_slash_pos == std::string::npos ? 0 : last_slash_pos);
        } else if (input == "." or input == "..")
            input.clear();
        else {
            const size_t next_slash_pos(input.find('/', input[0] == '/' ? 1 : 0));
            output += input.substr(0, next_slash_pos);
            input = (next_slash_pos == std::string::npos) ? "" : input.substr(next_slash_pos);
        }
    }

    return output;
}


bool Url::isValidWebUrl() const {
    return is_valid_ and (scheme_ == "http" or scheme_ == "https") and not getHostname().empty();
}


std::string Url::getHostname() const {
    std::string hostname(authority_);
    if (hostname.length() >= 2 and hostname.front() == '[' and hostname.back() == ']')
        hostname = hostname.substr(1, hostname.length() - 2);
    return StringUtil::ToLower(hostname);
}


unsigned Url::getPortNumber() const {
    unsigned port_number;
    if (not port_.empty() and StringUtil::ToUnsigned(port_, &port_number))
        return port_number;

    if (scheme_ == "http")
        return 80;
    if (scheme_ == "https")
        return 443;
    return 0;
}


std::string Url::getSite() const {
    std::string site(scheme_ + "://");
    if (has_username_password_)
        site += username_password_ + "@";
    site += authority_;
    if (has_port_)
        site += ":" + port_;

    return site;
}


std::string Url::toString() const {
    std::string url;
    if (not scheme_.empty())
        url += scheme_ + ":";
    if (has_authority_) {
        url += "//";
        if (has_username_password_)
            url += username_password_ + "@";
        url += authority_;
        if (has_port_)
            url += ":" + port_;
    }
    url += path_;
    if (has_query_)
        url += "?" + query_;
    if (has_fragment_)
        url += "#" + fragment_;

    return url;
}


void Url::normalise() {
    StringUtil::ToLower(&authority_);
    if (has_authority_ and path_.empty())
        path_ = "/";
}
