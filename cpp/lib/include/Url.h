/** \file    Url.h
 *  \brief   Declaration of class Url, a parser and resolver for URL references.
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

#ifndef URL_H
#define URL_H


#include <string>


/** \class  Url
 *  \brief  A class representing a URL (or more accurately: a URL reference).
 *
 *  The reference is split into its components as described in RFC 3986.  Relative references can be resolved against
 *  a base URL.  Resolution follows RFC 3986, section 5.2 in its non-strict form, i.e. a reference that repeats the
 *  base's scheme without an authority is treated as relative and a reference with its own authority is taken as is,
 *  without dot-segment removal.  Leading and trailing whitespace and control characters
 *  as well as embedded tabs and line breaks are removed before parsing.
 */
class Url {
    std::string scheme_;            // Always lowercase.
    std::string username_password_;
    std::string authority_;         // The host as written, IPv6 literals including the brackets.
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
    bool has_authority_, has_username_password_, has_port_, has_query_, has_fragment_;
    bool is_valid_;
public:
    Url(): has_authority_(false), has_username_password_(false), has_port_(false), has_query_(false), has_fragment_(false),
           is_valid_(false) { }

    explicit Url(const std::string &url);

    /** \brief  Creates an absolute URL by resolving "url" against "base_url".
     *  \note   If "base_url" is not absolute, "url" is used unchanged.
     */
    Url(const std::string &url, const Url &base_url);

    /** \return False if the reference could not be split into components, e.g. if an authority contains an unterminated
     *          IPv6 literal or a non-numeric port. */
    bool isValid() const { return is_valid_; }

    bool isAbsolute() const { return not scheme_.empty(); }

    /** \return True if the scheme is "http" or "https" and there is a non-empty host. */
    bool isValidWebUrl() const;

    const std::string &getScheme() const { return scheme_; }
    const std::string &getUsernamePassword() const { return username_password_; }

    /** \return The host as it appeared in the reference. */
    const std::string &getAuthority() const { return authority_; }

    /** \return The lowercased host with the brackets around IPv6 literals removed. */
    std::string getHostname() const;

    const std::string &getPort() const { return port_; }

    /** \return The explicit port or, if none was given, the default port of the scheme (0 if unknown). */
    unsigned getPortNumber() const;

    const std::string &getPath() const { return path_; }
    const std::string &getQuery() const { return query_; }
    const std::string &getFragment() const { return fragment_; }
    bool hasAuthority() const { return has_authority_; }
    bool hasQuery() const { return has_query_; }
    bool hasFragment() const { return has_fragment_; }

    /** \return The recombined URL reference. */
    std::string toString() const;

    /** \return The scheme, a colon, two slashes and the complete authority (user info, host and port) as written. */
    std::string getSite() const;

    /** \return The URL of the robots.txt file for the site of this URL. */
    std::string getRobotsDotTxtUrl() const { return getSite() + "/robots.txt"; }

    bool isRobotsDotTxtUrl() const { return path_ == "/robots.txt"; }

    /** \brief  Lowercases the host and replaces an empty path with "/" on URLs with an authority. */
    void normalise();

    /** \brief  Implements "remove_dot_segments" as described in RFC 3986, section 5.2.4. */
    static std::string RemoveDotSegments(const std::string &path);
private:
    void parse(const std::string &url);
    bool parseAuthority(const std::string &authority);
    void resolve(const Url &reference, const Url &base_url);
};


inline bool operator==(const Url &lhs, const Url &rhs) { return lhs.toString() == rhs.toString(); }


#endif // ifndef URL_H
