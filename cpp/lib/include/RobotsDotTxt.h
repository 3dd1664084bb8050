/** \file    RobotsDotTxt.h
 *  \brief   Declaration of class RobotsDotTxt.
 *  \author  Dr. Johannes Ruscheinski
 */

/*
 *  Copyright 2002-2009 Project iVia.
 *  Copyright 2002-2009 The Regents of The University of California.
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as
 *  published by the Free Software Foundation; either version 2 of the License,
 *  or (at your option) any later version.
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

#ifndef ROBOTS_DOT_TXT_H
#define ROBOTS_DOT_TXT_H


#include <string>
#include <vector>
#include "Url.h"


/** \class  RobotsDotTxt
 *  \brief  Attempts to implement the behaviour as specified by http://www.robotstxt.org/wc/norobots-rfc.html.
 *
 *  A group of "User-agent" lines followed by "Allow", "Disallow" and "Crawl-delay" lines forms a user agent descriptor.
 *  Rules preceding the first "User-agent" line are ignored, as is a group of "User-agent" lines that is terminated by a
 *  blank line before any rule has been seen.  The first group that lists "*" is consulted only if no other group
 *  matches.  Within a group the first matching rule wins.  "Sitemap" lines may appear anywhere.
 */
class RobotsDotTxt {
    enum RuleType { ALLOW, DISALLOW };

    class Rule {
        RuleType rule_type_;
        std::string path_prefix_; // Percent-decoded.
    public:
        Rule(const RuleType rule_type, const std::string &path_prefix);
        bool match(const std::string &canonical_path) const;
        RuleType getRuleType() const { return rule_type_; }
        std::string toString() const { return (rule_type_ == ALLOW ? "Allow: " : "Disallow: ") + path_prefix_; }
    };

    class UserAgentDescriptor {
        std::vector<std::string> user_agent_patterns_;
        std::vector<Rule> rules_;
        bool has_crawl_delay_;
        unsigned crawl_delay_;
    public:
        UserAgentDescriptor(): has_crawl_delay_(false), crawl_delay_(0) { }
        void addUserAgent(const std::string &user_agent_pattern) { user_agent_patterns_.emplace_back(user_agent_pattern); }
        void addRule(const RuleType rule_type, const std::string &value);
        void setCrawlDelay(const unsigned new_crawl_delay) { has_crawl_delay_ = true; crawl_delay_ = new_crawl_delay; }
        bool isWildCard() const;

        /** \param product_token  The lowercased part of our user agent string that precedes the first slash. */
        bool match(const std::string &product_token) const;

        /** \return True unless the first rule that matches "canonical_path" is a DISALLOW rule. */
        bool accessAllowed(const std::string &canonical_path) const;

        bool hasCrawlDelay() const { return has_crawl_delay_; }
        unsigned getCrawlDelay() const { return crawl_delay_; }
        bool empty() const { return user_agent_patterns_.empty(); }
        void clear() { user_agent_patterns_.clear(); rules_.clear(); has_crawl_delay_ = false; crawl_delay_ = 0; }
        std::string toString() const;
    };

    std::vector<UserAgentDescriptor> user_agent_descriptors_;
    bool have_wild_card_descriptor_;
    UserAgentDescriptor wild_card_descriptor_;
    std::vector<std::string> sitemaps_;
public:
    /** \brief  Constructs a RobotsDotTxt object that allows everything. */
    RobotsDotTxt(): have_wild_card_descriptor_(false) { }

    /** \brief  Constructs a RobotsDotTxt object.
     *  \param  robots_dot_txt  The contents of a Web server's "robots.txt" file.
     */
    explicit RobotsDotTxt(const std::string &robots_dot_txt) { reinitialize(robots_dot_txt); }

    /** \brief   Checks access rights for a given user-agent and path.
     *  \param   user_agent      A string used by the caller to identify itself to the Web server whose robots.txt file the
     *                           current object represents.
     *  \param   path_and_query  The path we'd like to access, possibly followed by a question mark and a query.
     *  \return  True if "user_agent" is allowed to access "path_and_query", else false.
     *  \note    The pattern matching for the user agent is case insensitive!
     */
    bool accessAllowed(const std::string &user_agent, const std::string &path_and_query) const;

    /** \brief   Checks access rights for a given user-agent and URL.
     *  \param   url  A URL on the same site as this robots.txt file.
     */
    bool accessAllowed(const std::string &user_agent, const Url &url) const;

    /** \brief  Retrieves the crawl delay that applies to "user_agent".
     *  \return False if no crawl delay has been specified for "user_agent".
     */
    bool getCrawlDelay(const std::string &user_agent, unsigned * const crawl_delay) const;

    /** \return The URLs of all "Sitemap" lines in document order. */
    const std::vector<std::string> &getSitemaps() const { return sitemaps_; }

    /** \brief  Resets the access rules based on a new robots.txt document.
     *  \param  robots_dot_txt  The contents of a Web server's "robots.txt" file.
     */
    void reinitialize(const std::string &robots_dot_txt);

    std::string toString() const;
private:
    const UserAgentDescriptor *findDescriptor(const std::string &user_agent) const;
};


#endif // ifndef ROBOTS_DOT_TXT_H
