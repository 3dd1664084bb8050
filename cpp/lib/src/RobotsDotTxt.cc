/** \file    RobotsDotTxt.cc
 *  \brief   Implementation of class RobotsDotTxt.
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
 *  along with libiViaCore; if not, write to the Free Software Foundation, Inc.,
 *  59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */

#include "RobotsDotTxt.h"
#include <cctype>
#include "StringUtil.h"
#include "TextUtil.h"
#include "util.h"


namespace {


// Replaces all %XX escapes with the bytes they stand for.  Malformed escapes are kept verbatim.
std::string CanonizePath(const std::string &non_canonical_path) {
    std::string canonical_path;
    canonical_path.reserve(non_canonical_path.length());

    for (std::string::const_iterator ch(non_canonical_path.begin()); ch != non_canonical_path.end(); ++ch) {
        if (likely(*ch != '%')) {
            canonical_path += *ch;
            continue;
        }

        if (unlikely(non_canonical_path.end() - ch < 3 or not std::isxdigit(static_cast<unsigned char>(*(ch + 1)))
                     or not std::isxdigit(static_cast<unsigned char>(*(ch + 2))))) {
            canonical_path += '%';
            continue;
        }

        unsigned high_nibble, low_nibble;
        StringUtil::FromHex(*(ch + 1), &high_nibble);
        StringUtil::FromHex(*(ch + 2), &low_nibble);
        canonical_path += static_cast<char>((high_nibble << 4u) | low_nibble);
        ch += 2;
    }

    return canonical_path;
}


// \return The part of "user_agent" preceding the first slash, lowercased.
std::string GetProductToken(const std::string &user_agent) {
    const auto first_slash_pos(user_agent.find('/'));
    return StringUtil::ToLower(first_slash_pos == std::string::npos ? user_agent : user_agent.substr(0, first_slash_pos));
}


enum LineType { BLANK, COMMENT_OR_GARBAGE, USER_AGENT, ALLOW_RULE, DISALLOW_RULE, CRAWL_DELAY, SITEMAP, UNKNOWN_FIELD };


// ParseLine -- break a line from a robots.txt file into its components.  "value" will only have meaning if neither BLANK
//              nor COMMENT_OR_GARBAGE has been returned!  Please note that a line consisting solely of a comment is not
//              BLANK and therefore does not terminate a group.
//
LineType ParseLine(std::string line, std::string * const value) {
    if (line.empty())
        return BLANK;

    const auto hash_pos(line.find('#'));
    if (hash_pos != std::string::npos)
        line.resize(hash_pos);

    line = TextUtil::TrimWhitespace(line);
    const auto colon_pos(line.find(':'));
    if (colon_pos == std::string::npos)
        return COMMENT_OR_GARBAGE;

    *value = TextUtil::TrimWhitespace(line.substr(colon_pos + 1));
    const std::string field_name(StringUtil::ToLower(TextUtil::TrimWhitespace(line.substr(0, colon_pos))));
    if (field_name == "user-agent")
        return USER_AGENT;
    if (field_name == "allow")
        return ALLOW_RULE;
    if (field_name == "disallow")
        return DISALLOW_RULE;
    if (field_name == "crawl-delay")
        return CRAWL_DELAY;
    if (field_name == "sitemap")
        return SITEMAP;

    return UNKNOWN_FIELD;
}


inline bool IsAllDigits(const std::string &s) {
    if (s.empty())
        return false;
    for (const char ch : s) {
        if (not std::isdigit(static_cast<unsigned char>(ch)))
            return false;
    }

    return true;
}


} // unnamed namespace


RobotsDotTxt::Rule::Rule(const RuleType rule_type, const std::string &path_prefix)
    : rule_type_(rule_type), path_prefix_(CanonizePath(path_prefix)) { }


bool RobotsDotTxt::Rule::match(const std::string &canonical_path) const {
    if (path_prefix_ == "*")
        return true;

    return StringUtil::StartsWith(canonical_path, path_prefix_);
}


void RobotsDotTxt::UserAgentDescriptor::addRule(const RuleType rule_type, const std::string &value) {
    // An empty path matches everything and an empty "Disallow:" means that everything is allowed.
    if (unlikely(value.empty())) {
        rules_.emplace_back(ALLOW, "");
        return;
    }

    rules_.emplace_back(rule_type, value);
}


bool RobotsDotTxt::UserAgentDescriptor::isWildCard() const {
    for (const auto &pattern : user_agent_patterns_) {
        if (pattern == "*")
            return true;
    }

    return false;
}


bool RobotsDotTxt::UserAgentDescriptor::match(const std::string &product_token) const {
    for (const auto &pattern : user_agent_patterns_) {
        if (pattern == "*" or product_token.find(StringUtil::ToLower(pattern)) != std::string::npos)
            return true;
    }

    return false;
}


bool RobotsDotTxt::UserAgentDescriptor::accessAllowed(const std::string &canonical_path) const {
    for (const auto &rule : rules_) {
        if (rule.match(canonical_path))
            return rule.getRuleType() == ALLOW;
    }

    return true;
}


std::string RobotsDotTxt::UserAgentDescriptor::toString() const {
    std::string user_agent_descriptor_as_string;

    // User-agent:
    for (const auto &user_agent_pattern : user_agent_patterns_)
        user_agent_descriptor_as_string += "User-agent: " + user_agent_pattern + "\n";

    // Crawl-delay:
    if (has_crawl_delay_)
        user_agent_descriptor_as_string += "Crawl-delay: " + std::to_string(crawl_delay_) + "\n";

    // Rules:
    for (const auto &rule : rules_)
        user_agent_descriptor_as_string += rule.toString() + "\n";

    return user_agent_descriptor_as_string;
}


const RobotsDotTxt::UserAgentDescriptor *RobotsDotTxt::findDescriptor(const std::string &user_agent) const {
    const std::string product_token(GetProductToken(user_agent));
    for (const auto &user_agent_descriptor : user_agent_descriptors_) {
        if (user_agent_descriptor.match(product_token))
            return &user_agent_descriptor;
    }

    return have_wild_card_descriptor_ ? &wild_card_descriptor_ : nullptr;
}


bool RobotsDotTxt::accessAllowed(const std::string &user_agent, const std::string &path_and_query) const {
    const std::string canonical_path(CanonizePath(path_and_query.empty() ? "/" : path_and_query));

    // Always allow access to the robots.txt file:
    if (canonical_path == "/robots.txt")
        return true;

    const UserAgentDescriptor * const user_agent_descriptor(findDescriptor(user_agent));
    return user_agent_descriptor == nullptr ? true : user_agent_descriptor->accessAllowed(canonical_path);
}


bool RobotsDotTxt::accessAllowed(const std::string &user_agent, const Url &url) const {
    std::string path_and_query(url.getPath().empty() ? "/" : url.getPath());
    if (url.hasQuery())
        path_and_query += "?" + url.getQuery();

    return accessAllowed(user_agent, path_and_query);
}


bool RobotsDotTxt::getCrawlDelay(const std::string &user_agent, unsigned * const crawl_delay) const {
    const UserAgentDescriptor * const user_agent_descriptor(findDescriptor(user_agent));
    if (user_agent_descriptor == nullptr or not user_agent_descriptor->hasCrawlDelay())
        return false;

    *crawl_delay = user_agent_descriptor->getCrawlDelay();
    return true;
}


void RobotsDotTxt::reinitialize(const std::string &robots_dot_txt) {
    user_agent_descriptors_.clear();
    have_wild_card_descriptor_ = false;
    wild_card_descriptor_.clear();
    sitemaps_.clear();

    UserAgentDescriptor temp_descriptor;
    auto add_descriptor([this](const UserAgentDescriptor &descriptor) {
        if (descriptor.isWildCard()) {
            if (not have_wild_card_descriptor_) {
                wild_card_descriptor_ = descriptor;
                have_wild_card_descriptor_ = true;
            }
        } else
            user_agent_descriptors_.emplace_back(descriptor);
    });

    enum State { LOOKING_FOR_USER_AGENT, COLLECTING_USER_AGENTS, PARSING_RULES } state(LOOKING_FOR_USER_AGENT);

    std::vector<std::string> lines;
    TextUtil::SplitLines(TextUtil::SanitizeUTF8(robots_dot_txt), &lines);
    for (const auto &line : lines) {
        std::string value;
        const LineType line_type(ParseLine(line, &value));
        switch (line_type) {
        case BLANK:
            if (state == PARSING_RULES)
                add_descriptor(temp_descriptor);
            if (state != LOOKING_FOR_USER_AGENT) {
                temp_descriptor.clear();
                state = LOOKING_FOR_USER_AGENT;
            }
            break;
        case USER_AGENT:
            if (state == PARSING_RULES) {
                add_descriptor(temp_descriptor);
                temp_descriptor.clear();
            }
            temp_descriptor.addUserAgent(CanonizePath(value));
            state = COLLECTING_USER_AGENTS;
            break;
        case ALLOW_RULE:
        case DISALLOW_RULE:
            if (state != LOOKING_FOR_USER_AGENT) {
                temp_descriptor.addRule(line_type == ALLOW_RULE ? ALLOW : DISALLOW, value);
                state = PARSING_RULES;
            }
            break;
        case CRAWL_DELAY:
            if (state != LOOKING_FOR_USER_AGENT) {
                unsigned crawl_delay;
                if (IsAllDigits(value) and StringUtil::ToUnsigned(value, &crawl_delay))
                    temp_descriptor.setCrawlDelay(crawl_delay);
                state = PARSING_RULES;
            }
            break;
        case SITEMAP:
            sitemaps_.emplace_back(value);
            break;
        case COMMENT_OR_GARBAGE:
        case UNKNOWN_FIELD:
            break;
        }
    }

    if (state == PARSING_RULES)
        add_descriptor(temp_descriptor);
}


std::string RobotsDotTxt::toString() const {
    std::string robots_dot_txt_as_string;
    for (const auto &user_agent_descriptor : user_agent_descriptors_) {
        if (not robots_dot_txt_as_string.empty())
            robots_dot_txt_as_string += '\n';
        robots_dot_txt_as_string += user_agent_descriptor.toString();
    }

    if (have_wild_card_descriptor_) {
        if (not robots_dot_txt_as_string.empty())
            robots_dot_txt_as_string += '\n';
        robots_dot_txt_as_string += wild_card_descriptor_.toString();
    }

    for (const auto &sitemap : sitemaps_)
        robots_dot_txt_as_string += "Sitemap: " + sitemap + "\n";

    return robots_dot_txt_as_string;
}
