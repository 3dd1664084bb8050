/** \file    HtmlParser.cc
 *  \brief   Implementation of an HTML parser class.
 *  \author  Dr. Johannes Ruscheinski
 */

/*
 *  Copyright 2002-2007 Dr. Johannes Ruscheinski.
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

#include "HtmlParser.h"
#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <cctype>
#include "StringUtil.h"
#include "TextUtil.h"
#include "util.h"


namespace {


struct EntityMapEntry {
    const char *entity_;
    uint32_t code_point_;
    bool may_omit_semicolon_; // Legacy references like "&amp" or "&copy" that browsers recognise without a semicolon.
} entity_map[] = {
    { "quot",   '"',   true  },
    { "apos",   '\'',  false },
    { "amp",    '&',   true  },
    { "lt",     '<',   true  },
    { "gt",     '>',   true  },
    { "nbsp",   160u,  true  },
    { "iexcl",  161u,  true  },
    { "cent",   162u,  true  },
    { "pound",  163u,  true  },
    { "curren", 164u,  true  },
    { "yen",    165u,  true  },
    { "brvbar", 166u,  true  },
    { "sect",   167u,  true  },
    { "uml",    168u,  true  },
    { "copy",   169u,  true  },
    { "ordf",   170u,  true  },
    { "laquo",  171u,  true  },
    { "not",    172u,  true  },
    { "shy",    173u,  true  },
    { "reg",    174u,  true  },
    { "macr",   175u,  true  },
    { "deg",    176u,  true  },
    { "plusmn", 177u,  true  },
    { "sup2",   178u,  true  },
    { "sup3",   179u,  true  },
    { "acute",  180u,  true  },
    { "micro",  181u,  true  },
    { "para",   182u,  true  },
    { "middot", 183u,  true  },
    { "cedil",  184u,  true  },
    { "sup1",   185u,  true  },
    { "ordm",   186u,  true  },
    { "raquo",  187u,  true  },
    { "frac14", 188u,  true  },
    { "frac12", 189u,  true  },
    { "frac34", 190u,  true  },
    { "iquest", 191u,  true  },
    { "Agrave", 192u,  true  },
    { "Aacute", 193u,  true  },
    { "Acirc",  194u,  true  },
    { "Atilde", 195u,  true  },
    { "Auml",   196u,  true  },
    { "Aring",  197u,  true  },
    { "AElig",  198u,  true  },
    { "Ccedil", 199u,  true  },
    { "Egrave", 200u,  true  },
    { "Eacute", 201u,  true  },
    { "Ecirc",  202u,  true  },
    { "Euml",   203u,  true  },
    { "Igrave", 204u,  true  },
    { "Iacute", 205u,  true  },
    { "Icirc",  206u,  true  },
    { "Iuml",   207u,  true  },
    { "ETH",    208u,  true  },
    { "Ntilde", 209u,  true  },
    { "Ograve", 210u,  true  },
    { "Oacute", 211u,  true  },
    { "Ocirc",  212u,  true  },
    { "Otilde", 213u,  true  },
    { "Ouml",   214u,  true  },
    { "times",  215u,  true  },
    { "Oslash", 216u,  true  },
    { "Ugrave", 217u,  true  },
    { "Uacute", 218u,  true  },
    { "Ucirc",  219u,  true  },
    { "Uuml",   220u,  true  },
    { "Yacute", 221u,  true  },
    { "THORN",  222u,  true  },
    { "szlig",  223u,  true  },
    { "agrave", 224u,  true  },
    { "aacute", 225u,  true  },
    { "acirc",  226u,  true  },
    { "atilde", 227u,  true  },
    { "auml",   228u,  true  },
    { "aring",  229u,  true  },
    { "aelig",  230u,  true  },
    { "ccedil", 231u,  true  },
    { "egrave", 232u,  true  },
    { "eacute", 233u,  true  },
    { "ecirc",  234u,  true  },
    { "euml",   235u,  true  },
    { "igrave", 236u,  true  },
    { "iacute", 237u,  true  },
    { "icirc",  238u,  true  },
    { "iuml",   239u,  true  },
    { "eth",    240u,  true  },
    { "ntilde", 241u,  true  },
    { "ograve", 242u,  true  },
    { "oacute", 243u,  true  },
    { "ocirc",  244u,  true  },
    { "otilde", 245u,  true  },
    { "ouml",   246u,  true  },
    { "divide", 247u,  true  },
    { "oslash", 248u,  true  },
    { "ugrave", 249u,  true  },
    { "uacute", 250u,  true  },
    { "ucirc",  251u,  true  },
    { "uuml",   252u,  true  },
    { "yacute", 253u,  true  },
    { "thorn",  254u,  true  },
    { "yuml",   255u,  true  },
    { "OElig",  338u,  false },
    { "oelig",  339u,  false },
    { "Scaron", 352u,  false },
    { "scaron", 353u,  false },
    { "Yuml",   376u,  false },
    { "fnof",   402u,  false },
    { "circ",   710u,  false },
    { "tilde",  732u,  false },
    { "ensp",   8194u, false },
    { "emsp",   8195u, false },
    { "thinsp", 8201u, false },
    { "zwnj",   8204u, false },
    { "zwj",    8205u, false },
    { "lrm",    8206u, false },
    { "rlm",    8207u, false },
    { "ndash",  8211u, false },
    { "mdash",  8212u, false },
    { "lsquo",  8216u, false },
    { "rsquo",  8217u, false },
    { "sbquo",  8218u, false },
    { "ldquo",  8220u, false },
    { "rdquo",  8221u, false },
    { "bdquo",  8222u, false },
    { "dagger", 8224u, false },
    { "Dagger", 8225u, false },
    { "bull",   8226u, false },
    { "hellip", 8230u, false },
    { "permil", 8240u, false },
    { "prime",  8242u, false },
    { "Prime",  8243u, false },
    { "lsaquo", 8249u, false },
    { "rsaquo", 8250u, false },
    { "euro",   8364u, false },
    { "trade",  8482u, false },
    { "larr",   8592u, false },
    { "uarr",   8593u, false },
    { "rarr",   8594u, false },
    { "darr",   8595u, false },
    { "harr",   8596u, false },
    { "minus",  8722u, false },
    { "infin",  8734u, false },
    { "asymp",  8776u, false },
    { "ne",     8800u, false },
    { "le",     8804u, false },
    { "ge",     8805u, false },
    { "hearts", 9829u, false },
};


const EntityMapEntry *FindEntity(const std::string &entity) {
    static std::unordered_map<std::string, const EntityMapEntry *> entity_name_to_entry_map;
    static const bool initialised([]() {
        for (const auto &entry : entity_map)
            entity_name_to_entry_map.emplace(entry.entity_, &entry);
        return true;
    }());
    (void)initialised;

    const auto name_and_entry(entity_name_to_entry_map.find(entity));
    return name_and_entry == entity_name_to_entry_map.cend() ? nullptr : name_and_entry->second;
}


// Browsers interpret numeric references in the C1 range as Windows-1252.
const uint32_t WINDOWS_1252_C1_CODE_POINTS[] = {
    0x20ACu, 0x0081u, 0x201Au, 0x0192u, 0x201Eu, 0x2026u, 0x2020u, 0x2021u,
    0x02C6u, 0x2030u, 0x0160u, 0x2039u, 0x0152u, 0x008Du, 0x017Du, 0x008Fu,
    0x0090u, 0x2018u, 0x2019u, 0x201Cu, 0x201Du, 0x2022u, 0x2013u, 0x2014u,
    0x02DCu, 0x2122u, 0x0161u, 0x203Au, 0x0153u, 0x009Du, 0x017Eu, 0x0178u,
};


uint32_t MapNumericCharacterReference(const uint32_t code_point) {
    if (code_point == 0)
        return TextUtil::REPLACEMENT_CHARACTER;
    if (code_point >= 0x80u and code_point <= 0x9Fu)
        return WINDOWS_1252_C1_CODE_POINTS[code_point - 0x80u];
    return code_point; // UTF32ToUTF8() takes care of surrogates and out-of-range values.
}


inline bool IsAsciiLetter(const int ch) {
    return ('A' <= ch and ch <= 'Z') or ('a' <= ch and ch <= 'z');
}


inline bool IsAsciiLetterOrDigit(const int ch) {
    return ('A' <= ch and ch <= 'Z') or ('a' <= ch and ch <= 'z') or ('0' <= ch and ch <= '9');
}


inline bool IsHtmlSpace(const char ch) {
    return ch == ' ' or ch == '\t' or ch == '\n' or ch == '\r' or ch == '\f' or ch == '\v';
}


} // unnamed namespace


bool HtmlParser::AttributeMap::insert(const std::string &name, const std::string &value) {
    if (find(name) != end())
        return false;

    name_value_pairs_.emplace_back(name, value);
    return true;
}


std::string HtmlParser::AttributeMap::get(const std::string &name, const std::string &default_value) const {
    const auto name_and_value(find(name));
    return name_and_value == end() ? default_value : name_and_value->second;
}


HtmlParser::AttributeMap::const_iterator HtmlParser::AttributeMap::find(const std::string &name) const {
    return std::find_if(name_value_pairs_.cbegin(), name_value_pairs_.cend(),
                        [&name](const std::pair<std::string, std::string> &name_and_value) { return name_and_value.first == name; });
}


// HtmlParser::AttributeMap::toString -- Construct a string representation of an attribute map.
//
std::string HtmlParser::AttributeMap::toString() const {
    std::string result;
    for (const auto &name_and_value : name_value_pairs_)
        result += " " + name_and_value.first + "=\"" + name_and_value.second + "\"";

    return result;
}


// HtmlParser::Chunk::toString -- Construct a string representation of a chunk.
//
std::string HtmlParser::Chunk::toString() const {
    switch (type_) {
    case OPENING_TAG:
        return "<" + text_ + (attribute_map_ == nullptr ? "" : attribute_map_->toString()) + (is_self_closing_ ? "/>" : ">");
    case CLOSING_TAG:
        return "</" + text_ + ">";
    case TEXT:
        return text_;
    case COMMENT:
        return "<!--" + text_ + "-->";
    case END_OF_STREAM:
        return "";
    }

    throw std::runtime_error("in HtmlParser::Chunk::toString: cannot convert an unknown chunk type to a string!");
}


HtmlParser::HtmlParser(const std::string &input_string, const unsigned chunk_mask)
    : input_(input_string), pos_(0), chunk_mask_(chunk_mask)
{
}


std::string HtmlParser::ChunkTypeToString(const unsigned chunk_type) {
    switch (chunk_type) {
    case OPENING_TAG:
        return "OPENING_TAG";
    case CLOSING_TAG:
        return "CLOSING_TAG";
    case TEXT:
        return "TEXT";
    case COMMENT:
        return "COMMENT";
    case END_OF_STREAM:
        return "END_OF_STREAM";
    default:
        throw std::runtime_error("in HtmlParser::ChunkTypeToString: unknown chunk type " + std::to_string(chunk_type) + "!");
    }
}


std::string HtmlParser::DecodeEntities(const std::string &text, const bool in_attribute_value) {
    std::string decoded_text;
    decoded_text.reserve(text.size());

    size_t pos(0);
    for (;;) {
        const size_t ampersand_pos(text.find('&', pos));
        if (ampersand_pos == std::string::npos) {
            decoded_text.append(text, pos, std::string::npos);
            return decoded_text;
        }
        decoded_text.append(text, pos, ampersand_pos - pos);
        pos = ampersand_pos + 1;

        // Numeric reference?
        if (pos < text.size() and text[pos] == '#') {
            size_t digits_start(pos + 1);
            const bool hex(digits_start < text.size() and (text[digits_start] == 'x' or text[digits_start] == 'X'));
            if (hex)
                ++digits_start;

            uint32_t code_point(0);
            size_t digits_end(digits_start);
            while (digits_end < text.size()
                   and (hex ? std::isxdigit(static_cast<unsigned char>(text[digits_end]))
                       : std::isdigit(static_cast<unsigned char>(text[digits_end]))))
            {
                unsigned digit;
                StringUtil::FromHex(text[digits_end], &digit);
                if (code_point <= 0x10FFFFu)
                    code_point = code_point * (hex ? 16u : 10u) + digit;
                ++digits_end;
            }

            if (digits_end == digits_start) { // Not a reference after all.
                decoded_text += '&';
                continue;
            }

            pos = digits_end;
            if (pos < text.size() and text[pos] == ';')
                ++pos;
            decoded_text += TextUtil::UTF32ToUTF8(MapNumericCharacterReference(code_point));
            continue;
        }

        size_t name_end(pos);
        while (name_end < text.size() and IsAsciiLetterOrDigit(text[name_end]))
            ++name_end;
        const std::string entity_name(text.substr(pos, name_end - pos));

        if (name_end < text.size() and text[name_end] == ';') {
            const EntityMapEntry * const entry(FindEntity(entity_name));
            if (entry != nullptr) {
                decoded_text += TextUtil::UTF32ToUTF8(entry->code_point_);
                pos = name_end + 1;
                continue;
            }
        }

        // Look for the longest legacy reference that is a prefix of "entity_name":
        if (not in_attribute_value) {
            bool found(false);
            for (size_t length(entity_name.length()); length >= 2; --length) {
                const EntityMapEntry * const entry(FindEntity(entity_name.substr(0, length)));
                if (entry != nullptr and entry->may_omit_semicolon_) {
                    decoded_text += TextUtil::UTF32ToUTF8(entry->code_point_);
                    pos += length;
                    found = true;
                    break;
                }
            }
            if (found)
                continue;
        }

        decoded_text += '&';
    }
}


void HtmlParser::report(const unsigned chunk_type, const std::string &text, const AttributeMap * const attribute_map,
                        const bool is_self_closing)
{
    if (not (chunk_mask_ & chunk_type))
        return;

    Chunk chunk(chunk_type, text, attribute_map, is_self_closing);
    notify(chunk);
}


// HtmlParser::atMarkupStart -- returns true if "pos_" points at a '<' that starts a tag, a comment or a declaration.
//
bool HtmlParser::atMarkupStart() const {
    if (input_[pos_] != '<' or pos_ + 1 >= input_.size())
        return false;

    const char next_ch(input_[pos_ + 1]);
    return IsAsciiLetter(next_ch) or next_ch == '!' or next_ch == '?' or next_ch == '/';
}


void HtmlParser::skipWhiteSpace() {
    while (pos_ < input_.size() and IsHtmlSpace(input_[pos_]))
        ++pos_;
}


void HtmlParser::parseText() {
    const size_t text_start(pos_);
    do
        ++pos_;
    while (pos_ < input_.size() and not atMarkupStart());

    report(TEXT, DecodeEntities(input_.substr(text_start, pos_ - text_start)));
}


// HtmlParser::skipComment -- assumes that at this point we are looking at "<!--" and skips over all input up to and
//                            including "-->".
//
void HtmlParser::skipComment() {
    const size_t comment_start(pos_ + 4);
    const size_t comment_end(input_.find("-->", comment_start));
    if (comment_end == std::string::npos) {
        report(COMMENT, input_.substr(comment_start));
        pos_ = input_.size();
        return;
    }

    report(COMMENT, input_.substr(comment_start, comment_end - comment_start));
    pos_ = comment_end + 3;
}


// HtmlParser::skipDeclaration -- skips over DOCTYPEs, processing instructions and the like.  The contents of CDATA
//                                sections are reported as text.
//
void HtmlParser::skipDeclaration() {
    if (input_.compare(pos_, 9, "<![CDATA[") == 0) {
        const size_t cdata_start(pos_ + 9);
        const size_t cdata_end(input_.find("]]>", cdata_start));
        if (cdata_end == std::string::npos) {
            report(TEXT, input_.substr(cdata_start));
            pos_ = input_.size();
        } else {
            report(TEXT, input_.substr(cdata_start, cdata_end - cdata_start));
            pos_ = cdata_end + 3;
        }
        return;
    }

    const size_t closing_angle_bracket_pos(input_.find('>', pos_));
    pos_ = (closing_angle_bracket_pos == std::string::npos) ? input_.size() : closing_angle_bracket_pos + 1;
}


std::string HtmlParser::extractTagName() {
    if (pos_ >= input_.size() or not IsAsciiLetter(input_[pos_]))
        return ""; // let's hope the caller deals with the error reporting!

    std::string tag_name;
    while (pos_ < input_.size() and not IsHtmlSpace(input_[pos_]) and input_[pos_] != '/' and input_[pos_] != '>')
        tag_name += input_[pos_++];

    return StringUtil::ToLower(&tag_name);
}


// HtmlParser::extractAttribute -- assumes that "pos_" points at the first character of an attribute name.  Always
//                                 consumes at least one character.
//
bool HtmlParser::extractAttribute(std::string * const attribute_name, std::string * const attribute_value) {
    attribute_name->clear();
    attribute_value->clear();

    *attribute_name += input_[pos_++];
    while (pos_ < input_.size() and not IsHtmlSpace(input_[pos_]) and input_[pos_] != '=' and input_[pos_] != '>'
           and input_[pos_] != '/')
        *attribute_name += input_[pos_++];
    StringUtil::ToLower(attribute_name);

    const size_t pos_after_name(pos_);
    skipWhiteSpace();
    if (pos_ >= input_.size() or input_[pos_] != '=') {
        pos_ = pos_after_name;
        return false;
    }

    ++pos_; // Skip over the equal sign.
    skipWhiteSpace();
    if (pos_ >= input_.size())
        return true;

    const char delimiter(input_[pos_]);
    if (delimiter == '"' or delimiter == '\'') {
        const size_t value_start(pos_ + 1);
        const size_t value_end(input_.find(delimiter, value_start));
        if (value_end == std::string::npos) {
            *attribute_value = DecodeEntities(input_.substr(value_start), /* in_attribute_value = */ true);
            pos_ = input_.size();
        } else {
            *attribute_value = DecodeEntities(input_.substr(value_start, value_end - value_start),
                                              /* in_attribute_value = */ true);
            pos_ = value_end + 1;
        }
    } else { // unquoted attribute_value
        const size_t value_start(pos_);
        while (pos_ < input_.size() and not IsHtmlSpace(input_[pos_]) and input_[pos_] != '>')
            ++pos_;
        *attribute_value = DecodeEntities(input_.substr(value_start, pos_ - value_start), /* in_attribute_value = */ true);
    }

    return true;
}


// HtmlParser::parseRawText -- reports everything up to the closing tag of "tag_name" as a single TEXT chunk.
//
void HtmlParser::parseRawText(const std::string &tag_name) {
    const std::string closing_tag_prefix("</" + tag_name);
    size_t search_pos(pos_), closing_tag_pos(std::string::npos);
    while ((closing_tag_pos = StringUtil::FindCaseInsensitive(input_, closing_tag_prefix, search_pos)) != std::string::npos) {
        const size_t after_name_pos(closing_tag_pos + closing_tag_prefix.length());
        if (after_name_pos >= input_.size() or IsHtmlSpace(input_[after_name_pos]) or input_[after_name_pos] == '/'
            or input_[after_name_pos] == '>')
            break;
        search_pos = after_name_pos;
    }

    const size_t text_end(closing_tag_pos == std::string::npos ? input_.size() : closing_tag_pos);
    if (text_end > pos_)
        report(TEXT, input_.substr(pos_, text_end - pos_));
    pos_ = text_end;

    if (closing_tag_pos != std::string::npos) {
        const size_t closing_angle_bracket_pos(input_.find('>', closing_tag_pos));
        pos_ = (closing_angle_bracket_pos == std::string::npos) ? input_.size() : closing_angle_bracket_pos + 1;
    }
    report(CLOSING_TAG, tag_name);
}


// HtmlParser::parseTag -- assumes that "pos_" points at the '<' of an opening or closing tag.
//
void HtmlParser::parseTag() {
    ++pos_; // Skip over '<'.

    const bool is_end_tag(input_[pos_] == '/');
    if (is_end_tag)
        ++pos_;

    const std::string tag_name(extractTagName());
    if (unlikely(tag_name.empty() or is_end_tag)) {
        const size_t closing_angle_bracket_pos(input_.find('>', pos_));
        if (closing_angle_bracket_pos == std::string::npos) {
            pos_ = input_.size();
            return;
        }
        pos_ = closing_angle_bracket_pos + 1;
        if (not tag_name.empty())
            report(CLOSING_TAG, tag_name);
        return;
    }

    AttributeMap attribute_map;
    bool is_self_closing(false);
    for (;;) {
        skipWhiteSpace();
        if (unlikely(pos_ >= input_.size()))
            return; // A tag that is cut off by the end of the input is dropped.

        if (input_[pos_] == '>') {
            ++pos_;
            break;
        }

        if (input_[pos_] == '/') {
            ++pos_;
            if (pos_ < input_.size() and input_[pos_] == '>') {
                is_self_closing = true;
                ++pos_;
                break;
            }
            continue;
        }

        std::string attribute_name, attribute_value;
        extractAttribute(&attribute_name, &attribute_value);
        attribute_map.insert(attribute_name, attribute_value);
    }

    report(OPENING_TAG, tag_name, &attribute_map, is_self_closing);
    if ((tag_name == "script" or tag_name == "style") and not is_self_closing)
        parseRawText(tag_name);
}


void HtmlParser::parse() {
    while (pos_ < input_.size()) {
        if (not atMarkupStart())
            parseText();
        else if (input_.compare(pos_, 4, "<!--") == 0)
            skipComment();
        else if (input_[pos_ + 1] == '!' or input_[pos_ + 1] == '?')
            skipDeclaration();
        else
            parseTag();
    }

    report(END_OF_STREAM, "");
}
