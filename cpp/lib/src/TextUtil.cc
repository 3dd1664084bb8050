/** \file    TextUtil.cc
 *  \brief   Implementation of UTF-8 text related utility functions.
 *  \author  Dr. Johannes Ruscheinski
 */

/*
 *  Copyright 2003-2009 Project iVia.
 *  Copyright 2003-2009 The Regents of The University of California.
 *  Copyright 2015-2021 Universitätsbibliothek Tübingen.
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
#include "TextUtil.h"
#include "util.h"


namespace TextUtil {


std::string UTF32ToUTF8(uint32_t code_point) {
    if (unlikely((code_point >= 0xD800u and code_point <= 0xDFFFu) or code_point > 0x10FFFFu))
        code_point = REPLACEMENT_CHARACTER;

    std::string utf8;
    if (code_point <= 0x7Fu)
        utf8 += static_cast<char>(code_point);
    else if (code_point <= 0x7FFu) {
        utf8 += static_cast<char>(0b11000000u | (code_point >> 6u));
        utf8 += static_cast<char>(0b10000000u | (code_point & 0b00111111u));
    } else if (code_point <= 0xFFFFu) {
        utf8 += static_cast<char>(0b11100000u | (code_point >> 12u));
        utf8 += static_cast<char>(0b10000000u | ((code_point >> 6u) & 0b00111111u));
        utf8 += static_cast<char>(0b10000000u | (code_point & 0b00111111u));
    } else {
        utf8 += static_cast<char>(0b11110000u | (code_point >> 18u));
        utf8 += static_cast<char>(0b10000000u | ((code_point >> 12u) & 0b00111111u));
        utf8 += static_cast<char>(0b10000000u | ((code_point >> 6u) & 0b00111111u));
        utf8 += static_cast<char>(0b10000000u | (code_point & 0b00111111u));
    }

    return utf8;
}


uint32_t GetNextCodePoint(const std::string &utf8_string, size_t * const pos) {
    const unsigned char lead(static_cast<unsigned char>(utf8_string[*pos]));
    ++*pos;
    if (lead <= 0x7Fu)
        return lead;

    unsigned continuation_count;
    uint32_t code_point;
    unsigned char lower_bound(0x80u), upper_bound(0xBFu); // Allowed range for the first continuation byte.
    if (lead >= 0xC2u and lead <= 0xDFu) {
        continuation_count = 1;
        code_point = lead & 0x1Fu;
    } else if (lead >= 0xE0u and lead <= 0xEFu) {
        continuation_count = 2;
        code_point = lead & 0x0Fu;
        if (lead == 0xE0u)
            lower_bound = 0xA0u; // overlong
        else if (lead == 0xEDu)
            upper_bound = 0x9Fu; // surrogates
    } else if (lead >= 0xF0u and lead <= 0xF4u) {
        continuation_count = 3;
        code_point = lead & 0x07u;
        if (lead == 0xF0u)
            lower_bound = 0x90u; // overlong
        else if (lead == 0xF4u)
            upper_bound = 0x8Fu; // > U+10FFFF
    } else
        return REPLACEMENT_CHARACTER;

    for (unsigned i(0); i < continuation_count; ++i) {
        if (*pos >= utf8_string.size())
            return REPLACEMENT_CHARACTER;
        const unsigned char continuation_byte(static_cast<unsigned char>(utf8_string[*pos]));
        if (continuation_byte < lower_bound or continuation_byte > upper_bound)
            return REPLACEMENT_CHARACTER;
        code_point = (code_point << 6u) | (continuation_byte & 0x3Fu);
        ++*pos;
        lower_bound = 0x80u, upper_bound = 0xBFu;
    }

    return code_point;
}


std::string SanitizeUTF8(const std::string &raw_bytes) {
    std::string sanitized_string;
    sanitized_string.reserve(raw_bytes.size());

    size_t pos(0);
    while (pos < raw_bytes.size()) {
        const size_t start(pos);
        const uint32_t code_point(GetNextCodePoint(raw_bytes, &pos));
        if (code_point == REPLACEMENT_CHARACTER)
            sanitized_string += UTF32ToUTF8(REPLACEMENT_CHARACTER);
        else
            sanitized_string.append(raw_bytes, start, pos - start);
    }

    return sanitized_string;
}


bool IsValidUTF8(const std::string &utf8_candidate) {
    size_t pos(0);
    while (pos < utf8_candidate.size()) {
        const size_t start(pos);
        if (GetNextCodePoint(utf8_candidate, &pos) == REPLACEMENT_CHARACTER) {
            // A literal U+FFFD is fine:
            if (utf8_candidate.compare(start, 3, "\xEF\xBF\xBD") != 0)
                return false;
        }
    }

    return true;
}


size_t UTF8Length(const std::string &utf8_string) {
    size_t length(0), pos(0);
    while (pos < utf8_string.size()) {
        GetNextCodePoint(utf8_string, &pos);
        ++length;
    }

    return length;
}


std::string &UTF8Truncate(std::string * const utf8_string, const size_t max_length) {
    size_t codepoint_count(0), pos(0);
    while (codepoint_count < max_length and pos < utf8_string->size()) {
        GetNextCodePoint(*utf8_string, &pos);
        ++codepoint_count;
    }
    utf8_string->resize(pos);

    return *utf8_string;
}


bool IsWhitespace(const uint32_t code_point) {
    if (code_point <= 0x20u)
        return code_point == 0x20u or (code_point >= 0x09u and code_point <= 0x0Du) or (code_point >= 0x1Cu and code_point <= 0x1Fu);
    if (code_point < 0x85u)
        return false;

    switch (code_point) {
    case 0x0085u:
    case 0x00A0u:
    case 0x1680u:
    case 0x2028u:
    case 0x2029u:
    case 0x202Fu:
    case 0x205Fu:
    case 0x3000u:
        return true;
    default:
        return code_point >= 0x2000u and code_point <= 0x200Au;
    }
}


std::string TrimWhitespace(const std::string &utf8_string) {
    size_t first_non_whitespace(std::string::npos), end_of_last_non_whitespace(0);
    size_t pos(0);
    while (pos < utf8_string.size()) {
        const size_t start(pos);
        if (not IsWhitespace(GetNextCodePoint(utf8_string, &pos))) {
            if (first_non_whitespace == std::string::npos)
                first_non_whitespace = start;
            end_of_last_non_whitespace = pos;
        }
    }

    if (first_non_whitespace == std::string::npos)
        return "";
    return utf8_string.substr(first_non_whitespace, end_of_last_non_whitespace - first_non_whitespace);
}


std::string CollapseAndTrimWhitespace(const std::string &utf8_string) {
    std::string collapsed_string;
    collapsed_string.reserve(utf8_string.size());

    bool pending_space(false);
    size_t pos(0);
    while (pos < utf8_string.size()) {
        const size_t start(pos);
        if (IsWhitespace(GetNextCodePoint(utf8_string, &pos)))
            pending_space = not collapsed_string.empty();
        else {
            if (pending_space) {
                collapsed_string += ' ';
                pending_space = false;
            }
            collapsed_string.append(utf8_string, start, pos - start);
        }
    }

    return collapsed_string;
}


size_t CountWords(const std::string &utf8_string) {
    size_t word_count(0);
    bool in_word(false);
    size_t pos(0);
    while (pos < utf8_string.size()) {
        if (IsWhitespace(GetNextCodePoint(utf8_string, &pos)))
            in_word = false;
        else if (not in_word) {
            in_word = true;
            ++word_count;
        }
    }

    return word_count;
}


namespace {


inline bool IsLineBoundary(const uint32_t code_point) {
    switch (code_point) {
    case '\n':
    case '\r':
    case '\v':
    case '\f':
    case 0x1Cu:
    case 0x1Du:
    case 0x1Eu:
    case 0x85u:
    case 0x2028u:
    case 0x2029u:
        return true;
    default:
        return false;
    }
}


} // unnamed namespace


void SplitLines(const std::string &utf8_string, std::vector<std::string> * const lines) {
    lines->clear();

    size_t line_start(0), pos(0);
    while (pos < utf8_string.size()) {
        const size_t start(pos);
        const uint32_t code_point(GetNextCodePoint(utf8_string, &pos));
        if (not IsLineBoundary(code_point))
            continue;

        lines->emplace_back(utf8_string.substr(line_start, start - line_start));
        if (code_point == '\r' and pos < utf8_string.size() and utf8_string[pos] == '\n')
            ++pos;
        line_start = pos;
    }

    if (line_start < utf8_string.size())
        lines->emplace_back(utf8_string.substr(line_start));
}


std::string CSVEscape(const std::string &value) {
    std::string escaped_value;
    escaped_value.reserve(value.length() + 2 /* for the quotes */);

    escaped_value += '"';
    for (const char ch : value) {
        if (unlikely(ch == '"'))
            escaped_value += '"';
        escaped_value += ch;
    }
    escaped_value += '"';

    return escaped_value;
}


} // namespace TextUtil
