/** \file    StringUtil.cc
 *  \brief   Implementation of byte-oriented string utility functions.
 *  \author  Dr. Johannes Ruscheinski
 */

/*
 *  Copyright 2002-2009 Project iVia.
 *  Copyright 2002-2009 The Regents of The University of California.
 *  Copyright 2015-2021 Universitätsbibliothek Tübingen
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
#include "StringUtil.h"
#include <limits>
#include <stdexcept>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include "util.h"


namespace StringUtil {


std::string ToLower(std::string * const s) {
    for (auto &ch : *s)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));

    return *s;
}


std::string ToUpper(std::string * const s) {
    for (auto &ch : *s)
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));

    return *s;
}


std::string Trim(const std::string &trim_set, std::string * const s) {
    const auto first_pos(s->find_first_not_of(trim_set));
    if (first_pos == std::string::npos) {
        s->clear();
        return *s;
    }

    const auto last_pos(s->find_last_not_of(trim_set));
    *s = s->substr(first_pos, last_pos - first_pos + 1);

    return *s;
}


std::string &ReplaceString(const std::string &old_text, const std::string &new_text, std::string * const s, const bool global) {
    if (unlikely(old_text.empty()))
        throw std::runtime_error("in StringUtil::ReplaceString: \"old_text\" must not be empty!");

    std::string replaced_string;
    std::string::size_type start_pos(0);
    for (;;) {
        const auto old_text_pos(s->find(old_text, start_pos));
        if (old_text_pos == std::string::npos)
            break;

        replaced_string += s->substr(start_pos, old_text_pos - start_pos);
        replaced_string += new_text;
        start_pos = old_text_pos + old_text.length();
        if (not global)
            break;
    }
    replaced_string += s->substr(start_pos);

    s->swap(replaced_string);
    return *s;
}


size_t FindCaseInsensitive(const std::string &haystack, const std::string &needle, const size_t start_pos) {
    if (needle.empty())
        return start_pos <= haystack.length() ? start_pos : std::string::npos;
    if (needle.length() > haystack.length())
        return std::string::npos;

    const size_t last_start(haystack.length() - needle.length());
    for (size_t start(start_pos); start <= last_start; ++start) {
        size_t i(0);
        while (i < needle.length()
               and std::tolower(static_cast<unsigned char>(haystack[start + i])) == std::tolower(static_cast<unsigned char>(needle[i])))
            ++i;
        if (i == needle.length())
            return start;
    }

    return std::string::npos;
}


bool ToUnsigned(const std::string &s, unsigned * const n, const unsigned base) {
    if (s.empty() or not std::isalnum(static_cast<unsigned char>(s[0])))
        return false;

    errno = 0;
    char *end_ptr;
    const unsigned long value(std::strtoul(s.c_str(), &end_ptr, static_cast<int>(base)));
    if (errno != 0 or *end_ptr != '\0' or value > std::numeric_limits<unsigned>::max()) {
        errno = 0;
        return false;
    }

    *n = static_cast<unsigned>(value);
    return true;
}


unsigned ToUnsigned(const std::string &s, const unsigned base) {
    unsigned n;
    if (unlikely(not ToUnsigned(s, &n, base)))
        throw std::runtime_error("in StringUtil::ToUnsigned: can't convert \"" + s + "\" to an unsigned number!");

    return n;
}


bool ToDouble(const std::string &s, double * const n) {
    if (s.empty())
        return false;

    errno = 0;
    char *end_ptr;
    *n = std::strtod(s.c_str(), &end_ptr);
    if (errno != 0 or *end_ptr != '\0') {
        errno = 0;
        return false;
    }

    return true;
}


bool FromHex(const char ch, unsigned * const u) {
    if (ch >= '0' and ch <= '9') {
        *u = ch - '0';
        return true;
    }
    if (ch >= 'A' and ch <= 'F') {
        *u = ch - 'A' + 10;
        return true;
    }
    if (ch >= 'a' and ch <= 'f') {
        *u = ch - 'a' + 10;
        return true;
    }

    return false;
}


} // namespace StringUtil
