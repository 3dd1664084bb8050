/** \file    StringUtil.h
 *  \brief   Declarations for byte-oriented string utility functions.
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
#pragma once


#include <string>
#include <cstring>
#include <strings.h>


namespace StringUtil {


// ASCII whitespace only, all of our strings are UTF-8.
const std::string WHITE_SPACE(" \t\n\v\r\f");


/** \brief  Convert a string to lowercase (modifies its argument). */
std::string ToLower(std::string * const s);


/** \brief  Convert a string to lowercase (does not modify its agrument). */
inline std::string ToLower(const std::string &s) {
    std::string temp_s(s);
    return ToLower(&temp_s);
}


/** \brief  Convert a string to uppercase (modifies its argument). */
std::string ToUpper(std::string * const s);


inline std::string ToUpper(const std::string &s) {
    std::string temp_s(s);
    return ToUpper(&temp_s);
}


/** \brief   Remove all occurences of a set of characters from either end of a string.
 *  \param   trim_set  The set of characters to remove.
 *  \param   s         The string to trim.
 *  \return  The trimmed string.
 */
std::string Trim(const std::string &trim_set, std::string * const s);


inline std::string Trim(const std::string &trim_set, const std::string &s) {
    std::string temp_s(s);
    return Trim(trim_set, &temp_s);
}


/** \brief   Remove all occurences of whitespace characters from either end of a string. */
inline std::string TrimWhite(std::string * const s) {
    return Trim(WHITE_SPACE, s);
}


inline std::string TrimWhite(const std::string &s) {
    std::string temp_s(s);
    return TrimWhite(&temp_s);
}


/** \brief  Splits "s" around "field_separator" and trims whitespace from each part.
 *  \param  container             A string container to hold the parts (e.g. std::vector<std::string>).
 *  \param  suppress_empty_words  If true, we skip empty "words", otherwise we keep them.
 *  \return The number of extracted "words".
 */
template<typename InsertableContainer> inline unsigned SplitThenTrimWhite(const std::string &s, const char field_separator,
                                                                          InsertableContainer * const container,
                                                                          const bool suppress_empty_words = true)
{
    container->clear();
    unsigned count(0);
    std::string::size_type word_start(0);
    for (;;) {
        const auto separator_pos(s.find(field_separator, word_start));
        std::string new_word(s.substr(word_start, separator_pos == std::string::npos ? std::string::npos : separator_pos - word_start));
        TrimWhite(&new_word);
        if (not new_word.empty() or not suppress_empty_words) {
            container->insert(container->end(), new_word);
            ++count;
        }

        if (separator_pos == std::string::npos)
            return count;
        word_start = separator_pos + 1;
    }
}


/** \brief  Splits "s" on runs of ASCII whitespace, no empty parts are ever generated. */
template<typename InsertableContainer> unsigned SplitOnWhitespace(const std::string &s, InsertableContainer * const container) {
    container->clear();
    unsigned count(0);
    auto ch(s.cbegin());
    while (ch != s.cend()) {
        while (ch != s.cend() and WHITE_SPACE.find(*ch) != std::string::npos)
            ++ch;
        if (ch == s.cend())
            break;

        const auto word_start(ch);
        while (ch != s.cend() and WHITE_SPACE.find(*ch) == std::string::npos)
            ++ch;
        container->insert(container->end(), std::string(word_start, ch));
        ++count;
    }

    return count;
}


/** \brief  Joins the strings in "source" with "separator" in between. */
template<typename StringContainer> std::string Join(const StringContainer &source, const std::string &separator) {
    std::string dest;
    bool first(true);
    for (const auto &element : source) {
        if (not first)
            dest += separator;
        dest += element;
        first = false;
    }

    return dest;
}


/** \brief  Replaces occurences of "old_text" with "new_text" in "*s".
 *  \param  global  If true, all occurences are replaced, otherwise only the first.
 */
std::string &ReplaceString(const std::string &old_text, const std::string &new_text, std::string * const s, const bool global = true);


/** \brief  Does the given string start with the suggested prefix?
 *  \param  ignore_case  If true, the match will be case-insensitive.
 */
inline bool StartsWith(const std::string &s, const std::string &prefix, const bool ignore_case = false) {
    return prefix.empty()
           or (s.length() >= prefix.length()
               and (ignore_case ? (::strncasecmp(s.c_str(), prefix.c_str(), prefix.length()) == 0)
                                : (std::strncmp(s.c_str(), prefix.c_str(), prefix.length()) == 0)));
}


inline bool EndsWith(const std::string &s, const std::string &suffix, const bool ignore_case = false) {
    return suffix.empty()
           or (s.length() >= suffix.length()
               and (ignore_case ? (::strncasecmp(s.c_str() + (s.length() - suffix.length()), suffix.c_str(), suffix.length()) == 0)
                                : (std::strncmp(s.c_str() + (s.length() - suffix.length()), suffix.c_str(), suffix.length()) == 0)));
}


/** \return The position of the first occurence of "needle" in "haystack" at or after "start_pos" ignoring ASCII case, or
 *          std::string::npos.
 */
size_t FindCaseInsensitive(const std::string &haystack, const std::string &needle, const size_t start_pos = 0);


/** \brief  Converts "s" to an unsigned number.
 *  \return True if the conversion succeeded and the number fit into an unsigned, else false.
 */
bool ToUnsigned(const std::string &s, unsigned * const n, const unsigned base = 10);


/** \brief  Converts "s" to an unsigned number.
 *  \note   Throws an exception if the conversion fails.
 */
unsigned ToUnsigned(const std::string &s, const unsigned base = 10);


bool ToDouble(const std::string &s, double * const n);


/** \return True if "ch" was successfully converted to a value in the range [0..15] else false. */
bool FromHex(const char ch, unsigned * const u);


} // namespace StringUtil
