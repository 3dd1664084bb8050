/** \file    TextUtil.h
 *  \brief   Declarations of UTF-8 text related utility functions.
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
#pragma once


#include <string>
#include <vector>
#include <cinttypes>


namespace TextUtil {


const uint32_t REPLACEMENT_CHARACTER(0xFFFDu);


/** Converts UTF-32 a.k.a. UCS-4 to UTF-8.
 *  \note Surrogates and code points above U+10FFFF are mapped to U+FFFD.
 */
std::string UTF32ToUTF8(const uint32_t code_point);


/** \brief Decodes the code point starting at "*pos" and advances "*pos" past it.
 *  \note  An invalid or truncated sequence yields REPLACEMENT_CHARACTER and "*pos" is advanced past the maximal invalid
 *         subpart, following the Unicode "substitution of maximal subparts" practice.
 */
uint32_t GetNextCodePoint(const std::string &utf8_string, size_t * const pos);


/** \brief Replaces every invalid UTF-8 sequence in "raw_bytes" with U+FFFD.
 *  \return The cleaned up string which is guaranteed to be valid UTF-8.
 */
std::string SanitizeUTF8(const std::string &raw_bytes);


bool IsValidUTF8(const std::string &utf8_candidate);


/** \return The number of code points in "utf8_string". */
size_t UTF8Length(const std::string &utf8_string);


/** \brief Truncates "utf8_string" to a maximum length of "max_length" codepoints.
 *  \return A reference to the truncated "utf8_string".
 */
std::string &UTF8Truncate(std::string * const utf8_string, const size_t max_length);


inline std::string UTF8Truncate(const std::string &utf8_string, const size_t max_length) {
    std::string temp_utf8_string(utf8_string);
    return UTF8Truncate(&temp_utf8_string, max_length);
}


/** \return True if "code_point" is a Unicode whitespace character, i.e. one of the characters that separate words in plain
 *          text (ASCII whitespace, the information separators U+001C..U+001F, NEL, NBSP and the Unicode space separators).
 */
bool IsWhitespace(const uint32_t code_point);


/** \brief Removes leading and trailing Unicode whitespace. */
std::string TrimWhitespace(const std::string &utf8_string);


/** \brief Replaces any sequence of Unicode whitespace characters with a single space (0x20) character and removes leading
 *         and trailing whitespace.
 */
std::string CollapseAndTrimWhitespace(const std::string &utf8_string);


/** \return The number of runs of non-whitespace characters in "utf8_string". */
size_t CountWords(const std::string &utf8_string);


/** \brief Splits "utf8_string" at line boundaries.
 *  \note  Line boundaries are LF, CR, CR+LF, VT, FF, U+001C..U+001E, NEL, LINE SEPARATOR and PARAGRAPH SEPARATOR.  The
 *         line boundaries are not part of the returned lines and a trailing line boundary does not produce an empty last
 *         line.
 */
void SplitLines(const std::string &utf8_string, std::vector<std::string> * const lines);


/** \brief Quotes "value" for use as a field in a comma-separated values file as described in RFC 4180. */
std::string CSVEscape(const std::string &value);


} // namespace TextUtil
