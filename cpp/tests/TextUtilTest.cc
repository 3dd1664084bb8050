/** \brief Test cases for the UTF-8 and string utility functions
 *  \author The scrape_tools developers
 *
 *  \copyright 2026 The scrape_tools developers.
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
#define BOOST_TEST_MODULE TextUtil
#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>
#include <set>
#include <string>
#include <vector>
#include "StringUtil.h"
#include "TextUtil.h"


BOOST_AUTO_TEST_CASE(UTF32ToUTF8) {
    BOOST_CHECK_EQUAL(TextUtil::UTF32ToUTF8('A'), "A");
    BOOST_CHECK_EQUAL(TextUtil::UTF32ToUTF8(0xE9u), "\xC3\xA9");
    BOOST_CHECK_EQUAL(TextUtil::UTF32ToUTF8(0x20ACu), "\xE2\x82\xAC");
    BOOST_CHECK_EQUAL(TextUtil::UTF32ToUTF8(0x1F600u), "\xF0\x9F\x98\x80");
    BOOST_CHECK_EQUAL(TextUtil::UTF32ToUTF8(0xD800u), "\xEF\xBF\xBD");
    BOOST_CHECK_EQUAL(TextUtil::UTF32ToUTF8(0x110000u), "\xEF\xBF\xBD");
}


BOOST_AUTO_TEST_CASE(SanitizeUTF8) {
    BOOST_CHECK_EQUAL(TextUtil::SanitizeUTF8("caf\xC3\xA9"), "caf\xC3\xA9");
    BOOST_CHECK_EQUAL(TextUtil::SanitizeUTF8("caf\xE9!"), "caf\xEF\xBF\xBD!");
    BOOST_CHECK_EQUAL(TextUtil::SanitizeUTF8("\xC0\xAF"), "\xEF\xBF\xBD\xEF\xBF\xBD");
    BOOST_CHECK_EQUAL(TextUtil::SanitizeUTF8("\xE2\x82"), "\xEF\xBF\xBD");

    BOOST_CHECK(TextUtil::IsValidUTF8(TextUtil::SanitizeUTF8("\xFF\xFE garbage \xED\xA0\x80")));
    BOOST_CHECK(not TextUtil::IsValidUTF8("\xFF"));
    BOOST_CHECK(TextUtil::IsValidUTF8("\xEF\xBF\xBD"));
}


BOOST_AUTO_TEST_CASE(LengthAndTruncation) {
    const std::string text("\xC3\xA4\xC3\xB6\xC3\xBC" "abc");
    BOOST_CHECK_EQUAL(TextUtil::UTF8Length(text), 6u);
    BOOST_CHECK_EQUAL(TextUtil::UTF8Truncate(text, 2), "\xC3\xA4\xC3\xB6");
    BOOST_CHECK_EQUAL(TextUtil::UTF8Truncate(text, 100), text);
    BOOST_CHECK_EQUAL(TextUtil::UTF8Truncate(text, 0), "");
}


BOOST_AUTO_TEST_CASE(Whitespace) {
    BOOST_CHECK_EQUAL(TextUtil::TrimWhitespace(" \t\xC2\xA0 hello world\n\xE3\x80\x80"), "hello world");
    BOOST_CHECK_EQUAL(TextUtil::TrimWhitespace(" \n "), "");
    BOOST_CHECK_EQUAL(TextUtil::CollapseAndTrimWhitespace("  a \n\t b\xC2\xA0\xC2\xA0 c  "), "a b c");
    BOOST_CHECK_EQUAL(TextUtil::CountWords(" one two\nthree\xC2\xA0" "four "), 4u);
    BOOST_CHECK_EQUAL(TextUtil::CountWords(""), 0u);
}


BOOST_AUTO_TEST_CASE(SplitLines) {
    std::vector<std::string> lines;
    TextUtil::SplitLines("a\r\nb\rc\n\nd\xE2\x80\xA8" "e\n", &lines);
    const std::vector<std::string> expected_lines{ "a", "b", "c", "", "d", "e" };
    BOOST_CHECK_EQUAL_COLLECTIONS(lines.cbegin(), lines.cend(), expected_lines.cbegin(), expected_lines.cend());

    TextUtil::SplitLines("", &lines);
    BOOST_CHECK(lines.empty());
}


BOOST_AUTO_TEST_CASE(CSVEscape) {
    BOOST_CHECK_EQUAL(TextUtil::CSVEscape("plain"), "\"plain\"");
    BOOST_CHECK_EQUAL(TextUtil::CSVEscape("say \"hi\", ok"), "\"say \"\"hi\"\", ok\"");
}


BOOST_AUTO_TEST_CASE(StringUtilBasics) {
    BOOST_CHECK_EQUAL(StringUtil::ToLower("MiXeD"), "mixed");
    BOOST_CHECK_EQUAL(StringUtil::ToUpper("MiXeD"), "MIXED");
    BOOST_CHECK_EQUAL(StringUtil::TrimWhite("  x \n"), "x");
    BOOST_CHECK(StringUtil::StartsWith("Content-Type", "content-", /* ignore_case = */ true));
    BOOST_CHECK(not StringUtil::StartsWith("Content-Type", "content-"));
    BOOST_CHECK(StringUtil::EndsWith("index.HTML", ".html", /* ignore_case = */ true));
    BOOST_CHECK_EQUAL(StringUtil::FindCaseInsensitive("Text/HTML; charset=utf-8", "text/html"), 0u);

    const std::string haystack_with_nul("a\0bTEXT", 7);
    BOOST_CHECK_EQUAL(StringUtil::FindCaseInsensitive(haystack_with_nul, "text"), 3u);
    BOOST_CHECK_EQUAL(StringUtil::FindCaseInsensitive("TEXT/html", "text", 1), std::string::npos);
    BOOST_CHECK_EQUAL(StringUtil::FindCaseInsensitive("short", "longer needle"), std::string::npos);
}


BOOST_AUTO_TEST_CASE(StringUtilConversions) {
    unsigned n;
    BOOST_CHECK(StringUtil::ToUnsigned("8080", &n));
    BOOST_CHECK_EQUAL(n, 8080u);
    BOOST_CHECK(StringUtil::ToUnsigned("ff", &n, 16));
    BOOST_CHECK_EQUAL(n, 255u);
    BOOST_CHECK(not StringUtil::ToUnsigned("-1", &n));
    BOOST_CHECK(not StringUtil::ToUnsigned("12abc", &n));
    BOOST_CHECK(not StringUtil::ToUnsigned("", &n));
    BOOST_CHECK_THROW(StringUtil::ToUnsigned("x"), std::runtime_error);

    double d;
    BOOST_CHECK(StringUtil::ToDouble("0.7", &d));
    BOOST_CHECK_CLOSE(d, 0.7, 0.0001);
    BOOST_CHECK(not StringUtil::ToDouble("warm", &d));
}


BOOST_AUTO_TEST_CASE(StringUtilSplitAndJoin) {
    std::vector<std::string> parts;
    BOOST_CHECK_EQUAL(StringUtil::SplitThenTrimWhite(" a , b,, c ", ',', &parts), 3u);
    BOOST_CHECK_EQUAL(StringUtil::Join(parts, "|"), "a|b|c");

    BOOST_CHECK_EQUAL(StringUtil::SplitThenTrimWhite(" a ,\t,b ", ',', &parts, /* suppress_empty_words = */ false), 3u);
    BOOST_CHECK_EQUAL(StringUtil::Join(parts, "|"), "a||b");

    std::set<std::string> origins;
    BOOST_CHECK_EQUAL(StringUtil::SplitThenTrimWhite("http://b.test  http://a.test http://b.test", ' ', &origins), 3u);
    BOOST_CHECK_EQUAL(origins.size(), 2u);
}
