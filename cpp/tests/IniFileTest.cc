/** \brief Test cases for IniFile
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
#define BOOST_TEST_MODULE IniFile
#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>
#include <sstream>
#include <stdexcept>
#include "IniFile.h"


BOOST_AUTO_TEST_CASE(SectionsAndEntries) {
    std::istringstream input("; leading comment\n"
                             "global_entry = 1\n"
                             "[Server]\n"
                             "port = 8080   # trailing comment\n"
                             "allowed_origins = http://a.example http://b.example\n"
                             "\n"
                             "[ Fetcher ]\n"
                             "user_agent = \"  Padded/1.0 #1  \"\n"
                             "escaped = a\\#b\n"
                             "port = 1\n"
                             "port = 2\n");
    const IniFile ini_file(input, "test.conf");

    BOOST_CHECK_EQUAL(ini_file.getFilename(), "test.conf");
    BOOST_CHECK(ini_file.hasSection(""));
    BOOST_CHECK(ini_file.hasSection("Server"));
    BOOST_CHECK(ini_file.hasSection("Fetcher"));
    BOOST_CHECK(not ini_file.hasSection("Robots"));

    BOOST_CHECK_EQUAL(ini_file.getUnsigned("", "global_entry", 0), 1u);
    BOOST_CHECK_EQUAL(ini_file.getUnsigned("Server", "port", 0), 8080u);
    BOOST_CHECK_EQUAL(ini_file.getString("Server", "allowed_origins", ""), "http://a.example http://b.example");
    BOOST_CHECK_EQUAL(ini_file.getString("Fetcher", "user_agent", ""), "  Padded/1.0 #1  ");
    BOOST_CHECK_EQUAL(ini_file.getString("Fetcher", "escaped", ""), "a#b");
    BOOST_CHECK_EQUAL(ini_file.getUnsigned("Fetcher", "port", 0), 2u);
    BOOST_CHECK_EQUAL(ini_file.getSection("Fetcher")->size(), 3u);
    BOOST_CHECK_EQUAL(ini_file.getSection("Fetcher")->getSectionName(), "Fetcher");
    BOOST_CHECK(ini_file.getSection("Fetcher")->hasEntry("escaped"));
    BOOST_CHECK(not ini_file.getSection("Fetcher")->hasEntry("allowed_origins"));
}


BOOST_AUTO_TEST_CASE(Defaults) {
    std::istringstream input("[Enrichment]\nmodel = gpt-4o-mini\n");
    const IniFile ini_file(input, "test.conf");

    BOOST_CHECK_EQUAL(ini_file.getString("Enrichment", "model", "gpt-3.5-turbo"), "gpt-4o-mini");
    BOOST_CHECK_EQUAL(ini_file.getString("Enrichment", "endpoint", "https://api.example/"), "https://api.example/");
    BOOST_CHECK_CLOSE(ini_file.getDouble("Enrichment", "temperature", 0.7), 0.7, 0.0001);
    BOOST_CHECK_EQUAL(ini_file.getUnsigned("Missing", "anything", 42), 42u);
    BOOST_CHECK(ini_file.getBool("Missing", "flag", true));

    std::string value;
    BOOST_CHECK(not ini_file.lookup("Enrichment", "api_key_env", &value));
    BOOST_CHECK(value.empty());

    const IniFile empty_ini_file;
    BOOST_CHECK_EQUAL(empty_ini_file.getUnsigned("Server", "port", 8000), 8000u);
}


BOOST_AUTO_TEST_CASE(Booleans) {
    std::istringstream input("[Flags]\na = Yes\nb = off\nc = TRUE\n");
    const IniFile ini_file(input, "test.conf");
    BOOST_CHECK(ini_file.getBool("Flags", "a", false));
    BOOST_CHECK(not ini_file.getBool("Flags", "b", true));
    BOOST_CHECK(ini_file.getBool("Flags", "c", false));
}


BOOST_AUTO_TEST_CASE(SyntaxErrors) {
    std::istringstream unterminated_header("[Server\n");
    BOOST_CHECK_THROW(IniFile(unterminated_header, "bad.conf"), std::runtime_error);

    std::istringstream missing_equal_sign("[Server]\nport 8000\n");
    BOOST_CHECK_THROW(IniFile(missing_equal_sign, "bad.conf"), std::runtime_error);

    std::istringstream bad_quotes("[Server]\naddress = \"0.0.0.0\n");
    BOOST_CHECK_THROW(IniFile(bad_quotes, "bad.conf"), std::runtime_error);

    std::istringstream duplicate_section("[A]\n[A]\n");
    BOOST_CHECK_THROW(IniFile(duplicate_section, "bad.conf"), std::runtime_error);

    std::istringstream bad_name("[A]\n1abc = 2\n");
    BOOST_CHECK_THROW(IniFile(bad_name, "bad.conf"), std::runtime_error);

    BOOST_CHECK_THROW(IniFile("/nonexistent/scrape_tools.conf"), std::runtime_error);
}
