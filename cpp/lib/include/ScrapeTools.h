/** \file   ScrapeTools.h
 *  \brief  Project-wide constants and locations.
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
#pragma once


#include <string>


namespace ScrapeTools {


const std::string APP_NAME("Scrape");
const std::string VERSION("0.1.0");

// Sent with every outbound request to a target site.
const std::string DEFAULT_USER_AGENT("Scrape/1.0 (+https://example.com/contact) Mozilla/5.0 (Windows NT 10.0; Win64; x64)");


// \return A slash-terminated absolute path.
inline std::string GetConfigPath() {
    return "/usr/local/etc/scrape_tools/";
}


inline std::string GetDefaultConfigFilename() {
    return GetConfigPath() + "scrape_tools.conf";
}


} // namespace ScrapeTools
