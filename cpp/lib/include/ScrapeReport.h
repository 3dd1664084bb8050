/** \file   ScrapeReport.h
 *  \brief  Renders scrape results as JSON, CSV or plain text.
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
#include <nlohmann/json.hpp>
#include "ScrapePipeline.h"


namespace ScrapeReport {


enum Format { JSON, CSV, TEXT };


/** \return True if "format_name" is one of "json", "csv" or "text", else false. */
bool StringToFormat(const std::string &format_name, Format * const format);


/** \brief  Converts "result" to the object we send to HTTP clients.
 *  \note   Absent optional values become JSON nulls.  The enrichment fields are all null if there was no enrichment.
 */
nlohmann::json ToJSON(const ScrapeResult &result);


/** \brief  A two-column "Field,Value" table with the scalars followed by the key points, links and images. */
std::string ToCSV(const ScrapeResult &result);


std::string ToText(const ScrapeResult &result);


std::string Render(const ScrapeResult &result, const Format format);


} // namespace ScrapeReport
