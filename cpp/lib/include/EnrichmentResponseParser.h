/** \file   EnrichmentResponseParser.h
 *  \brief  Splits the labelled sections of a language model response into typed fields.
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


#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>


struct NamedEntity {
    std::string name_;
    std::string type_; // One of "PERSON", "ORG", "LOCATION" or "PRODUCT".
};


struct EnrichmentResult {
    std::optional<std::string> summary_;
    std::vector<std::string> key_points_;
    std::optional<std::string> category_;
    std::optional<std::string> sentiment_;
    std::optional<std::vector<NamedEntity>> entities_; // Absent if the section was missing or not valid JSON.
    std::vector<std::string> topics_;
    std::vector<std::string> keywords_;
    std::optional<nlohmann::json> structured_data_;    // Always a JSON object if present.
    std::optional<std::string> insights_;
};


namespace EnrichmentResponseParser {


/** \return The section labels in the order in which we ask the model to emit them, e.g. "SUMMARY" or "KEY_POINTS". */
const std::vector<std::string> &GetSectionLabels();


/** \brief  Locates each "LABEL:" marker and maps the label to the trimmed text up to the next marker or the end.
 *  \return The number of sections found.
 *  \note   Only the first occurrence of each marker is considered.
 */
size_t SplitIntoSections(const std::string &response_text, std::map<std::string, std::string> * const labels_to_sections_map);


/** \brief  Turns a bulleted or line-separated list into its items.
 *  \note   Leading dashes and blanks are stripped from every line and blank lines are dropped.  If
 *          "split_single_line_on_commas" is true, a single unbulleted line is treated as a comma-separated list.
 */
std::vector<std::string> ParseListSection(const std::string &section, const bool split_single_line_on_commas = false);


/** \brief  Removes a surrounding Markdown code fence, e.g. "```json\n...\n```", if present. */
std::string StripCodeFences(const std::string &section);


/** \brief  Parses the ENTITIES section.
 *  \return False if "section" is not a JSON array.  Elements without a name or with an unknown type are skipped.
 */
bool ParseEntities(const std::string &section, std::vector<NamedEntity> * const entities);


/** \brief  Parses a complete model response.
 *  \return False, and leaves "result" untouched, if none of the section markers could be found.
 *  \note   A JSON section that can't be parsed only leaves the corresponding field of "result" absent.
 */
bool Parse(const std::string &response_text, EnrichmentResult * const result);


} // namespace EnrichmentResponseParser
