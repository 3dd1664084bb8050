/** \file   EnrichmentResponseParser.cc
 *  \brief  Implementation of the EnrichmentResponseParser functions.
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
#include "EnrichmentResponseParser.h"
#include <set>
#include "StringUtil.h"
#include "TextUtil.h"
#include "util.h"


namespace EnrichmentResponseParser {


const std::vector<std::string> &GetSectionLabels() {
    static const std::vector<std::string> SECTION_LABELS{
        "SUMMARY", "KEY_POINTS", "CATEGORY", "SENTIMENT", "ENTITIES", "TOPICS", "KEYWORDS", "STRUCTURED_DATA", "INSIGHTS"
    };
    return SECTION_LABELS;
}


size_t SplitIntoSections(const std::string &response_text, std::map<std::string, std::string> * const labels_to_sections_map) {
    labels_to_sections_map->clear();

    // Find the first occurrence of each marker:
    std::map<size_t, std::string> marker_positions_to_labels_map;
    for (const auto &label : GetSectionLabels()) {
        const size_t marker_pos(response_text.find(label + ":"));
        if (marker_pos != std::string::npos)
            marker_positions_to_labels_map.emplace(marker_pos, label);
    }

    for (auto marker_pos_and_label(marker_positions_to_labels_map.cbegin()); marker_pos_and_label != marker_positions_to_labels_map.cend();
         ++marker_pos_and_label)
    {
        const size_t section_start(marker_pos_and_label->first + marker_pos_and_label->second.length() + 1 /* colon */);
        auto next_marker_pos_and_label(marker_pos_and_label);
        ++next_marker_pos_and_label;

        // Markers may overlap if a label occurs inside the text of an earlier section, skip those:
        while (next_marker_pos_and_label != marker_positions_to_labels_map.cend() and next_marker_pos_and_label->first < section_start)
            ++next_marker_pos_and_label;

        const size_t section_end(next_marker_pos_and_label == marker_positions_to_labels_map.cend() ? response_text.length()
                                                                                                      : next_marker_pos_and_label->first);
        (*labels_to_sections_map)[marker_pos_and_label->second] =
            TextUtil::TrimWhitespace(response_text.substr(section_start, section_end - section_start));
    }

    return labels_to_sections_map->size();
}


std::vector<std::string> ParseListSection(const std::string &section, const bool split_single_line_on_commas) {
    std::vector<std::string> lines;
    TextUtil::SplitLines(section, &lines);

    std::vector<std::string> items;
    bool bullet_seen(false);
    for (const auto &line : lines) {
        std::string item(TextUtil::TrimWhitespace(line));
        if (StringUtil::StartsWith(item, "-") or StringUtil::StartsWith(item, "*") or StringUtil::StartsWith(item, "•"))
            bullet_seen = true;

        // Remove bullets:
        const size_t first_non_bullet_pos(item.find_first_not_of("-* "));
        if (first_non_bullet_pos == std::string::npos)
            continue;
        item = item.substr(first_non_bullet_pos);
        if (StringUtil::StartsWith(item, "•"))
            item = item.substr(std::string("•").length());

        item = TextUtil::TrimWhitespace(item);
        if (not item.empty())
            items.emplace_back(item);
    }

    if (split_single_line_on_commas and items.size() == 1 and not bullet_seen) {
        std::vector<std::string> comma_separated_items;
        StringUtil::SplitThenTrimWhite(items.front(), ',', &comma_separated_items);
        return comma_separated_items;
    }

    return items;
}


std::string StripCodeFences(const std::string &section) {
    std::string stripped_section(TextUtil::TrimWhitespace(section));
    if (not StringUtil::StartsWith(stripped_section, "```"))
        return stripped_section;

    // Drop the opening fence together with an optional language tag:
    const size_t first_newline_pos(stripped_section.find('\n'));
    stripped_section = (first_newline_pos == std::string::npos) ? stripped_section.substr(3) : stripped_section.substr(first_newline_pos + 1);

    if (StringUtil::EndsWith(stripped_section, "```"))
        stripped_section.resize(stripped_section.length() - 3);

    return TextUtil::TrimWhitespace(stripped_section);
}


bool ParseEntities(const std::string &section, std::vector<NamedEntity> * const entities) {
    static const std::set<std::string> ENTITY_TYPES{ "PERSON", "ORG", "LOCATION", "PRODUCT" };

    const nlohmann::json json(nlohmann::json::parse(StripCodeFences(section), /* cb = */ nullptr, /* allow_exceptions = */ false));
    if (not json.is_array())
        return false;

    entities->clear();
    for (const auto &element : json) {
        if (not element.is_object())
            continue;

        const auto name(element.find("name")), type(element.find("type"));
        if (name == element.end() or not name->is_string() or type == element.end() or not type->is_string())
            continue;

        NamedEntity entity;
        entity.name_ = TextUtil::TrimWhitespace(name->get<std::string>());
        entity.type_ = StringUtil::ToUpper(TextUtil::TrimWhitespace(type->get<std::string>()));
        if (entity.name_.empty() or ENTITY_TYPES.find(entity.type_) == ENTITY_TYPES.cend())
            continue;

        entities->emplace_back(entity);
    }

    return true;
}


namespace {


inline std::optional<std::string> GetScalarSection(const std::map<std::string, std::string> &labels_to_sections_map,
                                                   const std::string &label)
{
    const auto label_and_section(labels_to_sections_map.find(label));
    if (label_and_section == labels_to_sections_map.cend() or label_and_section->second.empty())
        return std::nullopt;
    return label_and_section->second;
}


inline std::string GetSection(const std::map<std::string, std::string> &labels_to_sections_map, const std::string &label) {
    const auto label_and_section(labels_to_sections_map.find(label));
    return label_and_section == labels_to_sections_map.cend() ? "" : label_and_section->second;
}


} // unnamed namespace


bool Parse(const std::string &response_text, EnrichmentResult * const result) {
    std::map<std::string, std::string> labels_to_sections_map;
    if (SplitIntoSections(response_text, &labels_to_sections_map) == 0)
        return false;

    EnrichmentResult new_result;
    new_result.summary_    = GetScalarSection(labels_to_sections_map, "SUMMARY");
    new_result.key_points_ = ParseListSection(GetSection(labels_to_sections_map, "KEY_POINTS"));
    new_result.category_   = GetScalarSection(labels_to_sections_map, "CATEGORY");
    new_result.sentiment_  = GetScalarSection(labels_to_sections_map, "SENTIMENT");
    new_result.topics_     = ParseListSection(GetSection(labels_to_sections_map, "TOPICS"), /* split_single_line_on_commas = */ true);
    new_result.keywords_   = ParseListSection(GetSection(labels_to_sections_map, "KEYWORDS"), /* split_single_line_on_commas = */ true);
    new_result.insights_   = GetScalarSection(labels_to_sections_map, "INSIGHTS");

    const auto entities_section(GetScalarSection(labels_to_sections_map, "ENTITIES"));
    if (entities_section) {
        std::vector<NamedEntity> entities;
        if (ParseEntities(*entities_section, &entities))
            new_result.entities_ = entities;
        else
            LOG_DEBUG("ENTITIES section is not a JSON array");
    }

    const auto structured_data_section(GetScalarSection(labels_to_sections_map, "STRUCTURED_DATA"));
    if (structured_data_section) {
        const nlohmann::json structured_data(nlohmann::json::parse(StripCodeFences(*structured_data_section), /* cb = */ nullptr,
                                                                   /* allow_exceptions = */ false));
        if (structured_data.is_object())
            new_result.structured_data_ = structured_data;
        else
            LOG_DEBUG("STRUCTURED_DATA section is not a JSON object");
    }

    *result = new_result;
    return true;
}


} // namespace EnrichmentResponseParser
