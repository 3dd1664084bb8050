/** \file   ScrapeReport.cc
 *  \brief  Implementation of the ScrapeReport functions.
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
#include "ScrapeReport.h"
#include "StringUtil.h"
#include "TextUtil.h"
#include "util.h"


namespace ScrapeReport {


bool StringToFormat(const std::string &format_name, Format * const format) {
    if (format_name == "json")
        *format = JSON;
    else if (format_name == "csv")
        *format = CSV;
    else if (format_name == "text")
        *format = TEXT;
    else
        return false;

    return true;
}


namespace {


template<typename ValueType> nlohmann::json OptionalToJSON(const std::optional<ValueType> &optional_value) {
    return optional_value ? nlohmann::json(*optional_value) : nlohmann::json(nullptr);
}


// Empty lists are reported as null, just like missing ones.
nlohmann::json ListToJSON(const std::vector<std::string> &list) {
    return list.empty() ? nlohmann::json(nullptr) : nlohmann::json(list);
}


nlohmann::json TablesToJSON(const std::vector<HtmlExtractor::Table> &tables) {
    nlohmann::json tables_json(nlohmann::json::array());
    for (const auto &table : tables)
        tables_json.push_back({ { "headers", table.headers_ }, { "rows", table.rows_ } });
    return tables_json;
}


nlohmann::json FormsToJSON(const std::vector<HtmlExtractor::Form> &forms) {
    nlohmann::json forms_json(nlohmann::json::array());
    for (const auto &form : forms) {
        nlohmann::json inputs_json(nlohmann::json::array());
        for (const auto &input : form.inputs_)
            inputs_json.push_back(
                { { "type", input.type_ }, { "name", input.name_ }, { "placeholder", input.placeholder_ }, { "label", input.label_ } });
        forms_json.push_back({ { "action", form.action_ }, { "method", form.method_ }, { "inputs", inputs_json } });
    }
    return forms_json;
}


nlohmann::json ButtonsToJSON(const std::vector<HtmlExtractor::Button> &buttons) {
    nlohmann::json buttons_json(nlohmann::json::array());
    for (const auto &button : buttons)
        buttons_json.push_back({ { "text", button.text_ }, { "type", button.type_ }, { "classes", button.classes_ } });
    return buttons_json;
}


nlohmann::json ListsToJSON(const std::vector<HtmlExtractor::List> &lists) {
    nlohmann::json lists_json(nlohmann::json::array());
    for (const auto &list : lists)
        lists_json.push_back({ { "type", list.type_ }, { "items", list.items_ } });
    return lists_json;
}


nlohmann::json EntitiesToJSON(const std::optional<std::vector<NamedEntity>> &entities) {
    if (not entities)
        return nullptr;

    nlohmann::json entities_json(nlohmann::json::array());
    for (const auto &entity : *entities)
        entities_json.push_back({ { "name", entity.name_ }, { "type", entity.type_ } });
    return entities_json;
}


} // unnamed namespace


nlohmann::json ToJSON(const ScrapeResult &result) {
    const HtmlExtractor::ExtractionRecord &record(result.record_);

    nlohmann::json json;
    json["fetched_url"]  = result.fetched_url_;
    json["title"]        = OptionalToJSON(record.title_);
    json["description"]  = OptionalToJSON(record.description_);
    json["text_excerpt"] = record.text_excerpt_;
    json["full_text"]    = record.full_text_;
    json["links"]        = record.links_;
    json["images"]       = record.images_;
    json["headings"]     = record.headings_;
    json["meta_tags"]    = record.meta_tags_;
    json["social_tags"]  = record.social_tags_;
    json["language"]     = OptionalToJSON(record.language_);
    json["word_count"]   = record.word_count_;
    json["tables"]       = TablesToJSON(record.tables_);
    json["forms"]        = FormsToJSON(record.forms_);
    json["buttons"]      = ButtonsToJSON(record.buttons_);
    json["videos"]       = record.videos_;
    json["scripts"]      = record.scripts_;
    json["stylesheets"]  = record.stylesheets_;
    json["lists"]        = ListsToJSON(record.lists_);
    json["paragraphs"]   = record.paragraphs_;
    json["quotes"]       = record.quotes_;
    json["code_blocks"]  = record.code_blocks_;

    if (result.enrichment_) {
        const EnrichmentResult &enrichment(*result.enrichment_);
        json["ai_summary"]         = OptionalToJSON(enrichment.summary_);
        json["ai_key_points"]      = ListToJSON(enrichment.key_points_);
        json["ai_category"]        = OptionalToJSON(enrichment.category_);
        json["ai_sentiment"]       = OptionalToJSON(enrichment.sentiment_);
        json["ai_entities"]        = EntitiesToJSON(enrichment.entities_);
        json["ai_topics"]          = ListToJSON(enrichment.topics_);
        json["ai_keywords"]        = ListToJSON(enrichment.keywords_);
        json["ai_structured_data"] = OptionalToJSON(enrichment.structured_data_);
        json["ai_insights"]        = OptionalToJSON(enrichment.insights_);
    } else {
        for (const auto &field_name : { "ai_summary", "ai_key_points", "ai_category", "ai_sentiment", "ai_entities", "ai_topics",
                                        "ai_keywords", "ai_structured_data", "ai_insights" })
            json[field_name] = nullptr;
    }

    json["warnings"] = result.warnings_;

    return json;
}


namespace {


inline void AppendCSVRow(const std::string &field, const std::string &value, std::string * const csv) {
    *csv += TextUtil::CSVEscape(field) + "," + TextUtil::CSVEscape(value) + "\r\n";
}


inline std::string OptionalOrEmpty(const std::optional<std::string> &optional_value) {
    return optional_value ? *optional_value : "";
}


} // unnamed namespace


std::string ToCSV(const ScrapeResult &result) {
    const HtmlExtractor::ExtractionRecord &record(result.record_);

    std::string csv;
    AppendCSVRow("Field", "Value", &csv);
    AppendCSVRow("URL", result.fetched_url_, &csv);
    AppendCSVRow("Title", OptionalOrEmpty(record.title_), &csv);
    AppendCSVRow("Description", OptionalOrEmpty(record.description_), &csv);
    AppendCSVRow("Language", OptionalOrEmpty(record.language_), &csv);
    AppendCSVRow("Word Count", std::to_string(record.word_count_), &csv);
    AppendCSVRow("Links Count", std::to_string(record.links_.size()), &csv);
    AppendCSVRow("Images Count", std::to_string(record.images_.size()), &csv);
    AppendCSVRow("AI Category", result.enrichment_ ? OptionalOrEmpty(result.enrichment_->category_) : "", &csv);
    AppendCSVRow("AI Summary", result.enrichment_ ? OptionalOrEmpty(result.enrichment_->summary_) : "", &csv);

    if (result.enrichment_ and not result.enrichment_->key_points_.empty()) {
        AppendCSVRow("AI Key Points", "", &csv);
        for (const auto &key_point : result.enrichment_->key_points_)
            AppendCSVRow("", key_point, &csv);
    }

    if (not record.links_.empty()) {
        AppendCSVRow("Links", "", &csv);
        for (const auto &link : record.links_)
            AppendCSVRow("", link, &csv);
    }

    if (not record.images_.empty()) {
        AppendCSVRow("Images", "", &csv);
        for (const auto &image : record.images_)
            AppendCSVRow("", image, &csv);
    }

    return csv;
}


std::string ToText(const ScrapeResult &result) {
    const HtmlExtractor::ExtractionRecord &record(result.record_);
    const std::string RULE(60, '=');

    std::string text;
    text += RULE + "\nWEB SCRAPE REPORT\n" + RULE + "\n\n";
    text += "URL: " + result.fetched_url_ + "\n";
    text += "Title: " + (record.title_ ? *record.title_ : "N/A") + "\n";
    text += "Description: " + (record.description_ ? *record.description_ : "N/A") + "\n";
    text += "Language: " + (record.language_ ? *record.language_ : "N/A") + "\n";
    text += "Word Count: " + std::to_string(record.word_count_) + "\n";
    text += "Links: " + std::to_string(record.links_.size()) + "\n";
    text += "Images: " + std::to_string(record.images_.size()) + "\n";

    if (result.enrichment_) {
        const EnrichmentResult &enrichment(*result.enrichment_);
        if (enrichment.category_)
            text += "AI Category: " + *enrichment.category_ + "\n";
        if (enrichment.summary_)
            text += "\nAI SUMMARY\n" + std::string(60, '-') + "\n" + *enrichment.summary_ + "\n";
        if (not enrichment.key_points_.empty()) {
            text += "\nAI KEY POINTS\n" + std::string(60, '-') + "\n";
            for (const auto &key_point : enrichment.key_points_)
                text += "- " + key_point + "\n";
        }
    }

    text += "\nFULL TEXT\n" + std::string(60, '-') + "\n" + record.full_text_ + "\n";

    if (not record.links_.empty()) {
        text += "\nLINKS\n" + std::string(60, '-') + "\n";
        unsigned link_no(0);
        for (const auto &link : record.links_)
            text += std::to_string(++link_no) + ". " + link + "\n";
    }

    if (not record.images_.empty()) {
        text += "\nIMAGES\n" + std::string(60, '-') + "\n";
        unsigned image_no(0);
        for (const auto &image : record.images_)
            text += std::to_string(++image_no) + ". " + image + "\n";
    }

    if (not result.warnings_.empty()) {
        text += "\nWARNINGS\n" + std::string(60, '-') + "\n";
        for (const auto &warning : result.warnings_)
            text += warning + "\n";
    }

    return text;
}


std::string Render(const ScrapeResult &result, const Format format) {
    switch (format) {
    case JSON:
        return ToJSON(result).dump(4);
    case CSV:
        return ToCSV(result);
    case TEXT:
        return ToText(result);
    }

    LOG_ERROR("unknown format " + std::to_string(static_cast<int>(format)) + "!");
}


} // namespace ScrapeReport
