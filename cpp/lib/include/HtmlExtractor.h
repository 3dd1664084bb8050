/** \file   HtmlExtractor.h
 *  \brief  Turns HTML pages into structured extraction records.
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
#include "Url.h"


namespace HtmlExtractor {


const size_t MAX_EXCERPT_LENGTH(1200); // In characters.
const size_t MAX_LINK_COUNT(100);
const size_t MAX_IMAGE_COUNT(50);
const size_t MAX_TABLE_COUNT(20);
const size_t MAX_FORM_COUNT(10);
const size_t MAX_BUTTON_COUNT(50);
const size_t MAX_VIDEO_COUNT(20);
const size_t MAX_SCRIPT_COUNT(30);
const size_t MAX_STYLESHEET_COUNT(20);
const size_t MAX_LIST_COUNT(30);
const size_t MAX_LIST_ITEM_COUNT(50); // Per list.
const size_t MAX_PARAGRAPH_COUNT(100);
const size_t MAX_QUOTE_COUNT(30);
const size_t MAX_CODE_BLOCK_COUNT(20);
const size_t MAX_CODE_BLOCK_LENGTH(500); // In characters.
const size_t MIN_CODE_BLOCK_LENGTH(11);  // In characters.
const std::string LOGIN_WALL_MESSAGE("Login form detected; scraping aborted.");


struct Table {
    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};


struct FormInput {
    std::string type_;
    std::string name_;
    std::string placeholder_;
    std::string label_;
};


struct Form {
    std::string action_; // Absolute if the form had an action, else empty.
    std::string method_; // Uppercase.
    std::vector<FormInput> inputs_;
};


struct Button {
    std::string text_;
    std::string type_;
    std::vector<std::string> classes_;
};


struct List {
    std::string type_; // "ul" or "ol".
    std::vector<std::string> items_;
};


struct ExtractionRecord {
    std::optional<std::string> title_;
    std::optional<std::string> description_;
    std::optional<std::string> language_;
    std::string full_text_;
    std::string text_excerpt_;
    size_t word_count_;
    std::map<std::string, std::vector<std::string>> headings_; // Always has the keys "h1" through "h6".
    std::vector<std::string> links_;
    std::vector<std::string> images_;
    std::map<std::string, std::string> meta_tags_;
    std::map<std::string, std::string> social_tags_;
    std::vector<Table> tables_;
    std::vector<Form> forms_;
    std::vector<Button> buttons_;
    std::vector<std::string> videos_;
    std::vector<std::string> scripts_;
    std::vector<std::string> stylesheets_;
    std::vector<List> lists_;
    std::vector<std::string> paragraphs_;
    std::vector<std::string> quotes_;
    std::vector<std::string> code_blocks_;
public:
    ExtractionRecord(): word_count_(0) { }
};


/** \brief  Extracts metadata, text and structural elements from an HTML page.
 *  \param  html      Valid UTF-8.
 *  \param  base_url  Relative references are resolved against this URL.  Only http and https URLs are collected.
 *  \throws ScrapeError with kind LOGIN_WALL_DETECTED if the page contains a password field, a form whose id mentions
 *          "login" or the word "login" near the beginning of its text.
 *  \note   The same input always yields the same record.
 */
ExtractionRecord Extract(const std::string &html, const Url &base_url);


/** \brief  Limits "text" to MAX_EXCERPT_LENGTH characters, appending an ellipsis if anything had to be dropped. */
std::string MakeExcerpt(const std::string &text);


/** \brief  Splits "text" into lines, trims each line and joins the non-empty lines with newlines. */
std::string NormaliseLines(const std::string &text);


} // namespace HtmlExtractor
