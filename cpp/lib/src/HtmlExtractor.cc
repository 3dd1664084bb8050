/** \file   HtmlExtractor.cc
 *  \brief  Implementation of the HtmlExtractor functions.
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
#include "HtmlExtractor.h"
#include <algorithm>
#include <unordered_map>
#include <unordered_set>
#include "HtmlDocument.h"
#include "ScrapeError.h"
#include "StringUtil.h"
#include "TextUtil.h"
#include "util.h"


namespace HtmlExtractor {


namespace {


const std::set<std::string> NON_CONTENT_ELEMENTS{ "script", "style", "noscript", "iframe" };
const std::vector<std::string> HEADING_LEVELS{ "h1", "h2", "h3", "h4", "h5", "h6" };
const std::vector<std::string> VIDEO_HOSTS{
    "youtube.com", "youtube-nocookie.com", "youtu.be", "player.vimeo.com", "vimeo.com", "dailymotion.com"
};


// Resolves references, keeps http(s) URLs only, suppresses duplicates and stops accepting URLs at "max_count".
class UrlCollector {
    const Url &base_url_;
    const size_t max_count_;
    std::vector<std::string> &urls_;
    std::unordered_set<std::string> seen_urls_;
public:
    UrlCollector(const Url &base_url, const size_t max_count, std::vector<std::string> * const urls)
        : base_url_(base_url), max_count_(max_count), urls_(*urls) { }

    inline bool full() const { return urls_.size() >= max_count_; }
    void add(const std::string &reference);
};


void UrlCollector::add(const std::string &reference) {
    if (full())
        return;

    const std::string absolute_url(Url(reference, base_url_).toString());
    if (not StringUtil::StartsWith(absolute_url, "http://") and not StringUtil::StartsWith(absolute_url, "https://"))
        return;

    if (seen_urls_.emplace(absolute_url).second)
        urls_.emplace_back(absolute_url);
}


inline std::string GetCollapsedText(const HtmlDocument::Node &element) {
    return TextUtil::CollapseAndTrimWhitespace(element.getTextContent());
}


bool IsVideoHost(const std::string &hostname) {
    for (const auto &video_host : VIDEO_HOSTS) {
        if (hostname == video_host or StringUtil::EndsWith(hostname, "." + video_host))
            return true;
    }

    return false;
}


void ExtractTitleAndLanguage(const HtmlDocument &document, ExtractionRecord * const record) {
    const HtmlDocument::Node * const title(document.getDocumentNode().findFirst("title"));
    if (title != nullptr and not title->getChildren().empty())
        record->title_ = TextUtil::TrimWhitespace(title->getTextContent());

    const HtmlDocument::Node * const html(document.getDocumentNode().findFirst("html"));
    if (html != nullptr and html->hasAttribute("lang"))
        record->language_ = html->getAttribute("lang");
    if (record->language_ and not record->language_->empty())
        return;

    std::vector<const HtmlDocument::Node *> metas;
    document.getDocumentNode().findAll("meta", &metas);
    for (const auto meta : metas) {
        if (meta->getAttribute("http-equiv") == "Content-Language") {
            const std::string content(meta->getAttribute("content"));
            record->language_ = TextUtil::TrimWhitespace(content.substr(0, content.find(',')));
            return;
        }
    }
}


void ExtractMetaTags(const HtmlDocument &document, ExtractionRecord * const record) {
    std::vector<const HtmlDocument::Node *> metas;
    document.getDocumentNode().findAll("meta", &metas);

    bool description_seen(false);
    for (const auto meta : metas) {
        const std::string content(meta->getAttribute("content"));

        if (not description_seen and meta->getAttribute("name") == "description") {
            record->description_ = TextUtil::TrimWhitespace(content);
            description_seen = true;
        }

        std::string name(meta->getAttribute("name"));
        if (name.empty())
            name = meta->getAttribute("property");
        if (name.empty())
            name = meta->getAttribute("http-equiv");
        if (not name.empty() and not content.empty())
            record->meta_tags_[StringUtil::ToLower(name)] = content;

        if (content.empty())
            continue;

        std::string property(meta->getAttribute("property"));
        if (StringUtil::StartsWith(property, "og:")) {
            StringUtil::ReplaceString("og:", "", &property);
            if (not property.empty())
                record->social_tags_["og:" + property] = content;
        }

        std::string twitter_name(meta->getAttribute("name"));
        if (StringUtil::StartsWith(twitter_name, "twitter:")) {
            StringUtil::ReplaceString("twitter:", "", &twitter_name);
            if (not twitter_name.empty())
                record->social_tags_["twitter:" + twitter_name] = content;
        }
    }
}


// Collects everything that is based on attributes and must therefore run before the removal of non-content elements.
void ExtractReferences(const HtmlDocument &document, const Url &base_url, ExtractionRecord * const record) {
    const HtmlDocument::Node &document_node(document.getDocumentNode());

    std::vector<const HtmlDocument::Node *> elements;
    document_node.findAll("a", &elements);
    UrlCollector link_collector(base_url, MAX_LINK_COUNT, &record->links_);
    for (const auto anchor : elements) {
        if (link_collector.full())
            break;
        if (anchor->hasAttribute("href"))
            link_collector.add(anchor->getAttribute("href"));
    }

    elements.clear();
    document_node.findAll("img", &elements);
    UrlCollector image_collector(base_url, MAX_IMAGE_COUNT, &record->images_);
    for (const auto image : elements) {
        if (image_collector.full())
            break;
        if (image->hasAttribute("src"))
            image_collector.add(image->getAttribute("src"));
    }

    elements.clear();
    document_node.findAll(std::set<std::string>{ "video", "source", "iframe", "embed" }, &elements);
    UrlCollector video_collector(base_url, MAX_VIDEO_COUNT, &record->videos_);
    for (const auto element : elements) {
        if (video_collector.full())
            break;
        if (not element->hasAttribute("src"))
            continue;

        const std::string src(element->getAttribute("src"));
        const std::string &tag_name(element->getTagName());
        if (tag_name == "video" or (tag_name == "source" and element->hasAncestor("video")))
            video_collector.add(src);
        else if ((tag_name == "iframe" or tag_name == "embed") and IsVideoHost(Url(src, base_url).getHostname()))
            video_collector.add(src);
    }

    elements.clear();
    document_node.findAll("script", &elements);
    UrlCollector script_collector(base_url, MAX_SCRIPT_COUNT, &record->scripts_);
    for (const auto script : elements) {
        if (script_collector.full())
            break;
        if (script->hasAttribute("src"))
            script_collector.add(script->getAttribute("src"));
    }

    elements.clear();
    document_node.findAll("link", &elements);
    UrlCollector stylesheet_collector(base_url, MAX_STYLESHEET_COUNT, &record->stylesheets_);
    for (const auto link : elements) {
        if (stylesheet_collector.full())
            break;
        if (not link->hasAttribute("href"))
            continue;

        std::vector<std::string> rel_tokens;
        StringUtil::SplitOnWhitespace(StringUtil::ToLower(link->getAttribute("rel")), &rel_tokens);
        if (std::find(rel_tokens.cbegin(), rel_tokens.cend(), "stylesheet") != rel_tokens.cend())
            stylesheet_collector.add(link->getAttribute("href"));
    }
}


void ExtractText(const HtmlDocument &document, ExtractionRecord * const record) {
    record->full_text_ = NormaliseLines(document.getText("\n"));
    record->word_count_ = TextUtil::CountWords(record->full_text_);
    record->text_excerpt_ = MakeExcerpt(record->full_text_);
}


void CheckForLoginWall(const HtmlDocument &document, const ExtractionRecord &record) {
    std::vector<const HtmlDocument::Node *> elements;
    document.getDocumentNode().findAll("input", &elements);
    for (const auto input : elements) {
        if (StringUtil::ToLower(input->getAttribute("type")) == "password") {
            LOG_DEBUG("found a password field");
            throw ScrapeError(ScrapeError::LOGIN_WALL_DETECTED, LOGIN_WALL_MESSAGE);
        }
    }

    elements.clear();
    document.getDocumentNode().findAll("form", &elements);
    for (const auto form : elements) {
        if (StringUtil::FindCaseInsensitive(form->getAttribute("id"), "login") != std::string::npos) {
            LOG_DEBUG("found a login form");
            throw ScrapeError(ScrapeError::LOGIN_WALL_DETECTED, LOGIN_WALL_MESSAGE);
        }
    }

    if (StringUtil::ToLower(TextUtil::UTF8Truncate(record.full_text_, 500)).find("login") != std::string::npos) {
        LOG_DEBUG("found \"login\" near the start of the text");
        throw ScrapeError(ScrapeError::LOGIN_WALL_DETECTED, LOGIN_WALL_MESSAGE);
    }
}


void ExtractHeadings(const HtmlDocument &document, ExtractionRecord * const record) {
    for (const auto &heading_level : HEADING_LEVELS) {
        std::vector<std::string> &headings(record->headings_[heading_level]);

        std::vector<const HtmlDocument::Node *> elements;
        document.getDocumentNode().findAll(heading_level, &elements);
        for (const auto heading : elements) {
            const std::string heading_text(TextUtil::TrimWhitespace(heading->getTextContent()));
            if (not heading_text.empty())
                headings.emplace_back(heading_text);
        }
    }
}


// \return The cells of "row" that belong to "row" itself and not to a nested table.
std::vector<const HtmlDocument::Node *> GetOwnCells(const HtmlDocument::Node &row) {
    std::vector<const HtmlDocument::Node *> cells, own_cells;
    row.findAll(std::set<std::string>{ "td", "th" }, &cells);
    for (const auto cell : cells) {
        if (cell->getClosestAncestor("tr") == &row)
            own_cells.emplace_back(cell);
    }

    return own_cells;
}


void ExtractTables(const HtmlDocument &document, ExtractionRecord * const record) {
    std::vector<const HtmlDocument::Node *> tables;
    document.getDocumentNode().findAll("table", &tables);
    for (const auto table : tables) {
        if (record->tables_.size() >= MAX_TABLE_COUNT)
            break;

        std::vector<const HtmlDocument::Node *> rows;
        table->findAll("tr", &rows);

        Table new_table;
        bool header_row_seen(false);
        for (const auto row : rows) {
            if (row->getClosestAncestor("table") != table)
                continue;

            const std::vector<const HtmlDocument::Node *> cells(GetOwnCells(*row));
            bool has_data_cell(false), has_header_cell(false);
            for (const auto cell : cells) {
                if (cell->getTagName() == "td")
                    has_data_cell = true;
                else
                    has_header_cell = true;
            }

            if (has_header_cell and not header_row_seen) {
                for (const auto cell : cells) {
                    if (cell->getTagName() == "th")
                        new_table.headers_.emplace_back(GetCollapsedText(*cell));
                }
                header_row_seen = true;
            }

            if (has_data_cell) {
                std::vector<std::string> row_cells;
                for (const auto cell : cells)
                    row_cells.emplace_back(GetCollapsedText(*cell));
                new_table.rows_.emplace_back(row_cells);
            }
        }

        if (not new_table.headers_.empty() or not new_table.rows_.empty())
            record->tables_.emplace_back(new_table);
    }
}


void ExtractForms(const HtmlDocument &document, const Url &base_url, ExtractionRecord * const record) {
    std::vector<const HtmlDocument::Node *> labels;
    document.getDocumentNode().findAll("label", &labels);
    std::unordered_map<std::string, std::string> ids_to_label_texts_map;
    for (const auto label : labels) {
        if (label->hasAttribute("for"))
            ids_to_label_texts_map.emplace(label->getAttribute("for"), GetCollapsedText(*label));
    }

    std::vector<const HtmlDocument::Node *> forms;
    document.getDocumentNode().findAll("form", &forms);
    for (const auto form : forms) {
        if (record->forms_.size() >= MAX_FORM_COUNT)
            break;

        std::vector<const HtmlDocument::Node *> fields;
        form->findAll(std::set<std::string>{ "input", "textarea", "select" }, &fields);
        if (fields.empty())
            continue;

        Form new_form;
        const std::string action(form->getAttribute("action"));
        if (not action.empty())
            new_form.action_ = Url(action, base_url).toString();
        new_form.method_ = StringUtil::ToUpper(StringUtil::TrimWhite(form->getAttribute("method")));
        if (new_form.method_.empty())
            new_form.method_ = "GET";

        for (const auto field : fields) {
            FormInput input;
            input.type_ = (field->getTagName() == "input") ? StringUtil::ToLower(field->getAttribute("type", "text")) : field->getTagName();
            input.name_ = field->getAttribute("name");
            input.placeholder_ = field->getAttribute("placeholder");

            const auto id_and_label_text(field->hasAttribute("id") ? ids_to_label_texts_map.find(field->getAttribute("id"))
                                                                    : ids_to_label_texts_map.end());
            if (id_and_label_text != ids_to_label_texts_map.end())
                input.label_ = id_and_label_text->second;
            else {
                const HtmlDocument::Node * const enclosing_label(field->getClosestAncestor("label"));
                if (enclosing_label != nullptr)
                    input.label_ = GetCollapsedText(*enclosing_label);
            }

            new_form.inputs_.emplace_back(input);
        }

        record->forms_.emplace_back(new_form);
    }
}


void ExtractButtons(const HtmlDocument &document, ExtractionRecord * const record) {
    std::vector<const HtmlDocument::Node *> elements;
    document.getDocumentNode().findAll(std::set<std::string>{ "button", "input" }, &elements);
    for (const auto element : elements) {
        if (record->buttons_.size() >= MAX_BUTTON_COUNT)
            break;

        Button button;
        if (element->getTagName() == "button") {
            button.text_ = GetCollapsedText(*element);
            button.type_ = StringUtil::ToLower(element->getAttribute("type", "submit"));
        } else {
            button.type_ = StringUtil::ToLower(element->getAttribute("type"));
            if (button.type_ != "submit" and button.type_ != "button" and button.type_ != "reset")
                continue;
            button.text_ = element->getAttribute("value");
        }
        StringUtil::SplitOnWhitespace(element->getAttribute("class"), &button.classes_);

        record->buttons_.emplace_back(button);
    }
}


void ExtractLists(const HtmlDocument &document, ExtractionRecord * const record) {
    std::vector<const HtmlDocument::Node *> lists;
    document.getDocumentNode().findAll(std::set<std::string>{ "ul", "ol" }, &lists);
    for (const auto list : lists) {
        if (record->lists_.size() >= MAX_LIST_COUNT)
            break;

        std::vector<const HtmlDocument::Node *> list_items;
        list->findAll("li", &list_items);

        List new_list;
        new_list.type_ = list->getTagName();
        for (const auto list_item : list_items) {
            if (new_list.items_.size() >= MAX_LIST_ITEM_COUNT)
                break;

            // Skip items of nested lists:
            const HtmlDocument::Node *owner(list_item->getParent());
            while (owner != nullptr and owner->getTagName() != "ul" and owner->getTagName() != "ol")
                owner = owner->getParent();
            if (owner != list)
                continue;

            const std::string item_text(GetCollapsedText(*list_item));
            if (not item_text.empty())
                new_list.items_.emplace_back(item_text);
        }

        if (not new_list.items_.empty())
            record->lists_.emplace_back(new_list);
    }
}


void ExtractTextBlocks(const HtmlDocument &document, const std::set<std::string> &tag_names, const size_t max_count,
                       std::vector<std::string> * const text_blocks)
{
    std::vector<const HtmlDocument::Node *> elements;
    document.getDocumentNode().findAll(tag_names, &elements);
    for (const auto element : elements) {
        if (text_blocks->size() >= max_count)
            break;

        const std::string text(GetCollapsedText(*element));
        if (not text.empty())
            text_blocks->emplace_back(text);
    }
}


void ExtractCodeBlocks(const HtmlDocument &document, ExtractionRecord * const record) {
    std::vector<const HtmlDocument::Node *> elements;
    document.getDocumentNode().findAll(std::set<std::string>{ "pre", "code" }, &elements);
    for (const auto element : elements) {
        if (record->code_blocks_.size() >= MAX_CODE_BLOCK_COUNT)
            break;
        if (element->hasAncestor("pre"))
            continue;

        const std::string raw_text(element->getTextContent());
        if (TextUtil::UTF8Length(raw_text) < MIN_CODE_BLOCK_LENGTH)
            continue;

        record->code_blocks_.emplace_back(TextUtil::UTF8Truncate(TextUtil::TrimWhitespace(raw_text), MAX_CODE_BLOCK_LENGTH));
    }
}


} // unnamed namespace


std::string MakeExcerpt(const std::string &text) {
    if (TextUtil::UTF8Length(text) <= MAX_EXCERPT_LENGTH)
        return text;

    return TextUtil::UTF8Truncate(text, MAX_EXCERPT_LENGTH) + "…";
}


std::string NormaliseLines(const std::string &text) {
    std::vector<std::string> lines;
    TextUtil::SplitLines(text, &lines);

    std::vector<std::string> non_empty_lines;
    for (const auto &line : lines) {
        const std::string trimmed_line(TextUtil::TrimWhitespace(line));
        if (not trimmed_line.empty())
            non_empty_lines.emplace_back(trimmed_line);
    }

    return StringUtil::Join(non_empty_lines, "\n");
}


ExtractionRecord Extract(const std::string &html, const Url &base_url) {
    HtmlDocument document(html);

    ExtractionRecord record;
    ExtractTitleAndLanguage(document, &record);
    ExtractMetaTags(document, &record);
    ExtractReferences(document, base_url, &record);

    const size_t removed_count(document.removeElements(NON_CONTENT_ELEMENTS));
    LOG_DEBUG("removed " + std::to_string(removed_count) + " non-content element(s)");

    ExtractText(document, &record);
    CheckForLoginWall(document, record);

    ExtractHeadings(document, &record);
    ExtractTables(document, &record);
    ExtractForms(document, base_url, &record);
    ExtractButtons(document, &record);
    ExtractLists(document, &record);
    ExtractTextBlocks(document, { "p" }, MAX_PARAGRAPH_COUNT, &record.paragraphs_);
    ExtractTextBlocks(document, { "blockquote", "q" }, MAX_QUOTE_COUNT, &record.quotes_);
    ExtractCodeBlocks(document, &record);

    return record;
}


} // namespace HtmlExtractor
