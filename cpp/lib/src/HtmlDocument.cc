/** \file   HtmlDocument.cc
 *  \brief  Implementation of class HtmlDocument.
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
#include "HtmlDocument.h"
#include <map>
#include "StringUtil.h"
#include "util.h"


namespace {


// Deeper elements are attached to the innermost element at this depth.
const size_t MAX_NESTING_DEPTH(512);


const std::set<std::string> VOID_ELEMENTS{
    "area", "base", "br", "col", "embed", "hr", "img", "input", "keygen", "link", "meta", "param", "source", "track", "wbr"
};


// Opening tags of these elements close an open "p" element.
const std::set<std::string> PARAGRAPH_CLOSERS{
    "address", "article", "aside", "blockquote", "details", "div", "dl", "fieldset", "figcaption", "figure", "footer", "form",
    "h1", "h2", "h3", "h4", "h5", "h6", "header", "hr", "main", "menu", "nav", "ol", "p", "pre", "section", "table", "ul"
};


// An open "p" element is not closed across these.
const std::set<std::string> PARAGRAPH_SCOPE_BOUNDARIES{
    "applet", "button", "caption", "html", "marquee", "object", "table", "td", "template", "th"
};


struct ImpliedEndRule {
    std::set<std::string> closed_elements_;
    std::set<std::string> boundaries_;
};


// Maps an opening tag to the open elements it implicitly closes.
const std::map<std::string, ImpliedEndRule> IMPLIED_END_RULES{
    { "li",       { { "li" },                        { "ul", "ol", "menu", "table" } } },
    { "dt",       { { "dt", "dd" },                  { "dl", "table" } } },
    { "dd",       { { "dt", "dd" },                  { "dl", "table" } } },
    { "tr",       { { "tr" },                        { "table", "thead", "tbody", "tfoot" } } },
    { "td",       { { "td", "th" },                  { "tr", "table" } } },
    { "th",       { { "td", "th" },                  { "tr", "table" } } },
    { "thead",    { { "thead", "tbody", "tfoot" },   { "table" } } },
    { "tbody",    { { "thead", "tbody", "tfoot" },   { "table" } } },
    { "tfoot",    { { "thead", "tbody", "tfoot" },   { "table" } } },
    { "option",   { { "option" },                    { "select", "datalist", "optgroup" } } },
    { "optgroup", { { "optgroup", "option" },        { "select" } } },
};


} // unnamed namespace


class HtmlDocument::TreeBuilder : public HtmlParser {
    std::vector<Node *> open_elements_; // The first entry is always the document node.
public:
    TreeBuilder(const std::string &html, Node * const document_node)
        : HtmlParser(html, OPENING_TAG | CLOSING_TAG | TEXT), open_elements_{ document_node } { }

    void notify(const Chunk &chunk) override;
private:
    inline Node *currentNode() const { return open_elements_.back(); }
    void closeElement(const std::set<std::string> &tag_names, const std::set<std::string> &boundaries);
    void appendText(const std::string &text);
};


// TreeBuilder::closeElement -- pops the innermost open element named in "tag_names" and everything above it unless we
//                              encounter an element named in "boundaries" first.
//
void HtmlDocument::TreeBuilder::closeElement(const std::set<std::string> &tag_names, const std::set<std::string> &boundaries) {
    for (size_t i(open_elements_.size() - 1); i > 0; --i) {
        const std::string &tag_name(open_elements_[i]->tag_name_);
        if (tag_names.find(tag_name) != tag_names.cend()) {
            open_elements_.resize(i);
            return;
        }
        if (boundaries.find(tag_name) != boundaries.cend())
            return;
    }
}


void HtmlDocument::TreeBuilder::appendText(const std::string &text) {
    if (text.empty())
        return;

    // Merge adjacent text:
    Node * const current_node(currentNode());
    if (not current_node->children_.empty() and current_node->children_.back()->isText())
        current_node->children_.back()->text_ += text;
    else
        current_node->children_.emplace_back(new Node(current_node, text));
}


void HtmlDocument::TreeBuilder::notify(const Chunk &chunk) {
    if (chunk.type_ == TEXT) {
        appendText(chunk.text_);
        return;
    }

    const std::string &tag_name(chunk.text_);
    if (chunk.type_ == CLOSING_TAG) {
        static const std::set<std::string> NO_BOUNDARIES;
        closeElement({ tag_name }, NO_BOUNDARIES);
        return;
    }

    // If we get here we have an opening tag.

    const auto implied_end_rule(IMPLIED_END_RULES.find(tag_name));
    if (implied_end_rule != IMPLIED_END_RULES.cend())
        closeElement(implied_end_rule->second.closed_elements_, implied_end_rule->second.boundaries_);
    if (PARAGRAPH_CLOSERS.find(tag_name) != PARAGRAPH_CLOSERS.cend())
        closeElement({ "p" }, PARAGRAPH_SCOPE_BOUNDARIES);

    Node * const parent(currentNode());
    parent->children_.emplace_back(new Node(parent, tag_name, *chunk.attribute_map_));
    if (chunk.is_self_closing_ or VOID_ELEMENTS.find(tag_name) != VOID_ELEMENTS.cend())
        return;

    if (unlikely(open_elements_.size() > MAX_NESTING_DEPTH)) {
        LOG_DEBUG("maximum nesting depth exceeded, flattening \"" + tag_name + "\" element");
        return;
    }
    open_elements_.emplace_back(parent->children_.back().get());
}


std::string HtmlDocument::Node::getTextContent() const {
    std::vector<std::string> texts;
    collectTexts(&texts);
    return StringUtil::Join(texts, "");
}


void HtmlDocument::Node::collectTexts(std::vector<std::string> * const texts) const {
    for (const auto &child : children_) {
        if (child->isText())
            texts->emplace_back(child->text_);
        else
            child->collectTexts(texts);
    }
}


void HtmlDocument::Node::findAll(const std::set<std::string> &tag_names, std::vector<const Node *> * const elements) const {
    for (const auto &child : children_) {
        if (child->isText())
            continue;
        if (tag_names.find(child->tag_name_) != tag_names.cend())
            elements->emplace_back(child.get());
        child->findAll(tag_names, elements);
    }
}


const HtmlDocument::Node *HtmlDocument::Node::findFirst(const std::string &tag_name) const {
    for (const auto &child : children_) {
        if (child->isText())
            continue;
        if (child->tag_name_ == tag_name)
            return child.get();
        const Node * const match(child->findFirst(tag_name));
        if (match != nullptr)
            return match;
    }

    return nullptr;
}


const HtmlDocument::Node *HtmlDocument::Node::getClosestAncestor(const std::string &tag_name) const {
    for (const Node *ancestor(parent_); ancestor != nullptr; ancestor = ancestor->parent_) {
        if (ancestor->is_element_ and ancestor->tag_name_ == tag_name)
            return ancestor;
    }

    return nullptr;
}


bool HtmlDocument::Node::hasAncestor(const std::string &tag_name) const {
    return getClosestAncestor(tag_name) != nullptr;
}


HtmlDocument::HtmlDocument(const std::string &html)
    : document_node_(new Node(nullptr, "", HtmlParser::AttributeMap()))
{
    TreeBuilder tree_builder(html, document_node_.get());
    tree_builder.parse();
}


namespace {


size_t RemoveElements(std::vector<std::unique_ptr<HtmlDocument::Node>> * const children, const std::set<std::string> &tag_names) {
    size_t removed_count(0);
    for (auto child(children->begin()); child != children->end(); /* Intentionally empty! */) {
        if ((*child)->isElement() and tag_names.find((*child)->getTagName()) != tag_names.cend()) {
            child = children->erase(child);
            ++removed_count;
        } else
            ++child;
    }

    return removed_count;
}


} // unnamed namespace


size_t HtmlDocument::removeElements(const std::set<std::string> &tag_names) {
    size_t removed_count(0);
    std::vector<Node *> nodes_to_visit{ document_node_.get() };
    while (not nodes_to_visit.empty()) {
        Node * const node(nodes_to_visit.back());
        nodes_to_visit.pop_back();
        removed_count += RemoveElements(&node->children_, tag_names);
        for (const auto &child : node->children_) {
            if (child->isElement())
                nodes_to_visit.emplace_back(child.get());
        }
    }

    return removed_count;
}


std::string HtmlDocument::getText(const std::string &separator) const {
    std::vector<std::string> texts;
    document_node_->collectTexts(&texts);
    return StringUtil::Join(texts, separator);
}
