/** \file   HtmlDocument.h
 *  \brief  A simple document tree for HTML pages, built with HtmlParser.
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


#include <memory>
#include <set>
#include <string>
#include <vector>
#include "HtmlParser.h"


/** \class  HtmlDocument
 *  \brief  An element tree for an HTML document.
 *
 *  Tree construction is lenient: void elements never have children, an end tag closes the innermost open element with
 *  the same name and is ignored if there is no such element, and a few end tags are implied, e.g. an opening "li" tag
 *  closes a still open "li" element of the same list and block-level elements close an open "p" element.  Comments and
 *  declarations are not part of the tree.
 */
class HtmlDocument {
    class TreeBuilder;
public:
    class Node {
        friend class HtmlDocument;
        friend class TreeBuilder;
        Node *parent_;
        bool is_element_;
        std::string tag_name_; // Empty for text nodes and the document node.
        std::string text_;     // Empty for element nodes.
        HtmlParser::AttributeMap attribute_map_;
        std::vector<std::unique_ptr<Node>> children_;
    public:
        Node(Node * const parent, const std::string &tag_name, const HtmlParser::AttributeMap &attribute_map)
            : parent_(parent), is_element_(true), tag_name_(tag_name), attribute_map_(attribute_map) { }
        Node(Node * const parent, const std::string &text): parent_(parent), is_element_(false), text_(text) { }

        inline bool isElement() const { return is_element_; }
        inline bool isText() const { return not is_element_; }
        inline const std::string &getTagName() const { return tag_name_; }

        /** \return The contents of a text node. */
        inline const std::string &getText() const { return text_; }

        inline const Node *getParent() const { return parent_; }
        inline const std::vector<std::unique_ptr<Node>> &getChildren() const { return children_; }
        inline const HtmlParser::AttributeMap &getAttributes() const { return attribute_map_; }
        inline bool hasAttribute(const std::string &name) const { return attribute_map_.hasAttribute(name); }
        inline std::string getAttribute(const std::string &name, const std::string &default_value = "") const
            { return attribute_map_.get(name, default_value); }

        /** \return The concatenation of the contents of all descendant text nodes in document order. */
        std::string getTextContent() const;

        /** \brief  Appends the contents of all descendant text nodes in document order. */
        void collectTexts(std::vector<std::string> * const texts) const;

        /** \brief  Appends all descendant elements whose tag name is in "tag_names" in document order. */
        void findAll(const std::set<std::string> &tag_names, std::vector<const Node *> * const elements) const;
        void findAll(const std::string &tag_name, std::vector<const Node *> * const elements) const
            { findAll(std::set<std::string>{ tag_name }, elements); }

        /** \return The first descendant element named "tag_name" in document order or nullptr. */
        const Node *findFirst(const std::string &tag_name) const;

        /** \return True if any ancestor element is named "tag_name". */
        bool hasAncestor(const std::string &tag_name) const;

        /** \return The closest ancestor element named "tag_name" or nullptr. */
        const Node *getClosestAncestor(const std::string &tag_name) const;
    };
private:
    std::unique_ptr<Node> document_node_;
public:
    explicit HtmlDocument(const std::string &html);

    /** \return The pseudo element at the root of the tree.  It has no tag name. */
    const Node &getDocumentNode() const { return *document_node_; }

    /** \brief  Deletes all elements named in "tag_names" together with their descendants.
     *  \return The number of removed elements, not counting descendants.
     */
    size_t removeElements(const std::set<std::string> &tag_names);

    /** \return The contents of all text nodes in document order, joined with "separator". */
    std::string getText(const std::string &separator) const;
};
