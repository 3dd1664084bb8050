/** \file    HtmlParser.h
 *  \brief   Declaration of an HTML parser class.
 *  \author  Dr. Johannes Ruscheinski
 */

/*
 *  Copyright 2002-2007 Dr. Johannes Ruscheinski.
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as published
 *  by the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software
 *  Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */

#ifndef HTML_PARSER_H
#define HTML_PARSER_H


#include <string>
#include <utility>
#include <vector>


/** \class  HtmlParser
 *  \brief  A parser for HTML documents.
 *
 *  This class provides a simple, forgiving HTML tokenizer.  To use it, you should create a subclass that specifies which
 *  tokens should generate events (by setting the notification_mask) and then overriding the notify member function to
 *  take an appropriate action whenever an event occurs.
 *
 *  Character references are decoded in text and attribute values.  The contents of "script" and "style" elements are
 *  reported verbatim as a single TEXT chunk.  Tag and attribute names are reported in lowercase.  A tag that is not
 *  closed before the end of the input is dropped.
 */
class HtmlParser {
    const std::string input_;
    size_t pos_;
    const unsigned chunk_mask_;
public:
    // The different Chunk types:
    static constexpr unsigned OPENING_TAG   = 1u << 0u;
    static constexpr unsigned CLOSING_TAG   = 1u << 1u;
    static constexpr unsigned TEXT          = 1u << 2u;
    static constexpr unsigned COMMENT       = 1u << 3u;
    static constexpr unsigned END_OF_STREAM = 1u << 4u;
    static constexpr unsigned EVERYTHING    = 0xFFFFu;

    /** \class  AttributeMap
     *  \brief  A representation of the HTML attributes in a single HTML Element, in document order.
     */
    class AttributeMap {
        std::vector<std::pair<std::string, std::string>> name_value_pairs_;
    public:
        typedef std::vector<std::pair<std::string, std::string>>::const_iterator const_iterator;
    public:
        bool empty() const { return name_value_pairs_.empty(); }
        size_t size() const { return name_value_pairs_.size(); }

        /** \brief  Insert a value into an AttributeMap unless the attribute is already present.
         *  \return True if the attribute wasn't in the map yet, else false.
         */
        bool insert(const std::string &name, const std::string &value);

        bool hasAttribute(const std::string &name) const { return find(name) != end(); }

        /** \return The value of "name" or "default_value" if there is no such attribute. */
        std::string get(const std::string &name, const std::string &default_value = "") const;

        /** \brief  Reconstruct the string representation of this HTML fragment.
         *  \note   The reconstructed text may differ from the original HTML.
         */
        std::string toString() const;

        const_iterator find(const std::string &name) const;
        const_iterator begin() const { return name_value_pairs_.begin(); }
        const_iterator end() const { return name_value_pairs_.end(); }
    };

    /** \class  Chunk
     *  \brief  A representation of a small "chunk" of an HTML document.
     */
    struct Chunk {
        unsigned type_;
        std::string text_; // The tag name for tags, decoded text for TEXT and the raw text for COMMENT chunks.
        const AttributeMap *attribute_map_; // only non-nullptr if type_ == OPENING_TAG
        bool is_self_closing_;              // only meaningful if type_ == OPENING_TAG
    public:
        Chunk(const unsigned type, const std::string &text, const AttributeMap * const attribute_map = nullptr,
              const bool is_self_closing = false)
            : type_(type), text_(text), attribute_map_(attribute_map), is_self_closing_(is_self_closing) { }

        /** \brief  Reconstruct the string representation of this HTML fragment.
         *  \note   The reconstructed text may differ from the original HTML.
         */
        std::string toString() const;
    };
public:
    explicit HtmlParser(const std::string &input_string, const unsigned chunk_mask = EVERYTHING);
    HtmlParser(const HtmlParser &rhs) = delete;
    virtual ~HtmlParser() = default;

    HtmlParser &operator=(const HtmlParser &rhs) = delete;

    void parse();
    virtual void notify(const Chunk &chunk) = 0;

    static std::string ChunkTypeToString(const unsigned chunk_type);

    /** \brief  Replaces HTML character references, e.g. "&amp;", "&#8230;" or "&#x2014;", with their UTF-8 equivalents.
     *  \param  in_attribute_value  If true, named references lacking the terminating semicolon are left alone.
     */
    static std::string DecodeEntities(const std::string &text, const bool in_attribute_value = false);
private:
    void report(const unsigned chunk_type, const std::string &text, const AttributeMap * const attribute_map = nullptr,
                const bool is_self_closing = false);
    bool atMarkupStart() const;
    void parseText();
    void parseTag();
    void parseRawText(const std::string &tag_name);
    void skipComment();
    void skipDeclaration();
    void skipWhiteSpace();
    std::string extractTagName();
    bool extractAttribute(std::string * const attribute_name, std::string * const attribute_value);
};


#endif // ifndef HTML_PARSER_H
