/** \brief Test cases for HtmlParser and HtmlDocument
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
#define BOOST_TEST_MODULE HtmlDocument
#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>
#include <string>
#include <vector>
#include "HtmlDocument.h"
#include "HtmlParser.h"


namespace {


class ChunkCollector : public HtmlParser {
public:
    std::vector<std::string> chunks_;
public:
    explicit ChunkCollector(const std::string &html): HtmlParser(html, OPENING_TAG | CLOSING_TAG | TEXT | COMMENT) { }
    void notify(const Chunk &chunk) override { chunks_.emplace_back(ChunkTypeToString(chunk.type_) + ":" + chunk.toString()); }
};


std::vector<const HtmlDocument::Node *> FindAll(const HtmlDocument &document, const std::string &tag_name) {
    std::vector<const HtmlDocument::Node *> elements;
    document.getDocumentNode().findAll(tag_name, &elements);
    return elements;
}


} // unnamed namespace


BOOST_AUTO_TEST_CASE(Chunks) {
    ChunkCollector collector("<P Class=\"x\">Hi<!-- note --><BR/></p>");
    collector.parse();
    const std::vector<std::string> expected_chunks{
        "OPENING_TAG:<p class=\"x\">", "TEXT:Hi", "COMMENT:<!-- note -->", "OPENING_TAG:<br/>", "CLOSING_TAG:</p>"
    };
    BOOST_CHECK_EQUAL_COLLECTIONS(collector.chunks_.cbegin(), collector.chunks_.cend(), expected_chunks.cbegin(),
                                  expected_chunks.cend());
}


BOOST_AUTO_TEST_CASE(RawText) {
    ChunkCollector collector("<script>if (a < b && c) { x = '</div>'; }</SCRIPT><p>after</p>");
    collector.parse();
    BOOST_REQUIRE_EQUAL(collector.chunks_.size(), 6u);
    BOOST_CHECK_EQUAL(collector.chunks_[1], "TEXT:if (a < b && c) { x = '</div>'; }");
    BOOST_CHECK_EQUAL(collector.chunks_[2], "CLOSING_TAG:</script>");
}


BOOST_AUTO_TEST_CASE(TagsCutOffByEndOfInput) {
    ChunkCollector collector1("<p>x</p><a href='");
    collector1.parse();
    const std::vector<std::string> expected_chunks1{ "OPENING_TAG:<p>", "TEXT:x", "CLOSING_TAG:</p>" };
    BOOST_CHECK_EQUAL_COLLECTIONS(collector1.chunks_.cbegin(), collector1.chunks_.cend(), expected_chunks1.cbegin(),
                                  expected_chunks1.cend());

    ChunkCollector collector2("text<img src=a.png");
    collector2.parse();
    BOOST_REQUIRE_EQUAL(collector2.chunks_.size(), 1u);
    BOOST_CHECK_EQUAL(collector2.chunks_[0], "TEXT:text");

    ChunkCollector collector3("<b>bold</b");
    collector3.parse();
    BOOST_REQUIRE_EQUAL(collector3.chunks_.size(), 2u);
    BOOST_CHECK_EQUAL(collector3.chunks_[1], "TEXT:bold");
}


BOOST_AUTO_TEST_CASE(DecodeEntities) {
    BOOST_CHECK_EQUAL(HtmlParser::DecodeEntities("Fish &amp; Chips"), "Fish & Chips");
    BOOST_CHECK_EQUAL(HtmlParser::DecodeEntities("&lt;b&gt;"), "<b>");
    BOOST_CHECK_EQUAL(HtmlParser::DecodeEntities("&#65;&#x42;&#X43;"), "ABC");
    BOOST_CHECK_EQUAL(HtmlParser::DecodeEntities("&copy 2025"), "\xC2\xA9 2025");
    BOOST_CHECK_EQUAL(HtmlParser::DecodeEntities("&#150;"), "\xE2\x80\x93");
    BOOST_CHECK_EQUAL(HtmlParser::DecodeEntities("&#0;"), "\xEF\xBF\xBD");
    BOOST_CHECK_EQUAL(HtmlParser::DecodeEntities("AT&T &unknown; &#;"), "AT&T &unknown; &#;");
    BOOST_CHECK_EQUAL(HtmlParser::DecodeEntities("?a=1&copy=2", /* in_attribute_value = */ true), "?a=1&copy=2");
}


BOOST_AUTO_TEST_CASE(Attributes) {
    const HtmlDocument document("<a HREF='/one?x=1&amp;y=2' href=\"/two\" data-flag title=unquoted>link</a>");
    const auto anchors(FindAll(document, "a"));
    BOOST_REQUIRE_EQUAL(anchors.size(), 1u);
    BOOST_CHECK_EQUAL(anchors[0]->getAttribute("href"), "/one?x=1&y=2");
    BOOST_CHECK_EQUAL(anchors[0]->getAttributes().size(), 3u);
    BOOST_CHECK(anchors[0]->hasAttribute("data-flag"));
    BOOST_CHECK_EQUAL(anchors[0]->getAttribute("data-flag", "missing"), "");
    BOOST_CHECK_EQUAL(anchors[0]->getAttribute("title"), "unquoted");
    BOOST_CHECK_EQUAL(anchors[0]->getAttribute("rel", "none"), "none");
    BOOST_CHECK_EQUAL(anchors[0]->getTextContent(), "link");
}


BOOST_AUTO_TEST_CASE(ImpliedEndTags) {
    const HtmlDocument document("<ul><li>one<li>two<li>three</ul>"
                                "<table><tr><td>1<td>2<tr><td>3</table>"
                                "<p>para<div>block</div>");
    const auto lists(FindAll(document, "ul"));
    BOOST_REQUIRE_EQUAL(lists.size(), 1u);
    BOOST_CHECK_EQUAL(lists[0]->getChildren().size(), 3u);

    const auto rows(FindAll(document, "tr"));
    BOOST_REQUIRE_EQUAL(rows.size(), 2u);
    BOOST_CHECK_EQUAL(rows[0]->getChildren().size(), 2u);
    BOOST_CHECK_EQUAL(rows[1]->getTextContent(), "3");

    const auto divs(FindAll(document, "div"));
    BOOST_REQUIRE_EQUAL(divs.size(), 1u);
    BOOST_CHECK(not divs[0]->hasAncestor("p"));
    BOOST_CHECK_EQUAL(FindAll(document, "p")[0]->getTextContent(), "para");
}


BOOST_AUTO_TEST_CASE(NestedListsKeepTheirItems) {
    const HtmlDocument document("<ul><li>outer<ul><li>inner one<li>inner two</ul></li><li>outer two</ul>");
    const auto items(FindAll(document, "li"));
    BOOST_REQUIRE_EQUAL(items.size(), 4u);
    BOOST_CHECK_EQUAL(items[1]->getClosestAncestor("li"), items[0]);
    BOOST_CHECK_EQUAL(items[2]->getClosestAncestor("li"), items[0]);
    BOOST_CHECK(items[3]->getClosestAncestor("li") == nullptr);
}


BOOST_AUTO_TEST_CASE(StrayEndTagsAndVoidElements) {
    const HtmlDocument document("<div>a</span>b<br>c<img src=x.png>d</div>");
    const auto divs(FindAll(document, "div"));
    BOOST_REQUIRE_EQUAL(divs.size(), 1u);
    BOOST_CHECK_EQUAL(divs[0]->getTextContent(), "abcd");
    BOOST_CHECK_EQUAL(divs[0]->getChildren().size(), 5u);
    BOOST_CHECK(FindAll(document, "br")[0]->getChildren().empty());
}


BOOST_AUTO_TEST_CASE(CommentsAreDropped) {
    const HtmlDocument document("<!DOCTYPE html><p>a<!-- hidden -->b</p>");
    const auto paragraphs(FindAll(document, "p"));
    BOOST_REQUIRE_EQUAL(paragraphs.size(), 1u);
    BOOST_REQUIRE_EQUAL(paragraphs[0]->getChildren().size(), 1u);
    BOOST_CHECK_EQUAL(paragraphs[0]->getChildren()[0]->getText(), "ab");
}


BOOST_AUTO_TEST_CASE(RemoveElements) {
    HtmlDocument document("<body><nav>menu<nav>sub</nav></nav><p>text<script>x()</script></p><footer>foot</footer></body>");
    BOOST_CHECK_EQUAL(document.removeElements({ "nav", "script", "footer" }), 3u);
    BOOST_CHECK_EQUAL(document.getText("|"), "text");
    BOOST_CHECK(document.getDocumentNode().findFirst("nav") == nullptr);
    BOOST_CHECK(document.getDocumentNode().findFirst("body") != nullptr);
}


BOOST_AUTO_TEST_CASE(GetText) {
    const HtmlDocument document("<h1>Title</h1><p>First <b>bold</b> rest</p>");
    BOOST_CHECK_EQUAL(document.getText("\n"), "Title\nFirst \nbold\n rest");
    BOOST_CHECK_EQUAL(document.getDocumentNode().getTextContent(), "TitleFirst bold rest");
}


BOOST_AUTO_TEST_CASE(DeepNesting) {
    std::string html;
    for (unsigned i(0); i < 2000; ++i)
        html += "<div>";
    html += "deep";

    const HtmlDocument document(html);
    BOOST_CHECK_EQUAL(FindAll(document, "div").size(), 2000u);
    BOOST_CHECK_EQUAL(document.getText(""), "deep");
}


BOOST_AUTO_TEST_CASE(MalformedInput) {
    BOOST_CHECK_EQUAL(HtmlDocument("").getText(""), "");
    BOOST_CHECK_EQUAL(HtmlDocument("a < b and c > d <").getText(""), "a < b and c > d <");
    BOOST_CHECK_EQUAL(HtmlDocument("<p>unterminated <!-- comment").getText(""), "unterminated ");
    BOOST_CHECK(HtmlDocument("<p title=\"never closed>text").getDocumentNode().getChildren().empty());
    BOOST_CHECK_EQUAL(HtmlDocument("<p>kept</p><a href='").getText(""), "kept");
}
