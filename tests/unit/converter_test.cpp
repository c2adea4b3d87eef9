#include <html2org/convert/converter.h>
#include <html2org/convert/render_context.h>
#include <html2org/html/html_parser.h>

#include <gtest/gtest.h>

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

using namespace html2org;
using convert::ConvertResult;
using convert::Converter;
using convert::Options;

namespace {

std::string to_org(const std::string& html, const Options& options = {}) {
    const ConvertResult result = convert::convert_string(html, options);
    EXPECT_TRUE(result.ok) << result.message;
    return result.text;
}

Options pretty_options() {
    Options options;
    options.pretty_tables = true;
    options.pretty_table_options = convert::make_default_pretty_table_options();
    return options;
}

std::vector<core::DiagnosticEvent> events_from(const core::DiagnosticLog& log,
                                               const std::string& module) {
    std::vector<core::DiagnosticEvent> selected;
    for (const auto& event : log.events()) {
        if (event.module == module) {
            selected.push_back(event);
        }
    }
    return selected;
}

std::size_t count_occurrences(const std::string& text, const std::string& needle) {
    std::size_t count = 0;
    for (std::size_t pos = text.find(needle); pos != std::string::npos;
         pos = text.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

}  // namespace

// ============================================================================
// Whitespace and paragraphs
// ============================================================================

TEST(ConvertTextTest, StripsWhitespace) {
    EXPECT_EQ(to_org("test text"), "test text");
    EXPECT_EQ(to_org("  \ttext\ntext\n"), "text text");
    EXPECT_EQ(to_org("  \na \n\t \n \n a \t"), "a a");
    EXPECT_EQ(to_org("test        text"), "test text");
    EXPECT_EQ(to_org("test&nbsp;&nbsp;&nbsp; text&nbsp;"), "test    text");
    EXPECT_EQ(to_org("<p>This is &lsquo;<span>foo</span>&rsquo;.</p>"),
              "This is \xE2\x80\x98" "foo\xE2\x80\x99.");
}

TEST(ConvertTextTest, ParagraphsAndBreaks) {
    EXPECT_EQ(to_org("Test text<br>"), "Test text");
    EXPECT_EQ(to_org("Test text<br>Test"), "Test text\nTest");
    EXPECT_EQ(to_org("<p>Test text</p>"), "Test text");
    EXPECT_EQ(to_org("<p>Test text</p><p>Test text</p>"), "Test text\n\nTest text");
    EXPECT_EQ(to_org("\n<p>Test text</p>\n\n\n\t<p>Test text</p>\n"), "Test text\n\nTest text");
    EXPECT_EQ(to_org("\n<p>Test text<br/>Test text</p>\n"), "Test text\nTest text");
    EXPECT_EQ(to_org("\n<p>Test text<br> \tTest text<br></p>\n"), "Test text\nTest text");
    EXPECT_EQ(to_org("Test text<br><BR />Test text"), "Test text\n\nTest text");
    EXPECT_EQ(to_org("a&nbsp;<br>b"), "a\nb");
}

TEST(ConvertTextTest, MixedInlineAndBlockText) {
    EXPECT_EQ(to_org("hi\n\n\t\t\t<br>\n\n\thello <a href=\"https://google.com\">google</a>\n"
                     "\t<br><br>\n\ttest<p>List:</p>\n\n\t<ul>\n"
                     "\t\t<li><a href=\"foo\">Foo</a></li>\n"
                     "\t\t<li><a href=\"http://www.microshwhat.com/bar/soapy\">Barsoap</a></li>\n"
                     "        <li>Baz</li>\n\t</ul>\n"),
              "hi\nhello [[https://google.com][google]]\n\ntest\n\nList:\n\n"
              "- [[foo][Foo]]\n- [[http://www.microshwhat.com/bar/soapy][Barsoap]]\n- Baz");
}

TEST(ConvertTextTest, MalformedListMarkup) {
    EXPECT_EQ(to_org("hi\n\n\t\t\thello <a href=\"https://google.com\">google</a>\n\n"
                     "\t\t\ttest<p>List:</p>\n\n\t\t\t<ul>\n"
                     "\t\t\t\t<li><a href=\"foo\">Foo</a>\n"
                     "\t\t\t\t<li><a href=\"/\n\t\t                bar/baz\">Bar</a>\n"
                     "\t\t        <li>Baz</li>\n\t\t\t</ul>\n\t\t"),
              "hi hello [[https://google.com][google]] test\n\nList:\n\n"
              "- [[foo][Foo]]\n- [[/\t\t                bar/baz][Bar]]\n- Baz");
}

TEST(ConvertTextTest, PeriodStaysAttached) {
    EXPECT_EQ(to_org("<p>Lorem ipsum <span>test</span>.</p>"), "Lorem ipsum test.");
    EXPECT_EQ(to_org("<p>Lorem ipsum <span>test.</span></p>"), "Lorem ipsum test.");
}

TEST(ConvertTextTest, HorizontalRule) {
    EXPECT_EQ(to_org("a<hr>b"), "a\n-----\nb");
}

TEST(ConvertTextTest, IgnoresStylesScriptsAndMetadata) {
    EXPECT_EQ(to_org("<style>Test</style>"), "");
    EXPECT_EQ(to_org("<style type=\"text/css\">body { color: #fff; }</style>"), "");
    EXPECT_EQ(to_org("<link rel=\"stylesheet\" href=\"main.css\">"), "");
    EXPECT_EQ(to_org("<script>Test</script>"), "");
    EXPECT_EQ(to_org("<script type=\"text/ng-template\" id=\"template.html\">"
                     "<a href=\"http://google.com\">Google</a></script>"),
              "");
    EXPECT_EQ(to_org("<meta charset=\"utf-8\"><template><p>hidden</p></template>shown"), "shown");
    EXPECT_EQ(to_org("a<!-- comment -->b"), "ab");
}

// ============================================================================
// Preformatted and code
// ============================================================================

TEST(ConvertCodeTest, PreformattedBlocks) {
    EXPECT_EQ(to_org("<pre>test1\ntest 2\n\ntest  3\n</pre>"),
              "#+begin_src\ntest1\ntest 2\n\ntest  3\n#+end_src");
    EXPECT_EQ(to_org("<pre>test 1   test 2</pre>"), "#+begin_src\ntest 1   test 2\n#+end_src");
    EXPECT_EQ(to_org("<pre class=\"chroma\">\n    <span class=\"nx\">b1</span> <span class=\"o\">:=</span> "
                     "<span class=\"nb\">make</span><span class=\"p\">([]</span><span class=\"kt\">byte"
                     "</span><span class=\"p\">,</span> <span class=\"mi\">5</span><span class=\"p\">)"
                     "</span>\n</pre>"),
              "#+begin_src\n    b1 := make([]byte, 5)\n#+end_src");
}

TEST(ConvertCodeTest, InlineCodeTags) {
    EXPECT_EQ(to_org("<p>The first <tt class=\"key\">KEY</tt> part."), "The first ~KEY~ part.");
    EXPECT_EQ(to_org("<p>This is <kbd>kbd</kbd>."), "This is ~kbd~.");
    EXPECT_EQ(to_org("<p>This is <var>var</var>."), "This is ~var~.");
    EXPECT_EQ(to_org("<p>the argument to <code>code</code> is</p>"), "the argument to ~code~ is");
    EXPECT_EQ(to_org("<p>This is <samp>samp</samp>.</p>"), "This is ~samp~.");
    EXPECT_EQ(to_org("<code>  </code>x"), "x");
}

TEST(ConvertCodeTest, MultiLineInlineCodeBecomesBlock) {
    EXPECT_EQ(to_org("<p>Multi-line<tt class=\"key\">teletype<br>TELETYPE</tt> part."),
              "Multi-line\n#+begin_src\nteletype\nTELETYPE\n#+end_src\npart.");
}

TEST(ConvertCodeTest, CodeInsidePre) {
    EXPECT_EQ(to_org("<pre><code>a := 1\nb := 2\n</code></pre>\n"),
              "#+begin_src\na := 1\nb := 2\n#+end_src");
    EXPECT_EQ(to_org("<pre><code>func foo()  {\n    return 1\n}\n</code></pre>\n"),
              "#+begin_src\nfunc foo()  {\n    return 1\n}\n#+end_src");
}

// ============================================================================
// Headings, emphasis, blocks
// ============================================================================

TEST(ConvertBlockTest, Headings) {
    EXPECT_EQ(to_org("<h1>Test</h1>"), "* Test");
    EXPECT_EQ(to_org("\t<h1>\nTest</h1> "), "* Test");
    EXPECT_EQ(to_org("\t<h1>\nTest line 1<br>Test 2</h1> "), "* Test line 1 Test 2");
    EXPECT_EQ(to_org("<h1>Test</h1> <h1>Test</h1>"), "* Test\n\n* Test");
    EXPECT_EQ(to_org("<h2>Test</h2>"), "** Test");
    EXPECT_EQ(to_org("<h6>Deep</h6>"), "****** Deep");
    EXPECT_EQ(to_org("<h1><a href='http://example.com/'>Test</a></h1>"),
              "* [[http://example.com/][Test]]");
    EXPECT_EQ(to_org("<h3> <span class='a'>Test </span></h3>"), "*** Test");
}

TEST(ConvertBlockTest, Emphasis) {
    EXPECT_EQ(to_org("<b>Test</b>"), "*Test*");
    EXPECT_EQ(to_org("\t<b>Test</b> "), "*Test*");
    EXPECT_EQ(to_org("\t<b>Test line 1<br>Test 2</b> "), "*Test line 1\nTest 2*");
    EXPECT_EQ(to_org("<b>Test</b> <b>Test</b>"), "*Test* *Test*");
    EXPECT_EQ(to_org("<i>it</i> <u>un</u> <del>gone</del> <strong>st</strong>"),
              "/it/ _un_ +gone+ *st*");
    EXPECT_EQ(to_org("<b>bold </b>next"), "*bold* next");
    EXPECT_EQ(to_org("<em> </em>x"), "x");
}

TEST(ConvertBlockTest, Divs) {
    EXPECT_EQ(to_org("<div>Test</div>"), "Test");
    EXPECT_EQ(to_org("\t<div>Test</div> "), "Test");
    EXPECT_EQ(to_org("<div>Test line 1<div>Test 2</div></div>"), "Test line 1\nTest 2");
    EXPECT_EQ(to_org("Test 1<div>Test 2</div> <div>Test 3</div>Test 4"),
              "Test 1\nTest 2\nTest 3\nTest 4");
    EXPECT_EQ(to_org("Test 1<div>&nbsp;Test 2&nbsp;</div>"), "Test 1\n Test 2");
    EXPECT_EQ(to_org("<section>a</section><article>b</article>"), "a\nb");
}

TEST(ConvertBlockTest, Blockquotes) {
    EXPECT_EQ(to_org("<div>level 0<blockquote>level 1<br><blockquote>level 2</blockquote>level 1"
                     "</blockquote><div>level 0</div></div>"),
              "level 0\n\n#+begin_quote\nlevel 1\n\nlevel 2\n\nlevel 1\n#+end_quote\n\nlevel 0");
    EXPECT_EQ(to_org("<blockquote>Test</blockquote>Test"), "#+begin_quote\nTest\n#+end_quote\n\nTest");
    EXPECT_EQ(to_org("\t<blockquote> \nTest<br></blockquote> "),
              "#+begin_quote\nTest\n\n#+end_quote");
    EXPECT_EQ(to_org("\t<blockquote> \nTest line 1<br>Test 2</blockquote> "),
              "#+begin_quote\nTest line 1\nTest 2\n#+end_quote");
    EXPECT_EQ(to_org("<blockquote>Test</blockquote> <blockquote>Test</blockquote> Other Test"),
              "#+begin_quote\nTest\n#+end_quote\n\n#+begin_quote\nTest\n#+end_quote\n\nOther Test");
    EXPECT_EQ(to_org("<blockquote>Lorem <b>ipsum</b> <b>Commodo</b>.</blockquote>"),
              "#+begin_quote\nLorem *ipsum* *Commodo*.\n#+end_quote");
}

TEST(ConvertBlockTest, NestedQuotesShareOneDelimiterPair) {
    const std::string out =
        to_org("<blockquote>a<blockquote>b<blockquote>c</blockquote></blockquote></blockquote>");
    EXPECT_EQ(count_occurrences(out, "#+begin_quote"), 1u);
    EXPECT_EQ(count_occurrences(out, "#+end_quote"), 1u);
    EXPECT_NE(out.find('c'), std::string::npos);
}

TEST(ConvertBlockTest, LongQuoteLinesAreKeptByDefault) {
    std::string words;
    for (int i = 0; i < 20; ++i) {
        words += (i == 0 ? "" : " ") + std::string("aaaa");
    }
    EXPECT_EQ(to_org("<blockquote>" + words + "</blockquote>"),
              "#+begin_quote\n" + words + "\n#+end_quote");
}

TEST(ConvertBlockTest, BreaksLongQuoteLinesWhenAsked) {
    std::string first;
    std::string second;
    for (int i = 0; i < 15; ++i) {
        first += (i == 0 ? "" : " ") + std::string("aaaa");
    }
    for (int i = 0; i < 5; ++i) {
        second += (i == 0 ? "" : " ") + std::string("aaaa");
    }

    Options options;
    options.break_long_lines = true;
    EXPECT_EQ(to_org("<blockquote>" + first + " " + second + "</blockquote>", options),
              "#+begin_quote\n" + first + "\n" + second + "\n#+end_quote");

    // Text outside quotes is never wrapped.
    EXPECT_EQ(to_org("<p>" + first + " " + second + "</p>", options), first + " " + second);
}

// ============================================================================
// Lists
// ============================================================================

TEST(ConvertListTest, UnorderedLists) {
    EXPECT_EQ(to_org("<ul></ul>"), "");
    EXPECT_EQ(to_org("<ul><li>item</li></ul>_"), "- item\n\n_");
    EXPECT_EQ(to_org("<li class='123'>item 1</li> <li>item 2</li>\n_"), "- item 1\n- item 2\n_");
    EXPECT_EQ(to_org("<li>item 1</li> \t\n <li>item 2</li> <li> item 3</li>\n_"),
              "- item 1\n- item 2\n- item 3\n_");
    EXPECT_EQ(to_org("<ul><li> </li><li>kept</li></ul>"), "- kept");
}

TEST(ConvertListTest, OrderedListsNumberItems) {
    EXPECT_EQ(to_org("<ol><li>one</li><li>two</li><li>three</li></ol>"), "1. one\n2. two\n3. three");
    EXPECT_EQ(to_org("<ol start=\"4\"><li>four</li><li>five</li></ol>"), "4. four\n5. five");
}

TEST(ConvertListTest, ContinuationLinesAreIndented) {
    EXPECT_EQ(to_org("<ul><li>line1<br>line2</li></ul>"), "- line1\n  line2");
    EXPECT_EQ(to_org("<ol><li>a<br>b</li></ol>"), "1. a\n   b");
}

TEST(ConvertListTest, ListItemWithNestedLink) {
    EXPECT_EQ(to_org("<li>\n\t\t  <a href=\"/new\" data-ga-click=\"Header, create new repository, "
                     "icon:repo\"><span class=\"octicon octicon-repo\"></span> New repository</a>\n"
                     "\t\t</li>"),
              "- [[/new][New repository]]");
}

TEST(ConvertListTest, DefinitionLists) {
    EXPECT_EQ(to_org("<dl><dt>Term</dt><dd>Meaning</dd><dt>Other</dt><dd>More</dd></dl>"),
              "*Term*\nMeaning\n*Other*\nMore");
}

// ============================================================================
// Links and images
// ============================================================================

TEST(ConvertLinkTest, Links) {
    EXPECT_EQ(to_org("<a></a>"), "");
    EXPECT_EQ(to_org("<a href=\"\"></a>"), "");
    EXPECT_EQ(to_org("<a href=\"http://example.com/\"></a>"), "[[http://example.com/]]");
    EXPECT_EQ(to_org("<a href=\"\">Link</a>"), "Link");
    EXPECT_EQ(to_org("<a href=\"http://example.com/\">Link</a>"), "[[http://example.com/][Link]]");
    EXPECT_EQ(to_org("<a href=\"http://example.com/\"><span class=\"a\">Link</span></a>"),
              "[[http://example.com/][Link]]");
    EXPECT_EQ(to_org("<a href='http://example.com/'>\n\t<span class='a'>Link</span>\n\t</a>"),
              "[[http://example.com/][Link]]");
    EXPECT_EQ(to_org("<a href='mailto:contact@example.org'>Contact Us</a>"),
              "[[mailto:contact@example.org][Contact Us]]");
    EXPECT_EQ(to_org("<a href=\"http://example.com:80/~user?aaa=bb&amp;c=d,e,f#foo\">Link</a>"),
              "[[http://example.com:80/~user?aaa=bb&c=d,e,f#foo][Link]]");
    EXPECT_EQ(to_org("<a title='title' href=\"http://example.com/\">Link</a>"),
              "[[http://example.com/][Link]]");
    EXPECT_EQ(to_org("<a href=\"   http://example.com/ \"> Link </a>"),
              "[[http://example.com/][Link]]");
    EXPECT_EQ(to_org("<a href=\"http://example.com/a/\">Link A</a> "
                     "<a href=\"http://example.com/b/\">Link B</a>"),
              "[[http://example.com/a/][Link A]] [[http://example.com/b/][Link B]]");
    EXPECT_EQ(to_org("<a href=\"%%LINK%%\">Link</a>"), "[[%%LINK%%][Link]]");
    EXPECT_EQ(to_org("<a href=\"[LINK]\">Link</a>"), "[[[LINK]][Link]]");
    EXPECT_EQ(to_org("<a href=\"{LINK}\">Link</a>"), "[[{LINK}][Link]]");
    EXPECT_EQ(to_org("<a href=\"[[!unsubscribe]]\">Link</a>"), "[[[[!unsubscribe]]][Link]]");
    EXPECT_EQ(to_org("<p>This is <a href=\"http://www.google.com\" >link1</a> and "
                     "<a href=\"http://www.google.com\" >link2 </a> is next.</p>"),
              "This is [[http://www.google.com][link1]] and [[http://www.google.com][link2]] is next.");
    EXPECT_EQ(to_org("<a href=\"http://www.google.com\" >http://www.google.com</a>"),
              "[[http://www.google.com]]");
    EXPECT_EQ(to_org("<p>(see <a href=\"http://example.com\">Plain Lists</a>)</p>"),
              "(see [[http://example.com][Plain Lists]])");
}

TEST(ConvertLinkTest, LinkAroundBlocksGetsGenericLabel) {
    EXPECT_EQ(to_org("text <a href=\"http://example.com\"><br><h3>Heading</h3><div></div></a>"),
              "text\n*** Heading [[http://example.com][Link]]");
    EXPECT_EQ(to_org("<a><div>plain</div></a>"), "plain");
}

TEST(ConvertLinkTest, BaseUrl) {
    Options options;
    options.base_url = "https://orgmode.org/manual/Structure-Templates.html";
    EXPECT_EQ(to_org("<a name=\"index-template-insertion\"></a>", options), "");

    options.base_url = "http://example.com/foo/";
    EXPECT_EQ(to_org("<a href=\"./bar/\">bar</a>", options), "[[http://example.com/foo/bar/][bar]]");
    EXPECT_EQ(to_org("<a href=\"../\">top</a>", options), "[[http://example.com/][top]]");
    EXPECT_EQ(to_org("<img src=\"hello.jpg\">", options), "[[http://example.com/foo/hello.jpg]]");

    options.base_url = "http://example.com";
    EXPECT_EQ(to_org("<h2><a href=\"/foo/bar/\"><div><span>Title</span> <span>Sub</span></div></a></h2>",
                     options),
              "** Title Sub [[http://example.com/foo/bar/][Link]]");

    options.base_url = "https://mitpress.mit.edu";
    EXPECT_EQ(to_org("<a href=\"book-Z-H-4.html#%_toc_start\">content</a>", options),
              "[[https://mitpress.mit.edu/book-Z-H-4.html][content]]");
}

TEST(ConvertLinkTest, OmitLinks) {
    Options options;
    options.omit_links = true;
    EXPECT_EQ(to_org("<a></a>", options), "");
    EXPECT_EQ(to_org("<a href=\"http://example.com/\"></a>", options), "");
    EXPECT_EQ(to_org("<a href=\"\">Link</a>", options), "Link");
    EXPECT_EQ(to_org("<a href=\"http://example.com/\">Link</a>", options), "Link");
    EXPECT_EQ(to_org("<a href='http://example.com/'>\n\t<span class='a'>Link</span>\n\t</a>", options),
              "Link");
    EXPECT_EQ(to_org("<a href=\"http://example.com/\"><img src=\"http://example.ru/hello.jpg\" "
                     "alt=\"Example\"></a>",
                     options),
              "#+CAPTION: Example\n[[http://example.ru/hello.jpg]]\nExample");
}

TEST(ConvertLinkTest, Images) {
    EXPECT_EQ(to_org("<img />"), "");
    EXPECT_EQ(to_org("<img src=\"http://example.ru/hello.jpg\" />"), "[[http://example.ru/hello.jpg]]");
    EXPECT_EQ(to_org("<img alt=\"Example\"/>"), "");
    EXPECT_EQ(to_org("<img src=\"http://example.ru/hello.jpg\" alt=\"Example\"/>"),
              "#+CAPTION: Example\n[[http://example.ru/hello.jpg]]");
    EXPECT_EQ(to_org("<a href=\"http://example.com/\"><img src=\"http://example.ru/hello.jpg\" "
                     "alt=\"Example\"/></a>"),
              "#+CAPTION: Example\n[[http://example.ru/hello.jpg]]\n[[http://example.com/][Example]]");
}

TEST(ConvertLinkTest, DataUrlImages) {
    const std::string data = "data:image/png;base64," + std::string(120, 'A');
    EXPECT_EQ(to_org("<img src=\"" + data + "\">"), "[[data:image/png;(omitted)]]");

    Options options;
    options.show_full_data_urls = true;
    EXPECT_EQ(to_org("<img src=\"" + data + "\">", options), "[[" + data + "]]");
}

TEST(ConvertLinkTest, InternalAnchors) {
    const std::string html =
        "<a name=\"top\"></a><p>intro <a href=\"#sec\">Jump</a></p>"
        "<h2 id=\"sec\">Section</h2><span id=\"unused\">x</span><a href=\"#top\">up</a>";
    EXPECT_EQ(to_org(html), "intro [[sec][Jump]]\n\n** Section\nx[[top][up]]");

    Options options;
    options.show_internal_anchors = true;
    EXPECT_EQ(to_org(html, options),
              "<<top>>\n\nintro [[sec][Jump]]\n\n** Section<<sec>>\nx[[top][up]]");
}

// ============================================================================
// Tables
// ============================================================================

TEST(ConvertTableTest, PlainTables) {
    EXPECT_EQ(to_org("<table><tr><td></td><td></td></tr></table>"), "");
    EXPECT_EQ(to_org("<table><tr><td>cell1</td><td>cell2</td></tr></table>"), "cell1 cell2");
    EXPECT_EQ(to_org("<table><tr><td>row1</td></tr><tr><td>row2</td></tr></table>"), "row1\nrow2");
    EXPECT_EQ(to_org("<table>\n   <tr><td>cell1-1</td><td>cell1-2</td></tr>\n"
                     "   <tr><td>cell2-1</td><td>cell2-2</td></tr>\n</table>"),
              "cell1-1 cell1-2\ncell2-1 cell2-2");
    EXPECT_EQ(to_org("_<table><tr><td>cell</td></tr></table>_"), "_\n\ncell\n\n_");
}

TEST(ConvertTableTest, PrettyTables) {
    const Options options = pretty_options();
    EXPECT_EQ(to_org("<table><tr><td></td><td></td></tr></table>", options), "|  |  |");
    EXPECT_EQ(to_org("<table><tr><td>cell1</td><td>cell2</td></tr></table>", options),
              "| cell1 | cell2 |");
    EXPECT_EQ(to_org("<table><tr><td>row1</td></tr><tr><td>row2</td></tr></table>", options),
              "| row1 |\n| row2 |");
    EXPECT_EQ(to_org("_<table><tr><td>cell</td></tr></table>_", options), "_\n\n| cell |\n\n_");
}

TEST(ConvertTableTest, PrettyCellsWithParagraphs) {
    const std::string html =
        "<table>\n<tbody>\n"
        "<tr><td><p>Row-1-Col-1-Msg123456789012345</p><p>Row-1-Col-1-Msg2</p></td>"
        "<td>Row-1-Col-2</td></tr>\n"
        "<tr><td>Row-2-Col-1</td><td>Row-2-Col-2</td></tr>\n"
        "</tbody>\n</table>";
    EXPECT_EQ(to_org(html, pretty_options()),
              "| Row-1-Col-1-Msg123456789012345 | Row-1-Col-2 |\n"
              "| Row-1-Col-1-Msg2               |             |\n"
              "| Row-2-Col-1                    | Row-2-Col-2 |");
    EXPECT_EQ(to_org(html),
              "Row-1-Col-1-Msg123456789012345\n\nRow-1-Col-1-Msg2\n\nRow-1-Col-2\n"
              "Row-2-Col-1 Row-2-Col-2");
}

TEST(ConvertTableTest, HeaderAndFooterSections) {
    const std::string html =
        "<table>\n<thead>\n<tr><th>Header 1</th><th>Header 2</th></tr>\n</thead>\n"
        "<tfoot>\n<tr><td>Footer 1</td><td>Footer 2</td></tr>\n</tfoot>\n"
        "<tbody>\n<tr><td>Row 1 Col 1</td><td>Row 1 Col 2</td></tr>\n"
        "<tr><td>Row 2 Col 1</td><td>Row 2 Col 2</td></tr>\n</tbody>\n</table>";
    EXPECT_EQ(to_org(html, pretty_options()),
              "|  HEADER 1   |  HEADER 2   |\n"
              "|-------------+-------------|\n"
              "| Row 1 Col 1 | Row 1 Col 2 |\n"
              "| Row 2 Col 1 | Row 2 Col 2 |\n"
              "|-------------+-------------|\n"
              "|  FOOTER 1   |  FOOTER 2   |");
    EXPECT_EQ(to_org(html),
              "Header 1 Header 2\nFooter 1 Footer 2\nRow 1 Col 1 Row 1 Col 2\nRow 2 Col 1 Row 2 Col 2");
}

TEST(ConvertTableTest, TwoTablesGetSeparateContexts) {
    const std::string html =
        "<p>\n<table><thead><tr><th>T1 H1</th><th>T1 H2</th></tr></thead>"
        "<tbody><tr><td>T1 A</td><td>T1 B</td></tr></tbody></table>\n"
        "<table><thead><tr><th>T2 H1</th></tr></thead>"
        "<tbody><tr><td>T2 A</td></tr></tbody></table>\n</p>";
    EXPECT_EQ(to_org(html, pretty_options()),
              "| T1 H1 | T1 H2 |\n"
              "|-------+-------|\n"
              "| T1 A  | T1 B  |\n"
              "\n"
              "| T2 H1 |\n"
              "|-------|\n"
              "| T2 A  |");
}

TEST(ConvertTableTest, WideDescriptionColumn) {
    const std::string description =
        "Open source programming language that makes it easy to build simple, reliable, and "
        "efficient software";
    const std::string html =
        "<table>\n<tr>\n<th>Item</th>\n<th>Description</th>\n<th>Price</th>\n</tr>\n"
        "<tr>\n<td>Golang</td>\n<td>" + description + "</td>\n<td>$10.99</td>\n</tr>\n"
        "<tr>\n<td>Hermes</td>\n<td>Programmatically create beautiful e-mails using Golang.</td>\n"
        "<td>$1.99</td>\n</tr>\n</table>";

    const std::string pad45(45, ' ');
    const std::string dashes(103, '-');
    EXPECT_EQ(to_org(html, pretty_options()),
              "|  ITEM  | " + pad45 + "DESCRIPTION" + pad45 + " | PRICE  |\n"
              "|--------+" + dashes + "+--------|\n"
              "| Golang | " + description + " | $10.99 |\n"
              "| Hermes | Programmatically create beautiful e-mails using Golang." +
                  std::string(46, ' ') + " | $1.99  |");
    EXPECT_EQ(to_org(html),
              "Item  Description  Price\n"
              "Golang  " + description + "  $10.99\n"
              "Hermes  Programmatically create beautiful e-mails using Golang.  $1.99");
}

TEST(ConvertTableTest, CellsWithEmptySpans) {
    const std::string html =
        "<table><tr>\n <td><span></span></td>\n <td><span></span>1</td>\n"
        " <td><a href=\"http://example.com/2\"><span></span>2</a></td>\n"
        " <td><a href=\"http://example.com/3\"><span></span>3</a></td>\n</tr></table>";
    EXPECT_EQ(to_org(html, pretty_options()),
              "|  | 1 | [[http://example.com/2][2]] | [[http://example.com/3][3]] |");
    EXPECT_EQ(to_org(html), "1  [[http://example.com/2][2]]  [[http://example.com/3][3]]");
}

// ============================================================================
// Titles, noscript, forms
// ============================================================================

TEST(ConvertDocumentTest, Titles) {
    EXPECT_EQ(to_org("<title>My site</title>text"), "#+TITLE: My site\n\ntext");
    EXPECT_EQ(to_org("<html><head><title>My site</title></head><body>body</body></html>"),
              "#+TITLE: My site\n\nbody");
}

TEST(ConvertDocumentTest, NoscriptContent) {
    const std::string html =
        "<body><noscript><style>div {display: none}</style> <div>Test</div></noscript></body>";
    EXPECT_EQ(to_org(html), "");

    Options options;
    options.show_noscripts = true;
    EXPECT_EQ(to_org(html, options), "Test");
}

TEST(ConvertFormTest, TextAreas) {
    EXPECT_EQ(to_org("<textarea></textarea>"), "#+begin_textarea\n\n#+end_textarea");
    EXPECT_EQ(to_org("<textarea placeholder=\"Enter...\"></textarea>"),
              "#+begin_textarea\nEnter...\n#+end_textarea");
    EXPECT_EQ(to_org("<textarea placeholder=\"Enter...\">Entered</textarea>"),
              "#+begin_textarea\nEntered\n#+end_textarea");
    EXPECT_EQ(to_org("<textarea>func foo() {\n    return 1\n}</textarea>"),
              "#+begin_textarea\nfunc foo() {\n    return 1\n}\n#+end_textarea");
}

TEST(ConvertFormTest, Inputs) {
    EXPECT_EQ(to_org("<input>"), "#+begin_input :type unknown\n\n#+end_input");
    EXPECT_EQ(to_org("<input />"), "#+begin_input :type unknown\n\n#+end_input");
    EXPECT_EQ(to_org("<input type=\"text\" >"), "#+begin_input :type text\n\n#+end_input");
    EXPECT_EQ(to_org("<input type=\"number\" >"), "#+begin_input :type number\n\n#+end_input");
    EXPECT_EQ(to_org("<input type=\"PASSWORD\" >"), "#+begin_input :type password\n\n#+end_input");
    EXPECT_EQ(to_org("<input type=\"radio\" >"), "");
    EXPECT_EQ(to_org("<input type=\"hidden\" >"), "");
    EXPECT_EQ(to_org("<input placeholder=\"Enter input\" />"),
              "#+begin_input :type unknown\nEnter input\n#+end_input");
    EXPECT_EQ(to_org("<input type=\"text\" value=\"git@github.com:satotake/html2org.git\" readonly=\"\">"),
              "#+begin_input :type text\ngit@github.com:satotake/html2org.git\n#+end_input");
    EXPECT_EQ(to_org("<input type=\"text\" value=\"VALUE\" placeholder=\"P\">"),
              "#+begin_input :type text\nVALUE\n#+end_input");
}

TEST(ConvertFormTest, SelectShowsChosenOption) {
    EXPECT_EQ(to_org("<select name=\"c\"><option>One</option><option selected>Two</option></select>"),
              "#+begin_input :type select\nTwo\n#+end_input");
    EXPECT_EQ(to_org("<select><option> First  choice </option><option>Second</option></select>"),
              "#+begin_input :type select\nFirst choice\n#+end_input");
}

TEST(ConvertFormTest, FormFieldsGetIncreasingIds) {
    Options options;
    options.base_url = "http://example.com/";
    EXPECT_EQ(to_org("<form action=\"/submit\" method=\"POST\">"
                     "<input type=\"text\" name=\"q\"><input type=\"password\" name=\"pw\"></form>",
                     options),
              "#+begin_input :type text :form org-form-id--1 :id org-form-id--2 :name q\n\n"
              "#+end_input\n\n"
              "#+begin_input :type password :form org-form-id--1 :id org-form-id--3 :name pw\n\n"
              "#+end_input\n\n"
              "[[org-form:org-form-id--1:post:http://example.com/submit][Submit]]");
}

TEST(ConvertFormTest, FormDefaultsToGetAndBaseUrl) {
    EXPECT_EQ(to_org("<form><textarea name=\"t\">x</textarea></form>"),
              "#+begin_textarea :form org-form-id--1 :id org-form-id--2 :name t\nx\n#+end_textarea\n\n"
              "[[org-form:org-form-id--1:get:][Submit]]");

    Options options;
    options.base_url = "http://example.com/page";
    EXPECT_EQ(to_org("<form method=\"get\"></form>", options),
              "[[org-form:org-form-id--1:get:http://example.com/page][Submit]]");
}

TEST(ConvertFormTest, FieldOutsideFormHasNoId) {
    const std::string out = to_org("<input type=\"text\" name=\"q\">");
    EXPECT_EQ(out.find(":id"), std::string::npos);
    EXPECT_EQ(out.find(":form"), std::string::npos);
}

// ============================================================================
// Whole documents and entry points
// ============================================================================

TEST(ConvertDocumentTest, ExampleDocument) {
    const std::string html = R"(
<html>
	<head>
		<title>My Mega Service</title>
		<link rel="stylesheet" href="main.css">
		<style type="text/css">body { color: #fff; }</style>
	</head>

	<body>
		<div class="logo">
			<a href="http://jaytaylor.com/"><img src="/logo-image.jpg" alt="Mega Service"/></a>
		</div>

		<h1>Welcome to your new account on my service!</h1>

		<p>
			Here is some more information:

			<ul>
				<li>Link 1: <a href="https://example.com">Example.com</a></li>
				<li>Link 2: <a href="https://example2.com">Example2.com</a></li>
				<li>Something else</li>
			</ul>
		</p>

		<table>
			<thead>
				<tr><th>Header 1</th><th>Header 2</th></tr>
			</thead>
			<tfoot>
				<tr><td>Footer 1</td><td>Footer 2</td></tr>
			</tfoot>
			<tbody>
				<tr><td>Row 1 Col 1</td><td>Row 1 Col 2</td></tr>
				<tr><td>Row 2 Col 1</td><td>Row 2 Col 2</td></tr>
			</tbody>
		</table>
	</body>
</html>)";

    Options options;
    options.pretty_tables = true;
    EXPECT_EQ(to_org(html, options),
              "#+TITLE: My Mega Service\n"
              "\n"
              "#+CAPTION: Mega Service\n"
              "[[/logo-image.jpg]]\n"
              "[[http://jaytaylor.com/][Mega Service]]\n"
              "\n"
              "* Welcome to your new account on my service!\n"
              "\n"
              "Here is some more information:\n"
              "\n"
              "- Link 1: [[https://example.com][Example.com]]\n"
              "- Link 2: [[https://example2.com][Example2.com]]\n"
              "- Something else\n"
              "\n"
              "|  HEADER 1   |  HEADER 2   |\n"
              "|-------------+-------------|\n"
              "| Row 1 Col 1 | Row 1 Col 2 |\n"
              "| Row 2 Col 1 | Row 2 Col 2 |\n"
              "|-------------+-------------|\n"
              "|  FOOTER 1   |  FOOTER 2   |");
}

TEST(ConvertEntryPointTest, StreamAndNodeInputs) {
    std::istringstream stream("\xEF\xBB\xBF<h1>Test</h1>");
    const ConvertResult from_stream = convert::convert_stream(stream);
    ASSERT_TRUE(from_stream.ok) << from_stream.message;
    EXPECT_EQ(from_stream.text, "* Test");

    const auto doc = html::parse_html("<p>node</p>");
    const ConvertResult from_node = convert::convert_node(*doc);
    ASSERT_TRUE(from_node.ok);
    EXPECT_EQ(from_node.text, "node");
}

TEST(ConvertEntryPointTest, DeeplyNestedInputConverts) {
    std::string html;
    for (int i = 0; i < 100000; ++i) {
        html += "<span>";
    }
    html += "x";
    EXPECT_EQ(to_org(html), "x");

    std::string quotes;
    for (int i = 0; i < 2000; ++i) {
        quotes += "<blockquote>";
    }
    const std::string quoted = to_org(quotes + "deep");
    EXPECT_EQ(count_occurrences(quoted, "#+begin_quote"), 1u);
    EXPECT_NE(quoted.find("deep"), std::string::npos);
}

TEST(ConvertEntryPointTest, InvalidBaseUrlFailsWholeConversion) {
    Options options;
    options.base_url = ":nope";
    const ConvertResult result = convert::convert_string("<p>ok</p><a href=\"x\">y</a>", options);
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(result.text.empty());
    EXPECT_NE(result.message.find("missing protocol scheme"), std::string::npos);
}

TEST(ConvertEntryPointTest, BlockLevelTags) {
    EXPECT_TRUE(convert::is_block_level("div"));
    EXPECT_TRUE(convert::is_block_level("h3"));
    EXPECT_TRUE(convert::is_block_level("table"));
    EXPECT_FALSE(convert::is_block_level("span"));
    EXPECT_FALSE(convert::is_block_level("a"));
}

// ============================================================================
// Converter
// ============================================================================

TEST(ConverterTest, RecordsStageTrace) {
    Converter converter;
    const ConvertResult result = converter.convert("<p>hello</p>");
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.text, "hello");
    EXPECT_EQ(converter.current_stage(), core::LifecycleStage::Complete);
    EXPECT_EQ(converter.trace().stages(),
              (std::vector<core::LifecycleStage>{
                  core::LifecycleStage::Idle, core::LifecycleStage::Parsing,
                  core::LifecycleStage::Collecting, core::LifecycleStage::Rendering,
                  core::LifecycleStage::Normalizing, core::LifecycleStage::Complete}));
    EXPECT_TRUE(converter.failures().empty());
    EXPECT_EQ(converter.last_failure(), nullptr);
}

TEST(ConverterTest, ForwardsParserRecoveries) {
    Converter converter;
    ASSERT_TRUE(converter.convert("<div><span>x").ok);
    const auto warnings = events_from(converter.diagnostics(), "html");
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_EQ(warnings[0].severity, core::Severity::Warning);
    EXPECT_NE(warnings[0].message.find("Unclosed element <span>"), std::string::npos);
}

TEST(ConverterTest, ReportsDroppedFormFields) {
    Converter converter;
    const ConvertResult result = converter.convert("<input type=\"radio\">");
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.text, "");
    const auto events = events_from(converter.diagnostics(), "render");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].severity, core::Severity::Warning);
    EXPECT_NE(events[0].message.find("radio"), std::string::npos);
}

TEST(ConverterTest, FailureIsCapturedWithContext) {
    Options options;
    options.base_url = ":nope";
    Converter converter(options);
    const std::string html = "<input type=\"radio\"><a href=\"x\">y</a>";
    const ConvertResult result = converter.convert(html);

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(converter.current_stage(), core::LifecycleStage::Error);
    const std::uint64_t call = converter.diagnostics().current_call();
    EXPECT_EQ(converter.diagnostics().count(core::Severity::Error, call), 1u);
    ASSERT_EQ(converter.failures().size(), 1u);

    const core::ConversionFailure* failure = converter.last_failure();
    ASSERT_NE(failure, nullptr);
    EXPECT_EQ(failure->call_id, call);
    EXPECT_EQ(failure->module, "render");
    EXPECT_EQ(failure->stage, "rendering");
    EXPECT_EQ(failure->message, result.message);
    EXPECT_FALSE(failure->events.empty());

    const std::string text = failure->describe();
    EXPECT_EQ(text.rfind("conversion failed in render/rendering: ", 0), 0u);
    EXPECT_NE(text.find("  input bytes: " + std::to_string(html.size()) + "\n"), std::string::npos);
    EXPECT_NE(text.find("  base URL: :nope\n"), std::string::npos);
    EXPECT_NE(text.find("radio"), std::string::npos);
}

TEST(ConverterTest, LastFailureClearsOnNextCall) {
    Options options;
    options.base_url = ":nope";
    Converter converter(options);
    EXPECT_FALSE(converter.convert("<a href=\"x\">y</a>").ok);
    ASSERT_NE(converter.last_failure(), nullptr);

    ASSERT_TRUE(converter.convert("plain").ok);
    EXPECT_EQ(converter.last_failure(), nullptr);
    EXPECT_EQ(converter.failures().size(), 1u);
}

TEST(ConverterTest, ThresholdKeepsOnlyErrors) {
    Options options;
    options.base_url = ":nope";
    Converter converter(options);
    converter.diagnostics().set_threshold(core::Severity::Error);
    ASSERT_TRUE(converter.convert("<div><span>x").ok);
    EXPECT_TRUE(converter.diagnostics().events().empty());

    EXPECT_FALSE(converter.convert("<a href=\"x\">y</a>").ok);
    ASSERT_EQ(converter.diagnostics().events().size(), 1u);
    EXPECT_EQ(converter.diagnostics().events()[0].severity, core::Severity::Error);
    ASSERT_NE(converter.last_failure(), nullptr);
    EXPECT_EQ(converter.last_failure()->events.size(), 1u);
}

TEST(ConverterTest, EachCallGetsItsOwnCallId) {
    Converter converter;
    ASSERT_TRUE(converter.convert("a").ok);
    ASSERT_TRUE(converter.convert("b").ok);
    EXPECT_EQ(converter.diagnostics().events().front().call_id, 1u);
    EXPECT_EQ(converter.diagnostics().events().back().call_id, 2u);
    EXPECT_FALSE(converter.diagnostics().call_events(1).empty());
}

TEST(ConverterTest, ConvertsStreamsAndNodes) {
    Options options;
    options.omit_links = true;
    Converter converter(options);
    EXPECT_TRUE(converter.options().omit_links);

    std::istringstream stream("<a href=\"http://example.com/\">Link</a>");
    const ConvertResult from_stream = converter.convert(stream);
    ASSERT_TRUE(from_stream.ok);
    EXPECT_EQ(from_stream.text, "Link");

    const auto doc = html::parse_html("<h2>Node</h2>");
    const ConvertResult from_node = converter.convert_node(*doc);
    ASSERT_TRUE(from_node.ok);
    EXPECT_EQ(from_node.text, "** Node");
    EXPECT_EQ(converter.trace().stages().front(), core::LifecycleStage::Idle);
    EXPECT_EQ(converter.trace().stages()[1], core::LifecycleStage::Collecting);
}

TEST(ConverterTest, RenderContextTracksLinePosition) {
    const convert::FragmentSet fragments;
    const Options options;
    int form_counter = 0;
    convert::RenderContext context(convert::RenderShared{options, fragments, form_counter});

    const auto doc = html::parse_html("<blockquote>quoted</blockquote>tail");
    std::string err;
    ASSERT_TRUE(context.render(*doc, err)) << err;
    EXPECT_EQ(context.blockquote_level(), 0);
    EXPECT_EQ(context.line_length(), 4u);
    EXPECT_NE(context.output().find("#+begin_quote"), std::string::npos);
}
