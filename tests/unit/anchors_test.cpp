#include <html2org/convert/anchors.h>
#include <html2org/html/html_parser.h>

#include <gtest/gtest.h>

using html2org::convert::collect_fragment_names;
using html2org::convert::FragmentSet;
using html2org::html::parse_html;

TEST(AnchorCollectorTest, CollectsInPageTargets) {
    const auto doc = parse_html(
        "<a href='#top'>up</a><p><a href=' #usage '>usage</a></p>"
        "<a href='#top'>again</a>");
    const FragmentSet names = collect_fragment_names(*doc);
    EXPECT_EQ(names, (FragmentSet{"top", "usage"}));
}

TEST(AnchorCollectorTest, IgnoresBareHashAndExternalFragments) {
    const auto doc = parse_html(
        "<a href='#'>self</a><a href='http://example.com/#intro'>ext</a>"
        "<a name='#named'>n</a><div href='#div'>d</div>");
    EXPECT_TRUE(collect_fragment_names(*doc).empty());
}

TEST(AnchorCollectorTest, VisitsSubtreesTheRendererSkips) {
    const auto doc = parse_html("<template><a href='#hidden'>h</a></template>");
    EXPECT_EQ(collect_fragment_names(*doc).count("hidden"), 1u);
}
