#include <gtest/gtest.h>
#include "services/Capabilities.hpp"
#include "utils/Errors.hpp"
#include "utils/HtmlParser.hpp"

using namespace Pequod;

namespace {

const char* kRss2 = R"(<?xml version="1.0" encoding="UTF-8"?>
<rss version="2.0" xmlns:content="http://purl.org/rss/1.0/modules/content/">
  <channel>
    <title>Example &amp; Co</title>
    <link>https://example.com/</link>
    <item>
      <title>First post</title>
      <link>https://example.com/first</link>
      <guid isPermaLink="false">post-1</guid>
      <pubDate>Mon, 02 Jan 2006 15:04:05 GMT</pubDate>
      <description>&lt;p&gt;Short &lt;b&gt;summary&lt;/b&gt;&lt;/p&gt;</description>
    </item>
    <item>
      <title>Second post</title>
      <link>https://example.com/second</link>
      <description>plain</description>
      <content:encoded><![CDATA[<p>Full</p><p>body</p>]]></content:encoded>
    </item>
  </channel>
</rss>)";

const char* kAtom = R"(<?xml version="1.0" encoding="utf-8"?>
<feed xmlns="http://www.w3.org/2005/Atom">
  <title>Atom Example</title>
  <entry>
    <title type="html">Atom &lt;em&gt;entry&lt;/em&gt;</title>
    <link rel="self" href="https://example.org/self"/>
    <link rel="alternate" href="https://example.org/entry"/>
    <id>urn:uuid:1225c695</id>
    <updated>2006-01-02T15:04:05Z</updated>
    <summary>Atom summary</summary>
  </entry>
</feed>)";

const char* kRdf = R"(<?xml version="1.0"?>
<rdf:RDF xmlns:rdf="http://www.w3.org/1999/02/22-rdf-syntax-ns#"
         xmlns="http://purl.org/rss/1.0/"
         xmlns:dc="http://purl.org/dc/elements/1.1/">
  <channel rdf:about="https://example.net/">
    <title>RDF Example</title>
  </channel>
  <item rdf:about="https://example.net/one">
    <title>One</title>
    <link>https://example.net/one</link>
    <dc:date>2006-01-02T15:04:05Z</dc:date>
  </item>
</rdf:RDF>)";

}

TEST(FeedParserTest, ParsesRss2Channel) {
    ParsedFeed feed = HtmlParser::parseFeed(kRss2);
    EXPECT_EQ(feed.title, "Example & Co");
    ASSERT_EQ(feed.entries.size(), 2u);

    const ParsedEntry& first = feed.entries[0];
    EXPECT_EQ(first.title, "First post");
    EXPECT_EQ(first.link, "https://example.com/first");
    ASSERT_TRUE(first.guid.has_value());
    EXPECT_EQ(*first.guid, "post-1");
    EXPECT_EQ(first.identityKey(), "post-1");
    EXPECT_EQ(first.publishedAt, 1136214245);
    EXPECT_EQ(first.summary, "Short summary");

    const ParsedEntry& second = feed.entries[1];
    EXPECT_FALSE(second.guid.has_value());
    EXPECT_EQ(second.identityKey(), "https://example.com/second");
    EXPECT_FALSE(second.publishedAt.has_value());
    EXPECT_EQ(second.summary, "Full\n\nbody");
}

TEST(FeedParserTest, ParsesAtomFeed) {
    ParsedFeed feed = HtmlParser::parseFeed(kAtom);
    EXPECT_EQ(feed.title, "Atom Example");
    ASSERT_EQ(feed.entries.size(), 1u);
    const ParsedEntry& entry = feed.entries[0];
    EXPECT_EQ(entry.title, "Atom entry");
    EXPECT_EQ(entry.link, "https://example.org/entry");
    EXPECT_EQ(entry.guid, std::optional<std::string>("urn:uuid:1225c695"));
    EXPECT_EQ(entry.publishedAt, 1136214245);
    EXPECT_EQ(entry.summary, "Atom summary");
}

TEST(FeedParserTest, ParsesRdfItemsBesideChannel) {
    ParsedFeed feed = HtmlParser::parseFeed(kRdf);
    EXPECT_EQ(feed.title, "RDF Example");
    ASSERT_EQ(feed.entries.size(), 1u);
    EXPECT_EQ(feed.entries[0].link, "https://example.net/one");
    EXPECT_EQ(feed.entries[0].guid, std::optional<std::string>("https://example.net/one"));
    EXPECT_EQ(feed.entries[0].publishedAt, 1136214245);
}

TEST(FeedParserTest, RejectsMalformedInput) {
    EXPECT_THROW(HtmlParser::parseFeed(""), ParseError);
    EXPECT_THROW(HtmlParser::parseFeed("<rss><channel>"), ParseError);
    EXPECT_THROW(HtmlParser::parseFeed("<html><body>hi</body></html>"), ParseError);
    EXPECT_THROW(HtmlParser::parseFeed("<rss version=\"2.0\"></rss>"), ParseError);
}

TEST(FeedParserTest, EntryWithoutIdentityHasEmptyKey) {
    ParsedFeed feed = HtmlParser::parseFeed(
        "<rss version=\"2.0\"><channel><title>t</title><item><description>x</description></item></channel></rss>");
    ASSERT_EQ(feed.entries.size(), 1u);
    EXPECT_EQ(feed.entries[0].identityKey(), "");
}

TEST(FeedParserTest, TitleFallsBackAsIdentity) {
    ParsedEntry entry;
    entry.title = "Only a title";
    EXPECT_EQ(entry.identityKey(), "title:Only a title");
}

TEST(FeedDiscoveryTest, PrefersAdvertisedLinks) {
    const char* html = R"(<html><head>
        <link rel="alternate" type="application/rss+xml" href="/feeds/main.xml">
        </head><body><a href="https://example.com/comments/feed">comments</a></body></html>)";
    XmlFeedParser parser;
    auto links = parser.discoverFeedLinks(html, "https://example.com/blog/");
    ASSERT_GE(links.size(), 3u);
    EXPECT_EQ(links[0], "https://example.com/feeds/main.xml");
    EXPECT_EQ(links[1], "https://example.com/comments/feed");
    EXPECT_EQ(links[2], "https://example.com/rss");
    EXPECT_EQ(links.back(), "https://example.com/index.xml");
}

TEST(TextExtractorTest, PrefersArticleAndSkipsChrome) {
    const char* html = R"(<html><body>
        <nav>Home | About</nav>
        <article><h1>Headline</h1><p>First paragraph.</p><script>var x = 1;</script>
        <ul><li>point</li></ul></article>
        <footer>Copyright</footer></body></html>)";
    HtmlTextExtractor extractor;
    EXPECT_EQ(extractor.extractReadableText(html), "Headline\n\nFirst paragraph.\n\n- point");
}

TEST(TextExtractorTest, EmptyPageFails) {
    HtmlTextExtractor extractor;
    EXPECT_THROW(extractor.extractReadableText(""), ResolutionError);
}
