#include "FeedParser.hpp"

#include <gtest/gtest.h>

TEST(FeedParserTest, ParsesRss2WithEnclosures) {
    auto entries = parse_feed(R"(<?xml version="1.0"?>
<rss version="2.0">
  <channel>
    <title>Releases</title>
    <item>
      <title>Show S01E01 1080p</title>
      <link>https://example.org/page/1</link>
      <enclosure url="https://example.org/1.torrent" type="application/x-bittorrent" length="1000"/>
    </item>
    <item>
      <title>Show S01E02 720p</title>
      <link>magnet:?xt=urn:btih:0123456789abcdef0123456789abcdef01234567</link>
    </item>
  </channel>
</rss>)");

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].title, "Show S01E01 1080p");
    ASSERT_EQ(entries[0].links.size(), 2u);
    EXPECT_FALSE(is_transfer_link(entries[0].links[0]));
    EXPECT_TRUE(is_transfer_link(entries[0].links[1]));
    EXPECT_EQ(entries[0].links[1].href, "https://example.org/1.torrent");

    ASSERT_EQ(entries[1].links.size(), 1u);
    EXPECT_TRUE(is_transfer_link(entries[1].links[0]));
}

TEST(FeedParserTest, ParsesAtom) {
    auto entries = parse_feed(R"(<?xml version="1.0"?>
<feed xmlns="http://www.w3.org/2005/Atom">
  <title>Atom releases</title>
  <entry>
    <title>Distro 24.04</title>
    <link href="https://example.org/distro"/>
    <link rel="enclosure" type="application/x-bittorrent" href="https://example.org/distro.torrent"/>
  </entry>
</feed>)");

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].title, "Distro 24.04");
    ASSERT_EQ(entries[0].links.size(), 2u);
    EXPECT_EQ(entries[0].links[0].rel, "alternate");
    EXPECT_EQ(entries[0].links[1].rel, "enclosure");
    EXPECT_TRUE(is_transfer_link(entries[0].links[1]));
}

TEST(FeedParserTest, ParsesRdf) {
    auto entries = parse_feed(R"(<?xml version="1.0"?>
<rdf:RDF xmlns:rdf="http://www.w3.org/1999/02/22-rdf-syntax-ns#" xmlns="http://purl.org/rss/1.0/">
  <channel rdf:about="https://example.org/"><title>Old style</title></channel>
  <item rdf:about="https://example.org/a">
    <title>Archive</title>
    <link>magnet:?xt=urn:btih:aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa</link>
  </item>
</rdf:RDF>)");

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].title, "Archive");
    ASSERT_EQ(entries[0].links.size(), 1u);
    EXPECT_TRUE(entries[0].links[0].href.starts_with("magnet:"));
}

TEST(FeedParserTest, EmptyChannelHasNoEntries) {
    EXPECT_TRUE(parse_feed("<rss><channel><title>quiet</title></channel></rss>").empty());
}

TEST(FeedParserTest, RejectsMalformedAndUnknownDocuments) {
    EXPECT_THROW(parse_feed("<rss><channel><item>"), FeedParseError);
    EXPECT_THROW(parse_feed("not xml at all"), FeedParseError);
    EXPECT_THROW(parse_feed("<html><body/></html>"), FeedParseError);
    EXPECT_THROW(parse_feed("<rss version=\"2.0\"/>"), FeedParseError);
}

TEST(FeedParserTest, TransferLinks) {
    EXPECT_TRUE(is_transfer_link({ "https://x/a.torrent", "application/x-bittorrent", "enclosure" }));
    EXPECT_TRUE(is_transfer_link({ "magnet:?xt=urn:btih:abc", "", "alternate" }));
    EXPECT_FALSE(is_transfer_link({ "https://x/page", "text/html", "alternate" }));
    EXPECT_FALSE(is_transfer_link({ "https://x/a.torrent", "", "alternate" }));
}
