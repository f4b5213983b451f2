#include <gtest/gtest.h>
#include "TestFakes.hpp"
#include "services/ContentResolver.hpp"

using namespace Pequod;
using namespace Pequod::Testing;

namespace {

const std::string kArticle =
    "This is the article body. It is long enough to count as readable text, which means it has "
    "well over eighty characters in it.";

Entry entryWithLink(const std::string& link) {
    Entry entry;
    entry.id = 7;
    entry.link = link;
    return entry;
}

}

class ContentResolverTest : public ::testing::Test {
protected:
    FakeTransport transport_;
    FakeTextExtractor extractor_;
    ContentResolver resolver_{transport_, extractor_, 20};
};

TEST_F(ContentResolverTest, ReturnsExtractedText) {
    transport_.respond("https://example.com/post", kArticle, "text/html; charset=utf-8");
    EXPECT_EQ(resolver_.resolveFullContent(entryWithLink("https://example.com/post")), kArticle);
}

TEST_F(ContentResolverTest, MissingContentTypeIsAccepted) {
    transport_.respond("https://example.com/post", kArticle);
    EXPECT_EQ(resolver_.resolveFullContent(entryWithLink("https://example.com/post")), kArticle);
}

TEST_F(ContentResolverTest, FetchFailuresBecomeResolutionErrors) {
    transport_.fail("https://example.com/down", FakeTransport::Failure::Fetch);
    transport_.fail("https://example.com/slow", FakeTransport::Failure::Timeout);
    EXPECT_THROW(resolver_.resolveFullContent(entryWithLink("https://example.com/down")), ResolutionError);
    EXPECT_THROW(resolver_.resolveFullContent(entryWithLink("https://example.com/slow")), ResolutionError);
}

TEST_F(ContentResolverTest, NonHtmlIsRejected) {
    transport_.respond("https://example.com/paper.pdf", kArticle, "application/pdf");
    EXPECT_THROW(resolver_.resolveFullContent(entryWithLink("https://example.com/paper.pdf")), ResolutionError);
}

TEST_F(ContentResolverTest, ShortTextIsRejected) {
    transport_.respond("https://example.com/stub", "Subscribe to read more.", "text/html");
    EXPECT_THROW(resolver_.resolveFullContent(entryWithLink("https://example.com/stub")), ResolutionError);
}

TEST_F(ContentResolverTest, EntryWithoutLinkIsRejected) {
    EXPECT_THROW(resolver_.resolveFullContent(entryWithLink("")), ResolutionError);
    EXPECT_TRUE(transport_.requested().empty());
}
