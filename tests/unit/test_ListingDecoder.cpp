#include <gtest/gtest.h>
#include "transfer/ListingDecoder.hpp"
#include "transfer/errors.hpp"

#include <string>
#include <vector>

using namespace d8::transfer;

namespace {

std::vector<ListingEntry> decodeInSlices(const std::string& body, const std::size_t slice) {
    std::vector<ListingEntry> out;
    ListingDecoder decoder([&](ListingEntry&& e) { out.push_back(std::move(e)); });
    for (std::size_t i = 0; i < body.size(); i += slice) decoder.feed(std::string_view(body).substr(i, slice));
    decoder.finish();
    return out;
}

}

TEST(ListingDecoderTest, DecodesFilesAndDirs) {
    const auto entries = decodeInSlices(R"({"items":[{"name":"a.txt","type":"file"},{"name":"sub","type":"dir"}]})", 4096);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "a.txt");
    EXPECT_EQ(entries[0].type, EntryType::File);
    EXPECT_EQ(entries[1].name, "sub");
    EXPECT_EQ(entries[1].type, EntryType::Dir);
}

TEST(ListingDecoderTest, AnySplitPointYieldsTheSameEntries) {
    const std::string body =
        R"( { "kind" : "List", "meta": {"items": [1, 2]}, "items" : [ )"
        R"({"name":"we\"ird, name","type":"file","size":3}, )"
        R"({"name":"}{[]","type":"dir","extra":{"nested":["]"]}} ] , "tail": true })";

    const auto whole = decodeInSlices(body, body.size());
    ASSERT_EQ(whole.size(), 2u);
    EXPECT_EQ(whole[0].name, "we\"ird, name");
    EXPECT_EQ(whole[1].name, "}{[]");

    for (std::size_t slice = 1; slice < 9; ++slice) {
        const auto parts = decodeInSlices(body, slice);
        ASSERT_EQ(parts.size(), whole.size()) << "slice " << slice;
        for (std::size_t i = 0; i < parts.size(); ++i) {
            EXPECT_EQ(parts[i].name, whole[i].name);
            EXPECT_EQ(parts[i].type, whole[i].type);
        }
    }
}

TEST(ListingDecoderTest, EmptyItemsIsDone) {
    ListingDecoder decoder([](ListingEntry&&) { FAIL() << "no entries expected"; });
    decoder.feed(R"({"items": []})");
    EXPECT_EQ(decoder.state(), ListingDecoder::State::Done);
    EXPECT_NO_THROW(decoder.finish());
}

TEST(ListingDecoderTest, StatesAdvanceWithInput) {
    std::size_t seen = 0;
    ListingDecoder decoder([&](ListingEntry&&) { ++seen; });
    EXPECT_EQ(decoder.state(), ListingDecoder::State::SeekingItemsKey);
    decoder.feed(R"({"items":)");
    EXPECT_EQ(decoder.state(), ListingDecoder::State::SeekingItemsKey);
    decoder.feed("[");
    EXPECT_EQ(decoder.state(), ListingDecoder::State::InArray);
    decoder.feed(R"({"name":"x","type":"file"})");
    EXPECT_EQ(seen, 1u);
    EXPECT_EQ(decoder.entriesEmitted(), 1u);
    decoder.feed("]");
    EXPECT_EQ(decoder.state(), ListingDecoder::State::Done);
}

TEST(ListingDecoderTest, TruncatedStreamFailsOnFinish) {
    ListingDecoder decoder([](ListingEntry&&) {});
    decoder.feed(R"({"items":[{"name":"x","type":"file"},)");
    EXPECT_THROW(decoder.finish(), ProtocolError);

    ListingDecoder empty([](ListingEntry&&) {});
    EXPECT_THROW(empty.finish(), ProtocolError);
}

TEST(ListingDecoderTest, RejectsMalformedInput) {
    const std::vector<std::string> bad{
        R"([])",
        R"({"items": {}})",
        R"({"other": 1})",
        R"({"items":[{"name":"x","type":"link"}]})",
        R"({"items":[{"name":"x"}]})",
        R"({"items":["x"]})",
        R"({"items":[{"name":"a","type":"file"},]})",
        R"({"items":[{"name":"a","type":"file"} {"name":"b","type":"file"}]})",
        R"({"items":[{"name":"../etc","type":"file"}]})",
        R"({"items":[{"name":"a/b","type":"file"}]})",
    };
    for (const auto& body : bad) {
        ListingDecoder decoder([](ListingEntry&&) {});
        EXPECT_THROW({
            decoder.feed(body);
            decoder.finish();
        }, ProtocolError) << body;
    }
}

TEST(ListingDecoderTest, IgnoresBytesAfterTheArray) {
    std::size_t seen = 0;
    ListingDecoder decoder([&](ListingEntry&&) { ++seen; });
    decoder.feed(R"({"items":[{"name":"a","type":"file"}], "garbage": [[[)");
    EXPECT_NO_THROW(decoder.finish());
    EXPECT_EQ(seen, 1u);
}
