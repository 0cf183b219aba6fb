/*
 * test_types.cpp - Tests for source and catalog records
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

#include "extension/mock_extension.hpp"
#include "extension/types.hpp"

using namespace shiori::extension;
using shiori::test::makeDescriptor;

// ============================================================================
// SourceMetadata
// ============================================================================

class SourceMetadataTest : public ::testing::Test {
protected:
    void SetUp() override {
        entry = {{"id", 7},
                 {"name", "foo"},
                 {"url", "https://foo.example"},
                 {"version", "1.0.0"},
                 {"abi_tag", "X"},
                 {"contract_version", "Y"},
                 {"icon", "https://foo.example/icon.png"}};
    }

    json entry;
};

TEST_F(SourceMetadataTest, DecodesManifestEntry) {
    auto metadata = SourceMetadata::fromJson(entry);
    ASSERT_TRUE(metadata) << metadata.error();
    EXPECT_EQ(metadata->id, 7);
    EXPECT_EQ(metadata->name, "foo");
    EXPECT_EQ(metadata->abiTag, "X");
    EXPECT_EQ(metadata->contractVersion, "Y");
    EXPECT_EQ(metadata->toJson(), entry);
}

TEST_F(SourceMetadataTest, MissingFieldIsReported) {
    entry.erase("abi_tag");
    auto metadata = SourceMetadata::fromJson(entry);
    ASSERT_FALSE(metadata);
    EXPECT_NE(metadata.error().find("abi_tag"), std::string::npos);
}

TEST_F(SourceMetadataTest, WrongTypeIsReported) {
    entry["id"] = "7";
    auto metadata = SourceMetadata::fromJson(entry);
    ASSERT_FALSE(metadata);
    EXPECT_NE(metadata.error().find("'id'"), std::string::npos);

    entry["id"] = 7;
    entry["version"] = 1;
    EXPECT_FALSE(SourceMetadata::fromJson(entry));
}

TEST_F(SourceMetadataTest, NonObjectIsRejected) {
    EXPECT_FALSE(SourceMetadata::fromJson(json::array()));
    EXPECT_FALSE(SourceMetadata::fromJson("foo"));
}

TEST(SourceTest, CarriesComputedUpdateFlag) {
    auto source = Source::from(makeDescriptor(3, "bar", "2.0.0"), true);
    auto j = source.toJson();
    EXPECT_EQ(j["id"], 3);
    EXPECT_EQ(j["has_update"], true);
    EXPECT_EQ(Source::from(source).hasUpdate, false);
}

// ============================================================================
// NativeSchema
// ============================================================================

TEST(NativeSchemaTest, MangaFromNativeRecord) {
    json native = {{"sourceId", 1},
                   {"title", "Yotsuba"},
                   {"author", {"Azuma"}},
                   {"genre", {"Comedy", "Slice of Life"}},
                   {"status", "ongoing"},
                   {"description", nullptr},
                   {"path", "/manga/yotsuba"},
                   {"coverUrl", "https://img.example/yotsuba.jpg"}};

    auto manga = NativeSchema<MangaInfo>::fromNative(native);
    ASSERT_TRUE(manga) << manga.error();
    EXPECT_EQ(manga->sourceId, 1);
    EXPECT_EQ(manga->genre.size(), 2u);
    EXPECT_EQ(manga->status, "ongoing");
    EXPECT_FALSE(manga->description.has_value());
    EXPECT_EQ(manga->coverUrl, "https://img.example/yotsuba.jpg");
    EXPECT_EQ(NativeSchema<MangaInfo>::toNative(*manga), native);
}

TEST(NativeSchemaTest, MangaOptionalFieldsMayBeAbsent) {
    json native = {{"sourceId", 1},
                   {"title", "Untitled"},
                   {"path", "/m/1"},
                   {"coverUrl", ""}};
    auto manga = NativeSchema<MangaInfo>::fromNative(native);
    ASSERT_TRUE(manga) << manga.error();
    EXPECT_TRUE(manga->author.empty());
    EXPECT_FALSE(manga->status.has_value());

    auto j = manga->toJson();
    EXPECT_TRUE(j["status"].is_null());
    EXPECT_EQ(j["cover_url"], "");
    EXPECT_EQ(j["source_id"], 1);
}

TEST(NativeSchemaTest, MangaRequiredFieldsAreEnforced) {
    json native = {{"sourceId", 1}, {"path", "/m/1"}, {"coverUrl", ""}};
    auto manga = NativeSchema<MangaInfo>::fromNative(native);
    ASSERT_FALSE(manga);
    EXPECT_NE(manga.error().find("title"), std::string::npos);

    native["title"] = "T";
    native["genre"] = {"ok", 3};
    EXPECT_FALSE(NativeSchema<MangaInfo>::fromNative(native));
}

TEST(NativeSchemaTest, ChapterDefaults) {
    json native = {{"sourceId", 2},
                   {"title", "Chapter 10.5"},
                   {"path", "/c/105"},
                   {"number", 10.5}};
    auto chapter = NativeSchema<ChapterInfo>::fromNative(native);
    ASSERT_TRUE(chapter) << chapter.error();
    EXPECT_DOUBLE_EQ(chapter->number, 10.5);
    EXPECT_EQ(chapter->scanlator, "");
    EXPECT_EQ(chapter->uploaded, 0);

    native.erase("number");
    EXPECT_FALSE(NativeSchema<ChapterInfo>::fromNative(native));
}

TEST(NativeSchemaTest, IntegersBeyondInt64AreRejected) {
    json manga = {{"sourceId", std::numeric_limits<uint64_t>::max()},
                  {"title", "T"},
                  {"path", "/m/1"},
                  {"coverUrl", ""}};
    auto decoded = NativeSchema<MangaInfo>::fromNative(manga);
    ASSERT_FALSE(decoded);
    EXPECT_NE(decoded.error().find("out of range"), std::string::npos);

    json chapter = {{"sourceId", 2},
                    {"title", "Chapter 1"},
                    {"path", "/c/1"},
                    {"number", 1},
                    {"uploaded", uint64_t{9223372036854775808ULL}}};
    EXPECT_FALSE(NativeSchema<ChapterInfo>::fromNative(chapter));

    chapter["uploaded"] = uint64_t{1700000000};
    auto accepted = NativeSchema<ChapterInfo>::fromNative(chapter);
    ASSERT_TRUE(accepted) << accepted.error();
    EXPECT_EQ(accepted->uploaded, 1700000000);
}

TEST(NativeSchemaTest, PagesMustBeStrings) {
    EXPECT_EQ(NativeSchema<std::string>::fromNative("https://p/1.jpg").value(),
              "https://p/1.jpg");
    EXPECT_FALSE(NativeSchema<std::string>::fromNative(1));
}
