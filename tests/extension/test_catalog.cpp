/*
 * test_catalog.cpp - Tests for catalog normalization
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "extension/catalog.hpp"
#include "extension/mock_extension.hpp"
#include "extension/registry.hpp"

using namespace shiori::extension;
using namespace shiori::test;

namespace {

auto nativeManga(const std::string& title, const std::string& path) -> json {
    return {{"sourceId", 1},
            {"title", title},
            {"author", {"Author"}},
            {"genre", json::array()},
            {"status", nullptr},
            {"description", "desc"},
            {"path", path},
            {"coverUrl", "https://img.example" + path}};
}

}  // namespace

class CatalogServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        handle = std::make_shared<ScriptedHandle>();
        ASSERT_TRUE(registry.registerSource(makeDescriptor(1, "foo", "1.0.0"),
                                            handle));
    }

    ExtensionRegistry registry;
    CatalogService catalog{registry};
    std::shared_ptr<ScriptedHandle> handle;
};

TEST_F(CatalogServiceTest, PopularPreservesOrder) {
    handle->setResult(json::array({nativeManga("B", "/m/b"),
                                   nativeManga("A", "/m/a"),
                                   nativeManga("C", "/m/c")}));

    auto manga = catalog.popular(1, 2);
    ASSERT_TRUE(manga) << manga.error().describe();
    ASSERT_EQ(manga->size(), 3u);
    EXPECT_EQ((*manga)[0].title, "B");
    EXPECT_EQ((*manga)[1].title, "A");
    EXPECT_EQ((*manga)[2].title, "C");
    EXPECT_EQ((*manga)[0].description, "desc");
    EXPECT_FALSE((*manga)[0].status.has_value());
    EXPECT_EQ(handle->lastPage(), 2);
}

TEST_F(CatalogServiceTest, EmptyPageIsValid) {
    auto manga = catalog.latest(1, 9);
    ASSERT_TRUE(manga);
    EXPECT_TRUE(manga->empty());
}

TEST_F(CatalogServiceTest, MissingTitleIsProtocolError) {
    auto broken = nativeManga("B", "/m/b");
    broken.erase("title");
    handle->setResult(json::array({nativeManga("A", "/m/a"), broken}));

    auto manga = catalog.search(1, 1, "q", std::nullopt);
    ASSERT_FALSE(manga);
    EXPECT_EQ(manga.error().code, ExtensionErrorCode::ProtocolError);
    EXPECT_EQ(manga.error().detail.rfind("element 1:", 0), 0u);
}

TEST_F(CatalogServiceTest, DetailNormalizesSingleRecord) {
    handle->setResult(nativeManga("Solo", "/m/solo"));

    auto manga = catalog.detail(1, "/m/solo");
    ASSERT_TRUE(manga) << manga.error().describe();
    EXPECT_EQ(manga->path, "/m/solo");
    EXPECT_EQ(manga->author, std::vector<std::string>{"Author"});
    EXPECT_EQ(handle->lastPath(), "/m/solo");
}

TEST_F(CatalogServiceTest, ChaptersNormalized) {
    handle->setResult(json::array(
        {{{"sourceId", 1},
          {"title", "Ch. 2"},
          {"path", "/c/2"},
          {"number", 2},
          {"scanlator", "group"},
          {"uploaded", 1700000000}},
         {{"sourceId", 1}, {"title", "Ch. 1"}, {"path", "/c/1"}, {"number", 1}}}));

    auto chapters = catalog.chapters(1, "/m/a");
    ASSERT_TRUE(chapters) << chapters.error().describe();
    ASSERT_EQ(chapters->size(), 2u);
    EXPECT_EQ((*chapters)[0].scanlator, "group");
    EXPECT_EQ((*chapters)[0].uploaded, 1700000000);
    EXPECT_DOUBLE_EQ((*chapters)[1].number, 1.0);
}

TEST_F(CatalogServiceTest, PagesMustBeStrings) {
    handle->setResult(json::array({"https://p/1.jpg", "https://p/2.jpg"}));
    auto pages = catalog.pages(1, "/c/1");
    ASSERT_TRUE(pages);
    EXPECT_EQ(*pages, (PageList{"https://p/1.jpg", "https://p/2.jpg"}));

    handle->setResult(json::array({"https://p/1.jpg", 2}));
    auto broken = catalog.pages(1, "/c/1");
    ASSERT_FALSE(broken);
    EXPECT_EQ(broken.error().code, ExtensionErrorCode::ProtocolError);
}

TEST_F(CatalogServiceTest, ErrorsFromDispatchPassThrough) {
    auto missing = catalog.popular(2, 1);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ExtensionErrorCode::NotFound);

    handle->setFailure("boom");
    auto failed = catalog.chapters(1, "/m/a");
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().code, ExtensionErrorCode::ExecutionError);
}
