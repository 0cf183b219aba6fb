/*
 * fixture_extension.cpp - Native extension loaded by the runtime tests
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "extension/native_runtime.hpp"

namespace {

using shiori::extension::Filters;
using shiori::extension::IExtensionHandle;
using shiori::extension::json;
using shiori::extension::RuntimeResult;

class FixtureSource : public IExtensionHandle {
public:
    auto getPopularManga(int page) -> RuntimeResult<json> override {
        return json::array({manga("Fixture Manga", page)});
    }

    auto getLatestManga(int page) -> RuntimeResult<json> override {
        return json::array({manga("Fixture Latest", page)});
    }

    auto searchManga(int page, const std::optional<std::string>& query,
                     const std::optional<Filters>& /*filters*/)
        -> RuntimeResult<json> override {
        if (!query || query->empty()) {
            return json::array();
        }
        return json::array({manga(*query, page)});
    }

    auto getMangaDetail(const std::string& path) -> RuntimeResult<json> override {
        if (path == "/missing") {
            return std::unexpected("no manga at " + path);
        }
        auto detail = manga("Fixture Manga", 1);
        detail["path"] = path;
        return detail;
    }

    auto getChapters(const std::string& path) -> RuntimeResult<json> override {
        return json::array({{{"sourceId", 1},
                             {"title", "Chapter 1"},
                             {"path", path + "/1"},
                             {"number", 1},
                             {"uploaded", 1700000000}}});
    }

    auto getPages(const std::string& path) -> RuntimeResult<json> override {
        return json::array({path + "/1.jpg", path + "/2.jpg"});
    }

private:
    static auto manga(const std::string& title, int page) -> json {
        return {{"sourceId", 1},
                {"title", title},
                {"author", {"Fixture Author"}},
                {"genre", {"Test"}},
                {"status", "ongoing"},
                {"description", nullptr},
                {"path", "/manga/" + std::to_string(page)},
                {"coverUrl", "https://fixture.example/cover.jpg"}};
    }
};

}  // namespace

SHIORI_EXPORT_EXTENSION(FixtureSource)
