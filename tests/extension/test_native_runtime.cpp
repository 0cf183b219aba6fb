/*
 * test_native_runtime.cpp - Tests for shared library extensions
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <future>
#include <string>
#include <vector>

#include "extension/extension.hpp"
#include "extension/mock_extension.hpp"

using namespace shiori::extension;
namespace fs = std::filesystem;

class NativeRuntimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info =
            ::testing::UnitTest::GetInstance()->current_test_info();
        root = fs::temp_directory_path() /
               ("shiori_native_" + std::string(info->name()));
        fs::remove_all(root);
        fs::create_directories(root / "repo" / "library");
        fs::copy_file(SHIORI_FIXTURE_EXTENSION,
                      root / "repo" / "library" /
                          NativeRuntime::publishedFileName("fixture"));

        repoUrl = "file://" + (root / "repo").string();
        transport = CurlTransport::createShared();
        runtime = makeRuntime(HostIdentity::current());
    }

    void TearDown() override {
        runtime.reset();
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    auto makeRuntime(HostIdentity host) -> std::shared_ptr<NativeRuntime> {
        return NativeRuntime::createShared({root / "extensions", std::move(host)},
                                           transport);
    }

    auto fixture(const std::string& version) const -> RemoteSourceDescriptor {
        auto host = HostIdentity::current();
        return shiori::test::makeDescriptor(1, "fixture", version, host.abiTag,
                                            host.contractVersion);
    }

    auto stored(const std::string& version) const -> fs::path {
        return root / "extensions" /
               NativeRuntime::storedFileName(fixture(version));
    }

    fs::path root;
    std::string repoUrl;
    std::shared_ptr<CurlTransport> transport;
    std::shared_ptr<NativeRuntime> runtime;
};

// ============================================================================
// Materialize
// ============================================================================

TEST_F(NativeRuntimeTest, MaterializeLoadsLibrary) {
    auto handle = runtime->materialize(repoUrl, fixture("1.0.0"));
    ASSERT_TRUE(handle) << handle.error();

    auto popular = (*handle)->getPopularManga(3);
    ASSERT_TRUE(popular);
    ASSERT_EQ(popular->size(), 1u);
    EXPECT_EQ((*popular)[0]["title"], "Fixture Manga");
    EXPECT_EQ((*popular)[0]["path"], "/manga/3");

    EXPECT_TRUE(fs::exists(stored("1.0.0")));
    EXPECT_TRUE(fs::exists(root / "extensions" /
                           NativeRuntime::sidecarFileName(1)));
    EXPECT_FALSE(fs::exists(stored("1.0.0").string() + ".part"));
}

TEST_F(NativeRuntimeTest, MissingPackageLeavesNothingBehind) {
    auto descriptor = fixture("1.0.0");
    descriptor.name = "absent";

    auto handle = runtime->materialize(repoUrl, descriptor);
    ASSERT_FALSE(handle);
    EXPECT_TRUE(fs::is_empty(root / "extensions"));
}

TEST_F(NativeRuntimeTest, InvalidLibraryIsRejected) {
    std::ofstream(root / "repo" / "library" /
                  NativeRuntime::publishedFileName("broken"))
        << "not a shared object";
    auto descriptor = fixture("1.0.0");
    descriptor.name = "broken";

    auto handle = runtime->materialize(repoUrl, descriptor);
    ASSERT_FALSE(handle);
    EXPECT_NE(handle.error().find("dlopen"), std::string::npos);
    EXPECT_FALSE(fs::exists(root / "extensions" /
                            NativeRuntime::storedFileName(descriptor)));
}

TEST_F(NativeRuntimeTest, HostMismatchIsRefused) {
    auto foreign = makeRuntime(
        HostIdentity{"other-abi", HostIdentity::current().contractVersion});

    auto handle = foreign->materialize(repoUrl, fixture("1.0.0"));
    ASSERT_FALSE(handle);
    EXPECT_NE(handle.error().find("other-abi"), std::string::npos);
    EXPECT_FALSE(fs::exists(stored("1.0.0")));
}

TEST_F(NativeRuntimeTest, UnsafePackageNamesAreRefused) {
    for (const std::string name :
         {"x/../../escaped", "..", "a\\b", "", "nested/lib"}) {
        auto descriptor = fixture("1.0.0");
        descriptor.name = name;

        auto handle = runtime->materialize(repoUrl, descriptor);
        ASSERT_FALSE(handle) << name;
        EXPECT_NE(handle.error().find("package name"), std::string::npos);
    }
    EXPECT_FALSE(fs::exists(root / "escaped-1.0.0.so.part"));
    EXPECT_FALSE(fs::exists(root / "extensions" / "libx"));
    EXPECT_FALSE(fs::exists(root / "extensions"));
}

TEST_F(NativeRuntimeTest, InvalidVersionIsRefusedBeforeDownload) {
    auto handle = runtime->materialize(repoUrl, fixture("../1"));
    ASSERT_FALSE(handle);
    EXPECT_NE(handle.error().find("invalid version"), std::string::npos);
    EXPECT_FALSE(fs::exists(root / "extensions"));
}

TEST_F(NativeRuntimeTest, SourcesSharingANameKeepSeparateFiles) {
    auto other = fixture("2.0.0");
    other.id = 2;

    ASSERT_TRUE(runtime->materialize(repoUrl, fixture("1.0.0")));
    ASSERT_TRUE(runtime->materialize(repoUrl, other));

    EXPECT_TRUE(fs::exists(stored("1.0.0")));
    EXPECT_TRUE(fs::exists(root / "extensions" /
                           NativeRuntime::storedFileName(other)));
    EXPECT_EQ(runtime->stored().size(), 2u);

    runtime->release(1);
    EXPECT_FALSE(fs::exists(stored("1.0.0")));
    EXPECT_TRUE(fs::exists(root / "extensions" /
                           NativeRuntime::storedFileName(other)));
    auto remaining = runtime->stored();
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].id, 2);
}

TEST_F(NativeRuntimeTest, NewVersionRemovesStalePackage) {
    auto first = runtime->materialize(repoUrl, fixture("1.0.0"));
    ASSERT_TRUE(first) << first.error();
    auto second = runtime->materialize(repoUrl, fixture("1.1.0"));
    ASSERT_TRUE(second) << second.error();

    EXPECT_FALSE(fs::exists(stored("1.0.0")));
    EXPECT_TRUE(fs::exists(stored("1.1.0")));

    // The older instance stays usable while it is held
    EXPECT_TRUE((*first)->getLatestManga(1));
}

// ============================================================================
// Restore and release
// ============================================================================

TEST_F(NativeRuntimeTest, StoredPackagesReloadAfterRestart) {
    ASSERT_TRUE(runtime->materialize(repoUrl, fixture("1.0.0")));

    auto restarted = makeRuntime(HostIdentity::current());
    auto packages = restarted->stored();
    ASSERT_EQ(packages.size(), 1u);
    EXPECT_EQ(packages[0], fixture("1.0.0"));

    auto handle = restarted->loadStored(packages[0]);
    ASSERT_TRUE(handle) << handle.error();
    EXPECT_TRUE((*handle)->getPages("/c/1"));
}

TEST_F(NativeRuntimeTest, NothingStoredInEmptyDirectory) {
    EXPECT_TRUE(runtime->stored().empty());
}

TEST_F(NativeRuntimeTest, MisplacedOrUnsafeSidecarsAreIgnored) {
    fs::create_directories(root / "extensions");
    auto misplaced = fixture("1.0.0");
    std::ofstream(root / "extensions" / NativeRuntime::sidecarFileName(7))
        << misplaced.toJson().dump();
    auto unsafe = fixture("1.0.0");
    unsafe.id = 8;
    unsafe.name = "../outside";
    std::ofstream(root / "extensions" / NativeRuntime::sidecarFileName(8))
        << unsafe.toJson().dump();

    EXPECT_TRUE(runtime->stored().empty());
}

TEST_F(NativeRuntimeTest, ReleaseRemovesPackageAndSidecar) {
    ASSERT_TRUE(runtime->materialize(repoUrl, fixture("1.0.0")));
    runtime->release(1);

    EXPECT_FALSE(fs::exists(stored("1.0.0")));
    EXPECT_FALSE(fs::exists(root / "extensions" /
                            NativeRuntime::sidecarFileName(1)));
    EXPECT_TRUE(runtime->stored().empty());
}

// ============================================================================
// Through the lifecycle
// ============================================================================

TEST_F(NativeRuntimeTest, InstallBrowseUninstall) {
    std::ofstream(root / "repo" / "index.json")
        << json::array({fixture("1.0.0").toJson()}).dump();

    ExtensionRegistry registry;
    RemoteIndexClient indexClient(transport);
    LifecycleOrchestrator lifecycle(registry, indexClient, *runtime);
    CatalogService catalog(registry);

    auto installed = lifecycle.install(repoUrl, 1);
    ASSERT_TRUE(installed) << installed.error().describe();

    auto manga = catalog.popular(1, 1);
    ASSERT_TRUE(manga) << manga.error().describe();
    ASSERT_EQ(manga->size(), 1u);
    EXPECT_EQ(manga->front().author, std::vector<std::string>{"Fixture Author"});

    auto pages = catalog.pages(1, "/c/9");
    ASSERT_TRUE(pages);
    EXPECT_EQ(pages->front(), "/c/9/1.jpg");

    auto missing = catalog.detail(1, "/missing");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ExtensionErrorCode::ExecutionError);

    ASSERT_TRUE(lifecycle.uninstall(1));
    EXPECT_FALSE(fs::exists(stored("1.0.0")));
}

TEST_F(NativeRuntimeTest, LifecycleRestoreGatesStoredPackages) {
    ASSERT_TRUE(runtime->materialize(repoUrl, fixture("1.0.0")));

    ExtensionRegistry registry;
    RemoteIndexClient indexClient(transport);
    auto upgraded = HostIdentity{"next-abi",
                                 HostIdentity::current().contractVersion};
    LifecycleOrchestrator stale(registry, indexClient, *runtime, upgraded);
    EXPECT_EQ(stale.restore(), 0u);
    EXPECT_FALSE(registry.exists(1));

    LifecycleOrchestrator current(registry, indexClient, *runtime);
    EXPECT_EQ(current.restore(), 1u);
    EXPECT_TRUE(registry.exists(1));
}

TEST_F(NativeRuntimeTest, TransportServesConcurrentCalls) {
    std::ofstream(root / "repo" / "index.json") << "[]";
    fs::create_directories(root / "downloads");

    std::vector<std::future<bool>> calls;
    for (int i = 0; i < 8; ++i) {
        calls.push_back(std::async(std::launch::async, [this, i] {
            if (i % 2 == 0) {
                auto body = transport->get(repoUrl + "/index.json");
                return body.has_value() && *body == "[]";
            }
            auto target = root / "downloads" / ("copy" + std::to_string(i));
            return transport
                       ->download(repoUrl + "/library/" +
                                      NativeRuntime::publishedFileName("fixture"),
                                  target)
                       .has_value() &&
                   fs::file_size(target) ==
                       fs::file_size(SHIORI_FIXTURE_EXTENSION);
        }));
    }
    for (auto& call : calls) {
        EXPECT_TRUE(call.get());
    }
}

TEST_F(NativeRuntimeTest, DownloadNeedsExistingDirectory) {
    auto result = transport->download(
        repoUrl + "/library/" + NativeRuntime::publishedFileName("fixture"),
        root / "missing" / "dir" / "file.so");
    EXPECT_FALSE(result);
    EXPECT_FALSE(fs::exists(root / "missing"));
}

TEST(CurlTransportTest, MissingFileIsError) {
    CurlTransport transport;
    auto body = transport.get("file:///nonexistent/shiori/index.json");
    EXPECT_FALSE(body);
}
