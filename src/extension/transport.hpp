/*
 * transport.hpp - Fetching repository resources
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SHIORI_EXTENSION_TRANSPORT_HPP
#define SHIORI_EXTENSION_TRANSPORT_HPP

#include <chrono>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>

#include <curl/curl.h>

namespace shiori::extension {

/**
 * @brief Transport used to reach an extension repository
 *
 * Errors are plain descriptions; callers decide which taxonomy code they map
 * to.
 */
class IIndexTransport {
public:
    virtual ~IIndexTransport() = default;

    /**
     * @brief GET a resource and return its body
     *
     * Fails on transport errors and on any status outside 2xx.
     */
    virtual auto get(const std::string& url)
        -> std::expected<std::string, std::string> = 0;

    /**
     * @brief GET a resource into a file, replacing it
     *
     * The parent directory must exist. A partially written file is removed
     * on failure.
     */
    virtual auto download(const std::string& url,
                          const std::filesystem::path& destination)
        -> std::expected<void, std::string> = 0;
};

struct CurlTransportConfig {
    std::chrono::seconds timeout{30};
    std::string userAgent = "Shiori/0.1";
};

/**
 * @brief libcurl transport, supports http(s) and file:// repositories
 *
 * Every call performs on its own easy handle, so a long package download
 * does not hold up index fetches.
 */
class CurlTransport : public IIndexTransport {
public:
    explicit CurlTransport(CurlTransportConfig config = {});
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    static auto createShared(CurlTransportConfig config = {})
        -> std::shared_ptr<CurlTransport>;

    auto get(const std::string& url)
        -> std::expected<std::string, std::string> override;

    auto download(const std::string& url,
                  const std::filesystem::path& destination)
        -> std::expected<void, std::string> override;

private:
    using CurlHandle = std::unique_ptr<CURL, void (*)(CURL*)>;

    static auto openHandle() -> std::expected<CurlHandle, std::string>;

    auto perform(CURL* curl, const std::string& url)
        -> std::expected<void, std::string>;

    CurlTransportConfig config_;
};

}  // namespace shiori::extension

#endif  // SHIORI_EXTENSION_TRANSPORT_HPP
