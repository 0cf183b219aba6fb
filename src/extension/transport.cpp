/*
 * transport.cpp - Fetching repository resources
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "transport.hpp"

#include <format>
#include <fstream>

#include "atom/error/exception.hpp"
#include "atom/log/spdlog_logger.hpp"

namespace shiori::extension {

namespace {

auto stringWriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata)
    -> size_t {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

auto fileWriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata)
    -> size_t {
    auto* file = static_cast<std::ofstream*>(userdata);
    file->write(ptr, static_cast<std::streamsize>(size * nmemb));
    return file->good() ? size * nmemb : 0;
}

}  // namespace

CurlTransport::CurlTransport(CurlTransportConfig config)
    : config_(std::move(config)) {
    if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
        THROW_RUNTIME_ERROR("Failed to initialize libcurl");
    }
    LOG_DEBUG("Curl transport ready (timeout {}s, agent '{}')",
              config_.timeout.count(), config_.userAgent);
}

CurlTransport::~CurlTransport() = default;

auto CurlTransport::createShared(CurlTransportConfig config)
    -> std::shared_ptr<CurlTransport> {
    return std::make_shared<CurlTransport>(std::move(config));
}

auto CurlTransport::openHandle() -> std::expected<CurlHandle, std::string> {
    CurlHandle curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        return std::unexpected(std::string("Failed to create curl handle"));
    }
    return curl;
}

auto CurlTransport::perform(CURL* curl, const std::string& url)
    -> std::expected<void, std::string> {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.userAgent.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT,
                     static_cast<long>(config_.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        return std::unexpected(
            std::format("GET {} failed: {}", url, curl_easy_strerror(res)));
    }

    // file:// transfers report no response code
    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
    if (httpCode != 0 && (httpCode < 200 || httpCode >= 300)) {
        return std::unexpected(
            std::format("GET {} returned HTTP {}", url, httpCode));
    }
    return {};
}

auto CurlTransport::get(const std::string& url)
    -> std::expected<std::string, std::string> {
    auto curl = openHandle();
    if (!curl) {
        return std::unexpected(curl.error());
    }

    std::string body;
    curl_easy_setopt(curl->get(), CURLOPT_WRITEFUNCTION, stringWriteCallback);
    curl_easy_setopt(curl->get(), CURLOPT_WRITEDATA, &body);

    LOG_DEBUG("GET {}", url);
    auto result = perform(curl->get(), url);
    if (!result) {
        LOG_ERROR("{}", result.error());
        return std::unexpected(result.error());
    }
    return body;
}

auto CurlTransport::download(const std::string& url,
                             const std::filesystem::path& destination)
    -> std::expected<void, std::string> {
    auto curl = openHandle();
    if (!curl) {
        return std::unexpected(curl.error());
    }

    std::ofstream output(destination, std::ios::binary | std::ios::trunc);
    if (!output) {
        return std::unexpected(
            std::format("Cannot open {} for writing", destination.string()));
    }

    curl_easy_setopt(curl->get(), CURLOPT_WRITEFUNCTION, fileWriteCallback);
    curl_easy_setopt(curl->get(), CURLOPT_WRITEDATA, &output);

    LOG_INFO("Downloading {} to {}", url, destination.string());
    auto result = perform(curl->get(), url);
    output.close();

    if (!result || !output) {
        std::error_code ec;
        std::filesystem::remove(destination, ec);
        auto message = result ? std::format("Failed writing {}",
                                            destination.string())
                              : result.error();
        LOG_ERROR("{}", message);
        return std::unexpected(message);
    }
    return {};
}

}  // namespace shiori::extension
