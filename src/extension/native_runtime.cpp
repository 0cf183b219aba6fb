/*
 * native_runtime.cpp - Extensions shipped as shared libraries
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "native_runtime.hpp"

#include <dlfcn.h>

#include <format>
#include <fstream>

#include "index_client.hpp"
#include "version.hpp"

#include "atom/log/spdlog_logger.hpp"

namespace shiori::extension {

using namespace std::string_view_literals;

namespace {

#ifdef __APPLE__
constexpr const char* LIBRARY_SUFFIX = ".dylib";
#else
constexpr const char* LIBRARY_SUFFIX = ".so";
#endif

template <typename Func>
auto getFunction(void* library, const char* name) -> Func {
    return reinterpret_cast<Func>(dlsym(library, name));
}

}  // namespace

NativeRuntime::NativeRuntime(NativeRuntimeConfig config,
                             std::shared_ptr<IIndexTransport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {
    LOG_INFO("Native extension runtime using directory {}",
             config_.directory.string());
}

auto NativeRuntime::createShared(NativeRuntimeConfig config,
                                 std::shared_ptr<IIndexTransport> transport)
    -> std::shared_ptr<NativeRuntime> {
    return std::make_shared<NativeRuntime>(std::move(config),
                                           std::move(transport));
}

auto NativeRuntime::publishedFileName(std::string_view name) -> std::string {
    return std::format("lib{}{}", name, LIBRARY_SUFFIX);
}

auto NativeRuntime::storedFileName(const SourceMetadata& metadata)
    -> std::string {
    return std::format("{}-{}{}", metadata.id, metadata.version,
                       LIBRARY_SUFFIX);
}

auto NativeRuntime::sidecarFileName(int64_t id) -> std::string {
    return std::format("{}.json", id);
}

auto NativeRuntime::validatePackage(const SourceMetadata& metadata)
    -> RuntimeResult<void> {
    const auto& name = metadata.name;
    if (name.empty() || name.find_first_of("/\\\0"sv) != std::string::npos ||
        name.find("..") != std::string::npos) {
        return std::unexpected(std::format(
            "source {} has an unusable package name '{}'", metadata.id, name));
    }
    try {
        (void)Version::parse(metadata.version);
    } catch (const InvalidVersion&) {
        return std::unexpected(
            std::format("source {} has an invalid version '{}'", metadata.id,
                        metadata.version));
    }
    return {};
}

auto NativeRuntime::load(const std::filesystem::path& library)
    -> RuntimeResult<std::shared_ptr<IExtensionHandle>> {
    void* raw = dlopen(library.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!raw) {
        return std::unexpected(
            std::format("dlopen failed: {}", dlerror()));
    }
    std::shared_ptr<void> module(raw, [](void* h) { dlclose(h); });

    auto abiTag = getFunction<AbiTagFunc>(raw, ABI_TAG_SYMBOL);
    auto contract = getFunction<ContractVersionFunc>(raw, CONTRACT_VERSION_SYMBOL);
    auto create = getFunction<CreateExtensionFunc>(raw, CREATE_SYMBOL);
    auto destroy = getFunction<DestroyExtensionFunc>(raw, DESTROY_SYMBOL);
    if (!abiTag || !contract || !create || !destroy) {
        return std::unexpected(std::format(
            "{} does not export the extension entry points", library.string()));
    }

    if (config_.host.abiTag != abiTag()) {
        return std::unexpected(
            std::format("{} built for ABI '{}', host is '{}'",
                        library.string(), abiTag(), config_.host.abiTag));
    }
    if (config_.host.contractVersion != contract()) {
        return std::unexpected(std::format(
            "{} implements contract '{}', host is '{}'", library.string(),
            contract(), config_.host.contractVersion));
    }

    IExtensionHandle* instance = create();
    if (!instance) {
        return std::unexpected(std::format(
            "{} returned no extension instance", library.string()));
    }

    // The deleter owns the module so the code outlives the instance
    std::shared_ptr<IExtensionHandle> handle(
        instance, [destroy, module](IExtensionHandle* extension) {
            destroy(extension);
        });
    LOG_DEBUG("Loaded native extension {}", library.string());
    return handle;
}

auto NativeRuntime::materialize(const std::string& repoUrl,
                                const RemoteSourceDescriptor& descriptor)
    -> RuntimeResult<std::shared_ptr<IExtensionHandle>> {
    if (auto valid = validatePackage(descriptor); !valid) {
        LOG_WARN("Refusing to materialize: {}", valid.error());
        return std::unexpected(valid.error());
    }

    std::unique_lock lock(directoryMutex_);

    std::error_code ec;
    std::filesystem::create_directories(config_.directory, ec);
    if (ec) {
        return std::unexpected(
            std::format("Cannot create extension directory {}: {}",
                        config_.directory.string(), ec.message()));
    }

    auto url = repositoryResource(
        repoUrl, "library/" + publishedFileName(descriptor.name));
    auto target = config_.directory / storedFileName(descriptor);
    auto partial = target;
    partial += ".part";

    if (auto downloaded = transport_->download(url, partial); !downloaded) {
        return std::unexpected(downloaded.error());
    }

    std::filesystem::rename(partial, target, ec);
    if (ec) {
        std::filesystem::remove(partial, ec);
        return std::unexpected(std::format("Cannot move package into {}: {}",
                                           target.string(), ec.message()));
    }

    auto handle = load(target);
    if (!handle) {
        LOG_ERROR("Failed to load source {} ({}): {}", descriptor.id,
                  descriptor.name, handle.error());
        std::filesystem::remove(target, ec);
        return handle;
    }

    auto sidecar = config_.directory / sidecarFileName(descriptor.id);
    std::ofstream out(sidecar, std::ios::trunc);
    out << descriptor.toJson().dump(2);
    out.close();
    if (!out) {
        std::filesystem::remove(target, ec);
        return std::unexpected(
            std::format("Cannot write {}", sidecar.string()));
    }

    removeStaleLibraries(descriptor);
    LOG_INFO("Materialized source {} ({} {})", descriptor.id, descriptor.name,
             descriptor.version);
    return handle;
}

void NativeRuntime::release(int64_t id) {
    std::unique_lock lock(directoryMutex_);
    for (const auto& metadata : readSidecars()) {
        if (metadata.id != id) {
            continue;
        }
        std::error_code ec;
        std::filesystem::remove(config_.directory / storedFileName(metadata),
                                ec);
        if (ec) {
            LOG_WARN("Cannot remove package of source {}: {}", id,
                     ec.message());
        }
        std::filesystem::remove(
            config_.directory / sidecarFileName(metadata.id), ec);
        if (ec) {
            LOG_WARN("Cannot remove sidecar of source {}: {}", id,
                     ec.message());
        }
        LOG_INFO("Released source {} ({})", id, metadata.name);
    }
}

auto NativeRuntime::stored() -> std::vector<SourceMetadata> {
    std::unique_lock lock(directoryMutex_);
    return readSidecars();
}

auto NativeRuntime::loadStored(const SourceMetadata& metadata)
    -> RuntimeResult<std::shared_ptr<IExtensionHandle>> {
    if (auto valid = validatePackage(metadata); !valid) {
        return std::unexpected(valid.error());
    }
    std::unique_lock lock(directoryMutex_);
    return load(config_.directory / storedFileName(metadata));
}

auto NativeRuntime::readSidecars() const -> std::vector<SourceMetadata> {
    std::vector<SourceMetadata> result;
    std::error_code ec;
    if (!std::filesystem::is_directory(config_.directory, ec)) {
        return result;
    }

    for (const auto& entry :
         std::filesystem::directory_iterator(config_.directory, ec)) {
        const auto& path = entry.path();
        if (!entry.is_regular_file() || path.extension() != ".json") {
            continue;
        }
        std::ifstream in(path);
        json document = json::parse(in, nullptr, false);
        auto metadata = SourceMetadata::fromJson(document);
        if (!metadata) {
            LOG_WARN("Ignoring unreadable sidecar {}: {}", path.string(),
                     document.is_discarded() ? "invalid JSON"
                                             : metadata.error());
            continue;
        }
        if (path.filename().string() != sidecarFileName(metadata->id)) {
            LOG_WARN("Ignoring sidecar {}: it describes source {}",
                     path.string(), metadata->id);
            continue;
        }
        if (auto valid = validatePackage(*metadata); !valid) {
            LOG_WARN("Ignoring sidecar {}: {}", path.string(), valid.error());
            continue;
        }
        result.push_back(std::move(*metadata));
    }
    return result;
}

void NativeRuntime::removeStaleLibraries(const SourceMetadata& current) const {
    auto prefix = std::format("{}-", current.id);
    auto keep = storedFileName(current);
    std::error_code ec;
    for (const auto& entry :
         std::filesystem::directory_iterator(config_.directory, ec)) {
        auto fileName = entry.path().filename().string();
        std::string_view suffix = LIBRARY_SUFFIX;
        if (fileName == keep || !fileName.starts_with(prefix) ||
            !fileName.ends_with(suffix)) {
            continue;
        }
        // "12-1.0.0.so" never matches the prefix "1-"
        auto version = std::string_view(fileName).substr(
            prefix.size(), fileName.size() - prefix.size() - suffix.size());
        try {
            (void)Version::parse(version);
        } catch (const InvalidVersion&) {
            continue;
        }
        std::error_code removeError;
        std::filesystem::remove(entry.path(), removeError);
        if (removeError) {
            LOG_WARN("Cannot remove stale package {}: {}", fileName,
                     removeError.message());
        } else {
            LOG_DEBUG("Removed stale package {}", fileName);
        }
    }
}

}  // namespace shiori::extension
