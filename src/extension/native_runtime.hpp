/*
 * native_runtime.hpp - Extensions shipped as shared libraries
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SHIORI_EXTENSION_NATIVE_RUNTIME_HPP
#define SHIORI_EXTENSION_NATIVE_RUNTIME_HPP

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "compatibility.hpp"
#include "runtime.hpp"
#include "transport.hpp"

namespace shiori::extension {

/// Exported by every native extension
inline constexpr const char* ABI_TAG_SYMBOL = "shiori_extension_abi_tag";
inline constexpr const char* CONTRACT_VERSION_SYMBOL =
    "shiori_extension_contract_version";
inline constexpr const char* CREATE_SYMBOL = "shiori_create_extension";
inline constexpr const char* DESTROY_SYMBOL = "shiori_destroy_extension";

using AbiTagFunc = const char* (*)();
using ContractVersionFunc = const char* (*)();
using CreateExtensionFunc = IExtensionHandle* (*)();
using DestroyExtensionFunc = void (*)(IExtensionHandle*);

/**
 * @brief Define the entry points of a native extension
 *
 * Place once in the extension library:
 * @code
 * SHIORI_EXPORT_EXTENSION(MySource)
 * @endcode
 */
#define SHIORI_EXPORT_EXTENSION(ClassName)                                  \
    extern "C" const char* shiori_extension_abi_tag() {                     \
        return SHIORI_ABI_TAG;                                              \
    }                                                                       \
    extern "C" const char* shiori_extension_contract_version() {            \
        return SHIORI_CONTRACT_VERSION;                                     \
    }                                                                       \
    extern "C" shiori::extension::IExtensionHandle*                         \
    shiori_create_extension() {                                             \
        return new ClassName();                                             \
    }                                                                       \
    extern "C" void shiori_destroy_extension(                               \
        shiori::extension::IExtensionHandle* extension) {                   \
        delete extension;                                                   \
    }

struct NativeRuntimeConfig {
    std::filesystem::path directory = "extensions";
    HostIdentity host = HostIdentity::current();
};

/**
 * @brief Runtime that downloads `library/lib{name}.so` and dlopens it
 *
 * Each package is stored as `{id}-{version}.so` next to a sidecar
 * `{id}.json` holding its descriptor. A versioned file name keeps a freshly
 * downloaded build from resolving to an image that is still mapped.
 */
class NativeRuntime : public IExtensionRuntime {
public:
    NativeRuntime(NativeRuntimeConfig config,
                  std::shared_ptr<IIndexTransport> transport);

    static auto createShared(NativeRuntimeConfig config,
                             std::shared_ptr<IIndexTransport> transport)
        -> std::shared_ptr<NativeRuntime>;

    auto materialize(const std::string& repoUrl,
                     const RemoteSourceDescriptor& descriptor)
        -> RuntimeResult<std::shared_ptr<IExtensionHandle>> override;

    void release(int64_t id) override;

    auto stored() -> std::vector<SourceMetadata> override;

    auto loadStored(const SourceMetadata& metadata)
        -> RuntimeResult<std::shared_ptr<IExtensionHandle>> override;

    /**
     * @brief Check that a descriptor can name files in the directory
     *
     * The name must be non-empty and free of path separators and "..". The
     * version must be a valid semantic version.
     */
    static auto validatePackage(const SourceMetadata& metadata)
        -> RuntimeResult<void>;

    /**
     * @brief Load a library and instantiate its extension
     *
     * Refuses libraries whose exported ABI tag or contract version differ
     * from the host.
     */
    auto load(const std::filesystem::path& library)
        -> RuntimeResult<std::shared_ptr<IExtensionHandle>>;

    /**
     * @brief Name of the package as published in a repository
     */
    static auto publishedFileName(std::string_view name) -> std::string;

    /**
     * @brief Name of the package as stored in the extension directory
     */
    static auto storedFileName(const SourceMetadata& metadata) -> std::string;

    static auto sidecarFileName(int64_t id) -> std::string;

    [[nodiscard]] auto directory() const -> const std::filesystem::path& {
        return config_.directory;
    }

private:
    auto readSidecars() const -> std::vector<SourceMetadata>;
    void removeStaleLibraries(const SourceMetadata& current) const;

    NativeRuntimeConfig config_;
    std::shared_ptr<IIndexTransport> transport_;
    std::mutex directoryMutex_;
};

}  // namespace shiori::extension

#endif  // SHIORI_EXTENSION_NATIVE_RUNTIME_HPP
