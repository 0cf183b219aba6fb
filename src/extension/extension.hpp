/*
 * extension.hpp - Source extension lifecycle and dispatch
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SHIORI_EXTENSION_EXTENSION_HPP
#define SHIORI_EXTENSION_EXTENSION_HPP

#include "catalog.hpp"
#include "compatibility.hpp"
#include "error.hpp"
#include "index_client.hpp"
#include "lifecycle.hpp"
#include "native_runtime.hpp"
#include "registry.hpp"
#include "runtime.hpp"
#include "source_service.hpp"
#include "transport.hpp"
#include "types.hpp"
#include "version.hpp"

#endif  // SHIORI_EXTENSION_EXTENSION_HPP
