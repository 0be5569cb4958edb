//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REGDEC_PLATFORM_REGISTRY_STORE_HPP_INCLUDED
#define REGDEC_PLATFORM_REGISTRY_STORE_HPP_INCLUDED

#include "regdec/store.hpp"

#include <cetl/cetl.hpp>

#include <memory>

namespace regdec
{
namespace platform
{

/// Read-only store over the native Windows registry.
///
/// Error codes are Win32 `LSTATUS` values (like `ERROR_FILE_NOT_FOUND`).
///
class RegistryStore : public Store
{
public:
    using Ptr = std::unique_ptr<RegistryStore>;

    CETL_NODISCARD static Ptr make();

protected:
    RegistryStore() = default;

};  // RegistryStore

}  // namespace platform
}  // namespace regdec

#endif  // REGDEC_PLATFORM_REGISTRY_STORE_HPP_INCLUDED
