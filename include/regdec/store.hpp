//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REGDEC_STORE_HPP_INCLUDED
#define REGDEC_STORE_HPP_INCLUDED

#include "value_type.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace regdec
{

/// Predefined roots of a hierarchical store.
///
enum class RootKey
{
    ClassesRoot,
    CurrentUser,
    LocalMachine,
    Users,
    CurrentConfig,

};  // RootKey

/// Abstract interface of a read-only hierarchical key-value store (aka registry).
///
/// A store consists of named containers (keys), each holding child containers and typed values.
/// All failures are reported as platform specific error codes (`errno` or `LSTATUS` values).
///
class Store
{
public:
    using Ptr    = std::unique_ptr<Store>;
    using Handle = std::uintptr_t;
    using Bytes  = std::vector<std::uint8_t>;

    struct OpenResult
    {
        using Failure = int;
        using Success = Handle;
        using Var     = cetl::variant<Success, Failure>;
    };

    struct ProbeResult
    {
        using Failure = int;
        struct Success
        {
            std::size_t size;
            ValueType   type;
        };
        using Var = cetl::variant<Success, Failure>;
    };

    struct ReadResult
    {
        using Failure = int;
        using Success = Bytes;
        using Var     = cetl::variant<Success, Failure>;
    };

    Store(const Store&)                = delete;
    Store(Store&&) noexcept            = delete;
    Store& operator=(const Store&)     = delete;
    Store& operator=(Store&&) noexcept = delete;

    virtual ~Store() = default;

    /// Gets a handle of a predefined root.
    ///
    /// Root handles are never closed.
    ///
    CETL_NODISCARD virtual Handle getRoot(const RootKey root) const = 0;

    /// Opens a child container of the given parent container.
    ///
    /// @param name Name of the child. Might be a `\`-separated relative path,
    ///             and might be empty (opens a new handle to the parent itself).
    /// @return Handle of the opened container, which has to be closed by `closeContainer`.
    ///
    CETL_NODISCARD virtual OpenResult::Var openContainer(const Handle parent, const std::string& name) = 0;

    /// Releases a container handle previously returned by `openContainer`.
    ///
    /// @return Zero on success, otherwise platform error code.
    ///
    CETL_NODISCARD virtual int closeContainer(const Handle handle) = 0;

    /// Gets the payload size and the type tag of a named value.
    ///
    CETL_NODISCARD virtual ProbeResult::Var probeValue(const Handle handle, const std::string& name) = 0;

    /// Reads the payload of a named value.
    ///
    /// @param size_hint The size reported by `probeValue`.
    ///
    CETL_NODISCARD virtual ReadResult::Var readValue(const Handle       handle,
                                                     const std::string& name,
                                                     const std::size_t  size_hint) = 0;

protected:
    Store() = default;

};  // Store

}  // namespace regdec

#endif  // REGDEC_STORE_HPP_INCLUDED
