//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "regdec/platform/registry_store.hpp"

#include "decoder/utf16.hpp"
#include "logging.hpp"
#include "regdec/store.hpp"
#include "regdec/value_type.hpp"

#include <cetl/cetl.hpp>

#include <windows.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace regdec
{
namespace platform
{
namespace
{

std::wstring toWide(const std::string& text)
{
    const auto   utf16 = detail::utf8ToUtf16le(text);
    std::wstring wide;
    wide.reserve(utf16.size() / 2);
    for (std::size_t i = 0; (i + 1) < utf16.size(); i += 2)
    {
        wide.push_back(static_cast<wchar_t>(utf16[i] | (utf16[i + 1] << 8U)));  // NOLINT(*-magic-numbers)
    }
    return wide;
}

/// Registry API takes null terminated names, so a name with an embedded NUL can't be passed as is.
///
bool hasEmbeddedNul(const std::string& name)
{
    return name.find('\0') != std::string::npos;
}

HKEY toHkey(const Store::Handle handle)
{
    return reinterpret_cast<HKEY>(handle);  // NOLINT(*-reinterpret-cast, performance-no-int-to-ptr)
}

class RegistryStoreImpl final : public RegistryStore
{
public:
    RegistryStoreImpl()
        : logger_{common::getLogger("store")}
    {
    }

    RegistryStoreImpl(const RegistryStoreImpl&)                = delete;
    RegistryStoreImpl(RegistryStoreImpl&&) noexcept            = delete;
    RegistryStoreImpl& operator=(const RegistryStoreImpl&)     = delete;
    RegistryStoreImpl& operator=(RegistryStoreImpl&&) noexcept = delete;

    ~RegistryStoreImpl() override = default;

    // MARK: Store

    Handle getRoot(const RootKey root) const override
    {
        switch (root)
        {
        case RootKey::ClassesRoot:
            return reinterpret_cast<Handle>(HKEY_CLASSES_ROOT);  // NOLINT(*-reinterpret-cast)
        case RootKey::CurrentUser:
            return reinterpret_cast<Handle>(HKEY_CURRENT_USER);  // NOLINT(*-reinterpret-cast)
        case RootKey::LocalMachine:
            return reinterpret_cast<Handle>(HKEY_LOCAL_MACHINE);  // NOLINT(*-reinterpret-cast)
        case RootKey::Users:
            return reinterpret_cast<Handle>(HKEY_USERS);  // NOLINT(*-reinterpret-cast)
        case RootKey::CurrentConfig:
        default:
            return reinterpret_cast<Handle>(HKEY_CURRENT_CONFIG);  // NOLINT(*-reinterpret-cast)
        }
    }

    OpenResult::Var openContainer(const Handle parent, const std::string& name) override
    {
        if (hasEmbeddedNul(name))
        {
            logger_->warn("RegistryStore: can't open container - name has embedded NUL.");
            return static_cast<int>(ERROR_INVALID_PARAMETER);
        }
        HKEY       hkey   = nullptr;
        const auto status = ::RegOpenKeyExW(toHkey(parent), toWide(name).c_str(), 0, KEY_READ, &hkey);
        if (status != ERROR_SUCCESS)
        {
            logger_->trace("RegistryStore: failed to open '{}' (status={}).", name, status);
            return static_cast<int>(status);
        }
        return reinterpret_cast<Handle>(hkey);  // NOLINT(*-reinterpret-cast)
    }

    int closeContainer(const Handle handle) override
    {
        return static_cast<int>(::RegCloseKey(toHkey(handle)));
    }

    ProbeResult::Var probeValue(const Handle handle, const std::string& name) override
    {
        if (hasEmbeddedNul(name))
        {
            logger_->warn("RegistryStore: can't probe value - name has embedded NUL.");
            return static_cast<int>(ERROR_INVALID_PARAMETER);
        }
        DWORD      type   = REG_NONE;
        DWORD      size   = 0;
        const auto status = ::RegQueryValueExW(toHkey(handle), toWide(name).c_str(), nullptr, &type, nullptr, &size);
        if (status != ERROR_SUCCESS)
        {
            logger_->trace("RegistryStore: failed to probe '{}' (status={}).", name, status);
            return static_cast<int>(status);
        }
        return ProbeResult::Success{size, static_cast<ValueType>(type)};
    }

    ReadResult::Var readValue(const Handle handle, const std::string& name, const std::size_t size_hint) override
    {
        if (hasEmbeddedNul(name))
        {
            logger_->warn("RegistryStore: can't read value - name has embedded NUL.");
            return static_cast<int>(ERROR_INVALID_PARAMETER);
        }
        Bytes      bytes(size_hint);
        auto       size   = static_cast<DWORD>(bytes.size());
        const auto status = ::RegQueryValueExW(toHkey(handle),
                                               toWide(name).c_str(),
                                               nullptr,
                                               nullptr,
                                               bytes.data(),
                                               &size);
        if (status != ERROR_SUCCESS)
        {
            logger_->trace("RegistryStore: failed to read '{}' (status={}).", name, status);
            return static_cast<int>(status);
        }
        bytes.resize(size);
        return bytes;
    }

private:
    common::LoggerPtr logger_;

};  // RegistryStoreImpl

}  // namespace

RegistryStore::Ptr RegistryStore::make()
{
    return std::make_unique<RegistryStoreImpl>();
}

}  // namespace platform
}  // namespace regdec
