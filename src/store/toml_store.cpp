//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "regdec/toml_store.hpp"

#include "decoder/utf16.hpp"
#include "logging.hpp"
#include "regdec/store.hpp"
#include "regdec/value_type.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <toml.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <initializer_list>
#include <limits>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace regdec
{
namespace
{

constexpr char        PathSeparator   = '\\';
constexpr const char* DefaultValueKey = "@";

struct TypeAlias
{
    const char* name;
    ValueType   type;
};

// NOLINTNEXTLINE(cert-err58-cpp)
const std::array<TypeAlias, 9> s_type_aliases{{
    {"none", ValueType::None},
    {"sz", ValueType::String},
    {"expand_sz", ValueType::ExpandString},
    {"binary", ValueType::Binary},
    {"dword", ValueType::Dword},
    {"dword_be", ValueType::DwordBigEndian},
    {"link", ValueType::Link},
    {"multi_sz", ValueType::MultiString},
    {"qword", ValueType::Qword},
}};

std::string toLower(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(), [](const unsigned char ch) {
        //
        return static_cast<char>(std::tolower(ch));
    });
    return str;
}

bool equalsIgnoreCase(const std::string& lhs, const std::string& rhs)
{
    return (lhs.size() == rhs.size()) && (toLower(lhs) == toLower(rhs));
}

bool hasEmbeddedNul(const std::string& name)
{
    return name.find('\0') != std::string::npos;
}

class TomlStoreImpl final : public TomlStore
{
public:
    using TomlConf  = toml::ordered_type_config;
    using TomlValue = toml::basic_value<TomlConf>;
    using Hives     = std::map<RootKey, TomlValue>;

    explicit TomlStoreImpl(Hives&& hives)
        : hives_{std::move(hives)}
        , next_handle_{FirstOpenedHandle}
        , logger_{common::getLogger("store")}
    {
        // Roots without a document are just empty.
        for (const auto root : {RootKey::ClassesRoot,
                                RootKey::CurrentUser,
                                RootKey::LocalMachine,
                                RootKey::Users,
                                RootKey::CurrentConfig})
        {
            if (hives_.find(root) == hives_.end())
            {
                hives_.emplace(root, TomlValue{TomlValue::table_type{}});
            }
        }
    }

    TomlStoreImpl(const TomlStoreImpl&)                = delete;
    TomlStoreImpl(TomlStoreImpl&&) noexcept            = delete;
    TomlStoreImpl& operator=(const TomlStoreImpl&)     = delete;
    TomlStoreImpl& operator=(TomlStoreImpl&&) noexcept = delete;

    ~TomlStoreImpl() override
    {
        if (!opened_.empty())
        {
            logger_->warn("TomlStore: destroyed with {} opened container(s).", opened_.size());
        }
    }

    // MARK: TomlStore

    std::size_t openedContainers() const noexcept override
    {
        return opened_.size();
    }

    // MARK: Store

    Handle getRoot(const RootKey root) const override
    {
        return static_cast<Handle>(root) + 1;
    }

    OpenResult::Var openContainer(const Handle parent, const std::string& name) override
    {
        const auto* container = resolve(parent);
        if (container == nullptr)
        {
            logger_->warn("TomlStore: can't open '{}' - bad parent handle (handle={}).", name, parent);
            return EBADF;
        }
        if (hasEmbeddedNul(name))
        {
            logger_->warn("TomlStore: can't open container - name has embedded NUL (handle={}).", parent);
            return EINVAL;
        }

        std::size_t begin = 0;
        while (begin <= name.size())
        {
            auto end = name.find(PathSeparator, begin);
            if (end == std::string::npos)
            {
                end = name.size();
            }
            if (end > begin)
            {
                container = findChild(*container, name.substr(begin, end - begin), true);
                if (container == nullptr)
                {
                    logger_->trace("TomlStore: container '{}' not found.", name);
                    return ENOENT;
                }
            }
            begin = end + 1;
        }

        const auto handle = next_handle_++;
        opened_.emplace(handle, container);
        logger_->trace("TomlStore: opened '{}' (handle={}).", name, handle);
        return handle;
    }

    int closeContainer(const Handle handle) override
    {
        if (opened_.erase(handle) == 0)
        {
            logger_->warn("TomlStore: can't close unknown handle (handle={}).", handle);
            return EBADF;
        }
        logger_->trace("TomlStore: closed (handle={}).", handle);
        return 0;
    }

    ProbeResult::Var probeValue(const Handle handle, const std::string& name) override
    {
        auto maybe_value = encodeNamedValue(handle, name);
        if (const auto* const err = cetl::get_if<int>(&maybe_value))
        {
            return *err;
        }
        const auto& encoded = cetl::get<Encoded>(maybe_value);
        return ProbeResult::Success{encoded.bytes.size(), encoded.type};
    }

    ReadResult::Var readValue(const Handle handle, const std::string& name, const std::size_t size_hint) override
    {
        auto maybe_value = encodeNamedValue(handle, name);
        if (const auto* const err = cetl::get_if<int>(&maybe_value))
        {
            return *err;
        }
        auto encoded = cetl::get<Encoded>(std::move(maybe_value));
        if (size_hint < encoded.bytes.size())
        {
            logger_->debug("TomlStore: buffer is too small for '{}' (size={}, hint={}).",
                           name,
                           encoded.bytes.size(),
                           size_hint);
            return ERANGE;
        }
        return std::move(encoded.bytes);
    }

private:
    static constexpr Handle FirstOpenedHandle = 0x100;

    struct Encoded
    {
        ValueType type;
        Bytes     bytes;
    };
    using EncodeResult = cetl::variant<Encoded, int>;

    const TomlValue* resolve(const Handle handle) const
    {
        const auto opened_it = opened_.find(handle);
        if (opened_it != opened_.end())
        {
            return opened_it->second;
        }
        const auto hive_it = std::find_if(hives_.cbegin(), hives_.cend(), [this, handle](const Hives::value_type& hive) {
            //
            return getRoot(hive.first) == handle;
        });
        return (hive_it != hives_.cend()) ? &hive_it->second : nullptr;
    }

    static bool isContainer(const TomlValue& value)
    {
        return value.is_table() && (value.as_table_fmt().fmt != toml::table_format::oneline);
    }

    /// Finds a child container (or a value) by its case insensitive name.
    ///
    static const TomlValue* findChild(const TomlValue& container, const std::string& name, const bool want_container)
    {
        if (!container.is_table())
        {
            return nullptr;
        }
        for (const auto& key_value : container.as_table())
        {
            if ((isContainer(key_value.second) == want_container) && equalsIgnoreCase(key_value.first, name))
            {
                return &key_value.second;
            }
        }
        return nullptr;
    }

    EncodeResult encodeNamedValue(const Handle handle, const std::string& name) const
    {
        const auto* const container = resolve(handle);
        if (container == nullptr)
        {
            logger_->warn("TomlStore: can't query '{}' - bad handle (handle={}).", name, handle);
            return EBADF;
        }
        if (hasEmbeddedNul(name))
        {
            logger_->warn("TomlStore: can't query value - name has embedded NUL (handle={}).", handle);
            return EINVAL;
        }

        const auto* const value = findChild(*container, name.empty() ? DefaultValueKey : name, false);
        if (value == nullptr)
        {
            logger_->trace("TomlStore: value '{}' not found (handle={}).", name, handle);
            return ENOENT;
        }

        auto result = encodeValue(*value);
        if (cetl::get_if<int>(&result) != nullptr)
        {
            logger_->warn("TomlStore: value '{}' can't be represented in the store (handle={}).", name, handle);
        }
        return result;
    }

    static EncodeResult encodeValue(const TomlValue& value)
    {
        if (value.is_table())
        {
            return encodeTypedValue(value);
        }
        if (value.is_integer())
        {
            const auto integer = value.as_integer();
            if ((integer >= 0) && (integer <= std::numeric_limits<std::uint32_t>::max()))
            {
                return Encoded{ValueType::Dword, encodeInteger(static_cast<std::uint64_t>(integer), 4, false)};
            }
            return Encoded{ValueType::Qword, encodeInteger(static_cast<std::uint64_t>(integer), 8, false)};
        }
        if (value.is_string())
        {
            return Encoded{ValueType::String, encodeText(value.as_string())};
        }
        if (value.is_array())
        {
            if (auto bytes = encodeByteArray(value))
            {
                return Encoded{ValueType::Binary, std::move(*bytes)};
            }
            if (auto multi_text = encodeMultiText(value))
            {
                return Encoded{ValueType::MultiString, std::move(*multi_text)};
            }
            return EINVAL;
        }
        return Encoded{ValueType::None, {}};
    }

    /// Encodes `{ type = ..., data = ... }` inline table.
    ///
    static EncodeResult encodeTypedValue(const TomlValue& value)
    {
        if (!value.contains("type"))
        {
            return EINVAL;
        }
        const auto maybe_type = parseValueType(value.at("type"));
        if (!maybe_type)
        {
            return EINVAL;
        }
        const auto type = *maybe_type;

        if (!value.contains("data"))
        {
            return Encoded{type, {}};
        }
        const auto& data = value.at("data");

        // Raw bytes are taken as is, regardless of the type.
        if (auto bytes = encodeByteArray(data))
        {
            return Encoded{type, std::move(*bytes)};
        }

        switch (type)
        {
        case ValueType::String:
        case ValueType::ExpandString:
        case ValueType::Link:
            if (data.is_string())
            {
                return Encoded{type, encodeText(data.as_string())};
            }
            break;
        case ValueType::MultiString:
            if (auto multi_text = encodeMultiText(data))
            {
                return Encoded{type, std::move(*multi_text)};
            }
            break;
        case ValueType::Dword:
        case ValueType::DwordBigEndian:
            if (data.is_integer())
            {
                return Encoded{type,
                               encodeInteger(static_cast<std::uint64_t>(data.as_integer()),
                                             4,
                                             type == ValueType::DwordBigEndian)};
            }
            break;
        case ValueType::Qword:
            if (data.is_integer())
            {
                return Encoded{type, encodeInteger(static_cast<std::uint64_t>(data.as_integer()), 8, false)};
            }
            break;
        default:
            break;
        }
        return EINVAL;
    }

    static cetl::optional<ValueType> parseValueType(const TomlValue& type)
    {
        if (type.is_integer())
        {
            const auto raw = type.as_integer();
            if ((raw < 0) || (raw > std::numeric_limits<std::uint32_t>::max()))
            {
                return cetl::nullopt;
            }
            return static_cast<ValueType>(raw);
        }
        if (!type.is_string())
        {
            return cetl::nullopt;
        }

        const auto name = toLower(type.as_string());
        for (const auto& alias : s_type_aliases)
        {
            if ((name == alias.name) || (name == toLower(describeValueType(alias.type))))
            {
                return alias.type;
            }
        }
        return cetl::nullopt;
    }

    static Bytes encodeInteger(const std::uint64_t value, const std::size_t width, const bool big_endian)
    {
        Bytes bytes(width);
        for (std::size_t i = 0; i < width; ++i)
        {
            const auto byte = static_cast<std::uint8_t>(value >> (i * 8U));  // NOLINT(*-magic-numbers)
            bytes[big_endian ? (width - 1 - i) : i] = byte;
        }
        return bytes;
    }

    static Bytes encodeText(const std::string& text)
    {
        auto bytes = detail::utf8ToUtf16le(text);
        bytes.push_back(0);
        bytes.push_back(0);
        return bytes;
    }

    static cetl::optional<Bytes> encodeByteArray(const TomlValue& value)
    {
        if (!value.is_array())
        {
            return cetl::nullopt;
        }
        const auto& array = value.as_array();
        if (array.empty())
        {
            return Bytes{};
        }

        Bytes bytes;
        bytes.reserve(array.size());
        for (const auto& item : array)
        {
            if (!item.is_integer() || (item.as_integer() < 0) ||
                (item.as_integer() > std::numeric_limits<std::uint8_t>::max()))
            {
                return cetl::nullopt;
            }
            bytes.push_back(static_cast<std::uint8_t>(item.as_integer()));
        }
        return bytes;
    }

    static cetl::optional<Bytes> encodeMultiText(const TomlValue& value)
    {
        if (!value.is_array())
        {
            return cetl::nullopt;
        }

        Bytes bytes;
        for (const auto& item : value.as_array())
        {
            if (!item.is_string())
            {
                return cetl::nullopt;
            }
            const auto text = encodeText(item.as_string());
            bytes.insert(bytes.end(), text.cbegin(), text.cend());
        }
        bytes.push_back(0);
        bytes.push_back(0);
        return bytes;
    }

    Hives                              hives_;
    std::map<Handle, const TomlValue*> opened_;
    Handle                             next_handle_;
    common::LoggerPtr                  logger_;

};  // TomlStoreImpl

constexpr TomlStore::Handle TomlStoreImpl::FirstOpenedHandle;

}  // namespace

TomlStore::Ptr TomlStore::make(const HiveFiles& hive_files)
{
    const auto logger = common::getLogger("store");

    TomlStoreImpl::Hives hives;
    for (const auto& root_file : hive_files)
    {
        try
        {
            hives.emplace(root_file.first, toml::parse<TomlStoreImpl::TomlConf>(root_file.second));
            logger->debug("TomlStore: loaded hive file '{}'.", root_file.second);

        } catch (const std::exception& ex)
        {
            logger->warn("TomlStore: failed to load hive file '{}' - root stays empty. Error: {}",
                         root_file.second,
                         ex.what());
        }
    }
    return std::make_unique<TomlStoreImpl>(std::move(hives));
}

TomlStore::Ptr TomlStore::makeFromText(const HiveTexts& hive_texts)
{
    const auto logger = common::getLogger("store");

    TomlStoreImpl::Hives hives;
    for (const auto& root_text : hive_texts)
    {
        try
        {
            hives.emplace(root_text.first, toml::parse_str<TomlStoreImpl::TomlConf>(root_text.second));

        } catch (const std::exception& ex)
        {
            logger->warn("TomlStore: failed to parse hive text - root stays empty. Error: {}", ex.what());
        }
    }
    return std::make_unique<TomlStoreImpl>(std::move(hives));
}

}  // namespace regdec
