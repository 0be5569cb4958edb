//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "regdec/detail/engine.hpp"

#include "logging.hpp"
#include "regdec/detail/entry.hpp"
#include "regdec/error.hpp"
#include "regdec/store.hpp"
#include "regdec/value_codec.hpp"
#include "regdec/value_type.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <spdlog/fmt/fmt.h>

#include <string>
#include <utility>

namespace regdec
{
namespace detail
{
namespace
{

constexpr char PathSeparator = '\\';

common::LoggerPtr engineLogger()
{
    return common::getLogger("regdec");
}

std::string joinPath(const std::string& parent_path, const std::string& name)
{
    if (name.empty())
    {
        return parent_path;
    }
    return parent_path + PathSeparator + name;
}

/// RAII wrapper of an opened container handle.
///
/// The handle should be released explicitly with `close` (so that a failure can be reported);
/// the destructor releases it only if that hasn't happened (e.g. on exception).
///
class ScopedContainer final
{
public:
    ScopedContainer(Store& store, const Store::Handle handle)
        : store_{store}
        , handle_{handle}
    {
    }

    ScopedContainer(const ScopedContainer&)                = delete;
    ScopedContainer(ScopedContainer&&) noexcept            = delete;
    ScopedContainer& operator=(const ScopedContainer&)     = delete;
    ScopedContainer& operator=(ScopedContainer&&) noexcept = delete;

    ~ScopedContainer()
    {
        if (handle_)
        {
            if (const int err = store_.closeContainer(*handle_))
            {
                engineLogger()->warn("Failed to release container handle (handle={}, err={}).", *handle_, err);
            }
        }
    }

    CETL_NODISCARD int close()
    {
        CETL_DEBUG_ASSERT(handle_, "");

        const auto handle = *handle_;
        handle_.reset();
        return store_.closeContainer(handle);
    }

private:
    Store&                        store_;
    cetl::optional<Store::Handle> handle_;

};  // ScopedContainer

OptError populateSubentries(ContainerNode& node, Store& store, const Store::Handle handle, const std::string& path)
{
    for (auto& subentry : node.subentries)
    {
        if (auto failure = populate(*subentry, store, handle, path))
        {
            return failure;
        }
    }
    return cetl::nullopt;
}

OptError populateContainer(const FieldSpec&    field,
                           ContainerNode&      node,
                           Store&              store,
                           const Store::Handle parent,
                           const std::string&  parent_path)
{
    // Members of an embedded composite live in the very same container as their enclosing composite.
    if (field.embedded)
    {
        return populateSubentries(node, store, parent, parent_path);
    }

    const auto path        = joinPath(parent_path, field.name);
    auto       maybe_handle = store.openContainer(parent, field.name);
    if (const auto* const err = cetl::get_if<Store::OpenResult::Failure>(&maybe_handle))
    {
        if (field.required)
        {
            engineLogger()->debug("Required key '{}' could not be opened (err={}).", path, *err);
            return makeError(ErrorCode::RequiredMissing,
                             fmt::format("registry: required key '{}' could not be opened (err={}).", path, *err));
        }

        engineLogger()->debug("Skipping optional key '{}' (err={}).", path, *err);
        node.skipped = true;
        return cetl::nullopt;
    }
    const auto handle = cetl::get<Store::OpenResult::Success>(maybe_handle);
    engineLogger()->trace("Opened key '{}' (handle={}).", path, handle);

    ScopedContainer scoped{store, handle};

    auto result = populateSubentries(node, store, handle, path);

    if (const int err = scoped.close())
    {
        engineLogger()->warn("Failed to release key '{}' (handle={}, err={}).", path, handle, err);
        if (result)
        {
            result->message += fmt::format(" Also failed to release key '{}' (err={}).", path, err);
        }
        else
        {
            result = makeError(ErrorCode::ReleaseFailed,
                               fmt::format("registry: failed to release key '{}' (err={}).", path, err));
        }
    }
    return result;
}

OptError populateValue(const FieldSpec&    field,
                       ValueNode&          node,
                       Store&              store,
                       const Store::Handle parent,
                       const std::string&  parent_path)
{
    const auto path = joinPath(parent_path, field.name);

    const auto missing = [&field, &node, &path](const int err) -> OptError {
        //
        if (field.required)
        {
            engineLogger()->debug("Required value '{}' could not be read (err={}).", path, err);
            return makeError(ErrorCode::RequiredMissing,
                             fmt::format("registry: required value '{}' could not be read (err={}).", path, err));
        }

        engineLogger()->debug("Skipping optional value '{}' (err={}).", path, err);
        node.skipped = true;
        node.raw_data.reset();
        return cetl::nullopt;
    };

    // First probe the size and the type...
    //
    const auto maybe_info = store.probeValue(parent, field.name);
    if (const auto* const err = cetl::get_if<Store::ProbeResult::Failure>(&maybe_info))
    {
        return missing(*err);
    }
    const auto info = cetl::get<Store::ProbeResult::Success>(maybe_info);

    // ...and then read the whole payload.
    //
    auto maybe_data = store.readValue(parent, field.name, info.size);
    if (const auto* const err = cetl::get_if<Store::ReadResult::Failure>(&maybe_data))
    {
        return missing(*err);
    }

    node.raw_data   = cetl::get<Store::ReadResult::Success>(std::move(maybe_data));
    node.value_type = info.type;
    engineLogger()->trace("Read value '{}' (type={}, size={}).",
                          path,
                          describeValueType(info.type),
                          node.raw_data->size());
    return cetl::nullopt;
}

/// Decodes and type checks all values of the tree, without touching the target.
///
OptError stage(Entry& entry)
{
    return cetl::visit(  //
        cetl::make_overloaded(
            [](ContainerNode& node) -> OptError {
                //
                if (node.skipped)
                {
                    return cetl::nullopt;
                }
                for (auto& subentry : node.subentries)
                {
                    if (auto failure = stage(*subentry))
                    {
                        return failure;
                    }
                }
                return cetl::nullopt;
            },
            [&entry](ValueNode& node) -> OptError {
                //
                if (node.skipped)
                {
                    return cetl::nullopt;
                }
                CETL_DEBUG_ASSERT(node.raw_data && node.value_type, "Entry is not populated.");

                auto maybe_value = decodeRaw(*node.raw_data, *node.value_type, entry.field.name);
                if (auto* const failure = cetl::get_if<DecodeResult::Failure>(&maybe_value))
                {
                    return std::move(*failure);
                }
                auto value = cetl::get<DecodeResult::Success>(std::move(maybe_value));

                const auto kind = kindOf(value);
                if (!node.accepts(kind))
                {
                    return makeError(ErrorCode::TypeMismatch,
                                     fmt::format("registry: tried to unmarshal {} registry value '{}' of type {} "
                                                 "into a {}.",
                                                 describeCanonicalKind(kind),
                                                 entry.field.name,
                                                 describeValueType(*node.value_type),
                                                 node.target_type));
                }

                node.staged = std::move(value);
                return cetl::nullopt;
            }),
        entry.node);
}

/// Writes all staged values into the target.
///
void commit(Entry& entry, void* const field)
{
    cetl::visit(  //
        cetl::make_overloaded(
            [field](ContainerNode& node) {
                //
                if (node.skipped)
                {
                    return;
                }
                void* const composite = node.materialize(field);
                for (auto& subentry : node.subentries)
                {
                    commit(*subentry, subentry->locate(composite));
                }
            },
            [field](ValueNode& node) {
                //
                if (node.skipped)
                {
                    return;
                }
                CETL_DEBUG_ASSERT(node.staged, "Entry is not staged.");

                node.assign(field, std::move(*node.staged));
                node.staged.reset();
            }),
        entry.node);
}

}  // namespace

OptError populate(Entry& entry, Store& store, const Store::Handle parent, const std::string& parent_path)
{
    return cetl::visit(  //
        cetl::make_overloaded(
            [&](ContainerNode& node) {
                //
                return populateContainer(entry.field, node, store, parent, parent_path);
            },
            [&](ValueNode& node) {
                //
                return populateValue(entry.field, node, store, parent, parent_path);
            }),
        entry.node);
}

OptError unmarshal(Entry& entry, void* const field)
{
    if (auto failure = stage(entry))
    {
        return failure;
    }
    commit(entry, field);
    return cetl::nullopt;
}

OptError decodeTree(Entry&             root_entry,
                    Store&             store,
                    const RootKey      root_key,
                    const std::string& root_name,
                    void* const        target)
{
    const auto root_handle = store.getRoot(root_key);
    if (auto failure = populate(root_entry, store, root_handle, root_name))
    {
        engineLogger()->debug("Failed to populate '{}\\{}': {}", root_name, root_entry.field.name, failure->message);
        return failure;
    }
    if (auto failure = unmarshal(root_entry, target))
    {
        engineLogger()->debug("Failed to unmarshal '{}\\{}': {}", root_name, root_entry.field.name, failure->message);
        return failure;
    }

    engineLogger()->debug("Decoded '{}\\{}'.", root_name, root_entry.field.name);
    return cetl::nullopt;
}

}  // namespace detail
}  // namespace regdec
