//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REGDEC_TOML_STORE_HPP_INCLUDED
#define REGDEC_TOML_STORE_HPP_INCLUDED

#include "store.hpp"

#include <cetl/cetl.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <string>

namespace regdec
{

/// Read-only store backed by TOML documents, one document per root ("hive").
///
/// Tables are containers (names matched case insensitively), and all other keys are values:
/// - integer in `[0, 0xFFFFFFFF]` range is `REG_DWORD`, any other integer is `REG_QWORD`;
/// - string is `REG_SZ`;
/// - array of strings is `REG_MULTI_SZ`, and array of integers in `[0, 255]` range is `REG_BINARY`;
/// - inline table `{ type = "...", data = ... }` forces the type tag; the `type` is either
///   a tag name (like `expand_sz`, `dword_be` or `REG_QWORD`) or a raw tag number,
///   and a `data` array of bytes is taken as is (whatever the tag is);
/// - anything else (booleans, floats, dates) is `REG_NONE`.
///
/// The default (unnamed) value of a container is stored under the `@` key.
///
class TomlStore : public Store
{
public:
    using Ptr       = std::unique_ptr<TomlStore>;
    using HiveFiles = std::map<RootKey, std::string>;
    using HiveTexts = std::map<RootKey, std::string>;

    /// Makes a new store from TOML files.
    ///
    /// A root without a file (or with a file which can't be loaded) is just empty.
    ///
    CETL_NODISCARD static Ptr make(const HiveFiles& hive_files);

    /// Makes a new store from TOML documents given as text.
    ///
    CETL_NODISCARD static Ptr makeFromText(const HiveTexts& hive_texts);

    /// Number of currently opened (not yet closed) container handles.
    ///
    CETL_NODISCARD virtual std::size_t openedContainers() const noexcept = 0;

protected:
    TomlStore() = default;

};  // TomlStore

}  // namespace regdec

#endif  // REGDEC_TOML_STORE_HPP_INCLUDED
