//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REGDEC_CLI_OS_INFO_HPP_INCLUDED
#define REGDEC_CLI_OS_INFO_HPP_INCLUDED

#include <regdec/schema.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace regdec
{
namespace cli
{

/// Build identity, stored side by side with the version numbers.
///
struct BuildInfo
{
    std::string   current_build;
    std::uint32_t ubr{0};
    std::string   build_lab_ex;

    static auto regdecSchema()
    {
        return fields(REGDEC_FIELD(BuildInfo, current_build, "CurrentBuild"),
                      REGDEC_FIELD(BuildInfo, ubr, "UBR"),
                      REGDEC_FIELD(BuildInfo, build_lab_ex, "BuildLabEx"));
    }
};

/// Windows version information, as found under `SOFTWARE\Microsoft\Windows NT\CurrentVersion`.
///
struct OsInfo
{
    std::string                 product_name;
    std::string                 edition_id;
    std::string                 display_version;
    std::uint32_t               major_version{0};
    std::uint32_t               minor_version{0};
    std::uint32_t               install_date{0};
    std::uint64_t               install_time{0};
    std::string                 system_root;
    std::vector<std::uint8_t>   digital_product_id;
    std::vector<std::string>    language_packs;
    BuildInfo                   build;
    cetl::optional<std::string> registered_owner;

    static auto regdecSchema()
    {
        return fields(REGDEC_FIELD(OsInfo, product_name, "ProductName,required"),
                      REGDEC_FIELD(OsInfo, edition_id, "EditionID"),
                      REGDEC_FIELD(OsInfo, display_version, "DisplayVersion"),
                      REGDEC_FIELD(OsInfo, major_version, "CurrentMajorVersionNumber"),
                      REGDEC_FIELD(OsInfo, minor_version, "CurrentMinorVersionNumber"),
                      REGDEC_FIELD(OsInfo, install_date, "InstallDate"),
                      REGDEC_FIELD(OsInfo, install_time, "InstallTime"),
                      REGDEC_FIELD(OsInfo, system_root, "SystemRoot"),
                      REGDEC_FIELD(OsInfo, digital_product_id, "DigitalProductId"),
                      REGDEC_FIELD(OsInfo, language_packs, "LanguagePacks"),
                      REGDEC_FIELD(OsInfo, build, ",embedded"),
                      REGDEC_FIELD(OsInfo, registered_owner, "RegisteredOwner"));
    }
};

}  // namespace cli
}  // namespace regdec

#endif  // REGDEC_CLI_OS_INFO_HPP_INCLUDED
