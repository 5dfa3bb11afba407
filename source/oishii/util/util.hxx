/*!
 * @file
 * @brief File helpers for the endian streams.
 */

#pragma once

#include <core/common.h>
#include <oishii/interfaces.hxx>

namespace oishii {

Result<std::vector<u8>> UtilReadFile(std::string_view path);
Result<void> FlushFile(std::span<const u8> buf, std::string_view path);

} // namespace oishii
