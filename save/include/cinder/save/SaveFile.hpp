/**
 * @file SaveFile.hpp
 * @brief On-disk save container with a checksum header.
 *
 * Layout (little endian):
 * @code
 *   magic "NCSV" | version u32 | payload length u32 | checksum u32 | payload
 * @endcode
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef CINDER_SAVE_SAVEFILE_HPP
    #define CINDER_SAVE_SAVEFILE_HPP

#include <cinder/core/Types.hpp>
#include <cinder/core/Expected.hpp>

#include <array>
#include <filesystem>
#include <span>

namespace cinder::save {

class SaveFile final
{
public:
    static constexpr std::array<core::byte, 4> kMagic{core::byte{'N'}, core::byte{'C'}, core::byte{'S'}, core::byte{'V'}};
    static constexpr core::u32   kVersion    = 2;
    static constexpr core::usize kHeaderSize = 16;

    /** @brief Header + payload image. */
    [[nodiscard]] static core::Bytes encode(std::span<const core::byte> payload);

    /**
     * @brief Validates an image and returns its payload.
     * @return kCorruptedData for a bad magic, version or length,
     *         kChecksumMismatch for a payload that fails its checksum.
     */
    [[nodiscard]] static core::Expected<core::Bytes> decode(std::span<const core::byte> image);

    /**
     * @brief Atomically replaces @p path.
     *
     * Writes "<path>.tmp", fsyncs it, then renames it over @p path.  Parent
     * directories are created as needed.
     */
    [[nodiscard]] static core::Expected<void> write(const std::filesystem::path &path,
                                                    std::span<const core::byte> payload);

    /** @brief Reads and validates @p path; kNotFound if it does not exist. */
    [[nodiscard]] static core::Expected<core::Bytes> read(const std::filesystem::path &path);

    /** @brief Deletes @p path; a missing file is not an error. */
    [[nodiscard]] static core::Expected<void> remove(const std::filesystem::path &path);
};

} // namespace cinder::save

#endif // CINDER_SAVE_SAVEFILE_HPP
