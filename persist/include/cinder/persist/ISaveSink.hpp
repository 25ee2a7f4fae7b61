/**
 * @file ISaveSink.hpp
 * @brief Where confirmed writes end up.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef CINDER_PERSIST_ISAVESINK_HPP
    #define CINDER_PERSIST_ISAVESINK_HPP

#include <cinder/core/Expected.hpp>
#include <cinder/persist/PendingWrite.hpp>

namespace cinder::persist {

/**
 * @class ISaveSink
 * @brief Commits one confirmed write; called from the writer thread only.
 */
class ISaveSink
{
public:
    virtual ~ISaveSink() = default;

    [[nodiscard]] virtual core::Expected<void> commit(const PendingWrite &record) = 0;
};

/**
 * @class FileSaveSink
 * @brief Writes the record's destination with SaveFile, or deletes it.
 */
class FileSaveSink final : public ISaveSink
{
public:
    [[nodiscard]] core::Expected<void> commit(const PendingWrite &record) override;
};

} // namespace cinder::persist

#endif // CINDER_PERSIST_ISAVESINK_HPP
