/**
 * @file FileSaveSink.cpp
 * @brief FileSaveSink implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <cinder/persist/ISaveSink.hpp>
#include <cinder/save/SaveFile.hpp>

namespace cinder::persist {

core::Expected<void> FileSaveSink::commit(const PendingWrite &record)
{
    if (record.data)
    {
        return save::SaveFile::write(record.destination, *record.data);
    }
    return save::SaveFile::remove(record.destination);
}

} // namespace cinder::persist
