/**
 * @file PendingWrite.hpp
 * @brief A save write waiting for its frame to be confirmed.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef CINDER_PERSIST_PENDINGWRITE_HPP
    #define CINDER_PERSIST_PENDINGWRITE_HPP

#include <cinder/core/Types.hpp>

#include <filesystem>
#include <optional>

namespace cinder::persist {

struct PendingWrite
{
    core::Frame                frame{0};
    core::u32                  slot{0};
    std::optional<core::Bytes> data;        ///< std::nullopt records a delete.
    std::filesystem::path      destination;
};

} // namespace cinder::persist

#endif // CINDER_PERSIST_PENDINGWRITE_HPP
