// /////////////////////////////////////////////////////////////////////////////
/// @file IFrameSource.hpp
/// @brief Read access to the rollback engine's frame counter.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <cinder/core/Types.hpp>

namespace cinder::engine {

class IFrameSource
{
public:
    virtual ~IFrameSource() = default;

    /// @brief Frame currently being simulated (resimulated during rollback).
    [[nodiscard]] virtual core::Frame currentFrame() const = 0;
};

} // namespace cinder::engine
