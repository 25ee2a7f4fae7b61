// /////////////////////////////////////////////////////////////////////////////
/// @file IRollbackListener.hpp
/// @brief Confirmation and rollback notifications from the rollback engine.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <cinder/core/Types.hpp>

namespace cinder::engine {

// /////////////////////////////////////////////////////////////////////////////
/// @class IRollbackListener
/// @brief Observer of the rollback engine's frame lifecycle.
///
/// Both calls arrive on the simulation thread, in the order the engine
/// makes them.
// /////////////////////////////////////////////////////////////////////////////
class IRollbackListener
{
public:
    virtual ~IRollbackListener() = default;

    /// @brief Every frame up to @p frame has inputs from all players.
    virtual void onFrameConfirmed(core::Frame frame) = 0;

    /// @brief State is being restored to @p target; later frames are void.
    virtual void onRollback(core::Frame target) = 0;
};

} // namespace cinder::engine
