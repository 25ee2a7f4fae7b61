/**
 * @file SequenceWindow.cpp
 * @brief SequenceWindow implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <cinder/net/sync/SequenceWindow.hpp>

namespace cinder::net::sync {

void SequenceWindow::record(core::u16 sequence) noexcept
{
    if (!_any)
    {
        _any  = true;
        _last = sequence;
        _bits = 0;
        return;
    }

    if (sequence == _last)
    {
        return;
    }

    if (sequenceGreaterThan(sequence, _last))
    {
        const core::u32 shift = static_cast<core::u16>(sequence - _last);
        if (shift > kAckBits)
        {
            _bits = 0;
        }
        else
        {
            // The previous newest sequence moves to bit (shift - 1).
            const core::u64 widened = (static_cast<core::u64>(_bits) << shift) | (core::u64{1} << (shift - 1));
            _bits = static_cast<core::u32>(widened);
        }
        _last = sequence;
        return;
    }

    const core::u32 distance = static_cast<core::u16>(_last - sequence);
    if (distance <= kAckBits)
    {
        _bits |= 1u << (distance - 1);
    }
}

void SequenceWindow::reset() noexcept
{
    _last = 0;
    _bits = 0;
    _any  = false;
}

bool SequenceWindow::contains(core::u16 sequence) const noexcept
{
    if (!_any)
    {
        return false;
    }
    if (sequence == _last)
    {
        return true;
    }
    const core::u32 distance = static_cast<core::u16>(_last - sequence);
    return distance >= 1 && distance <= kAckBits && (_bits & (1u << (distance - 1))) != 0;
}

} // namespace cinder::net::sync
