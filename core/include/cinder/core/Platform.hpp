/**
 * @file Platform.hpp
 * @brief Compiler portability macros.
 *
 * Branch-prediction hint for the assertion macros.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef CINDER_CORE_PLATFORM_HPP
    #define CINDER_CORE_PLATFORM_HPP

    #if defined(__GNUC__) || defined(__clang__)
        #define CINDER_UNLIKELY(x)     __builtin_expect(!!(x), 0)
    #else
        #define CINDER_UNLIKELY(x)     (x)
    #endif

#endif // CINDER_CORE_PLATFORM_HPP
