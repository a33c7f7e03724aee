#pragma once

#include "logger.hpp"

/// Logging macros with file and line information.
/// Debug records are always compiled in and filtered by the runtime level,
/// so WOODY_LOG_LEVEL=debug works on release builds.

#define WOODY_LOG_DEBUG(fmt, ...) \
    ::woody::log::logger::instance().log( \
        ::woody::log::level::debug, \
        __FILE__, __LINE__, \
        fmt __VA_OPT__(,) __VA_ARGS__ \
    )

#define WOODY_LOG_INFO(fmt, ...) \
    ::woody::log::logger::instance().log( \
        ::woody::log::level::info, \
        __FILE__, __LINE__, \
        fmt __VA_OPT__(,) __VA_ARGS__ \
    )

#define WOODY_LOG_WARNING(fmt, ...) \
    ::woody::log::logger::instance().log( \
        ::woody::log::level::warning, \
        __FILE__, __LINE__, \
        fmt __VA_OPT__(,) __VA_ARGS__ \
    )

#define WOODY_LOG_ERROR(fmt, ...) \
    ::woody::log::logger::instance().log( \
        ::woody::log::level::error, \
        __FILE__, __LINE__, \
        fmt __VA_OPT__(,) __VA_ARGS__ \
    )
