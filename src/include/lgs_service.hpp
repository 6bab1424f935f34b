#pragma once
/**
 * @file lgs_service.hpp
 * @brief Layer 2: Service modules built on lgs_base.
 *
 * Provides application lifecycle management and the asynchronous Logger.
 * Include this when you need LifecycleGuard or the LOGGER_* macros.
 */
#include "lgs_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
