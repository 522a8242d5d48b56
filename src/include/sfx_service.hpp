#pragma once
/**
 * @file sfx_service.hpp
 * @brief Layer 2: Service modules built on sfx_base.
 *
 * Provides the asynchronous Logger, per-path FileLock, and crash-safe file
 * replacement (atomic_file). Include this when you need logging, locking, or
 * durable file writes.
 */
#include "sfx_base.hpp"

#include "utils/atomic_file.hpp"
#include "utils/file_lock.hpp"
#include "utils/logger.hpp"
