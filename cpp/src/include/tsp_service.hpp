#pragma once
/**
 * @file tsp_service.hpp
 * @brief Layer 2: Service modules built on tsp_base.
 *
 * Provides the Logger and AtomicSlot, the swap-and-verify cell the engine
 * keeps its registration bundle and informer sinks in.
 */
#include "tsp_base.hpp"

#include "utils/atomic_slot.hpp"
#include "utils/logger.hpp"
