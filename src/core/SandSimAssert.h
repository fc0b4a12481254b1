#pragma once

#include "CrashDumpHandler.h"

#include <cassert>

/**
 * SandSimAssert.h - Assertion macros with crash dump integration.
 *
 * On failure the installed Grid is written to a JSON crash dump before the
 * macro decides whether to terminate.
 */

/**
 * SANDSIM_ASSERT - Dump, then assert() (terminates in debug builds).
 *
 * Usage: SANDSIM_ASSERT(condition, "Description of what failed");
 */
#define SANDSIM_ASSERT(condition, message)                                                  \
    do {                                                                                    \
        if (!(condition)) {                                                                 \
            SandSim::CrashDumpHandler::onAssertionFailure(#condition, __FILE__, __LINE__, message); \
            assert(condition);                                                              \
        }                                                                                   \
    } while (0)

/**
 * SANDSIM_VERIFY - Dump and log, then continue.
 */
#define SANDSIM_VERIFY(condition, message)                                                  \
    do {                                                                                    \
        if (!(condition)) {                                                                 \
            SandSim::CrashDumpHandler::onAssertionFailure(#condition, __FILE__, __LINE__, message); \
        }                                                                                   \
    } while (0)

/**
 * SANDSIM_DUMP - Manual grid dump at a checkpoint.
 */
#define SANDSIM_DUMP(reason) SandSim::CrashDumpHandler::dumpGridState(reason)

#ifdef NDEBUG
#define SANDSIM_DEBUG_ASSERT(condition, message) ((void)0)
#else
#define SANDSIM_DEBUG_ASSERT(condition, message) SANDSIM_ASSERT(condition, message)
#endif
