/**
 * @file Log.hpp
 * @brief spdlog logger for merge decisions
 *
 * Levels used by the engine:
 * - warn: ignored field-level custom merge failures
 * - debug: skipped fields and delegations to custom merges
 * - trace: every assignment, with a snapshot of the value (debug builds)
 */

#ifndef STRUCTMERGE_LOG_HPP
#define STRUCTMERGE_LOG_HPP

#include <spdlog/spdlog.h>
#include <memory>

#ifdef STRUCTMERGE_DEBUG_BUILD
#define STRUCTMERGE_TRACE(logger, ...) (logger).trace(__VA_ARGS__)
#else
#define STRUCTMERGE_TRACE(logger, ...) (void)0
#endif

#define STRUCTMERGE_DEBUG(logger, ...) (logger).debug(__VA_ARGS__)

namespace structmerge::log {

/**
 * @brief The "structmerge" logger
 *
 * Defaults to a stderr sink at warn level. Holders keep the logger alive
 * across a later set_logger().
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Replace the logger; nullptr restores the default one
 *
 * Merges already running keep the logger they started with.
 */
void set_logger(std::shared_ptr<spdlog::logger> replacement);

void set_level(spdlog::level::level_enum level);

} // namespace structmerge::log

#endif // STRUCTMERGE_LOG_HPP
