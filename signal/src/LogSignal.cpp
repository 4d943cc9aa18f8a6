/**
 * @file LogSignal.cpp
 * @brief LogSignal implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <bpb/signal/LogSignal.hpp>

#include <bpb/core/Log.hpp>

#include <string>

namespace bpb::signal {

void LogSignal::progress()
{
    ++_step;
    core::Log::info("SIGNAL", "progress " + std::to_string(_step));
}

void LogSignal::success()
{
    core::Log::info("SIGNAL", "success");
}

void LogSignal::failure()
{
    core::Log::error("SIGNAL", "failure");
}

} // namespace bpb::signal
