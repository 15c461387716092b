#pragma once

#include "ISubsystemFactory.hpp"
#include "OneShotSignal.hpp"
#include "tether/api/LaunchOptions.hpp"
#include "tether/api/StartInfo.hpp"

#include <memory>
#include <optional>

namespace tether
{

/**
 * @brief Body of the host-owned runtime thread.
 */
class Bootstrap
{
public:
    /**
     * @brief Run the runtime to completion
     *
     * Initializes logging and the crash handler, starts the supervisor, waits for
     * an unload request, disposes, removes the crash handler, silences logging,
     * then sets `finished`. Always sets `finished`.
     *
     * @param factory Collaborator factory, DefaultSubsystemFactory when null
     * @param options Start toggles, read from the environment when empty
     */
    static void Run(const StartInfo& info, OneShotSignal& finished, std::unique_ptr<ISubsystemFactory> factory = nullptr,
                    std::optional<LaunchOptions> options = std::nullopt);

    /// Forwards to the running supervisor. False when none is running. Safe from any
    /// thread while Run tears the supervisor down.
    static bool RequestUnload();

    static void InitializeLogging(const StartInfo& info);
};

} // namespace tether
