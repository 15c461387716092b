#pragma once

#include <string>

namespace tether
{

class Supervisor;

/**
 * @brief One-shot diagnostic dump written when the runtime reaches Ready.
 *
 * The log line carries base64 so support tooling can lift it out of a log file verbatim.
 */
class Troubleshooting
{
public:
    static constexpr const char* kLogPrefix = "TROUBLESHOOTING:";

    /// Logs the snapshot and returns its JSON text.
    static std::string LogSnapshot(const Supervisor& supervisor, bool interface_loaded);

    static std::string Base64Encode(const std::string& data);
};

} // namespace tether
