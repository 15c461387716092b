#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace tether
{

class SignatureNotFound : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Pattern lookups over the host's main module.
 *
 * Every subsystem that touches host code resolves its addresses here.
 */
class ISigScanner
{
public:
    virtual ~ISigScanner() = default;

    /**
     * @brief Find a byte pattern in the module's executable regions
     * @return Match address. A match starting with a rel32 CALL/JMP resolves to its target.
     * @throws SignatureNotFound when the pattern does not occur
     */
    virtual uintptr_t ScanText(const std::string& signature) = 0;

    virtual std::optional<uintptr_t> TryScanText(const std::string& signature) = 0;

    /**
     * @brief Resolve a named entry of the signature table
     * @throws SignatureNotFound when the name is unknown or the pattern does not occur
     */
    virtual uintptr_t Resolve(const std::string& name) = 0;

    virtual std::optional<uintptr_t> TryResolve(const std::string& name) = 0;

    virtual const std::string& ModuleName() const = 0;
    virtual uintptr_t BaseAddress() const = 0;

    /// Drops cached results and the process context.
    virtual void Dispose() = 0;
};

} // namespace tether
