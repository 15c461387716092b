#pragma once

#include <stdexcept>
#include <string>

namespace tether
{

/// Construction or enable failure of a named subsystem.
class SubsystemError : public std::runtime_error
{
public:
    SubsystemError(std::string subsystem, const std::string& message)
        : std::runtime_error(subsystem + ": " + message)
        , subsystem_(std::move(subsystem))
    {
    }

    const std::string& Subsystem() const noexcept { return subsystem_; }

private:
    std::string subsystem_;
};

/// what() of the exception being handled, or a placeholder for types outside
/// std::exception. Only valid inside a catch block.
inline std::string CurrentExceptionMessage()
{
    try
    {
        throw;
    }
    catch (const std::exception& ex)
    {
        return ex.what();
    }
    catch (...)
    {
        return "non-standard exception";
    }
}

} // namespace tether
