#pragma once

#include "tether/core/SubscriberList.hpp"

#include <functional>
#include <string>
#include <unordered_map>

namespace tether
{

enum class LocalizationSource
{
    None,
    Override,
    UiCulture
};

class ILocalization
{
public:
    virtual ~ILocalization() = default;

    /// Configures the language from an explicit code (configuration override).
    virtual void SetupWithLangCode(const std::string& code) = 0;

    /// Configures the language from the process UI culture.
    virtual void SetupWithUiCulture() = 0;

    virtual std::string Localize(const std::string& key, const std::string& fallback) const = 0;

    /// Localize with {name} placeholders replaced from args.
    virtual std::string Format(const std::string& key, const std::string& fallback,
                               const std::unordered_map<std::string, std::string>& args) const = 0;

    virtual std::string CurrentLanguage() const = 0;
    virtual LocalizationSource LastSource() const = 0;

    virtual SubscriptionId SubscribeLanguageChanged(std::function<void(const std::string&)> callback) = 0;
    virtual void UnsubscribeLanguageChanged(SubscriptionId id) = 0;
};

} // namespace tether
