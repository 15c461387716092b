#pragma once

#include "ILocalization.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tether
{

/**
 * @brief Runtime UI strings from `<asset>/loc/<code>.toml`.
 *
 * English is always loaded as the fallback. Nested tables flatten into dotted keys.
 */
class LocalizationService : public ILocalization
{
public:
    static const std::vector<std::string>& SupportedLanguages();

    explicit LocalizationService(std::filesystem::path asset_directory);

    void SetupWithLangCode(const std::string& code) override;
    void SetupWithUiCulture() override;

    std::string Localize(const std::string& key, const std::string& fallback) const override;
    std::string Format(const std::string& key, const std::string& fallback,
                       const std::unordered_map<std::string, std::string>& args) const override;

    std::string CurrentLanguage() const override;
    LocalizationSource LastSource() const override { return source_; }

    SubscriptionId SubscribeLanguageChanged(std::function<void(const std::string&)> callback) override;
    void UnsubscribeLanguageChanged(SubscriptionId id) override;

    /// Two-letter code from a locale name such as "de_DE.UTF-8", "en" when unsupported.
    static std::string CodeFromLocaleName(const std::string& locale_name);

private:
    void LoadLanguage(const std::string& code);
    static std::optional<std::string> UiLocaleName();

    std::filesystem::path directory_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> fallback_;
    std::unordered_map<std::string, std::string> current_;
    std::string language_ = "en";
    LocalizationSource source_ = LocalizationSource::None;
    SubscriberList<const std::string&> language_changed_;
};

} // namespace tether
