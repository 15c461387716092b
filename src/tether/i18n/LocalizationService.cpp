#include "LocalizationService.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <locale>

#include <plog/Log.h>
#include <toml++/toml.h>

#ifdef _WIN32
#include <windows.h>
#endif

namespace fs = std::filesystem;

namespace tether
{

namespace
{

void FlattenTable(const toml::table& tbl, const std::string& prefix, std::unordered_map<std::string, std::string>& out)
{
    for (auto&& [k, node] : tbl)
    {
        std::string key = std::string(k.str());
        std::string full = prefix.empty() ? key : (prefix + "." + key);
        if (node.is_table())
            FlattenTable(*node.as_table(), full, out);
        else if (auto value = node.value<std::string>())
            out[full] = *value;
    }
}

std::unordered_map<std::string, std::string> LoadFile(const fs::path& path)
{
    std::unordered_map<std::string, std::string> strings;
    std::error_code ec;
    if (!fs::exists(path, ec))
    {
        PLOG_WARNING << "Localization file not found: " << path.string();
        return strings;
    }
    try
    {
        toml::table table = toml::parse_file(path.string());
        FlattenTable(table, "", strings);
    }
    catch (const toml::parse_error& pe)
    {
        PLOG_WARNING << "Failed to parse localization file '" << path.string() << "': " << pe.description();
    }
    return strings;
}

std::string ReplaceNamed(const std::string& s, const std::unordered_map<std::string, std::string>& args)
{
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size();)
    {
        if (s[i] == '{')
        {
            size_t j = s.find('}', i + 1);
            if (j != std::string::npos)
            {
                auto it = args.find(s.substr(i + 1, j - (i + 1)));
                if (it != args.end())
                    out += it->second;
                else
                    out += s.substr(i, j - i + 1);
                i = j + 1;
                continue;
            }
        }
        out.push_back(s[i]);
        ++i;
    }
    return out;
}

} // namespace

const std::vector<std::string>& LocalizationService::SupportedLanguages()
{
    static const std::vector<std::string> kLanguages = { "de", "ja", "fr", "it", "es", "ko", "no", "ru" };
    return kLanguages;
}

LocalizationService::LocalizationService(fs::path asset_directory)
    : directory_(std::move(asset_directory) / "loc")
{
    fallback_ = LoadFile(directory_ / "en.toml");
    if (fallback_.empty())
        PLOG_WARNING << "English fallback " << (directory_ / "en.toml").string() << " is empty or missing";
    current_ = fallback_;
}

void LocalizationService::SetupWithLangCode(const std::string& code)
{
    PLOG_INFO << "Localization language from configuration override: " << code;
    source_ = LocalizationSource::Override;
    LoadLanguage(code.empty() ? std::string("en") : code);
}

void LocalizationService::SetupWithUiCulture()
{
    auto locale_name = UiLocaleName();
    std::string code = locale_name ? CodeFromLocaleName(*locale_name) : "en";
    PLOG_INFO << "Localization language from UI culture '" << locale_name.value_or("") << "': " << code;
    source_ = LocalizationSource::UiCulture;
    LoadLanguage(code);
}

void LocalizationService::LoadLanguage(const std::string& code)
{
    auto strings = code == "en" ? fallback_ : LoadFile(directory_ / (code + ".toml"));
    if (strings.empty() && code != "en")
        PLOG_WARNING << "Language '" << code << "' not found, using English fallback";

    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = std::move(strings);
        language_ = code;
    }
    language_changed_.Invoke(code);
}

std::string LocalizationService::Localize(const std::string& key, const std::string& fallback) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = current_.find(key);
    if (it != current_.end())
        return it->second;
    auto ie = fallback_.find(key);
    if (ie != fallback_.end())
        return ie->second;
    return fallback;
}

std::string LocalizationService::Format(const std::string& key, const std::string& fallback,
                                        const std::unordered_map<std::string, std::string>& args) const
{
    return ReplaceNamed(Localize(key, fallback), args);
}

std::string LocalizationService::CurrentLanguage() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return language_;
}

SubscriptionId LocalizationService::SubscribeLanguageChanged(std::function<void(const std::string&)> callback)
{
    return language_changed_.Subscribe(std::move(callback));
}

void LocalizationService::UnsubscribeLanguageChanged(SubscriptionId id) { language_changed_.Unsubscribe(id); }

std::string LocalizationService::CodeFromLocaleName(const std::string& locale_name)
{
    if (locale_name.size() < 2)
        return "en";

    std::string code = locale_name.substr(0, 2);
    std::transform(code.begin(), code.end(), code.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto& supported = SupportedLanguages();
    if (std::find(supported.begin(), supported.end(), code) != supported.end())
        return code;
    return "en";
}

std::optional<std::string> LocalizationService::UiLocaleName()
{
#ifdef _WIN32
    wchar_t buffer[LOCALE_NAME_MAX_LENGTH] = {};
    int length = GetUserDefaultLocaleName(buffer, LOCALE_NAME_MAX_LENGTH);
    if (length > 1)
    {
        std::string name;
        for (int i = 0; i < length - 1; ++i)
            name.push_back(static_cast<char>(buffer[i]));
        return name;
    }
#else
    for (const char* variable : { "LC_ALL", "LC_MESSAGES", "LANG" })
    {
        const char* value = std::getenv(variable);
        if (value != nullptr && *value != '\0')
            return std::string(value);
    }
#endif
    std::string global = std::locale().name();
    if (global.empty() || global == "C" || global == "*")
        return std::nullopt;
    return global;
}

} // namespace tether
