#include "Signatures.hpp"
#include "Pattern.hpp"

#include <plog/Log.h>
#include <toml++/toml.h>

namespace tether
{

Signatures Signatures::Defaults()
{
    Signatures sigs;
    sigs.entries_[sig::kFrameworkUpdate] = "40 53 48 83 EC 20 FF 81 ?? ?? ?? ?? 48 8B D9 48 8D 4C 24 ??";
    sigs.entries_[sig::kNetworkDispatch] = "48 89 5C 24 ?? 56 48 83 EC 50 8B F2";
    sigs.entries_[sig::kTerritoryChange] = "40 53 56 48 83 EC 58 41 0F B7 F0 48 8B D9";
    sigs.entries_[sig::kDebugCheck] = "FF 15 ?? ?? ?? ?? 85 C0 74 11 41";
    sigs.entries_[sig::kExceptionFilter] =
        "40 55 53 56 48 8D AC 24 ?? ?? ?? ?? B8 ?? ?? ?? ?? E8 ?? ?? ?? ?? 48 2B E0 48 8B 05 ?? ?? ?? ?? 48 33 "
        "C4 48 89 85 ?? ?? ?? ?? 48 83 3D ?? ?? ?? ?? ??";
    // The present hook depends on the host's renderer build and has no built-in default.
    return sigs;
}

Signatures Signatures::Load(const std::filesystem::path& asset_directory)
{
    Signatures sigs = Defaults();
    auto path = asset_directory / "signatures.toml";
    std::error_code ec;
    if (std::filesystem::exists(path, ec))
    {
        size_t applied = sigs.LoadOverrides(path);
        PLOG_INFO << "Applied " << applied << " signature override(s) from " << path.string();
    }
    return sigs;
}

size_t Signatures::LoadOverrides(const std::filesystem::path& path)
{
    toml::table root;
    try
    {
        root = toml::parse_file(path.string());
    }
    catch (const toml::parse_error& pe)
    {
        PLOG_WARNING << "Failed to parse signatures '" << path.string() << "': " << pe.description();
        return 0;
    }

    // Entries may sit at the top level or under [signatures].
    const toml::table* table = &root;
    if (auto nested = root["signatures"].as_table())
        table = nested;

    size_t applied = 0;
    for (auto&& [key, node] : *table)
    {
        auto value = node.value<std::string>();
        if (!value)
            continue;

        if (!IsSymbolReference(*value) && !Pattern::FromString(*value).IsValid())
        {
            PLOG_WARNING << "Ignoring invalid signature '" << key.str() << "': " << *value;
            continue;
        }

        entries_[std::string(key.str())] = *value;
        ++applied;
    }
    return applied;
}

std::optional<std::string> Signatures::Get(const std::string& name) const
{
    auto it = entries_.find(name);
    if (it == entries_.end())
        return std::nullopt;
    return it->second;
}

void Signatures::Set(const std::string& name, std::string value) { entries_[name] = std::move(value); }

} // namespace tether
