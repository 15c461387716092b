#include "RuntimeInterface.hpp"
#include "tether/i18n/ILocalization.hpp"
#include "tether/utils/LogLevelSwitch.hpp"

#include <imgui.h>
#include <plog/Log.h>

namespace tether
{

namespace
{

constexpr const char* kLevelNames[] = { "none", "fatal", "error", "warning", "info", "debug", "verbose" };

ImVec4 SeverityColor(utils::ErrorSeverity severity)
{
    switch (severity)
    {
    case utils::ErrorSeverity::Fatal: return ImVec4(1.0f, 0.3f, 0.3f, 1.0f);
    case utils::ErrorSeverity::Error: return ImVec4(1.0f, 0.5f, 0.4f, 1.0f);
    case utils::ErrorSeverity::Warning: return ImVec4(1.0f, 0.8f, 0.3f, 1.0f);
    default: return ImVec4(0.8f, 0.8f, 0.8f, 1.0f);
    }
}

} // namespace

RuntimeInterface::RuntimeInterface(const RuntimeInterfaceCreateInfo& info)
    : version_(info.version)
    , log_level_(info.log_level)
    , localization_(info.localization)
    , loaded_plugins_(info.loaded_plugins)
    , request_unload_(info.request_unload)
{
}

void RuntimeInterface::ToggleMainWindow()
{
    bool open = !main_open_.load(std::memory_order_acquire);
    main_open_.store(open, std::memory_order_release);
    PLOG_DEBUG << "Main window " << (open ? "opened" : "closed");
}

void RuntimeInterface::CollectErrors()
{
    if (!utils::ErrorReporter::HasPendingErrors())
        return;

    for (auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        errors_.push_back(std::move(report));
        if (errors_.size() > kMaxShownErrors)
            errors_.pop_front();
    }
    // Surface new problems even when the window was closed.
    main_open_.store(true, std::memory_order_release);
}

void RuntimeInterface::Draw()
{
    CollectErrors();
    if (!IsMainWindowOpen())
        return;

    bool open = true;
    ImGui::SetNextWindowSize(ImVec2(480.0f, 360.0f), ImGuiCond_FirstUseEver);
    auto title = localization_.Localize("interface.title", "tether") + "###tether_main";
    if (ImGui::Begin(title.c_str(), &open))
    {
        ImGui::Text("tether %s", version_.c_str());
        ImGui::Separator();
        DrawLogLevel();
        DrawPlugins();
        DrawErrors();

        ImGui::Separator();
        if (ImGui::Button(localization_.Localize("interface.unload", "Unload").c_str()) && request_unload_)
            request_unload_();
    }
    ImGui::End();

    if (!open)
        main_open_.store(false, std::memory_order_release);
}

void RuntimeInterface::DrawLogLevel()
{
    int current = static_cast<int>(log_level_.Get());
    if (ImGui::Combo("Log level", &current, kLevelNames, IM_ARRAYSIZE(kLevelNames)))
        log_level_.Set(static_cast<plog::Severity>(current));
}

void RuntimeInterface::DrawPlugins()
{
    auto plugins = loaded_plugins_ ? loaded_plugins_() : std::vector<LoadedPluginInfo>{};
    auto header = localization_.Localize("interface.plugins", "Plugins") + "###plugins";
    if (!ImGui::CollapsingHeader(header.c_str(), ImGuiTreeNodeFlags_DefaultOpen))
        return;

    if (plugins.empty())
    {
        ImGui::TextDisabled("No plugins loaded");
        return;
    }
    for (const auto& plugin : plugins)
        ImGui::BulletText("%s %s%s", plugin.name.c_str(), plugin.version.c_str(), plugin.is_default ? " (bundled)" : "");
}

void RuntimeInterface::DrawErrors()
{
    if (errors_.empty())
        return;
    auto header = localization_.Localize("interface.problems", "Problems") + "###problems";
    if (!ImGui::CollapsingHeader(header.c_str(), ImGuiTreeNodeFlags_DefaultOpen))
        return;

    for (const auto& report : errors_)
    {
        ImGui::TextColored(SeverityColor(report.severity), "[%s] %s", report.timestamp.c_str(),
                           report.user_message.c_str());
        if (!report.technical_details.empty() && ImGui::IsItemHovered())
            ImGui::SetTooltip("%s", report.technical_details.c_str());
    }
    if (ImGui::SmallButton("Clear"))
        errors_.clear();
}

} // namespace tether
