#pragma once

#include "IDataAssets.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace tether
{

/**
 * @brief Game data tables loaded from the asset directory.
 *
 * Layout:
 * - UIRes/serveropcode.json, UIRes/clientopcode.json: { "Name": opcode }
 * - exd/<sheet>.jsonl: one row per line, { "id": n, "name_en": ..., "name_ja": ..., ... }
 */
class DataAssets : public IDataAssets
{
public:
    explicit DataAssets(ClientLanguage language);

    void Initialize(const std::filesystem::path& asset_directory) override;

    bool IsReady() const override { return ready_.load(std::memory_order_acquire); }
    ClientLanguage Language() const override { return language_; }

    std::optional<uint16_t> ServerOpcode(const std::string& name) const override;
    std::optional<uint16_t> ClientOpcode(const std::string& name) const override;

    std::optional<std::string> GetText(const std::string& sheet, uint32_t id) const override;
    std::optional<int64_t> GetNumber(const std::string& sheet, uint32_t id, const std::string& column) const override;

    std::vector<std::string> SheetNames() const override;

    void Dispose() override;

    /// Rows loaded into a sheet, zero when the sheet is unknown.
    size_t RowCount(const std::string& sheet) const;

private:
    using Sheet = std::unordered_map<uint32_t, nlohmann::json>;
    using OpcodeMap = std::unordered_map<std::string, uint16_t>;

    static OpcodeMap LoadOpcodes(const std::filesystem::path& path);
    static Sheet LoadSheet(const std::filesystem::path& path);

    const nlohmann::json* FindRow(const std::string& sheet, uint32_t id) const;

    ClientLanguage language_;
    std::atomic<bool> ready_{ false };

    mutable std::mutex mutex_;
    OpcodeMap server_opcodes_;
    OpcodeMap client_opcodes_;
    std::map<std::string, Sheet> sheets_;
};

} // namespace tether
