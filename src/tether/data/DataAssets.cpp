#include "DataAssets.hpp"

#include <fstream>

#include <plog/Log.h>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace tether
{

DataAssets::DataAssets(ClientLanguage language)
    : language_(language)
{
}

void DataAssets::Initialize(const fs::path& asset_directory)
{
    std::error_code ec;
    if (!fs::is_directory(asset_directory, ec))
        throw DataLoadError("asset directory not found: " + asset_directory.string());

    auto server = LoadOpcodes(asset_directory / "UIRes" / "serveropcode.json");
    auto client = LoadOpcodes(asset_directory / "UIRes" / "clientopcode.json");

    std::map<std::string, Sheet> sheets;
    auto exd = asset_directory / "exd";
    if (fs::is_directory(exd, ec))
    {
        for (const auto& entry : fs::directory_iterator(exd, ec))
        {
            if (!entry.is_regular_file() || entry.path().extension() != ".jsonl")
                continue;
            sheets[entry.path().stem().string()] = LoadSheet(entry.path());
        }
    }
    else
    {
        PLOG_WARNING << "No exd directory under " << asset_directory.string();
    }

    PLOG_INFO << "Data assets ready: " << server.size() << " server opcode(s), " << client.size()
              << " client opcode(s), " << sheets.size() << " sheet(s)";

    {
        std::lock_guard<std::mutex> lock(mutex_);
        server_opcodes_ = std::move(server);
        client_opcodes_ = std::move(client);
        sheets_ = std::move(sheets);
    }
    ready_.store(true, std::memory_order_release);
}

DataAssets::OpcodeMap DataAssets::LoadOpcodes(const fs::path& path)
{
    std::ifstream file(path);
    if (!file)
        throw DataLoadError("missing opcode table " + path.string());

    OpcodeMap opcodes;
    try
    {
        json doc = json::parse(file);
        if (!doc.is_object())
            throw DataLoadError("opcode table is not an object: " + path.string());

        for (const auto& [name, value] : doc.items())
        {
            if (!value.is_number_unsigned() || value.get<uint64_t>() > 0xFFFF)
            {
                PLOG_WARNING << "Ignoring opcode '" << name << "' in " << path.string();
                continue;
            }
            opcodes[name] = value.get<uint16_t>();
        }
    }
    catch (const json::exception& e)
    {
        throw DataLoadError("malformed opcode table " + path.string() + ": " + e.what());
    }
    return opcodes;
}

DataAssets::Sheet DataAssets::LoadSheet(const fs::path& path)
{
    Sheet sheet;
    std::ifstream file(path);
    if (!file)
    {
        PLOG_WARNING << "Could not open sheet " << path.string();
        return sheet;
    }

    std::string line;
    size_t line_number = 0;
    while (std::getline(file, line))
    {
        ++line_number;
        if (line.empty())
            continue;

        auto row = json::parse(line, nullptr, false);
        if (row.is_discarded() || !row.is_object() || !row.contains("id") || !row["id"].is_number_unsigned())
        {
            PLOG_WARNING << "Skipping malformed row " << path.filename().string() << ":" << line_number;
            continue;
        }
        uint32_t id = row["id"].get<uint32_t>();
        sheet[id] = std::move(row);
    }

    PLOG_DEBUG << "Loaded sheet " << path.stem().string() << " (" << sheet.size() << " rows)";
    return sheet;
}

std::optional<uint16_t> DataAssets::ServerOpcode(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = server_opcodes_.find(name);
    if (it == server_opcodes_.end())
        return std::nullopt;
    return it->second;
}

std::optional<uint16_t> DataAssets::ClientOpcode(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = client_opcodes_.find(name);
    if (it == client_opcodes_.end())
        return std::nullopt;
    return it->second;
}

const json* DataAssets::FindRow(const std::string& sheet, uint32_t id) const
{
    auto sheet_it = sheets_.find(sheet);
    if (sheet_it == sheets_.end())
        return nullptr;
    auto row_it = sheet_it->second.find(id);
    if (row_it == sheet_it->second.end())
        return nullptr;
    return &row_it->second;
}

std::optional<std::string> DataAssets::GetText(const std::string& sheet, uint32_t id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const json* row = FindRow(sheet, id);
    if (row == nullptr)
        return std::nullopt;

    for (const std::string column : { std::string("name_") + LanguageCode(language_), std::string("name_en") })
    {
        auto it = row->find(column);
        if (it != row->end() && it->is_string() && !it->get_ref<const std::string&>().empty())
            return it->get<std::string>();
    }
    return std::nullopt;
}

std::optional<int64_t> DataAssets::GetNumber(const std::string& sheet, uint32_t id, const std::string& column) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const json* row = FindRow(sheet, id);
    if (row == nullptr)
        return std::nullopt;

    auto it = row->find(column);
    if (it == row->end() || !it->is_number_integer())
        return std::nullopt;
    return it->get<int64_t>();
}

std::vector<std::string> DataAssets::SheetNames() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(sheets_.size());
    for (const auto& [name, sheet] : sheets_)
        names.push_back(name);
    return names;
}

size_t DataAssets::RowCount(const std::string& sheet) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sheets_.find(sheet);
    return it == sheets_.end() ? 0 : it->second.size();
}

void DataAssets::Dispose()
{
    ready_.store(false, std::memory_order_release);
    std::lock_guard<std::mutex> lock(mutex_);
    server_opcodes_.clear();
    client_opcodes_.clear();
    sheets_.clear();
}

} // namespace tether
