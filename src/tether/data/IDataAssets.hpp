#pragma once

#include "tether/api/StartInfo.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tether
{

class DataLoadError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Game data tables: opcode maps and per-language text sheets.
 */
class IDataAssets
{
public:
    virtual ~IDataAssets() = default;

    /// Loads every table under asset_directory. Throws DataLoadError.
    virtual void Initialize(const std::filesystem::path& asset_directory) = 0;

    virtual bool IsReady() const = 0;
    virtual ClientLanguage Language() const = 0;

    virtual std::optional<uint16_t> ServerOpcode(const std::string& name) const = 0;
    virtual std::optional<uint16_t> ClientOpcode(const std::string& name) const = 0;

    /// Text column of a sheet row in the data language, English when the row lacks it.
    virtual std::optional<std::string> GetText(const std::string& sheet, uint32_t id) const = 0;

    /// Integer column of a sheet row.
    virtual std::optional<int64_t> GetNumber(const std::string& sheet, uint32_t id, const std::string& column) const = 0;

    virtual std::vector<std::string> SheetNames() const = 0;

    virtual void Dispose() = 0;
};

enum class SegmentKind
{
    Text,
    NewLine,
    AutoTranslate,
    Unknown
};

struct StringSegment
{
    SegmentKind kind = SegmentKind::Text;
    std::string text;          // Resolved text, empty for opaque payloads
    uint8_t payload_type = 0;  // Zero for text runs
    std::vector<uint8_t> raw;  // Payload body for non-text segments
};

struct DecodedString
{
    std::vector<StringSegment> segments;

    /// Concatenated text with opaque payloads dropped.
    std::string TextValue() const;
};

class IStringDecoder
{
public:
    virtual ~IStringDecoder() = default;

    /// Never throws; truncated payloads become Unknown segments.
    virtual DecodedString Decode(const std::vector<uint8_t>& bytes) const = 0;
};

} // namespace tether
