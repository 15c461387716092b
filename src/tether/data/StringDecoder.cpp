#include "StringDecoder.hpp"

#include <plog/Log.h>

namespace tether
{

std::string DecodedString::TextValue() const
{
    std::string out;
    for (const auto& segment : segments)
    {
        if (segment.kind != SegmentKind::Unknown)
            out += segment.text;
    }
    return out;
}

StringDecoder::StringDecoder(IDataAssets& data)
    : data_(data)
{
}

std::optional<uint32_t> StringDecoder::ReadInteger(const std::vector<uint8_t>& bytes, size_t& pos)
{
    if (pos >= bytes.size())
        return std::nullopt;

    uint8_t marker = bytes[pos++];
    if (marker < 0xD0)
        return static_cast<uint32_t>(marker - 1);

    // Low nibble + 1 flags which of the four little-endian bytes follow, high byte first.
    uint32_t flags = (static_cast<uint32_t>(marker) + 1) & 0xF;
    uint32_t value = 0;
    for (int i = 3; i >= 0; --i)
    {
        if ((flags & (1u << i)) == 0)
            continue;
        if (pos >= bytes.size())
            return std::nullopt;
        value |= static_cast<uint32_t>(bytes[pos++]) << (8 * i);
    }
    return value;
}

DecodedString StringDecoder::Decode(const std::vector<uint8_t>& bytes) const
{
    DecodedString result;
    std::string text;

    auto flush_text = [&]() {
        if (text.empty())
            return;
        result.segments.push_back({ SegmentKind::Text, std::move(text), 0, {} });
        text.clear();
    };

    size_t pos = 0;
    while (pos < bytes.size())
    {
        uint8_t byte = bytes[pos];
        if (byte != kStartByte)
        {
            text.push_back(static_cast<char>(byte));
            ++pos;
            continue;
        }

        flush_text();
        size_t start = pos;
        ++pos;

        // START type length body END
        std::optional<uint32_t> length;
        uint8_t type = 0;
        if (pos < bytes.size())
        {
            type = bytes[pos++];
            length = ReadInteger(bytes, pos);
        }

        if (!length || pos + *length >= bytes.size() || bytes[pos + *length] != kEndByte)
        {
            PLOG_DEBUG << "Truncated payload at offset " << start;
            StringSegment opaque;
            opaque.kind = SegmentKind::Unknown;
            opaque.payload_type = type;
            opaque.raw.assign(bytes.begin() + start, bytes.end());
            result.segments.push_back(std::move(opaque));
            return result;
        }

        std::vector<uint8_t> body(bytes.begin() + pos, bytes.begin() + pos + *length);
        pos += *length + 1;
        result.segments.push_back(DecodePayload(type, std::move(body)));
    }

    flush_text();
    return result;
}

StringSegment StringDecoder::DecodePayload(uint8_t type, std::vector<uint8_t> body) const
{
    StringSegment segment;
    segment.payload_type = type;

    switch (type)
    {
    case kNewLine:
        segment.kind = SegmentKind::NewLine;
        segment.text = "\n";
        break;

    case kAutoTranslate:
    {
        segment.kind = SegmentKind::AutoTranslate;
        size_t pos = 0;
        if (body.empty())
            break;
        uint8_t group = body[pos++];
        auto key = ReadInteger(body, pos);
        if (!key)
            break;

        auto row_group = data_.GetNumber(kCompletionSheet, *key, "group");
        if (row_group && *row_group != group)
        {
            PLOG_DEBUG << "Auto-translate key " << *key << " is in group " << *row_group << ", not " << int(group);
            break;
        }
        segment.text = data_.GetText(kCompletionSheet, *key).value_or("");
        break;
    }

    default:
        segment.kind = SegmentKind::Unknown;
        break;
    }

    segment.raw = std::move(body);
    return segment;
}

} // namespace tether
