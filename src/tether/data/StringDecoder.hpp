#pragma once

#include "IDataAssets.hpp"

#include <cstddef>
#include <optional>

namespace tether
{

/**
 * @brief Decoder for the host's encoded chat strings.
 *
 * Text runs are UTF-8. Payloads are framed as START(0x02) type length body END(0x03),
 * the length using the host's variable-length integer encoding.
 */
class StringDecoder : public IStringDecoder
{
public:
    static constexpr uint8_t kStartByte = 0x02;
    static constexpr uint8_t kEndByte = 0x03;
    static constexpr uint8_t kNewLine = 0x10;
    static constexpr uint8_t kAutoTranslate = 0x2E;
    static constexpr const char* kCompletionSheet = "completion";

    explicit StringDecoder(IDataAssets& data);

    DecodedString Decode(const std::vector<uint8_t>& bytes) const override;

    /// Reads one encoded integer at `pos`, advancing it. Nullopt when truncated.
    static std::optional<uint32_t> ReadInteger(const std::vector<uint8_t>& bytes, size_t& pos);

private:
    StringSegment DecodePayload(uint8_t type, std::vector<uint8_t> body) const;

    IDataAssets& data_;
};

} // namespace tether
