#include "textsplit/codec/base64.hpp"

#include <array>

namespace textsplit::codec {
namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::uint8_t kInvalid = 0xFF;
constexpr std::uint8_t kPad = 0xFE;
constexpr std::uint8_t kSpace = 0xFD;

std::array<std::uint8_t, 256> build_reverse_table() {
    std::array<std::uint8_t, 256> table{};
    table.fill(kInvalid);
    for (std::uint8_t i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = i;
    }
    table[static_cast<unsigned char>('=')] = kPad;
    for (char c : {' ', '\t', '\r', '\n', '\v', '\f'}) {
        table[static_cast<unsigned char>(c)] = kSpace;
    }
    return table;
}

const std::array<std::uint8_t, 256>& reverse_table() {
    static const auto table = build_reverse_table();
    return table;
}

Result<void> invalid(const std::string& what, std::size_t position) {
    return Err<void>(ErrorCode::CorruptChunk,
                     what + " at offset " + std::to_string(position));
}

} // namespace

std::size_t encoded_size(std::size_t raw_size) noexcept {
    return ((raw_size + 2) / 3) * 4;
}

std::string encode(const std::uint8_t* data, std::size_t size) {
    std::string out;
    out.reserve(encoded_size(size));

    std::size_t i = 0;
    for (; i + 3 <= size; i += 3) {
        const std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16) |
                                     (static_cast<std::uint32_t>(data[i + 1]) << 8) |
                                     static_cast<std::uint32_t>(data[i + 2]);
        out.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 6) & 0x3F]);
        out.push_back(kAlphabet[triple & 0x3F]);
    }

    const std::size_t rest = size - i;
    if (rest == 1) {
        const std::uint32_t triple = static_cast<std::uint32_t>(data[i]) << 16;
        out.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        out.append("==");
    } else if (rest == 2) {
        const std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16) |
                                     (static_cast<std::uint32_t>(data[i + 1]) << 8);
        out.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::string encode(const std::vector<std::uint8_t>& data) {
    return encode(data.data(), data.size());
}

Result<void> decode_append(const std::string& text, std::vector<std::uint8_t>& out) {
    const auto& table = reverse_table();
    const std::size_t original_size = out.size();
    out.reserve(original_size + (text.size() / 4) * 3);

    std::array<std::uint8_t, 4> quad{};
    std::size_t filled = 0;
    std::size_t padding = 0;

    for (std::size_t pos = 0; pos < text.size(); ++pos) {
        const std::uint8_t value = table[static_cast<unsigned char>(text[pos])];
        if (value == kSpace) {
            continue;
        }
        if (value == kInvalid) {
            out.resize(original_size);
            return invalid("invalid base64 character", pos);
        }
        if (padding > 0 && value != kPad) {
            out.resize(original_size);
            return invalid("data after base64 padding", pos);
        }
        if (value == kPad) {
            // Only the last one or two positions of a quad may be padding
            if (filled < 2) {
                out.resize(original_size);
                return invalid("misplaced base64 padding", pos);
            }
            ++padding;
            quad[filled++] = 0;
        } else {
            quad[filled++] = value;
        }

        if (filled == 4) {
            const std::uint32_t triple = (static_cast<std::uint32_t>(quad[0]) << 18) |
                                         (static_cast<std::uint32_t>(quad[1]) << 12) |
                                         (static_cast<std::uint32_t>(quad[2]) << 6) |
                                         static_cast<std::uint32_t>(quad[3]);
            out.push_back(static_cast<std::uint8_t>((triple >> 16) & 0xFF));
            if (padding < 2) {
                out.push_back(static_cast<std::uint8_t>((triple >> 8) & 0xFF));
            }
            if (padding < 1) {
                out.push_back(static_cast<std::uint8_t>(triple & 0xFF));
            }
            filled = 0;
            if (padding > 0) {
                // A padded quad closes the stream; the next loop turn rejects more data
                padding = 3;
            }
        }
    }

    if (filled != 0) {
        out.resize(original_size);
        return invalid("truncated base64 quantum", text.size());
    }
    return Ok();
}

Result<std::vector<std::uint8_t>> decode(const std::string& text) {
    std::vector<std::uint8_t> out;
    auto result = decode_append(text, out);
    if (result.is_error()) {
        return Err<std::vector<std::uint8_t>>(result.error());
    }
    return Ok(std::move(out));
}

} // namespace textsplit::codec
