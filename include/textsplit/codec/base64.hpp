#pragma once

#include "textsplit/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace textsplit::codec {

/**
 * @brief Standard base64 (RFC 4648 alphabet, '=' padding, no line wrapping)
 *
 * The chunk file format is exactly the output of encode(): one line of
 * ASCII text with no trailing newline.
 */

std::size_t encoded_size(std::size_t raw_size) noexcept;

std::string encode(const std::uint8_t* data, std::size_t size);
std::string encode(const std::vector<std::uint8_t>& data);

/**
 * @brief Decode base64 text, appending the bytes to @p out
 *
 * ASCII whitespace is skipped. Any other character outside the alphabet,
 * a '=' anywhere but the final one or two positions, or a length that is
 * not a multiple of four fails with CorruptChunk. On failure @p out is
 * left with its original contents.
 */
textsplit::Result<void> decode_append(const std::string& text, std::vector<std::uint8_t>& out);

textsplit::Result<std::vector<std::uint8_t>> decode(const std::string& text);

} // namespace textsplit::codec
