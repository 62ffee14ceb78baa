#pragma once

/// @file assuan.h
/// Percent-escaping used by the Assuan protocol spoken by pinentry.
///
/// See https://www.gnupg.org/documentation/manuals/assuan/Server-responses.html

#include <optional>
#include <string>
#include <string_view>

namespace tether {
namespace assuan {

/// Decode the payload of a `D` response line.
///
/// `%XX` escapes are replaced by the byte they name; every other byte is
/// copied through.  The result must be valid UTF-8.
///
/// @param encoded  Payload with the leading "D " already stripped.
/// @return The decoded text, or nullopt if an escape is malformed or
///         truncated, or the bytes are not UTF-8.  Never a partial result.
std::optional<std::string> decode_data(std::string_view encoded);

/// Escape text for use as an argument of a request line.
///
/// `%` and control bytes (including CR and LF) become `%XX` so the text
/// can never terminate or split the line.
std::string encode_data(std::string_view raw);

} // namespace assuan
} // namespace tether
