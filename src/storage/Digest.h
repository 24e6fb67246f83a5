#pragma once

#include <string>
#include <string_view>

namespace relaychat::storage {

// Lowercase hex SHA-256 of the given bytes.
// This is a corruption checksum for stored messages. It is not keyed, so anyone
// with write access to the log can rewrite both the text and its digest.
std::string sha256_hex(std::string_view data);

} // namespace relaychat::storage
