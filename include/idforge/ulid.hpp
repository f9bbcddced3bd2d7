#pragma once

#include <idforge/uuid.hpp>
#include <cstddef>
#include <string>

namespace idforge {

constexpr size_t ulid_length = 26;

// Renders the 128 bits as a ULID: 26 Crockford base-32 digits, most
// significant first. For a version 7 identifier the first 10 digits are
// its millisecond timestamp, as in a ULID.
std::string to_ulid_string(const Uuid& u);

// Writes exactly ulid_length characters (no terminator) into dest.
// Returns false and sets written to 0 when capacity < ulid_length.
bool try_format_ulid(const Uuid& u, char* dest, size_t capacity, size_t& written);

} // namespace idforge
