#pragma once

#include <cstdint>
#include <string>
#include <string_view>

// Decimal (powers of 1000) human-readable size: "1 Byte", "512 Bytes", "1.4 MB".
std::string natural_size(uint64_t bytes);

// Strips leading and trailing whitespace.
std::string trim(std::string_view s);
