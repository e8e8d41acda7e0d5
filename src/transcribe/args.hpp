#pragma once

#include "request.hpp"

#include <expected>
#include <span>
#include <string>
#include <string_view>

struct UsageError {
    std::string message;
};

// Model tiers accepted by --model, smallest first.
inline constexpr std::string_view kModelSizes[] = {
    "tiny", "base", "small", "medium", "large-v1", "large-v2", "large-v3", "large",
};

inline constexpr std::string_view kDefaultModel = "base";

std::expected<Request, UsageError> parse_args(std::span<const std::string_view> args);
std::expected<Request, UsageError> parse_args(int argc, char* argv[]);

std::string usage_text(std::string_view prog);
