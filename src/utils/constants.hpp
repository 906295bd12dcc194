#ifndef FURNILYTICS_CONSTANTS_HPP
#define FURNILYTICS_CONSTANTS_HPP

#include <cstddef>

namespace furnilytics::constants {
    inline constexpr int BASE_10 = 10;
    inline constexpr int ASCII_LOWERCASE_BIT = 0x20;

    inline constexpr const char* DEFAULT_BASE_URL = "https://furnilytics-api.fly.dev";
    inline constexpr const char* USER_AGENT = "furnilytics-cpp/0.2.0";

    inline constexpr const char* ENV_API_KEY = "FURNILYTICS_API_KEY";
    inline constexpr const char* ENV_BASE_URL = "FURNILYTICS_BASE_URL";
    inline constexpr const char* ENV_TIMEOUT_S = "FURNILYTICS_TIMEOUT_S";
    inline constexpr const char* ENV_MAX_RETRIES = "FURNILYTICS_MAX_RETRIES";

    inline constexpr long DEFAULT_TIMEOUT_S = 20;
    inline constexpr long MAX_TIMEOUT_S = 60L * 60L;
    inline constexpr long DEFAULT_MAX_RETRIES = 4;
    inline constexpr long MAX_RETRIES_LIMIT = 16;
    inline constexpr long BASE_DELAY_MS = 600;
    inline constexpr long MAX_DELAY_MS = 10'000;
    inline constexpr long CONNECT_TIMEOUT_MS = 10'000;
    inline constexpr long MS_PER_SECOND = 1000;

    inline constexpr std::size_t ERROR_SNIPPET_LENGTH = 200;
}  // namespace furnilytics::constants

#endif
