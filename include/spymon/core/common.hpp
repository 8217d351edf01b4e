#pragma once
#include <cstdint>
#include <string>

namespace spymon {
    constexpr const char* kVersion = "0.3.0";
}

namespace spymon::detail {
    int64_t getTimestampNs();
    int getPid();
    std::string toIso8601Utc();

    // Escapes s for a JSON string literal. Ill-formed UTF-8 is replaced
    // with U+FFFD so the output is always valid JSON.
    std::string jsonEscape(const std::string& s);
}
