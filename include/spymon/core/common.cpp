#include "spymon/core/common.hpp"
#include <chrono>
#include <cstddef>
#include <ctime>
#include <sstream>
#include <iomanip>

#ifdef _WIN32
    #include <windows.h>
#else
    #include <unistd.h>
#endif

namespace spymon::detail {
    int64_t getTimestampNs() {
        using namespace std::chrono;
        return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
    }

    int getPid() {
#ifdef _WIN32
        return static_cast<int>(GetCurrentProcessId());
#else
        return static_cast<int>(getpid());
#endif
    }

    std::string toIso8601Utc() {
        using namespace std::chrono;
        const auto now = system_clock::now();
        auto tt = system_clock::to_time_t(now);
#if defined(_WIN32)
        std::tm tm_utc;
        gmtime_s(&tm_utc, &tt);
        const auto* ptm = &tm_utc;
#else
        std::tm tm_utc;
        gmtime_r(&tt, &tm_utc);
        auto* ptm = &tm_utc;
#endif
        std::ostringstream oss;
        oss << std::put_time(ptm, "%Y-%m-%dT%H:%M:%SZ");
        return oss.str();
    }

    namespace {
        // Length of the well-formed UTF-8 sequence starting at s[i], or 0.
        // When 0, badLen is the length of the maximal ill-formed prefix,
        // which is replaced by a single U+FFFD.
        std::size_t utf8Sequence(const std::string& s, const std::size_t i, std::size_t& badLen) {
            const auto lead = static_cast<unsigned char>(s[i]);
            std::size_t need = 0;
            unsigned char lo = 0x80, hi = 0xBF;
            if (lead >= 0xC2 && lead <= 0xDF) {
                need = 1;
            } else if (lead == 0xE0) {
                need = 2; lo = 0xA0;
            } else if (lead == 0xED) {
                need = 2; hi = 0x9F;
            } else if (lead >= 0xE1 && lead <= 0xEF) {
                need = 2;
            } else if (lead == 0xF0) {
                need = 3; lo = 0x90;
            } else if (lead >= 0xF1 && lead <= 0xF3) {
                need = 3;
            } else if (lead == 0xF4) {
                need = 3; hi = 0x8F;
            } else {
                badLen = 1;
                return 0;
            }

            for (std::size_t k = 1; k <= need; ++k) {
                const unsigned char min = k == 1 ? lo : 0x80;
                const unsigned char max = k == 1 ? hi : 0xBF;
                if (i + k >= s.size()) {
                    badLen = k;
                    return 0;
                }
                const auto c = static_cast<unsigned char>(s[i + k]);
                if (c < min || c > max) {
                    badLen = k;
                    return 0;
                }
            }
            return need + 1;
        }
    }

    std::string jsonEscape(const std::string& s) {
        std::ostringstream oss;
        std::size_t i = 0;
        while (i < s.size()) {
            const char c = s[i];
            if (static_cast<unsigned char>(c) >= 0x80) {
                std::size_t badLen = 0;
                if (const std::size_t len = utf8Sequence(s, i, badLen)) {
                    oss.write(s.data() + i, static_cast<std::streamsize>(len));
                    i += len;
                } else {
                    oss << "\xEF\xBF\xBD";
                    i += badLen;
                }
                continue;
            }
            switch (c) {
                case '\\': oss << "\\\\"; break;
                case '"':  oss << "\\\""; break;
                case '\n': oss << "\\n"; break;
                case '\r': oss << "\\r"; break;
                case '\t': oss << "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                            << static_cast<int>(c) << std::dec << std::setfill(' ');
                    } else {
                        oss << c;
                    }
            }
            ++i;
        }
        return oss.str();
    }
}
