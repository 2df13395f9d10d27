
#ifndef TRANSFER_METER_CONSTANTS_HPP
#define TRANSFER_METER_CONSTANTS_HPP

#include <array>
#include <cstddef>

namespace constants {
    inline constexpr int BASE_10 = 10;
    inline constexpr long DEFAULT_DIAL_TIMEOUT_S = 30L;
    inline constexpr long DEFAULT_KEEPALIVE_S = 60L * 30L;
    inline constexpr long DEFAULT_TLS_TIMEOUT_S = 30L;
    inline constexpr int DEFAULT_CONCURRENT_TRANSFERS = 3;
    inline constexpr size_t MAX_REDIRECTS = 3;
    inline constexpr size_t READ_CHUNK_SIZE = 16 * 1024;
    inline constexpr size_t MAX_BUFFERED_BODY_BYTES = 256 * 1024;
    inline constexpr const char* CLIENT_VERSION = "0.6.0";
    inline constexpr const char* USER_AGENT = "transfer-meter/0.6.0";
    inline constexpr const char* AUTHORIZATION = "Authorization";
    inline constexpr const char* CONTENT_TYPE = "Content-Type";
    inline constexpr const char* CONTENT_LENGTH = "Content-Length";
    inline constexpr const char* TRANSFER_ENCODING = "Transfer-Encoding";
    inline constexpr const char* LOCATION = "Location";
    inline constexpr std::array<const char*, 4> TRACED_CONTENT_TYPES = {"json", "text", "xml", "html"};

}  // namespace constants

#endif
