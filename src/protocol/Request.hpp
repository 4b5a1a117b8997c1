#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace broker::protocol
{

    // Fixed-layout request header prefix: message_size, api key, api version,
    // correlation id. 12 bytes on the wire.
    struct RequestHeader
    {
        static constexpr size_t kWireSize = 12;

        int32_t message_size = 0;
        uint16_t request_api_key = 0;
        uint16_t request_api_version = 0;
        int32_t correlation_id = 0;

        // Not read off the wire by this version.
        std::optional<std::string> client_id;
        std::vector<std::string> tag_buffer;
    };

} // namespace broker::protocol
