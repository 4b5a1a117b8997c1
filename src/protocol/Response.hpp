#pragma once
#include <cstdint>
#include <cstddef>

namespace broker::protocol
{

    struct ResponseHeader
    {
        static constexpr size_t kWireSize = 8;

        // Always 0 for now; the body length is not computed.
        int32_t message_size = 0;
        int32_t correlation_id = 0;
    };

} // namespace broker::protocol
