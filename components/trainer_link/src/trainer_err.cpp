/**
 * @file trainer_err.cpp
 * @brief Error code naming
 */

#include "trainer_err.hpp"

namespace trainer_link {

const char* ErrorToName(esp_err_t err) noexcept
{
    switch (err) {
        case ERR_TRANSPORT_:             return "ERR_TRANSPORT";
        case ERR_UNSUPPORTED_OPERATION_: return "ERR_UNSUPPORTED_OPERATION";
        case ERR_PROTOCOL_DETECTION_:    return "ERR_PROTOCOL_DETECTION";
        case ERR_AUTHENTICATION_:        return "ERR_AUTHENTICATION";
        case ERR_NO_VENDOR_FRAME_:       return "ERR_NO_VENDOR_FRAME";
        default:                         return esp_err_to_name(err);
    }
}

} // namespace trainer_link
