/**
 * @file trainer_types.cpp
 * @brief Data model helpers
 */

#include "trainer_types.hpp"

#include <cstdio>
#include <cstring>

namespace trainer_link {

namespace {

int hexNibble(char c) noexcept
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

const char* ToString(ProtocolKind kind) noexcept
{
    switch (kind) {
        case ProtocolKind::Ftms:    return "FTMS";
        case ProtocolKind::Csc:     return "CSC";
        case ProtocolKind::Mobi:    return "MOBI";
        case ProtocolKind::Reborn:  return "REBORN";
        case ProtocolKind::Tacx:    return "TACX";
        case ProtocolKind::FitShow: return "FITSHOW";
        case ProtocolKind::YafitS3: return "YAFIT_S3";
        case ProtocolKind::YafitS4: return "YAFIT_S4";
        case ProtocolKind::Nus:     return "NUS";
        case ProtocolKind::Hrs:     return "HRS";
        case ProtocolKind::Cps:     return "CPS";
        case ProtocolKind::Bms:     return "BMS";
        case ProtocolKind::Dis:     return "DIS";
    }
    return "UNKNOWN";
}

bool BleUuid::FromString(const char* text, BleUuid& out) noexcept
{
    if (text == nullptr) return false;

    const size_t len = std::strlen(text);
    if (len == 4) {
        uint16_t v = 0;
        for (size_t i = 0; i < 4; ++i) {
            int n = hexNibble(text[i]);
            if (n < 0) return false;
            v = static_cast<uint16_t>((v << 4) | n);
        }
        out = From16(v);
        return true;
    }

    if (len != 36) return false;

    BleUuid parsed{};
    size_t byte_index = 0;
    for (size_t i = 0; i < len;) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (text[i] != '-') return false;
            ++i;
            continue;
        }
        int hi = hexNibble(text[i]);
        int lo = hexNibble(text[i + 1]);
        if (hi < 0 || lo < 0 || byte_index >= parsed.bytes.size()) return false;
        parsed.bytes[byte_index++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    if (byte_index != parsed.bytes.size()) return false;

    out = parsed;
    return true;
}

bool BleUuid::IsSigBased() const noexcept
{
    const BleUuid base = From16(0x0000);
    return bytes[0] == 0 && bytes[1] == 0 &&
           std::memcmp(bytes.data() + 4, base.bytes.data() + 4, 12) == 0;
}

void BleUuid::Format(char* out, size_t out_size) const noexcept
{
    if (out == nullptr || out_size < 37) return;
    snprintf(out, out_size,
             "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
             bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
             bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
}

std::string BleUuid::ToString() const
{
    char buf[37];
    Format(buf, sizeof(buf));
    return std::string(buf);
}

bool DeviceDescriptor::HasService(const BleUuid& uuid) const noexcept
{
    for (const auto& s : services) {
        if (s == uuid) return true;
    }
    return false;
}

std::string ToHex(const uint8_t* data, size_t len)
{
    static const char* DIGITS_ = "0123456789abcdef";
    std::string out;
    if (data == nullptr) return out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(DIGITS_[data[i] >> 4]);
        out.push_back(DIGITS_[data[i] & 0x0F]);
    }
    return out;
}

} // namespace trainer_link
