#include "channelhash.hpp"

using namespace meshslot;

static bool isContinuation(const std::string& s, size_t pos, uint8_t lo = 0x80, uint8_t hi = 0xBF)
{
    if(pos >= s.size())
        return false;
    const auto b = uint8_t(s[pos]);
    return b >= lo && b <= hi;
}

// decodes one code point at pos and advances pos past it
static uint32_t nextCodePoint(const std::string& s, size_t& pos)
{
    const auto lead = uint8_t(s[pos]);

    if(lead < 0x80) {
        pos += 1;
        return lead;
    }

    if(lead >= 0xC2 && lead <= 0xDF && isContinuation(s, pos + 1)) {
        uint32_t cp = (uint32_t(lead & 0x1F) << 6) | (uint8_t(s[pos + 1]) & 0x3F);
        pos += 2;
        return cp;
    }

    if(lead >= 0xE0 && lead <= 0xEF) {
        // reject overlong forms and UTF-16 surrogates
        uint8_t lo = lead == 0xE0 ? 0xA0 : 0x80;
        uint8_t hi = lead == 0xED ? 0x9F : 0xBF;
        if(isContinuation(s, pos + 1, lo, hi) && isContinuation(s, pos + 2)) {
            uint32_t cp = (uint32_t(lead & 0x0F) << 12)
                | (uint32_t(uint8_t(s[pos + 1]) & 0x3F) << 6)
                | (uint8_t(s[pos + 2]) & 0x3F);
            pos += 3;
            return cp;
        }
    }

    if(lead >= 0xF0 && lead <= 0xF4) {
        uint8_t lo = lead == 0xF0 ? 0x90 : 0x80;
        uint8_t hi = lead == 0xF4 ? 0x8F : 0xBF;
        if(isContinuation(s, pos + 1, lo, hi) && isContinuation(s, pos + 2) && isContinuation(s, pos + 3)) {
            uint32_t cp = (uint32_t(lead & 0x07) << 18)
                | (uint32_t(uint8_t(s[pos + 1]) & 0x3F) << 12)
                | (uint32_t(uint8_t(s[pos + 2]) & 0x3F) << 6)
                | (uint8_t(s[pos + 3]) & 0x3F);
            pos += 4;
            return cp;
        }
    }

    // undecodable byte, escaped into the low surrogate range like a python argv string
    pos += 1;
    return SURROGATE_ESCAPE_BASE + lead;
}

uint32_t meshslot::hashChannelName(const std::string& name)
{
    uint32_t hash = DJB2_SEED;
    size_t pos = 0;
    while(pos < name.size())
        hash = djb2Step(hash, nextCodePoint(name, pos));
    return hash;
}
