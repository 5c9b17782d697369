#include "record_decoder.hpp"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>

DecodeResult SampleRecordDecoder::decode(const Record& record) const {
    DecodeResult result;

    if (!isValidUtf8(record.data)) {
        result.status = DecodeStatus::MALFORMED;
        result.error = "payload is not valid UTF-8 (" + std::to_string(record.data.size()) + " bytes)";
        return result;
    }

    const size_t prefix_len = std::strlen(PAYLOAD_PREFIX);
    const std::string& text = record.data;
    if (text.compare(0, prefix_len, PAYLOAD_PREFIX) != 0 || text.size() == prefix_len) {
        result.status = DecodeStatus::UNRECOGNIZED;
        result.error = "record does not match sample record format: " + text;
        return result;
    }

    for (size_t i = prefix_len; i < text.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            result.status = DecodeStatus::UNRECOGNIZED;
            result.error = "record does not match sample record format: " + text;
            return result;
        }
    }

    errno = 0;
    long long created = std::strtoll(text.c_str() + prefix_len, nullptr, 10);
    if (errno == ERANGE) {
        result.status = DecodeStatus::UNRECOGNIZED;
        result.error = "record create time out of range: " + text;
        return result;
    }

    result.event.text = text;
    result.event.created_at_ms = created;
    return result;
}

bool SampleRecordDecoder::isValidUtf8(const std::string& bytes) {
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(bytes[i]);
        size_t len;
        uint32_t cp;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }

        if (i + len > n) {
            return false;
        }
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Reject overlong forms, surrogates and values past U+10FFFF
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
            return false;
        }
        if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += len;
    }
    return true;
}
