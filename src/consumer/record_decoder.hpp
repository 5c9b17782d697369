#ifndef RECORD_DECODER_HPP
#define RECORD_DECODER_HPP

#include "../common/stream_types.hpp"
#include <string>
#include <cstdint>

// Application value carried by a sample record: "testData-<create time millis>"
struct SampleEvent {
    std::string text;
    int64_t created_at_ms = 0;
};

enum class DecodeStatus {
    OK,
    MALFORMED,     // payload is not valid UTF-8
    UNRECOGNIZED   // valid text that does not follow the sample format
};

struct DecodeResult {
    DecodeStatus status = DecodeStatus::OK;
    SampleEvent event;
    std::string error;

    bool ok() const { return status == DecodeStatus::OK; }
};

// Turns a raw payload into an application value or a rejection.
// Implementations are stateless and never throw for bad input.
class RecordDecoder {
public:
    virtual ~RecordDecoder() = default;
    virtual DecodeResult decode(const Record& record) const = 0;
};

class SampleRecordDecoder : public RecordDecoder {
public:
    static constexpr const char* PAYLOAD_PREFIX = "testData-";

    DecodeResult decode(const Record& record) const override;

    // Check that bytes form well-formed UTF-8
    static bool isValidUtf8(const std::string& bytes);
};

#endif // RECORD_DECODER_HPP
