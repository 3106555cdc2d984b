#pragma once

#include <cstddef>
#include <optional>
#include <string>

// Recognises rz/sz file-transfer starts inside the live byte stream.
//
// Each chunk is judged on its own; a signature split across two reads is
// not seen. Scanning never alters the bytes, the caller still forwards them.
//
//   outbound "rz\r" at chunk start   -> UPLOAD   (offset 0)
//   outbound "sz "  at chunk start   -> DOWNLOAD (argument = trimmed rest)
//   inbound  "**\x18B" anywhere      -> DOWNLOAD (offset of the first '*')

enum class DetectionKind {
    UPLOAD,     // local file -> remote (remote runs rz)
    DOWNLOAD,   // remote file -> local (remote runs sz)
};

enum class Direction {
    OUTBOUND,   // typed locally, going to the channel
    INBOUND,    // arriving from the channel
};

struct DetectionEvent {
    DetectionKind kind;
    std::size_t offset;
    std::string argument;
};

const char* detection_kind_name(DetectionKind kind);

std::optional<DetectionEvent> scan(Direction direction, const char* data, std::size_t len);

// ZMODEM header prefix: ZPAD ZPAD ZDLE 'B'
constexpr char ZMODEM_HEADER[] = {'*', '*', 0x18, 'B'};
constexpr std::size_t ZMODEM_HEADER_LEN = sizeof(ZMODEM_HEADER);
