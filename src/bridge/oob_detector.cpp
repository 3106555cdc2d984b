#include "oob_detector.hpp"
#include <core/utils.hpp>
#include <cstring>

static const char RZ_COMMAND[] = {'r', 'z', '\r'};
static const char SZ_PREFIX[] = {'s', 'z', ' '};

const char* detection_kind_name(DetectionKind kind) {
    return kind == DetectionKind::UPLOAD ? "upload" : "download";
}

static bool starts_with(const char* data, std::size_t len, const char* prefix, std::size_t plen) {
    return len >= plen && std::memcmp(data, prefix, plen) == 0;
}

std::optional<DetectionEvent> scan(Direction direction, const char* data, std::size_t len) {
    if (!data || len == 0) return std::nullopt;

    if (direction == Direction::OUTBOUND) {
        if (starts_with(data, len, RZ_COMMAND, sizeof(RZ_COMMAND))) {
            return DetectionEvent{DetectionKind::UPLOAD, 0, ""};
        }
        if (starts_with(data, len, SZ_PREFIX, sizeof(SZ_PREFIX))) {
            std::string arg(data + sizeof(SZ_PREFIX), len - sizeof(SZ_PREFIX));
            trim(arg);
            return DetectionEvent{DetectionKind::DOWNLOAD, 0, arg};
        }
        return std::nullopt;
    }

    if (len < ZMODEM_HEADER_LEN) return std::nullopt;
    // <= so the last four bytes are examined too
    for (std::size_t i = 0; i + ZMODEM_HEADER_LEN <= len; i++) {
        if (std::memcmp(data + i, ZMODEM_HEADER, ZMODEM_HEADER_LEN) == 0) {
            return DetectionEvent{DetectionKind::DOWNLOAD, i, ""};
        }
    }
    return std::nullopt;
}
