//! # Content Fingerprints

#include "common/fingerprint.hpp"

#include <fstream>
#include <sstream>

namespace docforge {

std::string fingerprint(std::string_view content) {
    uint64_t combined = (static_cast<uint64_t>(crc32c(content)) << 32) |
                        static_cast<uint64_t>(content.size() & 0xFFFFFFFF);

    static constexpr char HEX_CHARS[] = "0123456789abcdef";
    std::string hex(16, '0');
    for (int i = 15; i >= 0; --i) {
        hex[static_cast<size_t>(i)] = HEX_CHARS[combined & 0xF];
        combined >>= 4;
    }
    return hex;
}

std::string fingerprint_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return "";
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return fingerprint(oss.str());
}

} // namespace docforge
