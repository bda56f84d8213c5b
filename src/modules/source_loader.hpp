#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include "modules/audio_decoder.hpp"
#include "modules/media_types.hpp"

namespace voxplay::modules {

// Resolves a Source into an opened decoder. Content sniffing takes
// precedence over the file extension; the extension is only a fallback.
class SourceLoader {
public:
    static constexpr size_t kSniffBytes = 4096;

    std::expected<AudioFormat, MediaError> detect_format(const Source& source) const;

    std::expected<std::unique_ptr<AudioDecoder>, MediaError> open(std::shared_ptr<const Source> source) const;

    static std::optional<AudioFormat> format_from_extension(const std::string& path);
    static bool is_video_extension(const std::string& path);
    static std::optional<AudioFormat> sniff_format(std::span<const uint8_t> header);

private:
    // Reads the first kSniffBytes of a file; the handle is closed on return.
    static std::expected<std::vector<uint8_t>, MediaError> read_header(const std::string& path);
};

} // namespace voxplay::modules
