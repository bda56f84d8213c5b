#include "modules/source_loader.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace voxplay::modules {

namespace {

std::string lowercase_extension(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext;
}

bool matches(std::span<const uint8_t> data, size_t offset, const char* magic) {
    size_t len = std::strlen(magic);
    if (data.size() < offset + len) return false;
    return std::memcmp(data.data() + offset, magic, len) == 0;
}

// MPEG-1/2/2.5 audio frame header with plausible field values.
bool is_mpeg_audio_frame(std::span<const uint8_t> data, size_t offset) {
    if (data.size() < offset + 4) return false;
    uint8_t b1 = data[offset + 1];
    uint8_t b2 = data[offset + 2];
    if (data[offset] != 0xFF || (b1 & 0xE0) != 0xE0) return false;
    int version = (b1 >> 3) & 0x03;
    int layer = (b1 >> 1) & 0x03;
    int bitrate = (b2 >> 4) & 0x0F;
    int rate = (b2 >> 2) & 0x03;
    // Layer 0 is ADTS AAC, which shares the sync word.
    return version != 1 && layer != 0 && bitrate != 0x0F && rate != 0x03;
}

} // namespace

std::optional<AudioFormat> SourceLoader::format_from_extension(const std::string& path) {
    std::string ext = lowercase_extension(path);
    if (ext == ".mp3") return AudioFormat::Mp3;
    if (ext == ".m4a") return AudioFormat::M4a;
    if (ext == ".wav" || ext == ".wave") return AudioFormat::Wav;
    if (ext == ".flac") return AudioFormat::Flac;
    return std::nullopt;
}

bool SourceLoader::is_video_extension(const std::string& path) {
    std::string ext = lowercase_extension(path);
    return ext == ".mp4" || ext == ".avi" || ext == ".mov" || ext == ".mkv" || ext == ".webm";
}

std::optional<AudioFormat> SourceLoader::sniff_format(std::span<const uint8_t> header) {
    if (matches(header, 0, "RIFF") && matches(header, 8, "WAVE")) return AudioFormat::Wav;
    if (matches(header, 0, "fLaC")) return AudioFormat::Flac;
    if (matches(header, 4, "ftyp")) return AudioFormat::M4a;

    if (matches(header, 0, "ID3") && header.size() >= 10) {
        // Syncsafe tag size; the tag may precede FLAC as well as MP3.
        size_t tag_size = (static_cast<size_t>(header[6] & 0x7F) << 21) |
                          (static_cast<size_t>(header[7] & 0x7F) << 14) |
                          (static_cast<size_t>(header[8] & 0x7F) << 7) |
                          static_cast<size_t>(header[9] & 0x7F);
        size_t body = 10 + tag_size;
        if (matches(header, body, "fLaC")) return AudioFormat::Flac;
        return AudioFormat::Mp3;
    }

    if (is_mpeg_audio_frame(header, 0)) return AudioFormat::Mp3;
    return std::nullopt;
}

std::expected<std::vector<uint8_t>, MediaError> SourceLoader::read_header(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::unexpected(MediaError::FileNotFound);
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(MediaError::FileNotFound);
    }
    std::vector<uint8_t> header(kSniffBytes);
    file.read(reinterpret_cast<char*>(header.data()), static_cast<std::streamsize>(header.size()));
    header.resize(static_cast<size_t>(file.gcount()));
    return header;
}

std::expected<AudioFormat, MediaError> SourceLoader::detect_format(const Source& source) const {
    std::optional<AudioFormat> by_extension;
    std::optional<AudioFormat> by_content;

    if (source.is_path()) {
        auto header = read_header(source.path());
        if (!header) {
            std::cerr << "[Loader] Cannot open " << source.path() << "\n";
            return std::unexpected(header.error());
        }
        by_content = sniff_format(*header);
        by_extension = format_from_extension(source.path());
        if (!by_content && is_video_extension(source.path())) {
            std::cerr << "[Loader] Video sources are not supported: " << source.path() << "\n";
            return std::unexpected(MediaError::UnsupportedFormat);
        }
    } else {
        const auto& bytes = source.bytes();
        by_content = sniff_format(std::span<const uint8_t>(bytes.data(), std::min(bytes.size(), kSniffBytes)));
    }

    if (by_content) {
        if (by_extension && *by_extension != *by_content) {
            std::cout << "[Loader] Extension says " << format_name(*by_extension) << " but content is "
                      << format_name(*by_content) << "; using content\n";
        }
        return *by_content;
    }
    if (by_extension) {
        return *by_extension;
    }
    std::cerr << "[Loader] No decoder matches " << source.describe() << "\n";
    return std::unexpected(MediaError::UnsupportedFormat);
}

std::expected<std::unique_ptr<AudioDecoder>, MediaError> SourceLoader::open(std::shared_ptr<const Source> source) const {
    if (!source) return std::unexpected(MediaError::InternalError);

    auto format = this->detect_format(*source);
    if (!format) return std::unexpected(format.error());

    auto decoder = create_decoder(*format);
    if (!decoder) return std::unexpected(MediaError::UnsupportedFormat);

    auto opened = decoder->open(std::move(source));
    if (!opened) {
        std::cerr << "[Loader] " << format_name(*format) << " decoder rejected source: "
                  << error_to_string(opened.error()) << "\n";
        return std::unexpected(opened.error());
    }
    return decoder;
}

} // namespace voxplay::modules
