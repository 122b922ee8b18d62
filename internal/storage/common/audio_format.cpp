#include "audio_format.hpp"

#include <cstring>

namespace localdeck::storage::common {

namespace {

bool HasPrefix(const uint8_t* data, std::size_t size, std::size_t offset, const char* magic) {
  const auto len = std::strlen(magic);
  return size >= offset + len && std::memcmp(data + offset, magic, len) == 0;
}

} // namespace

std::string SniffAudioFormat(const uint8_t* data, std::size_t size) {
  if (data == nullptr || size == 0) {
    return "unknown";
  }
  if (HasPrefix(data, size, 0, "ID3")) {
    return "mp3";
  }
  if (HasPrefix(data, size, 0, "fLaC")) {
    return "flac";
  }
  if (HasPrefix(data, size, 0, "OggS")) {
    return "ogg";
  }
  if (HasPrefix(data, size, 0, "RIFF") && HasPrefix(data, size, 8, "WAVE")) {
    return "wav";
  }
  if (HasPrefix(data, size, 4, "ftyp")) {
    return "m4a";
  }
  if (size >= 4 && data[0] == 0x1A && data[1] == 0x45 && data[2] == 0xDF && data[3] == 0xA3) {
    return "webm";
  }
  if (size >= 2 && data[0] == 0xFF) {
    // ADTS has layer bits 00, MPEG audio frames do not
    if ((data[1] & 0xF6) == 0xF0) {
      return "aac";
    }
    if ((data[1] & 0xE0) == 0xE0) {
      return "mp3";
    }
  }
  return "unknown";
}

std::string MimeTypeForFormat(const std::string& format) {
  if (format == "m4a") return "audio/x-m4a";
  if (format == "aac") return "audio/aac";
  if (format == "mp3") return "audio/mpeg";
  if (format == "wav") return "audio/wav";
  if (format == "ogg") return "audio/ogg";
  if (format == "flac") return "audio/flac";
  if (format == "webm") return "audio/webm";
  return "application/octet-stream";
}

} // namespace localdeck::storage::common
