#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace localdeck::storage::common {

// Bytes needed by SniffAudioFormat to decide.
constexpr std::size_t kFormatProbeBytes = 12;

/*
  Container tag from magic bytes: mp3, aac, m4a, ogg, flac, wav, webm or unknown.
*/
std::string SniffAudioFormat(const uint8_t* data, std::size_t size);

// Content type for a container tag, as served to players.
std::string MimeTypeForFormat(const std::string& format);

} // namespace localdeck::storage::common
