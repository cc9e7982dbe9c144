#pragma once

#include "bragi/export.h"
#include "bragi/types.h"
#include <string>

namespace bragi {

/**
 * @brief Audio file container produced by export_audio()
 */
enum class AudioContainer {
    Mp3,        // MPEG layer 3 (libmp3lame)
    Wav         // RIFF WAVE, 16-bit PCM
};

/**
 * @brief Container for a destination path
 *
 * ".mp3" and ".wav" (case-insensitive) select their container; any other or
 * missing extension falls back to Mp3.
 */
BRAGI_API AudioContainer container_from_path(const std::string& path);

/**
 * @brief File extension without the dot ("mp3", "wav")
 */
BRAGI_API const char* container_extension(AudioContainer container);

/**
 * @brief Encode a clip to a file
 *
 * The file is produced under a temporary sibling name and renamed into place
 * once encoding has finished, so a failed export never leaves a truncated
 * destination.
 *
 * @param clip Audio to encode (interleaved float32)
 * @param destination Output path
 * @param container Output container (the extension of destination is not consulted)
 * @param mp3_bitrate Bitrate in bits per second (mp3 only)
 * @throws ResourceError if encoding or writing fails
 */
BRAGI_API void export_audio(const AudioClip& clip,
                            const std::string& destination,
                            AudioContainer container,
                            int mp3_bitrate = 128000);

} // namespace bragi
