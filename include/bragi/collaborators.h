#pragma once

#include "export.h"
#include "types.h"
#include <string>

namespace bragi {

// ═══════════════════════════════════════════════════════════
// External collaborators consumed by the pipelines
// ═══════════════════════════════════════════════════════════

/**
 * @brief Decodes the audio track of a media file
 */
class BRAGI_API AudioSource {
public:
    virtual ~AudioSource() = default;

    /**
     * @brief Extract mono audio suitable for speech-to-text
     * @throws ExternalServiceError if the media cannot be decoded
     */
    virtual ExtractedAudio extract(const std::string& media_path) = 0;
};

/**
 * @brief Speech-to-text engine
 */
class BRAGI_API SpeechToText {
public:
    virtual ~SpeechToText() = default;

    /**
     * @brief Load the model if it is not loaded yet
     * @throws ExternalServiceError if the model cannot be loaded
     */
    virtual void prepare() = 0;

    /**
     * @brief Transcribe extracted audio into timed segments
     * @throws ExternalServiceError on inference failure
     */
    virtual TranscriptionResult transcribe(const ExtractedAudio& audio) = 0;
};

/**
 * @brief Machine translation engine
 */
class BRAGI_API TextTranslator {
public:
    virtual ~TextTranslator() = default;

    /**
     * @brief Translate one piece of text
     *
     * @param text Source text
     * @param source_lang Source language code ("en", "ja", ...)
     * @param target_lang Target language code
     * @return Translated text
     * @throws std::exception on any failure
     */
    virtual std::string translate(const std::string& text,
                                  const std::string& source_lang,
                                  const std::string& target_lang) = 0;
};

} // namespace bragi
