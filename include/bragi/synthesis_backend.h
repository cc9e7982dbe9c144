#pragma once

#include "bragi/export.h"
#include "bragi/types.h"
#include <functional>
#include <memory>
#include <string>
#include <variant>

namespace bragi {

// ═══════════════════════════════════════════════════════════
// Voice selection
// ═══════════════════════════════════════════════════════════

/**
 * @brief External text-to-speech executable
 *
 * The template is run through the shell after substitution of:
 *   {text_file}  file holding the UTF-8 text
 *   {output}     audio file the command must write (.wav)
 *   {lang}       target language code
 *   {voice}      voice name (the language code when empty)
 */
struct CommandVoice {
    std::string name = "command";
    std::string command_template;
    std::string voice;
};

/**
 * @brief Piper VITS voice run with ONNX Runtime
 *
 * Expects <model>.onnx.json next to the model. Phonemes come from the
 * espeak-ng executable.
 */
struct PiperVoice {
    std::string model_path;
    std::string config_path;        // Empty = model_path + ".json"
    std::string espeak_command = "espeak-ng";
    int speaker_id = 0;             // Multi-speaker models only
};

/**
 * @brief Embedder-supplied synthesis function
 *
 * Throwing from the function is reported as a failed segment.
 */
struct CallbackVoice {
    std::string name = "callback";
    std::function<AudioClip(const std::string& text, const std::string& language)> synthesize;
};

using VoiceSelection = std::variant<CommandVoice, PiperVoice, CallbackVoice>;

/**
 * @brief Parse a voice selector
 *
 * Accepted forms:
 *   espeak-ng            espeak-ng with the target language as voice
 *   espeak-ng:<voice>    espeak-ng with an explicit voice
 *   command:<template>   CommandVoice with a custom template
 *   piper:<model.onnx>   PiperVoice
 *
 * @throws FormatError for anything else
 */
BRAGI_API VoiceSelection parse_voice_selector(const std::string& selector);

// ═══════════════════════════════════════════════════════════
// Backend
// ═══════════════════════════════════════════════════════════

/**
 * @brief Result of synthesizing one text
 *
 * Failures are values, not exceptions: a failed segment is skipped by the
 * caller.
 */
struct SynthesisResult {
    bool ok = false;
    AudioClip clip;
    std::string error;
};

/**
 * @brief Speech synthesis backend chosen once per synthesizer
 *
 * Example usage:
 * @code
 * bragi::SynthesisBackend backend(bragi::parse_voice_selector("espeak-ng"));
 * auto result = backend.synthesize("Hola", "es");
 * if (!result.ok) {
 *     std::cerr << result.error << "\n";
 * }
 * @endcode
 */
class BRAGI_API SynthesisBackend {
public:
    /**
     * @throws ExternalServiceError if a Piper model cannot be loaded
     * @throws FormatError if the voice is incomplete (empty template/model/callback)
     */
    explicit SynthesisBackend(VoiceSelection voice);
    ~SynthesisBackend();

    SynthesisBackend(const SynthesisBackend&) = delete;
    SynthesisBackend& operator=(const SynthesisBackend&) = delete;
    SynthesisBackend(SynthesisBackend&&) noexcept;
    SynthesisBackend& operator=(SynthesisBackend&&) noexcept;

    /**
     * @brief Synthesize one text
     *
     * @param text UTF-8 text
     * @param language Target language code
     * @return Clip on success, error message on failure (never throws)
     */
    SynthesisResult synthesize(const std::string& text, const std::string& language);

    /**
     * @brief Backend name for logs ("espeak-ng", "piper", ...)
     */
    std::string name() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace bragi
