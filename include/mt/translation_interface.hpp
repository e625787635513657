#pragma once

#include <string>

namespace speechjobs {
namespace mt {

/**
 * Text translation capability, one instance per language pair
 */
class Translator {
public:
    virtual ~Translator() = default;

    /**
     * Translate text synchronously
     * @param text Text to translate
     * @param sourceLang Source language code (e.g., "en")
     * @param targetLang Target language code (e.g., "es")
     * @return Translated text
     * @throws TranslationException on failure
     */
    virtual std::string translate(const std::string& text,
                                  const std::string& sourceLang,
                                  const std::string& targetLang) = 0;
};

} // namespace mt
} // namespace speechjobs
