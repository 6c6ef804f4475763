#include "ImageGenerator.h"

#include <algorithm>
#include <cctype>
#include <vector>

namespace SpriteExtractor {

namespace {

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool containsAny(const std::string& haystack, const char* a, const char* b) {
    return haystack.find(a) != std::string::npos || haystack.find(b) != std::string::npos;
}

} // namespace

std::string optimizeSpritePrompt(const std::string& prompt) {
    const std::string lower = toLower(prompt);

    std::vector<const char*> additions;
    if (!containsAny(lower, "transparent", "background")) additions.push_back("with transparent or solid color background");
    if (!containsAny(lower, "sprite", "game")) additions.push_back("game sprite style");
    if (!containsAny(lower, "isolated", "separate")) additions.push_back("clearly isolated elements");

    if (additions.empty()) return prompt;

    std::string out = prompt;
    for (const char* addition : additions) {
        out += ", ";
        out += addition;
    }
    return out;
}

std::string resolveModelId(const std::string& alias) {
    if (alias == "nano-banana-pro") return "gemini-3-pro-image-preview";
    // "nano-banana" and anything unknown
    return "gemini-2.5-flash-image";
}

} // namespace SpriteExtractor
