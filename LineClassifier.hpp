// LineClassifier.hpp
#pragma once
#include <string>
#include "Types.hpp"

class SourceBuffer;

// Single forward pass over a buffer that tags every line (see LineTag).
// Total: malformed input never fails, an unterminated construct simply
// swallows the rest of the file and leaves a diagnostic behind.
namespace LineClassifier {
    ClassificationPtr classify(const SourceBuffer& buffer);

    // Same, for text that has no file behind it.
    ClassificationPtr classify_text(const std::string& text, uint64_t fingerprint = 0);
}
