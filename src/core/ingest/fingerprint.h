#pragma once

#include <QString>

namespace af {

// Fingerprinter maps message text to a stable identity hash used to group
// repeated attempts. The normalization is part of the stored data format:
//   lowercase -> trim -> collapse whitespace -> strip .,!?;:"'()[]{}<>
//   -> first 600 characters -> SHA-256 of the UTF-8 bytes, lowercase hex.
// Changing any step orphans every existing attempt thread.
class Fingerprinter {
public:
    static constexpr int kMaxNormalizedChars = 600;

    static QString normalize(const QString& text);
    static QString fingerprint(const QString& text);
};

} // namespace af
