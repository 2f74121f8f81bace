#include "core/ingest/fingerprint.h"

#include <QCryptographicHash>

#include <algorithm>

namespace af {

namespace {

bool isStrippedPunctuation(char32_t ch)
{
    switch (ch) {
    case '.':
    case ',':
    case '!':
    case '?':
    case ';':
    case ':':
    case '"':
    case '\'':
    case '(':
    case ')':
    case '[':
    case ']':
    case '{':
    case '}':
    case '<':
    case '>':
        return true;
    default:
        return false;
    }
}

// Whitespace as Python's str.isspace() sees it. QChar::isSpace() misses the
// information separators U+001C..U+001F.
bool isWhitespace(uint cp)
{
    if ((cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x20)) {
        return true;
    }
    switch (cp) {
    case 0x85:
    case 0xA0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
        return true;
    default:
        return cp >= 0x2000 && cp <= 0x200A;
    }
}

bool isCased(uint cp)
{
    const QChar::Category cat = QChar::category(char32_t(cp));
    return cat == QChar::Letter_Uppercase || cat == QChar::Letter_Lowercase
        || cat == QChar::Letter_Titlecase || QChar::isLower(char32_t(cp))
        || QChar::isUpper(char32_t(cp));
}

bool isCaseIgnorable(uint cp)
{
    switch (QChar::category(char32_t(cp))) {
    case QChar::Mark_NonSpacing:
    case QChar::Mark_Enclosing:
    case QChar::Other_Format:
    case QChar::Letter_Modifier:
    case QChar::Symbol_Modifier:
        return true;
    default:
        break;
    }
    switch (cp) {
    case 0x27: case 0x2E: case 0x3A: case 0xB7: case 0x387: case 0x5F4:
    case 0x2018: case 0x2019: case 0x2024: case 0x2027:
    case 0xFE13: case 0xFE52: case 0xFE55: case 0xFF07: case 0xFF0E: case 0xFF1A:
        return true;
    default:
        return false;
    }
}

// Capital sigma lowers to final sigma when it ends a word: a cased letter
// before it and none after it, skipping case-ignorable characters.
bool isFinalSigma(const QList<uint>& cps, qsizetype at)
{
    qsizetype before = at - 1;
    while (before >= 0 && isCaseIgnorable(cps[before])) {
        --before;
    }
    if (before < 0 || !isCased(cps[before])) {
        return false;
    }
    qsizetype after = at + 1;
    while (after < cps.size() && isCaseIgnorable(cps[after])) {
        ++after;
    }
    return after == cps.size() || !isCased(cps[after]);
}

// toLower() plus the context-dependent final sigma rule, which QString
// does not apply.
QString lowercase(const QString& text)
{
    const QList<uint> cps = text.toUcs4();
    QString lowered;
    lowered.reserve(text.size());
    qsizetype chunkStart = 0;
    for (qsizetype i = 0; i < cps.size(); ++i) {
        if (cps[i] != 0x03A3) {
            continue;
        }
        lowered += QString::fromUcs4(reinterpret_cast<const char32_t*>(cps.constData() + chunkStart),
                                     i - chunkStart).toLower();
        lowered += QChar(isFinalSigma(cps, i) ? 0x03C2 : 0x03C3);
        chunkStart = i + 1;
    }
    lowered += QString::fromUcs4(reinterpret_cast<const char32_t*>(cps.constData() + chunkStart),
                                 cps.size() - chunkStart).toLower();
    return lowered;
}

} // namespace

QString Fingerprinter::normalize(const QString& text)
{
    // Work in code points, not UTF-16 units, so text outside the BMP
    // truncates at the same place as any other implementation.
    const QList<uint> codePoints = lowercase(text).toUcs4();

    // Trim, then collapse each whitespace run to one space.
    QList<uint> collapsed;
    collapsed.reserve(codePoints.size());
    bool pendingSpace = false;
    for (const uint cp : codePoints) {
        if (isWhitespace(cp)) {
            pendingSpace = !collapsed.isEmpty();
            continue;
        }
        if (pendingSpace) {
            collapsed.append(' ');
            pendingSpace = false;
        }
        collapsed.append(cp);
    }

    QList<uint> kept;
    kept.reserve(std::min<qsizetype>(collapsed.size(), kMaxNormalizedChars));
    for (const uint cp : collapsed) {
        if (isStrippedPunctuation(static_cast<char32_t>(cp))) {
            continue;
        }
        kept.append(cp);
        if (kept.size() == kMaxNormalizedChars) {
            break;
        }
    }
    return QString::fromUcs4(reinterpret_cast<const char32_t*>(kept.constData()), kept.size());
}

QString Fingerprinter::fingerprint(const QString& text)
{
    const QByteArray digest = QCryptographicHash::hash(normalize(text).toUtf8(),
                                                       QCryptographicHash::Sha256);
    return QString::fromLatin1(digest.toHex());
}

} // namespace af
