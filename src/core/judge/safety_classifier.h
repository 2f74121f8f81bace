#pragma once

#include <QString>
#include <optional>

namespace af {

// Categories a classifier may block under. UNAVAILABLE is assigned by the
// pipeline itself when the classifier fails and fail-open is disabled.
namespace SafetyCategory {
inline const QString kNone = QStringLiteral("NONE");
inline const QString kFabrication = QStringLiteral("FABRICATION");
inline const QString kIllegal = QStringLiteral("ILLEGAL");
inline const QString kUnethical = QStringLiteral("UNETHICAL");
inline const QString kHarmful = QStringLiteral("HARMFUL");
inline const QString kUnavailable = QStringLiteral("UNAVAILABLE");
} // namespace SafetyCategory

struct SafetyVerdict {
    bool allowed = true;
    QString category = SafetyCategory::kNone;
    QString reasonShort;
};

// SafetyClassifier -- allow/block decision for user text, backed by an
// external model. Implementations may block the calling thread; callers go
// through JudgementGate, which bounds the wait.
class SafetyClassifier {
public:
    virtual ~SafetyClassifier() = default;

    // Returns nullopt (with a reason in errorOut) when no verdict could be
    // obtained: transport failure, non-zero exit, malformed reply.
    virtual std::optional<SafetyVerdict> classify(const QString& text, QString* errorOut) = 0;
};

} // namespace af
