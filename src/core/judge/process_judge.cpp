#include "core/judge/process_judge.h"
#include "core/shared/logging.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QProcess>

namespace af {

namespace {

bool fail(QString* errorOut, const QString& message)
{
    if (errorOut) {
        *errorOut = message;
    }
    return false;
}

QStringList stringArray(const QJsonValue& value)
{
    QStringList out;
    for (const QJsonValue& item : value.toArray()) {
        out.append(item.toString());
    }
    return out;
}

} // namespace

std::optional<QJsonObject> runJsonCommand(const QStringList& command,
                                          const QJsonObject& request,
                                          int timeoutMs,
                                          QString* errorOut)
{
    if (command.isEmpty() || command.front().isEmpty()) {
        fail(errorOut, QStringLiteral("no command configured"));
        return std::nullopt;
    }

    const QString program = command.front();
    QProcess process;
    process.start(program, command.mid(1));

    if (!process.waitForStarted(timeoutMs)) {
        fail(errorOut, QStringLiteral("Failed to start process: %1").arg(program));
        return std::nullopt;
    }

    process.write(QJsonDocument(request).toJson(QJsonDocument::Compact));
    process.write("\n");
    process.closeWriteChannel();

    if (!process.waitForFinished(timeoutMs)) {
        process.kill();
        process.waitForFinished();
        fail(errorOut, QStringLiteral("%1 timed out after %2 ms").arg(program).arg(timeoutMs));
        return std::nullopt;
    }

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        const QString stderrText = QString::fromUtf8(process.readAllStandardError()).trimmed();
        fail(errorOut, stderrText.isEmpty()
                           ? QStringLiteral("Process failed: %1").arg(program)
                           : QStringLiteral("%1 failed: %2").arg(program, stderrText.left(300)));
        return std::nullopt;
    }

    const QByteArray output = process.readAllStandardOutput().trimmed();
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(output, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        fail(errorOut, QStringLiteral("parse_error: %1").arg(parseError.errorString()));
        return std::nullopt;
    }
    return doc.object();
}

// ── ProcessSafetyClassifier ─────────────────────────────────

ProcessSafetyClassifier::ProcessSafetyClassifier(QStringList command, int timeoutMs)
    : m_command(std::move(command))
    , m_timeoutMs(timeoutMs)
{
}

std::optional<SafetyVerdict> ProcessSafetyClassifier::classify(const QString& text,
                                                               QString* errorOut)
{
    QJsonObject request;
    request[QStringLiteral("text")] = text;

    const std::optional<QJsonObject> reply = runJsonCommand(m_command, request, m_timeoutMs, errorOut);
    if (!reply) {
        return std::nullopt;
    }

    const QJsonValue allowed = reply->value(QStringLiteral("allowed"));
    if (!allowed.isBool()) {
        fail(errorOut, QStringLiteral("parse_error: missing boolean 'allowed'"));
        return std::nullopt;
    }

    SafetyVerdict verdict;
    verdict.allowed = allowed.toBool();
    verdict.category = reply->value(QStringLiteral("category")).toString(SafetyCategory::kNone);
    verdict.reasonShort = reply->value(QStringLiteral("reason_short")).toString().left(50);
    return verdict;
}

// ── ProcessCriticScorer ─────────────────────────────────────

ProcessCriticScorer::ProcessCriticScorer(QStringList command, int timeoutMs)
    : m_command(std::move(command))
    , m_timeoutMs(timeoutMs)
{
}

std::optional<CriticResult> ProcessCriticScorer::score(const QString& userText,
                                                       const QString& assistantText,
                                                       QString* errorOut)
{
    QJsonObject request;
    request[QStringLiteral("user_text")] = userText;
    request[QStringLiteral("assistant_text")] = assistantText;

    const std::optional<QJsonObject> reply = runJsonCommand(m_command, request, m_timeoutMs, errorOut);
    if (!reply) {
        return std::nullopt;
    }

    const QJsonValue score = reply->value(QStringLiteral("critic_score"));
    if (!score.isDouble() || score.toDouble() < 0.0 || score.toDouble() > 1.0) {
        fail(errorOut, QStringLiteral("parse_error: critic_score must be a number in [0, 1]"));
        return std::nullopt;
    }

    CriticResult result;
    result.criticScore = score.toDouble();
    result.violations = stringArray(reply->value(QStringLiteral("violations")));
    result.reasons = stringArray(reply->value(QStringLiteral("reasons")));
    LOG_DEBUG(afJudge, "Critic score %.2f (%lld violations)",
              result.criticScore, static_cast<long long>(result.violations.size()));
    return result;
}

} // namespace af
