#include "core/ipc/frame_reader.h"
#include "core/shared/logging.h"

#include <QJsonDocument>
#include <QtEndian>

namespace af {

namespace {

FrameReader::Status malformed(QString* errorOut, const QString& reason)
{
    LOG_WARN(afIpc, "Malformed frame: %s", qUtf8Printable(reason));
    if (errorOut) {
        *errorOut = reason;
    }
    return FrameReader::Status::Malformed;
}

} // anonymous namespace

QByteArray FrameReader::encode(const QJsonObject& json)
{
    const QByteArray payload = QJsonDocument(json).toJson(QJsonDocument::Compact);
    if (payload.size() > kMaxPayloadSize) {
        LOG_WARN(afIpc, "Refusing to frame %lld byte payload",
                 static_cast<long long>(payload.size()));
        return {};
    }

    QByteArray frame(kHeaderSize, Qt::Uninitialized);
    qToBigEndian<quint32>(static_cast<quint32>(payload.size()), frame.data());
    frame.append(payload);
    return frame;
}

FrameReader::Status FrameReader::next(QJsonObject* out, QString* errorOut)
{
    if (m_buffer.size() < kHeaderSize) {
        return Status::NeedMore;
    }

    const quint32 length = qFromBigEndian<quint32>(m_buffer.constData());
    if (length > static_cast<quint32>(kMaxPayloadSize)) {
        return malformed(errorOut, QStringLiteral("frame length %1 exceeds %2")
                                       .arg(length).arg(kMaxPayloadSize));
    }

    const int frameSize = kHeaderSize + static_cast<int>(length);
    if (m_buffer.size() < frameSize) {
        return Status::NeedMore;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(
        m_buffer.mid(kHeaderSize, static_cast<int>(length)), &parseError);
    m_buffer.remove(0, frameSize);

    if (parseError.error != QJsonParseError::NoError) {
        return malformed(errorOut, parseError.errorString());
    }
    if (!doc.isObject()) {
        return malformed(errorOut, QStringLiteral("payload is not a JSON object"));
    }

    if (out) {
        *out = doc.object();
    }
    return Status::Ready;
}

} // namespace af
