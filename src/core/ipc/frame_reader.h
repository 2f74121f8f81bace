#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QString>

namespace af {

// FrameReader splits a local-socket byte stream into JSON objects.
//
// A frame is a 4-byte big-endian payload length followed by one compact
// UTF-8 JSON object. Bytes are fed as they arrive; next() hands back one
// frame at a time. A Malformed result leaves the stream unusable and the
// reader must be cleared or dropped.
class FrameReader {
public:
    static constexpr int kHeaderSize = 4;
    static constexpr int kMaxPayloadSize = 16 * 1024 * 1024;

    enum class Status {
        NeedMore,
        Ready,
        Malformed,
    };

    // Empty result if the payload is larger than kMaxPayloadSize.
    static QByteArray encode(const QJsonObject& json);

    void feed(const QByteArray& bytes) { m_buffer.append(bytes); }

    Status next(QJsonObject* out, QString* errorOut = nullptr);

    int buffered() const { return static_cast<int>(m_buffer.size()); }
    void clear() { m_buffer.clear(); }

private:
    QByteArray m_buffer;
};

} // namespace af
