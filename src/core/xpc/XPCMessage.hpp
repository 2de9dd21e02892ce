#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QDataStream>
#include <QtCore/QIODevice>
#include <QtCore/QList>
#include <QtCore/QString>
#include <QtCore/QUuid>

#include "core/common/Expected.hpp"
#include "XPCError.hpp"

namespace Rbum {

enum class XPCMessageType : quint8 {
    Handshake,
    HandshakeReply,
    Ping,
    Pong,
    Request,
    Reply,
    ErrorReply,
    Notification,
    Shutdown
};

struct XPCEnvelope {
    XPCMessageType type = XPCMessageType::Request;
    QUuid requestId;
    QString operation;
    QByteArray payload;
    qint64 timestamp = 0;   // ms since epoch, set by encodeFrame when zero
};

constexpr quint32 kMaxFrameSize = 16 * 1024 * 1024;
constexpr quint32 kEnvelopeMagic = 0x52425850;  // "RBXP"

// quint32 big-endian body length followed by the serialised envelope
Expected<QByteArray, XPCError> encodeFrame(const XPCEnvelope& envelope);
Expected<XPCEnvelope, XPCError> decodeEnvelope(const QByteArray& body);

QByteArray encodeErrorPayload(XPCError error);
XPCError decodeErrorPayload(const QByteArray& payload);

template<typename... Args>
QByteArray packPayload(const Args&... args) {
    QByteArray data;
    QDataStream stream(&data, QIODevice::WriteOnly);
    stream.setVersion(QDataStream::Qt_6_0);
    (stream << ... << args);
    return data;
}

// Returns false if the payload was truncated or malformed
template<typename... Args>
bool unpackPayload(const QByteArray& data, Args&... args) {
    QDataStream stream(data);
    stream.setVersion(QDataStream::Qt_6_0);
    (stream >> ... >> args);
    return stream.status() == QDataStream::Ok;
}

/**
 * @brief Reassembles frames from a byte stream
 *
 * Feed whatever the socket delivered; takeFrames() returns every
 * complete envelope so far. A frame announcing more than maxFrameSize
 * poisons the reader, after which the connection must be dropped.
 */
class XPCFrameReader {
public:
    explicit XPCFrameReader(quint32 maxFrameSize = kMaxFrameSize);

    void append(const QByteArray& data);
    Expected<QList<XPCEnvelope>, XPCError> takeFrames();

    bool hasError() const { return failed_; }
    void reset();

private:
    QByteArray buffer_;
    quint32 maxFrameSize_;
    bool failed_ = false;
};

QString toString(XPCMessageType type);

} // namespace Rbum
