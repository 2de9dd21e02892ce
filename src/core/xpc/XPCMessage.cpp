#include "XPCMessage.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QDateTime>
#include <QtCore/QtEndian>

namespace Rbum {

Expected<QByteArray, XPCError> encodeFrame(const XPCEnvelope& envelope) {
    QByteArray body;
    QDataStream stream(&body, QIODevice::WriteOnly);
    stream.setVersion(QDataStream::Qt_6_0);

    const qint64 timestamp = envelope.timestamp != 0
        ? envelope.timestamp
        : QDateTime::currentMSecsSinceEpoch();

    stream << kEnvelopeMagic
           << static_cast<quint8>(envelope.type)
           << envelope.requestId
           << envelope.operation
           << envelope.payload
           << timestamp;

    if (static_cast<quint64>(body.size()) > kMaxFrameSize) {
        RBUM_ERROR("Refusing to send {} byte frame for '{}'", body.size(), envelope.operation.toStdString());
        return makeUnexpected(XPCError::MessageTooLarge);
    }

    QByteArray frame(sizeof(quint32), Qt::Uninitialized);
    qToBigEndian<quint32>(static_cast<quint32>(body.size()), frame.data());
    frame.append(body);
    return frame;
}

Expected<XPCEnvelope, XPCError> decodeEnvelope(const QByteArray& body) {
    QDataStream stream(body);
    stream.setVersion(QDataStream::Qt_6_0);

    quint32 magic = 0;
    quint8 type = 0;
    XPCEnvelope envelope;
    stream >> magic >> type >> envelope.requestId >> envelope.operation
           >> envelope.payload >> envelope.timestamp;

    if (stream.status() != QDataStream::Ok || magic != kEnvelopeMagic ||
        type > static_cast<quint8>(XPCMessageType::Shutdown)) {
        return makeUnexpected(XPCError::InvalidMessage);
    }

    envelope.type = static_cast<XPCMessageType>(type);
    return envelope;
}

QByteArray encodeErrorPayload(XPCError error) {
    return packPayload(toWireCode(error), errorString(error));
}

XPCError decodeErrorPayload(const QByteArray& payload) {
    quint32 code = 0;
    QString message;
    if (!unpackPayload(payload, code, message)) {
        return XPCError::InvalidMessage;
    }
    return fromWireCode(code);
}

XPCFrameReader::XPCFrameReader(quint32 maxFrameSize)
    : maxFrameSize_(maxFrameSize) {
}

void XPCFrameReader::append(const QByteArray& data) {
    if (!failed_) {
        buffer_.append(data);
    }
}

Expected<QList<XPCEnvelope>, XPCError> XPCFrameReader::takeFrames() {
    if (failed_) {
        return makeUnexpected(XPCError::MessageTooLarge);
    }

    QList<XPCEnvelope> envelopes;
    const int header = static_cast<int>(sizeof(quint32));

    while (buffer_.size() >= header) {
        const quint32 length = qFromBigEndian<quint32>(buffer_.constData());
        if (length > maxFrameSize_) {
            RBUM_ERROR("Incoming frame of {} bytes exceeds limit of {}", length, maxFrameSize_);
            failed_ = true;
            buffer_.clear();
            return makeUnexpected(XPCError::MessageTooLarge);
        }

        if (buffer_.size() - header < static_cast<qsizetype>(length)) {
            break;
        }

        const QByteArray body = buffer_.mid(header, static_cast<qsizetype>(length));
        buffer_.remove(0, header + static_cast<qsizetype>(length));

        auto envelope = decodeEnvelope(body);
        if (envelope.hasError()) {
            RBUM_WARN("Dropping malformed frame of {} bytes", length);
            continue;
        }
        envelopes.append(envelope.value());
    }

    return envelopes;
}

void XPCFrameReader::reset() {
    buffer_.clear();
    failed_ = false;
}

QString toString(XPCMessageType type) {
    switch (type) {
        case XPCMessageType::Handshake: return "handshake";
        case XPCMessageType::HandshakeReply: return "handshake-reply";
        case XPCMessageType::Ping: return "ping";
        case XPCMessageType::Pong: return "pong";
        case XPCMessageType::Request: return "request";
        case XPCMessageType::Reply: return "reply";
        case XPCMessageType::ErrorReply: return "error-reply";
        case XPCMessageType::Notification: return "notification";
        case XPCMessageType::Shutdown: return "shutdown";
    }
    return "unknown";
}

} // namespace Rbum
