#pragma once

#include <QJsonObject>
#include <QMetaType>
#include <QString>

namespace ssap {

enum class RequestType {
    Register,
    Request,
    Subscribe,
    Unsubscribe
};

enum class ResponseType {
    Response,
    Registered,
    Error
};

enum class PairingType {
    None,
    Prompt,
    Pin
};

struct Request {
    RequestType type = RequestType::Request;
    QString id;       // empty → "id" omitted on the wire
    QString uri;      // empty for register
    QJsonObject payload;
};

struct Response {
    ResponseType type = ResponseType::Response;
    QString id;
    QString error;
    QJsonObject payload;

    // Fields lifted out of payload
    QString clientKey;
    PairingType pairingType = PairingType::None;
    QString socketPath;
};

} // namespace ssap

Q_DECLARE_METATYPE(ssap::Response)
