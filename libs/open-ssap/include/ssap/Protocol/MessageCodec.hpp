#pragma once

#include <ssap/Protocol/Message.hpp>
#include <ssap/Protocol/RemoteCommand.hpp>
#include <QByteArray>
#include <QStringList>

namespace ssap {

namespace Uri {
    constexpr const char* SetPin = "ssap://pairing/setPin";
    constexpr const char* PointerInputSocket =
        "ssap://com.webos.service.networkinput/getPointerInputSocket";
}

/// Pure encode/decode between SSAP messages and wire frames. No I/O.
class MessageCodec {
public:
    /// Serialize {type, id, uri, payload}; "id", "uri" and "payload" are
    /// omitted when empty.
    static QString encodeRequest(const Request& request);

    /// Pointer-socket key frame: "type:button\nname:<KEY>\n\n". Not JSON.
    static QString encodeButton(const QString& buttonName);

    static Request registerRequest(PairingType pairingType, const QString& clientKey = {});
    static Request setPinRequest(const QString& pin);
    static Request pointerSocketRequest();
    static Request commandRequest(const RemoteCommand& command);

    static QJsonObject manifest();
    static QStringList permissions();

    /// Parse an inbound frame. Fails (returns false) on invalid JSON, a
    /// non-object document, or a missing/unknown "type".
    static bool decodeResponse(const QByteArray& frame, Response& response,
                               QString* errorString = nullptr);

    static QString requestTypeName(RequestType type);
    static QString responseTypeName(ResponseType type);
    static QString pairingTypeName(PairingType type);
    static bool pairingTypeFromName(const QString& name, PairingType& type);
};

} // namespace ssap
