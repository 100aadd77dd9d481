#include <ssap/Protocol/MessageCodec.hpp>
#include <ssap/Version.hpp>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace ssap {

namespace {

const char* const kPermissions[] = {
    "LAUNCH", "LAUNCH_WEBAPP", "APP_TO_APP", "CLOSE", "TEST_OPEN", "TEST_PROTECTED",
    "CONTROL_AUDIO", "CONTROL_DISPLAY", "CONTROL_INPUT_JOYSTICK",
    "CONTROL_INPUT_MEDIA_RECORDING", "CONTROL_INPUT_MEDIA_PLAYBACK", "CONTROL_INPUT_TV",
    "CONTROL_POWER", "READ_APP_STATUS", "READ_CURRENT_CHANNEL", "READ_INPUT_DEVICE_LIST",
    "READ_NETWORK_STATE", "READ_RUNNING_APPS", "READ_TV_CHANNEL_LIST",
    "WRITE_NOTIFICATION_TOAST", "READ_POWER_STATE", "READ_COUNTRY_INFO"
};

} // namespace

QString MessageCodec::encodeRequest(const Request& request)
{
    QJsonObject obj;
    obj["type"] = requestTypeName(request.type);
    if (!request.id.isEmpty())
        obj["id"] = request.id;
    if (!request.uri.isEmpty())
        obj["uri"] = request.uri;
    if (!request.payload.isEmpty())
        obj["payload"] = request.payload;

    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact));
}

QString MessageCodec::encodeButton(const QString& buttonName)
{
    return QStringLiteral("type:button\nname:%1\n\n").arg(buttonName);
}

Request MessageCodec::registerRequest(PairingType pairingType, const QString& clientKey)
{
    Request req;
    req.type = RequestType::Register;
    req.payload["forcePairing"] = false;
    req.payload["manifest"] = manifest();
    req.payload["pairingType"] = pairingTypeName(
        pairingType == PairingType::None ? PairingType::Prompt : pairingType);
    if (!clientKey.isEmpty())
        req.payload["client-key"] = clientKey;
    return req;
}

Request MessageCodec::setPinRequest(const QString& pin)
{
    Request req;
    req.uri = QString::fromLatin1(Uri::SetPin);
    req.payload["pin"] = pin;
    return req;
}

Request MessageCodec::pointerSocketRequest()
{
    Request req;
    req.uri = QString::fromLatin1(Uri::PointerInputSocket);
    return req;
}

Request MessageCodec::commandRequest(const RemoteCommand& command)
{
    Request req;
    req.uri = CommandTable::uri(command.action);
    req.payload = CommandTable::payload(command);
    return req;
}

QJsonObject MessageCodec::manifest()
{
    QJsonObject m;
    m["manifestVersion"] = MANIFEST_VERSION;
    m["permissions"] = QJsonArray::fromStringList(permissions());
    return m;
}

QStringList MessageCodec::permissions()
{
    QStringList list;
    for (const char* p : kPermissions)
        list << QString::fromLatin1(p);
    return list;
}

bool MessageCodec::decodeResponse(const QByteArray& frame, Response& response,
                                  QString* errorString)
{
    auto fail = [errorString](const QString& why) {
        if (errorString) *errorString = why;
        return false;
    };

    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(frame, &err);
    if (err.error != QJsonParseError::NoError)
        return fail(QStringLiteral("invalid JSON: %1").arg(err.errorString()));
    if (!doc.isObject())
        return fail(QStringLiteral("frame is not a JSON object"));

    QJsonObject obj = doc.object();
    const QJsonValue typeValue = obj.value("type");
    if (!typeValue.isString())
        return fail(QStringLiteral("missing response type"));

    const QString type = typeValue.toString();
    Response out;
    if (type == QLatin1String("response"))
        out.type = ResponseType::Response;
    else if (type == QLatin1String("registered"))
        out.type = ResponseType::Registered;
    else if (type == QLatin1String("error"))
        out.type = ResponseType::Error;
    else
        return fail(QStringLiteral("unknown response type '%1'").arg(type));

    out.id = obj.value("id").toString();
    out.error = obj.value("error").toString();
    out.payload = obj.value("payload").toObject();
    out.clientKey = out.payload.value("client-key").toString();
    out.socketPath = out.payload.value("socketPath").toString();
    PairingType pairing = PairingType::None;
    if (pairingTypeFromName(out.payload.value("pairingType").toString(), pairing))
        out.pairingType = pairing;

    response = out;
    return true;
}

QString MessageCodec::requestTypeName(RequestType type)
{
    switch (type) {
    case RequestType::Register:    return QStringLiteral("register");
    case RequestType::Request:     return QStringLiteral("request");
    case RequestType::Subscribe:   return QStringLiteral("subscribe");
    case RequestType::Unsubscribe: return QStringLiteral("unsubscribe");
    }
    return QStringLiteral("request");
}

QString MessageCodec::responseTypeName(ResponseType type)
{
    switch (type) {
    case ResponseType::Response:   return QStringLiteral("response");
    case ResponseType::Registered: return QStringLiteral("registered");
    case ResponseType::Error:      return QStringLiteral("error");
    }
    return QStringLiteral("response");
}

QString MessageCodec::pairingTypeName(PairingType type)
{
    switch (type) {
    case PairingType::Prompt: return QStringLiteral("PROMPT");
    case PairingType::Pin:    return QStringLiteral("PIN");
    case PairingType::None:   break;
    }
    return {};
}

bool MessageCodec::pairingTypeFromName(const QString& name, PairingType& type)
{
    const QString upper = name.trimmed().toUpper();
    if (upper == QLatin1String("PROMPT")) {
        type = PairingType::Prompt;
        return true;
    }
    if (upper == QLatin1String("PIN")) {
        type = PairingType::Pin;
        return true;
    }
    return false;
}

} // namespace ssap
