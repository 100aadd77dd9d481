#include <ssap/Protocol/ProtocolLogger.hpp>
#include <ssap/Session/WebOSSession.hpp>
#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace ssap {

namespace {

std::string jsonEscape(const std::string& input)
{
    std::ostringstream out;
    for (char c : input) {
        switch (c) {
        case '\\': out << "\\\\"; break;
        case '"': out << "\\\""; break;
        case '\b': out << "\\b"; break;
        case '\f': out << "\\f"; break;
        case '\n': out << "\\n"; break;
        case '\r': out << "\\r"; break;
        case '\t': out << "\\t"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                out << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                    << static_cast<int>(static_cast<unsigned char>(c));
            } else {
                out << c;
            }
            break;
        }
    }
    return out.str();
}

// Key frames are "type:button\nname:UP\n\n"
bool parseKeyFrame(const QString& frame, std::string& type, std::string& name)
{
    if (!frame.startsWith(QLatin1String("type:"))) return false;
    const QStringList lines = frame.split('\n');
    for (const QString& line : lines) {
        if (line.startsWith(QLatin1String("type:")))
            type = line.mid(5).toStdString();
        else if (line.startsWith(QLatin1String("name:")))
            name = line.mid(5).toStdString();
    }
    return true;
}

} // namespace

ProtocolLogger::ProtocolLogger(QObject* parent)
    : QObject(parent)
{
}

ProtocolLogger::~ProtocolLogger()
{
    detach();
    close();
}

void ProtocolLogger::open(const std::string& path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (open_) file_.close();
    file_.open(path, std::ios::trunc);
    startTime_ = std::chrono::steady_clock::now();
    open_ = file_.is_open();
    if (open_ && !QFile::setPermissions(QString::fromStdString(path),
                                        QFileDevice::ReadOwner | QFileDevice::WriteOwner)) {
        qWarning() << "[ProtocolLogger] Could not restrict permissions on"
                   << QString::fromStdString(path);
    }
    if (open_ && format_ == OutputFormat::Tsv) {
        file_ << "TIME\tDIR\tCHANNEL\tTYPE\tTARGET\tSIZE\tPREVIEW\n";
        file_.flush();
    }
}

void ProtocolLogger::close()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (open_) { file_.close(); open_ = false; }
}

bool ProtocolLogger::isOpen() const
{
    return open_;
}

void ProtocolLogger::setFormat(OutputFormat format)
{
    std::lock_guard<std::mutex> lock(mutex_);
    format_ = format;
}

ProtocolLogger::OutputFormat ProtocolLogger::format() const
{
    return format_;
}

void ProtocolLogger::attach(WebOSSession* session)
{
    detach();
    session_ = session;
    if (!session_) return;

    connect(session_, &WebOSSession::frameReceived,
            this, [this](const QString& channel, const QString& frame) {
                log("TV->Client", channel, frame);
            });
    connect(session_, &WebOSSession::frameSent,
            this, [this](const QString& channel, const QString& frame) {
                log("Client->TV", channel, frame);
            });
}

void ProtocolLogger::detach()
{
    if (session_) {
        disconnect(session_, nullptr, this, nullptr);
        session_ = nullptr;
    }
}

void ProtocolLogger::log(const std::string& direction, const QString& channel,
                         const QString& frame)
{
    const std::string type = frameType(frame);
    const std::string target = frameTarget(frame);
    const std::string raw = redact(frame).toStdString();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) return;

    auto now = std::chrono::steady_clock::now();

    if (format_ == OutputFormat::Jsonl) {
        const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
            now - startTime_).count();
        std::ostringstream line;
        line << "{\"ts_ms\":" << elapsedMs
             << ",\"direction\":\"" << jsonEscape(direction) << "\""
             << ",\"channel\":\"" << jsonEscape(channel.toStdString()) << "\""
             << ",\"type\":\"" << jsonEscape(type) << "\""
             << ",\"target\":\"" << jsonEscape(target) << "\""
             << ",\"frame\":\"" << jsonEscape(raw) << "\"}\n";
        file_ << line.str();
        file_.flush();
        return;
    }

    const auto elapsed = std::chrono::duration<double>(now - startTime_).count();

    // First 96 characters, control characters escaped so each frame stays on one line
    const size_t previewMax = 96;
    std::string preview = jsonEscape(raw.substr(0, std::min(raw.size(), previewMax)));
    if (raw.size() > previewMax) preview += "...";

    std::ostringstream line;
    line << std::fixed << std::setprecision(3) << elapsed << '\t'
         << direction << '\t'
         << channel.toStdString() << '\t'
         << type << '\t'
         << target << '\t'
         << raw.size() << '\t'
         << preview << '\n';

    file_ << line.str();
    file_.flush();
}

std::string ProtocolLogger::frameType(const QString& frame)
{
    std::string type;
    std::string name;
    if (parseKeyFrame(frame, type, name))
        return type.empty() ? "?" : type;

    const QJsonDocument doc = QJsonDocument::fromJson(frame.toUtf8());
    if (!doc.isObject()) return "?";
    const QString t = doc.object().value("type").toString();
    return t.isEmpty() ? "?" : t.toStdString();
}

std::string ProtocolLogger::frameTarget(const QString& frame)
{
    std::string type;
    std::string name;
    if (parseKeyFrame(frame, type, name))
        return name;

    const QJsonDocument doc = QJsonDocument::fromJson(frame.toUtf8());
    if (!doc.isObject()) return {};
    const QJsonObject obj = doc.object();
    if (obj.contains("uri"))
        return obj.value("uri").toString().toStdString();
    return obj.value("id").toString().toStdString();
}

QString ProtocolLogger::redact(const QString& frame)
{
    QJsonDocument doc = QJsonDocument::fromJson(frame.toUtf8());
    if (!doc.isObject()) return frame;

    QJsonObject obj = doc.object();
    QJsonObject payload = obj.value("payload").toObject();
    bool masked = false;
    for (const char* key : {"client-key", "pin"}) {
        if (payload.contains(QLatin1String(key))) {
            payload.insert(QLatin1String(key), QStringLiteral("***"));
            masked = true;
        }
    }
    if (!masked) return frame;

    obj.insert("payload", payload);
    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact));
}

} // namespace ssap
