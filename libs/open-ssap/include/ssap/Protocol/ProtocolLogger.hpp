#pragma once

#include <QObject>
#include <QString>
#include <fstream>
#include <mutex>
#include <chrono>
#include <string>

namespace ssap {

class WebOSSession;

/// Logs SSAP frames on both channels to a TSV or JSONL file.
/// attach() connects to a WebOSSession's frameSent and frameReceived.
/// The file is owner-only and pairing secrets are masked.
class ProtocolLogger : public QObject {
    Q_OBJECT

public:
    enum class OutputFormat {
        Tsv,
        Jsonl
    };

    explicit ProtocolLogger(QObject* parent = nullptr);
    ~ProtocolLogger() override;

    void open(const std::string& path = "/tmp/tvremote-protocol.log");
    void close();
    bool isOpen() const;

    void setFormat(OutputFormat format);
    OutputFormat format() const;

    void attach(WebOSSession* session);
    void detach();

    /// Manual log entry (direction: "Client->TV" or "TV->Client")
    void log(const std::string& direction, const QString& channel, const QString& frame);

    /// "register", "request", "button", ... ; "?" when unparseable
    static std::string frameType(const QString& frame);
    static std::string frameTarget(const QString& frame);

    /// Frame with payload "client-key" and "pin" values masked
    static QString redact(const QString& frame);

private:
    std::ofstream file_;
    std::mutex mutex_;
    std::chrono::steady_clock::time_point startTime_;
    bool open_ = false;
    OutputFormat format_ = OutputFormat::Tsv;
    WebOSSession* session_ = nullptr;
};

} // namespace ssap
