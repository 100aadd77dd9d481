#pragma once

#include <ssap/Transport/ITransport.hpp>
#include <QList>

namespace ssap {

class ReplayTransport : public ITransport {
    Q_OBJECT
public:
    explicit ReplayTransport(QObject* parent = nullptr);
    ~ReplayTransport() override;

    // ITransport interface
    void open(const QUrl& url) override;
    void close() override;
    bool sendText(const QString& message) override;
    bool sendBinary(const QByteArray& data) override;
    bool ping() override;
    bool isConnected() const override;
    QUrl url() const override;

    // Test API
    void feedText(const QString& message);
    void feedBinary(const QByteArray& data);
    void simulateConnect();
    void simulateDisconnect();
    void simulateError(const QString& message);
    void setFailPings(bool fail);

    bool isOpenRequested() const;
    int openCount() const;
    int closeCount() const;
    int pingCount() const;
    QList<QString> writtenText() const;
    QList<QByteArray> writtenBinary() const;
    void clearWritten();

private:
    QUrl url_;
    bool openRequested_ = false;
    bool connected_ = false;
    bool failPings_ = false;
    int openCount_ = 0;
    int closeCount_ = 0;
    int pingCount_ = 0;
    QList<QString> writtenText_;
    QList<QByteArray> writtenBinary_;
};

} // namespace ssap
