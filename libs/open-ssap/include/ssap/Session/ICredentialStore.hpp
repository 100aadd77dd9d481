#pragma once

#include <QHash>
#include <QString>

namespace ssap {

/// Key-value store for the pairing credential ("client-key").
/// One value per key; the session reads it at connect and writes it on
/// registration.
class ICredentialStore {
public:
    virtual ~ICredentialStore() = default;

    /// Null QString when the key is absent.
    virtual QString value(const QString& key) const = 0;
    virtual bool contains(const QString& key) const = 0;
    virtual void setValue(const QString& key, const QString& value) = 0;
    virtual void remove(const QString& key) = 0;
};

/// Non-persistent store; used when no file is configured and in tests.
class MemoryCredentialStore : public ICredentialStore {
public:
    QString value(const QString& key) const override;
    bool contains(const QString& key) const override;
    void setValue(const QString& key, const QString& value) override;
    void remove(const QString& key) override;

private:
    QHash<QString, QString> values_;
};

} // namespace ssap
