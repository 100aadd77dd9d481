#pragma once

#include <QHash>
#include <QMutex>
#include <QString>
#include <ssap/Session/ICredentialStore.hpp>

namespace tvr {

/// ICredentialStore persisted as a flat YAML map. The file is rewritten
/// atomically on every change and kept readable by the owner only.
/// Thread-safe.
class YamlCredentialStore : public ssap::ICredentialStore {
public:
    explicit YamlCredentialStore(const QString& filePath);

    QString value(const QString& key) const override;
    bool contains(const QString& key) const override;
    void setValue(const QString& key, const QString& value) override;
    void remove(const QString& key) override;

    QString filePath() const;

    /// False if the last write failed; the in-memory value is still updated.
    bool lastWriteSucceeded() const;

private:
    void load();
    bool persist();

    QString filePath_;
    mutable QMutex mutex_;
    QHash<QString, QString> values_;
    bool lastWriteOk_ = true;
};

} // namespace tvr
