#include "YamlCredentialStore.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>
#include <QSaveFile>
#include <QStringList>
#include <boost/log/trivial.hpp>
#include <yaml-cpp/yaml.h>

namespace tvr {

YamlCredentialStore::YamlCredentialStore(const QString& filePath)
    : filePath_(filePath)
{
    load();
}

void YamlCredentialStore::load()
{
    if (!QFile::exists(filePath_))
        return;

    try {
        YAML::Node root = YAML::LoadFile(filePath_.toStdString());
        if (!root.IsMap()) {
            BOOST_LOG_TRIVIAL(warning) << "YamlCredentialStore: " << filePath_.toStdString()
                                       << " is not a map, ignoring";
            return;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            if (!it->second.IsScalar()) continue;
            values_.insert(QString::fromStdString(it->first.as<std::string>()),
                           QString::fromStdString(it->second.as<std::string>()));
        }
    } catch (const YAML::Exception& e) {
        BOOST_LOG_TRIVIAL(warning) << "YamlCredentialStore: failed to read "
                                   << filePath_.toStdString() << ": " << e.what();
    }
}

bool YamlCredentialStore::persist()
{
    const QFileInfo info(filePath_);
    if (!QDir().mkpath(info.absolutePath())) {
        BOOST_LOG_TRIVIAL(error) << "YamlCredentialStore: cannot create "
                                 << info.absolutePath().toStdString();
        return false;
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    QStringList keys = values_.keys();
    keys.sort();
    for (const auto& key : keys)
        out << YAML::Key << key.toStdString() << YAML::Value << values_.value(key).toStdString();
    out << YAML::EndMap;

    QSaveFile file(filePath_);
    if (!file.open(QIODevice::WriteOnly)) {
        BOOST_LOG_TRIVIAL(error) << "YamlCredentialStore: cannot write "
                                 << filePath_.toStdString() << ": "
                                 << file.errorString().toStdString();
        return false;
    }
    file.write(out.c_str(), static_cast<qint64>(out.size()));
    file.write("\n");
    if (!file.commit()) {
        BOOST_LOG_TRIVIAL(error) << "YamlCredentialStore: commit failed for "
                                 << filePath_.toStdString() << ": "
                                 << file.errorString().toStdString();
        return false;
    }
    QFile::setPermissions(filePath_, QFileDevice::ReadOwner | QFileDevice::WriteOwner);
    return true;
}

QString YamlCredentialStore::value(const QString& key) const
{
    QMutexLocker lock(&mutex_);
    return values_.value(key);
}

bool YamlCredentialStore::contains(const QString& key) const
{
    QMutexLocker lock(&mutex_);
    return values_.contains(key);
}

void YamlCredentialStore::setValue(const QString& key, const QString& value)
{
    QMutexLocker lock(&mutex_);
    values_.insert(key, value);
    lastWriteOk_ = persist();
}

void YamlCredentialStore::remove(const QString& key)
{
    QMutexLocker lock(&mutex_);
    if (!values_.remove(key))
        return;
    lastWriteOk_ = persist();
}

QString YamlCredentialStore::filePath() const
{
    return filePath_;
}

bool YamlCredentialStore::lastWriteSucceeded() const
{
    QMutexLocker lock(&mutex_);
    return lastWriteOk_;
}

} // namespace tvr
