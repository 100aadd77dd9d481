#include <ssap/Session/ICredentialStore.hpp>

namespace ssap {

QString MemoryCredentialStore::value(const QString& key) const
{
    auto it = values_.constFind(key);
    if (it == values_.constEnd()) return {};
    return it.value();
}

bool MemoryCredentialStore::contains(const QString& key) const
{
    return values_.contains(key);
}

void MemoryCredentialStore::setValue(const QString& key, const QString& value)
{
    values_[key] = value;
}

void MemoryCredentialStore::remove(const QString& key)
{
    values_.remove(key);
}

} // namespace ssap
