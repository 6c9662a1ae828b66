#include "JsonFileDataStore.hpp"
#include "Logging.hpp"

#include <QFile>
#include <QJsonDocument>
#include <QSaveFile>

JsonFileDataStore::JsonFileDataStore(const QString& path)
    : m_path(path) {}

QJsonObject JsonFileDataStore::exportAllData() {
    QFile f(m_path);
    if (!f.exists()) return {};
    if (!f.open(QIODevice::ReadOnly)) {
        qCWarning(lcSync) << "cannot read" << m_path << ":" << f.errorString();
        return {};
    }
    QJsonParseError err{};
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        qCWarning(lcSync) << m_path << "is not a JSON object:" << err.errorString();
        return {};
    }
    return doc.object();
}

bool JsonFileDataStore::importAllData(const QJsonObject& snapshot, QString* error) {
    QSaveFile f(m_path);
    if (!f.open(QIODevice::WriteOnly)) {
        if (error) *error = f.errorString();
        return false;
    }
    const QByteArray bytes = QJsonDocument(snapshot).toJson(QJsonDocument::Indented);
    if (f.write(bytes) != bytes.size()) {
        if (error) *error = f.errorString();
        f.cancelWriting();
        return false;
    }
    if (!f.commit()) {
        if (error) *error = f.errorString();
        return false;
    }
    qCInfo(lcSync) << "imported dataset into" << m_path;
    return true;
}
