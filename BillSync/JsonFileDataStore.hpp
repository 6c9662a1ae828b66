#pragma once
#include "SyncCollaborators.hpp"

// Whole dataset as one JSON document on disk. Imports are written through
// QSaveFile so a failed write never leaves a half-replaced file.
class JsonFileDataStore : public SyncDataStore {
public:
    explicit JsonFileDataStore(const QString& path);

    QJsonObject exportAllData() override;
    bool importAllData(const QJsonObject& snapshot, QString* error) override;

    const QString& path() const { return m_path; }

private:
    QString m_path;
};
