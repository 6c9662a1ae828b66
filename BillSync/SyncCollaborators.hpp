#pragma once
#include <QJsonObject>
#include <QString>
#include <functional>

// Local durable storage that a sync reads from and overwrites.
class SyncDataStore {
public:
    virtual ~SyncDataStore() = default;

    virtual QJsonObject exportAllData() = 0;

    // Replaces everything or nothing. false (with *error set) leaves the
    // existing data untouched.
    virtual bool importAllData(const QJsonObject& snapshot, QString* error) = 0;
};

// Asks the user to approve an overwrite. Exactly one of the callbacks is
// invoked, possibly later from the event loop.
class ConfirmationPrompt {
public:
    virtual ~ConfirmationPrompt() = default;

    virtual void ask(const QString& title, const QString& body,
                     std::function<void()> onConfirm, std::function<void()> onCancel) = 0;
};
