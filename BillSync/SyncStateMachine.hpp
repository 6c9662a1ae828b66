#pragma once
#include <QObject>

// Lifecycle of one device-sync transfer. Every change goes through fire(),
// which looks the (state, event) pair up in a fixed transition table.
class SyncStateMachine : public QObject {
    Q_OBJECT
public:
    enum class State {
        Idle,
        Connecting,
        Waiting,     // sender: code issued, no receiver yet
        Connected,
        Sending,
        Receiving,
        Confirming,  // receiver: payload decrypted, waiting for the user
        Complete,
        Error
    };
    Q_ENUM(State)

    enum class Event {
        StartSending,
        StartReceiving,
        CodeIssued,
        PeerJoined,
        PayloadSent,
        KeyReceived,
        PayloadDecrypted,
        ImportApplied,
        PeerCompleted,
        Declined,
        PeerCancelled,
        Cancel,
        Failure,
        Reset
    };
    Q_ENUM(Event)

    explicit SyncStateMachine(QObject* parent = nullptr);

    State state() const { return m_state; }
    bool isBusy() const;
    bool isTerminal() const { return m_state == State::Complete || m_state == State::Error; }

    bool canFire(Event event) const;

    // Returns false, leaving the state untouched, when the table has no
    // entry for (state(), event).
    bool fire(Event event);

    static QString stateName(State state);
    static QString eventName(Event event);

signals:
    void stateChanged(SyncStateMachine::State from, SyncStateMachine::State to);

private:
    bool lookup(State from, Event event, State* to) const;

    State m_state = State::Idle;
};
