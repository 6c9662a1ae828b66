#include "SyncStateMachine.hpp"
#include "Logging.hpp"

#include <QMetaEnum>

namespace {

using State = SyncStateMachine::State;
using Event = SyncStateMachine::Event;

struct Transition {
    State from;
    Event event;
    State to;
};

// Failure is legal from every non-terminal state, Cancel from every state
// with a live channel.
const Transition kTransitions[] = {
    {State::Idle,       Event::StartSending,     State::Connecting},
    {State::Idle,       Event::StartReceiving,   State::Connecting},
    {State::Idle,       Event::Failure,          State::Error},

    {State::Connecting, Event::CodeIssued,       State::Waiting},
    {State::Connecting, Event::PeerJoined,       State::Connected},
    {State::Connecting, Event::Cancel,           State::Idle},
    {State::Connecting, Event::Failure,          State::Error},

    {State::Waiting,    Event::PeerJoined,       State::Connected},
    {State::Waiting,    Event::Cancel,           State::Idle},
    {State::Waiting,    Event::Failure,          State::Error},

    {State::Connected,  Event::PayloadSent,      State::Sending},
    {State::Connected,  Event::KeyReceived,      State::Receiving},
    {State::Connected,  Event::PeerCancelled,    State::Idle},
    {State::Connected,  Event::Cancel,           State::Idle},
    {State::Connected,  Event::Failure,          State::Error},

    {State::Sending,    Event::PeerCompleted,    State::Complete},
    {State::Sending,    Event::PeerCancelled,    State::Idle},
    {State::Sending,    Event::Cancel,           State::Idle},
    {State::Sending,    Event::Failure,          State::Error},

    {State::Receiving,  Event::PayloadDecrypted, State::Confirming},
    {State::Receiving,  Event::Cancel,           State::Idle},
    {State::Receiving,  Event::Failure,          State::Error},

    {State::Confirming, Event::ImportApplied,    State::Complete},
    {State::Confirming, Event::Declined,         State::Idle},
    {State::Confirming, Event::Cancel,           State::Idle},
    {State::Confirming, Event::Failure,          State::Error},

    {State::Complete,   Event::Reset,            State::Idle},
    {State::Error,      Event::Reset,            State::Idle},
};

} // namespace

SyncStateMachine::SyncStateMachine(QObject* parent)
    : QObject(parent) {}

bool SyncStateMachine::isBusy() const {
    return m_state != State::Idle && !isTerminal();
}

bool SyncStateMachine::lookup(State from, Event event, State* to) const {
    for (const Transition& t : kTransitions) {
        if (t.from == from && t.event == event) {
            *to = t.to;
            return true;
        }
    }
    return false;
}

bool SyncStateMachine::canFire(Event event) const {
    State ignored;
    return lookup(m_state, event, &ignored);
}

bool SyncStateMachine::fire(Event event) {
    State next;
    if (!lookup(m_state, event, &next)) {
        qCDebug(lcSync) << "ignoring" << eventName(event) << "in state" << stateName(m_state);
        return false;
    }
    const State prev = m_state;
    m_state = next;
    qCDebug(lcSync) << stateName(prev) << "->" << stateName(next) << "on" << eventName(event);
    emit stateChanged(prev, next);
    return true;
}

QString SyncStateMachine::stateName(State state) {
    return QString::fromLatin1(QMetaEnum::fromType<State>().valueToKey(int(state))).toLower();
}

QString SyncStateMachine::eventName(Event event) {
    return QString::fromLatin1(QMetaEnum::fromType<Event>().valueToKey(int(event)));
}
