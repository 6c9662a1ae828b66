#include "PairingRegistry.hpp"

SyncPairing* PairingRegistry::find(const QString& code) {
    auto it = m_pairings.find(code);
    return it == m_pairings.end() ? nullptr : &it.value();
}

bool PairingRegistry::create(const QString& code, RelayPeer* sender, qint64 nowMs) {
    if (m_pairings.contains(code) || m_codeByPeer.contains(sender)) return false;

    SyncPairing p;
    p.code = code;
    p.sender = sender;
    p.createdAtMs = nowMs;
    m_pairings.insert(code, p);
    m_codeByPeer.insert(sender, code);
    return true;
}

PairingRegistry::BindResult PairingRegistry::bindReceiver(const QString& code, RelayPeer* receiver) {
    auto it = m_pairings.find(code);
    if (it == m_pairings.end()) return BindResult::UnknownCode;
    if (it->receiver || it->completed) return BindResult::AlreadyPaired;

    it->receiver = receiver;
    m_codeByPeer.insert(receiver, code);
    return BindResult::Bound;
}

void PairingRegistry::remove(const QString& code) {
    auto it = m_pairings.find(code);
    if (it == m_pairings.end()) return;
    if (it->sender) m_codeByPeer.remove(it->sender);
    if (it->receiver) m_codeByPeer.remove(it->receiver);
    m_pairings.erase(it);
}
