#include "Logging.hpp"

Q_LOGGING_CATEGORY(lcKv, "billsync.kv")
Q_LOGGING_CATEGORY(lcSecret, "billsync.secret")
Q_LOGGING_CATEGORY(lcShare, "billsync.share")
Q_LOGGING_CATEGORY(lcHttp, "billsync.http")
Q_LOGGING_CATEGORY(lcRelay, "billsync.relay")
Q_LOGGING_CATEGORY(lcCrypto, "billsync.crypto")
Q_LOGGING_CATEGORY(lcLink, "billsync.link")
Q_LOGGING_CATEGORY(lcSync, "billsync.sync")
