#pragma once
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcKv)
Q_DECLARE_LOGGING_CATEGORY(lcSecret)
Q_DECLARE_LOGGING_CATEGORY(lcShare)
Q_DECLARE_LOGGING_CATEGORY(lcHttp)
Q_DECLARE_LOGGING_CATEGORY(lcRelay)
Q_DECLARE_LOGGING_CATEGORY(lcCrypto)
Q_DECLARE_LOGGING_CATEGORY(lcLink)
Q_DECLARE_LOGGING_CATEGORY(lcSync)
