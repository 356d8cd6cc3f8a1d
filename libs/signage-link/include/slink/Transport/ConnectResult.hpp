#pragma once

#include <QMetaType>

namespace slink {

enum class ConnectResult {
    Ok,
    Refused,
    Timeout,
    Unreachable,
    TlsError
};

inline const char* toString(ConnectResult result)
{
    switch (result) {
    case ConnectResult::Ok:          return "Ok";
    case ConnectResult::Refused:     return "Refused";
    case ConnectResult::Timeout:     return "Timeout";
    case ConnectResult::Unreachable: return "Unreachable";
    case ConnectResult::TlsError:    return "TLSError";
    }
    return "Unknown";
}

} // namespace slink

Q_DECLARE_METATYPE(slink::ConnectResult)
