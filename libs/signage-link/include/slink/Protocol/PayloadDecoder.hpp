#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QString>

namespace slink {

struct DecodeResult {
    bool ok = false;
    QJsonObject message;
    QString error;
};

/// Turns inbound frames into JSON objects. Binary frames that start with
/// the gzip magic (0x1F 0x8B) are inflated first; other binary frames are
/// taken as UTF-8 text.
class PayloadDecoder {
public:
    static DecodeResult decodeText(const QString& text);
    static DecodeResult decodeBinary(const QByteArray& data);

    static bool isGzip(const QByteArray& data);
    /// Returns false and leaves out untouched when the stream is corrupt.
    static bool gunzip(const QByteArray& data, QByteArray& out);
    static QByteArray gzip(const QByteArray& data);

private:
    static DecodeResult parseJson(const QByteArray& utf8);
};

} // namespace slink
