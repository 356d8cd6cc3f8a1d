#include <slink/Protocol/PayloadDecoder.hpp>
#include <QJsonDocument>
#include <QJsonParseError>
#include <zlib.h>

namespace slink {

namespace {
constexpr int kGzipWindowBits = 15 + 16;  // 32K window, gzip wrapper
constexpr int kChunkSize = 16384;
}

DecodeResult PayloadDecoder::decodeText(const QString& text)
{
    return parseJson(text.toUtf8());
}

DecodeResult PayloadDecoder::decodeBinary(const QByteArray& data)
{
    if (!isGzip(data))
        return parseJson(data);

    QByteArray inflated;
    if (!gunzip(data, inflated)) {
        DecodeResult result;
        result.error = QStringLiteral("gzip decompression failed (%1 bytes)").arg(data.size());
        return result;
    }
    return parseJson(inflated);
}

bool PayloadDecoder::isGzip(const QByteArray& data)
{
    return data.size() >= 2
        && static_cast<unsigned char>(data[0]) == 0x1F
        && static_cast<unsigned char>(data[1]) == 0x8B;
}

bool PayloadDecoder::gunzip(const QByteArray& data, QByteArray& out)
{
    z_stream stream{};
    if (inflateInit2(&stream, kGzipWindowBits) != Z_OK)
        return false;

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.constData()));
    stream.avail_in = static_cast<uInt>(data.size());

    QByteArray result;
    char buffer[kChunkSize];
    int rc = Z_OK;
    do {
        stream.next_out = reinterpret_cast<Bytef*>(buffer);
        stream.avail_out = kChunkSize;
        rc = inflate(&stream, Z_NO_FLUSH);
        // Z_BUF_ERROR here means the input ran out mid-stream
        if (rc != Z_OK && rc != Z_STREAM_END) {
            inflateEnd(&stream);
            return false;
        }
        result.append(buffer, kChunkSize - static_cast<int>(stream.avail_out));
    } while (rc != Z_STREAM_END);

    inflateEnd(&stream);
    out = result;
    return true;
}

QByteArray PayloadDecoder::gzip(const QByteArray& data)
{
    z_stream stream{};
    if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                     kGzipWindowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK)
        return {};

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.constData()));
    stream.avail_in = static_cast<uInt>(data.size());

    QByteArray result;
    char buffer[kChunkSize];
    int rc = Z_OK;
    do {
        stream.next_out = reinterpret_cast<Bytef*>(buffer);
        stream.avail_out = kChunkSize;
        rc = deflate(&stream, Z_FINISH);
        result.append(buffer, kChunkSize - static_cast<int>(stream.avail_out));
    } while (rc == Z_OK);

    deflateEnd(&stream);
    return rc == Z_STREAM_END ? result : QByteArray();
}

DecodeResult PayloadDecoder::parseJson(const QByteArray& utf8)
{
    DecodeResult result;
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(utf8, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        result.error = QStringLiteral("malformed JSON: %1").arg(parseError.errorString());
        return result;
    }
    if (!doc.isObject()) {
        result.error = QStringLiteral("payload is not a JSON object");
        return result;
    }
    result.ok = true;
    result.message = doc.object();
    return result;
}

} // namespace slink
