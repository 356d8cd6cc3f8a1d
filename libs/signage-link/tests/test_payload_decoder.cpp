#include <QtTest/QtTest>
#include <slink/Protocol/PayloadDecoder.hpp>
#include <slink/Protocol/Messages.hpp>

class TestPayloadDecoder : public QObject {
    Q_OBJECT
private slots:
    void testPlainText()
    {
        auto result = slink::PayloadDecoder::decodeText("{\"Type\":\"COMMAND\",\"Command\":\"SCREEN_ON\"}");
        QVERIFY(result.ok);
        QCOMPARE(result.message.value("Command").toString(), QString("SCREEN_ON"));
    }

    void testMalformedText()
    {
        auto result = slink::PayloadDecoder::decodeText("{\"Type\": \"COMM");
        QVERIFY(!result.ok);
        QVERIFY(result.error.contains("malformed"));
    }

    void testNonObjectRejected()
    {
        auto result = slink::PayloadDecoder::decodeText("[1, 2, 3]");
        QVERIFY(!result.ok);
    }

    void testGzipBinary()
    {
        const QByteArray json = "{\"Type\":\"DISPLAY_UPDATE\",\"Layout\":{\"Id\":\"lobby\"}}";
        const QByteArray compressed = slink::PayloadDecoder::gzip(json);
        QVERIFY(slink::PayloadDecoder::isGzip(compressed));

        auto result = slink::PayloadDecoder::decodeBinary(compressed);
        QVERIFY(result.ok);
        QCOMPARE(slink::messages::typeOf(result.message), QString("DISPLAY_UPDATE"));
        QCOMPARE(result.message.value("Layout").toObject().value("Id").toString(), QString("lobby"));
    }

    void testRawBinaryIsUtf8()
    {
        auto result = slink::PayloadDecoder::decodeBinary("{\"Type\":\"HEARTBEAT\"}");
        QVERIFY(result.ok);
        QCOMPARE(slink::messages::typeOf(result.message), QString("HEARTBEAT"));
    }

    void testCorruptGzip()
    {
        QByteArray corrupt("\x1f\x8b\x08\x00garbage-after-header", 24);
        auto result = slink::PayloadDecoder::decodeBinary(corrupt);
        QVERIFY(!result.ok);
        QVERIFY(result.error.contains("gzip"));
    }

    void testTruncatedGzip()
    {
        QByteArray compressed = slink::PayloadDecoder::gzip(QByteArray(4096, 'x'));
        compressed.chop(compressed.size() / 2);
        QByteArray out;
        QVERIFY(!slink::PayloadDecoder::gunzip(compressed, out));
        QVERIFY(out.isEmpty());
    }
};

QTEST_MAIN(TestPayloadDecoder)
#include "test_payload_decoder.moc"
