#include <QTest>
#include "proxy/stream_framer.h"

class TestStreamFramer : public QObject {
    Q_OBJECT

private slots:
    void testDetectMode() {
        QCOMPARE(StreamFramer::detectMode("text/event-stream; charset=utf-8", false), BodyMode::StreamEvents);
        QCOMPARE(StreamFramer::detectMode("application/x-ndjson", false), BodyMode::StreamLines);
        QCOMPARE(StreamFramer::detectMode("application/json", false), BodyMode::StreamRaw);
        QCOMPARE(StreamFramer::detectMode("application/json", true), BodyMode::Buffered);
        QCOMPARE(StreamFramer::detectMode("Text/Event-Stream", true), BodyMode::StreamEvents);
    }

    void testSseEventsSplitAcrossReads() {
        StreamFramer framer(BodyMode::StreamEvents);
        QList<QByteArray> units;
        units += framer.feed("data: {\"a\":1}\n");
        QVERIFY(units.isEmpty());
        units += framer.feed("\ndata: {\"a\":2}\n\nda");
        units += framer.feed("ta: [DONE]\n\n");

        QCOMPARE(units.size(), 3);
        QCOMPARE(units[0], QByteArray("data: {\"a\":1}\n\n"));
        QCOMPARE(units[1], QByteArray("data: {\"a\":2}\n\n"));
        QCOMPARE(units[2], QByteArray("data: [DONE]\n\n"));
        QVERIFY(!framer.hasPending());
    }

    void testSseCrlfDelimiter() {
        StreamFramer framer(BodyMode::StreamEvents);
        const QList<QByteArray> units = framer.feed("event: x\r\ndata: 1\r\n\r\ndata: 2\r\n\r\n");
        QCOMPARE(units.size(), 2);
        QCOMPARE(units[0], QByteArray("event: x\r\ndata: 1\r\n\r\n"));
    }

    void testNdjsonLines() {
        StreamFramer framer(BodyMode::StreamLines);
        QList<QByteArray> units = framer.feed("{\"done\":false}\n{\"done\":");
        QCOMPARE(units.size(), 1);
        QVERIFY(framer.hasPending());
        units += framer.feed("true}\n");
        QCOMPARE(units.size(), 2);
        QCOMPARE(units[1], QByteArray("{\"done\":true}\n"));
    }

    void testRawPassesReadsThrough() {
        StreamFramer framer(BodyMode::StreamRaw);
        QCOMPARE(framer.feed("abc"), QList<QByteArray>{QByteArray("abc")});
        QVERIFY(framer.feed(QByteArray()).isEmpty());
        QVERIFY(!framer.hasPending());
    }

    void testFlushReturnsUnterminatedTail() {
        StreamFramer framer(BodyMode::StreamLines);
        QVERIFY(framer.feed("{\"partial\":true}").isEmpty());
        QCOMPARE(framer.flush(), QByteArray("{\"partial\":true}"));
        QVERIFY(!framer.hasPending());
        QVERIFY(framer.flush().isEmpty());
    }

    void testUnitsReproduceInputExactly() {
        const QByteArray input("data: one\n\n: comment\r\n\r\ndata: two\ndata: three\n\ndata: tail");
        StreamFramer framer(BodyMode::StreamEvents);

        QByteArray output;
        for (int i = 0; i < input.size(); i += 7) {
            for (const QByteArray& unit : framer.feed(input.mid(i, 7)))
                output += unit;
        }
        output += framer.flush();
        QCOMPARE(output, input);
    }
};

QTEST_MAIN(TestStreamFramer)
#include "tst_stream_framer.moc"
