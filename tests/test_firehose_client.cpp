#include <gtest/gtest.h>

#include "fake_firehose_device.h"
#include "fake_transport.h"
#include "qualcomm/protocol/firehose_client.h"

using namespace edlkit;
using namespace edlkit::test;

namespace {

SessionParams emmcParams(qint64 toTarget = 1048576, qint64 fromTarget = 1048576)
{
    SessionParams params;
    params.memoryName = QStringLiteral("emmc");
    params.maxPayloadToTarget = toTarget;
    params.maxPayloadFromTarget = fromTarget;
    return params;
}

QByteArray pattern(int size, int seed)
{
    QByteArray out(size, '\0');
    for (int i = 0; i < size; i++)
        out[i] = static_cast<char>((i * 31 + seed) & 0xFF);
    return out;
}

} // namespace

// ─── Configure ───────────────────────────────────────────────────────

TEST(FirehoseClientTest, ConfigureAdoptsDeviceLimits)
{
    FakeTransport transport;
    FakeFirehoseDevice device(transport);
    device.setMaxPayloadToTarget(65536);
    device.setMaxPayloadFromTarget(32768);

    FirehoseClient client(&transport);
    const FirehoseResult result = client.configure(emmcParams());
    ASSERT_TRUE(result.success) << result.error.toString().toStdString();
    EXPECT_EQ(result.attempts, 1);

    const SessionContext& session = client.session();
    EXPECT_TRUE(session.isNegotiated());
    EXPECT_EQ(session.memoryName(), QStringLiteral("emmc"));
    EXPECT_EQ(session.maxPayloadToTarget(), 65536);
    EXPECT_EQ(session.maxPayloadFromTarget(), 32768);
    EXPECT_EQ(session.sectorSize(), 512u);

    ASSERT_EQ(device.commands().size(), 1);
    EXPECT_EQ(device.commands()[0].verb, QStringLiteral("configure"));
    EXPECT_EQ(device.commands()[0].attr("MemoryName"), QStringLiteral("emmc"));
    EXPECT_EQ(device.commands()[0].attr("MaxPayloadSizeToTargetInBytes"), QStringLiteral("1048576"));
}

TEST(FirehoseClientTest, ConfigureAcceptsCounterOffer)
{
    FakeTransport transport;
    FakeFirehoseDevice device(transport);
    device.setCounterOffer(131072);

    FirehoseClient client(&transport);
    const FirehoseResult result = client.configure(emmcParams());
    ASSERT_TRUE(result.success) << result.error.toString().toStdString();
    EXPECT_EQ(result.attempts, 1);
    EXPECT_EQ(device.countVerb("configure"), 2);
    EXPECT_EQ(device.commands()[1].attr("MaxPayloadSizeToTargetInBytes"), QStringLiteral("131072"));
    EXPECT_EQ(client.session().maxPayloadToTarget(), 131072);
}

TEST(FirehoseClientTest, ConfigureRejectsUnknownMemoryWithoutSectorSize)
{
    FakeTransport transport;
    FirehoseClient client(&transport);

    SessionParams params;
    params.memoryName = QStringLiteral("sdcc");
    const FirehoseResult result = client.configure(params);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, EdlErrorKind::UsageError);
    EXPECT_TRUE(transport.writes().isEmpty());
    EXPECT_FALSE(client.session().isNegotiated());
}

TEST(FirehoseClientTest, UnadvertisedVerbIsRefusedBeforeSending)
{
    FakeTransport transport;
    FakeFirehoseDevice device(transport);
    device.setSupportedFunctions({ "configure", "program", "read", "nop" });

    FirehoseClient client(&transport);
    ASSERT_TRUE(client.configure(emmcParams()).success);
    EXPECT_TRUE(client.session().supportedFunctions().contains("read"));

    const int writesBefore = transport.writes().size();
    const FirehoseResult result = client.execute(FirehoseCommand::erase(512, 0, 8, 0));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, EdlErrorKind::UnsupportedFeature);
    EXPECT_EQ(transport.writes().size(), writesBefore);

    EXPECT_TRUE(client.execute(FirehoseCommand::nop()).success);
}

TEST(FirehoseClientTest, ParsesSupportedFunctionList)
{
    const QStringList lines = {
        "INFO: Binary build date: Jan 1 2024",
        "INFO: Supported Functions: program read",
        "INFO: nop",
        "erase",
        "End of supported functions 4",
        "INFO: storage ready",
    };
    const QStringList functions = FirehoseClient::parseSupportedFunctions(lines);
    EXPECT_TRUE(functions.contains("program"));
    EXPECT_EQ(functions, (QStringList{ "program", "read", "nop", "erase" }));
}

// ─── Retry behaviour ─────────────────────────────────────────────────

TEST(FirehoseClientTest, RetryableNakIsResentIdentically)
{
    FakeTransport transport;
    FakeFirehoseDevice device(transport);
    device.setNakRule([](const FakeFirehoseCommand& cmd) {
        return cmd.verb == "erase" ? QStringLiteral("Failed to erase sectors") : QString();
    });

    FirehoseClient client(&transport);
    const FirehoseResult result = client.execute(FirehoseCommand::erase(512, 100, 8, 1));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, EdlErrorKind::DeviceRejected);
    EXPECT_TRUE(result.error.message.contains("Failed to erase sectors"));
    EXPECT_EQ(result.attempts, 4);

    ASSERT_EQ(device.countVerb("erase"), 4);
    for (const FakeFirehoseCommand& cmd : device.commands())
        EXPECT_EQ(cmd.attributes, device.commands().first().attributes);
    for (const QByteArray& sent : transport.writes())
        EXPECT_EQ(sent, transport.writes().first());
}

TEST(FirehoseClientTest, FatalNakIsNotRetried)
{
    FakeTransport transport;
    FakeFirehoseDevice device(transport);
    device.setNakRule([](const FakeFirehoseCommand&) {
        return QStringLiteral("ERROR: Command not supported");
    });

    FirehoseClient client(&transport);
    const FirehoseResult result = client.execute(FirehoseCommand::setBootableStorageDrive(1));
    EXPECT_EQ(result.error.kind, EdlErrorKind::DeviceRejected);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_EQ(device.commands().size(), 1);
}

TEST(FirehoseClientTest, NakReasonAttributeWins)
{
    FakeTransport transport;
    transport.pushIncoming(FakeFirehoseDevice::logXml("INFO: something else"));
    transport.pushIncoming(FakeFirehoseDevice::responseXml(false, { { "reason", "not allowed here" } }));

    FirehoseClient client(&transport);
    const FirehoseResult result = client.execute(FirehoseCommand::nop());
    EXPECT_EQ(result.error.kind, EdlErrorKind::DeviceRejected);
    EXPECT_EQ(result.error.message, QStringLiteral("nop NAK: not allowed here"));
    EXPECT_EQ(result.attempts, 1);
}

TEST(FirehoseClientTest, TransientNakRecovers)
{
    FakeTransport transport;
    FakeFirehoseDevice device(transport);
    int naks = 2;
    device.setNakRule([&naks](const FakeFirehoseCommand&) {
        return naks-- > 0 ? QStringLiteral("Device busy") : QString();
    });

    FirehoseClient client(&transport);
    const FirehoseResult result = client.execute(FirehoseCommand::nop());
    ASSERT_TRUE(result.success) << result.error.toString().toStdString();
    EXPECT_EQ(result.attempts, 3);
}

TEST(FirehoseClientTest, SilentDeviceEscalatesToRejected)
{
    FakeTransport transport;
    FakeFirehoseDevice device(transport);
    device.setSilenceRule([](const FakeFirehoseCommand&) { return true; });

    FirehoseClient client(&transport);
    client.setTimeouts(5, 5);
    const FirehoseResult result = client.execute(FirehoseCommand::nop());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, EdlErrorKind::DeviceRejected);
    EXPECT_TRUE(result.error.message.contains("no response after 4 attempts"));
    EXPECT_EQ(result.attempts, 4);
    EXPECT_EQ(device.countVerb("nop"), 4);
}

TEST(FirehoseClientTest, CustomRetryLimit)
{
    FakeTransport transport;
    FakeFirehoseDevice device(transport);
    device.setNakRule([](const FakeFirehoseCommand&) { return QStringLiteral("busy"); });

    FirehoseClient client(&transport);
    client.setRetryPolicy(RetryPolicy(0));
    EXPECT_EQ(client.execute(FirehoseCommand::nop()).attempts, 1);
    EXPECT_EQ(device.commands().size(), 1);
}

TEST(FirehoseClientTest, WriteFailureIsTransportError)
{
    FakeTransport transport;
    FakeFirehoseDevice device(transport);
    transport.failWritesAfter(0);

    FirehoseClient client(&transport);
    const FirehoseResult result = client.execute(FirehoseCommand::nop());
    EXPECT_EQ(result.error.kind, EdlErrorKind::TransportError);
    EXPECT_EQ(result.attempts, 1);
}

TEST(FirehoseClientTest, ClosedChannelIsTransportError)
{
    FakeTransport transport;
    transport.disconnectPeer();

    FirehoseClient client(&transport);
    const FirehoseResult result = client.execute(FirehoseCommand::nop());
    EXPECT_EQ(result.error.kind, EdlErrorKind::TransportError);
    EXPECT_EQ(result.attempts, 1);
}

TEST(FirehoseClientTest, MalformedResponseIsProtocolViolation)
{
    FakeTransport transport;
    transport.pushIncoming("this is not xml");

    FirehoseClient client(&transport);
    const FirehoseResult result = client.execute(FirehoseCommand::nop());
    EXPECT_EQ(result.error.kind, EdlErrorKind::ProtocolViolation);
    EXPECT_EQ(result.attempts, 1);
}

TEST(FirehoseClientTest, UnknownResponseValueIsProtocolViolation)
{
    FakeTransport transport;
    transport.pushIncoming("<?xml version=\"1.0\" ?><data><response value=\"MAYBE\"/></data>");

    FirehoseClient client(&transport);
    EXPECT_EQ(client.execute(FirehoseCommand::nop()).error.kind, EdlErrorKind::ProtocolViolation);
}

// ─── Data phases ─────────────────────────────────────────────────────

TEST(FirehoseClientTest, ProgramThenReadBack)
{
    FakeTransport transport;
    FakeFirehoseDevice device(transport);
    device.setMaxPayloadToTarget(1024);

    FirehoseClient client(&transport);
    ASSERT_TRUE(client.configure(emmcParams()).success);

    qint64 lastDone = 0;
    qint64 lastTotal = 0;
    QObject::connect(&client, &FirehoseClient::transferProgress, [&](qint64 done, qint64 total) {
        lastDone = done;
        lastTotal = total;
    });

    const QByteArray payload = pattern(1500, 7);
    const int writesBefore = transport.writes().size();
    const FirehoseResult written = client.program(FirehoseCommand::program(512, 10, 4, 0), payload);
    ASSERT_TRUE(written.success) << written.error.toString().toStdString();

    // XML, then the padded payload in two 1024-byte transfers
    ASSERT_EQ(transport.writes().size(), writesBefore + 3);
    EXPECT_EQ(transport.writes()[writesBefore + 1].size(), 1024);
    EXPECT_EQ(transport.writes()[writesBefore + 2].size(), 1024);
    EXPECT_EQ(lastDone, 2048);
    EXPECT_EQ(lastTotal, 2048);

    const QByteArray expected = payload + QByteArray(548, '\0');
    EXPECT_EQ(device.sectorData(0, 10, 4), expected);

    const FirehoseResult readBack = client.read(FirehoseCommand::read(512, 10, 4, 0));
    ASSERT_TRUE(readBack.success) << readBack.error.toString().toStdString();
    EXPECT_EQ(readBack.data, expected);
}

TEST(FirehoseClientTest, ReadSurvivesFragmentedTransport)
{
    FakeTransport transport;
    FakeFirehoseDevice device(transport);
    const QByteArray disk = pattern(2048, 3);
    device.setSectorData(2, 0, disk);
    transport.setMaxReadChunk(7);

    FirehoseClient client(&transport);
    const FirehoseResult result = client.read(FirehoseCommand::read(512, 1, 2, 2));
    ASSERT_TRUE(result.success) << result.error.toString().toStdString();
    EXPECT_EQ(result.data, disk.mid(512, 1024));
    EXPECT_EQ(transport.pendingIncoming(), 0);
}

TEST(FirehoseClientTest, RetryAfterTimeoutDropsLateReply)
{
    FakeTransport transport;
    FakeFirehoseDevice device(transport);
    const QByteArray disk = pattern(1024, 11);
    device.setSectorData(0, 0, disk);

    FirehoseClient client(&transport);
    client.setTimeouts(5, 5);

    // The first reply is queued but the host gives up on it
    transport.injectReadTimeouts(1);
    const FirehoseResult first = client.read(FirehoseCommand::read(512, 0, 1, 0));
    ASSERT_TRUE(first.success) << first.error.toString().toStdString();
    EXPECT_EQ(first.attempts, 2);
    EXPECT_EQ(first.data, disk.left(512));
    EXPECT_EQ(device.countVerb("read"), 2);
    EXPECT_EQ(transport.pendingIncoming(), 0);

    const FirehoseResult second = client.read(FirehoseCommand::read(512, 1, 1, 0));
    ASSERT_TRUE(second.success) << second.error.toString().toStdString();
    EXPECT_EQ(second.attempts, 1);
    EXPECT_EQ(second.data, disk.mid(512, 512));
}

TEST(FirehoseClientTest, ReadStallIsTransportError)
{
    FakeTransport transport;
    transport.pushIncoming(FakeFirehoseDevice::responseXml(true, { { "rawmode", "true" } }));
    transport.pushIncoming(QByteArray(100, 'x'));

    FirehoseClient client(&transport);
    const FirehoseResult result = client.read(FirehoseCommand::read(512, 0, 1, 0));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, EdlErrorKind::TransportError);
    EXPECT_TRUE(result.data.isEmpty());
    EXPECT_EQ(result.attempts, 1);
}

TEST(FirehoseClientTest, OversizedPayloadIsRefused)
{
    FakeTransport transport;
    FirehoseClient client(&transport);
    const FirehoseResult result =
        client.program(FirehoseCommand::program(512, 0, 1, 0), QByteArray(513, 'a'));
    EXPECT_EQ(result.error.kind, EdlErrorKind::UsageError);
    EXPECT_TRUE(transport.writes().isEmpty());
}

TEST(FirehoseClientTest, DataVerbsNeedTheirOwnCall)
{
    FakeTransport transport;
    FirehoseClient client(&transport);
    EXPECT_EQ(client.execute(FirehoseCommand::read(512, 0, 1, 0)).error.kind,
              EdlErrorKind::UsageError);
    EXPECT_EQ(client.execute(FirehoseCommand()).error.kind, EdlErrorKind::UsageError);
    EXPECT_TRUE(transport.writes().isEmpty());
}

// ─── Peek, logs, raw XML ─────────────────────────────────────────────

TEST(FirehoseClientTest, PeekDecodesLogBytes)
{
    FakeTransport transport;
    FakeFirehoseDevice device(transport);
    const QByteArray bytes = QByteArray::fromHex("0011223344556677889900aa");
    device.setMemory(0x80000, bytes);

    FirehoseClient client(&transport);
    const FirehoseResult result = client.peek(0x80000, 12);
    ASSERT_TRUE(result.success) << result.error.toString().toStdString();
    EXPECT_EQ(result.data, bytes);
    EXPECT_EQ(device.commands()[0].attr("address64"), QStringLiteral("0x80000"));
}

TEST(FirehoseClientTest, ShortPeekIsRejected)
{
    FakeTransport transport;
    transport.pushIncoming(FakeFirehoseDevice::logXml("0x01 0x02"));
    transport.pushIncoming(FakeFirehoseDevice::responseXml(true));

    FirehoseClient client(&transport);
    const FirehoseResult result = client.peek(0, 4);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, EdlErrorKind::DeviceRejected);
    EXPECT_TRUE(result.data.isEmpty());
}

TEST(FirehoseClientTest, PeekLineDecoding)
{
    const QByteArray out = FirehoseClient::decodePeekLines({
        "0x01 0x02 AB",
        "INFO: peek at 0x1000",
        "ff 0x1",
        "",
    });
    EXPECT_EQ(out, QByteArray::fromHex("0102ab"));
}

TEST(FirehoseClientTest, DeviceLogsAreForwarded)
{
    FakeTransport transport;
    FakeFirehoseDevice device(transport);
    device.setChatter({ "INFO: first", "INFO: second" });

    FirehoseClient client(&transport);
    QStringList seen;
    QObject::connect(&client, &FirehoseClient::deviceLog,
                     [&seen](const QString& line) { seen << line; });

    const FirehoseResult result = client.execute(FirehoseCommand::nop());
    ASSERT_TRUE(result.success);
    EXPECT_EQ(seen, (QStringList{ "INFO: first", "INFO: second" }));
    EXPECT_EQ(result.response.logLines, seen);
}

TEST(FirehoseClientTest, BytesHandedOverFromSaharaAreParsedFirst)
{
    FakeTransport transport;
    FakeFirehoseDevice device(transport);

    FirehoseClient client(&transport);
    client.pushReceived(FakeFirehoseDevice::logXml("INFO: loader started"));
    const FirehoseResult result = client.execute(FirehoseCommand::nop());
    ASSERT_TRUE(result.success);
    ASSERT_FALSE(result.response.logLines.isEmpty());
    EXPECT_EQ(result.response.logLines.first(), QStringLiteral("INFO: loader started"));
}

TEST(FirehoseClientTest, RawXmlIsSentVerbatim)
{
    FakeTransport transport;
    FakeFirehoseDevice device(transport);

    FirehoseClient client(&transport);
    const QString xml = QStringLiteral("<?xml version=\"1.0\" ?><data><benchmark trials=\"2\"/></data>");
    const FirehoseResult result = client.sendRawXml(xml);
    ASSERT_TRUE(result.success);
    ASSERT_EQ(transport.writes().size(), 1);
    EXPECT_EQ(transport.writes()[0], xml.toUtf8());
    EXPECT_EQ(device.commands()[0].verb, QStringLiteral("benchmark"));
}

TEST(FirehoseClientTest, MalformedRawXmlIsUsageError)
{
    FakeTransport transport;
    FirehoseClient client(&transport);
    const FirehoseResult result = client.sendRawXml("<data><nop></data>");
    EXPECT_EQ(result.error.kind, EdlErrorKind::UsageError);
    EXPECT_TRUE(transport.writes().isEmpty());
}
