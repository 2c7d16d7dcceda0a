#include <gtest/gtest.h>

#include "common/crc_utils.h"
#include "core/cancellation.h"
#include "fake_firehose_device.h"
#include "fake_sahara_device.h"
#include "fake_transport.h"
#include "gpt_image.h"
#include "qualcomm/services/qualcomm_service.h"

#include <QtEndian>
#include <memory>

using namespace edlkit;
using namespace edlkit::test;

namespace {

EdlConfig fastConfig()
{
    EdlConfig config;
    config.helloTimeoutMs = 10;
    config.packetTimeoutMs = 10;
    config.xmlTimeoutMs = 10;
    config.dataTimeoutMs = 10;
    return config;
}

QByteArray pattern(int size, int seed)
{
    QByteArray out(size, '\0');
    for (int i = 0; i < size; i++)
        out[i] = static_cast<char>((i * 13 + seed) & 0xFF);
    return out;
}

// A device whose loader is already running.
struct FirehoseBench {
    FakeTransport transport;
    FakeFirehoseDevice device;
    QualcommService service;

    explicit FirehoseBench(uint32_t sectorSize = 512, const EdlConfig& config = fastConfig())
        : device(transport, sectorSize)
        , service(&transport, config)
    {
        service.enterFirehose();
    }

    OperationResult configure(uint32_t sectorSize = 512)
    {
        SessionParams params;
        params.memoryName = QStringLiteral("emmc");
        params.sectorSize = sectorSize;
        return service.configure(params);
    }
};

} // namespace

// ─── Session sequencing ──────────────────────────────────────────────

TEST(QualcommServiceTest, DataOperationsNeedConfigure)
{
    FirehoseBench bench;
    const OperationResult result = bench.service.readSectors(0, 0, 1);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, EdlErrorKind::UsageError);
    EXPECT_TRUE(bench.transport.writes().isEmpty());

    EXPECT_EQ(bench.service.peek(0, 4).error.kind, EdlErrorKind::UsageError);
    EXPECT_EQ(bench.service.setBootableStorageDrive(1).error.kind, EdlErrorKind::UsageError);
    EXPECT_TRUE(bench.service.nop().success);
}

TEST(QualcommServiceTest, ConfigureOnlyOnce)
{
    FirehoseBench bench;
    ASSERT_TRUE(bench.configure().success);
    EXPECT_TRUE(bench.service.isConfigured());
    EXPECT_EQ(bench.service.session().sectorSize(), 512u);

    const OperationResult again = bench.configure();
    EXPECT_EQ(again.error.kind, EdlErrorKind::UsageError);
    EXPECT_EQ(bench.device.countVerb("configure"), 1);
}

TEST(QualcommServiceTest, FailedConfigureCanBeRepeated)
{
    FirehoseBench bench;
    bool refuse = true;
    bench.device.setNakRule([&refuse](const FakeFirehoseCommand&) {
        return refuse ? QStringLiteral("Invalid memory name") : QString();
    });

    EXPECT_EQ(bench.configure().error.kind, EdlErrorKind::DeviceRejected);
    EXPECT_FALSE(bench.service.isConfigured());

    refuse = false;
    EXPECT_TRUE(bench.configure().success);
    EXPECT_TRUE(bench.service.isConfigured());
}

TEST(QualcommServiceTest, FirehoseCallsBeforeLoaderAreUsageErrors)
{
    FakeTransport transport;
    QualcommService service(&transport, fastConfig());
    EXPECT_EQ(service.phase(), QualcommService::Phase::Sahara);

    SessionParams params;
    EXPECT_EQ(service.configure(params).error.kind, EdlErrorKind::UsageError);
    EXPECT_EQ(service.nop().error.kind, EdlErrorKind::UsageError);
    EXPECT_EQ(service.sendRawXml("<data><nop/></data>").error.kind, EdlErrorKind::UsageError);
    EXPECT_TRUE(transport.writes().isEmpty());
}

// ─── Chunked transfers ───────────────────────────────────────────────

TEST(QualcommServiceTest, WriteIsSplitByPayloadSize)
{
    FirehoseBench bench;
    bench.device.setMaxPayloadToTarget(512);
    ASSERT_TRUE(bench.configure().success);
    ASSERT_EQ(bench.service.session().maxPayloadToTarget(), 512);

    PartitionDescriptor target;
    target.name = QStringLiteral("persist");
    target.lun = 0;
    target.startSector = 40;
    target.sectorCount = 16;

    QList<QPair<qint64, qint64>> progress;
    QObject::connect(&bench.service, &QualcommService::transferProgress,
                     [&progress](qint64 done, qint64 total) { progress.append({ done, total }); });

    const QByteArray data = pattern(1300, 1);
    const OperationResult result = bench.service.write(target, { 0, 1300 }, data);
    ASSERT_TRUE(result.success) << result.error.toString().toStdString();

    ASSERT_EQ(result.chunks.size(), 3);
    EXPECT_EQ(result.chunks[0].length, 512);
    EXPECT_EQ(result.chunks[1].length, 512);
    EXPECT_EQ(result.chunks[2].length, 276);
    EXPECT_EQ(result.completedChunks(), 3);

    ASSERT_EQ(bench.device.countVerb("program"), 3);
    QList<uint64_t> starts;
    for (const FakeFirehoseCommand& cmd : bench.device.commands()) {
        if (cmd.verb == "program") {
            starts << static_cast<uint64_t>(cmd.intAttr("start_sector"));
            EXPECT_EQ(cmd.intAttr("num_partition_sectors"), 1);
            EXPECT_EQ(cmd.attr("label"), QStringLiteral("persist"));
        }
    }
    EXPECT_EQ(starts, (QList<uint64_t>{ 40, 41, 42 }));

    EXPECT_EQ(bench.device.sectorData(0, 40, 3), data + QByteArray(236, '\0'));
    EXPECT_EQ(progress.last(), (QPair<qint64, qint64>(1300, 1300)));
}

TEST(QualcommServiceTest, ReadConcatenatesChunksInOrder)
{
    FirehoseBench bench(200);
    bench.device.setMaxPayloadFromTarget(600);
    const QByteArray disk = pattern(4000, 9);
    bench.device.setSectorData(5, 0, disk);
    ASSERT_TRUE(bench.configure(200).success);

    PartitionDescriptor target;
    target.name = QStringLiteral("fsg");
    target.lun = 5;
    target.startSector = 3;
    target.sectorCount = 10;

    const OperationResult result = bench.service.read(target, { 0, 1000 });
    ASSERT_TRUE(result.success) << result.error.toString().toStdString();
    ASSERT_EQ(result.chunks.size(), 2);
    EXPECT_EQ(result.chunks[0].length, 600);
    EXPECT_EQ(result.chunks[1].length, 400);
    EXPECT_EQ(result.data, disk.mid(600, 1000));

    EXPECT_EQ(bench.device.countVerb("read"), 2);
    EXPECT_EQ(bench.device.commands().last().attr("physical_partition_number"), QStringLiteral("5"));
}

TEST(QualcommServiceTest, UnalignedReadIsTrimmed)
{
    FirehoseBench bench;
    const QByteArray disk = pattern(8192, 4);
    bench.device.setSectorData(0, 0, disk);
    ASSERT_TRUE(bench.configure().success);

    const OperationResult result =
        bench.service.read(PartitionDescriptor::wholeLun(0), { 700, 1000 });
    ASSERT_TRUE(result.success) << result.error.toString().toStdString();
    EXPECT_EQ(result.data, disk.mid(700, 1000));
}

TEST(QualcommServiceTest, SectorHelpersAndErase)
{
    FirehoseBench bench;
    ASSERT_TRUE(bench.configure().success);

    const QByteArray data = pattern(1024, 2);
    ASSERT_TRUE(bench.service.writeSectors(1, 8, data).success);
    const OperationResult back = bench.service.readSectors(1, 8, 2);
    ASSERT_TRUE(back.success);
    EXPECT_EQ(back.data, data);

    ASSERT_TRUE(bench.service.eraseSectors(1, 8, 2).success);
    EXPECT_EQ(bench.device.sectorData(1, 8, 2), QByteArray(1024, '\0'));
}

TEST(QualcommServiceTest, WriteRejectsMismatchedLengthAndAlignment)
{
    FirehoseBench bench;
    ASSERT_TRUE(bench.configure().success);
    const int writes = bench.transport.writes().size();

    EXPECT_EQ(bench.service.write(PartitionDescriptor::wholeLun(0), { 0, 100 }, QByteArray(99, 'a'))
                  .error.kind,
              EdlErrorKind::UsageError);
    EXPECT_EQ(bench.service.write(PartitionDescriptor::wholeLun(0), { 10, 100 }, QByteArray(100, 'a'))
                  .error.kind,
              EdlErrorKind::UsageError);
    EXPECT_EQ(bench.service.erase(PartitionDescriptor::wholeLun(0), { 0, 100 }).error.kind,
              EdlErrorKind::UsageError);
    EXPECT_EQ(bench.transport.writes().size(), writes);
}

// ─── Failure and cancellation ────────────────────────────────────────

TEST(QualcommServiceTest, FailedChunkStopsTheOperation)
{
    FirehoseBench bench;
    bench.device.setMaxPayloadToTarget(512);
    bench.device.setNakRule([](const FakeFirehoseCommand& cmd) {
        return cmd.verb == "program" && cmd.intAttr("start_sector") == 1
                   ? QStringLiteral("Write failed on sector 1") : QString();
    });
    ASSERT_TRUE(bench.configure().success);

    const OperationResult result =
        bench.service.write(PartitionDescriptor::wholeLun(0), { 0, 1536 }, pattern(1536, 5));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, EdlErrorKind::DeviceRejected);
    EXPECT_EQ(result.attempts, 4);

    ASSERT_EQ(result.chunks.size(), 3);
    EXPECT_EQ(result.chunks[0].outcome, ChunkOutcome::Succeeded);
    EXPECT_EQ(result.chunks[1].outcome, ChunkOutcome::Failed);
    EXPECT_EQ(result.chunks[2].outcome, ChunkOutcome::Pending);
    EXPECT_EQ(bench.device.countVerb("program"), 1 + 4);

    // A NAK leaves the session usable
    EXPECT_FALSE(bench.service.fatalError().isError());
    EXPECT_TRUE(bench.service.nop().success);
}

TEST(QualcommServiceTest, CancellationBetweenChunksResetsDevice)
{
    FirehoseBench bench;
    bench.device.setMaxPayloadFromTarget(512);
    ASSERT_TRUE(bench.configure().success);

    CancellationToken token;
    QObject::connect(&bench.service, &QualcommService::transferProgress,
                     [&token](qint64, qint64) { token.cancel(); });

    const OperationResult result =
        bench.service.readSectors(0, 0, 4, &token);
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.error.kind, EdlErrorKind::Cancelled);

    ASSERT_EQ(result.chunks.size(), 4);
    EXPECT_EQ(result.chunks[0].outcome, ChunkOutcome::Succeeded);
    for (int i = 1; i < 4; i++)
        EXPECT_EQ(result.chunks[i].outcome, ChunkOutcome::Cancelled);

    EXPECT_EQ(bench.device.countVerb("read"), 1);
    ASSERT_EQ(bench.device.commands().last().verb, QStringLiteral("power"));
    EXPECT_EQ(bench.device.commands().last().attr("value"), QStringLiteral("reset"));
}

TEST(QualcommServiceTest, CancelledBeforeStartSendsNoData)
{
    FirehoseBench bench;
    ASSERT_TRUE(bench.configure().success);

    CancellationToken token;
    token.cancel();
    const OperationResult result = bench.service.eraseSectors(0, 0, 8, &token);
    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.completedChunks(), 0);
    EXPECT_EQ(bench.device.countVerb("erase"), 0);
}

TEST(QualcommServiceTest, TransportFailureLatchesSession)
{
    FirehoseBench bench;
    ASSERT_TRUE(bench.configure().success);

    bench.transport.disconnectPeer();
    const OperationResult failed = bench.service.readSectors(0, 0, 1);
    EXPECT_EQ(failed.error.kind, EdlErrorKind::TransportError);
    EXPECT_EQ(failed.chunks[0].outcome, ChunkOutcome::Failed);
    EXPECT_TRUE(bench.service.fatalError().isError());

    const int writes = bench.transport.writes().size();
    const OperationResult next = bench.service.nop();
    EXPECT_EQ(next.error.kind, EdlErrorKind::TransportError);
    EXPECT_EQ(next.error.message, failed.error.message);
    EXPECT_EQ(bench.transport.writes().size(), writes);
}

// ─── Memory, partitions, storage ─────────────────────────────────────

TEST(QualcommServiceTest, PokeIsSplitIntoEightByteCommands)
{
    FirehoseBench bench;
    ASSERT_TRUE(bench.configure().success);

    const QByteArray bytes = pattern(20, 8);
    const OperationResult result = bench.service.poke(0x1000, bytes);
    ASSERT_TRUE(result.success) << result.error.toString().toStdString();
    ASSERT_EQ(result.chunks.size(), 3);
    EXPECT_EQ(result.chunks[2].length, 4);
    EXPECT_EQ(bench.device.countVerb("poke"), 3);
    EXPECT_EQ(bench.device.memory(0x1000, 20), bytes);

    const OperationResult peeked = bench.service.peek(0x1000, 20);
    ASSERT_TRUE(peeked.success);
    EXPECT_EQ(peeked.data, bytes);

    EXPECT_EQ(bench.service.peek(0x1000, 0).error.kind, EdlErrorKind::UsageError);
    EXPECT_EQ(bench.service.poke(0x1000, QByteArray()).error.kind, EdlErrorKind::UsageError);
}

TEST(QualcommServiceTest, ReadsGptAndFindsPartitions)
{
    FirehoseBench bench;
    GptImage image(512, 16);
    image.add("modemst1", 64, 1087).add("fsg", 2048, 3071);
    bench.device.setSectorData(2, 0, image.build());
    const QByteArray fsgData = pattern(1024, 6);
    bench.device.setSectorData(2, 2048, fsgData);
    ASSERT_TRUE(bench.configure().success);

    const GptParseResult gpt = bench.service.readGpt(2);
    ASSERT_TRUE(gpt.success) << gpt.error.toString().toStdString();
    ASSERT_EQ(gpt.partitions.size(), 2);
    EXPECT_EQ(gpt.partitions[0].lun, 2u);

    PartitionDescriptor fsg;
    EdlError error;
    const int readsBefore = bench.device.countVerb("read");
    ASSERT_TRUE(bench.service.findPartition("fsg", 2, fsg, error));
    EXPECT_EQ(bench.device.countVerb("read"), readsBefore);
    EXPECT_EQ(fsg.startSector, 2048u);
    EXPECT_EQ(fsg.sectorCount, 1024u);

    const OperationResult data = bench.service.read(fsg, { 0, 1024 });
    ASSERT_TRUE(data.success);
    EXPECT_EQ(data.data, fsgData);

    EXPECT_FALSE(bench.service.findPartition("absent", 2, fsg, error));
    EXPECT_EQ(error.kind, EdlErrorKind::UsageError);
}

TEST(QualcommServiceTest, BlankLunHasNoGpt)
{
    FirehoseBench bench;
    ASSERT_TRUE(bench.configure().success);

    PartitionDescriptor out;
    EdlError error;
    EXPECT_FALSE(bench.service.findPartition("boot", 0, out, error));
    EXPECT_EQ(error.kind, EdlErrorKind::DeviceRejected);
}

TEST(QualcommServiceTest, GptEntriesBeyondDiskAreRejected)
{
    FirehoseBench bench;
    QByteArray image = GptImage(512, 8).add("boot", 64, 127).build();
    auto* h = reinterpret_cast<uchar*>(image.data()) + 512;
    qToLittleEndian<quint64>(0xFFFFFFFFFFFFFFF0ULL, h + 72);
    qToLittleEndian<quint32>(0, h + 16);
    qToLittleEndian<quint32>(Crc32::compute(image.mid(512, 92)), h + 16);
    bench.device.setSectorData(0, 0, image);
    ASSERT_TRUE(bench.configure().success);

    const GptParseResult gpt = bench.service.readGpt(0);
    EXPECT_FALSE(gpt.success);
    EXPECT_EQ(gpt.error.kind, EdlErrorKind::DeviceRejected);
    EXPECT_EQ(bench.device.countVerb("read"), 1);
    EXPECT_FALSE(bench.service.fatalError().isError());
}

TEST(QualcommServiceTest, SectorHelpersRejectUnaddressableRanges)
{
    FirehoseBench bench;
    ASSERT_TRUE(bench.configure().success);
    const int writesBefore = static_cast<int>(bench.transport.writes().size());

    EXPECT_EQ(bench.service.readSectors(0, UINT64_MAX - 1, 2).error.kind,
              EdlErrorKind::UsageError);
    EXPECT_EQ(bench.service.eraseSectors(0, 1ULL << 62, 1).error.kind,
              EdlErrorKind::UsageError);
    // Last sector a qint64 byte offset can address at 512 bytes per sector
    const uint64_t lastSector = (1ULL << 54) - 1;
    EXPECT_EQ(bench.service.writeSectors(0, lastSector, QByteArray(1024, 'x')).error.kind,
              EdlErrorKind::UsageError);

    EXPECT_EQ(bench.transport.writes().size(), writesBefore);
    EXPECT_FALSE(bench.service.fatalError().isError());
}

// ─── A/B slots ───────────────────────────────────────────────────────

TEST(QualcommServiceTest, ActiveSlotFromBootFlags)
{
    FirehoseBench bench;
    GptImage image(512, 8);
    image.add("boot_a", 64, 127, PartitionDescriptor::AB_BOOT_SUCCESSFUL)
         .add("boot_b", 128, 191, PartitionDescriptor::AB_SLOT_ACTIVE);
    bench.device.setSectorData(0, 0, image.build());
    ASSERT_TRUE(bench.configure().success);

    QString slot;
    const OperationResult result = bench.service.getActiveSlot(slot);
    ASSERT_TRUE(result.success) << result.error.toString().toStdString();
    EXPECT_EQ(slot, QStringLiteral("b"));
}

TEST(QualcommServiceTest, ActiveSlotScansUfsLuns)
{
    FirehoseBench bench(4096);
    GptImage image(4096, 8);
    image.add("boot_a", 6, 20, PartitionDescriptor::AB_SLOT_ACTIVE).add("boot_b", 21, 35);
    bench.device.setSectorData(4, 0, image.build());

    SessionParams params;
    params.memoryName = QStringLiteral("ufs");
    ASSERT_TRUE(bench.service.configure(params).success);

    QString slot;
    const OperationResult result = bench.service.getActiveSlot(slot);
    ASSERT_TRUE(result.success) << result.error.toString().toStdString();
    EXPECT_EQ(slot, QStringLiteral("a"));
    // LUNs 0-3 stop at the header, LUN 4 also reads its entry array
    EXPECT_EQ(bench.device.countVerb("read"), 6);
}

TEST(QualcommServiceTest, ActiveSlotNeedsFlaggedBootPair)
{
    FirehoseBench bench;
    GptImage plain(512, 8);
    plain.add("system", 64, 127);
    bench.device.setSectorData(0, 0, plain.build());
    ASSERT_TRUE(bench.configure().success);

    QString slot;
    EXPECT_EQ(bench.service.getActiveSlot(slot).error.kind, EdlErrorKind::UnsupportedFeature);

    GptImage idle(512, 8);
    idle.add("boot_a", 64, 127).add("boot_b", 128, 191);
    bench.device.setSectorData(0, 0, idle.build());
    EXPECT_EQ(bench.service.getActiveSlot(slot).error.kind, EdlErrorKind::DeviceRejected);
    EXPECT_TRUE(slot.isEmpty());
}

TEST(QualcommServiceTest, SetActiveSlot)
{
    FirehoseBench bench;
    EXPECT_EQ(bench.service.setActiveSlot("a").error.kind, EdlErrorKind::UsageError);

    GptImage image(512, 8);
    image.add("boot_a", 64, 127);
    bench.device.setSectorData(0, 0, image.build());
    ASSERT_TRUE(bench.configure().success);
    ASSERT_TRUE(bench.service.readGpt(0).success);

    const int commandsBefore = static_cast<int>(bench.device.commands().size());
    EXPECT_EQ(bench.service.setActiveSlot("c").error.kind, EdlErrorKind::UsageError);
    EXPECT_EQ(bench.device.commands().size(), commandsBefore);

    const OperationResult result = bench.service.setActiveSlot(" _B ");
    ASSERT_TRUE(result.success) << result.error.toString().toStdString();
    const FakeFirehoseCommand& cmd = bench.device.commands().last();
    EXPECT_EQ(cmd.verb, QStringLiteral("setactiveslot"));
    EXPECT_EQ(cmd.attr("slot"), QStringLiteral("b"));

    // Slot flags changed, so the partition table is read again
    PartitionDescriptor boot;
    EdlError error;
    const int readsBefore = bench.device.countVerb("read");
    ASSERT_TRUE(bench.service.findPartition("boot_a", 0, boot, error));
    EXPECT_EQ(bench.device.countVerb("read"), readsBefore + 2);
}

TEST(QualcommServiceTest, SetActiveSlotRefusedByLoader)
{
    FirehoseBench bench;
    bench.device.setNakRule([](const FakeFirehoseCommand& cmd) {
        return cmd.verb == "setactiveslot" ? QStringLiteral("Command not supported") : QString();
    });
    ASSERT_TRUE(bench.configure().success);

    const OperationResult result = bench.service.setActiveSlot("a");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, EdlErrorKind::DeviceRejected);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_FALSE(bench.service.fatalError().isError());
}

TEST(QualcommServiceTest, StorageInfoFromDeviceLogs)
{
    FirehoseBench bench;
    bench.device.setStorageInfoLines({
        "INFO: {\"storage_info\": {\"total_blocks\":1000, \"block_size\":512, "
        "\"num_physical\":1, \"mem_type\":\"eMMC\", \"prod_name\":\"TEST\"}}",
    });
    ASSERT_TRUE(bench.configure().success);

    StorageInfo info;
    ASSERT_TRUE(bench.service.getStorageInfo(0, info).success);
    EXPECT_TRUE(info.valid);
    EXPECT_EQ(info.totalBlocks, 1000u);
    EXPECT_EQ(info.prodName, QStringLiteral("TEST"));
}

// ─── Device control ──────────────────────────────────────────────────

TEST(QualcommServiceTest, PowerModesMapToFirehoseValues)
{
    FirehoseBench bench;
    EXPECT_TRUE(bench.service.power("EDL").success);
    EXPECT_EQ(bench.device.commands().last().attr("value"), QStringLiteral("reset_to_edl"));
    EXPECT_TRUE(bench.service.power("off").success);
    EXPECT_EQ(bench.device.commands().last().attr("value"), QStringLiteral("off"));
    EXPECT_EQ(bench.service.power("hibernate").error.kind, EdlErrorKind::UsageError);
}

TEST(QualcommServiceTest, BootableDriveAndRawXml)
{
    FirehoseBench bench;
    ASSERT_TRUE(bench.configure().success);

    ASSERT_TRUE(bench.service.setBootableStorageDrive(1).success);
    EXPECT_EQ(bench.device.commands().last().verb, QStringLiteral("setbootablestoragedrive"));
    EXPECT_EQ(bench.device.commands().last().attr("value"), QStringLiteral("1"));

    EXPECT_TRUE(bench.service.sendRawXml("<?xml version=\"1.0\" ?><data><nop/></data>").success);
    EXPECT_EQ(bench.service.sendRawXml("<data>").error.kind, EdlErrorKind::UsageError);
}

// ─── Sahara to Firehose ──────────────────────────────────────────────

TEST(QualcommServiceTest, LoaderUploadOpensFirehoseSession)
{
    FakeTransport transport;
    const QByteArray loader = pattern(3000, 0);
    FakeSaharaDevice::Options options;
    options.trailer = FakeFirehoseDevice::logXml("INFO: loader up");
    FakeSaharaDevice sahara(transport, options, loader.size());
    sahara.start();

    QualcommService service(&transport, fastConfig());
    QList<int> phases;
    QObject::connect(&service, &QualcommService::phaseChanged,
                     [&phases](int phase) { phases << phase; });
    QStringList logs;
    QObject::connect(service.firehoseClient(), &FirehoseClient::deviceLog,
                     [&logs](const QString& line) { logs << line; });

    const SaharaResult uploaded = service.uploadLoader(loader);
    ASSERT_TRUE(uploaded.success) << uploaded.error.toString().toStdString();
    EXPECT_EQ(sahara.received(), loader);
    EXPECT_EQ(service.phase(), QualcommService::Phase::Firehose);
    EXPECT_EQ(phases, (QList<int>{ static_cast<int>(QualcommService::Phase::Firehose) }));

    FakeFirehoseDevice firehose(transport);
    SessionParams params;
    params.memoryName = QStringLiteral("ufs");
    ASSERT_TRUE(service.configure(params).success);
    EXPECT_EQ(service.session().sectorSize(), 4096u);
    EXPECT_EQ(logs, (QStringList{ "INFO: loader up" }));

    EXPECT_EQ(service.uploadLoader(loader).error.kind, EdlErrorKind::UsageError);
}

TEST(QualcommServiceTest, DeviceInfoThenUpload)
{
    FakeTransport transport;
    const QByteArray loader = pattern(1024, 3);
    FakeSaharaDevice::Options options;
    QByteArray serial(4, '\0');
    serial[0] = 0x78;
    serial[1] = 0x56;
    serial[2] = 0x34;
    serial[3] = 0x12;
    options.execReplies.insert(0x01, serial);
    options.execReplies.insert(0x02, QByteArray(8, '\x01'));
    options.execReplies.insert(0x03, QByteArray(32, '\x5A'));
    FakeSaharaDevice sahara(transport, options, loader.size());
    sahara.start();

    QualcommService service(&transport, fastConfig());
    const SaharaResult info = service.readDeviceInfo();
    ASSERT_TRUE(info.success) << info.error.toString().toStdString();
    EXPECT_EQ(service.phase(), QualcommService::Phase::Sahara);
    EXPECT_EQ(service.deviceInfo().serial, 0x12345678u);

    ASSERT_TRUE(service.uploadLoader(loader).success);
    EXPECT_EQ(sahara.received(), loader);
    EXPECT_EQ(sahara.helloCount(), 2);
}

TEST(QualcommServiceTest, SaharaResetBeforeLoader)
{
    FakeTransport transport;
    FakeSaharaDevice sahara(transport, FakeSaharaDevice::Options(), 1024);

    QualcommService service(&transport, fastConfig());
    const OperationResult result = service.reset();
    ASSERT_TRUE(result.success) << result.error.toString().toStdString();
    EXPECT_TRUE(sahara.hostCommands().contains(SaharaCommand::Reset));
}
