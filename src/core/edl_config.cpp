#include "edl_config.h"

#include <QFileInfo>
#include <QSettings>

static const QString TAG = QStringLiteral("Config");

namespace edlkit {

namespace {

int readPositiveInt(QSettings& settings, const QString& key, int fallback, bool allowZero = false)
{
    if (!settings.contains(key))
        return fallback;

    bool ok = false;
    const int value = settings.value(key).toString().trimmed().toInt(&ok);
    if (!ok || value < 0 || (value == 0 && !allowZero)) {
        LOG_WARNING_CAT(TAG, QString("Ignoring %1=%2, using %3")
                                 .arg(key, settings.value(key).toString()).arg(fallback));
        return fallback;
    }
    return value;
}

qint64 readPayload(QSettings& settings, const QString& key, qint64 fallback)
{
    if (!settings.contains(key))
        return fallback;

    bool ok = false;
    const qint64 value = settings.value(key).toString().trimmed().toLongLong(&ok);
    if (!ok || value <= 0) {
        LOG_WARNING_CAT(TAG, QString("Ignoring %1=%2, using %3")
                                 .arg(key, settings.value(key).toString()).arg(fallback));
        return fallback;
    }
    return value;
}

bool readBool(QSettings& settings, const QString& key, bool fallback)
{
    if (!settings.contains(key))
        return fallback;

    const QString text = settings.value(key).toString().trimmed().toLower();
    if (text == "true" || text == "1" || text == "yes")
        return true;
    if (text == "false" || text == "0" || text == "no")
        return false;
    LOG_WARNING_CAT(TAG, QString("Ignoring %1=%2, not a boolean").arg(key, text));
    return fallback;
}

} // namespace

SessionParams EdlConfig::sessionParams() const
{
    SessionParams params;
    params.memoryName = memoryName;
    params.maxPayloadToTarget = maxPayloadToTarget;
    params.maxPayloadFromTarget = maxPayloadFromTarget;
    params.sectorSize = sectorSize;
    params.skipStorageInit = skipStorageInit;
    return params;
}

RetryPolicy EdlConfig::retryPolicy() const
{
    return RetryPolicy(maxRetries, fatalNakPatterns);
}

void EdlConfig::applyLogging() const
{
    Logger::instance().setMinLevel(logLevel);
    if (!logDir.isEmpty() && !Logger::instance().initialize(logDir))
        LOG_WARNING_CAT(TAG, "Cannot open log directory: " + logDir);
}

bool EdlConfig::load(const QString& path, EdlConfig& config, EdlError& error)
{
    if (!QFileInfo::exists(path)) {
        error = EdlError::usage("Config file not found: " + path);
        return false;
    }

    QSettings settings(path, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        error = EdlError::usage("Config file is not valid INI: " + path);
        return false;
    }

    EdlConfig cfg;

    cfg.maxRetries = readPositiveInt(settings, "retry/max_retries", cfg.maxRetries, true);
    if (settings.contains("retry/fatal_nak_patterns")) {
        // Unquoted comma lists come back as a QStringList already
        QStringList patterns;
        for (const QString& item : settings.value("retry/fatal_nak_patterns").toStringList()) {
            for (const QString& part : item.split(',', Qt::SkipEmptyParts)) {
                const QString p = part.trimmed();
                if (!p.isEmpty())
                    patterns.append(p);
            }
        }
        cfg.fatalNakPatterns = patterns;
    }

    cfg.helloTimeoutMs = readPositiveInt(settings, "timeouts/hello_ms", cfg.helloTimeoutMs);
    cfg.packetTimeoutMs = readPositiveInt(settings, "timeouts/packet_ms", cfg.packetTimeoutMs);
    cfg.xmlTimeoutMs = readPositiveInt(settings, "timeouts/xml_ms", cfg.xmlTimeoutMs);
    cfg.dataTimeoutMs = readPositiveInt(settings, "timeouts/data_ms", cfg.dataTimeoutMs);

    const QString memory = settings.value("firehose/memory_name", cfg.memoryName)
                               .toString().trimmed().toLower();
    if (memory.isEmpty())
        LOG_WARNING_CAT(TAG, "Empty firehose/memory_name, using " + cfg.memoryName);
    else
        cfg.memoryName = memory;
    cfg.maxPayloadToTarget = readPayload(settings, "firehose/max_payload_size_to_target",
                                         cfg.maxPayloadToTarget);
    cfg.maxPayloadFromTarget = readPayload(settings, "firehose/max_payload_size_from_target",
                                           cfg.maxPayloadFromTarget);
    cfg.sectorSize = static_cast<uint32_t>(
        readPositiveInt(settings, "firehose/sector_size", 0, true));
    cfg.skipStorageInit = readBool(settings, "firehose/skip_storage_init", cfg.skipStorageInit);

    if (settings.contains("log/level")) {
        const QString level = settings.value("log/level").toString().trimmed();
        cfg.logLevel = Logger::levelFromString(level, cfg.logLevel);
    }
    cfg.logDir = settings.value("log/dir", cfg.logDir).toString().trimmed();

    config = cfg;
    LOG_INFO_CAT(TAG, QString("Loaded %1 (memory=%2, retries=%3)")
                          .arg(path, cfg.memoryName).arg(cfg.maxRetries));
    return true;
}

bool EdlConfig::save(const QString& path, EdlError& error) const
{
    QSettings settings(path, QSettings::IniFormat);

    settings.setValue("retry/max_retries", maxRetries);
    settings.setValue("retry/fatal_nak_patterns", fatalNakPatterns.join(','));

    settings.setValue("timeouts/hello_ms", helloTimeoutMs);
    settings.setValue("timeouts/packet_ms", packetTimeoutMs);
    settings.setValue("timeouts/xml_ms", xmlTimeoutMs);
    settings.setValue("timeouts/data_ms", dataTimeoutMs);

    settings.setValue("firehose/memory_name", memoryName);
    settings.setValue("firehose/max_payload_size_to_target", maxPayloadToTarget);
    settings.setValue("firehose/max_payload_size_from_target", maxPayloadFromTarget);
    settings.setValue("firehose/sector_size", sectorSize);
    settings.setValue("firehose/skip_storage_init", skipStorageInit);

    settings.setValue("log/level", Logger::levelToString(logLevel).toLower());
    settings.setValue("log/dir", logDir);

    settings.sync();
    if (settings.status() != QSettings::NoError) {
        error = EdlError::usage("Cannot write config file: " + path);
        return false;
    }
    return true;
}

} // namespace edlkit
