#include <montage/common/engine_settings.h>

#include <QLoggingCategory>
#include <QSettings>
#include <QStringList>

#include <cstdlib>

Q_LOGGING_CATEGORY(montageSettings, "montage.settings")

namespace montage {

namespace {

double readPositive(QSettings& settings, const QString& key, double fallback)
{
    if (!settings.contains(key)) {
        return fallback;
    }
    bool ok = false;
    double value = settings.value(key).toDouble(&ok);
    if (!ok || value <= 0.0) {
        qCWarning(montageSettings) << "Rejected setting" << key << "=" << settings.value(key)
                                   << "keeping" << fallback;
        return fallback;
    }
    return value;
}

int readCount(QSettings& settings, const QString& key, int fallback)
{
    if (!settings.contains(key)) {
        return fallback;
    }
    bool ok = false;
    int value = settings.value(key).toInt(&ok);
    if (!ok || value < 1) {
        qCWarning(montageSettings) << "Rejected setting" << key << "=" << settings.value(key)
                                   << "keeping" << fallback;
        return fallback;
    }
    return value;
}

} // namespace

void EngineSettings::load(QSettings& settings)
{
    // Algorithm: Read each key → Validate range → Keep default on rejection
    settings.beginGroup("timeline");
    fps = readPositive(settings, "fps", fps);
    flexibleDurationMs = readPositive(settings, "flexible_duration_ms", flexibleDurationMs);
    settings.endGroup();

    settings.beginGroup("transform");
    minScale = readPositive(settings, "min_scale", minScale);
    settings.endGroup();

    settings.beginGroup("speed");
    double loadedMin = readPositive(settings, "min", minSpeed);
    double loadedMax = readPositive(settings, "max", maxSpeed);
    if (loadedMin <= loadedMax) {
        minSpeed = loadedMin;
        maxSpeed = loadedMax;
    } else {
        qCWarning(montageSettings) << "Rejected speed range" << loadedMin << ">" << loadedMax;
    }
    settings.endGroup();

    settings.beginGroup("caption");
    captionMaxWords = readCount(settings, "max_words", captionMaxWords);
    captionMinWords = readCount(settings, "min_words", captionMinWords);
    captionMaxChars = readCount(settings, "max_chars", captionMaxChars);
    settings.endGroup();

    logLevel = settings.value("log/level", logLevel).toString();

    qCDebug(montageSettings) << "Loaded settings: fps" << fps << "speed range"
                             << minSpeed << "-" << maxSpeed;
}

void EngineSettings::save(QSettings& settings) const
{
    settings.setValue("timeline/fps", fps);
    settings.setValue("timeline/flexible_duration_ms", flexibleDurationMs);
    settings.setValue("transform/min_scale", minScale);
    settings.setValue("speed/min", minSpeed);
    settings.setValue("speed/max", maxSpeed);
    settings.setValue("caption/max_words", captionMaxWords);
    settings.setValue("caption/min_words", captionMinWords);
    settings.setValue("caption/max_chars", captionMaxChars);
    settings.setValue("log/level", logLevel);
    settings.sync();
}

EngineSettings EngineSettings::fromFile(const QString& filePath)
{
    EngineSettings result;
    QSettings settings(filePath, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        qCWarning(montageSettings) << "Cannot read settings file" << filePath;
        return result;
    }
    result.load(settings);
    return result;
}

void EngineSettings::applyLogFilter() const
{
    QString level = logLevel.toLower();
    const char* env = std::getenv("MONTAGE_LOG_LEVEL");
    if (env && *env) {
        level = QString::fromLatin1(env).toLower();
    }

    QStringList rules;
    if (level == "debug") {
        rules << "montage.*=true";
    } else if (level == "warn" || level == "warning") {
        rules << "montage.*.debug=false" << "montage.*.info=false";
    } else if (level == "error") {
        rules << "montage.*.debug=false" << "montage.*.info=false" << "montage.*.warning=false";
    } else {
        rules << "montage.*.debug=false";
    }
    QLoggingCategory::setFilterRules(rules.join('\n'));
}

} // namespace montage
