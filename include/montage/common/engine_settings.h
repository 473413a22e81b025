#pragma once

#include <QString>

class QSettings;

namespace montage {

/**
 * Engine-wide tunables shared by every clip in a session.
 * Passed explicitly to clips and timelines; there is no global instance.
 */
struct EngineSettings
{
    double fps = 30.0;
    double minScale = 0.1;
    double minSpeed = 0.1;
    double maxSpeed = 10.0;
    double flexibleDurationMs = 2000.0;

    int captionMaxWords = 5;
    int captionMinWords = 2;
    int captionMaxChars = 45;

    QString logLevel = QStringLiteral("info");

    // Duration of one frame on the fixed grid
    double frameDurationMs() const { return 1000.0 / fps; }

    /**
     * Read settings from a QSettings store
     * Algorithm: Read each key → Validate range → Keep default on rejection
     */
    void load(QSettings& settings);
    void save(QSettings& settings) const;

    // Load from an INI file; missing keys keep their defaults
    static EngineSettings fromFile(const QString& filePath);

    /**
     * Install Qt logging filter rules for the montage.* categories.
     * MONTAGE_LOG_LEVEL (debug|info|warn|error) overrides logLevel.
     */
    void applyLogFilter() const;
};

} // namespace montage
