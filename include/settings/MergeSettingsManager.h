#ifndef MERGESETTINGSMANAGER_H
#define MERGESETTINGSMANAGER_H

#include "compose/CompositionTypes.h"
#include "compose/StitchPipeline.h"

#include <QColor>
#include <QString>

/**
 * @brief Singleton class for managing merge and stitch defaults.
 *
 * Values stored by an older or hand-edited configuration that do not parse
 * are ignored and the built-in default is returned instead.
 */
class MergeSettingsManager
{
public:
    static MergeSettingsManager& instance();

    MergeMethod loadMethod() const;
    void saveMethod(MergeMethod method);

    int loadSpacing() const;
    void saveSpacing(int spacing);

    QColor loadBackground() const;
    void saveBackground(const QColor& color);

    StitchMode loadStitchMode() const;
    void saveStitchMode(StitchMode mode);

    int loadHeaderPadding() const;
    void saveHeaderPadding(int padding);

    QString loadOutputDirectory() const;
    void saveOutputDirectory(const QString& path);

    // MergeSpec filled from the stored defaults
    MergeSpec loadMergeSpec() const;

    // Removes every stored merge value so the built-in defaults apply again
    void resetToDefaults();

    // Default values
    static MergeMethod defaultMethod() { return MergeMethod::Auto; }
    static int defaultSpacing() { return 10; }
    static QColor defaultBackground() { return QColor(255, 255, 255); }
    static StitchMode defaultStitchMode() { return StitchMode::FlushStack; }
    static int defaultHeaderPadding() { return 20; }
    static QString defaultOutputDirectory();

    static constexpr const char* kSettingsKeyMethod = "merge/method";
    static constexpr const char* kSettingsKeySpacing = "merge/spacing";
    static constexpr const char* kSettingsKeyBackground = "merge/background";
    static constexpr const char* kSettingsKeyStitchMode = "merge/stitchMode";
    static constexpr const char* kSettingsKeyHeaderPadding = "merge/headerPadding";
    static constexpr const char* kSettingsKeyOutputDirectory = "merge/outputDirectory";

private:
    MergeSettingsManager() = default;
    MergeSettingsManager(const MergeSettingsManager&) = delete;
    MergeSettingsManager& operator=(const MergeSettingsManager&) = delete;
};

#endif // MERGESETTINGSMANAGER_H
