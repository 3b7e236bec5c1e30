#include "settings/MergeSettingsManager.h"
#include "settings/Settings.h"

#include <QDebug>
#include <QDir>
#include <QStandardPaths>

MergeSettingsManager& MergeSettingsManager::instance()
{
    static MergeSettingsManager instance;
    return instance;
}

QString MergeSettingsManager::defaultOutputDirectory()
{
    const QString pictures = QStandardPaths::writableLocation(QStandardPaths::PicturesLocation);
    return pictures.isEmpty() ? QDir::homePath() : pictures;
}

MergeMethod MergeSettingsManager::loadMethod() const
{
    auto settings = ScreenCatch::getSettings();
    const QString stored = settings.value(kSettingsKeyMethod).toString();
    MergeMethod method = defaultMethod();
    if (!stored.isEmpty() && !mergeMethodFromString(stored, &method)) {
        qWarning() << "MergeSettingsManager: Ignoring invalid merge method" << stored;
        return defaultMethod();
    }
    return method;
}

void MergeSettingsManager::saveMethod(MergeMethod method)
{
    auto settings = ScreenCatch::getSettings();
    settings.setValue(kSettingsKeyMethod, mergeMethodToString(method));
}

int MergeSettingsManager::loadSpacing() const
{
    auto settings = ScreenCatch::getSettings();
    bool ok = false;
    const int spacing = settings.value(kSettingsKeySpacing, defaultSpacing()).toInt(&ok);
    return (ok && spacing >= 0) ? spacing : defaultSpacing();
}

void MergeSettingsManager::saveSpacing(int spacing)
{
    auto settings = ScreenCatch::getSettings();
    settings.setValue(kSettingsKeySpacing, spacing);
}

QColor MergeSettingsManager::loadBackground() const
{
    auto settings = ScreenCatch::getSettings();
    const QColor color(settings.value(kSettingsKeyBackground, defaultBackground().name()).toString());
    return color.isValid() ? color : defaultBackground();
}

void MergeSettingsManager::saveBackground(const QColor& color)
{
    auto settings = ScreenCatch::getSettings();
    settings.setValue(kSettingsKeyBackground, color.name());
}

StitchMode MergeSettingsManager::loadStitchMode() const
{
    auto settings = ScreenCatch::getSettings();
    StitchMode mode = defaultStitchMode();
    const QString stored = settings.value(kSettingsKeyStitchMode).toString();
    if (!stored.isEmpty() && !stitchModeFromString(stored, &mode)) {
        return defaultStitchMode();
    }
    return mode;
}

void MergeSettingsManager::saveStitchMode(StitchMode mode)
{
    auto settings = ScreenCatch::getSettings();
    settings.setValue(kSettingsKeyStitchMode, stitchModeToString(mode));
}

int MergeSettingsManager::loadHeaderPadding() const
{
    auto settings = ScreenCatch::getSettings();
    bool ok = false;
    const int padding = settings.value(kSettingsKeyHeaderPadding, defaultHeaderPadding()).toInt(&ok);
    return (ok && padding >= 0) ? padding : defaultHeaderPadding();
}

void MergeSettingsManager::saveHeaderPadding(int padding)
{
    auto settings = ScreenCatch::getSettings();
    settings.setValue(kSettingsKeyHeaderPadding, padding);
}

QString MergeSettingsManager::loadOutputDirectory() const
{
    auto settings = ScreenCatch::getSettings();
    const QString path = settings.value(kSettingsKeyOutputDirectory).toString();
    return path.isEmpty() ? defaultOutputDirectory() : path;
}

void MergeSettingsManager::saveOutputDirectory(const QString& path)
{
    auto settings = ScreenCatch::getSettings();
    settings.setValue(kSettingsKeyOutputDirectory, path);
}

MergeSpec MergeSettingsManager::loadMergeSpec() const
{
    MergeSpec spec;
    spec.method = loadMethod();
    spec.spacing = loadSpacing();
    spec.background = loadBackground();
    return spec;
}

void MergeSettingsManager::resetToDefaults()
{
    auto settings = ScreenCatch::getSettings();
    settings.remove(QStringLiteral("merge"));
    settings.sync();
}
