/************************************************************************\

    Passdeck - Password store browser
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include "StoreSettings.h"

#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>
#include <QtGlobal>

namespace {
constexpr char storePathKey[] = "store/path";
constexpr char passExecutableKey[] = "store/passExecutable";
constexpr char clipTimeKey[] = "store/clipTime";
constexpr char refreshIntervalKey[] = "table/refreshInterval";
constexpr char logLevelKey[] = "log/level";
constexpr char logDirectoryKey[] = "log/directory";

constexpr char storeDirEnv[] = "PASSWORD_STORE_DIR";
constexpr char clipTimeEnv[] = "PASSWORD_STORE_CLIP_TIME";
constexpr char logLevelEnv[] = "PASSDECK_LOG_LEVEL";

constexpr char defaultStoreFolder[] = ".password-store";
constexpr char logFolder[] = "logs";
}

/**
 * @brief Loads settings from the user INI file and the environment.
 *
 * Environment variables understood by pass take precedence over the file.
 *
 * @return Resolved settings.
 */
StoreSettings StoreSettings::load()
{
    QSettings settings(QSettings::IniFormat, QSettings::UserScope, "Passdeck", "Passdeck");
    StoreSettings result;

    QString storePath = qEnvironmentVariable(storeDirEnv);
    if (storePath.isEmpty()) {
        storePath = settings.value(QLatin1String(storePathKey)).toString();
    }
    if (storePath.isEmpty()) {
        storePath = QDir::home().filePath(QLatin1String(defaultStoreFolder));
    }
    result.setStorePath(storePath);

    const QString executable = settings.value(QLatin1String(passExecutableKey)).toString().trimmed();
    if (!executable.isEmpty()) {
        result.setPassExecutable(executable);
    }

    QString clipTime = qEnvironmentVariable(clipTimeEnv);
    if (clipTime.isEmpty()) {
        clipTime = settings.value(QLatin1String(clipTimeKey)).toString();
    }
    result.setClipTimeSeconds(positiveOrDefault(clipTime, defaultClipTimeSeconds));

    const QString interval = settings.value(QLatin1String(refreshIntervalKey)).toString();
    result.setRefreshIntervalMs(positiveOrDefault(interval, defaultRefreshIntervalMs));

    QString level = qEnvironmentVariable(logLevelEnv);
    if (level.isEmpty()) {
        level = settings.value(QLatin1String(logLevelKey), result.logLevel()).toString();
    }
    result.setLogLevel(level.trimmed().toLower());

    const QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    const QString fallbackLogDir = dataDir.isEmpty() ? QString() : QDir(dataDir).filePath(QLatin1String(logFolder));
    result.setLogDirectory(settings.value(QLatin1String(logDirectoryKey), fallbackLogDir).toString());

    return result;
}

QString StoreSettings::storePath() const
{
    return m_storePath;
}

void StoreSettings::setStorePath(const QString &path)
{
    m_storePath = QDir::cleanPath(QDir::fromNativeSeparators(path));
}

QString StoreSettings::passExecutable() const
{
    return m_passExecutable;
}

void StoreSettings::setPassExecutable(const QString &executable)
{
    m_passExecutable = executable;
}

int StoreSettings::clipTimeSeconds() const
{
    return m_clipTimeSeconds;
}

void StoreSettings::setClipTimeSeconds(int seconds)
{
    m_clipTimeSeconds = seconds > 0 ? seconds : defaultClipTimeSeconds;
}

int StoreSettings::refreshIntervalMs() const
{
    return m_refreshIntervalMs;
}

void StoreSettings::setRefreshIntervalMs(int interval)
{
    m_refreshIntervalMs = interval > 0 ? interval : defaultRefreshIntervalMs;
}

QString StoreSettings::logLevel() const
{
    return m_logLevel;
}

void StoreSettings::setLogLevel(const QString &level)
{
    m_logLevel = level;
}

QString StoreSettings::logDirectory() const
{
    return m_logDirectory;
}

void StoreSettings::setLogDirectory(const QString &directory)
{
    m_logDirectory = directory;
}

bool StoreSettings::storeExists() const
{
    const QFileInfo info(m_storePath);
    return info.exists() && info.isDir();
}

int StoreSettings::positiveOrDefault(const QString &value, int fallback)
{
    bool ok = false;
    const int parsed = value.trimmed().toInt(&ok);
    if (!ok || parsed <= 0) {
        return fallback;
    }
    return parsed;
}
