#pragma once

#include <QString>

class StoreSettings
{
public:
    static constexpr int defaultClipTimeSeconds = 45;
    static constexpr int defaultRefreshIntervalMs = 5000;

    static StoreSettings load();

    QString storePath() const;
    void setStorePath(const QString &path);

    QString passExecutable() const;
    void setPassExecutable(const QString &executable);

    int clipTimeSeconds() const;
    void setClipTimeSeconds(int seconds);

    int refreshIntervalMs() const;
    void setRefreshIntervalMs(int interval);

    QString logLevel() const;
    void setLogLevel(const QString &level);

    QString logDirectory() const;
    void setLogDirectory(const QString &directory);

    bool storeExists() const;

private:
    static int positiveOrDefault(const QString &value, int fallback);

    QString m_storePath;
    QString m_passExecutable = QStringLiteral("pass");
    int m_clipTimeSeconds = defaultClipTimeSeconds;
    int m_refreshIntervalMs = defaultRefreshIntervalMs;
    QString m_logLevel = QStringLiteral("info");
    QString m_logDirectory;
};
