module;
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QMutex>
#include <QMutexLocker>
#include <QString>

#include <memory>
#include <utility>

module theboys.backend.logging;

Q_LOGGING_CATEGORY(lcVersion, "theboys.version")
Q_LOGGING_CATEGORY(lcInstall, "theboys.install")
Q_LOGGING_CATEGORY(lcSettings, "theboys.settings")
Q_LOGGING_CATEGORY(lcRelease, "theboys.release")
Q_LOGGING_CATEGORY(lcDownload, "theboys.download")
Q_LOGGING_CATEGORY(lcUpdate, "theboys.update")
Q_LOGGING_CATEGORY(lcMigration, "theboys.migration")
Q_LOGGING_CATEGORY(lcPlatform, "theboys.platform")

namespace {
QMutex g_sinkMutex;
std::unique_ptr<QFile> g_logFile;
QtMessageHandler g_previousHandler = nullptr;
bool g_handlerInstalled = false;

QString levelName(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:
        return QStringLiteral("DEBUG");
    case QtInfoMsg:
        return QStringLiteral("INFO");
    case QtWarningMsg:
        return QStringLiteral("WARN");
    case QtCriticalMsg:
        return QStringLiteral("ERROR");
    case QtFatalMsg:
        return QStringLiteral("FATAL");
    }
    return QStringLiteral("INFO");
}

void fileMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& message)
{
    {
        QMutexLocker locker(&g_sinkMutex);
        if (g_logFile != nullptr && g_logFile->isOpen()) {
            const QString category = context.category != nullptr
                ? QString::fromLatin1(context.category)
                : QStringLiteral("default");
            const QString line = QStringLiteral("%1 %2 %3: %4\n")
                .arg(QDateTime::currentDateTime().toString(Qt::ISODateWithMs),
                     levelName(type),
                     category,
                     message);
            g_logFile->write(line.toUtf8());
            g_logFile->flush();
        }
    }

    if (g_previousHandler != nullptr) {
        g_previousHandler(type, context, message);
    }
}
}

void applyLogFilter(bool debugEnabled)
{
    QLoggingCategory::setFilterRules(debugEnabled
        ? QStringLiteral("theboys.*.debug=true")
        : QStringLiteral("theboys.*.debug=false"));
}

bool installFileLogSink(const QString& logDirectory, QString *errorMessage)
{
    if (!QDir().mkpath(logDirectory)) {
        if (errorMessage != nullptr) {
            *errorMessage = QStringLiteral("Could not create log directory: %1").arg(logDirectory);
        }
        return false;
    }

    const QDir dir(logDirectory);
    const QString latestPath = dir.filePath(QStringLiteral("latest.log"));
    const QString previousPath = dir.filePath(QStringLiteral("previous.log"));

    QMutexLocker locker(&g_sinkMutex);
    if (g_logFile != nullptr) {
        g_logFile->close();
        g_logFile.reset();
    }

    if (QFileInfo::exists(latestPath)) {
        QFile::remove(previousPath);
        if (!QFile::rename(latestPath, previousPath)) {
            QFile::remove(latestPath);
        }
    }

    auto file = std::make_unique<QFile>(latestPath);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        if (errorMessage != nullptr) {
            *errorMessage = QStringLiteral("Could not open log file: %1").arg(latestPath);
        }
        return false;
    }
    g_logFile = std::move(file);

    if (!g_handlerInstalled) {
        g_previousHandler = qInstallMessageHandler(fileMessageHandler);
        g_handlerInstalled = true;
    }
    return true;
}

void removeFileLogSink()
{
    QMutexLocker locker(&g_sinkMutex);
    if (g_handlerInstalled) {
        qInstallMessageHandler(g_previousHandler);
        g_previousHandler = nullptr;
        g_handlerInstalled = false;
    }
    if (g_logFile != nullptr) {
        g_logFile->close();
        g_logFile.reset();
    }
}
