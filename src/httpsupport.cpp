module;
#include <QCoreApplication>
#include <QEventLoop>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QObject>
#include <QString>
#include <QTimer>
#include <QUrl>

module theboys.backend.httpsupport;

QByteArray userAgent(const QString& component)
{
    QString version = QCoreApplication::applicationVersion().trimmed();
    if (version.isEmpty()) {
        version = QStringLiteral("dev");
    }
    return QStringLiteral("TheBoys-%1/%2").arg(component, version).toUtf8();
}

QNetworkRequest makeRequest(const QUrl& url, const QString& component, int timeoutMs)
{
    QNetworkRequest request(url);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
    request.setRawHeader("User-Agent", userAgent(component));
    request.setTransferTimeout(timeoutMs);
    return request;
}

bool waitForReply(QNetworkReply *reply, int timeoutMs)
{
    if (reply == nullptr || reply->isFinished()) {
        return false;
    }

    bool timedOut = false;
    QEventLoop loop;
    QTimer deadline;
    deadline.setSingleShot(true);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&deadline, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        reply->abort();
        loop.quit();
    });
    deadline.start(timeoutMs);
    loop.exec();
    deadline.stop();
    return timedOut;
}

int httpStatus(const QNetworkReply *reply)
{
    if (reply == nullptr) {
        return 0;
    }
    return reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
}
