#include "event_channel.h"
#include "core/log_manager.h"
#include <QThread>
#include <QUuid>

EventChannel::EventChannel(QObject* parent)
    : QObject(parent)
{
}

bool EventChannel::publish(const QString& event, const QJsonObject& payload)
{
    if (QThread::currentThread() != thread()) {
        QMetaObject::invokeMethod(this, [this, event, payload]() { publish(event, payload); },
                                  Qt::QueuedConnection);
        return true;
    }

    if (m_detached) {
        LOG_DEBUG(QStringLiteral("EventChannel: dropping '%1' after detach").arg(event));
        return false;
    }
    if (m_closed) {
        LOG_WARNING(QStringLiteral("EventChannel: dropping '%1' published after close").arg(event));
        return false;
    }

    const bool terminal = isTerminal(event);
    if (terminal)
        m_closed = true;

    ++m_published;
    emit eventPublished(event, payload);

    if (terminal)
        emit closed();
    return true;
}

void EventChannel::detach()
{
    m_detached = true;
    m_closed = true;
}

bool EventChannel::publishNotification(const QString& content, NotificationStatus status)
{
    QJsonObject payload;
    payload["content"] = content;
    payload["id"] = QUuid::createUuid().toString(QUuid::WithoutBraces);
    payload["status"] = statusName(status);
    return publish(RelayEvent::Notification, payload);
}

bool EventChannel::isTerminal(const QString& event)
{
    return event == QLatin1String(RelayEvent::Done) || event == QLatin1String(RelayEvent::Error);
}

QString EventChannel::statusName(NotificationStatus status)
{
    switch (status) {
    case NotificationStatus::Started:   return QStringLiteral("started");
    case NotificationStatus::Running:   return QStringLiteral("running");
    case NotificationStatus::Completed: return QStringLiteral("completed");
    case NotificationStatus::Failed:    return QStringLiteral("failed");
    }
    return QStringLiteral("failed");
}
