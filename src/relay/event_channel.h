#pragma once
#include "semantic/types.h"
#include <QJsonObject>
#include <QObject>
#include <QString>

namespace RelayEvent {
    inline constexpr char TextDelta[]    = "text-delta";
    inline constexpr char ArgDelta[]     = "tool-call-arg-delta";
    inline constexpr char Code[]         = "code";
    inline constexpr char Notification[] = "notification";
    inline constexpr char ArtifactUrl[]  = "artifact-url";
    inline constexpr char Message[]      = "message";
    inline constexpr char Done[]         = "done";
    inline constexpr char Error[]        = "error";
}

// Request-scoped, ordered event stream. Every publish is delivered to the
// subscribers synchronously and in call order. A "done" or "error" event
// closes the channel; anything published afterwards is dropped.
// Publishes from another thread are queued onto the channel's thread and keep
// their relative order.
class EventChannel : public QObject {
    Q_OBJECT
public:
    explicit EventChannel(QObject* parent = nullptr);

    bool publish(const QString& event, const QJsonObject& payload);
    bool publishNotification(const QString& content, NotificationStatus status);

    // Silences the channel without a terminal event; used when the client is
    // gone and nothing more may reach it.
    void detach();

    bool isClosed() const { return m_closed; }
    bool isDetached() const { return m_detached; }
    int publishedCount() const { return m_published; }

    static bool isTerminal(const QString& event);
    static QString statusName(NotificationStatus status);

signals:
    void eventPublished(const QString& event, const QJsonObject& payload);
    void closed();

private:
    bool m_closed = false;
    bool m_detached = false;
    int m_published = 0;
};
