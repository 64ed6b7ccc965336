#pragma once

#include <QObject>
#include <QVariant>
#include <QVariantMap>

#include "common/frontend_event_sink.hpp"
#include "common/models.hpp"

namespace kgnav {

/**
 * ShellBridge is the only native object the front-end talks to.
 *
 * It is published to QML as the "shellBridge" context property. The
 * front-end queries build metadata through getBuildInfo() and subscribes
 * to frontendEvent for menu-driven commands.
 */
class ShellBridge : public QObject, public FrontendEventSink
{
    Q_OBJECT
public:
    explicit ShellBridge(const BuildInfo &buildInfo, QObject *parent = nullptr);
    ~ShellBridge() override;

    // Keys: buildNumber, epochMinutes, epoch, semver, gitSha, builtAtIso,
    // versionBuild.
    Q_INVOKABLE QVariantMap getBuildInfo() const;

    bool emitEvent(const QString &name, const std::optional<QString> &payload) override;

signals:
    // payload is a string, or an invalid QVariant when the event has none.
    void frontendEvent(const QString &name, const QVariant &payload);

private:
    BuildInfo m_buildInfo;
};

} // namespace kgnav
