#include "ui/backend/ShellBridge.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QMetaMethod>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace kgnav {

ShellBridge::ShellBridge(const BuildInfo &buildInfo, QObject *parent)
    : QObject(parent)
    , m_buildInfo(buildInfo)
{
}

ShellBridge::~ShellBridge() = default;

QVariantMap ShellBridge::getBuildInfo() const
{
    const nlohmann::json payload = m_buildInfo;
    KGNAV_LOG_DEBUG(QStringLiteral("ShellBridge"),
                    QStringLiteral("getBuildInfo"),
                    QStringLiteral("build_info_query"),
                    QStringLiteral("frontend_request"),
                    QStringLiteral("qml_invokable"),
                    kgnav::logging::defaultWho(),
                    QString(),
                    payload);
    const QJsonDocument doc =
        QJsonDocument::fromJson(QByteArray::fromStdString(payload.dump()));
    return doc.object().toVariantMap();
}

bool ShellBridge::emitEvent(const QString &name, const std::optional<QString> &payload)
{
    static const QMetaMethod signal = QMetaMethod::fromSignal(&ShellBridge::frontendEvent);
    const bool listening = isSignalConnected(signal);

    emit frontendEvent(name, payload ? QVariant(*payload) : QVariant());

    KGNAV_LOG_DEBUG(QStringLiteral("ShellBridge"),
                    QStringLiteral("emitEvent"),
                    QStringLiteral("frontend_event"),
                    QStringLiteral("menu_activation"),
                    QStringLiteral("qt_signal"),
                    kgnav::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"event", name.toStdString()},
                                    {"payload", payload ? payload->toStdString() : std::string()},
                                    {"listening", listening}}));
    return listening;
}

} // namespace kgnav
