#include "menu/menu_router.hpp"

#include <QAction>
#include <QMenu>
#include <QMenuBar>
#include <QUuid>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace kgnav {

const std::vector<MenuCommand> &menuCommands()
{
    static const std::vector<MenuCommand> commands = {
        MenuCommand::About,
        MenuCommand::SetLayoutConceptCentric,
        MenuCommand::SetLayoutSphere,
        MenuCommand::SetLayoutGrid,
        MenuCommand::ToggleXRay,
        MenuCommand::ResetCamera,
        MenuCommand::ToggleSidebar,
    };
    return commands;
}

QString toMenuIdentifier(MenuCommand command)
{
    switch (command) {
    case MenuCommand::About:
        return QStringLiteral("about");
    case MenuCommand::SetLayoutConceptCentric:
        return QStringLiteral("set_layout_concept");
    case MenuCommand::SetLayoutSphere:
        return QStringLiteral("set_layout_sphere");
    case MenuCommand::SetLayoutGrid:
        return QStringLiteral("set_layout_grid");
    case MenuCommand::ToggleXRay:
        return QStringLiteral("toggle_xray");
    case MenuCommand::ResetCamera:
        return QStringLiteral("reset_camera");
    case MenuCommand::ToggleSidebar:
        return QStringLiteral("toggle_sidebar");
    }
    return QString();
}

std::optional<MenuCommand> parseMenuIdentifier(const QString &identifier)
{
    for (const MenuCommand command : menuCommands()) {
        if (toMenuIdentifier(command) == identifier) {
            return command;
        }
    }
    return std::nullopt;
}

QString menuLabel(MenuCommand command)
{
    switch (command) {
    case MenuCommand::About:
        return QStringLiteral("About");
    case MenuCommand::SetLayoutConceptCentric:
        return QStringLiteral("Concept-Centric Layout");
    case MenuCommand::SetLayoutSphere:
        return QStringLiteral("Sphere Layout");
    case MenuCommand::SetLayoutGrid:
        return QStringLiteral("Grid Layout");
    case MenuCommand::ToggleXRay:
        return QStringLiteral("Toggle X-Ray");
    case MenuCommand::ResetCamera:
        return QStringLiteral("Reset Camera");
    case MenuCommand::ToggleSidebar:
        return QStringLiteral("Toggle Sidebar");
    }
    return QString();
}

MenuEvent menuEventFor(MenuCommand command)
{
    switch (command) {
    case MenuCommand::About:
        return {QStringLiteral("about"), std::nullopt};
    case MenuCommand::SetLayoutConceptCentric:
        return {QStringLiteral("set-layout"), QStringLiteral("concept-centric")};
    case MenuCommand::SetLayoutSphere:
        return {QStringLiteral("set-layout"), QStringLiteral("sphere")};
    case MenuCommand::SetLayoutGrid:
        return {QStringLiteral("set-layout"), QStringLiteral("grid")};
    case MenuCommand::ToggleXRay:
        return {QStringLiteral("toggle-xray"), std::nullopt};
    case MenuCommand::ResetCamera:
        return {QStringLiteral("reset-camera"), std::nullopt};
    case MenuCommand::ToggleSidebar:
        return {QStringLiteral("toggle-sidebar"), std::nullopt};
    }
    return {};
}

MenuEventRouter::MenuEventRouter(FrontendEventSink &sink)
    : m_sink(sink)
{
}

QMenu *MenuEventRouter::attachTo(QMenuBar *menuBar)
{
    if (!menuBar) {
        KGNAV_LOG_ERROR(QStringLiteral("MenuEventRouter"),
                        QStringLiteral("attachTo"),
                        QStringLiteral("menu_build_failed"),
                        QStringLiteral("null_menu_bar"),
                        QStringLiteral("qt_widgets"),
                        kgnav::logging::defaultWho(),
                        QString(),
                        nlohmann::json::object());
        return nullptr;
    }

    QMenu *menu = menuBar->addMenu(QStringLiteral("&Navigator"));
    menu->setObjectName(QStringLiteral("navigatorMenu"));

    for (const MenuCommand command : menuCommands()) {
        const QString identifier = toMenuIdentifier(command);
        QAction *action = menu->addAction(menuLabel(command));
        action->setObjectName(identifier);
        action->setData(identifier);
        QObject::connect(action, &QAction::triggered, menu, [this, identifier]() {
            dispatch(identifier);
        });
        if (command == MenuCommand::About || command == MenuCommand::SetLayoutGrid) {
            menu->addSeparator();
        }
    }

    KGNAV_LOG_DEBUG(QStringLiteral("MenuEventRouter"),
                    QStringLiteral("attachTo"),
                    QStringLiteral("menu_attached"),
                    QStringLiteral("startup"),
                    QStringLiteral("qt_widgets"),
                    kgnav::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"entries", menuCommands().size()}}));
    return menu;
}

bool MenuEventRouter::dispatch(const QString &identifier)
{
    const auto command = parseMenuIdentifier(identifier);
    if (!command) {
        return false;
    }

    // Router and sink records for one activation share this id.
    const logging::CorrelationScope scope(
        QStringLiteral("menu-") + QUuid::createUuid().toString(QUuid::WithoutBraces));

    const MenuEvent event = menuEventFor(*command);
    KGNAV_LOG_DEBUG(QStringLiteral("MenuEventRouter"),
                    QStringLiteral("dispatch"),
                    QStringLiteral("menu_dispatch"),
                    QStringLiteral("menu_activation"),
                    QStringLiteral("dispatch_table"),
                    kgnav::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"menuId", identifier.toStdString()},
                                    {"event", event.name.toStdString()}}));
    const bool delivered = m_sink.emitEvent(event.name, event.payload);
    if (!delivered) {
        KGNAV_LOG_DEBUG(QStringLiteral("MenuEventRouter"),
                        QStringLiteral("dispatch"),
                        QStringLiteral("event_not_delivered"),
                        QStringLiteral("no_listener"),
                        QStringLiteral("fire_and_forget"),
                        kgnav::logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"menuId", identifier.toStdString()},
                                        {"event", event.name.toStdString()}}));
    }
    return true;
}

} // namespace kgnav
