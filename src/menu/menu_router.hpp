#pragma once

#include <optional>
#include <vector>

#include <QString>

#include "common/enums.hpp"
#include "common/frontend_event_sink.hpp"

class QMenu;
class QMenuBar;

namespace kgnav {

struct MenuEvent {
    QString name;
    std::optional<QString> payload;
};

// All commands, in the order they appear in the menu.
const std::vector<MenuCommand> &menuCommands();

QString toMenuIdentifier(MenuCommand command);
std::optional<MenuCommand> parseMenuIdentifier(const QString &identifier);
QString menuLabel(MenuCommand command);
MenuEvent menuEventFor(MenuCommand command);

/**
 * MenuEventRouter owns the native "Navigator" menu and turns each
 * activation into exactly one front-end event.
 *
 * The router keeps no state besides the sink reference; dispatch can be
 * called from whichever thread the event loop delivers activations on.
 */
class MenuEventRouter
{
public:
    explicit MenuEventRouter(FrontendEventSink &sink);

    // Builds the menu on menuBar and wires every action to dispatch().
    // Returns nullptr when the menu cannot be constructed.
    QMenu *attachTo(QMenuBar *menuBar);

    // Emits the event mapped to identifier. Unknown identifiers are ignored
    // and return false.
    bool dispatch(const QString &identifier);

private:
    FrontendEventSink &m_sink;
};

} // namespace kgnav
