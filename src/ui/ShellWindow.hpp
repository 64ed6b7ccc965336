#pragma once

#include <QMainWindow>
#include <QUrl>

class QQuickWidget;

namespace kgnav {

class ShellBridge;

// ShellWindow hosts the front-end and owns the native menu bar.
class ShellWindow : public QMainWindow
{
    Q_OBJECT
public:
    explicit ShellWindow(ShellBridge &bridge, QWidget *parent = nullptr);
    ~ShellWindow() override;

    // Loads the front-end document. Returns false if it failed to load.
    bool loadFrontend(const QUrl &source);

private:
    QQuickWidget *m_view = nullptr;
};

} // namespace kgnav
