#include "ui/ShellWindow.hpp"

#include <QQmlContext>
#include <QQmlError>
#include <QQuickWidget>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "ui/backend/ShellBridge.hpp"

namespace kgnav {

namespace {

constexpr int kDefaultWidth = 1280;
constexpr int kDefaultHeight = 800;

} // namespace

ShellWindow::ShellWindow(ShellBridge &bridge, QWidget *parent)
    : QMainWindow(parent)
    , m_view(new QQuickWidget(this))
{
    setWindowTitle(QStringLiteral("3D Knowledge Graph Navigator"));
    resize(kDefaultWidth, kDefaultHeight);

    m_view->setResizeMode(QQuickWidget::SizeRootObjectToView);
    m_view->rootContext()->setContextProperty(QStringLiteral("shellBridge"), &bridge);
    setCentralWidget(m_view);
}

ShellWindow::~ShellWindow() = default;

bool ShellWindow::loadFrontend(const QUrl &source)
{
    m_view->setSource(source);
    if (m_view->status() != QQuickWidget::Error) {
        KGNAV_LOG_INFO(QStringLiteral("ShellWindow"),
                       QStringLiteral("loadFrontend"),
                       QStringLiteral("frontend_loaded"),
                       QStringLiteral("startup"),
                       QStringLiteral("qquickwidget"),
                       kgnav::logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"source", source.toString().toStdString()}}));
        return true;
    }

    nlohmann::json errors = nlohmann::json::array();
    for (const QQmlError &error : m_view->errors()) {
        errors.push_back(error.toString().toStdString());
    }
    KGNAV_LOG_ERROR(QStringLiteral("ShellWindow"),
                    QStringLiteral("loadFrontend"),
                    QStringLiteral("frontend_load_failed"),
                    QStringLiteral("qml_error"),
                    QStringLiteral("qquickwidget"),
                    kgnav::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"source", source.toString().toStdString()},
                                    {"errors", errors}}));
    return false;
}

} // namespace kgnav
