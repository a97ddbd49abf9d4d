#include "mainwindow.h"

#include <QApplication>
#include <QIcon>
#include <KAboutData>
#include <KLocalizedString>

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    KLocalizedString::setApplicationDomain("component-catalogue");

    // KDE application metadata, used by Help > About, the config file
    // name, and the XML GUI resource lookup.
    KAboutData aboutData(
        QStringLiteral("component-catalogue"),        // component name (internal)
        i18n("Component Catalogue"),                  // display name
        QStringLiteral("0.1.0"),                      // version
        i18n("Catalogue of crafting components"),     // short description
        KAboutLicense::GPL_V3,                        // license
        i18n("© 2026"),                               // copyright
        QString(),                                    // other text (optional)
        QString()                                     // homepage
    );

    aboutData.setOrganizationDomain("componentcatalogue.org");
    aboutData.setDesktopFileName(QStringLiteral("org.componentcatalogue.component-catalogue"));

    KAboutData::setApplicationData(aboutData);
    QApplication::setWindowIcon(QIcon::fromTheme(QStringLiteral("view-list-details")));

    // KXmlGuiWindow sets the WA_DeleteOnClose attribute, which means Qt
    // will call 'delete' on the window when it is closed.  The window
    // must therefore be heap-allocated.
    auto *window = new MainWindow();
    window->show();

    return app.exec();
}
