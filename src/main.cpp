#include <QApplication>
#include <QFileInfo>
#include "MainWindow.h"
#include "DarkTheme.h"
#include "AppConstants.h"
#include "EngineConfig.h"
#include "Logging.h"

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName(AppConstants::AppName);
    app.setApplicationVersion(AppConstants::AppVersion);
    app.setOrganizationName(AppConstants::OrgName);

    EngineConfig config;
    EngineConfigStore store;
    QString configPath = EngineConfigStore::defaultPath();
    bool configLoaded = !QFileInfo::exists(configPath) || store.load(configPath, config);

    Logging::install(config.logRules);
    if (!configLoaded)
        qCWarning(srApp) << "Using default engine settings:" << store.errorString();

    DarkTheme::apply(app);

    MainWindow window(config);
    window.show();

    return app.exec();
}
