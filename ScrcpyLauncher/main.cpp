#include <QApplication>
#include <QCommandLineParser>
#include <QDebug>

#include "LauncherCore.h"
#include "appcontext.h"
#include "ui/launcherwindow.h"
#include "ui/unixsignalwatcher.h"
#include "util/config.h"
#include "util/logger.h"

int main(int argc, char* argv[])
{
    QApplication a(argc, argv);
    QCoreApplication::setApplicationName("ScrcpyLauncher");
    QCoreApplication::setApplicationVersion(SLC_VERSION);

    // stderr only until the configured level and log file are known
    Logger::install(Logger::Info, QString());

    QCommandLineParser parser;
    parser.setApplicationDescription("Android mirror & APK installer launcher for scrcpy");
    parser.addHelpOption();
    parser.addVersionOption();
    ConfigLoader::addOptions(parser);
    parser.process(a);

    slc::LauncherConfig config = ConfigLoader::load(ConfigLoader::configPathFromArguments(parser));
    ConfigLoader::applyOverrides(config, parser);

    // replaces the bootstrap handler; an unopenable log file is reported by Logger itself
    Logger::install(Logger::levelFromString(config.logLevel), config.logFile);
    qInfo() << "ScrcpyLauncher" << SLC_VERSION << "starting";
    qInfo() << "Tools dir:" << config.toolsDir;

    // the signal socket pair must exist before the event loop runs
    UnixSignalWatcher signalWatcher;
    signalWatcher.install();

    slc::AppContext context(config);
    if (!context.hasAdb()) {
        qWarning() << "adb not found, expected at" << slc::AppContext::expectedAdbLocation();
    }
    if (!context.hasScrcpy()) {
        qWarning() << "scrcpy not found, expected at" << slc::AppContext::expectedScrcpyLocation();
    }

    LauncherWindow window(&context);
    QObject::connect(&signalWatcher, &UnixSignalWatcher::terminationRequested, &window, [&window](int) {
        window.cleanupAndExit();
        QApplication::quit();
    });

    window.show();
    window.start();

    int ret = a.exec();

    qInfo() << "ScrcpyLauncher exiting with code" << ret;
    Logger::uninstall();
    return ret;
}
