#include "core/ConfigManager.h"
#include "gui/MainWindow.h"
#include "utils/ArgParser.h"
#include "utils/Definitions.h"
#include "utils/Logger.h"

#include <QApplication>
#include <iostream>
#include <vector>

using namespace ConverterPro;

namespace {

Logger* s_logger = nullptr;

// Routes qDebug/qInfo/qWarning/... into the application log
void qtMessageHandler(QtMsgType type, const QMessageLogContext&, const QString& message)
{
    if (!s_logger) {
        std::cerr << message.toStdString() << std::endl;
        return;
    }
    switch (type) {
        case QtDebugMsg:
            s_logger->debug(message.toStdString());
            break;
        case QtInfoMsg:
            s_logger->info(message.toStdString());
            break;
        case QtWarningMsg:
            s_logger->warning(message.toStdString());
            break;
        case QtCriticalMsg:
        case QtFatalMsg:
            s_logger->error(message.toStdString());
            break;
    }
}

} // namespace

int main(int argc, char* argv[])
{
    ArgParser parser;
    ArgParser::Arguments args;
    // Parsed from a copy; QApplication needs the untouched argument list
    std::vector<char*> argvCopy(argv, argv + argc);
    try {
        args = parser.parseArgs(argc, argvCopy.data());
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << "\n\n" << parser.help() << std::endl;
        return 1;
    }
    if (args.helpRequested) {
        std::cout << parser.help() << std::endl;
        return 0;
    }

    Logger logger;
    if (!logger.openFile(args.logFile)) {
        logger.warning("Logging to the console only");
    }
    s_logger = &logger;
    qInstallMessageHandler(qtMessageHandler);

    QApplication app(argc, argv);
    QApplication::setApplicationName(QString::fromStdString(Definitions::APP_NAME));
    QApplication::setApplicationVersion(QString::fromStdString(Definitions::APP_VERSION));

    logger.info("Starting " + Definitions::APP_NAME + " " + Definitions::APP_VERSION);

    ConfigManager config(logger, args.configPath);
    if (!config.load()) {
        logger.warning("Using default settings");
    }

    int rc = 0;
    {
        MainWindow window(logger, config, QString::fromStdString(args.theme));
        window.show();
        rc = app.exec();
    }

    logger.info("Application exited with code " + std::to_string(rc));
    qInstallMessageHandler(nullptr);
    s_logger = nullptr;
    return rc;
}
