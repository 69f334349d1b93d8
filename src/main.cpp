#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QSettings>
#include <QTimer>
#include "commandrunner.h"
#include "utils/logging.h"
#include "utils/transfersettings.h"
#include "version.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("bucketeer");
    app.setApplicationVersion(BUCKETEER_VERSION);
    app.setOrganizationName("bucketeer");
    app.setOrganizationDomain("example.com");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("Browse and transfer objects in S3-style buckets");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");
    parser.addOption(verboseOption);

    QCommandLineOption rootOption(
        QStringList() << "r" << "root",
        "Directory whose subdirectories are the buckets", "dir");
    parser.addOption(rootOption);

    QCommandLineOption connectionOption(
        QStringList() << "c" << "connection",
        "Connection id reported with every operation", "id", "local");
    parser.addOption(connectionOption);

    QCommandLineOption pageSizeOption(
        QStringList() << "page-size",
        "Entries per listing page (1-1000)", "n");
    parser.addOption(pageSizeOption);

    QCommandLineOption allOption(
        QStringList() << "a" << "all",
        "ls: fetch every page instead of the first one");
    parser.addOption(allOption);

    parser.addPositionalArgument("command", CommandRunner::usage());
    parser.addPositionalArgument("args", "Command arguments", "[args...]");

    parser.process(app);

    // Set verbose logging flag
    bucketeer::verboseLogging = parser.isSet(verboseOption);

    if (bucketeer::verboseLogging) {
        qDebug() << "Verbose logging enabled";
    }

    TransferSettings settings = TransferSettings::load();

    CommandRunner::Options options;
    options.connectionId = parser.value(connectionOption);
    options.pageSize = settings.pageSize;
    options.listAll = parser.isSet(allOption);

    if (parser.isSet(pageSizeOption)) {
        bool ok = false;
        options.pageSize = parser.value(pageSizeOption).toInt(&ok);
        if (!ok || options.pageSize < 1 || options.pageSize > 1000) {
            qWarning().noquote() << "--page-size must be between 1 and 1000";
            return CommandRunner::ExitUsage;
        }
    }

    QString root = parser.value(rootOption);
    if (root.isEmpty()) {
        QSettings stored;
        root = stored.value("storage/root", QDir::currentPath()).toString();
    }

    QStringList positional = parser.positionalArguments();
    const QString command = positional.isEmpty() ? QString() : positional.takeFirst();

    CommandRunner runner(root, settings);
    QObject::connect(&runner, &CommandRunner::finished, &app, [](int exitCode) {
        QCoreApplication::exit(exitCode);
    });

    // Start once the event loop runs so every reply is delivered through it
    QTimer::singleShot(0, &runner, [&runner, command, positional, options]() {
        runner.run(command, positional, options);
    });

    return app.exec();
}
