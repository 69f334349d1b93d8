/**
 * @file commandrunner.h
 * @brief Executes one command-line request against a local bucket root.
 */

#ifndef COMMANDRUNNER_H
#define COMMANDRUNNER_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QTextStream>

class ConnectionHealthStore;
class InvalidationBridge;
class ListingCache;
class LocalStorageGateway;
class QIODevice;
class StorageService;
class TransferExecutor;
class TransferQueue;
struct ListingScope;
struct TransferSettings;

/**
 * @brief Wires the core together and runs a single command.
 *
 * Commands are asynchronous; the result is reported once through
 * finished() with the process exit code:
 * - 0 on success
 * - 1 if any operation failed
 * - 2 on a usage error
 */
class CommandRunner : public QObject
{
    Q_OBJECT

public:
    enum ExitCode {
        ExitSuccess = 0,
        ExitFailure = 1,
        ExitUsage = 2
    };

    /**
     * @brief Options shared by all commands.
     */
    struct Options {
        QString connectionId = QStringLiteral("local");
        int pageSize = 500;
        bool listAll = false;
    };

    /**
     * @brief Constructs a runner serving buckets below @p rootPath.
     */
    explicit CommandRunner(const QString &rootPath, const TransferSettings &settings,
                           QObject *parent = nullptr);
    ~CommandRunner() override;

    /**
     * @brief Redirects normal and error output (default stdout and stderr).
     */
    void setOutputDevices(QIODevice *out, QIODevice *err);

    /**
     * @brief Starts @p command with its positional @p arguments.
     *
     * finished() is always emitted later, even for usage errors.
     */
    void run(const QString &command, const QStringList &arguments, const Options &options);

    [[nodiscard]] static QString usage();

    [[nodiscard]] TransferQueue *queue() const { return queue_; }
    [[nodiscard]] LocalStorageGateway *gateway() const { return gateway_; }

signals:
    void finished(int exitCode);

private:
    void runList(const QStringList &arguments);
    void runPut(const QStringList &arguments);
    void runGet(const QStringList &arguments);
    void runRemove(const QStringList &arguments);
    void runMove(const QStringList &arguments);
    void runMakeFolder(const QStringList &arguments);
    void runPresign(const QStringList &arguments);
    void runStat(const QStringList &arguments);

    void printListing(const ListingScope &scope);
    void failUsage(const QString &message);
    void finish(int exitCode);

    LocalStorageGateway *gateway_ = nullptr;
    TransferQueue *queue_ = nullptr;
    InvalidationBridge *bridge_ = nullptr;
    ListingCache *cache_ = nullptr;
    TransferExecutor *executor_ = nullptr;
    ConnectionHealthStore *health_ = nullptr;
    StorageService *service_ = nullptr;

    QTextStream out_;
    QTextStream err_;
    Options options_;
    bool finished_ = false;
};

#endif // COMMANDRUNNER_H
