#include "commandrunner.h"
#include "models/listingcache.h"
#include "models/transferqueue.h"
#include "services/connectionhealthstore.h"
#include "services/invalidationbridge.h"
#include "services/localstoragegateway.h"
#include "services/storageservice.h"
#include "services/transferexecutor.h"
#include "utils/logging.h"
#include "utils/transfersettings.h"

#include <QIODevice>
#include <QTimer>
#include <algorithm>

CommandRunner::CommandRunner(const QString &rootPath, const TransferSettings &settings,
                             QObject *parent)
    : QObject(parent)
    , gateway_(new LocalStorageGateway(rootPath, this))
    , queue_(new TransferQueue(this))
    , bridge_(new InvalidationBridge(this))
    , cache_(new ListingCache(gateway_, this))
    , executor_(new TransferExecutor(gateway_, queue_, bridge_, this))
    , health_(new ConnectionHealthStore(this))
    , service_(new StorageService(gateway_, executor_, bridge_, health_, this))
    , out_(stdout)
    , err_(stderr)
{
    bridge_->attachCache(cache_);
    settings.applyTo(executor_, cache_, service_);
    options_.pageSize = settings.pageSize;

    connect(service_, &StorageService::operationFailed, this,
            [this](const QString &, const QString &, const QString &key, const QString &error) {
        err_ << tr("error: %1: %2").arg(key, error) << Qt::endl;
        finish(ExitFailure);
    });

    connect(health_, &ConnectionHealthStore::healthChanged, this,
            [](const QString &connectionId, ConnectionHealth health) {
        LOG_VERBOSE() << "Connection" << connectionId << "is" << connectionHealthToString(health);
    });
}

CommandRunner::~CommandRunner() = default;

void CommandRunner::setOutputDevices(QIODevice *out, QIODevice *err)
{
    out_.setDevice(out);
    err_.setDevice(err);
}

QString CommandRunner::usage()
{
    return QStringLiteral(
        "Commands:\n"
        "  ls BUCKET [PREFIX]         List a folder (--all fetches every page)\n"
        "  put BUCKET PREFIX FILE...  Upload files into a folder\n"
        "  get BUCKET DIR KEY...      Download objects into a local directory\n"
        "  rm BUCKET KEY...           Delete objects\n"
        "  mv BUCKET OLD NEW          Rename an object\n"
        "  mkdir BUCKET PATH          Create a folder\n"
        "  presign BUCKET KEY [TTL]   Print a time-limited URL\n"
        "  stat BUCKET KEY            Show object metadata\n");
}

void CommandRunner::run(const QString &command, const QStringList &arguments, const Options &options)
{
    options_ = options;
    options_.pageSize = qBound(1, options_.pageSize, ListingCache::MaxPageSize);

    LOG_VERBOSE() << "CommandRunner:" << command << arguments;

    if (command == "ls") {
        runList(arguments);
    } else if (command == "put") {
        runPut(arguments);
    } else if (command == "get") {
        runGet(arguments);
    } else if (command == "rm") {
        runRemove(arguments);
    } else if (command == "mv") {
        runMove(arguments);
    } else if (command == "mkdir") {
        runMakeFolder(arguments);
    } else if (command == "presign") {
        runPresign(arguments);
    } else if (command == "stat") {
        runStat(arguments);
    } else if (command.isEmpty()) {
        failUsage(tr("No command given"));
    } else {
        failUsage(tr("Unknown command '%1'").arg(command));
    }
}

void CommandRunner::runList(const QStringList &arguments)
{
    if (arguments.isEmpty() || arguments.size() > 2) {
        failUsage(tr("ls expects BUCKET [PREFIX]"));
        return;
    }

    QString prefix = arguments.value(1);
    if (!prefix.isEmpty() && !prefix.endsWith('/')) {
        prefix += '/';
    }
    const ListingScope scope{options_.connectionId, arguments.at(0), prefix};

    connect(cache_, &ListingCache::pageReady, this,
            [this, scope](const ListingScope &readyScope, int, const ListingPage &) {
        if (readyScope != scope || cache_->isFetching(scope)) {
            return;
        }
        if (options_.listAll && cache_->hasMore(scope)) {
            cache_->fetchNextPage(scope, options_.pageSize);
            return;
        }
        printListing(scope);
        finish(ExitSuccess);
    });

    connect(cache_, &ListingCache::fetchFailed, this,
            [this, scope](const ListingScope &failedScope, int, const QString &message) {
        if (failedScope != scope) {
            return;
        }
        err_ << tr("error: %1").arg(message) << Qt::endl;
        finish(ExitFailure);
    });

    cache_->fetchPage(scope, 0, options_.pageSize);
}

void CommandRunner::printListing(const ListingScope &scope)
{
    const ListingSnapshot snapshot = cache_->flatten(scope);

    QStringList prefixes = snapshot.prefixes;
    prefixes.sort();
    for (const QString &prefix : std::as_const(prefixes)) {
        out_ << QString(30, ' ') << "PRE " << prefix << Qt::endl;
    }

    QList<ObjectEntry> objects = snapshot.objects;
    std::sort(objects.begin(), objects.end(), [](const ObjectEntry &a, const ObjectEntry &b) {
        return a.key < b.key;
    });
    for (const ObjectEntry &object : std::as_const(objects)) {
        out_ << object.lastModified.toString("yyyy-MM-dd HH:mm:ss")
             << QString::number(object.size).rightJustified(11) << ' '
             << object.key << Qt::endl;
    }

    if (snapshot.isTruncated) {
        err_ << tr("More entries available, use --all to list everything") << Qt::endl;
    }
}

void CommandRunner::runPut(const QStringList &arguments)
{
    if (arguments.size() < 3) {
        failUsage(tr("put expects BUCKET PREFIX FILE..."));
        return;
    }

    connect(executor_, &TransferExecutor::transferFailed, this,
            [this](const QString &transferId, const QString &errorMessage) {
        const auto record = queue_->record(transferId);
        err_ << tr("upload failed: %1: %2")
                    .arg(record ? record->fileName : transferId, errorMessage) << Qt::endl;
    });
    connect(service_, &StorageService::statusMessage, this, [this](const QString &message, int) {
        out_ << message << Qt::endl;
    });
    connect(service_, &StorageService::transfersFinished, this,
            [this](int, TransferType, int, int failed) {
        finish(failed > 0 ? ExitFailure : ExitSuccess);
    });

    service_->uploadFiles(options_.connectionId, arguments.at(0), arguments.at(1),
                          arguments.mid(2));
}

void CommandRunner::runGet(const QStringList &arguments)
{
    if (arguments.size() < 3) {
        failUsage(tr("get expects BUCKET DIR KEY..."));
        return;
    }

    connect(executor_, &TransferExecutor::transferFailed, this,
            [this](const QString &transferId, const QString &errorMessage) {
        const auto record = queue_->record(transferId);
        err_ << tr("download failed: %1: %2")
                    .arg(record ? record->key : transferId, errorMessage) << Qt::endl;
    });
    connect(service_, &StorageService::statusMessage, this, [this](const QString &message, int) {
        out_ << message << Qt::endl;
    });
    connect(service_, &StorageService::transfersFinished, this,
            [this](int, TransferType, int, int failed) {
        finish(failed > 0 ? ExitFailure : ExitSuccess);
    });

    const int batchId = service_->downloadObjects(options_.connectionId, arguments.at(0),
                                                  arguments.mid(2), arguments.at(1));
    if (batchId < 0) {
        failUsage(tr("get needs at least one object key"));
    }
}

void CommandRunner::runRemove(const QStringList &arguments)
{
    if (arguments.size() < 2) {
        failUsage(tr("rm expects BUCKET KEY..."));
        return;
    }

    connect(service_, &StorageService::objectsDeleted, this,
            [this](const QString &, const QString &bucket, const QStringList &keys) {
        for (const QString &key : keys) {
            out_ << tr("delete: %1/%2").arg(bucket, key) << Qt::endl;
        }
        finish(ExitSuccess);
    });

    service_->deleteObjects(options_.connectionId, arguments.at(0), arguments.mid(1));
}

void CommandRunner::runMove(const QStringList &arguments)
{
    if (arguments.size() != 3) {
        failUsage(tr("mv expects BUCKET OLD NEW"));
        return;
    }

    connect(service_, &StorageService::objectRenamed, this,
            [this](const QString &, const QString &, const QString &oldKey, const QString &newKey) {
        out_ << tr("move: %1 -> %2").arg(oldKey, newKey) << Qt::endl;
        finish(ExitSuccess);
    });

    if (!service_->renameObject(options_.connectionId, arguments.at(0),
                                arguments.at(1), arguments.at(2))) {
        failUsage(tr("mv needs two different keys"));
    }
}

void CommandRunner::runMakeFolder(const QStringList &arguments)
{
    if (arguments.size() != 2) {
        failUsage(tr("mkdir expects BUCKET PATH"));
        return;
    }

    connect(service_, &StorageService::folderCreated, this,
            [this](const QString &, const QString &bucket, const QString &folderKey) {
        out_ << tr("created: %1/%2").arg(bucket, folderKey) << Qt::endl;
        finish(ExitSuccess);
    });

    if (!service_->createFolder(options_.connectionId, arguments.at(0), QString(), arguments.at(1))) {
        failUsage(tr("mkdir needs a folder name"));
    }
}

void CommandRunner::runPresign(const QStringList &arguments)
{
    if (arguments.size() < 2 || arguments.size() > 3) {
        failUsage(tr("presign expects BUCKET KEY [TTL]"));
        return;
    }

    int ttl = service_->defaultPresignTtl();
    if (arguments.size() == 3) {
        bool ok = false;
        ttl = arguments.at(2).toInt(&ok);
        if (!ok) {
            failUsage(tr("TTL must be a number of seconds"));
            return;
        }
    }

    connect(service_, &StorageService::presignedUrlReady, this,
            [this](const QString &, const QString &, const QString &, const QString &url) {
        out_ << url << Qt::endl;
        finish(ExitSuccess);
    });

    service_->presignUrl(options_.connectionId, arguments.at(0), arguments.at(1), ttl);
}

void CommandRunner::runStat(const QStringList &arguments)
{
    if (arguments.size() != 2) {
        failUsage(tr("stat expects BUCKET KEY"));
        return;
    }

    connect(service_, &StorageService::metadataReady, this,
            [this](const QString &, const QString &, const ObjectMetadata &metadata) {
        out_ << "Key:           " << metadata.key << Qt::endl;
        out_ << "Size:          " << metadata.size << Qt::endl;
        out_ << "Last modified: " << metadata.lastModified.toString(Qt::ISODate) << Qt::endl;
        out_ << "ETag:          " << metadata.etag << Qt::endl;
        out_ << "Content type:  " << metadata.contentType << Qt::endl;
        out_ << "Storage class: " << metadata.storageClass << Qt::endl;
        for (auto it = metadata.customMetadata.constBegin();
             it != metadata.customMetadata.constEnd(); ++it) {
            out_ << "x-amz-meta-" << it.key() << ": " << it.value() << Qt::endl;
        }
        finish(ExitSuccess);
    });

    service_->fetchMetadata(options_.connectionId, arguments.at(0), arguments.at(1));
}

void CommandRunner::failUsage(const QString &message)
{
    err_ << message << Qt::endl;
    err_ << usage() << Qt::flush;

    // Always report asynchronously so callers can connect after run()
    QTimer::singleShot(0, this, [this]() { finish(ExitUsage); });
}

void CommandRunner::finish(int exitCode)
{
    if (finished_) {
        return;
    }
    finished_ = true;

    out_.flush();
    err_.flush();
    emit finished(exitCode);
}
