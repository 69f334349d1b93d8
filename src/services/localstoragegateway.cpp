#include "localstoragegateway.h"
#include "utils/logging.h"

#include <QCryptographicHash>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMessageAuthenticationCode>
#include <QMimeDatabase>
#include <QPointer>
#include <QTimer>
#include <QUrl>
#include <QUrlQuery>
#include <QUuid>
#include <algorithm>

namespace {

struct ListEntry {
    QString key;
    bool isPrefix = false;
    QFileInfo info;
};

QString normalizedPrefix(const QString &prefix)
{
    if (prefix.isEmpty() || prefix.endsWith('/')) {
        return prefix;
    }
    return prefix + '/';
}

GatewayError notFound(const QString &message)
{
    return GatewayError{GatewayErrorKind::NotFound, message};
}

GatewayError invalidRequest(const QString &message)
{
    return GatewayError{GatewayErrorKind::InvalidRequest, message};
}

GatewayError localIo(const QString &message)
{
    return GatewayError{GatewayErrorKind::LocalIo, message};
}

} // namespace

struct LocalStorageGateway::CopyJob {
    QPointer<GatewayReply> reply;
    std::shared_ptr<QFile> source;
    std::shared_ptr<QFile> destination;
    qint64 total = 0;
    qint64 done = 0;
};

LocalStorageGateway::LocalStorageGateway(const QString &rootPath, QObject *parent)
    : IStorageGateway(parent)
    , rootPath_(QDir::cleanPath(rootPath))
    , signingSecret_(QUuid::createUuid().toRfc4122())
{
}

LocalStorageGateway::~LocalStorageGateway() = default;

void LocalStorageGateway::setChunkSize(qint64 bytes)
{
    chunkSize_ = qMax<qint64>(1, bytes);
}

QString LocalStorageGateway::bucketPath(const QString &bucket) const
{
    return rootPath_ + '/' + bucket;
}

QString LocalStorageGateway::objectPath(const QString &bucket, const QString &key) const
{
    return bucketPath(bucket) + '/' + key;
}

bool LocalStorageGateway::bucketExists(const QString &bucket) const
{
    return isSafeName(bucket) && QFileInfo(bucketPath(bucket)).isDir();
}

bool LocalStorageGateway::isSafeName(const QString &bucket)
{
    return !bucket.isEmpty() && !bucket.contains('/') && !bucket.contains('\\')
        && bucket != "." && bucket != "..";
}

bool LocalStorageGateway::isSafeKey(const QString &key)
{
    if (key.isEmpty() || key.startsWith('/') || key.contains('\\')) {
        return false;
    }
    const QStringList segments = key.split('/');
    for (const QString &segment : segments) {
        if (segment == "." || segment == "..") {
            return false;
        }
    }
    return true;
}

void LocalStorageGateway::completeLater(GatewayReply *reply, std::function<void()> work)
{
    // Replies are children of the gateway, so work never outlives it. The
    // reply is the timer context: a reply deleted early never runs its work.
    QTimer::singleShot(0, reply, [reply, work = std::move(work)]() {
        if (!reply->isFinished()) {
            work();
        }
    });
}

bool LocalStorageGateway::checkTarget(GatewayReply *reply, const QString &bucket,
                                      const QString &key, bool keyRequired)
{
    if (!bucketExists(bucket)) {
        reply->fail(notFound(QStringLiteral("NoSuchBucket: %1").arg(bucket)));
        return false;
    }
    if (keyRequired && !isSafeKey(key)) {
        reply->fail(invalidRequest(tr("Invalid object key '%1'").arg(key)));
        return false;
    }
    return true;
}

GatewayReply *LocalStorageGateway::listObjects(const QString &connectionId, const QString &bucket,
                                               const QString &prefix,
                                               const QString &continuationToken, int maxKeys)
{
    Q_UNUSED(connectionId)

    auto *reply = new GatewayReply(GatewayReply::Operation::List, this);
    completeLater(reply, [this, reply, bucket, prefix, continuationToken, maxKeys]() {
        if (!checkTarget(reply, bucket, QString(), false)) {
            return;
        }

        const QString folder = normalizedPrefix(prefix);
        if (!folder.isEmpty() && !isSafeKey(folder.chopped(1))) {
            reply->fail(invalidRequest(tr("Invalid prefix '%1'").arg(prefix)));
            return;
        }

        int limit = maxKeys <= 0 ? DefaultMaxKeys : qMin(maxKeys, MaxKeys);

        // A prefix with nothing under it is an empty listing, not an error
        QDir dir(objectPath(bucket, folder));
        QList<ListEntry> entries;
        if (dir.exists()) {
            const QFileInfoList infos = dir.entryInfoList(
                QDir::Files | QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden);
            for (const QFileInfo &info : infos) {
                ListEntry entry;
                entry.isPrefix = info.isDir();
                entry.key = folder + info.fileName() + (entry.isPrefix ? "/" : "");
                entry.info = info;
                entries.append(entry);
            }
        }

        std::sort(entries.begin(), entries.end(), [](const ListEntry &a, const ListEntry &b) {
            return a.key < b.key;
        });

        ListingPage page;
        int index = 0;
        if (!continuationToken.isEmpty()) {
            while (index < entries.size() && entries.at(index).key <= continuationToken) {
                ++index;
            }
        }

        QString lastKey;
        for (int taken = 0; index < entries.size() && taken < limit; ++index, ++taken) {
            const ListEntry &entry = entries.at(index);
            if (entry.isPrefix) {
                page.prefixes.append(entry.key);
            } else {
                ObjectEntry object;
                object.key = entry.key;
                object.size = entry.info.size();
                object.lastModified = entry.info.lastModified();
                page.objects.append(object);
            }
            lastKey = entry.key;
        }

        page.isTruncated = index < entries.size();
        if (page.isTruncated) {
            page.continuationToken = lastKey;
        }

        LOG_VERBOSE() << "LocalStorageGateway: listed" << bucket << folder << "->"
                      << page.objects.size() << "objects," << page.prefixes.size()
                      << "prefixes, truncated:" << page.isTruncated;
        reply->finishWithListing(page);
    });
    return reply;
}

GatewayReply *LocalStorageGateway::putObject(const QString &connectionId, const QString &bucket,
                                             const QString &key, const QString &sourceLocalPath)
{
    Q_UNUSED(connectionId)

    auto *reply = new GatewayReply(GatewayReply::Operation::Put, this);
    completeLater(reply, [this, reply, bucket, key, sourceLocalPath]() {
        if (!checkTarget(reply, bucket, key, true)) {
            return;
        }
        if (key.endsWith('/')) {
            reply->fail(invalidRequest(tr("Invalid object key '%1'").arg(key)));
            return;
        }
        startCopy(reply, sourceLocalPath, objectPath(bucket, key),
                  tr("Cannot read file '%1': file not found or access denied").arg(sourceLocalPath));
    });
    return reply;
}

GatewayReply *LocalStorageGateway::getObject(const QString &connectionId, const QString &bucket,
                                             const QString &key, const QString &destinationLocalPath)
{
    Q_UNUSED(connectionId)

    auto *reply = new GatewayReply(GatewayReply::Operation::Get, this);
    completeLater(reply, [this, reply, bucket, key, destinationLocalPath]() {
        if (!checkTarget(reply, bucket, key, true)) {
            return;
        }
        startCopy(reply, objectPath(bucket, key), destinationLocalPath,
                  QStringLiteral("NoSuchKey: %1").arg(key));
    });
    return reply;
}

void LocalStorageGateway::startCopy(GatewayReply *reply, const QString &sourcePath,
                                    const QString &destinationPath,
                                    const QString &missingSourceMessage)
{
    QFileInfo sourceInfo(sourcePath);
    if (!sourceInfo.isFile()) {
        GatewayError error = reply->operation() == GatewayReply::Operation::Get
            ? notFound(missingSourceMessage)
            : localIo(missingSourceMessage);
        reply->fail(error);
        return;
    }

    auto job = std::make_shared<CopyJob>();
    job->reply = reply;
    job->source = std::make_shared<QFile>(sourcePath);
    if (!job->source->open(QIODevice::ReadOnly)) {
        reply->fail(localIo(tr("Cannot read file '%1': %2")
                                .arg(sourcePath, job->source->errorString())));
        return;
    }

    if (!QDir().mkpath(QFileInfo(destinationPath).absolutePath())) {
        reply->fail(localIo(tr("Cannot create directory for '%1'").arg(destinationPath)));
        return;
    }

    job->destination = std::make_shared<QFile>(destinationPath);
    if (!job->destination->open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        reply->fail(localIo(tr("Cannot save file '%1': %2")
                                .arg(destinationPath, job->destination->errorString())));
        return;
    }

    job->total = job->source->size();

    connect(reply, &GatewayReply::abortRequested, reply, [job]() {
        LOG_VERBOSE() << "LocalStorageGateway: transfer aborted, removing"
                      << job->destination->fileName();
        discardPartial(job);
    });

    copyNextChunk(job);
}

void LocalStorageGateway::copyNextChunk(const std::shared_ptr<CopyJob> &job)
{
    GatewayReply *reply = job->reply;
    if (!reply || reply->isFinished()) {
        return;
    }

    if (job->done < job->total) {
        const QByteArray chunk = job->source->read(qMin(chunkSize_, job->total - job->done));
        if (chunk.isEmpty() || job->destination->write(chunk) != chunk.size()) {
            const QString reason = chunk.isEmpty() ? job->source->errorString()
                                                   : job->destination->errorString();
            discardPartial(job);
            reply->fail(localIo(tr("File transfer interrupted: %1").arg(reason)));
            return;
        }
        job->done += chunk.size();
        reply->reportProgress(job->done, job->total);
    }

    if (job->done < job->total) {
        QTimer::singleShot(0, reply, [this, job]() { copyNextChunk(job); });
        return;
    }

    job->source->close();
    if (!job->destination->flush()) {
        const QString reason = job->destination->errorString();
        discardPartial(job);
        reply->fail(localIo(tr("File transfer interrupted: %1").arg(reason)));
        return;
    }
    job->destination->close();

    if (job->total == 0) {
        reply->reportProgress(0, 0);
    }
    reply->finishSuccess();
}

void LocalStorageGateway::discardPartial(const std::shared_ptr<CopyJob> &job)
{
    if (job->source) {
        job->source->close();
    }
    if (job->destination) {
        job->destination->close();
        job->destination->remove();
    }
}

GatewayReply *LocalStorageGateway::deleteObjects(const QString &connectionId, const QString &bucket,
                                                 const QStringList &keys)
{
    Q_UNUSED(connectionId)

    auto *reply = new GatewayReply(GatewayReply::Operation::Delete, this);
    completeLater(reply, [this, reply, bucket, keys]() {
        if (!checkTarget(reply, bucket, QString(), false)) {
            return;
        }

        QStringList failures;
        for (const QString &key : keys) {
            if (!isSafeKey(key)) {
                reply->fail(invalidRequest(tr("Invalid object key '%1'").arg(key)));
                return;
            }

            const QString path = objectPath(bucket, key);
            if (key.endsWith('/')) {
                // Only an empty folder goes away with its marker
                if (!QDir().rmdir(path)) {
                    LOG_VERBOSE() << "LocalStorageGateway: folder kept" << key;
                }
                continue;
            }

            QFile file(path);
            if (file.exists() && !file.remove()) {
                failures.append(QStringLiteral("%1 (%2)").arg(key, file.errorString()));
            }
        }

        if (!failures.isEmpty()) {
            reply->fail(localIo(tr("Failed to delete: %1").arg(failures.join(", "))));
            return;
        }
        reply->finishSuccess();
    });
    return reply;
}

GatewayReply *LocalStorageGateway::copyObject(const QString &connectionId, const QString &bucket,
                                              const QString &sourceKey, const QString &destinationKey)
{
    Q_UNUSED(connectionId)

    auto *reply = new GatewayReply(GatewayReply::Operation::Copy, this);
    completeLater(reply, [this, reply, bucket, sourceKey, destinationKey]() {
        if (!checkTarget(reply, bucket, sourceKey, true)
            || !checkTarget(reply, bucket, destinationKey, true)) {
            return;
        }

        const QString source = objectPath(bucket, sourceKey);
        const QString destination = objectPath(bucket, destinationKey);
        if (!QFileInfo(source).isFile()) {
            reply->fail(notFound(QStringLiteral("NoSuchKey: %1").arg(sourceKey)));
            return;
        }
        if (source == destination) {
            reply->finishSuccess();
            return;
        }

        if (!QDir().mkpath(QFileInfo(destination).absolutePath())) {
            reply->fail(localIo(tr("Cannot create directory for '%1'").arg(destinationKey)));
            return;
        }
        if (QFile::exists(destination) && !QFile::remove(destination)) {
            reply->fail(localIo(tr("Cannot replace '%1'").arg(destinationKey)));
            return;
        }

        QFile file(source);
        if (!file.copy(destination)) {
            reply->fail(localIo(tr("Cannot copy '%1' to '%2': %3")
                                    .arg(sourceKey, destinationKey, file.errorString())));
            return;
        }
        reply->finishSuccess();
    });
    return reply;
}

GatewayReply *LocalStorageGateway::createFolder(const QString &connectionId, const QString &bucket,
                                                const QString &folderKey)
{
    Q_UNUSED(connectionId)

    auto *reply = new GatewayReply(GatewayReply::Operation::CreateFolder, this);
    completeLater(reply, [this, reply, bucket, folderKey]() {
        const QString key = normalizedPrefix(folderKey);
        if (!checkTarget(reply, bucket, key, true)) {
            return;
        }

        if (!QDir().mkpath(objectPath(bucket, key))) {
            reply->fail(localIo(tr("Cannot create folder '%1'").arg(key)));
            return;
        }
        reply->finishSuccess();
    });
    return reply;
}

GatewayReply *LocalStorageGateway::presignUrl(const QString &connectionId, const QString &bucket,
                                              const QString &key, int ttlSeconds)
{
    Q_UNUSED(connectionId)

    auto *reply = new GatewayReply(GatewayReply::Operation::Presign, this);
    completeLater(reply, [this, reply, bucket, key, ttlSeconds]() {
        if (ttlSeconds < 1 || ttlSeconds > MaxPresignTtlSeconds) {
            reply->fail(invalidRequest(tr("InvalidArgument: expiry must be between 1 and %1 seconds")
                                           .arg(MaxPresignTtlSeconds)));
            return;
        }
        if (!checkTarget(reply, bucket, key, true)) {
            return;
        }

        const QString path = objectPath(bucket, key);
        const qint64 expires = QDateTime::currentSecsSinceEpoch() + ttlSeconds;

        QUrl url = QUrl::fromLocalFile(path);
        QUrlQuery query;
        query.addQueryItem("X-Expires", QString::number(expires));
        query.addQueryItem("X-Signature", QString::fromLatin1(signature(path, expires)));
        url.setQuery(query);

        reply->finishWithUrl(url.toString());
    });
    return reply;
}

GatewayReply *LocalStorageGateway::headMetadata(const QString &connectionId, const QString &bucket,
                                                const QString &key)
{
    Q_UNUSED(connectionId)

    auto *reply = new GatewayReply(GatewayReply::Operation::Head, this);
    completeLater(reply, [this, reply, bucket, key]() {
        if (!checkTarget(reply, bucket, key, true)) {
            return;
        }

        const QString path = objectPath(bucket, key);
        QFile file(path);
        if (!QFileInfo(path).isFile()) {
            reply->fail(notFound(QStringLiteral("NoSuchKey: %1").arg(key)));
            return;
        }
        if (!file.open(QIODevice::ReadOnly)) {
            reply->fail(localIo(tr("Cannot read file '%1': %2").arg(key, file.errorString())));
            return;
        }

        QCryptographicHash hash(QCryptographicHash::Md5);
        hash.addData(&file);

        const QFileInfo info(path);
        ObjectMetadata metadata;
        metadata.key = key;
        metadata.size = info.size();
        metadata.lastModified = info.lastModified();
        metadata.etag = QStringLiteral("\"%1\"").arg(QString::fromLatin1(hash.result().toHex()));
        metadata.contentType = QMimeDatabase().mimeTypeForFile(info).name();
        metadata.storageClass = QStringLiteral("STANDARD");

        reply->finishWithMetadata(metadata);
    });
    return reply;
}

QByteArray LocalStorageGateway::signature(const QString &path, qint64 expires) const
{
    const QByteArray message = path.toUtf8() + '\n' + QByteArray::number(expires);
    return QMessageAuthenticationCode::hash(message, signingSecret_, QCryptographicHash::Sha256)
        .toHex();
}

bool LocalStorageGateway::verifyPresignedUrl(const QString &url, const QDateTime &now) const
{
    const QUrl parsed(url);
    if (!parsed.isLocalFile()) {
        return false;
    }

    const QUrlQuery query(parsed);
    bool ok = false;
    const qint64 expires = query.queryItemValue("X-Expires").toLongLong(&ok);
    if (!ok || now.toSecsSinceEpoch() > expires) {
        return false;
    }

    const QByteArray expected = signature(parsed.toLocalFile(), expires);
    return query.queryItemValue("X-Signature").toLatin1() == expected;
}
