#ifndef STORAGEENTRY_H
#define STORAGEENTRY_H

#include <QDateTime>
#include <QList>
#include <QMap>
#include <QString>
#include <QStringList>

/**
 * @brief A single object returned by a bucket listing.
 */
struct ObjectEntry {
    QString key;               ///< Full object key within the bucket
    qint64 size = 0;           ///< Size in bytes
    QDateTime lastModified;    ///< Last modification timestamp
    QString etag;              ///< Entity tag as reported by the store
    QString contentType;       ///< MIME type, empty if unknown
};

/**
 * @brief One page of a paginated listing.
 *
 * Pages for a scope are ordered by fetch sequence. The continuation token
 * of page N is what the store needs to produce page N+1.
 */
struct ListingPage {
    QList<ObjectEntry> objects;
    QStringList prefixes;          ///< Common prefixes ("folders"), each ending in '/'
    bool isTruncated = false;      ///< True if more entries follow this page
    QString continuationToken;     ///< Opaque cursor for the next page
};

/**
 * @brief Detailed object metadata as returned by a HEAD request.
 */
struct ObjectMetadata {
    QString key;
    qint64 size = 0;
    QDateTime lastModified;
    QString etag;
    QString contentType;
    QString contentEncoding;
    QString contentDisposition;
    QString contentLanguage;
    QString cacheControl;
    QString storageClass;
    QString versionId;
    QMap<QString, QString> customMetadata;
};

#endif // STORAGEENTRY_H
