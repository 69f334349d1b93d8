#include "gatewayreply.h"

#include "utils/logging.h"

GatewayReply::GatewayReply(Operation operation, QObject *parent)
    : QObject(parent)
    , operation_(operation)
{
}

GatewayReply::~GatewayReply() = default;

void GatewayReply::abort()
{
    if (finished_) {
        return;
    }

    LOG_VERBOSE() << "GatewayReply: abort requested for" << operation_;
    emit abortRequested();
    fail(GatewayError::cancelled());
}

void GatewayReply::reportProgress(qint64 bytesDone, qint64 bytesTotal)
{
    if (finished_) {
        return;
    }

    bytesDone_ = bytesDone;
    bytesTotal_ = bytesTotal;
    emit progress(bytesDone, bytesTotal);
}

void GatewayReply::finishWithListing(const ListingPage &page)
{
    if (!markFinished()) {
        return;
    }
    listingPage_ = page;
    emit finished();
}

void GatewayReply::finishWithUrl(const QString &url)
{
    if (!markFinished()) {
        return;
    }
    url_ = url;
    emit finished();
}

void GatewayReply::finishWithMetadata(const ObjectMetadata &metadata)
{
    if (!markFinished()) {
        return;
    }
    metadata_ = metadata;
    emit finished();
}

void GatewayReply::finishSuccess()
{
    if (!markFinished()) {
        return;
    }
    emit finished();
}

void GatewayReply::fail(const GatewayError &error)
{
    if (!markFinished()) {
        return;
    }

    error_ = error;
    if (error_.kind == GatewayErrorKind::None) {
        // A failure without a kind still has to read as a failure
        error_.kind = GatewayErrorKind::Unknown;
    }
    emit finished();
}

bool GatewayReply::markFinished()
{
    if (finished_) {
        return false;
    }
    finished_ = true;
    return true;
}
