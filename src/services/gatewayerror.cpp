#include "gatewayerror.h"

#include <QCoreApplication>
#include <QStringList>

namespace {

bool containsAny(const QString &text, const QStringList &needles)
{
    for (const QString &needle : needles) {
        if (text.contains(needle, Qt::CaseInsensitive)) {
            return true;
        }
    }
    return false;
}

} // namespace

GatewayError GatewayError::fromMessage(const QString &message)
{
    GatewayError err;
    err.message = message;

    // Provider error codes first: the rest of the message usually echoes the
    // key, which can contain any of the looser words below.
    if (containsAny(message, {"NoSuchKey", "NoSuchBucket", "NoSuchUpload"})) {
        err.kind = GatewayErrorKind::NotFound;
    } else if (containsAny(message, {"AccessDenied", "Forbidden", "permission denied",
                                     "AllAccessDisabled"})) {
        err.kind = GatewayErrorKind::PermissionDenied;
    } else if (containsAny(message, {"InvalidAccessKeyId", "SignatureDoesNotMatch",
                                     "ExpiredToken", "InvalidToken", "Unauthorized"})) {
        err.kind = GatewayErrorKind::Authentication;
    } else if (containsAny(message, {"InvalidArgument", "InvalidRequest", "InvalidBucketName",
                                     "KeyTooLong"})) {
        err.kind = GatewayErrorKind::InvalidRequest;
    } else if (containsAny(message, {"timed out", "timeout", "connection refused",
                                     "connection reset", "host not found", "network",
                                     "unreachable"})) {
        err.kind = GatewayErrorKind::Network;
    } else if (containsAny(message, {"not found", "404"})) {
        err.kind = GatewayErrorKind::NotFound;
    } else {
        err.kind = GatewayErrorKind::Unknown;
    }

    return err;
}

GatewayError GatewayError::cancelled()
{
    GatewayError err;
    err.kind = GatewayErrorKind::Cancelled;
    err.message = QCoreApplication::translate("GatewayError", "Cancelled");
    return err;
}
