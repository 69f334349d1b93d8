/**
 * @file gatewayerror.h
 * @brief Error taxonomy for Storage Gateway failures.
 */

#ifndef GATEWAYERROR_H
#define GATEWAYERROR_H

#include <QString>

/**
 * @brief Broad classes of storage gateway failures.
 */
enum class GatewayErrorKind {
    None,              ///< No error
    Network,           ///< Connection refused, reset, timed out, DNS
    Authentication,    ///< Bad credentials or request signature
    NotFound,          ///< Missing bucket or key
    PermissionDenied,  ///< Credentials valid but operation not allowed
    InvalidRequest,    ///< Rejected arguments (bad TTL, empty key, ...)
    LocalIo,           ///< Reading or writing the local file failed
    Cancelled,         ///< Aborted by the caller
    Unknown            ///< Anything else
};

/// @brief Convert GatewayErrorKind to string for logging
[[nodiscard]] inline const char* gatewayErrorKindToString(GatewayErrorKind kind) {
    switch (kind) {
        case GatewayErrorKind::None: return "None";
        case GatewayErrorKind::Network: return "Network";
        case GatewayErrorKind::Authentication: return "Authentication";
        case GatewayErrorKind::NotFound: return "NotFound";
        case GatewayErrorKind::PermissionDenied: return "PermissionDenied";
        case GatewayErrorKind::InvalidRequest: return "InvalidRequest";
        case GatewayErrorKind::LocalIo: return "LocalIo";
        case GatewayErrorKind::Cancelled: return "Cancelled";
        case GatewayErrorKind::Unknown: return "Unknown";
    }
    return "Unknown";
}

/**
 * @brief A failure reported by the Storage Gateway.
 *
 * The message is kept verbatim: it is what ends up in a transfer record's
 * error field and in status messages.
 */
struct GatewayError {
    GatewayErrorKind kind = GatewayErrorKind::None;
    QString message;

    [[nodiscard]] bool isError() const { return kind != GatewayErrorKind::None; }

    /**
     * @brief Returns true if the error indicates the connection itself is bad.
     *
     * Network and authentication failures say something about the connection;
     * a missing key or a denied operation does not.
     */
    [[nodiscard]] bool affectsConnectionHealth() const {
        return kind == GatewayErrorKind::Network || kind == GatewayErrorKind::Authentication;
    }

    /**
     * @brief Builds an error, guessing the kind from a provider message.
     * @param message Error text as returned by the provider.
     */
    [[nodiscard]] static GatewayError fromMessage(const QString &message);

    [[nodiscard]] static GatewayError cancelled();
};

#endif // GATEWAYERROR_H
