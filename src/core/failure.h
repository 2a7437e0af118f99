#pragma once
#include "types.h"
#include <QString>
#include <QJsonObject>

struct DomainFailure {
    ErrorKind   kind = ErrorKind::Internal;
    QString     code;
    QString     message;

    int httpStatus() const;
    QJsonObject toJson(Dialect dialect) const;

    static DomainFailure unknownProvider(const QString& model);
    static DomainFailure unknownModel(const QString& provider, const QString& model);
    static DomainFailure routeNotFound(const QString& method, const QString& path);
    static DomainFailure malformedRequest(const QString& code, const QString& msg);
    static DomainFailure payloadTooLarge(const QString& msg);
    static DomainFailure headerTooLarge(const QString& msg);
    static DomainFailure notSupported(const QString& code, const QString& msg);
    static DomainFailure upstreamUnreachable(const QString& msg);
    static DomainFailure upstreamTimeout(const QString& msg);
    static DomainFailure configurationInvalid(const QString& msg);
    static DomainFailure internal(const QString& msg);
};

QString errorKindName(ErrorKind kind);
