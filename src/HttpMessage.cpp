#include "HttpMessage.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QUrl>

namespace {
constexpr int MaxHeaderBytes = 64 * 1024;
constexpr qint64 MaxDocumentBytes = 16 * 1024 * 1024;
}

namespace LfsServe {

QByteArray HttpRequest::header(const QByteArray& name) const
{
    return headers.value(name.toLower());
}

QStringList HttpRequest::pathSegments() const
{
    QStringList segments;
    const auto parts = path.split(QLatin1Char('/'), Qt::SkipEmptyParts);
    for (const QString& part : parts) {
        segments.append(QUrl::fromPercentEncoding(part.toUtf8()));
    }
    return segments;
}

HttpRequestParser::HttpRequestParser(qint64 maxUploadSize)
    : mMaxBodySize(maxUploadSize)
{
}

HttpRequestParser::State HttpRequestParser::fail(int status, const QString& message)
{
    mState = State::Error;
    mErrorStatus = status;
    mErrorMessage = message;
    return mState;
}

HttpRequestParser::State HttpRequestParser::parseHeaders(int headerEnd)
{
    const QByteArray headerBlock = mBuffer.left(headerEnd);
    const QList<QByteArray> lines = headerBlock.split('\n');

    const QList<QByteArray> requestLine = lines.value(0).trimmed().split(' ');
    if (requestLine.size() != 3 || !requestLine.at(2).startsWith("HTTP/1.")) {
        return fail(400, QStringLiteral("Malformed request line"));
    }

    mRequest.method = requestLine.at(0).toUpper();
    const QByteArray target = requestLine.at(1);
    const int queryIndex = target.indexOf('?');
    mRequest.path = QString::fromUtf8(queryIndex >= 0 ? target.left(queryIndex) : target);
    mRequest.query = queryIndex >= 0 ? QString::fromUtf8(target.mid(queryIndex + 1)) : QString();

    for (int i = 1; i < lines.size(); ++i) {
        const QByteArray line = lines.at(i).trimmed();
        if (line.isEmpty()) {
            continue;
        }
        const int colon = line.indexOf(':');
        if (colon <= 0) {
            return fail(400, QStringLiteral("Malformed header line"));
        }
        mRequest.headers.insert(line.left(colon).trimmed().toLower(), line.mid(colon + 1).trimmed());
    }

    if (!mRequest.header("transfer-encoding").isEmpty()) {
        return fail(411, QStringLiteral("Chunked transfer encoding is not supported"));
    }

    mContentLength = 0;
    const QByteArray contentLength = mRequest.header("content-length");
    if (!contentLength.isEmpty()) {
        bool ok = false;
        mContentLength = contentLength.toLongLong(&ok);
        if (!ok || mContentLength < 0) {
            return fail(400, QStringLiteral("Invalid Content-Length"));
        }
    }

    //Only object uploads may exceed the JSON document limit
    const qint64 limit = mRequest.method == "PUT" ? mMaxBodySize : MaxDocumentBytes;
    if (limit > 0 && mContentLength > limit) {
        return fail(413, QStringLiteral("Request body of %1 bytes exceeds the limit of %2 bytes")
                             .arg(mContentLength)
                             .arg(limit));
    }

    mHeadersParsed = true;
    mBodyStart = headerEnd + 4;
    return State::NeedMoreData;
}

HttpRequestParser::State HttpRequestParser::append(const QByteArray& data)
{
    if (mState != State::NeedMoreData) {
        return mState;
    }

    mBuffer.append(data);

    if (!mHeadersParsed) {
        const int headerEnd = mBuffer.indexOf("\r\n\r\n");
        if (headerEnd < 0) {
            if (mBuffer.size() > MaxHeaderBytes) {
                return fail(431, QStringLiteral("Request header block too large"));
            }
            return mState;
        }
        if (parseHeaders(headerEnd) == State::Error) {
            return mState;
        }
    }

    const qint64 receivedBodyBytes = mBuffer.size() - mBodyStart;
    if (receivedBodyBytes < mContentLength) {
        return mState;
    }

    mRequest.body = mBuffer.mid(mBodyStart, mContentLength);
    mState = State::Complete;
    return mState;
}

QByteArray HttpResponse::statusText(int status)
{
    switch (status) {
    case 200: return QByteArrayLiteral("OK");
    case 400: return QByteArrayLiteral("Bad Request");
    case 403: return QByteArrayLiteral("Forbidden");
    case 404: return QByteArrayLiteral("Not Found");
    case 405: return QByteArrayLiteral("Method Not Allowed");
    case 408: return QByteArrayLiteral("Request Timeout");
    case 409: return QByteArrayLiteral("Conflict");
    case 411: return QByteArrayLiteral("Length Required");
    case 413: return QByteArrayLiteral("Payload Too Large");
    case 422: return QByteArrayLiteral("Unprocessable Entity");
    case 431: return QByteArrayLiteral("Request Header Fields Too Large");
    case 500: return QByteArrayLiteral("Internal Server Error");
    case 502: return QByteArrayLiteral("Bad Gateway");
    case 504: return QByteArrayLiteral("Gateway Timeout");
    default: return QByteArrayLiteral("Unknown");
    }
}

QByteArray HttpResponse::toByteArray() const
{
    return "HTTP/1.1 " + QByteArray::number(status) + " " + statusText(status) + "\r\n"
           "Content-Type: " + contentType + "\r\n"
           "Connection: close\r\n"
           "Content-Length: " + QByteArray::number(body.size()) + "\r\n"
           "\r\n" + body;
}

HttpResponse HttpResponse::json(int status, const QByteArray& body, const QByteArray& contentType)
{
    HttpResponse response;
    response.status = status;
    response.contentType = contentType;
    response.body = body;
    return response;
}

HttpResponse HttpResponse::error(int status, const QString& message, const QString& requestId)
{
    QJsonObject object;
    object.insert(QStringLiteral("message"), message);
    if (!requestId.isEmpty()) {
        object.insert(QStringLiteral("request_id"), requestId);
    }
    return json(status, QJsonDocument(object).toJson(QJsonDocument::Compact));
}

} // namespace LfsServe
