#ifndef HTTPMESSAGE_H
#define HTTPMESSAGE_H

#include <QByteArray>
#include <QHash>
#include <QString>
#include <QStringList>

namespace LfsServe {

struct HttpRequest {
    QByteArray method;
    QString path;
    QString query;
    QHash<QByteArray, QByteArray> headers; //!< names are lower case
    QByteArray body;

    QByteArray header(const QByteArray& name) const;
    QStringList pathSegments() const;
};

/**
 * Incremental HTTP/1.1 request parser. Bytes are appended as they arrive on
 * the socket; once the header block and Content-Length bytes of body are in,
 * the parser reports Complete and request() holds the message.
 */
class HttpRequestParser
{
public:
    enum class State {
        NeedMoreData,
        Complete,
        Error
    };

    //maxUploadSize bounds PUT bodies, 0 means unlimited
    explicit HttpRequestParser(qint64 maxUploadSize = 0);

    State append(const QByteArray& data);

    State state() const { return mState; }
    const HttpRequest& request() const { return mRequest; }
    int errorStatus() const { return mErrorStatus; }
    QString errorMessage() const { return mErrorMessage; }

private:
    qint64 mMaxBodySize = 0;
    QByteArray mBuffer;
    HttpRequest mRequest;
    State mState = State::NeedMoreData;
    bool mHeadersParsed = false;
    qint64 mBodyStart = 0;
    qint64 mContentLength = 0;
    int mErrorStatus = 0;
    QString mErrorMessage;

    State fail(int status, const QString& message);
    State parseHeaders(int headerEnd);
};

struct HttpResponse {
    int status = 200;
    QByteArray contentType = QByteArrayLiteral("application/json");
    QByteArray body;

    QByteArray toByteArray() const;

    static HttpResponse json(int status, const QByteArray& body, const QByteArray& contentType = QByteArrayLiteral("application/json"));
    static HttpResponse error(int status, const QString& message, const QString& requestId = QString());
    static QByteArray statusText(int status);
};

} // namespace LfsServe

#endif // HTTPMESSAGE_H
