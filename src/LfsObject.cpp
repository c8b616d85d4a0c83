#include "LfsObject.h"

#include <QCryptographicHash>

namespace LfsServe {

bool LfsObject::isValid() const
{
    return isValidOid(oid) && size >= 0;
}

bool LfsObject::operator==(const LfsObject& other) const
{
    return oid == other.oid && size == other.size;
}

LfsObject LfsObject::fromData(const QByteArray& data)
{
    LfsObject object;
    object.oid = sha256Hex(data);
    object.size = data.size();
    return object;
}

bool LfsObject::isValidOid(const QString& oid)
{
    if (oid.size() != 64) {
        return false;
    }
    for (QChar ch : oid) {
        const bool isDigit = ch >= QLatin1Char('0') && ch <= QLatin1Char('9');
        const bool isLowerHex = ch >= QLatin1Char('a') && ch <= QLatin1Char('f');
        if (!isDigit && !isLowerHex) {
            return false;
        }
    }
    return true;
}

QString LfsObject::sha256Hex(const QByteArray& data)
{
    QCryptographicHash hash(QCryptographicHash::Sha256);
    hash.addData(data);
    return QString::fromLatin1(hash.result().toHex());
}

} // namespace LfsServe
