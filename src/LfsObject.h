#ifndef LFSOBJECT_H
#define LFSOBJECT_H

#include <QByteArray>
#include <QString>

namespace LfsServe {

struct LfsObject {
    QString oid;
    qint64 size = 0;

    bool isValid() const;
    bool operator==(const LfsObject& other) const;
    bool operator!=(const LfsObject& other) const { return !(*this == other); }

    static LfsObject fromData(const QByteArray& data);
    static bool isValidOid(const QString& oid);
    static QString sha256Hex(const QByteArray& data);
};

} // namespace LfsServe

#endif // LFSOBJECT_H
