#ifndef COMMONMAIL_HPP
#define COMMONMAIL_HPP

#include "Options.hpp"
#include <QByteArray>
#include <QMap>
#include <QString>

class QTextCodec;

namespace Inbox
{
typedef QMap<QByteArray, QString> Headers; // lower-cased name -> decoded value

inline bool IsHexDigit(QChar x) { return (x >= '0' && x <= '9') || (x >= 'a' && x <= 'f') || (x >= 'A' && x <= 'F'); }

// charsets
QTextCodec* CodecForCharset(const QByteArray& charset, const Options& options = Options());
QString DecodeCharset(const QByteArray& bytes, const QByteArray& charset, const Options& options = Options());

// transfer encodings
QByteArray DecodeBase64(const QString& encoded, bool* ok = nullptr);
QByteArray DecodeQuotedPrintable(const QString& encoded);
QString DecodeContent(const QString& body, const QString& transferEncoding, const QByteArray& charset,
					  const Options& options = Options(), bool* ok = nullptr);
QByteArray DecodeBinary(const QString& body, const QString& transferEncoding, bool* ok = nullptr);

// header parameters
QString ExtractParameter(const QString& value, const QString& name);
QByteArray ExtractCharset(const QString& contentType);
QString ExtractBoundary(const QString& contentType);
QString ExtractFilename(const QString& disposition);
QString MediaType(const QString& contentType);
}
#endif // COMMONMAIL_HPP
