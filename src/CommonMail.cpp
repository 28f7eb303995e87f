#include <QRegExp>
#include <QTextCodec>

#include "CommonMail.hpp"


namespace Inbox
{
/**
 * Codec for a charset label.
 * Labels the options do not know map to UTF-8; never returns null.
 */
QTextCodec* CodecForCharset(const QByteArray& charset, const Options& options)
{
	QByteArray name = options.CodecNameFor(charset);
	QTextCodec* codec = QTextCodec::codecForName(name);
	if (!codec)
	{
		qDebug("Codec %s not available, decoding %s as UTF-8", name.data(), charset.data());
		codec = QTextCodec::codecForMib(106);
	}
	return codec;
}

/**
 * Bytes to text.
 * Invalid sequences become U+FFFD, this step never fails.
 */
QString DecodeCharset(const QByteArray& bytes, const QByteArray& charset, const Options& options)
{
	return CodecForCharset(charset, options)->toUnicode(bytes);
}

/**
 * Base64, whitespace ignored.
 * On malformed input returns an empty array and sets *ok to false.
 */
QByteArray DecodeBase64(const QString& encoded, bool* ok)
{
	QByteArray src;
	src.reserve(encoded.size());
	for (QChar ch : encoded)
	{
		if (!ch.isSpace()) src += ch.unicode() < 0x80 ? char(ch.unicode()) : '?';
	}

	QByteArray::FromBase64Result result =
		QByteArray::fromBase64Encoding(src, QByteArray::Base64Encoding | QByteArray::AbortOnBase64DecodingErrors);
	if (ok) *ok = bool(result);
	return result ? result.decoded : QByteArray();
}

/**
 * Quoted-printable.
 * Soft line breaks are dropped first, then every =XX becomes one byte and
 * every other character its own code unit.
 */
QByteArray DecodeQuotedPrintable(const QString& encoded)
{
	QString src = encoded;
	src.remove(QRegExp("=\\r?\\n"));

	QByteArray buf;
	int len = src.length();
	buf.reserve(len);
	for (int i = 0; i < len; i++)
	{
		if (src.at(i) == '=' && i + 2 < len && IsHexDigit(src.at(i+1)) && IsHexDigit(src.at(i+2)))
		{
			buf += char(src.mid(i + 1, 2).toInt(nullptr, 16));
			i += 2;
		}
		else
		{
			buf += char(src.at(i).unicode() & 0xff);
		}
	}
	return buf;
}

/**
 * Decode a text body.
 * Identity for anything that is neither base64 nor quoted-printable.
 * A body that is not valid base64 is returned as is with *ok set to false.
 */
QString DecodeContent(const QString& body, const QString& transferEncoding, const QByteArray& charset,
					  const Options& options, bool* ok)
{
	if (ok) *ok = true;
	if (body.isEmpty()) return QString();

	QString encoding = transferEncoding.toLower();
	if (encoding.contains("base64"))
	{
		bool decoded = false;
		QByteArray bytes = DecodeBase64(body, &decoded);
		if (!decoded)
		{
			if (ok) *ok = false;
			return body;
		}
		return DecodeCharset(bytes, charset, options);
	}
	if (encoding.contains("quoted-printable"))
	{
		return DecodeCharset(DecodeQuotedPrintable(body), charset, options);
	}
	return body;
}

/**
 * Decode an attachment body to bytes.
 *
 * base64 is binary-safe. Quoted-printable goes through UTF-8 text and back,
 * and identity takes every character as one Latin-1 byte, so binary content
 * without base64 wrapping does not survive.
 */
QByteArray DecodeBinary(const QString& body, const QString& transferEncoding, bool* ok)
{
	if (ok) *ok = true;

	QString encoding = transferEncoding.toLower();
	if (encoding.contains("base64"))
	{
		bool decoded = false;
		QByteArray bytes = DecodeBase64(body, &decoded);
		if (!decoded)
		{
			if (ok) *ok = false;
			return body.toUtf8();
		}
		return bytes;
	}
	if (encoding.contains("quoted-printable"))
	{
		return QString::fromUtf8(DecodeQuotedPrintable(body)).toUtf8();
	}
	return body.toLatin1();
}

/**
 * Value of a header parameter (name=value; name="value"; ...).
 *
 * The name matches case-insensitively. Values may be quoted with " (backslash
 * escapes allowed) or ', in which case ';' is part of the value.
 */
QString ExtractParameter(const QString& value, const QString& name)
{
	const QString wanted = name.toLower();
	const int len = value.length();
	int i = 0;
	while (i < len)
	{
		int start = i;
		while (i < len && value[i] != '=' && value[i] != ';') i++;
		if (i >= len) break;
		if (value[i] == ';')
		{
			i++;
			continue;
		}
		// last word before '=', a missing ';' after the media type is tolerated
		QString key = value.mid(start, i - start).trimmed().toLower().section(QRegExp("\\s+"), -1);
		i++;

		while (i < len && (value[i] == ' ' || value[i] == '\t')) i++;
		QString param;
		if (i < len && (value[i] == '"' || value[i] == '\''))
		{
			QChar quote = value[i++];
			while (i < len && value[i] != quote)
			{
				if (quote == '"' && value[i] == '\\' && i + 1 < len) i++;
				param += value[i++];
			}
			while (i < len && value[i] != ';') i++;
		}
		else
		{
			start = i;
			while (i < len && value[i] != ';') i++;
			param = value.mid(start, i - start).trimmed();
		}
		if (key == wanted) return param;
		i++;
	}
	return QString();
}

/**
 * Charset of a Content-Type value, utf-8 if absent.
 */
QByteArray ExtractCharset(const QString& contentType)
{
	QString charset = ExtractParameter(contentType, "charset");
	return charset.isEmpty() ? QByteArray("utf-8") : charset.toLatin1();
}

/**
 * Boundary of a multipart Content-Type value, empty if absent.
 */
QString ExtractBoundary(const QString& contentType)
{
	return ExtractParameter(contentType, "boundary");
}

/**
 * Filename of a Content-Disposition value, empty if absent.
 */
QString ExtractFilename(const QString& disposition)
{
	return ExtractParameter(disposition, "filename");
}

/**
 * Media type/sub-type without parameters (e.g. text/plain, image/png...).
 */
QString MediaType(const QString& contentType)
{
	QString type = contentType.section(';', 0, 0).trimmed().toLower();
	return type.isEmpty() ? QString("text/plain") : type;
}
}
