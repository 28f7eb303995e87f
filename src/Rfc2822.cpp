#include "AttachmentInbox.hpp"
#include "CommonMail.hpp"
#include "MailInbox.hpp"
#include "Util.hpp"

#include <QRegExp>

#include "Rfc2822.hpp"


namespace Inbox
{
/**
 * Parse all.
 */
void Rfc2822::Parse(const QByteArray& buffer)
{
	mail->raw = buffer;
	QString message = QString::fromUtf8(buffer);

	// no blank line: everything is headers
	QString headerBlock = message;
	QString body;
	int separatorLength = 0;
	int headerEnd = FindBlankLine(message, &separatorLength);
	if (headerEnd > 0)
	{
		headerBlock = message.left(headerEnd);
		body = message.mid(headerEnd + separatorLength);
	}
	mail->headers = ParseHeaders(headerBlock);

	QString contentType = mail->headers.value("content-type");
	if (contentType.isEmpty()) contentType = "text/plain";
	ParseBody(body, contentType, mail->headers.value("content-transfer-encoding"));

	if (mail->text.isEmpty() && !mail->html.isEmpty())
	{
		mail->text = HtmlToText(mail->html);
	}
}

/**
 * Position of the first empty line (CRLF CRLF or LF LF), -1 if none.
 */
int Rfc2822::FindBlankLine(const QString& text, int* separatorLength)
{
	int crlf = text.indexOf("\r\n\r\n");
	int lf = text.indexOf("\n\n");
	if (lf != -1 && (crlf == -1 || lf < crlf))
	{
		*separatorLength = 2;
		return lf;
	}
	*separatorLength = 4;
	return crlf;
}

/**
 * Header block.
 */
Headers Rfc2822::ParseHeaders(const QString& block, Headers* undecoded)
{
	Headers headers;
	currentHeaderKey.clear();
	currentHeaderValue.clear();

	for (const QString& line : block.split(QRegExp("\\r?\\n")))
	{
		ParseHeader(line, headers, undecoded);
	}
	ParseHeader("", headers, undecoded); // to store the header currently being parsed (last one)
	return headers;
}

/**
 * Header.
 */
void Rfc2822::ParseHeader(const QString& line, Headers& headers, Headers* undecoded)
{
	if (!line.isEmpty() && line.at(0).isSpace()) // continuation line
	{
		currentHeaderValue.append(line.trimmed());
		return;
	}

	// starting a new header field. Store the current one before
	if (!currentHeaderKey.isEmpty())
	{
		QString value = currentHeaderValue.join(' ');
		headers[currentHeaderKey] = DecodeWords(value);
		if (undecoded) (*undecoded)[currentHeaderKey] = value;
	}

	int colon = line.indexOf(':');
	if (colon > 0)
	{
		currentHeaderKey = line.left(colon).trimmed().toLower().toLatin1();
		currentHeaderValue = QStringList(line.mid(colon + 1).trimmed());
	} // else: empty or malformed header line. Ignore, the current header stays open.
}

/**
 * Body of the message itself.
 */
void Rfc2822::ParseBody(const QString& body, const QString& contentType, const QString& transferEncoding)
{
	if (contentType.contains("multipart", Qt::CaseInsensitive))
	{
		QString boundary = ExtractBoundary(contentType);
		if (boundary.isEmpty())
		{
			qDebug("No boundary in %s, multipart body dropped", qPrintable(contentType));
			return;
		}
		ParseMultipart(body, boundary, 1);
	}
	else if (contentType.contains("text/html", Qt::CaseInsensitive))
	{
		mail->html = DecodeText(body, transferEncoding, contentType);
	}
	else
	{
		mail->text = DecodeText(body, transferEncoding, contentType);
	}
}

/**
 * Split a multipart body on "--boundary".
 *
 * The preamble and everything from the close delimiter on are dropped, as
 * are parts without a header/body separator.
 */
QList<Part> Rfc2822::SplitMultipart(const QString& body, const QString& boundary)
{
	QList<Part> parts;
	QStringList sections = body.split("--" + boundary);
	for (int i = 1; i < sections.size(); i++)
	{
		QString section = sections[i].trimmed();
		if (section.startsWith("--")) break; // close delimiter
		if (section.isEmpty()) continue;

		int separatorLength = 0;
		int headerEnd = FindBlankLine(section, &separatorLength);
		if (headerEnd == -1)
		{
			qDebug("Part %d of %s has no header separator, skipped", i, qPrintable(boundary));
			continue;
		}

		Part part;
		part.headers = ParseHeaders(section.left(headerEnd), &part.undecodedHeaders);
		part.body = section.mid(headerEnd + separatorLength);
		parts.append(part);
	}
	return parts;
}

/**
 * Classify the parts of one multipart level.
 * depth is 1 for the message's own multipart body.
 */
void Rfc2822::ParseMultipart(const QString& body, const QString& boundary, int depth)
{
	for (const Part& part : SplitMultipart(body, boundary))
	{
		ParsePart(part, depth);
	}
}

/**
 * Part.
 * Later parts of the same kind replace earlier ones. Without nested
 * attachment collection, parts below the top level are classified by
 * type only and do not nest further.
 */
void Rfc2822::ParsePart(const Part& part, int depth)
{
	QString contentType = part.headers.value("content-type");
	if (contentType.isEmpty()) contentType = "text/plain";
	QString disposition = part.headers.value("content-disposition");
	QString transferEncoding = part.headers.value("content-transfer-encoding");
	bool isSingleLevel = depth > 1 && !options.IsCollectNestedAttachments();

	if (!isSingleLevel && disposition.contains("attachment", Qt::CaseInsensitive))
	{
		mail->attachments.append(ParseAttachment(part));
	}
	else if (contentType.contains("text/html", Qt::CaseInsensitive))
	{
		mail->html = DecodeText(part.body, transferEncoding, contentType);
	}
	else if (contentType.contains("text/plain", Qt::CaseInsensitive))
	{
		mail->text = DecodeText(part.body, transferEncoding, contentType);
	}
	else if (!isSingleLevel && contentType.contains("multipart", Qt::CaseInsensitive))
	{
		if (depth >= options.GetMaxDepth())
		{
			qDebug("Multipart nested deeper than %d levels, kept as text", options.GetMaxDepth());
			if (mail->text.isEmpty()) mail->text = DecodeText(part.body, transferEncoding, contentType);
			return;
		}
		QString boundary = ExtractBoundary(contentType);
		if (boundary.isEmpty())
		{
			qDebug("No boundary in nested %s, part dropped", qPrintable(contentType));
			return;
		}
		ParseMultipart(part.body, boundary, depth + 1);
	}
}

/**
 * Attachment.
 */
Attachment Rfc2822::ParseAttachment(const Part& part) const
{
	QString filename = ExtractFilename(part.undecodedHeaders.value("content-disposition"));
	if (filename.isEmpty())
	{
		filename = options.GetDefaultFilename();
	}
	filename = DecodeWords(filename);

	bool ok = false;
	QByteArray content = DecodeBinary(part.body, part.headers.value("content-transfer-encoding"), &ok);
	if (!ok)
	{
		qDebug("Attachment %s is not valid base64, stored undecoded", qPrintable(filename));
	}

	Attachment a(filename, content, MediaType(part.headers.value("content-type")));
	a.GetExtraHeaders() = part.headers;
	return a;
}

/**
 * Text body with the charset of its content type.
 */
QString Rfc2822::DecodeText(const QString& body, const QString& transferEncoding, const QString& contentType) const
{
	bool ok = false;
	QString text = DecodeContent(body, transferEncoding, ExtractCharset(contentType), options, &ok);
	if (!ok)
	{
		qDebug("Body declared %s could not be decoded, kept as is", qPrintable(transferEncoding));
	}
	return text;
}

/**
 * Replace encoded words (=?charset?b|q?text?=) in a header value.
 * A word that does not decode stays as it is and *ok is set to false.
 */
QString Rfc2822::DecodeWords(const QString& value, bool* ok) const
{
	if (ok) *ok = true;
	QString decoded = value;
	QRegExp encRe("=\\?([^?]+)\\?([bBqQ])\\?([^?]*)\\?="); // search for an encoded word
	int offset = 0;
	while ((offset = encRe.indexIn(decoded, offset)) != -1)
	{
		bool wordOk = false;
		QString word = Decode(encRe.cap(1), encRe.cap(2).toLower(), encRe.cap(3), &wordOk);
		if (!wordOk)
		{
			if (ok) *ok = false;
			offset += encRe.matchedLength();
			continue;
		}
		decoded.replace(offset, encRe.matchedLength(), word); // replace encoded word with decoded one
		offset += word.length(); // set offset after the inserted decoded word
	}
	return decoded;
}

/**
 * Decode.
 */
QString Rfc2822::Decode(const QString& charset, const QString& encoding, const QString& encoded, bool* ok) const
{
	QByteArray buf;
	if (encoding == "q")
	{
		buf = DecodeQuotedPrintable(QString(encoded).replace('_', ' '));
		*ok = true;
	}
	else
	{
		buf = DecodeBase64(encoded, ok);
		if (!*ok) return QString();
	}
	return DecodeCharset(buf, charset.toLatin1(), options);
}
}
