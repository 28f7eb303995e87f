#ifndef RFC2822_HPP
#define RFC2822_HPP

#include "CommonMail.hpp"
#include "Options.hpp"
#include <QByteArray>
#include <QList>
#include <QStringList>


namespace Inbox
{
class Mail;
class Attachment;

/**
 * One body part of a multipart entity, not decoded yet.
 */
struct Part
{
	Headers headers;
	Headers undecodedHeaders; // before encoded-word decoding
	QString body;
};

class Rfc2822
{
	Mail* mail;
	Options options;
	QByteArray currentHeaderKey;
	QStringList currentHeaderValue;

public:
	Rfc2822(Mail* mail, const Options& options = Options()) : mail(mail), options(options) {}

	void Parse(const QByteArray& buffer);

	Headers ParseHeaders(const QString& block, Headers* undecoded = nullptr);
	QList<Part> SplitMultipart(const QString& body, const QString& boundary);
	QString DecodeWords(const QString& value, bool* ok = nullptr) const;

	static int FindBlankLine(const QString& text, int* separatorLength);

private:
	void ParseHeader(const QString& line, Headers& headers, Headers* undecoded);
	void ParseBody(const QString& body, const QString& contentType, const QString& transferEncoding);
	void ParseMultipart(const QString& body, const QString& boundary, int depth);
	void ParsePart(const Part& part, int depth);
	Attachment ParseAttachment(const Part& part) const;
	QString DecodeText(const QString& body, const QString& transferEncoding, const QString& contentType) const;
	QString Decode(const QString& charset, const QString& encoding, const QString& encoded, bool* ok) const;
};
}

#endif // RFC2822_HPP
