#ifndef MAILINBOX_H
#define MAILINBOX_H

#include "AttachmentInbox.hpp"
#include "CommonMail.hpp"
#include "Options.hpp"
#include <QList>
#include <QString>


namespace Inbox
{
/**
 * A received message, decoded.
 */
class Mail
{
	friend class Rfc2822;

	Headers headers;
	QString text, html;
	QList<Attachment> attachments;
	QByteArray raw;

public:
	Mail();
	Mail(const QByteArray& rfc2822, const Options& options = Options());
	virtual ~Mail();

	const Headers& GetHeaders() const { return headers; }
	QString GetHeader(const QByteArray& key) const { return headers.value(key.toLower()); }
	QString GetSubject() const { return GetHeader("subject"); }
	QString GetText() const { return text; }
	QString GetHtml() const { return html; }
	const QList<Attachment>& GetAttachments() const { return attachments; }
	bool HasAttachments() const { return !attachments.isEmpty(); }
	QByteArray GetRaw() const { return raw; }
};

}

#endif // MAILINBOX_H
