#include "AttachmentInbox.hpp"
#include "MailInbox.hpp"
#include "Util.hpp"

#include <QDateTime>

#include "ReceiverInbox.hpp"


namespace Inbox
{
Receiver::Receiver(Store* store, const Options& options, QObject* parent)
	: QObject(parent)
	, store(store)
	, options(options)
{}

/**
 * Parse and store one message.
 * Returns the new email id, or an empty string if the message was rejected
 * or could not be stored.
 */
QString Receiver::Deliver(const QString& recipient, const QByteArray& rfc2822)
{
	QString address = recipient.trimmed().toLower();
	if (!IsAllowedDomain(address, options.GetDomains()))
	{
		qDebug("Rejected email to %s: domain not allowed", qPrintable(address));
		emit SignalRejected(address);
		return QString();
	}
	if (!store)
	{
		emit SignalError(QString("No store configured, email to %1 dropped").arg(address));
		return QString();
	}

	Mail mail(rfc2822, options);
	QString id = GenerateId();
	qint64 now = QDateTime::currentMSecsSinceEpoch();

	StoredEmail email = MakeRecord(mail, address, id, now, options);
	if (!store->SaveEmail(email))
	{
		qWarning("Error handling email to %s: saving %s failed", qPrintable(address), qPrintable(id));
		emit SignalError(QString("Saving email failed: %1 - %2").arg(id).arg(address));
		return QString();
	}

	for (const Attachment& a : mail.GetAttachments())
	{
		StoredAttachment attachment;
		attachment.id = GenerateId();
		attachment.emailId = id;
		attachment.filename = a.GetFilename();
		attachment.contentType = a.GetContentType();
		attachment.size = a.GetSize();
		attachment.content = a.GetContent();
		attachment.createdAt = now;
		if (!store->SaveAttachment(attachment))
		{
			qWarning("Error handling email %s: saving attachment %s failed", qPrintable(id), qPrintable(attachment.filename));
			emit SignalError(QString("Saving attachment failed: %1 - %2").arg(attachment.filename).arg(id));
			return QString();
		}
	}

	qDebug("Email saved: %s to %s from %s", qPrintable(id), qPrintable(address), qPrintable(email.fromAddress));
	emit SignalStored(id);
	return id;
}

/**
 * Storage record for a parsed mail.
 */
StoredEmail Receiver::MakeRecord(const Mail& mail, const QString& recipient, const QString& id, qint64 createdAt,
								 const Options& options)
{
	Address from = ParseAddress(mail.GetHeader("from"));
	QString subject = mail.GetSubject();

	StoredEmail email;
	email.id = id;
	email.address = recipient;
	email.fromAddress = from.email;
	email.fromName = from.name;
	email.subject = subject.isEmpty() ? options.GetSubjectPlaceholder() : subject;
	email.textContent = mail.GetText();
	email.htmlContent = mail.GetHtml();
	email.rawEmail = mail.GetRaw();
	email.hasAttachments = mail.HasAttachments();
	email.createdAt = createdAt;
	return email;
}

/**
 * Single message delivery, errors are reported through the signals.
 */
void Receiver::OnMessage(const QString& recipient, const QByteArray& rfc2822)
{
	Deliver(recipient, rfc2822);
}
}
