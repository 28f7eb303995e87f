#ifndef STORE_HPP
#define STORE_HPP

#include <QByteArray>
#include <QString>
#include <QtGlobal>


namespace Inbox
{
struct StoredEmail
{
	QString id;
	QString address;
	QString fromAddress;
	QString fromName;
	QString subject;
	QString textContent;
	QString htmlContent;
	QByteArray rawEmail;
	bool hasAttachments = false;
	qint64 createdAt = 0; // ms since epoch
};

struct StoredAttachment
{
	QString id;
	QString emailId;
	QString filename;
	QString contentType;
	int size = 0;
	QByteArray content;
	qint64 createdAt = 0;
};

/**
 * Persistent storage for received mail.
 * Implementations return false when a record could not be written.
 */
class Store
{
public:
	virtual ~Store() {}

	virtual bool SaveEmail(const StoredEmail& email) = 0;
	virtual bool SaveAttachment(const StoredAttachment& attachment) = 0;
};
}

#endif // STORE_HPP
