#ifndef RECEIVERINBOX_H
#define RECEIVERINBOX_H

#include "Options.hpp"
#include "Store.hpp"
#include <QByteArray>
#include <QObject>
#include <QString>


namespace Inbox
{
class Mail;

/**
 * Accepts raw messages for the configured domains and hands them to a Store.
 */
class Receiver : public QObject
{
	Q_OBJECT

	Store* store;
	Options options;

public:
	Receiver(Store* store, const Options& options = Options(), QObject* parent = 0);

	QString Deliver(const QString& recipient, const QByteArray& rfc2822);

	static StoredEmail MakeRecord(const Mail& mail, const QString& recipient, const QString& id, qint64 createdAt,
								  const Options& options = Options());

public slots:
	void OnMessage(const QString& recipient, const QByteArray& rfc2822);

signals:
	void SignalRejected(const QString& recipient);
	void SignalError(const QString& message);
	void SignalStored(const QString& id);
};
}

#endif // RECEIVERINBOX_H
