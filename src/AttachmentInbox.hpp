#ifndef ATTACHMENTINBOX_H
#define ATTACHMENTINBOX_H

#include "CommonMail.hpp"
#include <QByteArray>
#include <QString>


namespace Inbox
{

class Attachment
{
	QString filename;
	QString contentType;
	QByteArray content;
	Headers extraHeaders;

public:
	Attachment() : filename("attachment"), contentType("application/octet-stream") {}
	Attachment(const QString& filename, const QByteArray& content, const QString& contentType = "application/octet-stream");
	virtual ~Attachment();

	QString GetFilename() const { return filename; }
	QString GetContentType() const { return contentType; }
	QByteArray GetContent() const { return content; }
	int GetSize() const { return content.size(); }
	Headers& GetExtraHeaders() { return extraHeaders; }
	const Headers& GetExtraHeaders() const { return extraHeaders; }
};

}
#endif // ATTACHMENTINBOX_H
