#include "CommonMail.hpp"

#include "AttachmentInbox.hpp"


namespace Inbox
{
/**
 * Construct with decoded content.
 */
Attachment::Attachment(const QString& filename, const QByteArray& content, const QString& contentType)
	: filename(filename)
	, contentType(contentType)
	, content(content)
{}

Attachment::~Attachment()
{}
}
