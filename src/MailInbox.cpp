#include "AttachmentInbox.hpp"
#include "CommonMail.hpp"
#include "Rfc2822.hpp"

#include "MailInbox.hpp"


namespace Inbox
{
Mail::Mail()
{}

Mail::Mail(const QByteArray& rfc2822, const Options& options)
{
	Rfc2822 parser(this, options);
	parser.Parse(rfc2822);
}

Mail::~Mail()
{}
}
