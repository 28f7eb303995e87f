#include <QDateTime>
#include <QRandomGenerator>
#include <QRegExp>

#include "Util.hpp"


namespace Inbox
{
static QString RandomString(int length)
{
	static const char chars[] = "abcdefghijklmnopqrstuvwxyz0123456789";
	QString result;
	result.reserve(length);
	for (int i = 0; i < length; i++)
	{
		result += QLatin1Char(chars[QRandomGenerator::system()->bounded(36)]);
	}
	return result;
}

static QString Unquote(const QString& s)
{
	QString unquoted = s.trimmed();
	if (unquoted.size() >= 2 && unquoted.startsWith('"') && unquoted.endsWith('"'))
	{
		unquoted = unquoted.mid(1, unquoted.size() - 2).trimmed();
	}
	return unquoted;
}

/**
 * Readable text from HTML, for mails that come without a text/plain part.
 * Not a renderer: scripts and styles are dropped, tags become spaces and only
 * a handful of entities are resolved.
 */
QString HtmlToText(const QString& html)
{
	if (html.isEmpty()) return QString();

	QString text = html;
	QRegExp styleRe("<style[^>]*>[\\s\\S]*</style>", Qt::CaseInsensitive);
	styleRe.setMinimal(true);
	QRegExp scriptRe("<script[^>]*>[\\s\\S]*</script>", Qt::CaseInsensitive);
	scriptRe.setMinimal(true);
	text.remove(styleRe);
	text.remove(scriptRe);
	text.replace(QRegExp("<[^>]+>"), " ");

	text.replace("&nbsp;", " ");
	text.replace("&amp;", "&");
	text.replace("&lt;", "<");
	text.replace("&gt;", ">");
	text.replace("&quot;", "\"");
	return text.simplified();
}

/**
 * First maxLength characters of the text, whitespace collapsed.
 */
QString ExtractPreview(const QString& text, int maxLength)
{
	if (text.isEmpty()) return QString();
	QString cleaned = text.simplified();
	if (cleaned.length() <= maxLength) return cleaned;
	return cleaned.left(maxLength) + "...";
}

/**
 * Split "Name" <user@host> into display name and lower-cased address.
 */
Address ParseAddress(const QString& value)
{
	Address result;
	QString address = value.trimmed();
	if (address.isEmpty()) return result;

	int parenDepth = 0;
	int addrStart = -1;
	bool inQuote = false;
	int ct = address.length();

	for (int i = 0; i < ct; i++)
	{
		QChar ch = address[i];
		if (inQuote)
		{
			if (ch == '"')
				inQuote = false;
		}
		else if (addrStart != -1)
		{
			if (ch == '>')
			{
				result.name = Unquote(address.left(addrStart - 1));
				result.email = address.mid(addrStart, (i - addrStart)).trimmed().toLower();
				return result;
			}
		}
		else if (ch == '(')
		{
			parenDepth++;
		}
		else if (ch == ')')
		{
			parenDepth--;
			if (parenDepth < 0) parenDepth = 0;
		}
		else if (ch == '"')
		{
			if (parenDepth == 0)
				inQuote = true;
		}
		else if (ch == '<')
		{
			if (!inQuote && parenDepth == 0)
				addrStart = i + 1;
		}
	}

	if (addrStart != -1) // unterminated '<'
	{
		result.name = Unquote(address.left(addrStart - 1));
		result.email = address.mid(addrStart).trimmed().toLower();
	}
	else
	{
		result.email = address.toLower();
	}
	return result;
}

/**
 * True if the address is in one of the domains.
 * An empty domain list accepts every address.
 */
bool IsAllowedDomain(const QString& address, const QStringList& domains)
{
	QString lower = address.trimmed().toLower();
	if (!lower.contains('@')) return false;
	if (domains.isEmpty()) return true;

	for (const QString& domain : domains)
	{
		if (lower.endsWith("@" + domain.trimmed().toLower())) return true;
	}
	return false;
}

/**
 * Unique id: base 36 timestamp followed by 8 random characters.
 */
QString GenerateId()
{
	return QString::number(QDateTime::currentMSecsSinceEpoch(), 36) + RandomString(8);
}

/**
 * Random mailbox name.
 */
QString GeneratePrefix(int length)
{
	return RandomString(length);
}
}
