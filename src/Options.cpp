#include <QtGlobal>

#include "Options.hpp"


namespace Inbox
{
Options::Options()
	: defaultFilename("attachment")
	, subjectPlaceholder(QString::fromUtf8("(无主题)"))
{
	AddCharsetAlias("utf-8", "UTF-8");
	AddCharsetAlias("us-ascii", "UTF-8");
	AddCharsetAlias("gbk", "GBK");
	AddCharsetAlias("gb2312", "GBK");
	AddCharsetAlias("gb18030", "GB18030");
	AddCharsetAlias("big5", "Big5");
	AddCharsetAlias("iso-8859-1", "ISO-8859-1");
	AddCharsetAlias("latin1", "ISO-8859-1");
	AddCharsetAlias("windows-1252", "windows-1252");
	AddCharsetAlias("cp1252", "windows-1252");
}

/**
 * Defaults overridden by INBOX_* environment variables.
 */
Options Options::FromEnvironment()
{
	Options options;

	QString domains = qEnvironmentVariable("INBOX_DOMAINS");
	if (!domains.isEmpty())
	{
		options.SetDomains(domains.split(',', Qt::SkipEmptyParts));
	}

	bool ok = false;
	int depth = qEnvironmentVariableIntValue("INBOX_MAX_DEPTH", &ok);
	if (ok)
	{
		options.SetMaxDepth(depth);
	}
	else if (qEnvironmentVariableIsSet("INBOX_MAX_DEPTH"))
	{
		qWarning("INBOX_MAX_DEPTH is not a number, keeping %d", options.GetMaxDepth());
	}

	if (qEnvironmentVariableIsSet("INBOX_SUBJECT_PLACEHOLDER"))
	{
		options.SetSubjectPlaceholder(qEnvironmentVariable("INBOX_SUBJECT_PLACEHOLDER"));
	}
	return options;
}

/**
 * Domains are kept trimmed and lower-cased.
 */
void Options::SetDomains(const QStringList& list)
{
	domains.clear();
	for (const QString& domain : list)
	{
		QString d = domain.trimmed().toLower();
		if (!d.isEmpty()) domains.append(d);
	}
}

/**
 * Add charset alias.
 */
void Options::AddCharsetAlias(const QByteArray& label, const QByteArray& codecName)
{
	charsetAliases[NormalizeCharset(label)] = codecName;
}

/**
 * Remove charset alias.
 */
void Options::RemoveCharsetAlias(const QByteArray& label)
{
	charsetAliases.remove(NormalizeCharset(label));
}

/**
 * Codec name for a charset label, UTF-8 if unknown.
 */
QByteArray Options::CodecNameFor(const QByteArray& label) const
{
	return charsetAliases.value(NormalizeCharset(label), "UTF-8");
}

/**
 * Strip everything but letters and digits, lower case.
 */
QByteArray NormalizeCharset(const QByteArray& label)
{
	QByteArray normalized;
	for (char c : label)
	{
		if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) normalized += c;
		else if (c >= 'A' && c <= 'Z') normalized += char(c - 'A' + 'a');
	}
	return normalized;
}
}
