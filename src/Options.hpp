#ifndef OPTIONS_HPP
#define OPTIONS_HPP

#include <QByteArray>
#include <QHash>
#include <QString>
#include <QStringList>
#include <QtGlobal>


namespace Inbox
{
/**
 * Parser and delivery settings.
 * Passed by value to Mail, Rfc2822 and Receiver; there is no global state.
 */
class Options
{
	int maxDepth = 10;
	bool isCollectNestedAttachments = true;
	QString defaultFilename;
	QString subjectPlaceholder;
	QStringList domains;
	QHash<QByteArray, QByteArray> charsetAliases; // normalized label -> codec name

public:
	Options();

	static Options FromEnvironment();

	int GetMaxDepth() const { return maxDepth; }
	bool IsCollectNestedAttachments() const { return isCollectNestedAttachments; }
	QString GetDefaultFilename() const { return defaultFilename; }
	QString GetSubjectPlaceholder() const { return subjectPlaceholder; }
	QStringList GetDomains() const { return domains; }

	void SetMaxDepth(int depth) { maxDepth = qBound(1, depth, 64); }
	void SetCollectNestedAttachments(bool isOn) { isCollectNestedAttachments = isOn; }
	void SetDefaultFilename(const QString& filename) { defaultFilename = filename; }
	void SetSubjectPlaceholder(const QString& subject) { subjectPlaceholder = subject; }
	void SetDomains(const QStringList& domains);

	void AddCharsetAlias(const QByteArray& label, const QByteArray& codecName);
	void RemoveCharsetAlias(const QByteArray& label);
	QByteArray CodecNameFor(const QByteArray& label) const;
};

QByteArray NormalizeCharset(const QByteArray& label);
}

#endif // OPTIONS_HPP
