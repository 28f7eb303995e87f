#ifndef UTIL_HPP
#define UTIL_HPP

#include <QString>
#include <QStringList>


namespace Inbox
{
struct Address
{
	QString name;
	QString email;
};

QString HtmlToText(const QString& html);
QString ExtractPreview(const QString& text, int maxLength = 150);

Address ParseAddress(const QString& value);
bool IsAllowedDomain(const QString& address, const QStringList& domains);

QString GenerateId();
QString GeneratePrefix(int length = 10);
}

#endif // UTIL_HPP
