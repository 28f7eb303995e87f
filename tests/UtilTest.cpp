#include "Util.hpp"
#include "TestHelpers.hpp"

#include <QRegExp>
#include <QSet>

#include <gtest/gtest.h>

using namespace Inbox;


TEST(HtmlToText, StripsTagsAndCollapsesWhitespace)
{
	EXPECT_EQ(QString("Hello world"), HtmlToText("<p>Hello <b>world</b></p>"));
	EXPECT_EQ(QString("one two"), HtmlToText("<div>one</div>\r\n\r\n<div>two</div>"));
	EXPECT_TRUE(HtmlToText("").isEmpty());
	EXPECT_TRUE(HtmlToText("<br/><hr>").isEmpty());
}

TEST(HtmlToText, DropsStyleAndScript)
{
	EXPECT_EQ(QString("before after"), HtmlToText(
		"<STYLE type=\"text/css\">p { color: red; }</STYLE>before "
		"<script>var x = '<b>';</script>after"));
	// each block ends at its own closing tag
	EXPECT_EQ(QString("a b c"), HtmlToText("a<style>x</style> b <style>y</style>c"));
}

TEST(HtmlToText, ResolvesEntities)
{
	EXPECT_EQ(QString("1 < 2 & 3 > \"0\""), HtmlToText("1&nbsp;&lt;&nbsp;2 &amp; 3 &gt; &quot;0&quot;"));
	// ampersand goes after nbsp, so an escaped entity stays escaped once
	EXPECT_EQ(QString("&nbsp;"), HtmlToText("&amp;nbsp;"));
	EXPECT_EQ(QString("&copy;"), HtmlToText("&copy;"));
}

TEST(ExtractPreview, ShortAndLongText)
{
	EXPECT_EQ(QString("short text"), ExtractPreview("  short\r\n\ttext  "));
	EXPECT_TRUE(ExtractPreview("").isEmpty());

	QString longText(200, QChar('x'));
	QString preview = ExtractPreview(longText);
	EXPECT_EQ(153, preview.size());
	EXPECT_TRUE(preview.endsWith("..."));
	EXPECT_EQ(QString("abcde..."), ExtractPreview("abcdefgh", 5));
	EXPECT_EQ(QString("abcde"), ExtractPreview("abcde", 5));
}

TEST(ParseAddress, DisplayNameForms)
{
	Address a = ParseAddress("\"Alice Liddell\" <Alice@Example.ORG>");
	EXPECT_EQ(QString("Alice Liddell"), a.name);
	EXPECT_EQ(QString("alice@example.org"), a.email);

	a = ParseAddress("Bob <bob@example.com>");
	EXPECT_EQ(QString("Bob"), a.name);
	EXPECT_EQ(QString("bob@example.com"), a.email);

	a = ParseAddress("<carol@example.com>");
	EXPECT_TRUE(a.name.isEmpty());
	EXPECT_EQ(QString("carol@example.com"), a.email);

	a = ParseAddress("\"Smith, <John>\" <john@example.com>");
	EXPECT_EQ(QString("Smith, <John>"), a.name);
	EXPECT_EQ(QString("john@example.com"), a.email);
}

TEST(ParseAddress, BareAndEmpty)
{
	Address a = ParseAddress("  Dave@Example.com ");
	EXPECT_TRUE(a.name.isEmpty());
	EXPECT_EQ(QString("dave@example.com"), a.email);

	a = ParseAddress("");
	EXPECT_TRUE(a.name.isEmpty());
	EXPECT_TRUE(a.email.isEmpty());

	a = ParseAddress("Eve <eve@example.com");
	EXPECT_EQ(QString("Eve"), a.name);
	EXPECT_EQ(QString("eve@example.com"), a.email);
}

TEST(IsAllowedDomain, ConfiguredDomains)
{
	QStringList domains;
	domains << "example.com" << " Mail.Example.NET ";
	EXPECT_TRUE(IsAllowedDomain("user@example.com", domains));
	EXPECT_TRUE(IsAllowedDomain("User@EXAMPLE.com", domains));
	EXPECT_TRUE(IsAllowedDomain("x@mail.example.net", domains));
	EXPECT_FALSE(IsAllowedDomain("user@sub.example.com", domains));
	EXPECT_FALSE(IsAllowedDomain("user@example.com.evil.org", domains));
	EXPECT_FALSE(IsAllowedDomain("example.com", domains));
}

TEST(IsAllowedDomain, EmptyListAcceptsAnyAddress)
{
	EXPECT_TRUE(IsAllowedDomain("a@b", QStringList()));
	EXPECT_FALSE(IsAllowedDomain("no-at-sign", QStringList()));
	EXPECT_FALSE(IsAllowedDomain("", QStringList()));
}

TEST(GenerateId, CharactersAndUniqueness)
{
	QRegExp re("[0-9a-z]+");
	QSet<QString> seen;
	for (int i = 0; i < 100; i++)
	{
		QString id = GenerateId();
		EXPECT_TRUE(re.exactMatch(id)) << id.toStdString();
		EXPECT_GT(id.size(), 8);
		seen.insert(id);
	}
	EXPECT_EQ(100, seen.size());
}

TEST(GeneratePrefix, Length)
{
	QRegExp re("[0-9a-z]+");
	QString prefix = GeneratePrefix();
	EXPECT_EQ(10, prefix.size());
	EXPECT_TRUE(re.exactMatch(prefix));
	EXPECT_EQ(4, GeneratePrefix(4).size());
	EXPECT_TRUE(GeneratePrefix(0).isEmpty());
}
