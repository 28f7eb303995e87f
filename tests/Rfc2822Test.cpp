#include "MailInbox.hpp"
#include "Rfc2822.hpp"
#include "TestHelpers.hpp"

#include <gtest/gtest.h>

using namespace Inbox;


class Rfc2822Test : public ::testing::Test
{
protected:
	Mail mail;
	Rfc2822 parser{&mail};
};

TEST_F(Rfc2822Test, FoldedHeader)
{
	Headers headers = parser.ParseHeaders("Subject: Hello\r\n World");
	ASSERT_EQ(1, headers.size());
	EXPECT_EQ(QString("Hello World"), headers.value("subject"));
}

TEST_F(Rfc2822Test, FoldingWithTabsAndBareLf)
{
	Headers headers = parser.ParseHeaders(
		"To: bob@example.com\n"
		"Subject: Do\n"
		"   we\n"
		"\thandle   \n"
		" folded fields?\n"
		"Message-ID: <two@example.com>");
	EXPECT_EQ(QString("bob@example.com"), headers.value("to"));
	EXPECT_EQ(QString("Do we handle folded fields?"), headers.value("subject"));
	EXPECT_EQ(QString("<two@example.com>"), headers.value("message-id"));
}

TEST_F(Rfc2822Test, KeysAreLowerCasedAndLastOneWins)
{
	Headers headers = parser.ParseHeaders(
		"X-Spam-Score: 1\r\n"
		"CONTENT-type :  text/plain  \r\n"
		"x-spam-score: 7\r\n");
	EXPECT_EQ(2, headers.size());
	EXPECT_EQ(QString("text/plain"), headers.value("content-type"));
	EXPECT_EQ(QString("7"), headers.value("x-spam-score"));
}

TEST_F(Rfc2822Test, MalformedLinesAreDropped)
{
	Headers headers = parser.ParseHeaders(
		"Subject: a\r\n"
		"this line has no colon\r\n"
		" b\r\n"
		": no name\r\n"
		"From: x@y.z");
	EXPECT_EQ(2, headers.size());
	EXPECT_EQ(QString("a b"), headers.value("subject"));
	EXPECT_EQ(QString("x@y.z"), headers.value("from"));

	EXPECT_TRUE(parser.ParseHeaders("no colon anywhere\r\n\tat all").isEmpty());
	EXPECT_TRUE(parser.ParseHeaders("").isEmpty());
}

TEST_F(Rfc2822Test, EncodedWordsInMixedCharsets)
{
	bool ok = false;
	QString subject = parser.DecodeWords("=?gb2312?B?1tDOxA==?= =?utf-8?Q?plain?=", &ok);
	EXPECT_TRUE(ok);
	EXPECT_EQ(QString::fromUtf8("\xe4\xb8\xad\xe6\x96\x87 plain"), subject);

	Headers headers = parser.ParseHeaders("Subject: =?big5?b?pKSk5Q==?= and =?ISO-8859-1?q?caf=E9?=");
	EXPECT_EQ(QString::fromUtf8("\xe4\xb8\xad\xe6\x96\x87 and caf\xc3\xa9"), headers.value("subject"));
}

TEST_F(Rfc2822Test, QEncodingUnderscoreIsSpace)
{
	EXPECT_EQ(QString("Hello World!"), parser.DecodeWords("=?utf-8?q?Hello_World=21?="));
	EXPECT_EQ(QString("[tag] Hello there"), parser.DecodeWords("[tag] =?UTF-8?Q?Hello_there?="));
}

TEST_F(Rfc2822Test, BrokenWordStaysLiteral)
{
	bool ok = true;
	QString value = parser.DecodeWords("=?utf-8?B?@@@@?= and =?utf-8?B?b2s=?=", &ok);
	EXPECT_FALSE(ok);
	EXPECT_EQ(QString("=?utf-8?B?@@@@?= and ok"), value);

	EXPECT_EQ(QString("=?utf-8?X?abc?= plain"), parser.DecodeWords("=?utf-8?X?abc?= plain"));
	EXPECT_EQ(QString("ok"), parser.DecodeWords("=?x-unknown?B?b2s=?="));
}

TEST_F(Rfc2822Test, SplitMultipartDropsPreambleAndEpilogue)
{
	QList<Part> parts = parser.SplitMultipart(
		"This is a message with multiple parts in MIME format.\r\n"
		"--xyz\r\n"
		"Content-Type: text/plain\r\n"
		"\r\n"
		"first\r\n"
		"--xyz\r\n"
		"Content-Type: text/html\r\n"
		"Content-Transfer-Encoding: 7bit\r\n"
		"\r\n"
		"<p>second</p>\r\n"
		"--xyz--\r\n"
		"epilogue\r\n"
		"--xyz\r\n"
		"Content-Type: text/plain\r\n"
		"\r\n"
		"ghost\r\n", "xyz");

	ASSERT_EQ(2, parts.size());
	EXPECT_EQ(QString("text/plain"), parts[0].headers.value("content-type"));
	EXPECT_EQ(QString("first"), parts[0].body);
	EXPECT_EQ(QString("7bit"), parts[1].headers.value("content-transfer-encoding"));
	EXPECT_EQ(QString("<p>second</p>"), parts[1].body);
}

TEST_F(Rfc2822Test, SplitMultipartSkipsPartsWithoutSeparator)
{
	QList<Part> parts = parser.SplitMultipart(
		"--b\r\n"
		"no headers here\r\n"
		"--b\r\n"
		"\r\n"
		"--b\n"
		"Content-Type: text/plain\n"
		"\n"
		"line one\n"
		"line two\n"
		"--b--\n", "b");

	ASSERT_EQ(1, parts.size());
	EXPECT_EQ(QString("line one\nline two"), parts[0].body);
}

TEST_F(Rfc2822Test, SplitMultipartWithoutDelimiter)
{
	EXPECT_TRUE(parser.SplitMultipart("just text, no parts", "xyz").isEmpty());
}

TEST(FindBlankLine, CrlfAndLf)
{
	int length = 0;
	EXPECT_EQ(3, Rfc2822::FindBlankLine("A:b\r\n\r\nbody", &length));
	EXPECT_EQ(4, length);
	EXPECT_EQ(3, Rfc2822::FindBlankLine("A:b\n\nbody\r\n\r\n", &length));
	EXPECT_EQ(2, length);
	EXPECT_EQ(-1, Rfc2822::FindBlankLine("A:b\r\nC:d", &length));
}
