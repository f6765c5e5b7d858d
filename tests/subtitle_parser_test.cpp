#include "test_base.hpp"
#include "core/subtitle_parser.hpp"
#include "core/errors.hpp"

class SubtitleParserTest : public TestBase
{
};

TEST_F(SubtitleParserTest, ParsesWebVtt)
{
    const std::string vtt =
        "WEBVTT\n"
        "\n"
        "NOTE recorded in room 101\n"
        "\n"
        "intro\n"
        "00:00:01.000 --> 00:00:04.500 align:start position:10%\n"
        "<v Lecturer>Welcome to</v> the\n"
        "course\n"
        "\n"
        "00:05.000 --> 00:00:07.250\n"
        "Second cue\n";

    auto cues = SubtitleParser::parseVtt(vtt, "lec1");

    ASSERT_EQ(cues.size(), 2u);
    EXPECT_EQ(cues[0].video_id, "lec1");
    EXPECT_DOUBLE_EQ(cues[0].start, 1.0);
    EXPECT_DOUBLE_EQ(cues[0].end, 4.5);
    EXPECT_EQ(cues[0].text, "Welcome to the course");
    EXPECT_DOUBLE_EQ(cues[1].start, 5.0);
    EXPECT_DOUBLE_EQ(cues[1].end, 7.25);
    EXPECT_EQ(cues[1].text, "Second cue");
}

TEST_F(SubtitleParserTest, ParsesSubRipWithWindowsLineEndings)
{
    const std::string srt =
        "1\r\n"
        "00:00:00,000 --> 00:00:05,000\r\n"
        "Today we cover\r\n"
        "\r\n"
        "2\r\n"
        "00:00:05,000 --> 00:00:12,000\r\n"
        "<i>gradient descent.</i>\r\n";

    auto cues = SubtitleParser::parseSrt(srt, "lec2");

    ASSERT_EQ(cues.size(), 2u);
    EXPECT_DOUBLE_EQ(cues[0].end, 5.0);
    EXPECT_DOUBLE_EQ(cues[1].start, 5.0);
    EXPECT_DOUBLE_EQ(cues[1].end, 12.0);
    EXPECT_EQ(cues[1].text, "gradient descent.");
}

TEST_F(SubtitleParserTest, CueEndingBeforeStartReportsIndex)
{
    const std::string srt =
        "1\n00:00:00,000 --> 00:00:02,000\nfine\n\n"
        "2\n00:00:09,000 --> 00:00:03,000\nbroken\n";

    try
    {
        SubtitleParser::parseSrt(srt, "lec1");
        FAIL() << "Expected MalformedInputError";
    }
    catch (const MalformedInputError &e)
    {
        EXPECT_EQ(e.itemIndex(), 1u);
    }
}

TEST_F(SubtitleParserTest, EmptyCuesDoNotShiftReportedIndex)
{
    const std::string vtt =
        "WEBVTT\n\n"
        "00:00.000 --> 00:02.000\nfirst\n\n"
        "00:02.000 --> 00:03.000\n<i></i>\n\n"
        "00:03.000 --> 00:04.000\nsecond\n\n"
        "00:09.000 --> 00:05.000\nbroken\n";

    try
    {
        SubtitleParser::parseVtt(vtt, "lec1");
        FAIL() << "Expected MalformedInputError";
    }
    catch (const MalformedInputError &e)
    {
        // Index into the parsed cues, where the empty cue has no slot
        EXPECT_EQ(e.itemIndex(), 2u);
    }

    auto cues = SubtitleParser::parseVtt(vtt.substr(0, vtt.find("00:09.000")), "lec1");
    ASSERT_EQ(cues.size(), 2u);
    EXPECT_EQ(cues[1].text, "second");
}

TEST_F(SubtitleParserTest, UnparsableTimingIsMalformed)
{
    EXPECT_THROW(SubtitleParser::parseVtt("WEBVTT\n\n00:00:aa.000 --> 00:00:02.000\nx\n", "lec1"),
                 MalformedInputError);
}

TEST_F(SubtitleParserTest, ParseTimestampFormats)
{
    EXPECT_DOUBLE_EQ(*SubtitleParser::parseTimestamp("01:02:03.500"), 3723.5);
    EXPECT_DOUBLE_EQ(*SubtitleParser::parseTimestamp("02:03.250"), 123.25);
    EXPECT_DOUBLE_EQ(*SubtitleParser::parseTimestamp("00:00:01,200"), 1.2);
    EXPECT_FALSE(SubtitleParser::parseTimestamp("12").has_value());
    EXPECT_FALSE(SubtitleParser::parseTimestamp("00:75:00.000").has_value());
    EXPECT_FALSE(SubtitleParser::parseTimestamp("abc").has_value());
}

TEST_F(SubtitleParserTest, ParseFileChoosesFormatByExtension)
{
    std::string path = createFile("lec1.srt", "1\n00:00:00,000 --> 00:00:02,000\nhello\n");
    auto cues = SubtitleParser::parseFile(path, "lec1");
    ASSERT_EQ(cues.size(), 1u);
    EXPECT_EQ(cues[0].text, "hello");

    std::string unsupported = createFile("lec1.txt", "hello");
    EXPECT_THROW(SubtitleParser::parseFile(unsupported, "lec1"), MalformedInputError);
    EXPECT_THROW(SubtitleParser::parseFile(testDir() + "/missing.vtt", "lec1"), MalformedInputError);
}

TEST_F(SubtitleParserTest, DirectorySourcePrefersWebVtt)
{
    createFile("lec1.srt", "1\n00:00:00,000 --> 00:00:02,000\nfrom srt\n");
    createFile("lec1.vtt", "WEBVTT\n\n00:00:00.000 --> 00:00:02.000\nfrom vtt\n");

    DirectorySubtitleSource source(testDir());
    auto cues = source.cuesFor("lec1");
    ASSERT_EQ(cues.size(), 1u);
    EXPECT_EQ(cues[0].text, "from vtt");

    EXPECT_FALSE(source.findSubtitleFile("lec9").has_value());
    EXPECT_THROW(source.cuesFor("lec9"), MalformedInputError);
}
