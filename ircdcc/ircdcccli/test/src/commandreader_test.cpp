#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "commandreader.hpp"

using namespace ::testing;
using namespace ::ircdcccli;

TEST(CommandReaderTest, EmptyInputStream)
{
    std::istringstream commands_stream {""};
    CommandReader      command_reader {commands_stream};
    EXPECT_FALSE(command_reader.read_next_command().valid());
}

TEST(CommandReaderTest, SkipsBlankLines)
{
    std::istringstream commands_stream {"\n   \nlist\n\t\nexit"};
    CommandReader      command_reader {commands_stream};

    Command c1 = command_reader.read_next_command();
    EXPECT_TRUE(c1.valid());
    EXPECT_EQ(c1.cmd, "list");
    EXPECT_TRUE(c1.args.empty());

    Command c2 = command_reader.read_next_command();
    EXPECT_EQ(c2.cmd, "exit");

    EXPECT_FALSE(command_reader.read_next_command().valid());
}

TEST(CommandReaderTest, CommandsWithArgs)
{
    std::istringstream commands_stream {"send bob a.txt   b.txt\ncancel 1a2b3c4d"};
    CommandReader      command_reader {commands_stream};

    Command c1 = command_reader.read_next_command();
    EXPECT_EQ(c1.cmd, "send");
    EXPECT_THAT(c1.args, ElementsAre("bob", "a.txt", "b.txt"));

    Command c2 = command_reader.read_next_command();
    EXPECT_EQ(c2.cmd, "cancel");
    EXPECT_THAT(c2.args, ElementsAre("1a2b3c4d"));
}

TEST(CommandReaderTest, QuotedArgs)
{
    std::istringstream commands_stream {
        R"(send bob "my file.txt" other.txt)"
        "\n"
        R"(ctcp alice alice@host "DCC SEND \"a b.bin\" 3232235777 5000 100")"};
    CommandReader command_reader {commands_stream};

    Command c1 = command_reader.read_next_command();
    EXPECT_THAT(c1.args, ElementsAre("bob", "my file.txt", "other.txt"));

    Command c2 = command_reader.read_next_command();
    EXPECT_THAT(c2.args,
        ElementsAre("alice", "alice@host", R"(DCC SEND "a b.bin" 3232235777 5000 100)"));
}

TEST(CommandReaderTest, EmptyQuotedArg)
{
    EXPECT_THAT(CommandReader::split(R"(accept bob "" 1.2.3.4)"),
        ElementsAre("accept", "bob", "", "1.2.3.4"));
}

TEST(CommandReaderTest, UnterminatedQuoteRunsToEndOfLine)
{
    EXPECT_THAT(CommandReader::split(R"(resume "half done.iso)"),
        ElementsAre("resume", "half done.iso"));
}
