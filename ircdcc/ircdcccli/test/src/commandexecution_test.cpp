#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include <unistd.h>

#include "cancelcommand.hpp"
#include "consolectcpsender.hpp"
#include "ctcpcommand.hpp"
#include "dccengine.hpp"
#include "listcommand.hpp"
#include "sendcommand.hpp"

using namespace ::testing;
using namespace ::ircdcccli;

namespace
{
class CommandExecutionTest : public Test
{
protected:
    void SetUp() override
    {
        work_dir_ = std::filesystem::temp_directory_path() /
                    ("ircdcccli_test_" + std::to_string(::getpid()));
        std::filesystem::create_directories(work_dir_ / "uploads");
        std::filesystem::create_directories(work_dir_ / "downloads");

        std::ofstream {work_dir_ / "uploads" / "notes.txt"} << "hello world";

        auto config_path = work_dir_ / "config.json";
        std::ofstream {config_path} << R"({"download_dir": ")"
                                    << (work_dir_ / "downloads").string()
                                    << R"(", "upload_dir": ")" << (work_dir_ / "uploads").string()
                                    << R"(", "advertised_ip": "127.0.0.1"})";

        engine_ = std::make_unique<ircdcc::DCCEngine>(
            config_path.string(), std::make_shared<ConsoleCtcpSender>(ctcp_output_));
        ASSERT_TRUE(engine_->start());
    }

    void TearDown() override
    {
        engine_.reset();
        std::filesystem::remove_all(work_dir_);
    }

    std::filesystem::path              work_dir_;
    std::ostringstream                 ctcp_output_;
    std::ostringstream                 output_;
    std::unique_ptr<ircdcc::DCCEngine> engine_;
};
}  // namespace

TEST_F(CommandExecutionTest, ListWithoutTransfers)
{
    std::string err;
    EXPECT_TRUE(ListCommand {}.execute(*engine_, output_, err));
    EXPECT_EQ(output_.str(), "No transfers\n");
}

TEST_F(CommandExecutionTest, SendMissingFile)
{
    std::string err;
    EXPECT_FALSE((SendCommand {"bob", {"missing.txt"}, false}.execute(*engine_, output_, err)));
    EXPECT_EQ(err, "No file was sent");
    EXPECT_THAT(output_.str(), StartsWith("Cannot send missing.txt: "));
    EXPECT_TRUE(ctcp_output_.str().empty());
}

TEST_F(CommandExecutionTest, PassiveSendThenCancel)
{
    std::string err;
    ASSERT_TRUE((SendCommand {"bob", {"notes.txt"}, true}.execute(*engine_, output_, err))) << err;
    EXPECT_THAT(output_.str(), StartsWith("Offering 'notes.txt' (11 B) to bob, passive token "));
    EXPECT_THAT(ctcp_output_.str(), StartsWith("[ctcp -> bob] DCC SEND notes.txt 0 0 11 "));

    auto transfers = engine_->transfers();
    ASSERT_EQ(transfers.size(), 1u);

    output_.str("");
    EXPECT_TRUE(ListCommand {}.execute(*engine_, output_, err));
    EXPECT_THAT(output_.str(), HasSubstr("NEGOTIATING"));

    output_.str("");
    EXPECT_TRUE(CancelCommand {transfers[0].id.substr(0, 6)}.execute(*engine_, output_, err));
    EXPECT_THAT(output_.str(), StartsWith("Cancelled transfer " + transfers[0].id));
}

TEST_F(CommandExecutionTest, MalformedCtcpPayload)
{
    std::string err;
    EXPECT_FALSE((CtcpCommand {"alice", "alice@host", "DCC CHAT chat 0 0"}.execute(
        *engine_, output_, err)));
    EXPECT_FALSE(err.empty());
}
