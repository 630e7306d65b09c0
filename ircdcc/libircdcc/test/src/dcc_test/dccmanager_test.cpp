#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <iomanip>
#include <sstream>

#include "addressresolver_mock.hpp"
#include "checksumcalculatorimpl.hpp"
#include "ctcpsender.hpp"
#include "ctcpsender_mock.hpp"
#include "dcceventlistener_mock.hpp"
#include "dccmanager.hpp"
#include "executer_mock.hpp"
#include "iothreadpool.hpp"
#include "testutils.hpp"
#include "threadpool.hpp"
#include "tokengenerator_mock.hpp"
#include "tokengeneratorimpl.hpp"

using namespace ::testing;
using namespace ::ircdcc::dcc;

namespace
{
using Clock = std::chrono::steady_clock;

class DCCManagerTest : public Test
{
protected:
    void SetUp() override
    {
        ON_CALL(*token_generator_, generate(_)).WillByDefault(Invoke([this](size_t bytes) {
            std::ostringstream ss;
            ss << std::hex << std::setw(int(bytes * 2)) << std::setfill('0') << ++generated_;
            return ss.str();
        }));
        ON_CALL(*address_resolver_, advertised_address(_)).WillByDefault(Return("127.0.0.1"));
        ON_CALL(*ctcp_sender_, send_ctcp(_, _))
            .WillByDefault(Invoke([this](const std::string &nick, const std::string &payload) {
                sent_.emplace_back(nick, payload);
                return true;
            }));
        ON_CALL(*io_executer_, add_job(_, _)).WillByDefault(InvokeWithoutArgs([this] {
            ++movers_started_;
            return CompletionToken {};
        }));

        ON_CALL(*listener_, on_offer_received(_))
            .WillByDefault(Invoke([this](const OfferInfo &offer) { offers_.push_back(offer); }));
        ON_CALL(*listener_, on_offer_rejected(_, _))
            .WillByDefault(Invoke([this](const OfferInfo &offer, const std::string &reason) {
                rejections_.emplace_back(offer, reason);
            }));
        ON_CALL(*listener_, on_status_changed(_))
            .WillByDefault(Invoke([this](const TransferInfo &info) { statuses_.push_back(info); }));

        download_dir_              = temp_dir_.file("downloads");
        settings_.download_dir     = download_dir_;
        settings_.upload_dir       = temp_dir_.path();
        settings_.port_range_start = 40000;
        settings_.port_range_end   = 49999;

        manager_ = std::make_unique<DCCManager>(ctcp_sender_, address_resolver_, token_generator_,
            nullptr, event_executer_, io_executer_, settings_,
            [this] { return Clock::now() + offset_; });
        manager_->register_listener(listener_);
    }

    void process_events()
    {
        event_executer_->process_all_jobs();
    }

    void reconfigure()
    {
        manager_->reconfigure(settings_);
    }

    std::string pending_receive(const std::string &filename = "file.bin", uint64_t size = 2048)
    {
        EXPECT_TRUE(manager_->dispatch_incoming_ctcp("alice", "alice@example.org",
            "DCC SEND " + filename + " 2130706433 5000 " + std::to_string(size)));
        auto transfers = manager_->transfers();
        return transfers.empty() ? std::string {} : transfers.back().id;
    }

    TransferInfo info_of(const std::string &id) const
    {
        for (const auto &info : manager_->transfers())
        {
            if (info.id == id)
            {
                return info;
            }
        }
        return {};
    }

    testutils::TempDir temp_dir_ {"dccmanager_test"};
    std::string        download_dir_;
    DCCSettings        settings_;
    Clock::duration    offset_ {};
    std::shared_ptr<NiceMock<CtcpSenderMock>> ctcp_sender_ =
        std::make_shared<NiceMock<CtcpSenderMock>>();
    std::shared_ptr<NiceMock<AddressResolverMock>> address_resolver_ =
        std::make_shared<NiceMock<AddressResolverMock>>();
    std::shared_ptr<NiceMock<TokenGeneratorMock>> token_generator_ =
        std::make_shared<NiceMock<TokenGeneratorMock>>();
    std::shared_ptr<NiceMock<ExecuterMock>> io_executer_ =
        std::make_shared<NiceMock<ExecuterMock>>();
    std::shared_ptr<ThreadPool> event_executer_ = std::make_shared<ThreadPool>(1);
    std::shared_ptr<NiceMock<DCCEventListenerMock>> listener_ =
        std::make_shared<NiceMock<DCCEventListenerMock>>();
    int                                              generated_      = 0;
    int                                              movers_started_ = 0;
    std::vector<std::pair<std::string, std::string>> sent_;
    std::vector<OfferInfo>                           offers_;
    std::vector<std::pair<OfferInfo, std::string>>   rejections_;
    std::vector<TransferInfo>                        statuses_;
    std::unique_ptr<DCCManager>                      manager_;
};
}  // namespace

TEST_F(DCCManagerTest, IncomingOfferWaitsForConfirmation)
{
    auto id = pending_receive();
    ASSERT_FALSE(id.empty());
    process_events();

    ASSERT_EQ(offers_.size(), 1);
    EXPECT_EQ(offers_[0].nick, "alice");
    EXPECT_EQ(offers_[0].userhost, "alice@example.org");
    EXPECT_EQ(offers_[0].filename, "file.bin");
    EXPECT_EQ(offers_[0].ip, "127.0.0.1");
    EXPECT_EQ(offers_[0].port, 5000);
    EXPECT_EQ(offers_[0].file_size, 2048);
    EXPECT_FALSE(offers_[0].passive);
    EXPECT_EQ(offers_[0].transfer_id, id);

    EXPECT_EQ(info_of(id).status, TransferStatus::PENDING_ACCEPT);
    EXPECT_EQ(movers_started_, 0);

    std::string error;
    ASSERT_TRUE(manager_->confirm(id.substr(0, 31), error)) << error;
    EXPECT_EQ(info_of(id).status, TransferStatus::CONNECTING);
    EXPECT_EQ(movers_started_, 1);

    EXPECT_FALSE(manager_->confirm(id, error));
    EXPECT_EQ(error, "Transfer " + id + " is not waiting for confirmation");
    EXPECT_FALSE(manager_->confirm("ffff", error));
    EXPECT_EQ(error, "No transfer matches 'ffff'");
}

TEST_F(DCCManagerTest, AutoAcceptStartsReceiving)
{
    settings_.auto_accept = true;
    reconfigure();

    auto id = pending_receive();
    ASSERT_FALSE(id.empty());
    EXPECT_EQ(info_of(id).status, TransferStatus::CONNECTING);
    EXPECT_EQ(movers_started_, 1);

    process_events();
    ASSERT_EQ(offers_.size(), 1);
    EXPECT_EQ(offers_[0].transfer_id, id);
}

TEST_F(DCCManagerTest, RejectedOfferIsReported)
{
    EXPECT_FALSE(
        manager_->dispatch_incoming_ctcp("alice", "", "DCC SEND virus.exe 2130706433 5000 10"));
    process_events();

    EXPECT_TRUE(offers_.empty());
    ASSERT_EQ(rejections_.size(), 1);
    EXPECT_EQ(rejections_[0].first.filename, "virus.exe");
    EXPECT_EQ(rejections_[0].second,
        "DCC offer of 'virus.exe' from alice: File type '.exe' is blocked.");
    EXPECT_TRUE(manager_->transfers().empty());
}

TEST_F(DCCManagerTest, MalformedPayloadsAreDropped)
{
    EXPECT_FALSE(manager_->dispatch_incoming_ctcp("alice", "", "DCC SEND"));
    EXPECT_FALSE(manager_->dispatch_incoming_ctcp("alice", "", "VERSION"));
    EXPECT_FALSE(manager_->dispatch_incoming_ctcp("alice", "", "DCC CHAT chat 2130706433 5000"));
    process_events();

    EXPECT_TRUE(offers_.empty());
    EXPECT_TRUE(rejections_.empty());
    EXPECT_TRUE(manager_->transfers().empty());
}

TEST_F(DCCManagerTest, DisabledManagerIgnoresEverything)
{
    settings_.enabled = false;
    reconfigure();

    EXPECT_FALSE(
        manager_->dispatch_incoming_ctcp("alice", "", "DCC SEND file.bin 2130706433 5000 10"));

    auto outcomes = manager_->send("bob", {"a.bin", "b.bin"}, false);
    ASSERT_EQ(outcomes.size(), 2);
    for (const auto &outcome : outcomes)
    {
        EXPECT_EQ(outcome.result, SendOutcome::Result::ERROR);
        EXPECT_EQ(outcome.error, "DCC is disabled");
    }
    EXPECT_EQ(outcomes[1].path, "b.bin");

    EXPECT_TRUE(manager_->transfers().empty());
    EXPECT_TRUE(sent_.empty());
}

TEST_F(DCCManagerTest, PassiveOfferIsFetchedByToken)
{
    EXPECT_TRUE(manager_->dispatch_incoming_ctcp(
        "alice", "alice@example.org", "DCC SEND notes.txt 2130706433 0 11 abcdef12"));
    process_events();

    ASSERT_EQ(offers_.size(), 1);
    EXPECT_TRUE(offers_[0].passive);
    EXPECT_EQ(offers_[0].token, "abcdef12");
    EXPECT_TRUE(offers_[0].transfer_id.empty());
    EXPECT_TRUE(manager_->transfers().empty());

    auto stored = manager_->passive_offers();
    ASSERT_EQ(stored.size(), 1);
    EXPECT_EQ(stored[0].nick, "alice");
    EXPECT_EQ(stored[0].filename, "notes.txt");
    EXPECT_EQ(stored[0].file_size, 11);

    std::string error;
    EXPECT_TRUE(manager_->accept_passive_offer("99", error).empty());
    EXPECT_EQ(error, "No passive offer matches token '99'");

    auto id = manager_->accept_passive_offer("abc", error);
    ASSERT_FALSE(id.empty()) << error;
    EXPECT_TRUE(manager_->passive_offers().empty());

    auto info = info_of(id);
    EXPECT_EQ(info.status, TransferStatus::NEGOTIATING);
    EXPECT_TRUE(info.passive);
    ASSERT_EQ(sent_.size(), 1);
    EXPECT_EQ(sent_[0].first, "alice");
    EXPECT_EQ(sent_[0].second, "DCC ACCEPT notes.txt 2130706433 " +
                                   std::to_string(info.listen_port) + " 0 abcdef12");
    EXPECT_EQ(movers_started_, 1);
}

TEST_F(DCCManagerTest, AmbiguousPassiveToken)
{
    manager_->dispatch_incoming_ctcp("alice", "", "DCC SEND a.txt 2130706433 0 11 abc111");
    manager_->dispatch_incoming_ctcp("carol", "", "DCC SEND b.txt 2130706433 0 11 abc222");

    std::string error;
    EXPECT_TRUE(manager_->accept_passive_offer("abc", error).empty());
    EXPECT_EQ(error, "Token 'abc' matches more than one passive offer");
    EXPECT_EQ(manager_->passive_offers().size(), 2);
    EXPECT_TRUE(sent_.empty());
}

TEST_F(DCCManagerTest, CancelByPrefix)
{
    auto id = pending_receive();
    manager_->dispatch_incoming_ctcp("alice", "", "DCC SEND notes.txt 2130706433 0 11 abcdef12");

    std::string message;
    EXPECT_TRUE(manager_->cancel_by_prefix(id, message));
    EXPECT_EQ(message, "Cancelled transfer " + id + " of 'file.bin' with alice");
    EXPECT_EQ(info_of(id).status, TransferStatus::CANCELLED);

    EXPECT_FALSE(manager_->cancel_by_prefix(id, message));
    EXPECT_EQ(message, "Transfer " + id + " is already CANCELLED");

    EXPECT_TRUE(manager_->cancel_by_prefix("abcd", message));
    EXPECT_EQ(message, "Cancelled passive offer abcdef12 of 'notes.txt' from alice");
    EXPECT_TRUE(manager_->passive_offers().empty());

    EXPECT_FALSE(manager_->cancel_by_prefix("zzz", message));
    EXPECT_EQ(message, "No transfer or passive offer matches 'zzz'");

    process_events();
    ASSERT_FALSE(statuses_.empty());
    EXPECT_EQ(statuses_.back().id, id);
    EXPECT_EQ(statuses_.back().status, TransferStatus::CANCELLED);
}

TEST_F(DCCManagerTest, OnlyFinishedTransfersAreRemoved)
{
    auto id = pending_receive();

    std::string error;
    EXPECT_FALSE(manager_->remove(id, error));
    EXPECT_EQ(error, "Transfer " + id + " is PENDING_ACCEPT, cancel it first");

    EXPECT_TRUE(manager_->cancel(id));
    EXPECT_TRUE(manager_->remove(id, error)) << error;
    EXPECT_TRUE(manager_->transfers().empty());

    EXPECT_FALSE(manager_->remove(id, error));
    EXPECT_EQ(error, "No transfer matches '" + id + "'");
}

TEST_F(DCCManagerTest, StatusLinesListTransfersThenPassiveOffers)
{
    auto id = pending_receive();
    manager_->dispatch_incoming_ctcp("alice", "", "DCC SEND notes.txt 2130706433 0 11 abcdef12");

    auto lines = manager_->status_lines();
    ASSERT_EQ(lines.size(), 2);
    EXPECT_THAT(lines[0], HasSubstr(id.substr(0, 8)));
    EXPECT_THAT(lines[0], HasSubstr("PENDING_ACCEPT"));
    EXPECT_THAT(lines[1], StartsWith("Token: abcdef12"));
}

TEST_F(DCCManagerTest, ChecksumFromSenderIsRecorded)
{
    auto id = pending_receive();

    // Sender side ids never match ours, the filename does
    EXPECT_TRUE(manager_->dispatch_incoming_ctcp(
        "Alice", "", "DCC DCCCHECKSUM 0123456789abcdef file.bin md5 0cc175b9c0f1b6a8"));
    auto info = info_of(id);
    EXPECT_EQ(info.expected_checksum, "0cc175b9c0f1b6a8");
    EXPECT_EQ(info.checksum_algorithm, "md5");

    EXPECT_FALSE(manager_->dispatch_incoming_ctcp(
        "carol", "", "DCC DCCCHECKSUM 0123456789abcdef file.bin md5 0cc175b9c0f1b6a8"));
    EXPECT_FALSE(manager_->dispatch_incoming_ctcp(
        "alice", "", "DCC DCCCHECKSUM 0123456789abcdef other.bin md5 0cc175b9c0f1b6a8"));
}

TEST_F(DCCManagerTest, MaintenanceExpiresUnansweredOffers)
{
    settings_.transfer_timeout = std::chrono::seconds {10};
    reconfigure();
    auto id = pending_receive();

    manager_->run_maintenance();
    EXPECT_EQ(info_of(id).status, TransferStatus::PENDING_ACCEPT);

    offset_ = std::chrono::seconds {11};
    manager_->run_maintenance();

    auto info = info_of(id);
    EXPECT_EQ(info.status, TransferStatus::TIMED_OUT);
    EXPECT_EQ(info.error, "No response from alice within 10s");
}

TEST_F(DCCManagerTest, MaintenanceEvictsStalePassiveOffers)
{
    settings_.passive_token_timeout = std::chrono::seconds {120};
    reconfigure();
    manager_->dispatch_incoming_ctcp("alice", "", "DCC SEND notes.txt 2130706433 0 11 abcdef12");

    offset_ = std::chrono::seconds {60};
    manager_->run_maintenance();
    EXPECT_EQ(manager_->passive_offers().size(), 1);

    offset_ = std::chrono::seconds {121};
    manager_->run_maintenance();
    EXPECT_TRUE(manager_->passive_offers().empty());
}

TEST_F(DCCManagerTest, MaintenanceRemovesOldFinishedTransfers)
{
    auto id = pending_receive();
    manager_->cancel(id);

    offset_ = std::chrono::hours {71};
    manager_->run_maintenance();
    EXPECT_EQ(manager_->transfers().size(), 1);

    settings_.cleanup_enabled = false;
    reconfigure();
    offset_ = std::chrono::hours {73};
    manager_->run_maintenance();
    EXPECT_EQ(manager_->transfers().size(), 1);

    settings_.cleanup_enabled = true;
    reconfigure();
    manager_->run_maintenance();
    EXPECT_TRUE(manager_->transfers().empty());
}

TEST_F(DCCManagerTest, ResumeRequestsNeedAnInterruptedReceive)
{
    EXPECT_FALSE(manager_->dispatch_incoming_ctcp("alice", "", "DCC RESUME movie.mkv 6000 1000"));

    settings_.resume_enabled = false;
    reconfigure();
    EXPECT_FALSE(manager_->dispatch_incoming_ctcp("alice", "", "DCC RESUME movie.mkv 6000 1000"));

    process_events();
    ASSERT_EQ(rejections_.size(), 2);
    EXPECT_TRUE(rejections_[0].first.resume);
    EXPECT_EQ(rejections_[0].first.position, 1000);
    EXPECT_EQ(rejections_[0].second, "No interrupted receive of 'movie.mkv' from alice");
    EXPECT_EQ(rejections_[1].second, "Resuming transfers is disabled");
}

TEST_F(DCCManagerTest, ResumeOfInterruptedReceive)
{
    auto previous = pending_receive("movie.mkv", 3000);
    ASSERT_TRUE(manager_->cancel(previous));

    auto local_path = info_of(previous).local_path;
    std::filesystem::create_directories(download_dir_);
    ASSERT_TRUE(testutils::write_test_file(local_path, 1000));

    EXPECT_TRUE(
        manager_->dispatch_incoming_ctcp("ALICE", "", "DCC RESUME movie.mkv 6000 1000"));
    process_events();

    ASSERT_EQ(offers_.size(), 2);
    const auto &offer = offers_[1];
    EXPECT_TRUE(offer.resume);
    EXPECT_EQ(offer.position, 1000);
    EXPECT_EQ(offer.file_size, 3000);
    EXPECT_EQ(offer.ip, "127.0.0.1");
    ASSERT_FALSE(offer.transfer_id.empty());
    EXPECT_EQ(info_of(offer.transfer_id).status, TransferStatus::PENDING_ACCEPT);
    EXPECT_TRUE(sent_.empty());

    std::string error;
    ASSERT_TRUE(manager_->confirm(offer.transfer_id, error)) << error;
    ASSERT_EQ(sent_.size(), 1);
    EXPECT_EQ(sent_[0].second, "DCC ACCEPT movie.mkv 6000 1000");

    auto info = info_of(offer.transfer_id);
    EXPECT_EQ(info.status, TransferStatus::CONNECTING);
    EXPECT_EQ(info.resume_offset, 1000);
    EXPECT_EQ(info.local_path, local_path);
}

TEST_F(DCCManagerTest, QueuedSendStartsWhenActiveOneEnds)
{
    ASSERT_TRUE(testutils::write_test_file(temp_dir_.file("a.bin"), 100));
    ASSERT_TRUE(testutils::write_test_file(temp_dir_.file("b.bin"), 200));

    EXPECT_CALL(*listener_, on_send_queued("bob", EndsWith("b.bin"), 1));
    auto outcomes = manager_->send("bob", {"a.bin", "b.bin"}, false);
    ASSERT_EQ(outcomes.size(), 2);
    EXPECT_EQ(outcomes[0].result, SendOutcome::Result::STARTED);
    EXPECT_EQ(outcomes[1].result, SendOutcome::Result::QUEUED);
    EXPECT_THAT(manager_->queued_sends("bob"), ElementsAre(EndsWith("b.bin")));

    process_events();
    ASSERT_EQ(sent_.size(), 1);
    EXPECT_THAT(sent_[0].second, StartsWith("DCC SEND a.bin "));

    ASSERT_TRUE(manager_->cancel(outcomes[0].transfer_id));
    process_events();

    ASSERT_EQ(sent_.size(), 2);
    EXPECT_THAT(sent_[1].second, StartsWith("DCC SEND b.bin "));
    EXPECT_TRUE(manager_->queued_sends("bob").empty());
    EXPECT_EQ(manager_->transfers().size(), 2);
}

TEST_F(DCCManagerTest, ShutdownCancelsEverything)
{
    auto id = pending_receive();
    ASSERT_TRUE(testutils::write_test_file(temp_dir_.file("a.bin"), 100));
    ASSERT_TRUE(testutils::write_test_file(temp_dir_.file("b.bin"), 100));
    auto outcomes = manager_->send("bob", {"a.bin", "b.bin"}, false);

    manager_->shutdown();
    process_events();

    EXPECT_EQ(info_of(id).status, TransferStatus::CANCELLED);
    EXPECT_EQ(info_of(outcomes[0].transfer_id).status, TransferStatus::CANCELLED);
    EXPECT_TRUE(manager_->queued_sends("bob").empty());

    // Nothing was offered after the first file
    EXPECT_EQ(sent_.size(), 1);
    EXPECT_FALSE(
        manager_->dispatch_incoming_ctcp("alice", "", "DCC SEND file.bin 2130706433 5000 10"));
}

namespace
{
// Hands payloads to the other manager from a separate thread, the way an IRC server would
class LoopbackCtcpSender : public ircdcc::network::CtcpSender
{
public:
    LoopbackCtcpSender(std::string own_nick, std::shared_ptr<Executer> relay)
        : own_nick_ {std::move(own_nick)}
        , relay_ {std::move(relay)}
    {}

    void connect(const std::shared_ptr<DCCManager> &peer)
    {
        peer_ = peer;
    }

    bool send_ctcp(const std::string & /*nick*/, const std::string &payload) override
    {
        relay_->add_job([peer = peer_, nick = own_nick_, payload](
                            const CompletionToken & /*completion_token*/) {
            if (auto manager = peer.lock())
            {
                manager->dispatch_incoming_ctcp(nick, nick + "@localhost", payload);
            }
        });
        return true;
    }

private:
    const std::string                 own_nick_;
    const std::shared_ptr<Executer>   relay_;
    std::weak_ptr<DCCManager>         peer_;
};

class DCCManagerLoopbackTest : public Test
{
protected:
    void SetUp() override
    {
        ON_CALL(*address_resolver_, advertised_address(_)).WillByDefault(Return("127.0.0.1"));

        std::filesystem::create_directories(temp_dir_.file("uploads"));

        DCCSettings settings;
        settings.port_range_start   = 40000;
        settings.port_range_end     = 49999;
        settings.checksum_algorithm = "md5";
        settings.transfer_timeout   = std::chrono::seconds {10};

        sender_settings_            = settings;
        sender_settings_.upload_dir = temp_dir_.file("uploads");

        receiver_settings_              = settings;
        receiver_settings_.download_dir = temp_dir_.file("downloads");
    }

    void TearDown() override
    {
        if (alice_)
        {
            alice_->shutdown();
        }
        if (bob_)
        {
            bob_->shutdown();
        }
        relay_->process_all_jobs();
    }

    void create_managers()
    {
        auto alice_sender = std::make_shared<LoopbackCtcpSender>("alice", relay_);
        auto bob_sender   = std::make_shared<LoopbackCtcpSender>("bob", relay_);

        alice_ = std::make_shared<DCCManager>(alice_sender, address_resolver_, token_generator_,
            checksum_calculator_, std::make_shared<ThreadPool>(1),
            std::make_shared<IOThreadPool>(), sender_settings_);
        bob_ = std::make_shared<DCCManager>(bob_sender, address_resolver_, token_generator_,
            checksum_calculator_, std::make_shared<ThreadPool>(1),
            std::make_shared<IOThreadPool>(), receiver_settings_);

        alice_sender->connect(bob_);
        bob_sender->connect(alice_);
    }

    static bool finished(const std::shared_ptr<DCCManager> &manager, ChecksumStatus checksum)
    {
        auto transfers = manager->transfers();
        return transfers.size() == 1 && transfers[0].status == TransferStatus::COMPLETED &&
               transfers[0].checksum_status == checksum;
    }

    testutils::TempDir temp_dir_ {"dccmanager_loopback_test"};
    DCCSettings        sender_settings_;
    DCCSettings        receiver_settings_;
    std::shared_ptr<NiceMock<AddressResolverMock>> address_resolver_ =
        std::make_shared<NiceMock<AddressResolverMock>>();
    std::shared_ptr<ircdcc::crypto::TokenGeneratorImpl> token_generator_ =
        std::make_shared<ircdcc::crypto::TokenGeneratorImpl>();
    std::shared_ptr<ircdcc::crypto::ChecksumCalculatorImpl> checksum_calculator_ =
        std::make_shared<ircdcc::crypto::ChecksumCalculatorImpl>();
    std::shared_ptr<ThreadPool> relay_ = std::make_shared<ThreadPool>(1);
    std::shared_ptr<DCCManager> alice_;
    std::shared_ptr<DCCManager> bob_;
};
}  // namespace

TEST_F(DCCManagerLoopbackTest, ActiveSendWithChecksum)
{
    receiver_settings_.auto_accept = true;
    create_managers();

    auto source = temp_dir_.file("uploads/song.mp3");
    ASSERT_TRUE(testutils::write_test_file(source, 300000));

    auto outcomes = alice_->send("bob", {"song.mp3"}, false);
    ASSERT_EQ(outcomes.size(), 1);
    ASSERT_EQ(outcomes[0].result, SendOutcome::Result::STARTED) << outcomes[0].error;

    // The receiver only reports MATCH once the sender announced its checksum
    EXPECT_TRUE(testutils::wait_for([this] { return finished(bob_, ChecksumStatus::MATCH); },
        10000));
    EXPECT_TRUE(testutils::wait_for(
        [this] { return finished(alice_, ChecksumStatus::NOT_CHECKED); }, 10000));

    auto received = bob_->transfers();
    ASSERT_EQ(received.size(), 1);
    EXPECT_EQ(received[0].peer, "alice");
    EXPECT_EQ(received[0].bytes_transferred, 300000);
    EXPECT_TRUE(testutils::files_equal(source, received[0].local_path));
}

TEST_F(DCCManagerLoopbackTest, PassiveSendFetchedByToken)
{
    create_managers();

    auto source = temp_dir_.file("uploads/notes.txt");
    ASSERT_TRUE(testutils::write_test_file(source, 50000));

    auto outcomes = alice_->send("bob", {"notes.txt"}, true);
    ASSERT_EQ(outcomes.size(), 1);
    ASSERT_EQ(outcomes[0].result, SendOutcome::Result::STARTED) << outcomes[0].error;
    ASSERT_FALSE(outcomes[0].token.empty());

    ASSERT_TRUE(testutils::wait_for([this] { return bob_->passive_offers().size() == 1; }, 5000));
    EXPECT_EQ(bob_->passive_offers()[0].token, outcomes[0].token);

    std::string error;
    auto        id = bob_->accept_passive_offer(outcomes[0].token.substr(0, 6), error);
    ASSERT_FALSE(id.empty()) << error;

    EXPECT_TRUE(testutils::wait_for([this] { return finished(bob_, ChecksumStatus::MATCH); },
        10000));

    auto received = bob_->transfers();
    ASSERT_EQ(received.size(), 1);
    EXPECT_TRUE(received[0].passive);
    EXPECT_TRUE(testutils::files_equal(source, received[0].local_path));
}
