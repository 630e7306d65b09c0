#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <iomanip>
#include <sstream>

#include "addressresolver_mock.hpp"
#include "ctcpsender_mock.hpp"
#include "executer_mock.hpp"
#include "offercodec.hpp"
#include "receivetransfer.hpp"
#include "sendorchestrator.hpp"
#include "testutils.hpp"
#include "tokengenerator_mock.hpp"
#include "transfer.hpp"
#include "transferobserver_mock.hpp"
#include "transferregistry.hpp"

using namespace ::testing;
using namespace ::ircdcc::dcc;

namespace
{
class SendOrchestratorTest : public Test
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
        ON_CALL(*io_executer_, add_job(_, _))
            .WillByDefault(InvokeWithoutArgs([this] {
                ++movers_started_;
                return CompletionToken {};
            }));

        settings_.upload_dir       = temp_dir_.path();
        settings_.port_range_start = 40000;
        settings_.port_range_end   = 49999;

        orchestrator_ = std::make_unique<SendOrchestrator>(registry_, ctcp_sender_,
            address_resolver_, token_generator_, nullptr, observer_, io_executer_, settings_);
    }

    std::string make_file(const std::string &name, uint64_t size)
    {
        auto path = temp_dir_.file(name);
        EXPECT_TRUE(testutils::write_test_file(path, size));
        return path;
    }

    // Leaves an earlier send of the file to the peer interrupted after the given byte count
    std::shared_ptr<Transfer> interrupted_send(
        const std::string &peer, const std::string &name, uint64_t bytes_sent)
    {
        auto outcomes = orchestrator_->initiate_sends(peer, {name}, false);
        EXPECT_EQ(outcomes.front().result, SendOutcome::Result::STARTED);
        auto transfer = registry_->get(outcomes.front().transfer_id);
        transfer->update_progress(bytes_sent, true);
        transfer->abort("Connection reset by peer");
        return transfer;
    }

    std::shared_ptr<Transfer> transfer_of(const SendOutcome &outcome)
    {
        return registry_->get(outcome.transfer_id);
    }

    testutils::TempDir                temp_dir_ {"sendorchestrator_test"};
    DCCSettings                       settings_;
    std::shared_ptr<TransferRegistry> registry_ = std::make_shared<TransferRegistry>();
    std::shared_ptr<NiceMock<CtcpSenderMock>> ctcp_sender_ =
        std::make_shared<NiceMock<CtcpSenderMock>>();
    std::shared_ptr<NiceMock<AddressResolverMock>> address_resolver_ =
        std::make_shared<NiceMock<AddressResolverMock>>();
    std::shared_ptr<NiceMock<TokenGeneratorMock>> token_generator_ =
        std::make_shared<NiceMock<TokenGeneratorMock>>();
    std::shared_ptr<NiceMock<TransferObserverMock>> observer_ =
        std::make_shared<NiceMock<TransferObserverMock>>();
    std::shared_ptr<NiceMock<ExecuterMock>> io_executer_ =
        std::make_shared<NiceMock<ExecuterMock>>();
    std::unique_ptr<SendOrchestrator>                orchestrator_;
    std::vector<std::pair<std::string, std::string>> sent_;
    int                                              generated_      = 0;
    int                                              movers_started_ = 0;
};
}  // namespace

TEST_F(SendOrchestratorTest, ActiveSendOffersFile)
{
    make_file("report.pdf", 1000);

    EXPECT_CALL(*observer_, on_transfer_created(_));
    auto outcomes = orchestrator_->initiate_sends("bob", {"report.pdf"}, false);

    ASSERT_EQ(outcomes.size(), 1);
    const auto &outcome = outcomes.front();
    EXPECT_EQ(outcome.result, SendOutcome::Result::STARTED);
    EXPECT_EQ(outcome.path, "report.pdf");
    EXPECT_EQ(outcome.filename, "report.pdf");
    EXPECT_EQ(outcome.file_size, 1000);
    EXPECT_TRUE(outcome.token.empty());
    EXPECT_EQ(outcome.transfer_id.size(), 32);

    auto transfer = transfer_of(outcome);
    ASSERT_NE(transfer, nullptr);
    EXPECT_EQ(transfer->status(), TransferStatus::NEGOTIATING);
    EXPECT_EQ(transfer->direction(), Direction::SEND);
    EXPECT_FALSE(transfer->passive());

    ASSERT_EQ(sent_.size(), 1);
    EXPECT_EQ(sent_[0].first, "bob");
    EXPECT_EQ(sent_[0].second, "DCC SEND report.pdf 2130706433 " +
                                   std::to_string(transfer->listen_port()) + " 1000");
    EXPECT_EQ(movers_started_, 1);
}

TEST_F(SendOrchestratorTest, OneActiveSendPerPeer)
{
    auto a = make_file("a.bin", 100);
    auto b = make_file("b.bin", 200);
    auto c = make_file("c.bin", 300);

    EXPECT_CALL(*observer_, on_transfer_queued(_, _, _)).Times(AnyNumber());
    EXPECT_CALL(*observer_, on_transfer_queued("bob", b, 1));
    EXPECT_CALL(*observer_, on_transfer_queued("bob", c, 2));

    auto outcomes = orchestrator_->initiate_sends("bob", {a, b, c}, false);
    ASSERT_EQ(outcomes.size(), 3);
    EXPECT_EQ(outcomes[0].result, SendOutcome::Result::STARTED);
    EXPECT_EQ(outcomes[1].result, SendOutcome::Result::QUEUED);
    EXPECT_EQ(outcomes[1].queue_position, 1);
    EXPECT_EQ(outcomes[2].result, SendOutcome::Result::QUEUED);
    EXPECT_EQ(outcomes[2].queue_position, 2);
    EXPECT_EQ(sent_.size(), 1);

    EXPECT_THAT(orchestrator_->queued("BOB"), ElementsAre(b, c));

    // Another peer is not held back by bob's queue
    auto carol = orchestrator_->initiate_sends("carol", {a}, false);
    EXPECT_EQ(carol.front().result, SendOutcome::Result::STARTED);

    // A later request for bob joins the end of the queue
    auto later = orchestrator_->initiate_sends("Bob", {a}, false);
    EXPECT_EQ(later.front().result, SendOutcome::Result::QUEUED);
    EXPECT_EQ(later.front().queue_position, 3);
}

TEST_F(SendOrchestratorTest, QueueAdvancesWhenActiveSendEnds)
{
    auto a = make_file("a.bin", 100);
    auto b = make_file("b.bin", 200);
    auto c = make_file("c.bin", 300);

    auto outcomes = orchestrator_->initiate_sends("bob", {a, b, c}, false);
    EXPECT_FALSE(orchestrator_->process_next_in_queue("bob"));

    transfer_of(outcomes[0])->set_status(TransferStatus::COMPLETED);
    EXPECT_TRUE(orchestrator_->process_next_in_queue("bob"));
    ASSERT_EQ(sent_.size(), 2);
    EXPECT_THAT(sent_[1].second, StartsWith("DCC SEND b.bin "));
    EXPECT_THAT(orchestrator_->queued("bob"), ElementsAre(c));

    // b is active now
    EXPECT_FALSE(orchestrator_->process_next_in_queue("bob"));

    auto b_transfer =
        registry_->find_latest([](const Transfer &t) { return t.filename() == "b.bin"; });
    b_transfer->cancel();
    EXPECT_TRUE(orchestrator_->process_next_in_queue("bob"));
    EXPECT_THAT(sent_.back().second, StartsWith("DCC SEND c.bin "));
    EXPECT_TRUE(orchestrator_->queued("bob").empty());
    EXPECT_FALSE(orchestrator_->process_next_in_queue("bob"));
}

TEST_F(SendOrchestratorTest, InvalidFilesAreReported)
{
    make_file("ok.bin", 10);
    settings_.max_file_size = 1000;
    orchestrator_->reconfigure(settings_);
    make_file("huge.bin", 1001);

    auto outcomes =
        orchestrator_->initiate_sends("bob", {"missing.txt", "huge.bin", "ok.bin"}, false);
    ASSERT_EQ(outcomes.size(), 3);

    EXPECT_EQ(outcomes[0].result, SendOutcome::Result::ERROR);
    EXPECT_EQ(outcomes[0].filename, "missing.txt");
    EXPECT_EQ(outcomes[0].error, "DCC SEND to bob: File not found: missing.txt");

    EXPECT_EQ(outcomes[1].result, SendOutcome::Result::ERROR);
    EXPECT_EQ(outcomes[1].error,
        "DCC SEND to bob: File 'huge.bin' exceeds maximum size of 1000 bytes");

    EXPECT_EQ(outcomes[2].result, SendOutcome::Result::STARTED);
}

TEST_F(SendOrchestratorTest, PassiveSendWaitsForAccept)
{
    make_file("notes.txt", 11);

    auto outcomes = orchestrator_->initiate_sends("bob", {"notes.txt"}, true);
    const auto &outcome = outcomes.front();
    ASSERT_EQ(outcome.result, SendOutcome::Result::STARTED);
    EXPECT_EQ(outcome.token.size(), 16);

    ASSERT_EQ(sent_.size(), 1);
    EXPECT_EQ(sent_[0].second, "DCC SEND notes.txt 0 0 11 " + outcome.token);
    EXPECT_EQ(movers_started_, 0);

    auto transfer = transfer_of(outcome);
    EXPECT_TRUE(transfer->passive());
    EXPECT_EQ(transfer->token(), outcome.token);
    EXPECT_EQ(transfer->status(), TransferStatus::NEGOTIATING);

    ircdcc::protocol::AcceptOffer accept;
    accept.kind     = ircdcc::protocol::AcceptOffer::Kind::PASSIVE;
    accept.filename = "notes.txt";
    accept.ip       = "127.0.0.1";
    accept.port     = 5000;
    accept.token    = "wrongtoken";
    EXPECT_FALSE(orchestrator_->handle_accept("bob", accept));

    accept.token = outcome.token;
    EXPECT_FALSE(orchestrator_->handle_accept("carol", accept));
    EXPECT_TRUE(orchestrator_->handle_accept("BOB", accept));

    EXPECT_EQ(transfer->status(), TransferStatus::CONNECTING);
    EXPECT_EQ(transfer->info().peer_port, 5000);
    EXPECT_EQ(movers_started_, 1);

    // The send left NEGOTIATING, the same ACCEPT matches nothing now
    EXPECT_FALSE(orchestrator_->handle_accept("bob", accept));
}

TEST_F(SendOrchestratorTest, PassiveSendDoesNotBlockActiveSend)
{
    make_file("notes.txt", 11);
    make_file("photo.jpg", 500);

    orchestrator_->initiate_sends("bob", {"notes.txt"}, true);
    auto outcomes = orchestrator_->initiate_sends("bob", {"photo.jpg"}, false);
    EXPECT_EQ(outcomes.front().result, SendOutcome::Result::STARTED);
}

TEST_F(SendOrchestratorTest, OfferThatCannotBeSentFailsTransfer)
{
    make_file("a.bin", 100);
    EXPECT_CALL(*ctcp_sender_, send_ctcp("bob", _)).WillOnce(Return(false));

    auto outcomes = orchestrator_->initiate_sends("bob", {"a.bin"}, false);
    const auto &outcome = outcomes.front();
    EXPECT_EQ(outcome.result, SendOutcome::Result::ERROR);
    EXPECT_EQ(outcome.error, "DCC SEND of 'a.bin' to bob: the offer could not be sent");
    EXPECT_EQ(movers_started_, 0);

    auto transfers = registry_->all();
    ASSERT_EQ(transfers.size(), 1);
    EXPECT_EQ(transfers[0]->status(), TransferStatus::FAILED);
    EXPECT_EQ(transfers[0]->info().error, "Cannot send the offer to bob");
}

TEST_F(SendOrchestratorTest, NewSendResumesInterruptedOne)
{
    auto path = temp_dir_.file("big.iso");
    ASSERT_TRUE(testutils::write_sparse_file(path, 10000000));

    auto interrupted = interrupted_send("carol", "big.iso", 5000000);
    ASSERT_EQ(interrupted->status(), TransferStatus::FAILED);

    auto outcomes = orchestrator_->initiate_sends("carol", {"big.iso"}, false);
    const auto &outcome = outcomes.front();
    ASSERT_EQ(outcome.result, SendOutcome::Result::STARTED);
    EXPECT_EQ(outcome.resume_offset, 5000000);
    EXPECT_NE(outcome.transfer_id, interrupted->id());

    auto transfer = transfer_of(outcome);
    EXPECT_EQ(transfer->status(), TransferStatus::PENDING_RESUME);
    EXPECT_EQ(transfer->resume_offset(), 5000000);
    EXPECT_EQ(transfer->bytes_transferred(), 5000000);
    EXPECT_EQ(sent_.back().second,
        "DCC RESUME big.iso " + std::to_string(transfer->listen_port()) + " 5000000");

    ircdcc::protocol::AcceptOffer accept;
    accept.kind     = ircdcc::protocol::AcceptOffer::Kind::RESUME;
    accept.filename = "big.iso";
    accept.port     = transfer->listen_port();
    accept.position = 4000000;
    EXPECT_FALSE(orchestrator_->handle_accept("carol", accept));

    accept.position = 5000000;
    EXPECT_TRUE(orchestrator_->handle_accept("carol", accept));
    EXPECT_EQ(transfer->status(), TransferStatus::CONNECTING);
}

TEST_F(SendOrchestratorTest, InterruptedSendIsResumedOnlyOnce)
{
    make_file("a.bin", 1000);
    interrupted_send("bob", "a.bin", 400);

    auto first = orchestrator_->initiate_sends("bob", {"a.bin"}, false);
    EXPECT_EQ(first.front().resume_offset, 400);
    transfer_of(first.front())->cancel();

    // Only the cancelled resume is a candidate now, the send it picked up from is not
    auto second = orchestrator_->initiate_sends("bob", {"a.bin"}, false);
    ASSERT_EQ(second.front().result, SendOutcome::Result::STARTED);
    EXPECT_EQ(second.front().resume_offset, 400);
    EXPECT_NE(second.front().transfer_id, first.front().transfer_id);
    EXPECT_THAT(sent_.back().second, StartsWith("DCC RESUME a.bin "));
}

TEST_F(SendOrchestratorTest, AmbiguousResumeIsRejected)
{
    make_file("a.bin", 1000);
    interrupted_send("bob", "a.bin", 300);

    // A second send of the same file is interrupted as well
    settings_.resume_enabled = false;
    orchestrator_->reconfigure(settings_);
    auto fresh = orchestrator_->initiate_sends("bob", {"a.bin"}, false);
    auto second = transfer_of(fresh.front());
    second->update_progress(600, true);
    second->abort("Connection reset by peer");

    settings_.resume_enabled = true;
    orchestrator_->reconfigure(settings_);
    auto outcomes = orchestrator_->initiate_sends("bob", {"a.bin"}, false);
    EXPECT_EQ(outcomes.front().result, SendOutcome::Result::ERROR);
    EXPECT_THAT(outcomes.front().error, HasSubstr("more than one interrupted send"));
}

TEST_F(SendOrchestratorTest, ResumeByIdOrFilename)
{
    make_file("a.bin", 1000);
    auto interrupted = interrupted_send("bob", "a.bin", 250);

    SendOutcome outcome;
    std::string error;
    ASSERT_TRUE(orchestrator_->resume(interrupted->id(), outcome, error)) << error;
    EXPECT_EQ(outcome.resume_offset, 250);
    EXPECT_EQ(outcome.result, SendOutcome::Result::STARTED);

    auto resumed = transfer_of(outcome);
    resumed->update_progress(700, true);
    resumed->abort("Connection reset by peer");

    ASSERT_TRUE(orchestrator_->resume("a.bin", outcome, error)) << error;
    EXPECT_EQ(outcome.resume_offset, 700);
}

TEST_F(SendOrchestratorTest, ResumeErrors)
{
    make_file("a.bin", 1000);
    SendOutcome outcome;
    std::string error;

    EXPECT_FALSE(orchestrator_->resume("nothing", outcome, error));
    EXPECT_EQ(error, "No interrupted transfer matches 'nothing'");

    auto active = orchestrator_->initiate_sends("bob", {"a.bin"}, false).front();
    EXPECT_FALSE(orchestrator_->resume(active.transfer_id, outcome, error));
    EXPECT_EQ(error, "DCC SEND of 'a.bin' to bob is NEGOTIATING and cannot be resumed");

    Transfer::Parameters params;
    params.id       = "feedbeef";
    params.peer     = "alice";
    params.filename = "song.mp3";
    auto receive    = std::make_shared<ReceiveTransfer>(params, nullptr, observer_);
    registry_->add(receive);
    receive->abort("Connection reset by peer");
    EXPECT_FALSE(orchestrator_->resume("feedbeef", outcome, error));
    EXPECT_EQ(error, "Cannot resume the receive of 'song.mp3' from alice from this side, ask "
                     "alice to send it again");

    settings_.resume_enabled = false;
    orchestrator_->reconfigure(settings_);
    EXPECT_FALSE(orchestrator_->resume(active.transfer_id, outcome, error));
    EXPECT_EQ(error, "Resuming transfers is disabled");
}

TEST_F(SendOrchestratorTest, ClearQueues)
{
    auto a = make_file("a.bin", 100);
    auto b = make_file("b.bin", 200);
    orchestrator_->initiate_sends("bob", {a, b}, false);

    orchestrator_->clear_queues();
    EXPECT_TRUE(orchestrator_->queued("bob").empty());
    EXPECT_FALSE(orchestrator_->process_next_in_queue("bob"));
}

TEST_F(SendOrchestratorTest, OffersAreSentOutsideTheOrchestratorLock)
{
    auto a = make_file("a.bin", 100);
    auto b = make_file("b.bin", 200);
    auto c = make_file("c.bin", 300);

    // A sender that reads the queue back is only possible while the orchestrator is unlocked
    std::vector<std::vector<std::string>> queued_while_sending;
    ON_CALL(*ctcp_sender_, send_ctcp(_, _))
        .WillByDefault(Invoke([&](const std::string &nick, const std::string &payload) {
            queued_while_sending.push_back(orchestrator_->queued(nick));
            sent_.emplace_back(nick, payload);
            return true;
        }));

    auto outcomes = orchestrator_->initiate_sends("bob", {a, b, c}, false);
    EXPECT_EQ(outcomes[0].result, SendOutcome::Result::STARTED);
    EXPECT_EQ(outcomes[1].queue_position, 1);
    EXPECT_EQ(outcomes[2].queue_position, 2);

    transfer_of(outcomes[0])->set_status(TransferStatus::COMPLETED);
    EXPECT_TRUE(orchestrator_->process_next_in_queue("bob"));

    EXPECT_THAT(queued_while_sending, ElementsAre(IsEmpty(), ElementsAre(c)));
    EXPECT_EQ(movers_started_, 2);
}

TEST_F(SendOrchestratorTest, FailedOfferLetsTheNextFileStart)
{
    auto a = make_file("a.bin", 100);
    auto b = make_file("b.bin", 200);
    auto c = make_file("c.bin", 300);

    EXPECT_CALL(*ctcp_sender_, send_ctcp(_, _)).Times(AnyNumber());
    EXPECT_CALL(*ctcp_sender_, send_ctcp("bob", StartsWith("DCC SEND a.bin ")))
        .WillOnce(Return(false));
    auto outcomes = orchestrator_->initiate_sends("bob", {a, b, c}, false);

    ASSERT_EQ(outcomes.size(), 3);
    EXPECT_EQ(outcomes[0].result, SendOutcome::Result::ERROR);
    EXPECT_EQ(outcomes[0].error, "DCC SEND of 'a.bin' to bob: the offer could not be sent");
    EXPECT_TRUE(outcomes[0].transfer_id.empty());
    EXPECT_EQ(outcomes[1].result, SendOutcome::Result::STARTED);
    EXPECT_EQ(outcomes[2].result, SendOutcome::Result::QUEUED);
    EXPECT_EQ(outcomes[2].queue_position, 1);
    EXPECT_EQ(movers_started_, 1);

    // The same holds for a queued file whose offer cannot be sent
    auto d = make_file("d.bin", 400);
    orchestrator_->initiate_sends("bob", {d}, false);
    EXPECT_CALL(*ctcp_sender_, send_ctcp("bob", StartsWith("DCC SEND c.bin ")))
        .WillOnce(Return(false));

    transfer_of(outcomes[1])->set_status(TransferStatus::COMPLETED);
    EXPECT_TRUE(orchestrator_->process_next_in_queue("bob"));
    EXPECT_THAT(sent_.back().second, StartsWith("DCC SEND d.bin "));
    EXPECT_TRUE(orchestrator_->queued("bob").empty());
}

TEST_F(SendOrchestratorTest, FailedResumeOfferLeavesTheInterruptedSendResumable)
{
    make_file("a.bin", 1000);
    interrupted_send("bob", "a.bin", 400);

    EXPECT_CALL(*ctcp_sender_, send_ctcp(_, _)).Times(AnyNumber());
    EXPECT_CALL(*ctcp_sender_, send_ctcp("bob", StartsWith("DCC RESUME a.bin ")))
        .WillOnce(Return(false))
        .WillRepeatedly(DoDefault());
    auto failed = orchestrator_->initiate_sends("bob", {"a.bin"}, false);
    EXPECT_EQ(failed.front().result, SendOutcome::Result::ERROR);

    // The failed resume was never offered, so the interrupted send is still the one to resume
    registry_->remove(registry_
                          ->find_latest([](const Transfer &t) {
                              return t.status() == TransferStatus::FAILED &&
                                     t.resume_offset() != 0;
                          })
                          ->id());
    auto retried = orchestrator_->initiate_sends("bob", {"a.bin"}, false);
    ASSERT_EQ(retried.front().result, SendOutcome::Result::STARTED);
    EXPECT_EQ(retried.front().resume_offset, 400);
}

TEST_F(SendOrchestratorTest, ForgottenTransferIsNoLongerRemembered)
{
    make_file("a.bin", 1000);
    auto interrupted = interrupted_send("bob", "a.bin", 400);

    auto first = orchestrator_->initiate_sends("bob", {"a.bin"}, false);
    ASSERT_EQ(first.front().resume_offset, 400);
    transfer_of(first.front())->cancel();

    // While remembered as resumed, the first interrupted send is not a candidate again
    orchestrator_->forget(interrupted->id());
    auto second = orchestrator_->initiate_sends("bob", {"a.bin"}, false);
    EXPECT_EQ(second.front().result, SendOutcome::Result::ERROR);
    EXPECT_THAT(second.front().error, HasSubstr("more than one interrupted send"));

    registry_->remove(interrupted->id());
    auto third = orchestrator_->initiate_sends("bob", {"a.bin"}, false);
    ASSERT_EQ(third.front().result, SendOutcome::Result::STARTED);
    EXPECT_EQ(third.front().resume_offset, 400);
}
