#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>

#include "daemon/receiver.hpp"
#include "daemon/sender.hpp"
#include "test_transport.hpp"

using namespace ferry;
using ferry::testing::RecordingTransport;
using ferry::testing::pattern_bytes;

class ReceiverTest : public ::testing::Test {
protected:
    void SetUp() override { make_receiver(true); }

    void make_receiver(bool auto_accept, uint64_t max_file_size = DEFAULT_MAX_FILE_SIZE) {
        receiver_ = std::make_unique<Receiver>(
            rx_wire_, [this](const StatusEvent& ev) { events_.push_back(ev); },
            [this] { return passphrase_; }, auto_accept, max_file_size);
    }

    void expect_refused(const std::string& id) {
        const auto* t = receiver_->find(id);
        ASSERT_NE(t, nullptr);
        EXPECT_TRUE(t->cancelled);
        EXPECT_FALSE(t->ready);
        EXPECT_TRUE(t->chunks.empty());
        EXPECT_EQ(t->error, TransferError::TooLarge);
        EXPECT_EQ(events_.back().op, "error");

        auto cancels = rx_wire_.envelopes(Op::Cancel);
        ASSERT_EQ(cancels.size(), 1u);
        EXPECT_EQ(cancels[0].transfer_id, id);
        EXPECT_EQ(std::get<CancelMessage>(cancels[0].body).reason, "too-large");
    }

    std::string send(size_t n, const std::string& passphrase = "", const std::string& name = "data.bin") {
        auto id = sender_.begin(std::make_unique<MemoryFile>(pattern_bytes(n), name), "", passphrase, 1024);
        while (sender_.step()) {}
        return *id;
    }

    // Sender frames -> receiver, skipping whatever `drop` selects
    void deliver(const std::function<bool(const Envelope&)>& drop = nullptr) {
        ferry::testing::shuttle(tx_wire_, [this](const std::string& payload) {
            receiver_->handle(*decode_text(payload), "peer-a");
        }, drop);
    }

    // Receiver frames (resend requests) -> sender
    void answer_requests() {
        ferry::testing::shuttle(rx_wire_, [this](const std::string& payload) {
            auto env = decode_text(payload);
            if (env && env->op() == Op::Request) {
                sender_.serve_request(env->transfer_id, std::get<RequestMessage>(env->body));
            }
        });
    }

    std::vector<std::string> ops() const {
        std::vector<std::string> out;
        for (const auto& ev : events_) out.push_back(ev.op);
        return out;
    }

    RecordingTransport tx_wire_;
    RecordingTransport rx_wire_;
    Sender sender_{tx_wire_, nullptr};
    std::unique_ptr<Receiver> receiver_;
    std::vector<StatusEvent> events_;
    std::string passphrase_;
};

TEST_F(ReceiverTest, PlainTransferIsDeliveredOnce) {
    auto id = send(2500);
    deliver();

    const auto* t = receiver_->find(id);
    ASSERT_NE(t, nullptr);
    EXPECT_TRUE(t->ready);
    EXPECT_TRUE(t->delivered);
    EXPECT_EQ(t->result, pattern_bytes(2500));
    EXPECT_EQ(t->from, "peer-a");
    EXPECT_EQ(receiver_->active_id(), id);

    auto files = rx_wire_.files();
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0]["transferId"].get<std::string>(), id);
    EXPECT_EQ(files[0]["name"], "data.bin");
    EXPECT_EQ(files[0]["size"], 2500);
    EXPECT_EQ(files[0]["encrypted"], false);
    auto data = crypto::base64_decode(files[0]["data"].get<std::string>());
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(*data, pattern_bytes(2500));

    auto seen = ops();
    EXPECT_EQ(seen.front(), "header");
    EXPECT_EQ(seen.back(), "complete");
}

TEST_F(ReceiverTest, ChunksBeforeHeaderStillAssemble) {
    auto id = send(3000);
    auto frames = tx_wire_.take_outgoing();

    ASSERT_EQ(frames.size(), 5u); // header, 3 chunks, complete

    // Chunks in reverse, then the header, then complete
    for (size_t i = 3; i >= 1; i--) receiver_->handle(*decode_text(frames[i]));
    EXPECT_EQ(receiver_->find(id)->total_chunks, 3u);
    receiver_->handle(*decode_text(frames[0]));
    receiver_->handle(*decode_text(frames[4]));

    const auto* t = receiver_->find(id);
    ASSERT_NE(t, nullptr);
    EXPECT_TRUE(t->ready);
    EXPECT_EQ(t->result, pattern_bytes(3000));
    EXPECT_EQ(t->name, "data.bin");
}

TEST_F(ReceiverTest, DuplicatesDoNotDoubleCount) {
    auto id = send(3000);
    auto frames = tx_wire_.take_outgoing();
    ASSERT_EQ(frames.size(), 5u); // header, 3 chunks, complete

    receiver_->handle(*decode_text(frames[0]));
    receiver_->handle(*decode_text(frames[1]));
    receiver_->handle(*decode_text(frames[1]));
    EXPECT_EQ(receiver_->find(id)->received_count, 1u);
}

TEST_F(ReceiverTest, OutOfRangeAndZeroSequencesAreIgnored) {
    auto id = send(1500);
    auto frames = tx_wire_.take_outgoing();
    receiver_->handle(*decode_text(frames[0]));

    receiver_->handle(Envelope{id, 0, ChunkMessage{0, 2, "AAAA"}});
    receiver_->handle(Envelope{id, 0, ChunkMessage{7, 2, "AAAA"}});

    const auto* t = receiver_->find(id);
    EXPECT_EQ(t->received_count, 0u);
    EXPECT_TRUE(t->chunks.empty());
}

TEST_F(ReceiverTest, LostChunkIsRequestedAndRecovered) {
    auto id = send(5 * 1024);
    deliver([](const Envelope& env) {
        return env.op() == Op::Chunk && std::get<ChunkMessage>(env.body).seq == 2;
    });

    const auto* t = receiver_->find(id);
    ASSERT_NE(t, nullptr);
    EXPECT_TRUE(t->completed);
    EXPECT_FALSE(t->ready);
    EXPECT_EQ(t->missing_tries, 1u);

    auto requests = rx_wire_.envelopes(Op::Request);
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(std::get<RequestMessage>(requests[0].body).missing, (std::vector<uint32_t>{2}));

    EXPECT_EQ(events_.back().op, "request");
    EXPECT_EQ(*events_.back().tries, 1u);

    answer_requests();
    deliver();

    EXPECT_TRUE(t->ready);
    EXPECT_EQ(t->result, pattern_bytes(5 * 1024));
    EXPECT_EQ(rx_wire_.files().size(), 1u);
}

TEST_F(ReceiverTest, WrongPassphraseDecryptsNothing) {
    passphrase_ = "wrong";
    auto id = send(3000, "secret");
    deliver();

    const auto* t = receiver_->find(id);
    ASSERT_NE(t, nullptr);
    EXPECT_TRUE(t->encrypted());
    EXPECT_FALSE(t->ready);
    EXPECT_TRUE(t->result.empty());
    EXPECT_EQ(t->error, TransferError::PassphraseMismatch);
    EXPECT_EQ(t->status_text, "Assemble failed: Passphrase mismatch");
    EXPECT_TRUE(rx_wire_.files().empty());
    EXPECT_EQ(events_.back().op, "error");

    // Correct it and retry
    passphrase_ = "secret";
    auto retried = receiver_->retry(id);
    ASSERT_TRUE(retried.has_value());
    EXPECT_TRUE(retried->empty());
    EXPECT_TRUE(t->ready);
    EXPECT_FALSE(t->error.has_value());
    EXPECT_EQ(t->result, pattern_bytes(3000));
}

TEST_F(ReceiverTest, EncryptedWithoutPassphraseWaits) {
    auto id = send(500, "secret");
    deliver();

    const auto* t = receiver_->find(id);
    EXPECT_EQ(t->error, TransferError::PassphraseRequired);
    EXPECT_EQ(t->status_text, "Assemble failed: Encrypted file - provide passphrase");
}

TEST_F(ReceiverTest, CancelDiscardsChunks) {
    auto id = send(5 * 1024);
    auto frames = tx_wire_.take_outgoing();
    receiver_->handle(*decode_text(frames[0]));
    receiver_->handle(*decode_text(frames[1]));

    receiver_->handle(Envelope{id, 0, CancelMessage{"sender-cancel"}});
    const auto* t = receiver_->find(id);
    EXPECT_TRUE(t->cancelled);
    EXPECT_TRUE(t->chunks.empty());
    EXPECT_EQ(t->status_text, "Transfer cancelled (sender-cancel)");

    // Late chunks and complete change nothing
    for (size_t i = 2; i < frames.size(); i++) receiver_->handle(*decode_text(frames[i]));
    EXPECT_FALSE(t->ready);
    EXPECT_TRUE(t->chunks.empty());
    EXPECT_TRUE(rx_wire_.envelopes(Op::Request).empty());

    auto retried = receiver_->retry(id);
    ASSERT_FALSE(retried.has_value());
    EXPECT_EQ(retried.error(), TransferError::MissingMetadata);
}

TEST_F(ReceiverTest, CancelForUnknownIdStillReported) {
    receiver_->handle(Envelope{"ft-unknown", 0, CancelMessage{"x"}});
    EXPECT_EQ(receiver_->size(), 0u);
    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0].op, "cancel");
}

TEST_F(ReceiverTest, ManualAcceptHoldsDelivery) {
    make_receiver(false);
    auto id = send(700);
    deliver();

    const auto* t = receiver_->find(id);
    EXPECT_TRUE(t->ready);
    EXPECT_FALSE(t->delivered);
    EXPECT_TRUE(rx_wire_.files().empty());

    EXPECT_TRUE(receiver_->accept(id));
    EXPECT_TRUE(t->delivered);
    EXPECT_EQ(rx_wire_.files().size(), 1u);

    // Accepting twice does not deliver twice
    EXPECT_TRUE(receiver_->accept(id));
    EXPECT_EQ(rx_wire_.files().size(), 1u);
    EXPECT_FALSE(receiver_->accept("ft-nope"));
}

TEST_F(ReceiverTest, HeaderReusingFinishedIdStartsOver) {
    auto id = send(700);
    deliver();
    ASSERT_TRUE(receiver_->find(id)->ready);

    HeaderMessage h;
    h.name = "again.bin";
    h.size = 100;
    h.total_chunks = 1;
    receiver_->handle(Envelope{id, 0, h});

    const auto* t = receiver_->find(id);
    EXPECT_FALSE(t->ready);
    EXPECT_EQ(t->name, "again.bin");
    EXPECT_EQ(t->received_count, 0u);
}

TEST_F(ReceiverTest, RetryBeforeCompleteOnlyReportsGaps) {
    auto id = send(3000);
    auto frames = tx_wire_.take_outgoing();
    receiver_->handle(*decode_text(frames[0]));
    receiver_->handle(*decode_text(frames[2]));

    auto gaps = receiver_->retry(id);
    ASSERT_TRUE(gaps.has_value());
    EXPECT_EQ(*gaps, (std::vector<uint32_t>{1, 3}));
    EXPECT_TRUE(rx_wire_.envelopes(Op::Request).empty());
}

TEST_F(ReceiverTest, ConcurrentTransfersStayApart) {
    auto first = send(1500, "", "a.bin");
    auto a_frames = tx_wire_.take_outgoing();
    auto second = send(2500, "", "b.bin");
    auto b_frames = tx_wire_.take_outgoing();

    // Interleave the two streams
    for (size_t i = 0; i < std::max(a_frames.size(), b_frames.size()); i++) {
        if (i < a_frames.size()) receiver_->handle(*decode_text(a_frames[i]));
        if (i < b_frames.size()) receiver_->handle(*decode_text(b_frames[i]));
    }

    EXPECT_EQ(receiver_->size(), 2u);
    EXPECT_EQ(receiver_->find(first)->result, pattern_bytes(1500));
    EXPECT_EQ(receiver_->find(second)->result, pattern_bytes(2500));
}

TEST_F(ReceiverTest, SaveUsesSanitisedName) {
    auto id = send(900, "", "../../escape.txt");
    deliver();

    auto dir = std::filesystem::temp_directory_path() / "ferry_receiver_test";
    auto path = receiver_->save(id, dir);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->parent_path().string(), dir.string());
    EXPECT_EQ(path->filename().string(), "escape.txt");
    EXPECT_EQ(std::filesystem::file_size(*path), 900u);

    std::filesystem::remove_all(dir);
}

TEST_F(ReceiverTest, ClearForgetsEverything) {
    send(100);
    deliver();
    receiver_->clear();
    EXPECT_EQ(receiver_->size(), 0u);
    EXPECT_TRUE(receiver_->active_id().empty());
}

TEST_F(ReceiverTest, HugeSequenceBeforeHeaderIsDropped) {
    receiver_->handle(Envelope{"ft-x", 0, ChunkMessage{4'000'000'000u, 0, "AAAA"}});

    const auto* t = receiver_->find("ft-x");
    ASSERT_NE(t, nullptr);
    EXPECT_FALSE(t->cancelled);
    EXPECT_TRUE(t->chunks.empty());
    EXPECT_EQ(t->received_count, 0u);
    EXPECT_EQ(t->buffered, 0u);

    // The same record still takes a real transfer afterwards
    ChunkMessage ok{1, 1, crypto::base64_encode(pattern_bytes(10))};
    ok.size = 10;
    receiver_->handle(Envelope{"ft-x", 0, ok});
    receiver_->handle(Envelope{"ft-x", 0, CompleteMessage{1, 10}});
    EXPECT_TRUE(t->ready);
    EXPECT_EQ(t->result, pattern_bytes(10));
}

TEST_F(ReceiverTest, HugeChunkCountIsRefused) {
    HeaderMessage h;
    h.name = "bomb.bin";
    h.total_chunks = 4'000'000'000u;
    receiver_->handle(Envelope{"ft-count", 0, h});
    expect_refused("ft-count");
    EXPECT_EQ(receiver_->find("ft-count")->name, "bomb.bin");

    // Later traffic for the refused id is ignored
    receiver_->handle(Envelope{"ft-count", 0, ChunkMessage{1, 4'000'000'000u, "AAAA"}});
    receiver_->handle(Envelope{"ft-count", 0, CompleteMessage{4'000'000'000u, 0}});
    EXPECT_TRUE(receiver_->find("ft-count")->chunks.empty());
    EXPECT_EQ(rx_wire_.envelopes(Op::Cancel).size(), 1u);
    EXPECT_TRUE(rx_wire_.envelopes(Op::Request).empty());
}

TEST_F(ReceiverTest, HugeDeclaredSizeIsRefused) {
    HeaderMessage h;
    h.name = "huge.bin";
    h.size = 1'000'000'000'000'000ull;
    h.total_chunks = 1;
    receiver_->handle(Envelope{"ft-size", 0, h});
    receiver_->handle(Envelope{"ft-size", 0, ChunkMessage{1, 1, "AAAA"}});
    receiver_->handle(Envelope{"ft-size", 0, CompleteMessage{1, 1'000'000'000'000'000ull}});

    expect_refused("ft-size");
    EXPECT_TRUE(receiver_->find("ft-size")->result.empty());
}

TEST_F(ReceiverTest, HugeSizeOnCompleteAloneIsRefused) {
    receiver_->handle(Envelope{"ft-late", 0, CompleteMessage{1, 1'000'000'000'000'000ull}});
    expect_refused("ft-late");
}

TEST_F(ReceiverTest, ConfiguredLimitIsHonoured) {
    make_receiver(true, 2048);

    auto small = send(2000);
    deliver();
    EXPECT_TRUE(receiver_->find(small)->ready);

    auto big = send(3000);
    deliver();
    expect_refused(big);
    EXPECT_EQ(rx_wire_.files().size(), 1u);
}

TEST_F(ReceiverTest, ChunkDataBeyondDeclaredSizeIsRefused) {
    HeaderMessage h;
    h.size = 10;
    receiver_->handle(Envelope{"ft-fat", 0, h});

    // Far more payload than ten bytes could ever encode to
    receiver_->handle(Envelope{"ft-fat", 0, ChunkMessage{1, 0, crypto::base64_encode(pattern_bytes(4096))}});
    expect_refused("ft-fat");
}

TEST_F(ReceiverTest, OversizedChunkTextIsDropped) {
    auto id = send(1500);
    auto frames = tx_wire_.take_outgoing();
    receiver_->handle(*decode_text(frames[0]));

    receiver_->handle(Envelope{id, 0, ChunkMessage{1, 2, std::string(64 * 1024, 'A')}});
    const auto* t = receiver_->find(id);
    EXPECT_FALSE(t->cancelled);
    EXPECT_TRUE(t->chunks.empty());
}
