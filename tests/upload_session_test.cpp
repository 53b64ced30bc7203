// tests/upload_session_test.cpp
#include <gtest/gtest.h>

#include "digest_utility.hpp"
#include "test_helpers.hpp"
#include "upload_errors.hpp"
#include "upload_session.hpp"

namespace MultipartUploader {
namespace Session {
namespace test {

class UploadSessionTest : public Testing::StoreTest {
protected:
    void SetUp() override {
        Testing::StoreTest::SetUp();
        useMinimumPartSize(1);
        faults = std::make_unique<Testing::FaultInjectingStore>(*store);
    }

    void TearDown() override {
        faults.reset();
        Testing::StoreTest::TearDown();
    }

    const std::vector<char> first{'h', 'e', 'l', 'l', 'o'};
    const std::vector<char> second{'!'};
    std::unique_ptr<Testing::FaultInjectingStore> faults;
};

TEST_F(UploadSessionTest, BeginUploadFinalize) {
    UploadSession session(*faults, "md5");
    EXPECT_EQ(session.state(), SessionState::NotStarted);

    std::string id = session.begin(BUCKET, "greeting", "whole-file-digest");
    EXPECT_EQ(session.state(), SessionState::InProgress);
    EXPECT_EQ(session.uploadId(), id);

    Store::PartAck ack1 = session.uploadPart(1, first);
    Store::PartAck ack2 = session.uploadPart(2, second);
    EXPECT_EQ(ack1.part_number, 1);
    EXPECT_EQ(ack2.part_number, 2);

    FinalizedObject object = session.finalize({ack1, ack2});

    EXPECT_EQ(session.state(), SessionState::Completed);
    EXPECT_EQ(object.size, 6u);
    EXPECT_EQ(object.digest, "whole-file-digest");
    EXPECT_EQ(object.key, "greeting");
    EXPECT_EQ(store->readObject(BUCKET, "greeting"), (std::vector<char>{'h', 'e', 'l', 'l', 'o', '!'}));
    EXPECT_EQ(faults->abort_calls.load(), 0);
}

TEST_F(UploadSessionTest, MetadataKeyIsTheDigestAlgorithm) {
    UploadSession session(*faults, "sha256");
    session.begin(BUCKET, "greeting", "abc");
    session.finalize({session.uploadPart(1, first)});

    EXPECT_EQ(store->headObject(BUCKET, "greeting").metadata.at("sha256"), "abc");
}

TEST_F(UploadSessionTest, UploadsPieceFileAsReadAtTransmission) {
    std::filesystem::path piece_path = workdir() / "greeting.1";
    Testing::writeFile(piece_path, std::string("hello"));
    Pieces::FilePiece piece(1, piece_path, 0, 5);

    UploadSession session(*faults, "md5");
    session.begin(BUCKET, "greeting", "d");
    // The piece changes after splitting; what gets sent and hashed is the current content.
    Testing::writeFile(piece_path, std::string("HELLO"));
    FinalizedObject object = session.finalize({session.uploadPart(piece, 1)});

    EXPECT_EQ(object.size, 5u);
    EXPECT_EQ(store->readObject(BUCKET, "greeting"), (std::vector<char>{'H', 'E', 'L', 'L', 'O'}));
}

TEST_F(UploadSessionTest, UnsupportedAlgorithmFailsBeforeAnyRemoteCall) {
    EXPECT_THROW({ UploadSession rejected(*faults, "no-such-digest"); }, UnsupportedAlgorithm);
    EXPECT_EQ(faults->create_calls.load(), 0);
}

TEST_F(UploadSessionTest, IllegalTransitions) {
    UploadSession session(*faults, "md5");
    EXPECT_THROW(session.uploadPart(1, first), SessionStateError);
    EXPECT_THROW(session.finalize({}), SessionStateError);
    EXPECT_THROW(session.abort(), SessionStateError);

    session.begin(BUCKET, "k", "d");
    EXPECT_THROW(session.begin(BUCKET, "k", "d"), SessionStateError);

    session.abort();
    EXPECT_EQ(session.state(), SessionState::Aborted);
    EXPECT_THROW(session.abort(), SessionStateError);
    EXPECT_THROW(session.uploadPart(1, first), SessionStateError);
    EXPECT_THROW(session.finalize({}), SessionStateError);
    EXPECT_EQ(faults->abort_calls.load(), 1);
}

TEST_F(UploadSessionTest, StrictOrderRejectsGapsAndRepeats) {
    UploadSession session(*faults, "md5");
    session.begin(BUCKET, "k", "d");

    EXPECT_THROW(session.uploadPart(2, first), SessionStateError);
    session.uploadPart(1, first);
    EXPECT_THROW(session.uploadPart(1, first), SessionStateError);
    EXPECT_EQ(faults->part_calls.load(), 1);
    session.abort();
}

TEST_F(UploadSessionTest, UnorderedSessionAcceptsAnyOrderOnce) {
    UploadSession session(*faults, "md5", false);
    session.begin(BUCKET, "k", "d");

    Store::PartAck ack2 = session.uploadPart(2, second);
    Store::PartAck ack1 = session.uploadPart(1, first);
    EXPECT_THROW(session.uploadPart(2, second), SessionStateError);

    FinalizedObject object = session.finalize({ack1, ack2});
    EXPECT_EQ(object.size, 6u);
}

TEST_F(UploadSessionTest, FinalizeRequiresExactlyOneThroughN) {
    UploadSession session(*faults, "md5");
    session.begin(BUCKET, "k", "d");
    Store::PartAck ack1 = session.uploadPart(1, first);
    Store::PartAck ack2 = session.uploadPart(2, second);

    EXPECT_THROW(session.finalize({ack2, ack1}), FinalizeError);
    EXPECT_THROW(session.finalize({ack1}), FinalizeError);
    EXPECT_THROW(session.finalize({ack1, ack1}), FinalizeError);
    EXPECT_THROW(session.finalize({ack1, Store::PartAck{2, "\"forged\""}}), FinalizeError);
    EXPECT_EQ(faults->complete_calls.load(), 0);
    EXPECT_EQ(session.state(), SessionState::InProgress);

    session.finalize({ack1, ack2});
    EXPECT_EQ(session.state(), SessionState::Completed);
}

TEST_F(UploadSessionTest, CorruptedPartIsRejectedAsPartUploadError) {
    faults->corrupt_part = 1;
    UploadSession session(*faults, "md5");
    session.begin(BUCKET, "k", "d");

    try {
        session.uploadPart(1, first);
        FAIL() << "corrupted part was accepted";
    } catch (const PartUploadError& e) {
        EXPECT_EQ(e.partNumber(), 1);
        EXPECT_NE(std::string(e.what()).find("BadDigest"), std::string::npos);
    }
    EXPECT_TRUE(session.isOpen());
    session.abort();
    EXPECT_TRUE(store->liveUploadIds().empty());
}

TEST_F(UploadSessionTest, StoreRejectionOnCompleteIsFinalizeError) {
    faults->fail_complete = true;
    UploadSession session(*faults, "md5");
    session.begin(BUCKET, "k", "d");
    Store::PartAck ack = session.uploadPart(1, first);

    EXPECT_THROW(session.finalize({ack}), FinalizeError);
    EXPECT_EQ(session.state(), SessionState::InProgress);
    session.abort();
    EXPECT_EQ(session.state(), SessionState::Aborted);
}

TEST_F(UploadSessionTest, AbortFailureIsReportedAndSessionStillTerminates) {
    faults->fail_abort = true;
    UploadSession session(*faults, "md5");
    session.begin(BUCKET, "k", "d");

    EXPECT_THROW(session.abort(), AbortError);
    EXPECT_EQ(session.state(), SessionState::Aborted);
    ASSERT_TRUE(session.abortFailure().has_value());
    EXPECT_NE(session.abortFailure()->find("injected abort failure"), std::string::npos);
}

TEST_F(UploadSessionTest, GuardAbortsOpenSessionOnScopeExit) {
    UploadSession session(*faults, "md5");
    session.begin(BUCKET, "k", "d");
    try {
        SessionAbortGuard guard(session);
        session.uploadPart(1, first);
        throw std::runtime_error("interrupted between parts");
    } catch (const std::runtime_error&) {
    }

    EXPECT_EQ(session.state(), SessionState::Aborted);
    EXPECT_EQ(faults->abort_calls.load(), 1);
    EXPECT_TRUE(store->liveUploadIds().empty());
}

TEST_F(UploadSessionTest, GuardLeavesCompletedSessionAlone) {
    UploadSession session(*faults, "md5");
    session.begin(BUCKET, "k", "d");
    {
        SessionAbortGuard guard(session);
        session.finalize({session.uploadPart(1, first)});
    }
    EXPECT_EQ(session.state(), SessionState::Completed);
    EXPECT_EQ(faults->abort_calls.load(), 0);
}

TEST_F(UploadSessionTest, GuardRecordsAbortFailure) {
    faults->fail_abort = true;
    UploadSession session(*faults, "md5");
    session.begin(BUCKET, "k", "d");
    {
        SessionAbortGuard guard(session);
    }
    EXPECT_EQ(session.state(), SessionState::Aborted);
    EXPECT_TRUE(session.abortFailure().has_value());
}

TEST_F(UploadSessionTest, StateNames) {
    EXPECT_STREQ(toString(SessionState::NotStarted), "NotStarted");
    EXPECT_STREQ(toString(SessionState::InProgress), "InProgress");
    EXPECT_STREQ(toString(SessionState::Completed), "Completed");
    EXPECT_STREQ(toString(SessionState::Aborted), "Aborted");
}

} // namespace test
} // namespace Session
} // namespace MultipartUploader
