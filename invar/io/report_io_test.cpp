#include <gtest/gtest.h>
#include <invar/io/report_io.hpp>
#include <invar/testing/story_votes.hpp>

namespace invar {
namespace {

VerificationReport orphan_report() {
    StoryVotes fixture(false);
    VerifierOptions options;
    options.threads = 1;
    options.samples = 500;
    options.seed = 0;
    return Verifier(fixture.schema(), options).verify();
}

TEST(ReportIoTest, DumpsValues) {
    StoryVotes fixture;
    const Value vote = fixture.vote(5, 1, 2, 3, -1);
    protobuf::Value message;
    dump_value(vote, message);
    EXPECT_EQ(message.kind(), protobuf::Value::HANDLE);
    EXPECT_EQ(message.type(), "Vote");
    EXPECT_EQ(message.handle_id(), 5UL);
    const auto& val = message.val();
    EXPECT_EQ(val.kind(), protobuf::Value::RECORD);
    ASSERT_EQ(val.fields_size(), 4);
    EXPECT_EQ(val.fields(3).name(), "value");
    EXPECT_EQ(val.fields(3).value().int_value(), "-1");

    const Int big = Int(1) << 80;
    dump_value(Value::from_int(big), message);
    EXPECT_EQ(message.int_value(), "1208925819614629174706176");
}

TEST(ReportIoTest, DumpsReport) {
    const VerificationReport report = orphan_report();
    protobuf::VerificationReport message;
    dump_report(report, message);
    EXPECT_TRUE(message.IsInitialized());
    EXPECT_FALSE(message.deployable());
    ASSERT_EQ(static_cast<size_t>(message.verdicts_size()),
              report.verdicts().size());

    size_t disproven = 0;
    for (const auto& verdict : message.verdicts()) {
        if (verdict.kind() == protobuf::Verdict::DISPROVEN) {
            ++disproven;
            EXPECT_EQ(verdict.operation(), "insertVote");
            EXPECT_EQ(verdict.invariant(), "votesAreEmbedded");
            ASSERT_EQ(verdict.counterexample().params_size(), 1);
            EXPECT_EQ(verdict.counterexample().state_size(), 2);
        } else {
            EXPECT_FALSE(verdict.has_counterexample());
        }
    }
    EXPECT_EQ(disproven, 1UL);
}

TEST(ReportIoTest, WritesGzippedFile) {
    const VerificationReport report = orphan_report();
    protobuf::VerificationReport expected;
    dump_report(report, expected);
    in_temp_dir([&]() {
        write_report(report, "report.pb.gz");
        protobuf::VerificationReport actual;
        read_report("report.pb.gz", actual);
        EXPECT_EQ(actual.SerializeAsString(), expected.SerializeAsString());
    });
}

}  // namespace
}  // namespace invar
