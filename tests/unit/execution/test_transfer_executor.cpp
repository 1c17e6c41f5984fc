/**
 * @file test_transfer_executor.cpp
 * @brief Unit tests for transfer_executor with a scripted bulk tool
 */

#include <gtest/gtest.h>

#include <kcenon/object_transfer/execution/transfer_executor.h>
#include <kcenon/object_transfer/storage/local_object_store.h>

#include "../../support/scripted_process_runner.h"

#include <csignal>
#include <filesystem>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace kcenon::object_transfer::test {

class TransferExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() /
                ("object_trans_exec_" + std::to_string(std::random_device{}()));
        store_ = std::make_shared<local_object_store>(root_ / "store");
        ASSERT_TRUE(store_->create_bucket("data.binance.vision").has_value());
        ASSERT_TRUE(store_->create_bucket("market-archive").has_value());

        stores_ = std::make_shared<object_store_registry>();
        stores_->add(store_);
        runner_ = std::make_shared<scripted_process_runner>();

        retry_.max_attempts = 1;
        retry_.initial_delay = std::chrono::milliseconds(1);
        retry_.max_delay = std::chrono::milliseconds(2);
        retry_.use_jitter = false;
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    static auto source_url(std::size_t i) -> std::string {
        return "s3://data.binance.vision/klines/" + std::to_string(i) + ".zip";
    }

    static auto destination_url(std::size_t i) -> std::string {
        return "s3://market-archive/binance/klines/" + std::to_string(i) + ".zip";
    }

    auto make_batch(std::size_t count, transfer_mode mode) -> transfer_batch {
        transfer_batch batch;
        batch.id = "test-batch";
        batch.mode = mode;
        batch.state = batch_state::mode_selected;
        for (std::size_t i = 0; i < count; ++i) {
            auto source = object_url::parse(source_url(i)).value();
            auto written = store_->put(source.store(), "payload-" + std::to_string(i));
            EXPECT_TRUE(written.has_value());
            batch.descriptors.emplace_back(source, object_url::parse(destination_url(i)).value(),
                                           written.value());
        }
        if (mode == transfer_mode::direct_sync) {
            batch.commands = generator()->generate(batch.descriptors).value();
        }
        return batch;
    }

    auto generator() -> std::shared_ptr<const batch_command_generator> {
        return std::make_shared<const batch_command_generator>(bulk_tool_config{}, commands_);
    }

    auto make_executor() -> std::unique_ptr<transfer_executor> {
        staging_config staging;
        staging.root = root_ / "staging";
        auto fallback = std::make_shared<const traditional_transfer>(
            stores_, nullptr, std::make_shared<staging_area>(staging), retry_);
        auto executor = std::make_unique<transfer_executor>(
            runner_, std::make_shared<const regex_line_classifier>(), generator(),
            std::move(fallback), nullptr, executor_options{2, retry_});
        executor->set_event_handler(handler_);
        return executor;
    }

    static auto copied(std::size_t i) -> std::string {
        return "cp " + source_url(i) + " " + destination_url(i);
    }

    std::filesystem::path root_;
    std::shared_ptr<local_object_store> store_;
    std::shared_ptr<object_store_registry> stores_;
    std::shared_ptr<scripted_process_runner> runner_;
    cloud_retry_policy retry_;
    command_options commands_;
    transfer_event_handler handler_;
};

// =============================================================================
// Line mapping
// =============================================================================

TEST_F(TransferExecutorTest, IdentifiedLinesMapByUrl) {
    runner_->push(process_script::exit_with(1)
                      .out(copied(1))
                      .err("ERROR \"" + copied(0) + "\": AccessDenied: Access Denied"));
    auto batch = make_batch(3, transfer_mode::direct_sync);
    auto executor = make_executor();

    auto outcome = executor->execute(batch, {});

    ASSERT_EQ(outcome.results.size(), 3u);
    EXPECT_FALSE(outcome.results[0].succeeded());
    EXPECT_EQ(outcome.results[0].error_detail->code, error_code::access_denied);
    EXPECT_TRUE(outcome.results[1].succeeded());
    EXPECT_EQ(outcome.results[1].bytes_transferred, *batch.descriptors[1].size_hint());
    EXPECT_EQ(outcome.results[1].network_transfers, 1u);
    EXPECT_EQ(outcome.results[2].error_detail->code, error_code::result_not_reported);
    EXPECT_EQ(batch.state, batch_state::partially_failed);
    EXPECT_TRUE(outcome.mode_switches.empty());

    for (const auto& r : outcome.results) {
        EXPECT_EQ(r.operations, 1u);
        EXPECT_EQ(r.mode, transfer_mode::direct_sync);
    }
}

TEST_F(TransferExecutorTest, GenericErrorIsNotPinnedNextToIdentifiedLines) {
    const std::string generic = "ERROR NoSuchKey: The specified key does not exist.";
    runner_->push(process_script::exit_with(1).err(generic).out(copied(0)));
    auto batch = make_batch(2, transfer_mode::direct_sync);
    auto executor = make_executor();

    auto outcome = executor->execute(batch, {});

    ASSERT_EQ(outcome.results.size(), 2u);
    EXPECT_TRUE(outcome.results[0].succeeded());
    EXPECT_EQ(outcome.results[0].network_transfers, 1u);
    EXPECT_EQ(outcome.results[1].error_detail->code, error_code::result_not_reported);
    ASSERT_EQ(outcome.audit_lines.size(), 1u);
    EXPECT_EQ(outcome.audit_lines[0], generic);
    EXPECT_TRUE(outcome.mode_switches.empty());
}

TEST_F(TransferExecutorTest, PositionalLinesMapWhenNothingIsIdentified) {
    runner_->push(process_script::exit_with(0)
                      .err("ERROR failed to copy object: AccessDenied: Access Denied"));
    auto batch = make_batch(2, transfer_mode::direct_sync);
    auto executor = make_executor();

    auto outcome = executor->execute(batch, {});

    ASSERT_EQ(outcome.results.size(), 2u);
    EXPECT_EQ(outcome.results[0].error_detail->code, error_code::access_denied);
    EXPECT_TRUE(outcome.results[1].succeeded());
    EXPECT_TRUE(outcome.results[1].skipped);
    EXPECT_TRUE(outcome.audit_lines.empty());
}

TEST_F(TransferExecutorTest, KeysWithSpacesMapByUrl) {
    transfer_batch batch;
    batch.id = "test-batch";
    batch.mode = transfer_mode::direct_sync;
    batch.state = batch_state::mode_selected;

    auto source = object_url::parse("s3://data.binance.vision/klines/BTC USDT/a b.zip").value();
    auto destination =
        object_url::parse("s3://market-archive/binance/klines/BTC USDT/a b.zip").value();
    auto written = store_->put(source.store(), "payload");
    ASSERT_TRUE(written.has_value());
    batch.descriptors.emplace_back(source, destination, written.value());
    batch.descriptors.emplace_back(object_url::parse(source_url(1)).value(),
                                   object_url::parse(destination_url(1)).value());
    batch.commands = generator()->generate(batch.descriptors).value();

    runner_->push(process_script::exit_with(1)
                      .out("cp " + source.to_string() + " " + destination.to_string())
                      .err("ERROR \"" + generator()->render_directive(batch.descriptors[1]) +
                           "\": AccessDenied: Access Denied"));
    auto executor = make_executor();

    auto outcome = executor->execute(batch, {});

    ASSERT_EQ(outcome.results.size(), 2u);
    EXPECT_TRUE(outcome.results[0].succeeded());
    EXPECT_FALSE(outcome.results[0].skipped);
    EXPECT_EQ(outcome.results[0].bytes_transferred, written.value());
    EXPECT_EQ(outcome.results[1].error_detail->code, error_code::access_denied);
    EXPECT_TRUE(outcome.audit_lines.empty());
}

TEST_F(TransferExecutorTest, CleanExitWithoutLinesMeansSkipped) {
    runner_->push(process_script::exit_with(0).out(copied(0)));
    auto batch = make_batch(2, transfer_mode::direct_sync);
    auto executor = make_executor();

    auto outcome = executor->execute(batch, {});

    ASSERT_EQ(outcome.results.size(), 2u);
    EXPECT_FALSE(outcome.results[0].skipped);
    EXPECT_TRUE(outcome.results[1].succeeded());
    EXPECT_TRUE(outcome.results[1].skipped);
    EXPECT_EQ(outcome.results[1].network_transfers, 0u);
    EXPECT_EQ(batch.state, batch_state::completed);
}

TEST_F(TransferExecutorTest, UnmappedLinesGoToAudit) {
    runner_->push(process_script::exit_with(0)
                      .out("s5cmd starting 2 workers")
                      .out(copied(0))
                      .out("cp s3://elsewhere-bucket/x s3://market-archive/x"));
    auto batch = make_batch(1, transfer_mode::direct_sync);
    auto executor = make_executor();

    auto outcome = executor->execute(batch, {});

    ASSERT_EQ(outcome.audit_lines.size(), 2u);
    EXPECT_EQ(outcome.audit_lines[0], "s5cmd starting 2 workers");
    EXPECT_EQ(outcome.audit_lines[1], "cp s3://elsewhere-bucket/x s3://market-archive/x");
    EXPECT_TRUE(outcome.results[0].succeeded());
}

TEST_F(TransferExecutorTest, TimedOutInvocationFailsOpenDescriptors) {
    auto script = process_script::exit_with(-1).out(copied(0));
    script.outcome.timed_out = true;
    script.outcome.term_signal = SIGKILL;
    runner_->push(script);
    auto batch = make_batch(2, transfer_mode::direct_sync);
    auto executor = make_executor();

    auto outcome = executor->execute(batch, {});

    ASSERT_EQ(outcome.results.size(), 2u);
    EXPECT_TRUE(outcome.results[0].succeeded());
    EXPECT_EQ(outcome.results[1].error_detail->code, error_code::process_timeout);
    EXPECT_TRUE(outcome.mode_switches.empty());
}

// =============================================================================
// Retries
// =============================================================================

TEST_F(TransferExecutorTest, RetryRoundOnlyCarriesRetryableFailures) {
    retry_.max_attempts = 3;
    runner_->push(process_script::exit_with(1)
                      .out(copied(0))
                      .err("ERROR \"" + copied(1) + "\": SlowDown: Please reduce your request rate.")
                      .err("ERROR \"" + copied(2) + "\": NoSuchKey: The specified key does not exist."));
    runner_->push(process_script::exit_with(0).out(copied(1)));

    std::vector<transfer_result> attempts;
    handler_.on_attempt = [&](const transfer_result& r) { attempts.push_back(r); };
    auto batch = make_batch(3, transfer_mode::direct_sync);
    auto executor = make_executor();

    auto outcome = executor->execute(batch, {});

    auto specs = runner_->specs();
    ASSERT_EQ(specs.size(), 2u);
    EXPECT_NE(specs[1].stdin_data.find(source_url(1)), std::string::npos);
    EXPECT_EQ(specs[1].stdin_data.find(source_url(0)), std::string::npos);
    EXPECT_EQ(specs[1].stdin_data.find(source_url(2)), std::string::npos);

    ASSERT_EQ(attempts.size(), 1u);
    EXPECT_EQ(attempts[0].status, transfer_status::retried);

    ASSERT_EQ(outcome.results.size(), 3u);
    EXPECT_TRUE(outcome.results[1].succeeded());
    EXPECT_EQ(outcome.results[1].attempt, 2u);
    EXPECT_EQ(outcome.results[1].operations, 2u);
    EXPECT_EQ(outcome.results[2].error_detail->code, error_code::object_not_found);
    EXPECT_EQ(outcome.results[2].attempt, 1u);
}

TEST_F(TransferExecutorTest, CancellationDuringBackoffFailsPendingAsCancelled) {
    retry_.max_attempts = 3;
    retry_.initial_delay = std::chrono::seconds(30);
    retry_.max_delay = std::chrono::seconds(30);
    runner_->push(process_script::exit_with(1)
                      .err("ERROR \"" + copied(0) + "\": SlowDown: Please reduce your request rate."));

    cancellation_source cancel;
    handler_.on_attempt = [&](const transfer_result&) { cancel.cancel(); };
    auto batch = make_batch(1, transfer_mode::direct_sync);
    auto executor = make_executor();

    auto outcome = executor->execute(batch, cancel.token());

    EXPECT_TRUE(outcome.cancelled);
    ASSERT_EQ(outcome.results.size(), 1u);
    EXPECT_EQ(outcome.results[0].error_detail->code, error_code::cancelled);
    EXPECT_EQ(runner_->specs().size(), 1u);
}

// =============================================================================
// Escalation
// =============================================================================

TEST_F(TransferExecutorTest, SpawnFailureEscalatesToTraditional) {
    runner_->push(process_script::fail_to_start(error_code::tool_not_found, "s5cmd: not found"));
    std::vector<mode_switch_event> switches;
    handler_.on_mode_switch = [&](const mode_switch_event& e) { switches.push_back(e); };
    auto batch = make_batch(3, transfer_mode::direct_sync);
    auto executor = make_executor();

    auto outcome = executor->execute(batch, {});

    ASSERT_EQ(outcome.mode_switches.size(), 1u);
    EXPECT_EQ(outcome.mode_switches[0].cause.code, error_code::tool_not_found);
    EXPECT_EQ(outcome.mode_switches[0].descriptor_count, 3u);
    EXPECT_EQ(switches.size(), 1u);
    EXPECT_EQ(outcome.final_mode, transfer_mode::traditional);
    EXPECT_EQ(batch.mode, transfer_mode::traditional);
    EXPECT_EQ(batch.state, batch_state::completed);

    ASSERT_EQ(outcome.results.size(), 3u);
    for (std::size_t i = 0; i < 3; ++i) {
        EXPECT_TRUE(outcome.results[i].succeeded());
        EXPECT_EQ(outcome.results[i].mode, transfer_mode::traditional);
        EXPECT_EQ(outcome.results[i].operations, 2u);
        EXPECT_EQ(outcome.results[i].network_transfers, 2u);
        auto dst = object_url::parse(destination_url(i)).value();
        EXPECT_TRUE(store_->head(dst.store()).has_value());
    }
}

TEST_F(TransferExecutorTest, RunLevelErrorEscalatesToTraditional) {
    const std::string usage = "ERROR \"run\": flag provided but not defined: -retry-count";
    runner_->push(process_script::exit_with(1).err(usage));
    auto batch = make_batch(3, transfer_mode::direct_sync);
    auto executor = make_executor();

    auto outcome = executor->execute(batch, {});

    ASSERT_EQ(outcome.mode_switches.size(), 1u);
    EXPECT_EQ(outcome.mode_switches[0].cause.code, error_code::tool_invocation_failed);
    EXPECT_NE(outcome.mode_switches[0].cause.message.find("-retry-count"), std::string::npos);
    EXPECT_EQ(outcome.mode_switches[0].descriptor_count, 3u);
    EXPECT_EQ(outcome.final_mode, transfer_mode::traditional);
    ASSERT_EQ(outcome.audit_lines.size(), 1u);
    EXPECT_EQ(outcome.audit_lines[0], usage);

    ASSERT_EQ(outcome.results.size(), 3u);
    for (const auto& r : outcome.results) {
        EXPECT_TRUE(r.succeeded());
        EXPECT_EQ(r.mode, transfer_mode::traditional);
        EXPECT_EQ(r.operations, 2u);
    }
}

TEST_F(TransferExecutorTest, CrashedToolEscalatesWithCause) {
    auto script = process_script::exit_with(-1).err("panic: runtime error");
    script.outcome.term_signal = SIGSEGV;
    runner_->push(script);
    auto batch = make_batch(1, transfer_mode::direct_sync);
    auto executor = make_executor();

    auto outcome = executor->execute(batch, {});

    ASSERT_EQ(outcome.mode_switches.size(), 1u);
    EXPECT_EQ(outcome.mode_switches[0].cause.code, error_code::tool_crashed);
    EXPECT_NE(outcome.mode_switches[0].cause.message.find("panic: runtime error"),
              std::string::npos);
    EXPECT_TRUE(outcome.results[0].succeeded());
}

TEST_F(TransferExecutorTest, NonZeroExitWithSomeResultsDoesNotEscalate) {
    runner_->push(process_script::exit_with(1)
                      .out(copied(0))
                      .err("ERROR \"" + copied(1) + "\": AccessDenied: Access Denied"));
    auto batch = make_batch(2, transfer_mode::direct_sync);
    auto executor = make_executor();

    auto outcome = executor->execute(batch, {});

    EXPECT_TRUE(outcome.mode_switches.empty());
    EXPECT_EQ(outcome.final_mode, transfer_mode::direct_sync);
    EXPECT_EQ(outcome.results[1].error_detail->code, error_code::access_denied);
}

// =============================================================================
// Traditional
// =============================================================================

TEST_F(TransferExecutorTest, TraditionalBatchUsesEveryDescriptor) {
    auto batch = make_batch(5, transfer_mode::traditional);
    std::size_t reported = 0;
    handler_.on_result = [&](const transfer_result&) { ++reported; };
    auto executor = make_executor();

    auto outcome = executor->execute(batch, {});

    EXPECT_TRUE(runner_->specs().empty());
    ASSERT_EQ(outcome.results.size(), 5u);
    EXPECT_EQ(reported, 5u);
    EXPECT_EQ(batch.state, batch_state::completed);
    EXPECT_TRUE(!std::filesystem::exists(root_ / "staging") ||
                std::filesystem::is_empty(root_ / "staging"));
}

TEST_F(TransferExecutorTest, UnresolvedModeFailsEveryDescriptor) {
    auto batch = make_batch(2, transfer_mode::automatic);
    auto executor = make_executor();

    auto outcome = executor->execute(batch, {});

    ASSERT_EQ(outcome.results.size(), 2u);
    for (const auto& r : outcome.results) {
        EXPECT_EQ(r.error_detail->code, error_code::mode_unavailable);
    }
    EXPECT_EQ(batch.state, batch_state::partially_failed);
}

// =============================================================================
// Prefix sync
// =============================================================================

class PrefixSyncTest : public TransferExecutorTest {
protected:
    static auto sync_request(bool delete_extraneous) -> prefix_sync_request {
        prefix_sync_request request;
        request.source_prefix = "s3://data.binance.vision/klines";
        request.destination_prefix = "s3://market-archive/binance/klines";
        request.include_patterns = {"*.zip"};
        request.delete_extraneous = delete_extraneous;
        return request;
    }

    static auto empty_batch() -> transfer_batch {
        transfer_batch batch;
        batch.id = "sync-batch";
        batch.state = batch_state::mode_selected;
        return batch;
    }
};

TEST_F(PrefixSyncTest, ReportedObjectsBecomeResults) {
    const std::string stale = "s3://market-archive/binance/klines/stale.zip";
    runner_->push(process_script::exit_with(1)
                      .out(copied(0))
                      .out("DEBUG \"" + copied(1) + "\": object size matches")
                      .err("ERROR \"" + copied(2) + "\": AccessDenied: Access Denied")
                      .out("rm " + stale));
    std::size_t reported = 0;
    handler_.on_result = [&](const transfer_result&) { ++reported; };
    auto batch = empty_batch();
    auto executor = make_executor();

    auto outcome = executor->sync_prefix(sync_request(true), batch, {});

    ASSERT_TRUE(outcome.has_value());
    const auto& synced = outcome.value();
    ASSERT_EQ(batch.size(), 3u);
    ASSERT_EQ(synced.results.size(), 3u);
    EXPECT_EQ(reported, 3u);

    EXPECT_EQ(batch.descriptors[0].source().to_string(), source_url(0));
    EXPECT_EQ(batch.descriptors[0].destination().to_string(), destination_url(0));
    EXPECT_TRUE(synced.results[0].succeeded());
    EXPECT_EQ(synced.results[0].network_transfers, 1u);
    EXPECT_TRUE(synced.results[1].succeeded());
    EXPECT_TRUE(synced.results[1].skipped);
    EXPECT_FALSE(synced.results[2].succeeded());
    EXPECT_EQ(synced.results[2].error_detail->code, error_code::access_denied);

    for (const auto& r : synced.results) {
        EXPECT_EQ(r.mode, transfer_mode::direct_sync);
        EXPECT_EQ(r.operations, 1u);
    }
    EXPECT_EQ(synced.removed_objects, std::vector<std::string>{stale});
    EXPECT_TRUE(synced.audit_lines.empty());
    EXPECT_TRUE(synced.mode_switches.empty());
    EXPECT_EQ(batch.state, batch_state::partially_failed);

    auto specs = runner_->specs();
    ASSERT_EQ(specs.size(), 1u);
    EXPECT_EQ(specs[0].stdin_data,
              "sync --size-only --include '*.zip' --delete "
              "'s3://data.binance.vision/klines/*' 's3://market-archive/binance/klines/'\n");
    EXPECT_EQ(specs[0].argv.back(), "run");
}

TEST_F(PrefixSyncTest, LastReportForAnObjectWins) {
    runner_->push(process_script::exit_with(0)
                      .err("ERROR \"" + copied(0) + "\": SlowDown: Please reduce your request rate")
                      .out(copied(0)));
    auto batch = empty_batch();
    auto executor = make_executor();

    auto outcome = executor->sync_prefix(sync_request(false), batch, {});

    ASSERT_TRUE(outcome.has_value());
    ASSERT_EQ(outcome.value().results.size(), 1u);
    EXPECT_TRUE(outcome.value().results[0].succeeded());
    EXPECT_EQ(batch.state, batch_state::completed);
}

TEST_F(PrefixSyncTest, NothingToSyncCompletesEmpty) {
    auto batch = empty_batch();
    auto executor = make_executor();

    auto outcome = executor->sync_prefix(sync_request(false), batch, {});

    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome.value().results.empty());
    EXPECT_TRUE(batch.empty());
    EXPECT_EQ(batch.state, batch_state::completed);
}

TEST_F(PrefixSyncTest, SyncLevelErrorFailsTheSync) {
    runner_->push(process_script::exit_with(1).err(
        "ERROR \"sync s3://data.binance.vision/klines/* s3://market-archive/binance/klines/\": "
        "NoSuchBucket: The specified bucket does not exist"));
    auto batch = empty_batch();
    auto executor = make_executor();

    auto outcome = executor->sync_prefix(sync_request(false), batch, {});

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::tool_invocation_failed);
    EXPECT_NE(outcome.error().message.find("NoSuchBucket"), std::string::npos);
    EXPECT_TRUE(batch.empty());
}

TEST_F(PrefixSyncTest, ToolFailuresAreReturned) {
    runner_->push(process_script::fail_to_start(error_code::tool_not_found, "s5cmd not found"));
    auto missing_batch = empty_batch();
    auto executor = make_executor();

    auto missing = executor->sync_prefix(sync_request(false), missing_batch, {});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, error_code::tool_not_found);

    auto script = process_script::exit_with(-1);
    script.outcome.timed_out = true;
    script.out(copied(0));
    runner_->push(std::move(script));
    auto timed_out_batch = empty_batch();

    auto timed_out = executor->sync_prefix(sync_request(false), timed_out_batch, {});
    ASSERT_FALSE(timed_out.has_value());
    EXPECT_EQ(timed_out.error().code, error_code::process_timeout);

    prefix_sync_request cross_family = sync_request(false);
    cross_family.destination_prefix = "gs://market-archive/klines";
    auto invalid_batch = empty_batch();
    auto invalid = executor->sync_prefix(cross_family, invalid_batch, {});
    ASSERT_FALSE(invalid.has_value());
    EXPECT_EQ(invalid.error().code, error_code::store_family_mismatch);
    EXPECT_EQ(runner_->specs().size(), 2u);
}

}  // namespace kcenon::object_transfer::test
