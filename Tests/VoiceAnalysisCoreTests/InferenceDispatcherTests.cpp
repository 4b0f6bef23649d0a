/**
 * @file InferenceDispatcherTests.cpp
 * @brief Unit tests for the background inference queue
 */

#include "InferenceDispatcher.hpp"

#include "TestSupport.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <mutex>
#include <set>

using namespace va;
using va::test::fake_engine;
using va::test::temp_directory;
using va::test::write_file;

namespace {

struct fixture {
    temp_directory temp_dir;
    AnalysisStore  store{(temp_dir.path() / "analysis.db").string()};
    std::unique_ptr<FileVault>              vault;
    std::unique_ptr<PersistenceCoordinator> coordinator;
    fake_engine    engine;

    fixture() {
        store.open();
        vault = std::make_unique<FileVault>(
            VaultLocations{"", (temp_dir.path() / "data").string()});
        coordinator = std::make_unique<PersistenceCoordinator>(store, *vault);

        engine.results.push_back(
            PredictionResult{Channel::nationality, {{"US", 0.8}, {"GB", 0.2}},
                             TimePoint{std::chrono::seconds(1800000000)}});
    }

    int64_t create(const std::string& title) {
        const auto source = temp_dir.path() / (title + ".m4a");
        write_file(source, title);
        return *coordinator->create_analysis(title, std::nullopt, source.string()).id;
    }
};

}  // namespace

// ============================================================================
// process
// ============================================================================

TEST_CASE("dispatcher: successful analysis stores results and marks sent",
          "[dispatcher]") {
    fixture f;
    const int64_t id = f.create("ok");
    InferenceDispatcher dispatcher(*f.coordinator, f.engine);

    CHECK(dispatcher.process(id));

    auto row = f.coordinator->get_analysis_by_id(id);
    REQUIRE(row.has_value());
    CHECK(row->send_status == SendStatus::sent);
    REQUIRE(row->channel(Channel::nationality).prediction.has_value());
    CHECK(row->channel(Channel::nationality).prediction->at("US") == 0.8);
    CHECK(row->completion_date.has_value());

    // Already sent: skipped without calling the engine again.
    CHECK_FALSE(dispatcher.process(id));
    CHECK(f.engine.calls.load() == 1);
}

TEST_CASE("dispatcher: engine failure marks the analysis as failed", "[dispatcher]") {
    fixture f;
    const int64_t id = f.create("broken");
    f.engine.throw_media_error = true;
    InferenceDispatcher dispatcher(*f.coordinator, f.engine);

    CHECK_FALSE(dispatcher.process(id));

    auto row = f.coordinator->get_analysis_by_id(id);
    REQUIRE(row.has_value());
    CHECK(row->send_status == SendStatus::error);
    REQUIRE(row->error_message.has_value());
    CHECK(row->error_message->find("cannot decode") != std::string::npos);
    CHECK_FALSE(row->has_predictions());
}

TEST_CASE("dispatcher: empty or unstorable results fail the analysis", "[dispatcher]") {
    fixture f;
    const int64_t id = f.create("empty");
    InferenceDispatcher dispatcher(*f.coordinator, f.engine);

    SECTION("no channels") {
        f.engine.results.clear();
        CHECK_FALSE(dispatcher.process(id));
    }

    SECTION("reserved characters in a label") {
        f.engine.results[0].probabilities = {{"a,b", 1.0}};
        CHECK_FALSE(dispatcher.process(id));
    }

    CHECK(f.coordinator->get_analysis_by_id(id)->send_status == SendStatus::error);
}

TEST_CASE("dispatcher: unknown ids are skipped", "[dispatcher]") {
    fixture f;
    InferenceDispatcher dispatcher(*f.coordinator, f.engine);

    CHECK_FALSE(dispatcher.process(12345));
    CHECK(f.engine.calls.load() == 0);
}

// ============================================================================
// Background worker
// ============================================================================

TEST_CASE("dispatcher: submit requires a running worker", "[dispatcher][worker]") {
    fixture f;
    const int64_t id = f.create("idle");
    InferenceDispatcher dispatcher(*f.coordinator, f.engine);

    CHECK_FALSE(dispatcher.is_running());
    CHECK_FALSE(dispatcher.submit(id));
    CHECK(dispatcher.queued() == 0);
}

TEST_CASE("dispatcher: recovers pending analyses and drains on stop",
          "[dispatcher][worker]") {
    fixture f;
    const int64_t a = f.create("a");
    const int64_t b = f.create("b");
    const int64_t c = f.create("c");
    f.coordinator->mark_sent(c);

    InferenceDispatcher dispatcher(*f.coordinator, f.engine);

    std::mutex mu;
    std::set<int64_t> done;
    dispatcher.set_completion_callback([&](int64_t id, bool success, const std::string&) {
        std::lock_guard<std::mutex> lock(mu);
        if (success) done.insert(id);
    });

    dispatcher.start();
    CHECK(dispatcher.is_running());
    CHECK(dispatcher.recover_pending() == 2);
    dispatcher.stop();
    CHECK_FALSE(dispatcher.is_running());

    const std::set<int64_t> expected{a, b};
    CHECK(done == expected);
    CHECK(f.coordinator->pending().empty());
    CHECK(f.engine.calls.load() == 2);
}

TEST_CASE("dispatcher: retried analyses can be processed again", "[dispatcher][worker]") {
    fixture f;
    const int64_t id = f.create("retry");
    InferenceDispatcher dispatcher(*f.coordinator, f.engine);

    f.engine.throw_media_error = true;
    REQUIRE_FALSE(dispatcher.process(id));

    f.engine.throw_media_error = false;
    f.coordinator->retry_analysis(id);
    CHECK(dispatcher.process(id));
    CHECK(f.coordinator->get_analysis_by_id(id)->send_status == SendStatus::sent);
}
