// csrfguard Logging Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <thread>

#include "../../src/control/config.hpp"
#include "../../src/core/logging.hpp"

using namespace csrfguard::logging;

TEST_CASE("Correlation ID generation", "[logging][correlation_id]") {
    SECTION("generated IDs validate") {
        for (int i = 0; i < 50; ++i) {
            REQUIRE(is_valid_uuid(generate_correlation_id()));
        }
    }

    SECTION("same thread shares the base, counter increments") {
        std::string id1 = generate_correlation_id();
        std::string id2 = generate_correlation_id();

        REQUIRE(id1 != id2);

        size_t hash1 = id1.find('#');
        size_t hash2 = id2.find('#');
        REQUIRE(id1.substr(0, hash1) == id2.substr(0, hash2));
        REQUIRE(std::stoull(id2.substr(hash2 + 1)) == std::stoull(id1.substr(hash1 + 1)) + 1);
    }

    SECTION("other threads get another base") {
        std::string main_id = generate_correlation_id();
        std::string thread_id;
        std::thread worker([&thread_id] { thread_id = generate_correlation_id(); });
        worker.join();

        REQUIRE(is_valid_uuid(thread_id));
        REQUIRE(main_id.substr(0, 36) != thread_id.substr(0, 36));
    }
}

TEST_CASE("UUID validation", "[logging][validation]") {
    SECTION("accepts valid correlation IDs") {
        REQUIRE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#0"));
        REQUIRE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#999999"));
        REQUIRE(is_valid_uuid("ABCDEF12-3456-4789-ABCD-EF0123456789#42"));
    }

    SECTION("rejects invalid formats") {
        // Missing or broken counter
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000"));
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#"));
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#12a"));

        // Wrong shape
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-44665544000#0"));
        REQUIRE_FALSE(is_valid_uuid("550e8400e29b41d4a716446655440000#0"));

        // Version and variant
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-31d4-a716-446655440000#0"));
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-c716-446655440000#0"));

        // Non-hex
        REQUIRE_FALSE(is_valid_uuid("550g8400-e29b-41d4-a716-446655440000#0"));

        REQUIRE_FALSE(is_valid_uuid(""));
        REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#42#56"));
    }
}

TEST_CASE("Logger thread-local access", "[logging][logger]") {
    SECTION("test fixture bound a logger to the main thread") {
        REQUIRE(get_current_logger() != nullptr);
    }

    SECTION("a new thread starts without a logger") {
        quill::Logger* seen = reinterpret_cast<quill::Logger*>(1);
        std::thread worker([&seen] { seen = get_current_logger(); });
        worker.join();
        REQUIRE(seen == nullptr);
    }

    SECTION("worker logger writes to the configured directory") {
        const std::filesystem::path dir =
            std::filesystem::temp_directory_path() / "csrfguard_logging_test";

        quill::Logger* bound = nullptr;
        bool thread_local_matches = false;
        std::thread worker([&bound, &thread_local_matches, &dir] {
            csrfguard::control::LogConfig config;
            config.format = "json";
            config.output = dir.string();
            bound = init_worker_logger(7, config);
            LOG_INFO(bound, "worker logger ready");
            thread_local_matches = get_current_logger() == bound;
        });
        worker.join();

        REQUIRE(bound != nullptr);
        REQUIRE(thread_local_matches);
        REQUIRE(std::filesystem::is_directory(dir));
    }

    SECTION("console format needs no directory") {
        quill::Logger* bound = nullptr;
        std::thread worker([&bound] {
            csrfguard::control::LogConfig config;
            config.format = "console";
            config.output = "";
            bound = init_worker_logger(8, config);
        });
        worker.join();

        REQUIRE(bound != nullptr);
    }
}
