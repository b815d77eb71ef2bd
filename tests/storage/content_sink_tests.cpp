#include <catch2/catch_test_macros.hpp>
#include "../../include/frontier_crawler/storage/ContentSink.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using frontier_crawler::storage::ContentRecord;
using frontier_crawler::storage::ContentSink;
using json = nlohmann::json;

namespace {

std::string tempPath(const std::string& name) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto path = std::filesystem::temp_directory_path() /
                ("frontier_sink_" + name + "_" + std::to_string(stamp) + ".jsonl");
    return path.string();
}

std::vector<json> readLines(const std::string& path) {
    std::ifstream in(path);
    std::vector<json> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(json::parse(line));
    }
    return lines;
}

} // namespace

TEST_CASE("ContentSink writes one JSON object per line", "[ContentSink]") {
    std::string path = tempPath("basic");
    {
        ContentSink sink(path, 10);
        ContentRecord record;
        record.url = "https://example.com/";
        record.title = "Example \"quoted\"";
        record.statusCode = 200;
        record.content = "0123456789abcdef";
        REQUIRE(sink.append(record).success);
        REQUIRE(sink.recordsWritten() == 1);
        REQUIRE(sink.path() == path);
    }

    auto lines = readLines(path);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0]["url"] == "https://example.com/");
    REQUIRE(lines[0]["title"] == "Example \"quoted\"");
    REQUIRE(lines[0]["status_code"] == 200);
    REQUIRE(lines[0]["content"] == "0123456789");

    std::filesystem::remove(path);
}

TEST_CASE("ContentSink appends across reopen", "[ContentSink]") {
    std::string path = tempPath("reopen");
    {
        ContentSink sink(path);
        REQUIRE(sink.append(ContentRecord{"https://a.com/1", "one", 200, "first"}).success);
    }
    {
        ContentSink sink(path);
        REQUIRE(sink.append(ContentRecord{"https://a.com/2", "two", 200, "second"}).success);
        REQUIRE(sink.recordsWritten() == 1);
    }

    auto lines = readLines(path);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0]["url"] == "https://a.com/1");
    REQUIRE(lines[1]["url"] == "https://a.com/2");

    std::filesystem::remove(path);
}

TEST_CASE("ContentSink survives invalid UTF-8", "[ContentSink]") {
    std::string path = tempPath("utf8");
    {
        ContentSink sink(path);
        REQUIRE(sink.append(ContentRecord{"https://a.com/", "bad \xFF byte", 200, "caf\xC3\xA9"}).success);
    }
    auto lines = readLines(path);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0]["content"] == "caf\xC3\xA9");
    std::filesystem::remove(path);
}

TEST_CASE("ContentSink keeps lines whole under concurrent writers", "[ContentSink]") {
    std::string path = tempPath("concurrent");
    {
        ContentSink sink(path);
        std::atomic<int> failures{0};
        std::vector<std::thread> writers;
        for (int t = 0; t < 4; ++t) {
            writers.emplace_back([&sink, &failures, t] {
                for (int i = 0; i < 50; ++i) {
                    std::string url = "https://a.com/" + std::to_string(t) + "/" + std::to_string(i);
                    if (!sink.append(ContentRecord{url, "t", 200, std::string(200, 'x')}).success) {
                        ++failures;
                    }
                }
            });
        }
        for (auto& writer : writers) {
            writer.join();
        }
        REQUIRE(failures == 0);
        REQUIRE(sink.recordsWritten() == 200);
    }
    REQUIRE(readLines(path).size() == 200);
    std::filesystem::remove(path);
}

TEST_CASE("ContentSink rejects an unwritable path", "[ContentSink]") {
    REQUIRE_THROWS_AS(ContentSink("/nonexistent-dir/for/sure/out.jsonl"), std::runtime_error);
}

TEST_CASE("truncateUtf8 never splits a character", "[ContentSink]") {
    REQUIRE(ContentSink::truncateUtf8("hello", 3) == "hel");
    REQUIRE(ContentSink::truncateUtf8("hello", 50) == "hello");
    REQUIRE(ContentSink::truncateUtf8("caf\xC3\xA9!", 4) == "caf\xC3\xA9");
    REQUIRE(ContentSink::truncateUtf8("\xE2\x82\xAC\xE2\x82\xAC", 1) == "\xE2\x82\xAC");
    REQUIRE(ContentSink::truncateUtf8("ab\xE2\x82", 5) == "ab");
    REQUIRE(ContentSink::truncateUtf8("", 5).empty());
}
