#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <routelog/common/constants.h>
#include <routelog/common/error.h>
#include <routelog/common/logging.h>
#include <routelog/reader/reader_config.h>
#include <routelog/utils/logger.h>

#include <cstdlib>
#include <string>

using namespace routelog;

namespace {
void clear_env() {
    unsetenv(constants::env::CACHE);
    unsetenv(constants::env::CACHE_DIR);
    unsetenv(constants::env::API);
}
}  // namespace

TEST_CASE("C++ ReaderConfig - Environment") {
    clear_env();

    SUBCASE("Defaults") {
        auto config = ReaderConfig::from_env();
        CHECK_FALSE(config.cache_enabled);
        CHECK(config.api_url == constants::backend::DEFAULT_API_HOST);
        CHECK(config.fetch_timeout.count() ==
              constants::fetch::DEFAULT_TIMEOUT_SECONDS);
        CHECK_FALSE(config.validate_files);
        CHECK(config.resolved_cache_dir().filename() ==
              constants::cache::DEFAULT_DIR_NAME);
    }

    SUBCASE("Overrides") {
        setenv(constants::env::CACHE, "1", 1);
        setenv(constants::env::CACHE_DIR, "/tmp/routelog-cache", 1);
        setenv(constants::env::API, "http://localhost:8080", 1);
        auto config = ReaderConfig::from_env();
        CHECK(config.cache_enabled);
        CHECK(config.resolved_cache_dir() == fs::path("/tmp/routelog-cache"));
        CHECK(config.api_url == "http://localhost:8080");
        clear_env();
    }

    SUBCASE("Cache toggle values") {
        for (const char *on : {"1", "true", "TRUE", "yes", "On"}) {
            CAPTURE(on);
            CHECK(parse_bool(on));
        }
        for (const char *off : {"0", "false", "no", "", "2"}) {
            CAPTURE(off);
            CHECK_FALSE(parse_bool(off));
        }
    }
}

TEST_CASE("C++ Logger - Levels") {
    CHECK(logger::set_log_level("debug") == 0);
    CHECK(logger::get_log_level_string() == "debug");
    CHECK(logger::get_log_level_int() == 1);

    CHECK(logger::set_log_level("WARNING") == 0);
    CHECK(logger::get_log_level_int() == 3);

    CHECK(logger::set_log_level("nonsense") == -1);
    CHECK(logger::get_log_level_int() == 3);

    CHECK(logger::set_log_level_int(4) == 0);
    CHECK(logger::get_log_level_string() == "error");
    CHECK(logger::set_log_level_int(7) == -1);

    CHECK(logger::get() == logger::get());
    ROUTELOG_LOG_DEBUG("not shown at level {}", "error");
    logger::set_log_level("warn");
}

TEST_CASE("C++ Error - Types and messages") {
    ParseError parse("bad range");
    CHECK(parse.get_type() == Error::PARSE_ERROR);
    CHECK(std::string(parse.what()) == "[PARSE] bad range");

    ResolutionError resolution("no route");
    CHECK(resolution.get_type() == Error::RESOLUTION_ERROR);
    CHECK(std::string(resolution.what()).rfind("[RESOLUTION]", 0) == 0);

    FetchError fetch("timeout");
    CHECK(fetch.get_type() == Error::FETCH_ERROR);

    DecodeError decode("garbage");
    CHECK(decode.get_type() == Error::DECODE_ERROR);
    CHECK(std::string(decode.what()) == "[DECODE] garbage");

    const Error &base = fetch;
    CHECK(std::string(base.what()) == "[FETCH] timeout");
}
