/**
 * @file logger_adapter_test.cpp
 * @brief Unit tests for logger_adapter and decoder logging
 */

#include <viewer/integration/logger_adapter.hpp>

#include <catch2/catch_test_macros.hpp>

#include "fixtures/image_dataset.hpp"

#include <viewer/imaging/image_decoder.hpp>

#include <variant>

using namespace viewer::integration;

namespace {

/**
 * @brief RAII wrapper for logger initialization/shutdown
 */
class logger_test_fixture {
public:
    explicit logger_test_fixture(const logger_config& config) {
        logger_adapter::initialize(config);
    }

    ~logger_test_fixture() { logger_adapter::shutdown(); }

    logger_test_fixture(const logger_test_fixture&) = delete;
    logger_test_fixture& operator=(const logger_test_fixture&) = delete;
};

logger_config config_at(log_level level) {
    logger_config config;
    config.min_level = level;
    return config;
}

}  // namespace

TEST_CASE("logger_adapter before initialization", "[logger_adapter][init]") {
    REQUIRE_FALSE(logger_adapter::is_initialized());

    CHECK_FALSE(logger_adapter::is_level_enabled(log_level::error));
    logger_adapter::warn("dropped {}", 1);
    CHECK_FALSE(logger_adapter::is_initialized());
}

TEST_CASE("logger_adapter initialization and shutdown", "[logger_adapter][init]") {
    {
        logger_test_fixture fixture(config_at(log_level::debug));
        CHECK(logger_adapter::is_initialized());
        CHECK(logger_adapter::is_level_enabled(log_level::debug));

        SECTION("second initialize is ignored") {
            logger_adapter::initialize(config_at(log_level::error));
            CHECK(logger_adapter::is_level_enabled(log_level::debug));
        }
    }

    CHECK_FALSE(logger_adapter::is_initialized());
    CHECK_FALSE(logger_adapter::is_level_enabled(log_level::error));

    SECTION("shutdown without initialize is harmless") {
        logger_adapter::shutdown();
        CHECK_FALSE(logger_adapter::is_initialized());
    }
}

TEST_CASE("logger_adapter level filtering", "[logger_adapter][level]") {
    logger_test_fixture fixture(config_at(log_level::warn));

    CHECK_FALSE(logger_adapter::is_level_enabled(log_level::debug));
    CHECK_FALSE(logger_adapter::is_level_enabled(log_level::info));
    CHECK(logger_adapter::is_level_enabled(log_level::warn));
    CHECK(logger_adapter::is_level_enabled(log_level::error));
    CHECK_FALSE(logger_adapter::is_level_enabled(log_level::off));
}

TEST_CASE("decoding with logging enabled", "[logger_adapter][decode]") {
    logger_test_fixture fixture(config_at(log_level::debug));
    auto ds = viewer::test::make_sample_ct_dataset();

    SECTION("successful decode") {
        auto decoded = viewer::imaging::decode_image(ds);
        REQUIRE(decoded.is_ok());
        CHECK(std::get<viewer::imaging::grayscale_raster>(decoded.value().raster)
                  .sample_count() == 4);
    }

    SECTION("failed decode still returns the error") {
        ds.remove(viewer::core::tags::rows);

        auto decoded = viewer::imaging::decode_image(ds);
        REQUIRE(decoded.is_err());
        CHECK(decoded.error().code == viewer::error_codes::missing_rows);
    }

    SECTION("best-effort color decode") {
        ds.set_string(viewer::core::tags::photometric_interpretation,
                      viewer::encoding::vr_type::CS, "RGB");
        ds.set_uint16(viewer::core::tags::samples_per_pixel,
                      viewer::encoding::vr_type::US, 3);

        viewer::imaging::decode_options options;
        options.color_policy = viewer::imaging::color_decode_policy::best_effort;
        auto decoded = viewer::imaging::decode_image(ds, options);
        REQUIRE(decoded.is_ok());
        CHECK(std::holds_alternative<viewer::imaging::rgb_raster>(decoded.value().raster));
    }
}
