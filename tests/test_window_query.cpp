#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "kitty/window_query.hpp"
#include "world.hpp"

using Catch::Matchers::WithinAbs;

TEST_CASE("WindowQuery::parse_window_list", "[window]") {
    Config::Dimensions defaults;

    SECTION("GridAndGeometry") {
        auto dims = WindowQuery::parse_window_list(R"([
            {
                "id": 1,
                "geometry": {"width": 1600, "height": 960},
                "tabs": [{"windows": [{"id": 1, "columns": 160, "lines": 48}]}]
            }
        ])", defaults);
        REQUIRE(dims.has_value());
        REQUIRE(dims->columns == 160);
        REQUIRE(dims->rows == 48);
        REQUIRE_THAT(dims->cell_width, WithinAbs(10.0, 1e-9));
        REQUIRE_THAT(dims->cell_height, WithinAbs(20.0, 1e-9));
        REQUIRE(dims->width == 1600);
        REQUIRE(dims->height == 960);
    }

    SECTION("GridOnlyUsesConfiguredCellSize") {
        auto dims = WindowQuery::parse_window_list(
            R"([{"tabs": [{"windows": [{"columns": 100, "lines": 30}]}]}])", defaults);
        REQUIRE(dims.has_value());
        REQUIRE(dims->width == 1000);
        REQUIRE(dims->height == 600);
    }

    SECTION("ImplausibleGeometryIgnored") {
        auto dims = WindowQuery::parse_window_list(R"([{
            "geometry": {"width": 100000, "height": 100000},
            "tabs": [{"windows": [{"columns": 80, "lines": 24}]}]
        }])", defaults);
        REQUIRE(dims.has_value());
        REQUIRE(dims->cell_width == defaults.cell_width);
        REQUIRE(dims->cell_height == defaults.cell_height);
    }

    SECTION("NegativeGeometryIgnored") {
        auto dims = WindowQuery::parse_window_list(R"([{
            "geometry": {"width": -800, "height": -480},
            "tabs": [{"windows": [{"columns": 80, "lines": 24}]}]
        }])", defaults);
        REQUIRE(dims.has_value());
        REQUIRE(dims->width == 800);
        REQUIRE(dims->height == 480);
    }

    SECTION("FirstWindowWins") {
        auto dims = WindowQuery::parse_window_list(R"([{"tabs": [{"windows": [
            {"columns": 80, "lines": 24},
            {"columns": 200, "lines": 60}
        ]}]}])", defaults);
        REQUIRE(dims.has_value());
        REQUIRE(dims->columns == 80);
    }

    SECTION("Errors") {
        REQUIRE(WindowQuery::parse_window_list("[]", defaults).error() == "no kitty windows found");
        REQUIRE(WindowQuery::parse_window_list("{}", defaults).error() == "no kitty windows found");
        REQUIRE(WindowQuery::parse_window_list(R"([{"tabs": []}])", defaults).error() ==
                "no tabs found in kitty window");
        REQUIRE(WindowQuery::parse_window_list(R"([{"tabs": [{"windows": []}]}])", defaults).error() ==
                "no windows found in kitty tab");
        REQUIRE(WindowQuery::parse_window_list(R"([{"tabs": [{"windows": [{"id": 1}]}]}])", defaults)
                    .error() == "kitty window reports no grid size");

        REQUIRE(WindowQuery::parse_window_list(
                    R"([{"tabs": [{"windows": [{"columns": -1, "lines": 24}]}]}])", defaults)
                    .error() == "kitty window reports no grid size");
        REQUIRE(WindowQuery::parse_window_list(
                    R"([{"tabs": [{"windows": [{"columns": 80, "lines": 4294967296}]}]}])", defaults)
                    .error() == "kitty window reports no grid size");

        auto garbage = WindowQuery::parse_window_list("Error: remote control disabled", defaults);
        REQUIRE_FALSE(garbage.has_value());
        REQUIRE(garbage.error().starts_with("failed to parse kitty window list"));
    }
}

TEST_CASE("WindowQuery", "[window]") {
    World w;
    w.add_kitty(1234);
    auto discover = [&] { return w.validator.make(1234); };
    Dispatcher dispatcher(w.cache, discover, w.remote, {});

    // A regular file: TIOCGWINSZ fails, so the configured grid is used
    w.dir.touch("tty");
    WindowQuery query(dispatcher, Config::Dimensions{}, w.tty_path());

    SECTION("RemoteDimensions") {
        w.kitten = [](const std::vector<std::string>&) {
            return World::ok(R"([{"tabs": [{"windows": [{"columns": 120, "lines": 40}]}]}])");
        };
        auto dims = query.remote_dimensions();
        REQUIRE(dims.has_value());
        REQUIRE(dims->width == 1200);
        REQUIRE(dims->height == 800);
        REQUIRE(w.runner.calls[0].back() == "ls");
    }

    SECTION("MalformedResponseIsNotRetried") {
        w.kitten = [](const std::vector<std::string>&) { return World::ok("not json"); };
        auto dims = query.remote_dimensions();
        REQUIRE_FALSE(dims.has_value());
        REQUIRE(dims.error().kind == DispatchErrorKind::MalformedResponse);
        REQUIRE(w.runner.count("kitten") == 1);
    }

    SECTION("FallbackUsesConfiguredGrid") {
        auto dims = query.fallback_dimensions();
        REQUIRE(dims.columns == 80);
        REQUIRE(dims.rows == 24);
        REQUIRE(dims.width == 800);
        REQUIRE(dims.height == 480);
    }

    SECTION("DimensionsFallBackWhenRemoteFails") {
        w.kitten = [](const std::vector<std::string>&) { return World::fail("refused"); };
        auto dims = query.dimensions();
        REQUIRE(dims.width == 800);
        REQUIRE(dims.height == 480);
    }
}
