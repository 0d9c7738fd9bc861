#include <catch2/catch_test_macros.hpp>

#include "http/http_server.hpp"

TEST_CASE("HTTP query parsing", "[http]") {

    SECTION("StreamFilters") {
        auto q = HttpServer::parse_query("types=sweep_data%2Cstatus&min_signal=-60&device_types=hackrf");
        REQUIRE(q.size() == 3);
        REQUIRE(q["types"] == "sweep_data,status");
        REQUIRE(q["min_signal"] == "-60");
        REQUIRE(q["device_types"] == "hackrf");
    }

    SECTION("EmptyAndBareKeys") {
        auto q = HttpServer::parse_query("&limit=5&&verbose&=x");
        REQUIRE(q.size() == 2);
        REQUIRE(q["limit"] == "5");
        REQUIRE(q["verbose"].empty());
    }

    SECTION("PlusAndBadEscapes") {
        auto q = HttpServer::parse_query("reason=field+test&bad=%zz&cut=%4");
        REQUIRE(q["reason"] == "field test");
        REQUIRE(q["bad"] == "%zz");
        REQUIRE(q["cut"] == "%4");
    }

    SECTION("EmptyQuery") {
        REQUIRE(HttpServer::parse_query("").empty());
    }
}
