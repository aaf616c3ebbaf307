#include <catch2/catch_test_macros.hpp>

#include <sift/cli/query.hpp>
#include <sift/io/csv.hpp>

#include <filesystem>
#include <sstream>
#include <string>

using namespace sift;
using sift::cli::parse_condition;
using sift::runtime::Comparison;

namespace {

auto accounts_csv() -> std::string {
    return (std::filesystem::path(SIFT_SOURCE_DIR) / "tests" / "data" / "accounts.csv").string();
}

auto run(cli::QueryConfig config) -> std::string {
    config.csv_path = accounts_csv();
    std::ostringstream out;
    auto result = cli::run_query(config, out);
    REQUIRE(result.has_value());
    return out.str();
}

}  // namespace

TEST_CASE("parse_condition operators", "[cli][query]") {
    SECTION("symbol operators") {
        auto cond = parse_condition("Revenue >= 1000");
        REQUIRE(cond.has_value());
        REQUIRE(cond->field == "Revenue");
        REQUIRE(cond->op == Comparison::GreaterOrEqual);
        REQUIRE(cond->operands == std::vector<std::string>{"1000"});

        REQUIRE(parse_condition("Name==Acme")->op == Comparison::Equals);
        REQUIRE(parse_condition("Name != Acme")->op == Comparison::NotEquals);
        REQUIRE(parse_condition("Revenue<5")->op == Comparison::LessThan);
    }

    SECTION("membership") {
        auto cond = parse_condition("Industry in Software | Energy");
        REQUIRE(cond.has_value());
        REQUIRE(cond->op == Comparison::IsIn);
        REQUIRE(cond->operands == std::vector<std::string>{"Software", "Energy"});

        auto negated = parse_condition("Industry notin Pharma");
        REQUIRE(negated->op == Comparison::IsNotIn);
        REQUIRE(negated->field == "Industry");
    }

    SECTION("word operators inside an operand are literal text") {
        auto cond = parse_condition("Name == Sign in here");
        REQUIRE(cond->op == Comparison::Equals);
        REQUIRE(cond->operands.front() == "Sign in here");
    }

    SECTION("has value") {
        auto cond = parse_condition("Revenue?");
        REQUIRE(cond->op == Comparison::HasValue);
        REQUIRE(cond->operands.empty());
    }

    SECTION("malformed conditions") {
        REQUIRE_FALSE(parse_condition("").has_value());
        REQUIRE_FALSE(parse_condition("Revenue").has_value());
        REQUIRE_FALSE(parse_condition("== 5").has_value());
        REQUIRE_FALSE(parse_condition("Revenue >=").has_value());
        REQUIRE_FALSE(parse_condition("?").has_value());
        REQUIRE_FALSE(parse_condition("Revenue = 5").has_value());
    }
}

TEST_CASE("build_match types operands by the field kind", "[cli][query]") {
    auto csv = io::read_csv(accounts_csv(), "Account");
    REQUIRE(csv.has_value());
    const Schema& schema = *csv->schema;

    auto cond = parse_condition("Revenue > 1000000");
    auto built = cli::build_match({*cond}, schema);
    REQUIRE(built.has_value());
    REQUIRE(std::get<Value>(built->conditions()[0].operand) == Value{1000000});

    auto bad_literal = cli::build_match({*parse_condition("Revenue > lots")}, schema);
    REQUIRE_FALSE(bad_literal.has_value());

    auto unknown = cli::build_match({*parse_condition("Missing == 1")}, schema);
    REQUIRE_FALSE(unknown.has_value());
}

TEST_CASE("run_query pipeline", "[cli][query]") {
    SECTION("filter and pluck") {
        cli::QueryConfig config;
        config.where = {"Revenue >= 1000000"};
        config.pluck = "Name";
        REQUIRE(run(config) == "Acme\nUmbrella\n");
    }

    SECTION("conditions are conjunctive") {
        cli::QueryConfig config;
        config.where = {"Industry == Software", "Active == true"};
        config.pluck = "Name";
        REQUIRE(run(config) == "Initech\n");
    }

    SECTION("exclude drops matches") {
        cli::QueryConfig config;
        config.exclude = {"Industry in Software|Pharma"};
        config.pluck = "Id";
        REQUIRE(run(config) == "001A\n001B\n");
    }

    SECTION("group by counts records per key in first-seen order") {
        cli::QueryConfig config;
        config.group_by = "Industry";
        REQUIRE(run(config) == "Manufacturing\t1\nEnergy\t1\nSoftware\t2\nPharma\t1\n");
    }

    SECTION("has value skips null cells") {
        cli::QueryConfig config;
        config.where = {"Revenue?"};
        config.exclude = {"Revenue < 1000000"};
        config.pluck = "Name";
        REQUIRE(run(config) == "Acme\nUmbrella\n");
    }

    SECTION("pick then print") {
        cli::QueryConfig config;
        config.where = {"Name == Globex"};
        config.pick = {"Name", "Revenue"};
        auto text = run(config);
        REQUIRE(text.find("Globex") != std::string::npos);
        REQUIRE(text.find("125000") != std::string::npos);
        REQUIRE(text.find("Energy") == std::string::npos);
    }
}

TEST_CASE("run_query reports errors", "[cli][query]") {
    std::ostringstream out;

    SECTION("ordering a boolean field") {
        cli::QueryConfig config;
        config.csv_path = accounts_csv();
        config.where = {"Active < true"};
        auto result = cli::run_query(config, out);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().find("Active <") != std::string::npos);
    }

    SECTION("missing file") {
        cli::QueryConfig config;
        config.csv_path = "/nonexistent/accounts.csv";
        REQUIRE_FALSE(cli::run_query(config, out).has_value());
    }

    SECTION("picking an unknown field") {
        cli::QueryConfig config;
        config.csv_path = accounts_csv();
        config.pick = {"Nope"};
        REQUIRE_FALSE(cli::run_query(config, out).has_value());
    }
}
