#include <catch2/catch.hpp>
#include "crossword_csp/domain.hpp"
#include "crossword_csp/model.hpp"
#include "crossword_csp/puzzle.hpp"

using namespace crossword_csp;

namespace {

Model make_model(const std::vector<std::string>& rows, std::vector<std::string> words) {
    return Model(std::make_shared<const Puzzle>(Grid::from_rows(rows)), WordList(std::move(words)));
}

}  // namespace

// ============================================================================
// Domain (Sparse Set) tests
// ============================================================================

TEST_CASE("Domain basic operations", "[domain]") {
    auto d = Domain::full(5);

    SECTION("initial state") {
        REQUIRE(d.size() == 5);
        REQUIRE(!d.empty());
        REQUIRE(!d.is_singleton());
        REQUIRE(d.values() == std::vector<WordId>{0, 1, 2, 3, 4});
    }

    SECTION("contains") {
        REQUIRE(d.contains(0));
        REQUIRE(d.contains(4));
        REQUIRE(!d.contains(5));
    }
}

TEST_CASE("Domain from value list", "[domain]") {
    Domain d(std::vector<WordId>{7, 2, 7, 4});

    REQUIRE(d.size() == 3);
    REQUIRE(d.values() == std::vector<WordId>{2, 4, 7});
    REQUIRE(!d.contains(3));
    REQUIRE(!d.contains(100));
}

TEST_CASE("Domain remove", "[domain]") {
    auto d = Domain::full(5);

    SECTION("remove middle value") {
        REQUIRE(d.remove(2));
        REQUIRE(d.size() == 4);
        REQUIRE(!d.contains(2));
        REQUIRE(d.contains(4));
    }

    SECTION("remove missing value") {
        REQUIRE(d.remove(2));
        REQUIRE(!d.remove(2));
        REQUIRE(!d.remove(9));
        REQUIRE(d.size() == 4);
    }

    SECTION("remove until empty") {
        for (WordId v = 0; v < 5; ++v) {
            REQUIRE(d.remove(v));
        }
        REQUIRE(d.empty());
        REQUIRE(d.values().empty());
    }
}

TEST_CASE("Domain assign", "[domain]") {
    auto d = Domain::full(5);

    REQUIRE(!d.assign(7));
    REQUIRE(d.assign(3));
    REQUIRE(d.is_singleton());
    REQUIRE(d.values() == std::vector<WordId>{3});
}

TEST_CASE("Domain restores by size reset", "[domain]") {
    auto d = Domain::full(6);
    size_t saved = d.size();

    d.remove(1);
    d.remove(4);
    d.assign(2);
    REQUIRE(d.size() == 1);

    d.set_n(saved);
    REQUIRE(d.values() == std::vector<WordId>{0, 1, 2, 3, 4, 5});
}

// ============================================================================
// Model tests
// ============================================================================

TEST_CASE("Model initial state", "[model]") {
    auto model = make_model({"#_#", "___", "#_#"}, {"cat", "dog", "horse"});

    REQUIRE(model.num_variables() == 2);
    REQUIRE(model.words().size() == 3);
    REQUIRE(model.var_size(0) == 3);
    REQUIRE(model.var_size(1) == 3);
    REQUIRE(model.assigned_count() == 0);
    REQUIRE(!model.is_assigned(0));
    REQUIRE(model.assigned_word(0) == UNASSIGNED);
    REQUIRE(model.var_trail_size() == 0);
}

TEST_CASE("Model remove_value with trail", "[model][trail]") {
    auto model = make_model({"#_#", "___", "#_#"}, {"ace", "cat", "dog"});

    REQUIRE(model.remove_value(1, 0, 0));
    REQUIRE(!model.remove_value(1, 0, 0));
    REQUIRE(model.remove_value(1, 0, 2));
    REQUIRE(model.var_size(0) == 1);

    // 同じセーブポイントでは1回だけ保存
    REQUIRE(model.var_trail_size() == 1);

    model.rewind_to(0);
    REQUIRE(model.var_size(0) == 3);
    REQUIRE(model.domain(0).contains(0));
    REQUIRE(model.domain(0).contains(2));
    REQUIRE(model.var_trail_size() == 0);
}

TEST_CASE("Model instantiate", "[model]") {
    auto model = make_model({"#_#", "___", "#_#"}, {"ace", "cat", "dog"});

    SECTION("assigns and narrows the domain") {
        REQUIRE(model.instantiate(1, 1, 2));
        REQUIRE(model.is_assigned(1));
        REQUIRE(model.assigned_word(1) == 2);
        REQUIRE(model.domain(1).is_singleton());
        REQUIRE(model.assigned_count() == 1);
    }

    SECTION("fails for a removed word") {
        model.remove_value(1, 1, 2);
        REQUIRE(!model.instantiate(2, 1, 2));
        REQUIRE(!model.is_assigned(1));
        REQUIRE(model.assigned_count() == 0);
    }
}

TEST_CASE("Model nested rewind", "[model][trail]") {
    auto model = make_model({"____", "_##_", "____"}, {"lamp", "gift", "log", "pit", "top"});

    model.remove_value(1, 2, 0);     // level 1
    model.instantiate(2, 0, 0);      // level 2
    model.remove_value(2, 3, 2);
    model.instantiate(3, 2, 2);      // level 3
    REQUIRE(model.assigned_count() == 2);

    SECTION("rewind one level") {
        model.rewind_to(2);
        REQUIRE(model.assigned_count() == 1);
        REQUIRE(!model.is_assigned(2));
        REQUIRE(model.var_size(2) == 4);
        REQUIRE(model.var_size(3) == 4);
    }

    SECTION("rewind to level 1 keeps level 1 changes") {
        model.rewind_to(1);
        REQUIRE(model.assigned_count() == 0);
        REQUIRE(model.var_size(0) == 5);
        REQUIRE(model.var_size(2) == 4);
        REQUIRE(model.var_size(3) == 5);
    }

    SECTION("reset restores everything") {
        model.reset();
        REQUIRE(model.assigned_count() == 0);
        for (size_t v = 0; v < model.num_variables(); ++v) {
            REQUIRE(model.var_size(v) == 5);
        }
        REQUIRE(model.var_trail_size() == 0);
    }

    SECTION("levels can be reused after rewind") {
        model.rewind_to(1);
        REQUIRE(model.instantiate(2, 0, 1));
        REQUIRE(model.assigned_word(0) == 1);
        model.rewind_to(1);
        REQUIRE(!model.is_assigned(0));
        REQUIRE(model.var_size(0) == 5);
    }
}

TEST_CASE("Model requires a puzzle", "[model]") {
    REQUIRE_THROWS_AS(Model(nullptr, WordList()), std::invalid_argument);
}
