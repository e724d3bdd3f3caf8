#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include "../src/constraintEngine.hpp"

using wordsieve::engine::ConstraintEngine;
using wordsieve::feedback::parseRecord;

namespace {
    std::vector<std::string> accepted(const ConstraintEngine& engine, const std::vector<std::string>& words) {
        std::vector<std::string> out;
        for (const auto& word : words) {
            if (engine.test(word)) out.push_back(word);
        }
        return out;
    }

    auto MessageContains(std::string_view part) {
        return Catch::Matchers::Predicate<wordsieve::ContradictionError>(
            [part](const wordsieve::ContradictionError& e) { return std::string(e.what()).find(part) != std::string::npos; },
            "exception message contains: " + std::string(part)
        );
    }
}

TEST_CASE("Engine: fresh table", "[engine]") {
    ConstraintEngine engine{};
    REQUIRE(engine.recordCount() == 0);
    REQUIRE(engine.mandatoryLetters().empty());

    for (const auto& entry : engine.table()) {
        REQUIRE_FALSE(entry.excluded);
        REQUIRE(entry.confirmed.empty());
        REQUIRE(entry.rejected.empty());
        REQUIRE(entry.frequency > 0.0);
    }
    REQUIRE(engine.table().at('e').frequency > engine.table().at('z').frequency);
    REQUIRE(engine.table().find('?') == nullptr);
}

TEST_CASE("Engine: invalid length window", "[engine][error]") {
    REQUIRE_THROWS_AS(ConstraintEngine(0, 5), wordsieve::UsageError);
    REQUIRE_THROWS_AS(ConstraintEngine(6, 5), wordsieve::UsageError);
    REQUIRE_THROWS_AS(ConstraintEngine(5, wordsieve::config::MAX_WORD_LENGTH + 1), wordsieve::UsageError);
    REQUIRE_NOTHROW(ConstraintEngine(1, wordsieve::config::MAX_WORD_LENGTH));
}

TEST_CASE("Engine: irate xx..o", "[engine]") {
    ConstraintEngine engine{};
    engine.fold(parseRecord("irate", "xx..o"));
    const auto& table = engine.table();

    REQUIRE(engine.recordCount() == 1);
    REQUIRE(table.at('a').excluded);
    REQUIRE(table.at('t').excluded);
    REQUIRE_FALSE(table.at('i').excluded);
    REQUIRE(table.at('i').rejected.contains(0));
    REQUIRE(table.at('r').rejected.contains(1));
    REQUIRE(table.at('e').confirmed.contains(4));
    REQUIRE(table.at('e').rejected.empty());

    const auto mandatory = engine.mandatoryLetters();
    REQUIRE(mandatory.size() == 3);
    REQUIRE(mandatory.contains('e'));
    REQUIRE(mandatory.contains('i'));
    REQUIRE(mandatory.contains('r'));

    REQUIRE_FALSE(engine.test("crate"));  // 'a' and 't' are eliminated
    REQUIRE_FALSE(engine.test("plate"));
    REQUIRE(engine.test("spire"));
    REQUIRE(engine.test("shire"));
    REQUIRE(engine.test("rinse"));
    REQUIRE_FALSE(engine.test("irate"));  // 'i' rejected at 0
    REQUIRE_FALSE(engine.test("prize"));  // 'r' rejected at 1
    REQUIRE_FALSE(engine.test("spine"));  // no 'r'
    REQUIRE_FALSE(engine.test("siren"));  // position 4 belongs to 'e'
    REQUIRE_FALSE(engine.test("spires")); // too long
}

TEST_CASE("Engine: all letters confirmed accepts only the guess", "[engine]") {
    ConstraintEngine engine{};
    engine.fold(parseRecord("crane", "ooooo"));

    const std::vector<std::string> dictionary{"brine", "crane", "crank", "crone", "crane", "nacre", "caner"};
    REQUIRE(accepted(engine, dictionary) == std::vector<std::string>{"crane", "crane"});
}

TEST_CASE("Engine: misplaced letters are mandatory", "[engine]") {
    ConstraintEngine engine{};
    engine.fold(parseRecord("crane", "x...."));

    REQUIRE(engine.mandatoryLetters().contains('c'));
    REQUIRE(engine.test("stoic"));
    REQUIRE_FALSE(engine.test("coins"));  // 'c' rejected at 0
    REQUIRE_FALSE(engine.test("shout"));  // no 'c'
}

TEST_CASE("Engine: presence check ignores multiplicity", "[engine]") {
    ConstraintEngine engine{};
    engine.fold(parseRecord("speed", "..xx."));

    // Two misplaced 'e's only require one 'e' somewhere else
    REQUIRE(engine.test("eight"));
    REQUIRE(engine.test("elbow"));
    REQUIRE_FALSE(engine.test("bleed"));  // 'd' eliminated
}

TEST_CASE("Engine: folding several records", "[engine]") {
    ConstraintEngine engine{};
    const auto records = std::vector{parseRecord("irate", "xx..o"), parseRecord("shire", "..xxo")};
    engine.fold(records);

    REQUIRE(engine.recordCount() == 2);
    REQUIRE(engine.table().at('s').excluded);
    REQUIRE(engine.table().at('h').excluded);
    REQUIRE(engine.table().at('i').rejected.raw() == 0b101);
    REQUIRE(engine.table().at('r').rejected.raw() == 0b1010);

    REQUIRE_FALSE(engine.test("spire"));  // 's' eliminated
    REQUIRE_FALSE(engine.test("rinse"));
    REQUIRE_FALSE(engine.test("prize"));  // 'r' rejected at 1
    REQUIRE_FALSE(engine.test("riden"));  // position 4 belongs to 'e'
    REQUIRE(engine.test("rinde"));
}

TEST_CASE("Engine: folding a record twice is idempotent", "[engine]") {
    const auto record = parseRecord("irate", "xx..o");

    ConstraintEngine once{};
    once.fold(record);

    ConstraintEngine twice{};
    twice.fold(record);
    REQUIRE_NOTHROW(twice.fold(record));

    REQUIRE(once.table() == twice.table());
    REQUIRE(once.mandatoryLetters() == twice.mandatoryLetters());
    for (const auto* word : {"spire", "shire", "crate", "rinse", "prize"}) {
        REQUIRE(once.test(word) == twice.test(word));
    }
}

TEST_CASE("Engine: empty attempts accept every word in the window", "[engine]") {
    ConstraintEngine engine{4, 6};
    engine.fold(std::span<const wordsieve::feedback::Record>{});

    const std::vector<std::string> dictionary{"abc", "abcd", "zzzzz", "abcdef", "abcdefg", ""};
    REQUIRE(accepted(engine, dictionary) == std::vector<std::string>{"abcd", "zzzzz", "abcdef"});
}

TEST_CASE("Engine: accepted words respect the length window", "[engine]") {
    ConstraintEngine engine{3, 4};
    engine.fold(parseRecord("ab", "o."));

    for (const auto* word : {"a", "ac", "acc", "accc", "acccc", "accccc"}) {
        const std::string_view w{word};
        if (engine.test(w)) {
            REQUIRE(w.size() >= 3);
            REQUIRE(w.size() <= 4);
        }
    }
    REQUIRE(engine.test("acc"));
    REQUIRE(engine.test("accc"));
}

TEST_CASE("Engine: characters outside the alphabet are rejected", "[engine]") {
    ConstraintEngine engine{};
    REQUIRE(engine.test("crane"));
    REQUIRE_FALSE(engine.test("Crane"));
    REQUIRE_FALSE(engine.test("cr-ne"));
    REQUIRE_FALSE(engine.test("cr\xe9ne"));
}

TEST_CASE("Engine: contradictions", "[engine][error]") {
    SECTION("Eliminated and confirmed in one record") {
        ConstraintEngine engine{4, 4};
        REQUIRE_THROWS_MATCHES(engine.fold(parseRecord("aabb", "o.x.")), wordsieve::ContradictionError, MessageContains("'a'"));
    }

    SECTION("Eliminated and misplaced in one record") {
        ConstraintEngine engine{};
        REQUIRE_THROWS_AS(engine.fold(parseRecord("geese", ".x.x.")), wordsieve::ContradictionError);
    }

    SECTION("Eliminated earlier, confirmed later") {
        ConstraintEngine engine{};
        engine.fold(parseRecord("crane", "....."));
        REQUIRE_THROWS_MATCHES(engine.fold(parseRecord("spire", "....o")), wordsieve::ContradictionError, MessageContains("attempt 2"));
    }

    SECTION("Confirmed earlier, eliminated later") {
        ConstraintEngine engine{};
        engine.fold(parseRecord("crane", "....o"));
        REQUIRE_THROWS_MATCHES(engine.fold(parseRecord("eject", ".....")), wordsieve::ContradictionError, MessageContains("'e'"));
    }

    SECTION("Two letters confirmed at one position") {
        ConstraintEngine engine{};
        engine.fold(parseRecord("crane", "o...."));
        REQUIRE_THROWS_MATCHES(engine.fold(parseRecord("slout", "o....")), wordsieve::ContradictionError, MessageContains("position 0"));
    }

    SECTION("Confirmed and misplaced at one position") {
        ConstraintEngine engine{};
        engine.fold(parseRecord("crane", "x...."));
        REQUIRE_THROWS_AS(engine.fold(parseRecord("crane", "o....")), wordsieve::ContradictionError);
    }
}
