#define BOOST_TEST_MODULE QueryTest

#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

#include "mplsq/errors.h"
#include "mplsq/query.h"

using namespace mplsq;

typedef std::vector<std::string> Word;

BOOST_AUTO_TEST_CASE(CapturesResolveLeftToRight) {
    PathPattern pattern = compile_pattern("*, B, *");

    Match match;
    BOOST_REQUIRE(pattern.match(Word{"A", "B", "C", "B", "D"}, match));
    BOOST_REQUIRE_EQUAL(match.captures.size(), 2);
    BOOST_CHECK(match.captures[0].items == Word({"A"}));
    BOOST_CHECK(match.captures[1].items == Word({"C", "B", "D"}));
    BOOST_CHECK_EQUAL(match.captures[1].begin, 2);
    BOOST_CHECK_EQUAL(match.captures[1].end, 5);
}

BOOST_AUTO_TEST_CASE(NamedCaptures) {
    PathPattern pattern = compile_pattern("[head] S2 [tail]");

    Match match;
    BOOST_REQUIRE(pattern.match(Word{"S1", "S2", "S3"}, match));
    const Capture* head = match.find("head");
    const Capture* tail = match.find("tail");
    BOOST_REQUIRE(head != 0);
    BOOST_REQUIRE(tail != 0);
    BOOST_CHECK(head->items == Word({"S1"}));
    BOOST_CHECK(tail->items == Word({"S3"}));
    BOOST_CHECK(match.find("middle") == 0);
}

BOOST_AUTO_TEST_CASE(LiteralOnlyIsExact) {
    PathPattern pattern = compile_pattern("S1 S2 S3");

    BOOST_CHECK(pattern.literal_only());
    BOOST_CHECK(pattern.accepts(Word{"S1", "S2", "S3"}));
    BOOST_CHECK(!pattern.accepts(Word{"S1", "S2"}));
    BOOST_CHECK(!pattern.accepts(Word{"S1", "S2", "S3", "S4"}));
    BOOST_CHECK(!pattern.accepts(Word{"S1", "S3", "S2"}));
}

BOOST_AUTO_TEST_CASE(WildcardsMatchEmptyRuns) {
    PathPattern pattern = compile_pattern(".* S1 .* S3 .*");

    BOOST_CHECK(pattern.accepts(Word{"S1", "S3"}));
    BOOST_CHECK(pattern.accepts(Word{"S1", "S2", "S3"}));
    BOOST_CHECK(pattern.accepts(Word{"S0", "S1", "S2", "S3", "S4"}));
    BOOST_CHECK(!pattern.accepts(Word{"S1", "S2"}));
    BOOST_CHECK(!pattern.accepts(Word{"S3", "S1"}));
    BOOST_CHECK(!pattern.accepts(Word{}));
}

BOOST_AUTO_TEST_CASE(SingleAndOneOrMore) {
    PathPattern single = compile_pattern("S1 . S3");
    BOOST_CHECK(single.accepts(Word{"S1", "S2", "S3"}));
    BOOST_CHECK(!single.accepts(Word{"S1", "S3"}));
    BOOST_CHECK(!single.accepts(Word{"S1", "S2", "S2", "S3"}));

    PathPattern more = compile_pattern("S1 .+ S3");
    BOOST_CHECK(!more.accepts(Word{"S1", "S3"}));
    BOOST_CHECK(more.accepts(Word{"S1", "S2", "S3"}));
    BOOST_CHECK(more.accepts(Word{"S1", "S2", "S4", "S3"}));

    Match match;
    BOOST_REQUIRE(more.match(Word{"S1", "S2", "S4", "S3"}, match));
    BOOST_REQUIRE_EQUAL(match.captures.size(), 1);
    BOOST_CHECK(match.captures[0].items == Word({"S2", "S4"}));
}

BOOST_AUTO_TEST_CASE(AcceptsAgreesWithMatch) {
    std::vector<std::string> patterns{"* B *", "A . *", "[x] [y] C", "A .+", "B"};
    std::vector<Word> words{Word{}, Word{"A"}, Word{"B"}, Word{"A", "B"}, Word{"A", "B", "C"},
                            Word{"B", "B", "C"}, Word{"A", "C", "B", "C"}};
    for (auto& text : patterns) {
        PathPattern pattern = compile_pattern(text);
        for (auto& word : words) {
            Match match;
            BOOST_CHECK_EQUAL(pattern.accepts(word), pattern.match(word, match));
        }
    }
}

BOOST_AUTO_TEST_CASE(CommaAndSpaceSeparators) {
    PathPattern spaced = compile_pattern("S1 S2");
    PathPattern commas = compile_pattern("S1,S2");
    PathPattern both = compile_pattern(" S1 ,  S2 ");
    Word word{"S1", "S2"};
    BOOST_CHECK(spaced.accepts(word));
    BOOST_CHECK(commas.accepts(word));
    BOOST_CHECK(both.accepts(word));
    BOOST_CHECK_EQUAL(both.segments.size(), 2);
}

BOOST_AUTO_TEST_CASE(InvalidPatterns) {
    BOOST_CHECK_THROW(compile_pattern(""), InvalidPatternError);
    BOOST_CHECK_THROW(compile_pattern("   "), InvalidPatternError);
    BOOST_CHECK_THROW(compile_pattern("[a"), InvalidPatternError);
    BOOST_CHECK_THROW(compile_pattern("a]"), InvalidPatternError);
    BOOST_CHECK_THROW(compile_pattern("[a [b]]"), InvalidPatternError);
    BOOST_CHECK_THROW(compile_pattern("S1,,S2"), InvalidPatternError);
    BOOST_CHECK_THROW(compile_pattern(",S1"), InvalidPatternError);
    BOOST_CHECK_THROW(compile_pattern("S1,"), InvalidPatternError);
    BOOST_CHECK_THROW(compile_pattern("[x] S1 [x]"), InvalidPatternError);
    BOOST_CHECK_THROW(compile_pattern("[1x]"), InvalidPatternError);
    BOOST_CHECK_THROW(compile_pattern("S*1"), InvalidPatternError);
    BOOST_CHECK_THROW(compile_pattern("<10> S1"), InvalidPatternError);
}

BOOST_AUTO_TEST_CASE(ErrorCarriesColumn) {
    try {
        compile_pattern("S1 S2 ]");
        BOOST_FAIL("expected InvalidPatternError");
    } catch (const InvalidPatternError& e) {
        BOOST_CHECK_EQUAL(e.position, 6);
        BOOST_CHECK_EQUAL(e.pattern, "S1 S2 ]");
    }
}

BOOST_AUTO_TEST_CASE(ParseFullQuery) {
    Query query = parse_query("<10 20> .* S1 .* S3 .* <12 .*> 1");

    BOOST_CHECK(query.has_initial_stack);
    BOOST_CHECK(query.initial_stack == LabelStack({"10", "20"}));
    BOOST_CHECK(query.has_final_stack);
    BOOST_CHECK_EQUAL(query.k, 1);

    BOOST_CHECK(query.accepts(Word{"S1", "S2", "S3"}, LabelStack{"12", "20"}));
    BOOST_CHECK(query.accepts(Word{"S1", "S2", "S3"}, LabelStack{"12"}));
    BOOST_CHECK(!query.accepts(Word{"S1", "S2", "S3"}, LabelStack{"11", "20"}));
    BOOST_CHECK(!query.accepts(Word{"S1", "S2"}, LabelStack{"12"}));
}

BOOST_AUTO_TEST_CASE(ParsePathOnly) {
    Query query = parse_query("S1 .* S3");

    BOOST_CHECK(!query.has_initial_stack);
    BOOST_CHECK(query.initial_stack.empty());
    BOOST_CHECK(!query.has_final_stack);
    BOOST_CHECK_EQUAL(query.k, NONE);
    BOOST_CHECK(query.accepts(Word{"S1", "S3"}, LabelStack{"anything"}));
}

BOOST_AUTO_TEST_CASE(EmptyFinalStack) {
    Query query = parse_query("<10> S1 .* <> 0");

    BOOST_CHECK(query.has_final_stack);
    BOOST_CHECK_EQUAL(query.k, 0);
    BOOST_CHECK(query.accepts(Word{"S1", "S2"}, LabelStack{}));
    BOOST_CHECK(!query.accepts(Word{"S1", "S2"}, LabelStack{"10"}));
}

BOOST_AUTO_TEST_CASE(InvalidQueries) {
    BOOST_CHECK_THROW(parse_query(""), InvalidPatternError);
    BOOST_CHECK_THROW(parse_query("<10 S1 S2"), InvalidPatternError);
    BOOST_CHECK_THROW(parse_query("<10> S1 > S2"), InvalidPatternError);
    BOOST_CHECK_THROW(parse_query("<10 <11>> S1"), InvalidPatternError);
    BOOST_CHECK_THROW(parse_query("<.*> S1"), InvalidPatternError);
    BOOST_CHECK_THROW(parse_query("<10> S1 <> two"), InvalidPatternError);
    BOOST_CHECK_THROW(parse_query("<10> <> S1"), InvalidPatternError);
}
