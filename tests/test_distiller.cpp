#include <catch2/catch_test_macros.hpp>
#include "fakes.hpp"
#include "memory/fact_distiller.hpp"
#include "memory/fact_extractor.hpp"

using namespace memoria;

static std::vector<Turn> turns(size_t n) {
    std::vector<Turn> out;
    for (size_t i = 0; i < n; i++) {
        out.push_back({i % 2 == 0 ? "user" : "assistant", "turn " + std::to_string(i)});
    }
    return out;
}

// ── is_transient ─────────────────────────────────────────────

TEST_CASE("is_transient: relative time references", "[distill]") {
    REQUIRE(is_transient("Has a dentist appointment tomorrow"));
    REQUIRE(is_transient("Went running yesterday morning"));
    REQUIRE(is_transient("Is busy this week with exams"));
    REQUIRE(is_transient("Traveling NEXT WEEK to Berlin"));
    REQUIRE(is_transient("Today the user feels tired"));
    REQUIRE(is_transient("Is currently reading Dune"));
    REQUIRE(is_transient("Is cooking right now"));
}

TEST_CASE("is_transient: conversational requests", "[distill]") {
    REQUIRE(is_transient("Asked: can you recommend a song"));
    REQUIRE(is_transient("Wanted to know what is the capital of Peru"));
    REQUIRE(is_transient("User said help me write an email"));
    REQUIRE(is_transient("How do I install CMake"));
}

TEST_CASE("is_transient: durable facts pass", "[distill]") {
    REQUIRE_FALSE(is_transient("Works as a structural engineer in Seattle"));
    REQUIRE_FALSE(is_transient("Prefers dark roast coffee"));
    // Whole-word matching only
    REQUIRE_FALSE(is_transient("Collects todays-newspaper replicas"));
    REQUIRE_FALSE(is_transient("Plays the scanner game"));
}

TEST_CASE("transient_patterns: exposed as data", "[distill]") {
    REQUIRE(transient_patterns().size() == 3);
}

// ── render_transcript ────────────────────────────────────────

TEST_CASE("render_transcript: role-labeled lines, oldest first", "[distill]") {
    std::vector<Turn> t = {{"user", "I am a nurse"}, {"assistant", "Nice!"}};
    REQUIRE(render_transcript(t, 12) == "user: I am a nurse\nassistant: Nice!");
}

TEST_CASE("render_transcript: keeps only the last max_turns", "[distill]") {
    auto text = render_transcript(turns(20), 12);
    REQUIRE(text.find("turn 7\n") == std::string::npos);
    REQUIRE(text.rfind("user: turn 8", 0) == 0);
    REQUIRE(text.find("turn 19") != std::string::npos);
}

// ── parse_raw_facts ──────────────────────────────────────────

TEST_CASE("parse_raw_facts: typed fields", "[extract]") {
    auto facts = parse_raw_facts(R"([
        {"kind":"profile","content":"Works as a nurse","tags":["job"],"salience":0.8}
    ])");
    REQUIRE(facts.size() == 1);
    REQUIRE(facts[0].kind.value_or("") == "profile");
    REQUIRE(facts[0].content.value_or("") == "Works as a nurse");
    REQUIRE(facts[0].tags == std::vector<std::string>{"job"});
    REQUIRE(facts[0].salience.value_or(0.0) == 0.8);
}

TEST_CASE("parse_raw_facts: strips a Markdown code fence", "[extract]") {
    auto facts = parse_raw_facts("```json\n[{\"content\":\"Likes jazz\"}]\n```");
    REQUIRE(facts.size() == 1);
    REQUIRE(facts[0].content.value_or("") == "Likes jazz");
}

TEST_CASE("parse_raw_facts: malformed elements dropped or left empty", "[extract]") {
    auto facts = parse_raw_facts(R"([
        "just a string",
        42,
        {"content": 7, "salience": "high", "tags": ["ok", 3]}
    ])");
    REQUIRE(facts.size() == 1);
    REQUIRE_FALSE(facts[0].content.has_value());
    REQUIRE_FALSE(facts[0].salience.has_value());
    REQUIRE(facts[0].tags == std::vector<std::string>{"ok"});
}

TEST_CASE("parse_raw_facts: non-array output throws", "[extract]") {
    REQUIRE_THROWS_AS(parse_raw_facts(R"({"facts":[]})"), ExtractionParseFailure);
    REQUIRE_THROWS_AS(parse_raw_facts("Sure! Here are the facts"), ExtractionParseFailure);
    REQUIRE(parse_raw_facts("[]").empty());
}

// ── LlmFactExtractor ─────────────────────────────────────────

TEST_CASE("LlmFactExtractor: parses provider reply", "[extract]") {
    FakeProvider provider;
    provider.reply = R"([{"kind":"fact","content":"Lives in Seattle","salience":0.7}])";
    LlmFactExtractor extractor(provider, "m", 0.2);

    auto facts = extractor.extract("user: I live in Seattle");
    REQUIRE(facts.has_value());
    REQUIRE(facts.value_or(std::vector<RawFact>{}).size() == 1);
    REQUIRE(provider.last_temperature == 0.2);
    REQUIRE(provider.last_message.find("user: I live in Seattle") != std::string::npos);
}

TEST_CASE("LlmFactExtractor: provider failure yields nullopt", "[extract]") {
    FakeProvider provider;
    provider.fail = true;
    LlmFactExtractor extractor(provider, "m");
    REQUIRE_FALSE(extractor.extract("user: hi").has_value());
}

TEST_CASE("LlmFactExtractor: unparseable reply yields nullopt", "[extract]") {
    FakeProvider provider;
    provider.reply = "I could not find any facts.";
    LlmFactExtractor extractor(provider, "m");
    REQUIRE_FALSE(extractor.extract("user: hi").has_value());
}

// ── FactDistiller ────────────────────────────────────────────

TEST_CASE("FactDistiller: salience admission floor", "[distill]") {
    FakeExtractor extractor;
    FactDistiller d(extractor);
    REQUIRE_FALSE(d.admit(raw_fact("I like cats", 0.5)));
    REQUIRE(d.admit(raw_fact("I work as a structural engineer in Seattle", 0.75)));
    REQUIRE(d.admit(raw_fact("Prefers tea over coffee", 0.6)));
}

TEST_CASE("FactDistiller: content length counted in characters", "[distill]") {
    FakeExtractor extractor;
    FactDistiller d(extractor);
    REQUIRE_FALSE(d.admit(raw_fact("Short content!", 0.9)));        // 14
    REQUIRE(d.admit(raw_fact("Exactly fifteen", 0.9)));             // 15
    // 14 characters, 18 bytes
    REQUIRE_FALSE(d.admit(raw_fact("Caf\xC3\xA9 \xC3\xA9l\xC3\xA9gant \xC3\xA0", 0.9)));
    REQUIRE_FALSE(d.admit(raw_fact("      padded      ", 0.9)));
}

TEST_CASE("FactDistiller: missing fields rejected", "[distill]") {
    FakeExtractor extractor;
    FactDistiller d(extractor);

    RawFact no_salience;
    no_salience.content = "Works as a structural engineer";
    REQUIRE_FALSE(d.admit(no_salience));

    RawFact no_content;
    no_content.salience = 0.9;
    REQUIRE_FALSE(d.admit(no_content));
}

TEST_CASE("FactDistiller: transient content rejected", "[distill]") {
    FakeExtractor extractor;
    FactDistiller d(extractor);
    REQUIRE_FALSE(d.admit(raw_fact("Wants to go hiking tomorrow afternoon", 0.9)));
    REQUIRE_FALSE(d.admit(raw_fact("Asked can you suggest a playlist", 0.9)));
}

TEST_CASE("FactDistiller: noise hook rejects", "[distill]") {
    FakeExtractor extractor;
    FactDistiller d(extractor, {}, [](const std::string& content) {
        return content.find("lorem") != std::string::npos;
    });
    REQUIRE_FALSE(d.admit(raw_fact("lorem ipsum dolor sit amet", 0.9)));
    REQUIRE(d.admit(raw_fact("Speaks fluent Portuguese", 0.9)));
}

TEST_CASE("FactDistiller: distill_from_turns filters and tags provenance", "[distill]") {
    FakeExtractor extractor;
    extractor.facts = {
        raw_fact("I like cats", 0.5),
        raw_fact("I work as a structural engineer in Seattle", 0.75, "profile"),
        raw_fact("  Prefers window seats on flights  ", 0.9, "mystery-kind"),
        raw_fact("Has a meeting tomorrow at nine", 0.9),
    };
    FactDistiller d(extractor);

    auto facts = d.distill_from_turns(turns(5), "conv-42");
    REQUIRE(facts.size() == 2);
    REQUIRE(facts[0].content == "I work as a structural engineer in Seattle");
    REQUIRE(facts[0].kind == MemoryKind::Profile);
    REQUIRE(facts[0].salience == 0.75);
    REQUIRE(facts[0].source.origin == "conversation");
    REQUIRE(facts[0].source.reference_id == "conv-42");
    REQUIRE(facts[0].source.extracted_at > 0);
    REQUIRE(facts[1].content == "Prefers window seats on flights");
    REQUIRE(facts[1].kind == MemoryKind::Fact);
}

TEST_CASE("FactDistiller: extraction failure yields no facts", "[distill]") {
    FakeExtractor extractor;
    extractor.fail = true;
    FactDistiller d(extractor);
    REQUIRE(d.distill_from_turns(turns(6)).empty());
    REQUIRE(extractor.calls == 1);
}

TEST_CASE("FactDistiller: transcript limited to max_turns", "[distill]") {
    FakeExtractor extractor;
    DistillOptions opts;
    opts.max_turns = 3;
    FactDistiller d(extractor, opts);

    d.distill_from_turns(turns(10));
    REQUIRE(extractor.last_transcript == "assistant: turn 7\nuser: turn 8\nassistant: turn 9");
}

TEST_CASE("FactDistiller: no turns skips extraction", "[distill]") {
    FakeExtractor extractor;
    FactDistiller d(extractor);
    REQUIRE(d.distill_from_turns({}).empty());
    REQUIRE(extractor.calls == 0);
}
