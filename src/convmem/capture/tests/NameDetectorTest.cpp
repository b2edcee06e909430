#include "convmem/capture/NameDetector.h"

#include "MiniTest.h"

#include <optional>
#include <string>
#include <vector>

using namespace convmem::capture;

static std::string detectOr(const NameDetector& d, const std::string& text, const std::string& none = "<none>") {
    auto r = d.detect(text);
    return r.has_value() ? r.value() : none;
}

int main() {
    using mini_test::TestCase;

    std::vector<TestCase> tests;

    tests.push_back({"my_name_is_basic", []() {
        NameDetector d;
        CHECK_EQ(detectOr(d, "Hi, my name is Sarah."), std::string("Sarah"));
        CHECK_EQ(detectOr(d, "MY NAME IS john smith"), std::string("John Smith"));
        CHECK_EQ(detectOr(d, "well my name is mARIA"), std::string("Maria"));
    }});

    tests.push_back({"call_me_pattern", []() {
        NameDetector d;
        CHECK_EQ(detectOr(d, "You can call me Bob"), std::string("Bob"));
        CHECK_EQ(detectOr(d, "just CALL ME alex, okay?"), std::string("Alex"));
    }});

    tests.push_back({"truncates_at_sentence_punctuation", []() {
        NameDetector d;
        CHECK_EQ(detectOr(d, "my name is Anna; nice to meet you"), std::string("Anna"));
        CHECK_EQ(detectOr(d, "my name is Tom! what's yours"), std::string("Tom"));
    }});

    tests.push_back({"strips_filler_conjunctions", []() {
        NameDetector d;
        CHECK_EQ(detectOr(d, "my name is Sarah and I work in sales"), std::string("Sarah"));
        CHECK_EQ(detectOr(d, "my name is David but everyone calls me Dave"), std::string("David"));
        CHECK_EQ(detectOr(d, "my name is Lee so yeah"), std::string("Lee"));
    }});

    tests.push_back({"hyphenated_names_split_into_words", []() {
        NameDetector d;
        CHECK_EQ(detectOr(d, "my name is mary-jane"), std::string("Mary Jane"));
    }});

    tests.push_back({"rejects_too_many_words", []() {
        NameDetector d;
        CHECK_EQ(detectOr(d, "my name is what I told you before"), std::string("<none>"));
    }});

    tests.push_back({"rejects_short_or_non_alpha", []() {
        NameDetector d;
        // 单词过短
        CHECK_EQ(detectOr(d, "my name is J R"), std::string("<none>"));
        // 整体过短（2 个字符）
        CHECK_EQ(detectOr(d, "my name is Al"), std::string("<none>"));
        // 含撇号的词不是纯字母
        CHECK_EQ(detectOr(d, "my name is O'Brien"), std::string("<none>"));
    }});

    tests.push_back({"greeting_with_full_name", []() {
        NameDetector d;
        CHECK_EQ(detectOr(d, "Hi, my name is John Smith."), std::string("John Smith"));
    }});

    tests.push_back({"rejects_words_with_digits", []() {
        NameDetector d;
        CHECK_EQ(detectOr(d, "my name is X1 Y2"), std::string("<none>"));
        CHECK_EQ(detectOr(d, "call me R2D2"), std::string("<none>"));
    }});

    tests.push_back({"non_ascii_surroundings", []() {
        NameDetector d;
        // 首尾的多字节 UTF-8 字节不是空白
        CHECK_EQ(detectOr(d, "my name is Sarah, très bien"), std::string("Sarah"));
        CHECK_EQ(detectOr(d, "café talk"), std::string("<none>"));
    }});

    tests.push_back({"falls_through_to_next_pattern", []() {
        NameDetector d;
        CHECK_EQ(detectOr(d, "my name is Jo Ann Lee Smith, call me Robert"), std::string("Robert"));
    }});

    tests.push_back({"no_match", []() {
        NameDetector d;
        CHECK_EQ(detectOr(d, ""), std::string("<none>"));
        CHECK_EQ(detectOr(d, "   "), std::string("<none>"));
        CHECK_EQ(detectOr(d, "the weather is nice today"), std::string("<none>"));
        CHECK_EQ(detectOr(d, "enemy name is unknown"), std::string("<none>"));
    }});

    tests.push_back({"custom_limits", []() {
        NameDetector::Config cfg;
        cfg.maxWords = 4;
        cfg.minWordLength = 2;
        NameDetector d(cfg);
        CHECK_EQ(detectOr(d, "my name is Jo Ann Lee Smith"), std::string("Jo Ann Lee Smith"));
    }});

    return mini_test::run(tests);
}
