// =============================================================================
// TextNormalizer Tests
// =============================================================================

#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include "internal/text/text_normalizer.hpp"

using namespace voice;
using namespace voice::text;

TEST_CASE("UTF-8 helpers count characters, not bytes", "[text][utf8]") {
    REQUIRE(utf8Length("abc") == 3);
    REQUIRE(utf8Length("你好") == 2);
    REQUIRE(utf8Length("héllo") == 5);

    auto chars = splitUtf8("a你b");
    REQUIRE(chars == std::vector<std::string>{"a", "你", "b"});
}

TEST_CASE("isValidUtf8 accepts well-formed text only", "[text][utf8]") {
    REQUIRE(isValidUtf8(""));
    REQUIRE(isValidUtf8("plain ascii"));
    REQUIRE(isValidUtf8("你好 héllo"));
    REQUIRE(isValidUtf8("\xf0\x9f\x8e\xa4"));          // U+1F3A4

    REQUIRE_FALSE(isValidUtf8("Caf\xe9"));                // Latin-1
    REQUIRE_FALSE(isValidUtf8("\xe4\xbd"));              // 截断
    REQUIRE_FALSE(isValidUtf8("\xc0\xaf"));              // 过长编码
    REQUIRE_FALSE(isValidUtf8("\xed\xa0\x80"));         // 代理区
    REQUIRE_FALSE(isValidUtf8("\x80" "abc"));             // 孤立续字节
    REQUIRE_FALSE(isValidUtf8("\xf4\x90\x80\x80"));    // > U+10FFFF
}

TEST_CASE("isPunctuation covers ASCII and CJK marks", "[text][utf8]") {
    REQUIRE(isPunctuation("!"));
    REQUIRE(isPunctuation(","));
    REQUIRE(isPunctuation("，"));
    REQUIRE(isPunctuation("。"));
    REQUIRE_FALSE(isPunctuation("a"));
    REQUIRE_FALSE(isPunctuation("你"));
    REQUIRE_FALSE(isPunctuation(" "));
}

TEST_CASE("normalize collapses whitespace by default", "[text][normalize]") {
    TextNormalizer normalizer;
    TextData out;

    REQUIRE(normalizer.normalize("  Hello \t\n  World!  ", NormalizeOptions{}, out).isOk());
    REQUIRE(out.text == "Hello World!");
    REQUIRE(out.confidence == 1.0f);
    REQUIRE(out.metadata.at("original_length") == "20");
    REQUIRE(out.metadata.at("final_length") == "12");
    REQUIRE(out.metadata.at("strip_whitespace") == "true");
    REQUIRE(out.metadata.at("lowercase") == "false");
    REQUIRE(out.metadata.at("remove_punctuation") == "false");
}

TEST_CASE("normalize options", "[text][normalize]") {
    TextNormalizer normalizer;
    TextData out;
    NormalizeOptions options;

    SECTION("lowercase touches ASCII only") {
        options.lowercase = true;
        REQUIRE(normalizer.normalize("HeLLo ÉCOLE", options, out).isOk());
        REQUIRE(out.text == "hello École");
    }

    SECTION("punctuation removal keeps word spacing") {
        options.remove_punctuation = true;
        REQUIRE(normalizer.normalize("Hello , world! 你好，世界。", options, out).isOk());
        REQUIRE(out.text == "Hello world 你好世界");
        REQUIRE(out.metadata.at("remove_punctuation") == "true");
    }

    SECTION("whitespace kept when stripping is off") {
        options.strip_whitespace = false;
        REQUIRE(normalizer.normalize(" a  b ", options, out).isOk());
        REQUIRE(out.text == " a  b ");
    }

    SECTION("punctuation-only text becomes empty") {
        options.remove_punctuation = true;
        REQUIRE(normalizer.normalize("?!", options, out).isOk());
        REQUIRE(out.text.empty());
        REQUIRE(out.metadata.at("final_length") == "0");
    }
}

TEST_CASE("normalize rejects blank input", "[text][normalize]") {
    TextNormalizer normalizer;
    TextData out;
    out.text = "untouched";

    REQUIRE(normalizer.normalize("", NormalizeOptions{}, out).code == ErrorCode::INVALID_TEXT);
    REQUIRE(normalizer.normalize(" \t\r\n ", NormalizeOptions{}, out).code == ErrorCode::INVALID_TEXT);
    REQUIRE(out.text == "untouched");
}

TEST_CASE("normalize rejects text that is not UTF-8", "[text][normalize]") {
    TextNormalizer normalizer;
    TextData out;
    out.text = "untouched";

    auto err = normalizer.normalize("Caf\xe9 au lait", NormalizeOptions{}, out);
    REQUIRE(err.code == ErrorCode::INVALID_TEXT);
    REQUIRE(out.text == "untouched");
}
