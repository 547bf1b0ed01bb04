/**
 * @file test_jscrush.cpp
 * @brief Unit tests for the JSCrush packer
 */

#include "../../libcrusher/include/jscrush_crusher.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace crusher;

namespace {

constexpr std::string_view kHead = "_='";
constexpr std::string_view kMiddle = "';for(Y in $='";
constexpr std::string_view kTail = "')with(_.split($[Y]))_=join(pop());eval(_)";

// evaluates the self-unpacking program the way a JavaScript engine would
std::string unpack(const std::string& program) {
    const auto middle = program.find(kMiddle);
    EXPECT_EQ(program.rfind(kHead, 0), 0u);
    EXPECT_NE(middle, std::string::npos);

    std::string packed;
    for (std::size_t i = kHead.size(); i < middle; ++i) {
        char c = program[i];
        if (c == '\\') {
            c = program[++i];
            if (c == 'n') c = '\n';
            else if (c == 'r') c = '\r';
        }
        packed.push_back(c);
    }

    const auto keys_begin = middle + kMiddle.size();
    const std::string keys = program.substr(keys_begin, program.size() - keys_begin - kTail.size());

    for (const char key : keys) {
        std::vector<std::string> parts(1);
        for (const char c : packed) {
            if (c == key) parts.emplace_back();
            else parts.back().push_back(c);
        }
        const std::string glue = parts.back();
        parts.pop_back();
        std::string joined;
        for (std::size_t i = 0; i < parts.size(); ++i) {
            if (i) joined += glue;
            joined += parts[i];
        }
        packed = std::move(joined);
    }
    return packed;
}

bool valid_utf8(const std::string& s) {
    std::size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        std::size_t extra = 0;
        if (c < 0x80) extra = 0;
        else if ((c & 0xE0) == 0xC0) extra = 1;
        else if ((c & 0xF0) == 0xE0) extra = 2;
        else if ((c & 0xF8) == 0xF0) extra = 3;
        else return false;
        if (i + extra >= s.size() && extra > 0) return false;
        for (std::size_t k = 1; k <= extra; ++k) {
            if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return false;
        }
        i += extra + 1;
    }
    return true;
}

} // namespace

class JscrushCrusherTest : public ::testing::Test {
protected:
    JscrushCrusher jscrush_;
};

TEST_F(JscrushCrusherTest, Identity) {
    EXPECT_EQ(jscrush_.get_name(), "jscrush");
    EXPECT_TRUE(jscrush_.accepts(ContentType::Js));
    EXPECT_FALSE(jscrush_.accepts(ContentType::Css));
}

TEST_F(JscrushCrusherTest, ShortInputIsReturnedUnchanged) {
    EXPECT_EQ(jscrush_.crush(ContentType::Js, "a=1"), "a=1");
    EXPECT_EQ(jscrush_.crush(ContentType::Js, ""), "");
}

TEST_F(JscrushCrusherTest, RepetitiveInputIsPacked) {
    std::string js;
    for (int i = 0; i < 30; ++i) {
        js += "document.getElementById('item" + std::to_string(i % 3) + "').style.display='none';\n";
    }

    const std::string out = jscrush_.crush(ContentType::Js, js);
    EXPECT_LT(out.size(), js.size());
    EXPECT_EQ(out.rfind(kHead, 0), 0u);
    EXPECT_TRUE(out.ends_with(kTail));
    EXPECT_EQ(unpack(out), js);
}

TEST_F(JscrushCrusherTest, QuotesAndBackslashesSurvivePacking) {
    std::string js;
    for (int i = 0; i < 20; ++i) {
        js += "s+='it\\'s \\\\ \"quoted\"';\r\n";
    }

    const std::string out = jscrush_.crush(ContentType::Js, js);
    ASSERT_LT(out.size(), js.size());
    EXPECT_EQ(unpack(out), js);
}

TEST_F(JscrushCrusherTest, MultiByteCharactersAreNeverSplit) {
    std::string js;
    for (int i = 0; i < 40; ++i) {
        js += "console.log(\"h\xC3\xA9llo w\xC3\xB6rld \xC3\xA9\xC3\xA9\xC3\xB6\xC3\xB6 \" + " +
              std::to_string(i) + ");\n";
    }
    ASSERT_TRUE(valid_utf8(js));

    const std::string out = jscrush_.crush(ContentType::Js, js);
    ASSERT_LT(out.size(), js.size());
    EXPECT_TRUE(valid_utf8(out));
    EXPECT_EQ(unpack(out), js);
}
