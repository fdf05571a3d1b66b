#include "common/exceptions.hpp"
#include "grading/language.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace codegrade;

TEST(LanguageTest, FindByIdAndAlias) {
    ASSERT_NE(find_language("javascript"), nullptr);
    EXPECT_EQ(find_language("js"), find_language("javascript"));
    EXPECT_EQ(find_language("node"), find_language("javascript"));
    EXPECT_EQ(find_language("py"), find_language("python"));
    EXPECT_EQ(find_language("python3"), find_language("python"));
    EXPECT_EQ(find_language("c++")->id, "cpp");
    EXPECT_EQ(find_language("golang")->id, "go");
}

TEST(LanguageTest, LookupIsCaseInsensitive) {
    ASSERT_NE(find_language("JavaScript"), nullptr);
    EXPECT_EQ(find_language("JavaScript")->id, "javascript");
    EXPECT_EQ(find_language("PY")->id, "python");
}

TEST(LanguageTest, UnknownLanguage) {
    EXPECT_EQ(find_language("brainfuck"), nullptr);
    EXPECT_EQ(find_language(""), nullptr);
    EXPECT_THROW(get_language("brainfuck"), language_unsupported);

    try {
        get_language("cobol");
        FAIL() << "cobol should not be supported";
    } catch (language_unsupported &e) {
        EXPECT_EQ(e.code(), codegrade::error_code::LANGUAGE_UNSUPPORTED);
        EXPECT_EQ(e.language, "cobol");
        EXPECT_STREQ(e.what(), "Language cobol not supported");
    }
}

TEST(LanguageTest, SourceName) {
    EXPECT_EQ(get_language("javascript").source_name(), "main.js");
    EXPECT_EQ(get_language("python").source_name(), "main.py");
    EXPECT_EQ(get_language("rust").source_name(), "main.rs");
}

TEST(LanguageTest, OnlyInterpretedLanguagesRunLocally) {
    for (auto &lang : available_languages()) {
        EXPECT_FALSE(lang.remote_id.empty()) << lang.id;
        if (lang.id == "javascript" || lang.id == "python") {
            EXPECT_TRUE(lang.interpreter.has_value()) << lang.id;
            EXPECT_NE(lang.harness, nullptr) << lang.id;
        } else {
            EXPECT_FALSE(lang.interpreter.has_value()) << lang.id;
            EXPECT_EQ(lang.harness, nullptr) << lang.id;
        }
    }
}
