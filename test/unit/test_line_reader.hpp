#ifndef PIIGUARD_TEST_UNIT_TEST_LINE_READER_HPP
#define PIIGUARD_TEST_UNIT_TEST_LINE_READER_HPP

#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

#include "core/line_reader.hpp"

TEST(LineReaderTest, SplitKeepsTerminators) {
    auto lines = piiguard::core::splitLinesKeepEnds("a\nb\r\nc\rd\fe");
    std::vector<std::string> expected = {"a\n", "b\r\n", "c\r", "d\f", "e"};
    EXPECT_EQ(lines, expected);
}

TEST(LineReaderTest, EmptyAndBlankLines) {
    EXPECT_TRUE(piiguard::core::splitLinesKeepEnds("").empty());
    std::vector<std::string> expected = {"\n", "\n"};
    EXPECT_EQ(piiguard::core::splitLinesKeepEnds("\n\n"), expected);
}

TEST(LineReaderTest, StreamReaderAgreesWithSplit) {
    const std::string text = "first\r\nsecond\n\nthird\x1ctail";
    std::istringstream in(text);
    std::vector<std::string> read;
    std::string line;
    while (piiguard::core::readLineKeepEnd(in, line))
        read.push_back(line);

    EXPECT_EQ(read, piiguard::core::splitLinesKeepEnds(text));
    ASSERT_EQ(read.size(), (size_t)5);
    EXPECT_EQ(read[0], "first\r\n");
    EXPECT_EQ(read[4], "tail");
}

TEST(LineReaderTest, UnicodeLineSeparators) {
    // U+0085, U+2028, U+2029 break lines; U+00A0 and a stray E2 80 do not
    const std::string text = "a\xc2\x85" "b\xe2\x80\xa8" "c\xe2\x80\xa9" "d\xc2\xa0" "e\xe2\x80" "f\x1d" "g";
    std::vector<std::string> expected = {"a\xc2\x85", "b\xe2\x80\xa8", "c\xe2\x80\xa9",
                                         "d\xc2\xa0" "e\xe2\x80" "f\x1d", "g"};
    EXPECT_EQ(piiguard::core::splitLinesKeepEnds(text), expected);

    std::istringstream in(text);
    std::vector<std::string> read;
    std::string line;
    while (piiguard::core::readLineKeepEnd(in, line))
        read.push_back(line);
    EXPECT_EQ(read, expected);
}

TEST(LineReaderTest, StreamReaderRestartsAfterPartialSeparator) {
    // E2 80 followed by a real U+2028
    const std::string text = "x\xe2\x80\xe2\x80\xa8" "y";
    std::istringstream in(text);
    std::vector<std::string> read;
    std::string line;
    while (piiguard::core::readLineKeepEnd(in, line))
        read.push_back(line);
    EXPECT_EQ(read, piiguard::core::splitLinesKeepEnds(text));
    ASSERT_EQ(read.size(), (size_t)2);
    EXPECT_EQ(read[1], "y");
}

#endif // PIIGUARD_TEST_UNIT_TEST_LINE_READER_HPP
