//! # Diagnostic and Checksum Tests

#include "common/crc32c.hpp"
#include "common/utf8.hpp"
#include "diag/diagnostic.hpp"

#include <gtest/gtest.h>

using namespace kiln;
using namespace kiln::diag;

TEST(DiagnosticTest, FormatWithLocationAndContext) {
    auto d = Diagnostic::error(ErrorKind::CompileDiagnostic, "Unknown name 'y'");
    d.location = SourceLocation{"multi-root:///a.kl", 3, 17};
    d.context = {"  let x: Int = y;", "                ^"};

    EXPECT_EQ(d.format(), "multi-root:///a.kl:3:17: Error[CompileDiagnostic]: Unknown name 'y'\n"
                          "  let x: Int = y;\n"
                          "                ^");
}

TEST(DiagnosticTest, FormatWithoutLocation) {
    EXPECT_EQ(Diagnostic::warning("Ignoring unexpected argument \"x\".").format(),
              "Warning: Ignoring unexpected argument \"x\".");
    EXPECT_EQ(Diagnostic::info("Usage: kiln").format(), "Usage: kiln");
}

TEST(DiagnosticTest, FormatNamesTheErrorKind) {
    EXPECT_EQ(Diagnostic::error(ErrorKind::OptionParseError, "Unknown option").format(),
              "Error[OptionParseError]: Unknown option");
    EXPECT_EQ(Diagnostic::error(ErrorKind::ArgFileUnreadable, "Cannot read 'x'").format(),
              "Error[ArgFileUnreadable]: Cannot read 'x'");
    EXPECT_EQ(Diagnostic::error(ErrorKind::None, "plain").format(), "Error: plain");
}

TEST(DiagnosticTest, OnlyErrorsCount) {
    std::vector<Diagnostic> diagnostics = {Diagnostic::warning("w"), Diagnostic::info("i")};
    EXPECT_FALSE(has_errors(diagnostics));
    diagnostics.push_back(Diagnostic::error(ErrorKind::InternalError, "e"));
    EXPECT_TRUE(has_errors(diagnostics));
    EXPECT_STREQ(kind_name(ErrorKind::FilterInvariantViolation), "FilterInvariantViolation");
    EXPECT_STREQ(severity_name(Severity::Warning), "Warning");
}

TEST(Crc32cTest, KnownVectors) {
    // RFC 3720 check value
    EXPECT_EQ(crc32c("123456789"), 0xE3069283u);
    EXPECT_EQ(crc32c(""), 0u);
}

TEST(Crc32cTest, ExtendMatchesWholeBuffer) {
    std::string_view text = "multi-root:///lib/a.kl";
    uint32_t partial = crc32c_extend(0, text.data(), 10);
    partial = crc32c_extend(partial, text.data() + 10, text.size() - 10);
    EXPECT_EQ(partial, crc32c(text));
}

TEST(Crc32cTest, HexIncludesLength) {
    EXPECT_EQ(crc32c_hex(0xE3069283u, 9), "e306928300000009");
}

TEST(Utf8Test, SequenceLengths) {
    EXPECT_EQ(utf8_sequence_length("a", 0), 1u);
    EXPECT_EQ(utf8_sequence_length("caf\xC3\xA9", 3), 2u);
    EXPECT_EQ(utf8_sequence_length("\xE2\x82\xAC", 0), 3u);     // U+20AC
    EXPECT_EQ(utf8_sequence_length("\xF0\x9F\x98\x80", 0), 4u); // U+1F600
}

TEST(Utf8Test, MalformedSequencesAreZero) {
    EXPECT_EQ(utf8_sequence_length("\x80", 0), 0u);             // stray continuation
    EXPECT_EQ(utf8_sequence_length("\xC0\xAF", 0), 0u);         // overlong
    EXPECT_EQ(utf8_sequence_length("\xED\xA0\x80", 0), 0u);     // surrogate
    EXPECT_EQ(utf8_sequence_length("\xF4\x90\x80\x80", 0), 0u); // above U+10FFFF
    EXPECT_EQ(utf8_sequence_length("\xC3", 0), 0u);             // truncated
    EXPECT_EQ(utf8_sequence_length("a", 1), 0u);
}
