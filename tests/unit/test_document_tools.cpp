#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "conversion/conversion_manager.hpp"
#include "formats/format_registry.hpp"
#include "test_support.hpp"
#include "tools/document_tools.hpp"

namespace {

using docgate::conversion::ConversionManager;
using docgate::conversion::ConversionSettings;
using docgate::core::errors::ErrorKind;
using docgate::core::errors::get_error;
using docgate::core::errors::get_value;
using docgate::core::errors::is_error;
using docgate::protocol::DocumentKind;
using docgate::protocol::InsertAtEnd;
using docgate::protocol::InsertAtOffset;
using docgate::protocol::InsertAtStart;
using docgate::protocol::ReplaceAll;
using docgate::runtime::Deadline;
using docgate::testing::TempWorkspace;
using docgate::testing::install_mock_engine;
using docgate::testing::mock_engine_calls;
using docgate::testing::read_file;
using docgate::testing::write_file;
using docgate::tools::DocumentTools;

class DocumentToolsTest : public ::testing::Test {
protected:
    DocumentToolsTest() {
        ConversionSettings settings;
        settings.engine_path = install_mock_engine(workspace_.root()).string();
        settings.working_directory = workspace_.root();
        converter_ = std::make_unique<ConversionManager>(settings, formats_);
        tools_ = std::make_unique<DocumentTools>(
            *converter_, std::vector<std::filesystem::path>{workspace_.root() / "docs"});
    }

    static Deadline budget() { return Deadline::after_ms(10000); }

    TempWorkspace workspace_;
    docgate::formats::FormatRegistry formats_;
    std::unique_ptr<ConversionManager> converter_;
    std::unique_ptr<DocumentTools> tools_;
};

TEST_F(DocumentToolsTest, FileInfoReportsMissingFileWithoutFailing) {
    auto info = tools_->file_info("nowhere/report.DOCX");
    ASSERT_FALSE(is_error(info));
    EXPECT_FALSE(get_value(info).exists);
    EXPECT_EQ(get_value(info).filename, "report.DOCX");
    EXPECT_EQ(get_value(info).format, "docx");
    EXPECT_EQ(get_value(info).size_bytes, 0u);
}

TEST_F(DocumentToolsTest, FileInfoReportsSizeOfExistingFile) {
    write_file(workspace_.root() / "notes.txt", "twelve bytes");

    auto info = tools_->file_info("notes.txt");
    ASSERT_FALSE(is_error(info));
    EXPECT_TRUE(get_value(info).exists);
    EXPECT_EQ(get_value(info).size_bytes, 12u);
    EXPECT_EQ(get_value(info).path, workspace_.root() / "notes.txt");
}

TEST_F(DocumentToolsTest, ReadsPlainTextDirectly) {
    write_file(workspace_.root() / "plain.txt", "\xEF\xBB\xBFone two three");

    auto text = tools_->read_text("plain.txt", budget());
    ASSERT_FALSE(is_error(text));
    EXPECT_EQ(get_value(text).content, "one two three");
    EXPECT_EQ(get_value(text).word_count, 3u);
}

TEST_F(DocumentToolsTest, ReadsOtherFormatsThroughEngine) {
    write_file(workspace_.root() / "letter.odt", "Dear reader");

    auto text = tools_->read_text("letter.odt", budget());
    ASSERT_FALSE(is_error(text));
    EXPECT_EQ(get_value(text).content, "Dear reader");
}

TEST_F(DocumentToolsTest, StatisticsOfMissingFileIsValidationError) {
    auto stats = tools_->statistics("absent.odt", budget());
    ASSERT_TRUE(is_error(stats));
    EXPECT_EQ(get_error(stats).kind, ErrorKind::Validation);
    EXPECT_EQ(get_error(stats).code, "file_not_found");
}

TEST_F(DocumentToolsTest, StatisticsComputeContentMetrics) {
    write_file(workspace_.root() / "essay.txt", "First point. Second point!\n\nThird.");

    auto stats = tools_->statistics("essay.txt", budget());
    ASSERT_FALSE(is_error(stats));
    ASSERT_TRUE(get_value(stats).content.has_value());
    EXPECT_FALSE(get_value(stats).content_error.has_value());
    EXPECT_EQ(get_value(stats).content->word_count, 5u);
    EXPECT_EQ(get_value(stats).content->sentence_count, 3u);
    EXPECT_EQ(get_value(stats).content->paragraph_count, 2u);
    EXPECT_TRUE(get_value(stats).file.exists);
}

TEST_F(DocumentToolsTest, StatisticsKeepFileInfoWhenExtractionFails) {
    write_file(workspace_.root() / "CORRUPT.odt", "garbage");

    auto stats = tools_->statistics("CORRUPT.odt", budget());
    ASSERT_FALSE(is_error(stats));
    EXPECT_TRUE(get_value(stats).file.exists);
    EXPECT_FALSE(get_value(stats).content.has_value());
    ASSERT_TRUE(get_value(stats).content_error.has_value());
    EXPECT_EQ(get_value(stats).content_error->kind, ErrorKind::ConversionFailed);
}

TEST_F(DocumentToolsTest, ReadsSpreadsheetRowsUpToLimit) {
    write_file(workspace_.root() / "budget.ods", "item,cost\nrent,\"1,200\"\nfood,300\n");

    auto sheet = tools_->read_spreadsheet("budget.ods", std::nullopt, 100, budget());
    ASSERT_FALSE(is_error(sheet));
    EXPECT_EQ(get_value(sheet).sheet_name, "Sheet1");
    EXPECT_EQ(get_value(sheet).row_count, 3u);
    EXPECT_EQ(get_value(sheet).col_count, 2u);
    EXPECT_EQ(get_value(sheet).rows[1][1], "1,200");

    auto limited = tools_->read_spreadsheet("budget.ods", std::string("Costs"), 1, budget());
    ASSERT_FALSE(is_error(limited));
    EXPECT_EQ(get_value(limited).sheet_name, "Costs");
    EXPECT_EQ(get_value(limited).row_count, 1u);
}

TEST_F(DocumentToolsTest, SearchMatchesCaseInsensitivelyAndSkipsUnreadable) {
    write_file(workspace_.root() / "docs/a.txt", "Quarterly budget review");
    write_file(workspace_.root() / "docs/nested/b.odt", "the QUARTERLY numbers");
    write_file(workspace_.root() / "docs/c.txt", "nothing relevant");
    write_file(workspace_.root() / "docs/CORRUPT.odt", "quarterly");
    write_file(workspace_.root() / "docs/ignored.md", "quarterly");

    auto outcome = tools_->search("quarterly", std::nullopt, budget());
    ASSERT_FALSE(is_error(outcome));
    const auto& result = get_value(outcome);
    EXPECT_EQ(result.scanned, 4u);
    EXPECT_FALSE(result.truncated);
    ASSERT_EQ(result.hits.size(), 2u);
    EXPECT_EQ(result.hits[0].filename, "a.txt");
    EXPECT_EQ(result.hits[1].filename, "b.odt");
    EXPECT_EQ(result.hits[0].word_count, 3u);
    EXPECT_NE(result.hits[1].match_context.find("QUARTERLY"), std::string::npos);
}

TEST_F(DocumentToolsTest, SearchWithExplicitPathRequiresDirectory) {
    write_file(workspace_.root() / "other/x.txt", "needle");

    auto found = tools_->search("needle", std::string("other"), budget());
    ASSERT_FALSE(is_error(found));
    EXPECT_EQ(get_value(found).hits.size(), 1u);

    auto missing = tools_->search("needle", std::string("no-such-dir"), budget());
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "directory_not_found");
}

TEST_F(DocumentToolsTest, SearchReportsTruncationWhenDeadlineExpires) {
    write_file(workspace_.root() / "docs/a.txt", "needle");

    auto outcome = tools_->search("needle", std::nullopt, Deadline::after_ms(0));
    ASSERT_FALSE(is_error(outcome));
    EXPECT_TRUE(get_value(outcome).truncated);
    EXPECT_EQ(get_value(outcome).scanned, 0u);
}

TEST_F(DocumentToolsTest, EmptySearchQueryIsRejected) {
    auto outcome = tools_->search("", std::nullopt, budget());
    ASSERT_TRUE(is_error(outcome));
    EXPECT_EQ(get_error(outcome).kind, ErrorKind::Validation);
}

TEST_F(DocumentToolsTest, MergeToTextKeepsOrderAndRecordsFailures) {
    write_file(workspace_.root() / "a.txt", "alpha");
    write_file(workspace_.root() / "b.txt", "beta");

    auto merged = tools_->merge({"a.txt", "missing.txt", "b.txt"}, "out/merged.txt", "\n--\n",
                                budget());
    ASSERT_FALSE(is_error(merged));
    EXPECT_TRUE(get_value(merged).exists);

    const std::string content = read_file(workspace_.root() / "out/merged.txt");
    EXPECT_EQ(content.rfind("=== a.txt ===\n\nalpha\n--\n=== missing.txt ===\n\nError reading document: ", 0),
              0u);
    EXPECT_NE(content.find("\n--\n=== b.txt ===\n\nbeta"), std::string::npos);
}

TEST_F(DocumentToolsTest, MergeToOtherFormatConvertsStagedText) {
    write_file(workspace_.root() / "a.txt", "alpha");

    auto merged = tools_->merge({"a.txt"}, "out/merged.odt", "\n", budget());
    ASSERT_FALSE(is_error(merged));
    EXPECT_EQ(get_value(merged).format, "odt");
    EXPECT_EQ(read_file(workspace_.root() / "out/merged.odt"), "=== a.txt ===\n\nalpha");
}

TEST_F(DocumentToolsTest, MergeRejectsEmptyList) {
    auto merged = tools_->merge({}, "out/merged.txt", "\n", budget());
    ASSERT_TRUE(is_error(merged));
    EXPECT_EQ(get_error(merged).kind, ErrorKind::Validation);
}

TEST_F(DocumentToolsTest, CreateWriterDocumentImportsInitialText) {
    auto created = tools_->create_document("letters/welcome", DocumentKind::Writer,
                                           "Dear reader", budget());
    ASSERT_FALSE(is_error(created));
    EXPECT_EQ(get_value(created).filename, "welcome.odt");
    EXPECT_EQ(get_value(created).format, "odt");
    EXPECT_EQ(read_file(workspace_.root() / "letters/welcome.odt"), "Dear reader");

    const auto calls = mock_engine_calls(workspace_.root());
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_NE(calls[0].find("--convert-to odt:writer8"), std::string::npos);
    EXPECT_NE(calls[0].find("welcome.txt"), std::string::npos);
}

TEST_F(DocumentToolsTest, CreateSpreadsheetImportsContentAsCsv) {
    auto created = tools_->create_document("budget.ods", DocumentKind::Calc, "item,cost\nrent,900",
                                           budget());
    ASSERT_FALSE(is_error(created));
    EXPECT_EQ(read_file(workspace_.root() / "budget.ods"), "item,cost\nrent,900");

    const auto calls = mock_engine_calls(workspace_.root());
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_NE(calls[0].find("ods:calc8"), std::string::npos);
    EXPECT_NE(calls[0].find("budget.csv"), std::string::npos);
}

TEST_F(DocumentToolsTest, CreateEmptyDocumentStillProducesFile) {
    auto created = tools_->create_document("blank.odt", DocumentKind::Writer, "", budget());
    ASSERT_FALSE(is_error(created));
    EXPECT_TRUE(get_value(created).exists);
    EXPECT_GT(get_value(created).size_bytes, 0u);
}

TEST_F(DocumentToolsTest, CreatePresentationUsesSvgImportFilter) {
    auto created = tools_->create_document("deck", DocumentKind::Impress, "", budget());
    ASSERT_FALSE(is_error(created));
    EXPECT_EQ(get_value(created).filename, "deck.odp");

    const auto calls = mock_engine_calls(workspace_.root());
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_NE(calls[0].find("--infilter=impress_svg_Import"), std::string::npos);
    EXPECT_NE(calls[0].find("odp:impress8"), std::string::npos);

    auto with_text = tools_->create_document("slides.odp", DocumentKind::Impress, "Title",
                                             budget());
    ASSERT_TRUE(is_error(with_text));
    EXPECT_EQ(get_error(with_text).code, "content_not_supported");
}

TEST_F(DocumentToolsTest, CreateNeverOverwritesExistingFile) {
    write_file(workspace_.root() / "keep.odt", "original");

    auto created = tools_->create_document("keep.odt", DocumentKind::Writer, "new", budget());
    ASSERT_TRUE(is_error(created));
    EXPECT_EQ(get_error(created).kind, ErrorKind::Validation);
    EXPECT_EQ(get_error(created).code, "file_exists");
    EXPECT_EQ(read_file(workspace_.root() / "keep.odt"), "original");
    EXPECT_TRUE(mock_engine_calls(workspace_.root()).empty());
}

TEST_F(DocumentToolsTest, CreateRejectsExtensionOfAnotherModule) {
    auto created = tools_->create_document("numbers.ods", DocumentKind::Writer, "", budget());
    ASSERT_TRUE(is_error(created));
    EXPECT_EQ(get_error(created).code, "extension_mismatch");
    EXPECT_FALSE(std::filesystem::exists(workspace_.root() / "numbers.ods"));
}

TEST_F(DocumentToolsTest, CreatePlainTextIsWrittenWithoutEngine) {
    auto created = tools_->create_document("notes.txt", DocumentKind::Writer, "todo", budget());
    ASSERT_FALSE(is_error(created));
    EXPECT_EQ(read_file(workspace_.root() / "notes.txt"), "todo");
    EXPECT_TRUE(mock_engine_calls(workspace_.root()).empty());
}

TEST_F(DocumentToolsTest, InsertIntoPlainTextAtEachPosition) {
    write_file(workspace_.root() / "notes.txt", "middle");

    ASSERT_FALSE(is_error(tools_->insert_text("notes.txt", "top", InsertAtStart{}, budget())));
    ASSERT_FALSE(is_error(tools_->insert_text("notes.txt", "bottom", InsertAtEnd{}, budget())));
    EXPECT_EQ(read_file(workspace_.root() / "notes.txt"), "top\nmiddle\nbottom");

    ASSERT_FALSE(is_error(tools_->insert_text("notes.txt", "!", InsertAtOffset{3}, budget())));
    EXPECT_EQ(read_file(workspace_.root() / "notes.txt"), "top!\nmiddle\nbottom");

    ASSERT_FALSE(is_error(tools_->insert_text("notes.txt", "fresh", ReplaceAll{}, budget())));
    EXPECT_EQ(read_file(workspace_.root() / "notes.txt"), "fresh");
}

TEST_F(DocumentToolsTest, InsertRewritesWriterDocumentInItsOwnFormat) {
    write_file(workspace_.root() / "report.odt", "first");

    auto inserted = tools_->insert_text("report.odt", "second", InsertAtEnd{}, budget());
    ASSERT_FALSE(is_error(inserted));
    EXPECT_EQ(get_value(inserted).format, "odt");
    EXPECT_EQ(read_file(workspace_.root() / "report.odt"), "first\nsecond");

    const auto calls = mock_engine_calls(workspace_.root());
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_NE(calls[1].find("odt:writer8"), std::string::npos);
}

TEST_F(DocumentToolsTest, InsertIntoEmptyDocumentAddsNoSeparator) {
    ASSERT_FALSE(is_error(tools_->create_document("empty.odt", DocumentKind::Writer, "", budget())));

    ASSERT_FALSE(is_error(tools_->insert_text("empty.odt", "only", InsertAtStart{}, budget())));
    EXPECT_EQ(read_file(workspace_.root() / "empty.odt"), "only");
}

TEST_F(DocumentToolsTest, InsertKeepsOriginalWhenRewriteFails) {
    write_file(workspace_.root() / "CORRUPT.odt", "untouched");

    auto inserted = tools_->insert_text("CORRUPT.odt", "more", InsertAtEnd{}, budget());
    ASSERT_TRUE(is_error(inserted));
    EXPECT_EQ(read_file(workspace_.root() / "CORRUPT.odt"), "untouched");
}

TEST_F(DocumentToolsTest, InsertRejectsSpreadsheets) {
    write_file(workspace_.root() / "sheet.ods", "a,b");

    auto inserted = tools_->insert_text("sheet.ods", "c", InsertAtEnd{}, budget());
    ASSERT_TRUE(is_error(inserted));
    EXPECT_EQ(get_error(inserted).code, "unsupported_document_kind");
    EXPECT_TRUE(mock_engine_calls(workspace_.root()).empty());
}

}  // namespace
