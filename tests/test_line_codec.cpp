// EN: Unit tests for single-line decoding and encoding
// FR: Tests unitaires du décodage et de l'encodage d'une ligne

#include <gtest/gtest.h>
#include "csv/header_codec.hpp"
#include "csv/line_codec.hpp"
#include "infrastructure/logging/logger.hpp"

using namespace CSVS::CSV;

namespace {

struct Invoice {
    int invoice_number{0};
    std::string customer;
    double amount{0};
    std::optional<int> discount;
};

RecordSchema<Invoice> invoiceSchema(bool explicit_columns) {
    RecordSchema<Invoice> schema;
    schema.name("Invoice");
    if (explicit_columns) {
        schema.field("InvoiceNumber", &Invoice::invoice_number).column("Invoice #", 1);
        schema.field("Customer", &Invoice::customer).column("Customer", 2);
        schema.field("Amount", &Invoice::amount).column("Amount", 3);
    } else {
        schema.field("InvoiceNumber", &Invoice::invoice_number);
        schema.field("Customer", &Invoice::customer);
        schema.field("Amount", &Invoice::amount);
        schema.field("Discount", &Invoice::discount);
    }
    return schema;
}

} // namespace

class LineCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        CSVS::Logger::getInstance().setLogLevel(CSVS::LogLevel::ERROR);
        schema_ = invoiceSchema(false);
        active_ = FieldResolver::resolve("Invoice", schema_.infos(), true);
    }

    ColumnLayout layoutFor(const LineCodec& codec, const std::string& header) {
        HeaderCodec header_codec(options_.separator, options_.row_number_title,
                                 options_.use_line_numbers, active_.explicit_ordering);
        return codec.bind(header_codec.normalizeColumns(header), active_);
    }

    SerializerOptions options_;
    RecordSchema<Invoice> schema_;
    ActiveFieldSet active_;
};

TEST_F(LineCodecTest, EscapeReplacesSeparatorAndLineBreaks) {
    LineCodec codec(options_);

    std::string escaped = codec.escape("a,b\r\nc\nd");
    EXPECT_EQ(escaped, "a\xC9\x95" "b\xC9\x94" "c\xC9\x94" "d");
    EXPECT_EQ(escaped.find(','), std::string::npos);
    EXPECT_EQ(codec.unescape(escaped), "a,b\nc\nd");
}

TEST_F(LineCodecTest, NormalizeColumnNameSpellsOutHash) {
    EXPECT_EQ(LineCodec::normalizeColumnName("Invoice #"), "InvoiceNumber");
    EXPECT_EQ(LineCodec::normalizeColumnName("INVOICE#"), "INVOICENumber");
}

TEST_F(LineCodecTest, EncodeWritesRowNumberAndEscapedValues) {
    LineCodec codec(options_);
    Invoice invoice{42, "Smith, John", 10.5, std::nullopt};

    EXPECT_EQ(codec.encode(invoice, 3, active_, schema_.fields()),
              "3,10.5,Smith\xC9\x95 John,,42");
}

TEST_F(LineCodecTest, DecodeBindsColumnsInAnyOrder) {
    LineCodec codec(options_);
    ColumnLayout layout = layoutFor(codec, "RowNumber,Customer,Invoice#,Amount,Discount");

    std::optional<Invoice> result;
    EXPECT_EQ(codec.decode<Invoice>("1, Acme ,7,99.5,3", 2, layout, schema_.fields(), result), DecodeStatus::DECODED);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->customer, "Acme");
    EXPECT_EQ(result->invoice_number, 7);
    EXPECT_DOUBLE_EQ(result->amount, 99.5);
    EXPECT_EQ(result->discount, std::optional<int>(3));
}

TEST_F(LineCodecTest, DecodeRestoresEscapedCharacters) {
    LineCodec codec(options_);
    ColumnLayout layout = layoutFor(codec, "RowNumber,Amount,Customer,Discount,InvoiceNumber");

    std::optional<Invoice> result;
    codec.decode<Invoice>("1,1,Smith\xC9\x95 John\xC9\x94Jr,,5", 2, layout, schema_.fields(), result);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->customer, "Smith, John\nJr");
    EXPECT_FALSE(result->discount.has_value());
}

TEST_F(LineCodecTest, LastColumnAbsorbsOverflow) {
    LineCodec codec(options_);
    ColumnLayout layout = layoutFor(codec, "RowNumber,Amount,InvoiceNumber,Customer");

    std::optional<Invoice> result;
    codec.decode<Invoice>("1,2.5,9,Smith, John, Jr", 2, layout, schema_.fields(), result);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->customer, "Smith, John, Jr");
}

TEST_F(LineCodecTest, BlankLinesAndEofSentinelProduceNothing) {
    LineCodec codec(options_);
    ColumnLayout layout = layoutFor(codec, "RowNumber,Amount,Customer,Discount,InvoiceNumber");

    std::optional<Invoice> result;
    EXPECT_EQ(codec.decode<Invoice>("   ", 2, layout, schema_.fields(), result), DecodeStatus::BLANK);
    EXPECT_EQ(codec.decode<Invoice>("4,EOF", 3, layout, schema_.fields(), result), DecodeStatus::END_OF_FILE);
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(codec.endOfFileLine(4), "4,EOF");
}

TEST_F(LineCodecTest, EofSentinelWithoutLineNumbers) {
    options_.use_line_numbers = false;
    LineCodec codec(options_);
    ColumnLayout layout = layoutFor(codec, "Amount,Customer,Discount,InvoiceNumber");

    std::optional<Invoice> result;
    EXPECT_EQ(codec.decode<Invoice>("EOF", 5, layout, schema_.fields(), result), DecodeStatus::END_OF_FILE);
    EXPECT_EQ(codec.endOfFileLine(9), "EOF");
}

TEST_F(LineCodecTest, ShortRowKeepsDefaults) {
    LineCodec codec(options_);
    ColumnLayout layout = layoutFor(codec, "RowNumber,InvoiceNumber,Customer,Amount");

    std::optional<Invoice> result;
    EXPECT_EQ(codec.decode<Invoice>("1,12", 2, layout, schema_.fields(), result), DecodeStatus::SHORT_ROW);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->invoice_number, 12);
    EXPECT_EQ(result->customer, "");
    EXPECT_DOUBLE_EQ(result->amount, 0.0);
}

TEST_F(LineCodecTest, WhitespaceValueAssignsDefault) {
    LineCodec codec(options_);
    ColumnLayout layout = layoutFor(codec, "RowNumber,InvoiceNumber,Amount");

    std::optional<Invoice> result;
    codec.decode<Invoice>("1,   ,  ", 2, layout, schema_.fields(), result);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->invoice_number, 0);
}

TEST_F(LineCodecTest, UnknownAndRowNumberColumnsAreSkipped) {
    options_.use_line_numbers = false;
    LineCodec codec(options_);
    ColumnLayout layout = layoutFor(codec, "Row Number,Unknown,Customer");

    EXPECT_FALSE(layout.bindings[0].has_value());
    EXPECT_FALSE(layout.bindings[1].has_value());
    EXPECT_TRUE(layout.bindings[2].has_value());
}

TEST_F(LineCodecTest, ConversionFailureNamesLineAndColumn) {
    LineCodec codec(options_);
    ColumnLayout layout = layoutFor(codec, "RowNumber,InvoiceNumber");

    std::optional<Invoice> result;
    try {
        codec.decode<Invoice>("1,abc", 7, layout, schema_.fields(), result);
        FAIL() << "expected UnsupportedValueError";
    } catch (const UnsupportedValueError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("Line 7"), std::string::npos);
        EXPECT_NE(message.find("INVOICENUMBER"), std::string::npos);
        EXPECT_NE(message.find("abc"), std::string::npos);
    }
}

TEST_F(LineCodecTest, ExplicitTitlesBindThroughNormalizedNames) {
    schema_ = invoiceSchema(true);
    active_ = FieldResolver::resolve("Invoice", schema_.infos(), true);
    LineCodec codec(options_);
    ColumnLayout layout = layoutFor(codec, "RowNumber,Invoice #,Customer,Amount");

    std::optional<Invoice> result;
    codec.decode<Invoice>("1,31,Globex,7", 2, layout, schema_.fields(), result);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->invoice_number, 31);
    EXPECT_EQ(result->customer, "Globex");
}
